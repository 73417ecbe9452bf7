// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ExperimentStore.h"
#include <algorithm>
#include <sstream>
#include <boost/filesystem/fstream.hpp>
#include "ExperimentConfigurationWriter.h"
#include "ExperimentException.h"
#include "ExperimentSerializer.h"

namespace fs = boost::filesystem;

namespace stratlab
{
  namespace
  {
    void writeTextFile(const fs::path& path, const std::string& text)
    {
      // Write to a sibling and rename so readers never see a partial file
      const fs::path temp = path.string() + ".tmp";
      {
	fs::ofstream out(temp, std::ios::out | std::ios::trunc);
	if (!out)
	  throw PersistenceException("cannot open " + temp.string() + " for writing");

	out << text << '\n';
	out.flush();
	if (!out)
	  throw PersistenceException("failed writing " + temp.string());
      }

      boost::system::error_code ec;
      fs::rename(temp, path, ec);
      if (ec)
	throw PersistenceException("cannot move " + temp.string() + " to " + path.string() + ": " + ec.message());
    }
  }

  ExperimentStore::ExperimentStore(const fs::path& rootDirectory)
    : mRootDirectory(rootDirectory)
  {
    if (mRootDirectory.empty())
      throw PersistenceException("ExperimentStore: root directory cannot be empty");
  }

  fs::path ExperimentStore::getExperimentDirectory(const std::string& experimentId) const
  {
    return mRootDirectory / experimentId;
  }

  fs::path ExperimentStore::getRunLogPath(const std::string& experimentId) const
  {
    return getExperimentDirectory(experimentId) / RunLogWriter::kRunLogFileName;
  }

  fs::path ExperimentStore::ensureExperimentDirectory(const std::string& experimentId) const
  {
    const fs::path dir = getExperimentDirectory(experimentId);
    boost::system::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
      throw PersistenceException("cannot create experiment directory " + dir.string() + ": " + ec.message());
    return dir;
  }

  std::unique_ptr<RunLogWriter> ExperimentStore::openRunLog(const std::string& experimentId) const
  {
    ensureExperimentDirectory(experimentId);
    return std::make_unique<RunLogWriter>(getRunLogPath(experimentId));
  }

  fs::path ExperimentStore::saveConfiguration(const ExperimentConfiguration& configuration) const
  {
    const fs::path path = ensureExperimentDirectory(configuration.getExperimentId()) / kConfigFileName;
    writeTextFile(path, ExperimentConfigurationWriter().toString(configuration, true));
    return path;
  }

  fs::path ExperimentStore::saveSummary(const ExperimentResult& result) const
  {
    saveConfiguration(result.getConfiguration());

    const fs::path path = ensureExperimentDirectory(result.getExperimentId()) / kSummaryFileName;
    writeTextFile(path, ExperimentSerializer::exportSummary(result));
    return path;
  }

  ExperimentResult ExperimentStore::loadSummary(const std::string& experimentId) const
  {
    const fs::path path = getExperimentDirectory(experimentId) / kSummaryFileName;
    fs::ifstream in(path);
    if (!in)
      throw PersistenceException("no summary for experiment " + experimentId + " at " + path.string());

    std::ostringstream contents;
    contents << in.rdbuf();
    return ExperimentSerializer::importSummary(contents.str());
  }

  std::vector<RunRecord> ExperimentStore::loadRunLog(const std::string& experimentId) const
  {
    return RunLogWriter::readAll(getRunLogPath(experimentId));
  }

  std::vector<std::string> ExperimentStore::listExperiments() const
  {
    std::vector<std::string> ids;
    boost::system::error_code ec;
    if (!fs::is_directory(mRootDirectory, ec))
      return ids;

    for (fs::directory_iterator it(mRootDirectory, ec), end; !ec && it != end; it.increment(ec))
      {
	if (fs::is_regular_file(it->path() / kSummaryFileName))
	  ids.push_back(it->path().filename().string());
      }

    if (ec)
      throw PersistenceException("cannot list " + mRootDirectory.string() + ": " + ec.message());

    std::sort(ids.begin(), ids.end());
    return ids;
  }
}
