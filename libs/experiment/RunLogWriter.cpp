// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "RunLogWriter.h"
#include <string>
#include "ExperimentException.h"
#include "ExperimentSerializer.h"

namespace stratlab
{
  RunLogWriter::RunLogWriter(const boost::filesystem::path& logFile)
    : mPath(logFile),
      mOut(),
      mRecordsWritten(0)
  {
    if (mPath.has_parent_path())
      {
	boost::system::error_code ec;
	boost::filesystem::create_directories(mPath.parent_path(), ec);
	if (ec)
	  throw PersistenceException("cannot create directory " + mPath.parent_path().string()
				     + ": " + ec.message());
      }

    mOut.open(mPath, std::ios::out | std::ios::app);
    if (!mOut)
      throw PersistenceException("cannot open run log " + mPath.string());
  }

  void RunLogWriter::append(const std::vector<RunRecord>& records)
  {
    for (const auto& record : records)
      mOut << ExperimentSerializer::runRecordToLine(record) << '\n';

    mOut.flush();
    if (!mOut)
      throw PersistenceException("failed writing run log " + mPath.string());

    mRecordsWritten += records.size();
  }

  std::vector<RunRecord> RunLogWriter::readAll(const boost::filesystem::path& logFile)
  {
    boost::filesystem::ifstream in(logFile);
    if (!in)
      throw PersistenceException("cannot open run log " + logFile.string());

    std::vector<RunRecord> records;
    std::string line;
    while (std::getline(in, line))
      {
	if (line.find_first_not_of(" \t\r") == std::string::npos)
	  continue;

	records.push_back(ExperimentSerializer::runRecordFromLine(line));
      }
    return records;
  }
}
