// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_EXPERIMENT_STORE_H
#define __STRATLAB_EXPERIMENT_STORE_H 1

#include <memory>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "ExperimentConfiguration.h"
#include "ExperimentResult.h"
#include "RunLogWriter.h"

namespace stratlab
{
  /**
   * @brief Directory layout for persisted experiments.
   *
   * <root>/<experiment-id>/runs.jsonl     append-only run log
   * <root>/<experiment-id>/config.json    declarative configuration
   * <root>/<experiment-id>/summary.json   written at completion
   *
   * Directories are created on demand. I/O problems throw
   * PersistenceException.
   */
  class ExperimentStore
  {
  public:
    static constexpr const char* kSummaryFileName = "summary.json";
    static constexpr const char* kConfigFileName = "config.json";

    explicit ExperimentStore(const boost::filesystem::path& rootDirectory);

    const boost::filesystem::path& getRootDirectory() const
    {
      return mRootDirectory;
    }

    boost::filesystem::path getExperimentDirectory(const std::string& experimentId) const;
    boost::filesystem::path getRunLogPath(const std::string& experimentId) const;

    std::unique_ptr<RunLogWriter> openRunLog(const std::string& experimentId) const;

    boost::filesystem::path saveConfiguration(const ExperimentConfiguration& configuration) const;

    // Writes summary.json and config.json; returns the summary path
    boost::filesystem::path saveSummary(const ExperimentResult& result) const;

    ExperimentResult loadSummary(const std::string& experimentId) const;
    std::vector<RunRecord> loadRunLog(const std::string& experimentId) const;

    // Identifiers of experiments with a summary, sorted
    std::vector<std::string> listExperiments() const;

  private:
    boost::filesystem::path ensureExperimentDirectory(const std::string& experimentId) const;

  private:
    boost::filesystem::path mRootDirectory;
  };
}

#endif
