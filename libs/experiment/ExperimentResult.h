// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_EXPERIMENT_RESULT_H
#define __STRATLAB_EXPERIMENT_RESULT_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "ExperimentConfiguration.h"
#include "RunRecord.h"
#include "StatisticStatus.h"

namespace stratlab
{
  /**
   * Aggregates over the completed runs an ExperimentResult still holds.
   * Status is InsufficientData when there are none and the values are then
   * meaningless.
   */
  struct ExperimentStatistics
  {
    StatisticStatus status = StatisticStatus::InsufficientData;
    std::size_t completedRuns = 0;
    double avgReturn = 0.0;
    double avgDrawdown = 0.0;
    double avgSharpe = 0.0;
    double bestReturn = 0.0;
    double worstReturn = 0.0;
    double bestSharpe = 0.0;
  };

  /**
   * @brief Everything a batch produced for one experiment.
   *
   * Totals are counters maintained as runs are recorded, so they stay
   * correct when the runner drops flushed records from memory. The best run
   * under the configuration's optimization metric (in the tracked direction)
   * is also maintained incrementally; for any other metric getBestRun()
   * scans the runs still held.
   *
   * Runs are kept in completion order; treat them as a set keyed by run id.
   */
  class ExperimentResult
  {
  public:
    ExperimentResult(const ExperimentConfiguration& configuration,
		     std::size_t totalRuns,
		     bool maximize = true);

    static ExperimentResult restore(const ExperimentConfiguration& configuration,
				    const std::vector<RunRecord>& runs,
				    std::size_t totalRuns,
				    std::size_t completedRuns,
				    std::size_t failedRuns,
				    const boost::posix_time::ptime& startedAt,
				    const boost::posix_time::ptime& finishedAt,
				    bool maximize = true);

    const ExperimentConfiguration& getConfiguration() const { return mConfiguration; }

    const std::string& getExperimentId() const
    {
      return mConfiguration.getExperimentId();
    }

    const std::vector<RunRecord>& getRuns() const { return mRuns; }

    std::size_t getTotalRuns() const { return mTotalRuns; }
    std::size_t getCompletedRuns() const { return mCompletedRuns; }
    std::size_t getFailedRuns() const { return mFailedRuns; }

    // Runs neither completed nor failed, e.g. never dispatched after fail-fast
    std::size_t getUnfinishedRuns() const
    {
      const std::size_t finished = mCompletedRuns + mFailedRuns;
      return finished >= mTotalRuns ? 0 : mTotalRuns - finished;
    }

    const std::string& getTrackedMetric() const
    {
      return mConfiguration.getOptimizationMetric();
    }

    bool isMaximizing() const { return mMaximize; }

    // Best completed run under the optimization metric
    const std::optional<RunRecord>& getBestRun() const { return mBestRun; }

    std::optional<RunRecord> getBestRun(const std::string& metric, bool maximize = true) const;

    ExperimentStatistics getStatistics() const;

    const boost::posix_time::ptime& getStartedAt() const { return mStartedAt; }
    const boost::posix_time::ptime& getFinishedAt() const { return mFinishedAt; }
    double getDurationSeconds() const;

    // Counts a finished run; the record itself is kept only when retain is set
    void recordRun(const RunRecord& run, bool retain = true);

    // Candidate for the tracked best without counting it as a run
    void offerBestRun(const RunRecord& run);

    // Fold another batch of the same experiment into this one
    void absorb(const ExperimentResult& other);

    void setTiming(const boost::posix_time::ptime& startedAt, const boost::posix_time::ptime& finishedAt);

  private:
    void considerForBest(const RunRecord& run);

  private:
    ExperimentConfiguration mConfiguration;
    std::vector<RunRecord> mRuns;
    std::size_t mTotalRuns;
    std::size_t mCompletedRuns;
    std::size_t mFailedRuns;
    bool mMaximize;
    std::optional<RunRecord> mBestRun;
    boost::posix_time::ptime mStartedAt;
    boost::posix_time::ptime mFinishedAt;
  };

  // True when candidate beats incumbent in the given direction. NaN never wins.
  bool isBetterMetric(double candidate, double incumbent, bool maximize);
}

#endif
