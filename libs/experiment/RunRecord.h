// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_RUN_RECORD_H
#define __STRATLAB_RUN_RECORD_H 1

#include <optional>
#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BacktestMetrics.h"
#include "ParameterValue.h"

namespace stratlab
{
  enum class RunStatus { Pending, Running, Completed, Failed };

  std::string toString(RunStatus status);

  // Throws std::invalid_argument for unknown text
  RunStatus runStatusFromString(const std::string& text);

  /**
   * @brief Outcome of one backtest task (symbol, parameter assignment).
   *
   * Status only moves forward: Pending -> Running -> Completed | Failed.
   * A pending run may also fail directly (for example when it could not be
   * dispatched). Any other transition throws std::logic_error.
   *
   * Metrics are present iff the run completed; the error text is non-empty
   * iff the run failed.
   */
  class RunRecord
  {
  public:
    RunRecord(const std::string& runId,
	      const std::string& experimentId,
	      const std::string& symbol,
	      const ParameterSet& parameters);

    // Rebuild a record read back from storage. Throws std::invalid_argument
    // when the fields violate the status invariants.
    static RunRecord restore(const std::string& runId,
			     const std::string& experimentId,
			     const std::string& symbol,
			     const ParameterSet& parameters,
			     RunStatus status,
			     const boost::posix_time::ptime& startedAt,
			     const boost::posix_time::ptime& completedAt,
			     const std::optional<BacktestMetrics>& metrics,
			     unsigned int attempts,
			     const std::string& error);

    const std::string& getRunId() const { return mRunId; }
    const std::string& getExperimentId() const { return mExperimentId; }
    const std::string& getSymbol() const { return mSymbol; }
    const ParameterSet& getParameters() const { return mParameters; }
    RunStatus getStatus() const { return mStatus; }
    const boost::posix_time::ptime& getStartedAt() const { return mStartedAt; }
    const boost::posix_time::ptime& getCompletedAt() const { return mCompletedAt; }
    const std::optional<BacktestMetrics>& getMetrics() const { return mMetrics; }
    unsigned int getAttempts() const { return mAttempts; }
    const std::string& getError() const { return mError; }

    bool isCompleted() const
    {
      return mStatus == RunStatus::Completed;
    }

    bool isFailed() const
    {
      return mStatus == RunStatus::Failed;
    }

    bool isFinished() const
    {
      return isCompleted() || isFailed();
    }

    // Value of a metric for a completed run, nullopt otherwise
    std::optional<double> getMetric(const std::string& name) const;

    double getDurationSeconds() const;

    void markRunning(const boost::posix_time::ptime& at);
    void recordAttempt();
    void markCompleted(const BacktestMetrics& metrics, const boost::posix_time::ptime& at);
    void markFailed(const std::string& error, const boost::posix_time::ptime& at);

  private:
    std::string mRunId;
    std::string mExperimentId;
    std::string mSymbol;
    ParameterSet mParameters;
    RunStatus mStatus;
    boost::posix_time::ptime mStartedAt;
    boost::posix_time::ptime mCompletedAt;
    std::optional<BacktestMetrics> mMetrics;
    unsigned int mAttempts;
    std::string mError;
  };
}

#endif
