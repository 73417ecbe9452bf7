// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "RunRecord.h"
#include <stdexcept>
#include "TimeUtils.h"

namespace stratlab
{
  std::string toString(RunStatus status)
  {
    switch (status)
      {
      case RunStatus::Pending:
	return "pending";
      case RunStatus::Running:
	return "running";
      case RunStatus::Completed:
	return "completed";
      case RunStatus::Failed:
	return "failed";
      }
    return "pending";
  }

  RunStatus runStatusFromString(const std::string& text)
  {
    if (text == "pending")
      return RunStatus::Pending;
    if (text == "running")
      return RunStatus::Running;
    if (text == "completed")
      return RunStatus::Completed;
    if (text == "failed")
      return RunStatus::Failed;

    throw std::invalid_argument("unknown run status '" + text + "'");
  }

  RunRecord::RunRecord(const std::string& runId,
		       const std::string& experimentId,
		       const std::string& symbol,
		       const ParameterSet& parameters)
    : mRunId(runId),
      mExperimentId(experimentId),
      mSymbol(symbol),
      mParameters(parameters),
      mStatus(RunStatus::Pending),
      mStartedAt(boost::posix_time::not_a_date_time),
      mCompletedAt(boost::posix_time::not_a_date_time),
      mMetrics(),
      mAttempts(0),
      mError()
  {
    if (mRunId.empty())
      throw std::invalid_argument("RunRecord: run id cannot be empty");
  }

  RunRecord RunRecord::restore(const std::string& runId,
			       const std::string& experimentId,
			       const std::string& symbol,
			       const ParameterSet& parameters,
			       RunStatus status,
			       const boost::posix_time::ptime& startedAt,
			       const boost::posix_time::ptime& completedAt,
			       const std::optional<BacktestMetrics>& metrics,
			       unsigned int attempts,
			       const std::string& error)
  {
    if ((status == RunStatus::Completed) != metrics.has_value())
      throw std::invalid_argument("RunRecord " + runId + ": metrics must be present exactly when completed");

    if ((status == RunStatus::Failed) != !error.empty())
      throw std::invalid_argument("RunRecord " + runId + ": error text must be present exactly when failed");

    RunRecord record(runId, experimentId, symbol, parameters);
    record.mStatus = status;
    record.mStartedAt = startedAt;
    record.mCompletedAt = completedAt;
    record.mMetrics = metrics;
    record.mAttempts = attempts;
    record.mError = error;
    return record;
  }

  std::optional<double> RunRecord::getMetric(const std::string& name) const
  {
    if (!mMetrics)
      return std::nullopt;

    return mMetrics->getMetric(name);
  }

  double RunRecord::getDurationSeconds() const
  {
    return utils::secondsBetween(mStartedAt, mCompletedAt);
  }

  void RunRecord::markRunning(const boost::posix_time::ptime& at)
  {
    if (mStatus != RunStatus::Pending)
      throw std::logic_error("RunRecord " + mRunId + ": cannot start a run that is " + toString(mStatus));

    mStatus = RunStatus::Running;
    mStartedAt = at;
  }

  void RunRecord::recordAttempt()
  {
    if (mStatus != RunStatus::Running)
      throw std::logic_error("RunRecord " + mRunId + ": attempts are only recorded while running");

    ++mAttempts;
  }

  void RunRecord::markCompleted(const BacktestMetrics& metrics, const boost::posix_time::ptime& at)
  {
    if (mStatus != RunStatus::Running)
      throw std::logic_error("RunRecord " + mRunId + ": cannot complete a run that is " + toString(mStatus));

    mStatus = RunStatus::Completed;
    mCompletedAt = at;
    mMetrics = metrics;
  }

  void RunRecord::markFailed(const std::string& error, const boost::posix_time::ptime& at)
  {
    if (isFinished())
      throw std::logic_error("RunRecord " + mRunId + ": cannot fail a run that is " + toString(mStatus));

    mStatus = RunStatus::Failed;
    mCompletedAt = at;
    mError = error.empty() ? std::string("unknown error") : error;
  }
}
