// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ExperimentResult.h"
#include <algorithm>
#include <cmath>
#include "SampleStatistics.h"
#include "TimeUtils.h"

namespace stratlab
{
  bool isBetterMetric(double candidate, double incumbent, bool maximize)
  {
    if (std::isnan(candidate))
      return false;

    if (std::isnan(incumbent))
      return true;

    return maximize ? candidate > incumbent : candidate < incumbent;
  }

  ExperimentResult::ExperimentResult(const ExperimentConfiguration& configuration,
				     std::size_t totalRuns,
				     bool maximize)
    : mConfiguration(configuration),
      mRuns(),
      mTotalRuns(totalRuns),
      mCompletedRuns(0),
      mFailedRuns(0),
      mMaximize(maximize),
      mBestRun(),
      mStartedAt(boost::posix_time::not_a_date_time),
      mFinishedAt(boost::posix_time::not_a_date_time)
  {}

  ExperimentResult ExperimentResult::restore(const ExperimentConfiguration& configuration,
					     const std::vector<RunRecord>& runs,
					     std::size_t totalRuns,
					     std::size_t completedRuns,
					     std::size_t failedRuns,
					     const boost::posix_time::ptime& startedAt,
					     const boost::posix_time::ptime& finishedAt,
					     bool maximize)
  {
    ExperimentResult result(configuration, totalRuns, maximize);
    for (const auto& run : runs)
      result.recordRun(run, true);

    // Stored counters include runs that were flushed and not retained
    result.mCompletedRuns = std::max(completedRuns, result.mCompletedRuns);
    result.mFailedRuns = std::max(failedRuns, result.mFailedRuns);
    result.setTiming(startedAt, finishedAt);
    return result;
  }

  void ExperimentResult::recordRun(const RunRecord& run, bool retain)
  {
    if (run.isCompleted())
      {
	++mCompletedRuns;
	considerForBest(run);
      }
    else if (run.isFailed())
      ++mFailedRuns;

    if (retain)
      mRuns.push_back(run);
  }

  void ExperimentResult::considerForBest(const RunRecord& run)
  {
    std::optional<double> value = run.getMetric(getTrackedMetric());
    if (!value)
      return;

    if (!mBestRun)
      {
	if (!std::isnan(*value))
	  mBestRun = run;
	return;
      }

    if (isBetterMetric(*value, *mBestRun->getMetric(getTrackedMetric()), mMaximize))
      mBestRun = run;
  }

  void ExperimentResult::offerBestRun(const RunRecord& run)
  {
    if (run.isCompleted())
      considerForBest(run);
  }

  void ExperimentResult::absorb(const ExperimentResult& other)
  {
    mTotalRuns += other.mTotalRuns;
    mCompletedRuns += other.mCompletedRuns;
    mFailedRuns += other.mFailedRuns;
    mRuns.insert(mRuns.end(), other.mRuns.begin(), other.mRuns.end());

    if (other.mBestRun)
      considerForBest(*other.mBestRun);

    if (mStartedAt.is_special() || (!other.mStartedAt.is_special() && other.mStartedAt < mStartedAt))
      mStartedAt = other.mStartedAt;

    if (mFinishedAt.is_special() || (!other.mFinishedAt.is_special() && other.mFinishedAt > mFinishedAt))
      mFinishedAt = other.mFinishedAt;
  }

  std::optional<RunRecord> ExperimentResult::getBestRun(const std::string& metric, bool maximize) const
  {
    if (metric == getTrackedMetric() && maximize == mMaximize)
      return mBestRun;

    const RunRecord* best = nullptr;
    double bestValue = std::nan("");
    for (const auto& run : mRuns)
      {
	std::optional<double> value = run.getMetric(metric);
	if (!value)
	  continue;

	if (isBetterMetric(*value, bestValue, maximize))
	  {
	    best = &run;
	    bestValue = *value;
	  }
      }

    if (!best)
      return std::nullopt;

    return *best;
  }

  ExperimentStatistics ExperimentResult::getStatistics() const
  {
    SampleStatistics returns;
    SampleStatistics drawdowns;
    SampleStatistics sharpes;

    for (const auto& run : mRuns)
      {
	if (!run.isCompleted())
	  continue;

	const BacktestMetrics& m = *run.getMetrics();
	returns.add(m.getTotalReturn());
	drawdowns.add(m.getMaxDrawdown());
	sharpes.add(m.getSharpeRatio());
      }

    ExperimentStatistics stats;
    stats.completedRuns = returns.getCount();
    if (returns.empty())
      return stats;

    stats.status = StatisticStatus::Success;
    stats.avgReturn = returns.getMean();
    stats.avgDrawdown = drawdowns.empty() ? 0.0 : drawdowns.getMean();
    stats.avgSharpe = sharpes.empty() ? 0.0 : sharpes.getMean();
    stats.bestReturn = returns.getMax();
    stats.worstReturn = returns.getMin();
    stats.bestSharpe = sharpes.empty() ? 0.0 : sharpes.getMax();
    return stats;
  }

  double ExperimentResult::getDurationSeconds() const
  {
    return utils::secondsBetween(mStartedAt, mFinishedAt);
  }

  void ExperimentResult::setTiming(const boost::posix_time::ptime& startedAt,
				   const boost::posix_time::ptime& finishedAt)
  {
    mStartedAt = startedAt;
    mFinishedAt = finishedAt;
  }
}
