// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "WalkForwardResult.h"
#include <cmath>
#include "ExperimentResult.h"
#include "SampleStatistics.h"

namespace stratlab
{
  namespace walkforward
  {
    namespace
    {
      std::vector<double> metricValues(const std::vector<WindowMetricRow>& rows)
      {
	std::vector<double> values;
	values.reserve(rows.size());
	for (const auto& row : rows)
	  values.push_back(row.value);
	return values;
      }
    }

    WalkForwardResult::WalkForwardResult(const std::vector<Window>& windows,
					 const WalkForwardConfig& config,
					 const std::string& experimentName,
					 const std::string& strategyId,
					 const std::vector<std::string>& symbols,
					 const std::string& timeframe,
					 const std::string& metric,
					 bool maximize)
      : mWindows(windows),
	mConfig(config),
	mExperimentName(experimentName),
	mStrategyId(strategyId),
	mSymbols(symbols),
	mTimeframe(timeframe),
	mMetric(metric),
	mMaximize(maximize),
	mTrainSeconds(0.0),
	mTestSeconds(0.0)
    {}

    void WalkForwardResult::setTiming(double trainSeconds, double testSeconds)
    {
      mTrainSeconds = trainSeconds;
      mTestSeconds = testSeconds;
    }

    std::vector<WindowMetricRow> WalkForwardResult::getOutOfSampleMetrics() const
    {
      std::vector<WindowMetricRow> rows;
      for (const auto& window : mWindows)
	{
	  if (!window.isValidated() || !window.getTestMetrics())
	    continue;

	  const std::optional<double> value = window.getTestMetrics()->getMetric(mMetric);
	  if (value && std::isfinite(*value))
	    rows.push_back(WindowMetricRow{window.getIndex(), window.getTestStart(), window.getTestEnd(),
					   *value, *window.getTestMetrics()});
	}
      return rows;
    }

    std::vector<WindowMetricRow> WalkForwardResult::getInSampleMetrics() const
    {
      std::vector<WindowMetricRow> rows;
      for (const auto& window : mWindows)
	{
	  if (!window.isOptimized() || !window.getTrainMetrics())
	    continue;

	  const std::optional<double> value = window.getTrainMetrics()->getMetric(mMetric);
	  if (value && std::isfinite(*value))
	    rows.push_back(WindowMetricRow{window.getIndex(), window.getTrainStart(), window.getTrainEnd(),
					   *value, *window.getTrainMetrics()});
	}
      return rows;
    }

    std::map<std::string, ParameterStability> WalkForwardResult::getParameterStability() const
    {
      std::map<std::string, std::vector<double>> collected;
      for (const auto& window : mWindows)
	{
	  if (!window.isOptimized())
	    continue;

	  for (const auto& entry : window.getBestParameters())
	    {
	      if (entry.second.isNumeric())
		collected[entry.first].push_back(entry.second.asDouble());
	    }
	}

      std::map<std::string, ParameterStability> table;
      for (const auto& entry : collected)
	{
	  if (entry.second.size() < 2)
	    continue;

	  SampleStatistics stats(entry.second);
	  ParameterStability stability;
	  stability.values = entry.second;
	  stability.mean = stats.getMean();
	  stability.stdDev = stats.getPopulationStdDev();
	  stability.cv = coefficientOfVariation(entry.second);
	  table.emplace(entry.first, stability);
	}
      return table;
    }

    OutOfSampleSummary WalkForwardResult::getOutOfSampleSummary() const
    {
      OutOfSampleSummary summary;
      const std::vector<double> values = metricValues(getOutOfSampleMetrics());
      if (values.empty())
	return summary;

      SampleStatistics stats(values);
      summary.status = StatisticStatus::Success;
      summary.windows = values.size();
      summary.mean = stats.getMean();
      summary.stdDev = stats.getSampleStdDev();
      summary.max = stats.getMax();
      summary.min = stats.getMin();
      for (double v : values)
	{
	  if (v > 0.0)
	    ++summary.positiveWindows;
	}
      return summary;
    }

    ParameterSet WalkForwardResult::getRobustParameters() const
    {
      const std::vector<WindowMetricRow> rows = getOutOfSampleMetrics();
      const WindowMetricRow* best = nullptr;
      for (const auto& row : rows)
	{
	  if (!best || isBetterMetric(row.value, best->value, mMaximize))
	    best = &row;
	}

      if (!best)
	return ParameterSet();

      for (const auto& window : mWindows)
	{
	  if (window.getIndex() == best->windowIndex)
	    return window.getBestParameters();
	}
      return ParameterSet();
    }

    RobustnessScore WalkForwardResult::getRobustnessScore() const
    {
      std::vector<std::vector<double>> parameterValues;
      for (const auto& entry : getParameterStability())
	parameterValues.push_back(entry.second.values);

      return RobustnessScorer(mMaximize).score(metricValues(getInSampleMetrics()),
					       metricValues(getOutOfSampleMetrics()),
					       parameterValues);
    }

    bool WalkForwardResult::isRecommended() const
    {
      const RobustnessScore score = getRobustnessScore();
      return score.status == StatisticStatus::Success && score.total >= mConfig.recommendationThreshold;
    }
  }
}
