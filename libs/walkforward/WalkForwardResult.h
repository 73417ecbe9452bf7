// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_WALK_FORWARD_RESULT_H
#define __STRATLAB_WALK_FORWARD_RESULT_H 1

#include <cstddef>
#include <limits>
#include <map>
#include <string>
#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BacktestMetrics.h"
#include "ParameterValue.h"
#include "RobustnessScorer.h"
#include "StatisticStatus.h"
#include "WalkForwardConfig.h"
#include "Window.h"

namespace stratlab
{
  namespace walkforward
  {
    // One row of the in-sample or out-of-sample metric table
    struct WindowMetricRow
    {
      std::size_t windowIndex;
      boost::gregorian::date periodStart;
      boost::gregorian::date periodEnd;
      double value;                    // the optimization metric
      BacktestMetrics metrics;
    };

    struct ParameterStability
    {
      std::vector<double> values;      // winning value per optimized window
      double mean = std::numeric_limits<double>::quiet_NaN();
      double stdDev = std::numeric_limits<double>::quiet_NaN();   // population
      double cv = std::numeric_limits<double>::quiet_NaN();       // infinite for a zero mean
    };

    struct OutOfSampleSummary
    {
      StatisticStatus status = StatisticStatus::InsufficientData;
      std::size_t windows = 0;
      double mean = std::numeric_limits<double>::quiet_NaN();
      double stdDev = std::numeric_limits<double>::quiet_NaN();   // sample, NaN for one window
      double max = std::numeric_limits<double>::quiet_NaN();
      double min = std::numeric_limits<double>::quiet_NaN();
      std::size_t positiveWindows = 0;
    };

    /**
     * @brief Windows of a finished walk-forward run and the views derived from them.
     *
     * Read-only once produced. Every view is computed on demand from the
     * windows.
     */
    class WalkForwardResult
    {
    public:
      WalkForwardResult(const std::vector<Window>& windows,
			const WalkForwardConfig& config,
			const std::string& experimentName,
			const std::string& strategyId,
			const std::vector<std::string>& symbols,
			const std::string& timeframe,
			const std::string& metric,
			bool maximize);

      const std::vector<Window>& getWindows() const { return mWindows; }
      const WalkForwardConfig& getConfig() const { return mConfig; }
      const std::string& getExperimentName() const { return mExperimentName; }
      const std::string& getStrategyId() const { return mStrategyId; }
      const std::vector<std::string>& getSymbols() const { return mSymbols; }
      const std::string& getTimeframe() const { return mTimeframe; }
      const std::string& getMetric() const { return mMetric; }
      bool isMaximizing() const { return mMaximize; }

      double getTrainSeconds() const { return mTrainSeconds; }
      double getTestSeconds() const { return mTestSeconds; }
      void setTiming(double trainSeconds, double testSeconds);

      // Validated windows with test metrics reporting the metric
      std::vector<WindowMetricRow> getOutOfSampleMetrics() const;

      // Optimized windows with train metrics reporting the metric
      std::vector<WindowMetricRow> getInSampleMetrics() const;

      // Numeric parameters that won in at least two windows
      std::map<std::string, ParameterStability> getParameterStability() const;

      OutOfSampleSummary getOutOfSampleSummary() const;

      // Winning parameters of the validated window with the best OOS metric; empty if none
      ParameterSet getRobustParameters() const;

      RobustnessScore getRobustnessScore() const;

      bool isRecommended() const;

    private:
      std::vector<Window> mWindows;
      WalkForwardConfig mConfig;
      std::string mExperimentName;
      std::string mStrategyId;
      std::vector<std::string> mSymbols;
      std::string mTimeframe;
      std::string mMetric;
      bool mMaximize;
      double mTrainSeconds;
      double mTestSeconds;
    };
  }
}

#endif
