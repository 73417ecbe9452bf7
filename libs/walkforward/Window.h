// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_WINDOW_H
#define __STRATLAB_WINDOW_H 1

#include <cstddef>
#include <optional>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "BacktestMetrics.h"
#include "DateRange.h"
#include "ParameterValue.h"

namespace stratlab
{
  namespace walkforward
  {
    enum class WindowState
    {
      Pending,
      Optimized,
      Validated
    };

    std::string toString(WindowState state);

    /**
     * @brief One train/test pair of a walk-forward run.
     *
     * The test period starts on the train period's last (exclusive) date.
     * A window is optimized once, then validated once; validation before
     * optimization is a logic error.
     */
    class Window
    {
    public:
      Window(std::size_t index,
	     const boost::gregorian::date& trainStart,
	     const boost::gregorian::date& trainEnd,
	     const boost::gregorian::date& testStart,
	     const boost::gregorian::date& testEnd);

      std::size_t getIndex() const { return mIndex; }
      const boost::gregorian::date& getTrainStart() const { return mTrainStart; }
      const boost::gregorian::date& getTrainEnd() const { return mTrainEnd; }
      const boost::gregorian::date& getTestStart() const { return mTestStart; }
      const boost::gregorian::date& getTestEnd() const { return mTestEnd; }

      DateRange getTrainRange() const
      {
	return DateRange(mTrainStart, mTrainEnd);
      }

      DateRange getTestRange() const
      {
	return DateRange(mTestStart, mTestEnd);
      }

      WindowState getState() const { return mState; }

      bool isOptimized() const
      {
	return mState != WindowState::Pending;
      }

      bool isValidated() const
      {
	return mState == WindowState::Validated;
      }

      // Empty when the train search produced no eligible run
      const ParameterSet& getBestParameters() const { return mBestParameters; }
      const std::optional<BacktestMetrics>& getTrainMetrics() const { return mTrainMetrics; }
      const std::optional<BacktestMetrics>& getTestMetrics() const { return mTestMetrics; }
      const std::string& getError() const { return mError; }

      void markOptimized(const ParameterSet& bestParameters,
			 const std::optional<BacktestMetrics>& trainMetrics);

      // Throws std::logic_error unless the window is optimized and not yet validated
      void markValidated(const std::optional<BacktestMetrics>& testMetrics,
			 const std::string& error = std::string());

    private:
      std::size_t mIndex;
      boost::gregorian::date mTrainStart;
      boost::gregorian::date mTrainEnd;
      boost::gregorian::date mTestStart;
      boost::gregorian::date mTestEnd;
      WindowState mState;
      ParameterSet mBestParameters;
      std::optional<BacktestMetrics> mTrainMetrics;
      std::optional<BacktestMetrics> mTestMetrics;
      std::string mError;
    };
  }
}

#endif
