// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "Window.h"
#include <stdexcept>

namespace stratlab
{
  namespace walkforward
  {
    std::string toString(WindowState state)
    {
      switch (state)
	{
	case WindowState::Pending:
	  return "pending";
	case WindowState::Optimized:
	  return "optimized";
	case WindowState::Validated:
	  return "validated";
	}
      throw std::invalid_argument("toString: unknown window state");
    }

    Window::Window(std::size_t index,
		   const boost::gregorian::date& trainStart,
		   const boost::gregorian::date& trainEnd,
		   const boost::gregorian::date& testStart,
		   const boost::gregorian::date& testEnd)
      : mIndex(index),
	mTrainStart(trainStart),
	mTrainEnd(trainEnd),
	mTestStart(testStart),
	mTestEnd(testEnd),
	mState(WindowState::Pending),
	mBestParameters(),
	mTrainMetrics(),
	mTestMetrics(),
	mError()
    {}

    void Window::markOptimized(const ParameterSet& bestParameters,
			       const std::optional<BacktestMetrics>& trainMetrics)
    {
      if (mState != WindowState::Pending)
	throw std::logic_error("Window " + std::to_string(mIndex) + ": already " + toString(mState));

      mBestParameters = bestParameters;
      mTrainMetrics = trainMetrics;
      mState = WindowState::Optimized;
    }

    void Window::markValidated(const std::optional<BacktestMetrics>& testMetrics,
			       const std::string& error)
    {
      if (mState != WindowState::Optimized)
	throw std::logic_error("Window " + std::to_string(mIndex) + ": cannot validate a window that is "
			       + toString(mState));

      mTestMetrics = testMetrics;
      mError = error;
      mState = WindowState::Validated;
    }
  }
}
