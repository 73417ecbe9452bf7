// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "WindowGenerator.h"
#include <algorithm>
#include <stdexcept>
#include "WalkForwardException.h"

namespace stratlab
{
  namespace walkforward
  {
    using boost::gregorian::date;

    date addMonths(const date& from, int count)
    {
      const int monthIndex = static_cast<int>(from.year()) * 12 + (static_cast<int>(from.month()) - 1) + count;
      const unsigned short year = static_cast<unsigned short>(monthIndex / 12);
      const unsigned short month = static_cast<unsigned short>(monthIndex % 12 + 1);
      const unsigned short lastDay = boost::gregorian::gregorian_calendar::end_of_month_day(year, month);

      return date(year, month, std::min<unsigned short>(from.day(), lastDay));
    }

    void validate(const WalkForwardConfig& config)
    {
      if (config.trainMonths <= 0 || config.testMonths <= 0 || config.stepMonths <= 0)
	throw WalkForwardConfigurationException("WalkForwardConfig: train, test and step months must be positive");

      if (config.recommendationThreshold < 0.0 || config.recommendationThreshold > 100.0)
	throw WalkForwardConfigurationException("WalkForwardConfig: recommendation threshold must be within [0, 100]");
    }

    WindowGenerator::WindowGenerator(int trainMonths, int testMonths, int stepMonths)
      : mTrainMonths(trainMonths),
	mTestMonths(testMonths),
	mStepMonths(stepMonths)
    {
      if (trainMonths <= 0 || testMonths <= 0 || stepMonths <= 0)
	throw WalkForwardConfigurationException("WindowGenerator: train, test and step months must be positive");
    }

    WindowGenerator::WindowGenerator(const WalkForwardConfig& config)
      : WindowGenerator(config.trainMonths, config.testMonths, config.stepMonths)
    {}

    std::vector<Window> WindowGenerator::generate(const date& start, const date& end) const
    {
      if (start.is_special() || end.is_special())
	throw WalkForwardConfigurationException("WindowGenerator: start and end must be valid dates");

      if (end < start)
	throw WalkForwardConfigurationException("WindowGenerator: end date precedes start date");

      std::vector<Window> windows;
      for (int k = 0;; ++k)
	{
	  const int offset = k * mStepMonths;
	  date trainStart, trainEnd, testEnd;
	  try
	    {
	      trainStart = addMonths(start, offset);
	      trainEnd = addMonths(start, offset + mTrainMonths);
	      testEnd = addMonths(start, offset + mTrainMonths + mTestMonths);
	    }
	  catch (const std::out_of_range&)
	    {
	      // Past the last representable date, so past the end as well
	      break;
	    }

	  if (testEnd > end)
	    break;

	  windows.emplace_back(static_cast<std::size_t>(k), trainStart, trainEnd, trainEnd, testEnd);
	}
      return windows;
    }
  }
}
