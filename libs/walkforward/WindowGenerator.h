// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_WINDOW_GENERATOR_H
#define __STRATLAB_WINDOW_GENERATOR_H 1

#include <vector>
#include <boost/date_time/gregorian/gregorian.hpp>
#include "DateRange.h"
#include "WalkForwardConfig.h"
#include "Window.h"

namespace stratlab
{
  namespace walkforward
  {
    /**
     * @brief Slices a date range into forward-advancing train/test windows.
     *
     * Window k trains on [start + k*step, start + k*step + train) and tests
     * on the following test months. Every boundary is computed from the
     * global start with addMonths(), so a clamped day never carries over
     * into later windows. Generation
     * stops at the first window whose test end lies after the global end;
     * an empty list is a valid answer.
     */
    /**
     * Calendar month addition that keeps the day of month, clamped to the
     * length of the target month: Jan 31 + 1 is Feb 28, Feb 28 + 1 is
     * Mar 28. Throws std::out_of_range past the representable years.
     */
    boost::gregorian::date addMonths(const boost::gregorian::date& from, int count);

    class WindowGenerator
    {
    public:
      WindowGenerator(int trainMonths, int testMonths, int stepMonths);
      explicit WindowGenerator(const WalkForwardConfig& config);

      std::vector<Window> generate(const boost::gregorian::date& start,
				   const boost::gregorian::date& end) const;

      std::vector<Window> generate(const DateRange& range) const
      {
	return generate(range.getFirstDate(), range.getLastDate());
      }

    private:
      int mTrainMonths;
      int mTestMonths;
      int mStepMonths;
    };
  }
}

#endif
