// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_SAMPLE_STATISTICS_H
#define __STRATLAB_SAMPLE_STATISTICS_H 1

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/count.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/min.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/variance.hpp>

namespace stratlab
{
  /**
   * @class SampleStatistics
   * @brief Summary of a sequence of doubles, backed by Boost.Accumulators
   *
   * Boost's variance is the population variance; the sample variance is
   * derived from it with Bessel's correction. Non-finite inputs are ignored.
   */
  class SampleStatistics
  {
  private:
    using AccumulatorType = boost::accumulators::accumulator_set<
      double,
      boost::accumulators::stats<
	boost::accumulators::tag::min,
	boost::accumulators::tag::max,
	boost::accumulators::tag::mean,
	boost::accumulators::tag::variance,
	boost::accumulators::tag::count
	>
      >;

  public:
    SampleStatistics() = default;

    explicit SampleStatistics(const std::vector<double>& values)
    {
      for (double v : values)
	add(v);
    }

    void add(double value)
    {
      if (std::isfinite(value))
	mAccumulator(value);
    }

    std::size_t getCount() const
    {
      return boost::accumulators::count(mAccumulator);
    }

    bool empty() const
    {
      return getCount() == 0;
    }

    double getMean() const
    {
      return empty() ? std::numeric_limits<double>::quiet_NaN() : boost::accumulators::mean(mAccumulator);
    }

    double getMin() const
    {
      return empty() ? std::numeric_limits<double>::quiet_NaN() : boost::accumulators::min(mAccumulator);
    }

    double getMax() const
    {
      return empty() ? std::numeric_limits<double>::quiet_NaN() : boost::accumulators::max(mAccumulator);
    }

    double getPopulationVariance() const
    {
      return empty() ? std::numeric_limits<double>::quiet_NaN() : clampZero(boost::accumulators::variance(mAccumulator));
    }

    // NaN for fewer than two values
    double getSampleVariance() const
    {
      const std::size_t n = getCount();
      if (n < 2)
	return std::numeric_limits<double>::quiet_NaN();

      return getPopulationVariance() * static_cast<double>(n) / static_cast<double>(n - 1);
    }

    double getPopulationStdDev() const
    {
      return std::sqrt(getPopulationVariance());
    }

    double getSampleStdDev() const
    {
      return std::sqrt(getSampleVariance());
    }

  private:
    static double clampZero(double v)
    {
      return v < 0.0 ? 0.0 : v;
    }

  private:
    AccumulatorType mAccumulator;
  };
}

#endif
