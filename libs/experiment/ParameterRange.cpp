// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ParameterRange.h"
#include "ExperimentException.h"
#include <cmath>
#include <stdexcept>

namespace stratlab
{
  namespace
  {
    // Tolerance used when deciding whether an interval endpoint sits on the step grid
    constexpr double kGridTolerance = 1e-9;

    bool isIntegral(double x)
    {
      return std::isfinite(x) && (std::floor(x) == x);
    }

    std::size_t stepCount(double start, double stop, double step)
    {
      const double spans = (stop - start) / step;
      return static_cast<std::size_t>(std::ceil(spans - kGridTolerance)) + 1;
    }
  }

  ParameterRange::ParameterRange(const std::string& name,
				 std::optional<std::vector<ParameterValue>> values,
				 double start,
				 double stop,
				 std::optional<double> step,
				 std::optional<unsigned int> count,
				 Spacing spacing)
    : mName(name),
      mValues(std::move(values)),
      mStart(start),
      mStop(stop),
      mStep(step),
      mCount(count),
      mSpacing(spacing)
  {}

  void ParameterRange::validateName(const std::string& name)
  {
    if (name.empty())
      throw ExperimentConfigurationException("ParameterRange: parameter name cannot be empty");
  }

  ParameterRange ParameterRange::fromValues(const std::string& name,
					    const std::vector<ParameterValue>& values)
  {
    validateName(name);
    if (values.empty())
      throw ExperimentConfigurationException("ParameterRange '" + name + "': value list cannot be empty");

    return ParameterRange(name, values, 0.0, 0.0, std::nullopt, std::nullopt, Spacing::Linear);
  }

  ParameterRange ParameterRange::fromStep(const std::string& name,
					  double start,
					  double stop,
					  double step)
  {
    validateName(name);
    if (!std::isfinite(start) || !std::isfinite(stop) || !std::isfinite(step))
      throw ExperimentConfigurationException("ParameterRange '" + name + "': bounds and step must be finite");

    if (step <= 0.0)
      throw ExperimentConfigurationException("ParameterRange '" + name + "': step must be positive");

    if (stop < start)
      throw ExperimentConfigurationException("ParameterRange '" + name + "': stop cannot be less than start");

    return ParameterRange(name, std::nullopt, start, stop, step, std::nullopt, Spacing::Linear);
  }

  ParameterRange ParameterRange::fromCount(const std::string& name,
					   double start,
					   double stop,
					   unsigned int count,
					   Spacing spacing)
  {
    validateName(name);
    if (!std::isfinite(start) || !std::isfinite(stop))
      throw ExperimentConfigurationException("ParameterRange '" + name + "': bounds must be finite");

    if (count == 0)
      throw ExperimentConfigurationException("ParameterRange '" + name + "': count must be at least 1");

    if (stop < start)
      throw ExperimentConfigurationException("ParameterRange '" + name + "': stop cannot be less than start");

    if (spacing == Spacing::Logarithmic && (start <= 0.0 || stop <= 0.0))
      throw ExperimentConfigurationException("ParameterRange '" + name + "': log spacing requires strictly positive bounds");

    return ParameterRange(name, std::nullopt, start, stop, std::nullopt, count, spacing);
  }

  const std::vector<ParameterValue>& ParameterRange::getValues() const
  {
    if (!mValues)
      throw std::logic_error("ParameterRange '" + mName + "' is an interval, not a value list");

    return *mValues;
  }

  double ParameterRange::getStart() const
  {
    if (mValues)
      throw std::logic_error("ParameterRange '" + mName + "' is a value list, not an interval");

    return mStart;
  }

  double ParameterRange::getStop() const
  {
    if (mValues)
      throw std::logic_error("ParameterRange '" + mName + "' is a value list, not an interval");

    return mStop;
  }

  std::size_t ParameterRange::size() const
  {
    if (mValues)
      return mValues->size();

    if (mStep)
      return stepCount(mStart, mStop, *mStep);

    return *mCount;
  }

  std::vector<ParameterValue> ParameterRange::expand() const
  {
    if (mValues)
      return *mValues;

    std::vector<ParameterValue> result;
    const std::size_t n = size();
    result.reserve(n);

    if (mStep)
      {
	const double step = *mStep;
	const bool integral = isIntegral(mStart) && isIntegral(mStop) && isIntegral(step);

	for (std::size_t i = 0; i < n; ++i)
	  {
	    double v = (i + 1 == n) ? mStop : mStart + static_cast<double>(i) * step;
	    if (v > mStop)
	      v = mStop;

	    if (integral)
	      result.emplace_back(static_cast<long long>(std::llround(v)));
	    else
	      result.emplace_back(v);
	  }

	return result;
      }

    if (n == 1)
      {
	result.emplace_back(mStart);
	return result;
      }

    const double denom = static_cast<double>(n - 1);
    if (mSpacing == Spacing::Logarithmic)
      {
	const double logStart = std::log(mStart);
	const double logStop = std::log(mStop);
	for (std::size_t i = 0; i < n; ++i)
	  {
	    const double v = (i + 1 == n) ? mStop
	      : std::exp(logStart + (logStop - logStart) * static_cast<double>(i) / denom);
	    result.emplace_back(v);
	  }
      }
    else
      {
	for (std::size_t i = 0; i < n; ++i)
	  {
	    const double v = (i + 1 == n) ? mStop
	      : mStart + (mStop - mStart) * static_cast<double>(i) / denom;
	    result.emplace_back(v);
	  }
      }

    return result;
  }

  bool operator==(const ParameterRange& lhs, const ParameterRange& rhs)
  {
    if (lhs.getName() != rhs.getName() || lhs.isExplicit() != rhs.isExplicit())
      return false;

    if (lhs.isExplicit())
      return lhs.getValues() == rhs.getValues();

    return (lhs.getStart() == rhs.getStart()) &&
      (lhs.getStop() == rhs.getStop()) &&
      (lhs.getStep() == rhs.getStep()) &&
      (lhs.getCount() == rhs.getCount()) &&
      (lhs.isLogScale() == rhs.isLogScale());
  }
}
