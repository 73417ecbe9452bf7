// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_PARAMETER_RANGE_H
#define __STRATLAB_PARAMETER_RANGE_H 1

#include <optional>
#include <string>
#include <vector>
#include "ParameterValue.h"

namespace stratlab
{
  /**
   * @brief The admissible values of one strategy parameter.
   *
   * A range is either an explicit list of values or a numeric interval
   * [start, stop]. An interval is divided either by a step (linear only) or
   * by a count of points (linear or log spaced).
   *
   * Every constructor validates its arguments and throws
   * ExperimentConfigurationException, so an existing ParameterRange always
   * expands to a non-empty sequence.
   */
  class ParameterRange
  {
  public:
    enum class Spacing { Linear, Logarithmic };

    static constexpr unsigned int kDefaultLogCount = 10;

    static ParameterRange fromValues(const std::string& name,
				     const std::vector<ParameterValue>& values);

    static ParameterRange fromStep(const std::string& name,
				   double start,
				   double stop,
				   double step);

    static ParameterRange fromCount(const std::string& name,
				    double start,
				    double stop,
				    unsigned int count,
				    Spacing spacing = Spacing::Linear);

    ParameterRange(const ParameterRange&) = default;
    ParameterRange& operator=(const ParameterRange&) = default;
    ~ParameterRange() noexcept = default;

    const std::string& getName() const
    {
      return mName;
    }

    bool isExplicit() const
    {
      return mValues.has_value();
    }

    bool isLogScale() const
    {
      return mSpacing == Spacing::Logarithmic;
    }

    const std::vector<ParameterValue>& getValues() const;
    double getStart() const;
    double getStop() const;
    std::optional<double> getStep() const
    {
      return mStep;
    }

    std::optional<unsigned int> getCount() const
    {
      return mCount;
    }

    /**
     * @brief Concrete values of this range, in order.
     *
     * Explicit lists come back unchanged. A step interval produces
     * ceil((stop - start) / step) + 1 values; when the step does not land on
     * stop the final value is clamped to stop, so the sequence always spans
     * [start, stop]. If start, stop and step are all integral the values are
     * integers, otherwise reals. Count intervals always produce reals.
     */
    std::vector<ParameterValue> expand() const;

    // Number of values expand() returns, without building them
    std::size_t size() const;

  private:
    ParameterRange(const std::string& name,
		   std::optional<std::vector<ParameterValue>> values,
		   double start,
		   double stop,
		   std::optional<double> step,
		   std::optional<unsigned int> count,
		   Spacing spacing);

    static void validateName(const std::string& name);

  private:
    std::string mName;
    std::optional<std::vector<ParameterValue>> mValues;
    double mStart;
    double mStop;
    std::optional<double> mStep;
    std::optional<unsigned int> mCount;
    Spacing mSpacing;
  };

  bool operator==(const ParameterRange& lhs, const ParameterRange& rhs);

  inline bool operator!=(const ParameterRange& lhs, const ParameterRange& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
