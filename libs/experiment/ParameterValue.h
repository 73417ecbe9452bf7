// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_PARAMETER_VALUE_H
#define __STRATLAB_PARAMETER_VALUE_H 1

#include <map>
#include <string>
#include <variant>

namespace stratlab
{
  /**
   * @brief A single concrete strategy parameter value.
   *
   * Strategies declare integer, real, boolean and categorical (string)
   * parameters. Integer and real values are numeric and can be viewed as
   * double; the other kinds cannot.
   */
  class ParameterValue
  {
  public:
    enum class Kind { Integer, Real, Boolean, Text };

    ParameterValue()
      : mValue(0LL)
    {}

    ParameterValue(int value)
      : mValue(static_cast<long long>(value))
    {}

    ParameterValue(long value)
      : mValue(static_cast<long long>(value))
    {}

    ParameterValue(long long value)
      : mValue(value)
    {}

    ParameterValue(double value)
      : mValue(value)
    {}

    ParameterValue(bool value)
      : mValue(value)
    {}

    ParameterValue(const std::string& value)
      : mValue(value)
    {}

    ParameterValue(const char* value)
      : mValue(std::string(value))
    {}

    ParameterValue(const ParameterValue&) = default;
    ParameterValue& operator=(const ParameterValue&) = default;
    ~ParameterValue() noexcept = default;

    Kind getKind() const;

    bool isNumeric() const
    {
      return getKind() == Kind::Integer || getKind() == Kind::Real;
    }

    // Throws std::domain_error for boolean and text values
    double asDouble() const;
    long long asInteger() const;
    bool asBoolean() const;
    const std::string& asString() const;

    std::string toString() const;

    friend bool operator==(const ParameterValue& lhs, const ParameterValue& rhs)
    {
      return lhs.mValue == rhs.mValue;
    }

    friend bool operator<(const ParameterValue& lhs, const ParameterValue& rhs)
    {
      return lhs.mValue < rhs.mValue;
    }

  private:
    std::variant<long long, double, bool, std::string> mValue;
  };

  inline bool operator!=(const ParameterValue& lhs, const ParameterValue& rhs)
  {
    return !(lhs == rhs);
  }

  // One concrete assignment: parameter name -> value, ordered by name.
  using ParameterSet = std::map<std::string, ParameterValue>;

  // "{fast=5, slow=20}"
  std::string toString(const ParameterSet& parameters);
}

#endif
