// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ParameterValue.h"
#include <sstream>
#include <stdexcept>

namespace stratlab
{
  ParameterValue::Kind ParameterValue::getKind() const
  {
    switch (mValue.index())
      {
      case 0:
	return Kind::Integer;
      case 1:
	return Kind::Real;
      case 2:
	return Kind::Boolean;
      default:
	return Kind::Text;
      }
  }

  double ParameterValue::asDouble() const
  {
    if (const long long* i = std::get_if<long long>(&mValue))
      return static_cast<double>(*i);

    if (const double* d = std::get_if<double>(&mValue))
      return *d;

    throw std::domain_error("ParameterValue::asDouble - value " + toString() + " is not numeric");
  }

  long long ParameterValue::asInteger() const
  {
    if (const long long* i = std::get_if<long long>(&mValue))
      return *i;

    throw std::domain_error("ParameterValue::asInteger - value " + toString() + " is not an integer");
  }

  bool ParameterValue::asBoolean() const
  {
    if (const bool* b = std::get_if<bool>(&mValue))
      return *b;

    throw std::domain_error("ParameterValue::asBoolean - value " + toString() + " is not a boolean");
  }

  const std::string& ParameterValue::asString() const
  {
    if (const std::string* s = std::get_if<std::string>(&mValue))
      return *s;

    throw std::domain_error("ParameterValue::asString - value " + toString() + " is not text");
  }

  std::string ParameterValue::toString() const
  {
    std::ostringstream os;
    switch (getKind())
      {
      case Kind::Integer:
	os << std::get<long long>(mValue);
	break;
      case Kind::Real:
	os << std::get<double>(mValue);
	break;
      case Kind::Boolean:
	os << (std::get<bool>(mValue) ? "true" : "false");
	break;
      case Kind::Text:
	os << std::get<std::string>(mValue);
	break;
      }
    return os.str();
  }

  std::string toString(const ParameterSet& parameters)
  {
    std::ostringstream os;
    os << "{";
    bool first = true;
    for (const auto& entry : parameters)
      {
	if (!first)
	  os << ", ";
	os << entry.first << "=" << entry.second.toString();
	first = false;
      }
    os << "}";
    return os.str();
  }
}
