// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ExperimentJson.h"
#include "ExperimentException.h"
#include <cmath>
#include <limits>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

using namespace rapidjson;

namespace stratlab
{
  Value parameterValueToJson(const ParameterValue& value, JsonAllocator& allocator)
  {
    switch (value.getKind())
      {
      case ParameterValue::Kind::Integer:
	return Value(static_cast<int64_t>(value.asInteger()));
      case ParameterValue::Kind::Real:
	return Value(value.asDouble());
      case ParameterValue::Kind::Boolean:
	return Value(value.asBoolean());
      case ParameterValue::Kind::Text:
	break;
      }
    return Value(value.asString().c_str(), allocator);
  }

  ParameterValue parameterValueFromJson(const Value& json, const std::string& context)
  {
    if (json.IsBool())
      return ParameterValue(json.GetBool());

    if (json.IsInt64())
      return ParameterValue(static_cast<long long>(json.GetInt64()));

    if (json.IsNumber())
      return ParameterValue(json.GetDouble());

    if (json.IsString())
      return ParameterValue(std::string(json.GetString(), json.GetStringLength()));

    throw ExperimentConfigurationException(context + ": parameter values must be numbers, booleans or strings");
  }

  Value parameterSetToJson(const ParameterSet& parameters, JsonAllocator& allocator)
  {
    Value obj(kObjectType);
    for (const auto& entry : parameters)
      obj.AddMember(Value(entry.first.c_str(), allocator),
		    parameterValueToJson(entry.second, allocator),
		    allocator);
    return obj;
  }

  ParameterSet parameterSetFromJson(const Value& json, const std::string& context)
  {
    if (!json.IsObject())
      throw ExperimentConfigurationException(context + ": parameter assignment must be an object");

    ParameterSet result;
    for (Value::ConstMemberIterator it = json.MemberBegin(); it != json.MemberEnd(); ++it)
      {
	std::string name(it->name.GetString(), it->name.GetStringLength());
	result[name] = parameterValueFromJson(it->value, context + "." + name);
      }
    return result;
  }

  Value parameterRangeToJson(const ParameterRange& range, JsonAllocator& allocator)
  {
    if (range.isExplicit())
      {
	Value arr(kArrayType);
	for (const auto& v : range.getValues())
	  arr.PushBack(parameterValueToJson(v, allocator), allocator);
	return arr;
      }

    Value obj(kObjectType);
    obj.AddMember("start", range.getStart(), allocator);
    obj.AddMember("stop", range.getStop(), allocator);
    if (range.getStep())
      obj.AddMember("step", *range.getStep(), allocator);
    if (range.getCount())
      obj.AddMember("count", static_cast<unsigned>(*range.getCount()), allocator);
    obj.AddMember("log", range.isLogScale(), allocator);
    return obj;
  }

  ParameterRange parameterRangeFromJson(const std::string& name, const Value& json)
  {
    using json_access::Origin;
    const std::string context = "parameter '" + name + "'";

    if (json.IsArray())
      {
	std::vector<ParameterValue> values;
	values.reserve(json.Size());
	for (const auto& item : json.GetArray())
	  values.push_back(parameterValueFromJson(item, context));
	return ParameterRange::fromValues(name, values);
      }

    if (!json.IsObject())
      throw ExperimentConfigurationException(context + ": expected a value list or a {start, stop, step|count} object");

    auto start = json_access::optionalDouble(json, "start", Origin::Configuration);
    auto stop = json_access::optionalDouble(json, "stop", Origin::Configuration);
    auto step = json_access::optionalDouble(json, "step", Origin::Configuration);
    auto count = json_access::optionalUnsigned(json, "count", Origin::Configuration);
    if (!count)
      count = json_access::optionalUnsigned(json, "num", Origin::Configuration);
    const bool logScale = json_access::optionalBool(json, "log", Origin::Configuration).value_or(false);

    if (!start || !stop)
      throw ExperimentConfigurationException(context + ": interval requires both start and stop");

    if (step && count)
      throw ExperimentConfigurationException(context + ": specify either step or count, not both");

    if (logScale)
      {
	if (step)
	  throw ExperimentConfigurationException(context + ": log spacing is defined by count, not step");

	const unsigned int n = count ? static_cast<unsigned int>(*count) : ParameterRange::kDefaultLogCount;
	return ParameterRange::fromCount(name, *start, *stop, n, ParameterRange::Spacing::Logarithmic);
      }

    if (step)
      return ParameterRange::fromStep(name, *start, *stop, *step);

    if (count)
      return ParameterRange::fromCount(name, *start, *stop, static_cast<unsigned int>(*count));

    throw ExperimentConfigurationException(context + ": linear interval requires step or count");
  }

  Value numberToJson(double value)
  {
    if (!std::isfinite(value))
      return Value(kNullType);

    return Value(value);
  }

  double numberFromJson(const Value& json, const std::string& context)
  {
    if (json.IsNull())
      return std::numeric_limits<double>::quiet_NaN();

    if (!json.IsNumber())
      throw PersistenceException(context + " must be a number");

    return json.GetDouble();
  }

  Value stringToJson(const std::string& text, JsonAllocator& allocator)
  {
    return Value(text.c_str(), static_cast<SizeType>(text.size()), allocator);
  }

  Value stringListToJson(const std::vector<std::string>& items, JsonAllocator& allocator)
  {
    Value arr(kArrayType);
    for (const auto& item : items)
      arr.PushBack(stringToJson(item, allocator), allocator);
    return arr;
  }

  std::string jsonToString(const Value& json, bool pretty)
  {
    StringBuffer buffer;
    if (pretty)
      {
	PrettyWriter<StringBuffer> writer(buffer);
	json.Accept(writer);
      }
    else
      {
	Writer<StringBuffer> writer(buffer);
	json.Accept(writer);
      }
    return std::string(buffer.GetString(), buffer.GetSize());
  }

  void parseJsonDocument(Document& doc, const std::string& text, const std::string& context)
  {
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError())
      throw ExperimentConfigurationException(context + ": JSON parse error at offset "
					     + std::to_string(doc.GetErrorOffset()) + ": "
					     + GetParseError_En(doc.GetParseError()));
  }

  namespace json_access
  {
    void fail(Origin origin, const std::string& message)
    {
      if (origin == Origin::Configuration)
	throw ExperimentConfigurationException(message);

      throw PersistenceException(message);
    }

    const Value* findMember(const Value& obj, const char* key)
    {
      if (!obj.IsObject())
	return nullptr;

      Value::ConstMemberIterator it = obj.FindMember(key);
      if (it == obj.MemberEnd() || it->value.IsNull())
	return nullptr;

      return &it->value;
    }

    std::string requireString(const Value& obj, const char* key, Origin origin)
    {
      auto value = optionalString(obj, key, origin);
      if (!value)
	fail(origin, std::string("missing required field '") + key + "'");
      return *value;
    }

    std::optional<std::string> optionalString(const Value& obj, const char* key, Origin origin)
    {
      const Value* v = findMember(obj, key);
      if (!v)
	return std::nullopt;

      if (!v->IsString())
	fail(origin, std::string("field '") + key + "' must be a string");

      return std::string(v->GetString(), v->GetStringLength());
    }

    std::optional<double> optionalDouble(const Value& obj, const char* key, Origin origin)
    {
      const Value* v = findMember(obj, key);
      if (!v)
	return std::nullopt;

      if (!v->IsNumber())
	fail(origin, std::string("field '") + key + "' must be a number");

      return v->GetDouble();
    }

    std::optional<std::uint64_t> optionalUnsigned(const Value& obj, const char* key, Origin origin)
    {
      const Value* v = findMember(obj, key);
      if (!v)
	return std::nullopt;

      if (!v->IsUint64())
	fail(origin, std::string("field '") + key + "' must be a non-negative integer");

      return v->GetUint64();
    }

    std::optional<bool> optionalBool(const Value& obj, const char* key, Origin origin)
    {
      const Value* v = findMember(obj, key);
      if (!v)
	return std::nullopt;

      if (!v->IsBool())
	fail(origin, std::string("field '") + key + "' must be true or false");

      return v->GetBool();
    }

    std::vector<std::string> optionalStringList(const Value& obj, const char* key, Origin origin)
    {
      std::vector<std::string> result;
      const Value* v = findMember(obj, key);
      if (!v)
	return result;

      if (!v->IsArray())
	fail(origin, std::string("field '") + key + "' must be a list of strings");

      for (const auto& item : v->GetArray())
	{
	  if (!item.IsString())
	    fail(origin, std::string("field '") + key + "' must be a list of strings");
	  result.emplace_back(item.GetString(), item.GetStringLength());
	}
      return result;
    }
  }
}
