// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_EXPERIMENT_JSON_H
#define __STRATLAB_EXPERIMENT_JSON_H 1

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <rapidjson/document.h>
#include "ParameterRange.h"
#include "ParameterValue.h"

namespace stratlab
{
  using JsonAllocator = rapidjson::Document::AllocatorType;

  /**
   * @brief RapidJSON conversions shared by the configuration reader/writer,
   *        the run serializer and the walk-forward report.
   *
   * Readers never let RapidJSON assert on a type mismatch: every accessor
   * checks the member type first and throws the exception type chosen by the
   * caller's context (ExperimentConfigurationException for documents a human
   * edits, PersistenceException for files this library wrote).
   */

  rapidjson::Value parameterValueToJson(const ParameterValue& value, JsonAllocator& allocator);
  ParameterValue parameterValueFromJson(const rapidjson::Value& json, const std::string& context);

  rapidjson::Value parameterSetToJson(const ParameterSet& parameters, JsonAllocator& allocator);
  ParameterSet parameterSetFromJson(const rapidjson::Value& json, const std::string& context);

  // A list range becomes a JSON array, an interval an object
  // {start, stop, step} or {start, stop, count, log}
  rapidjson::Value parameterRangeToJson(const ParameterRange& range, JsonAllocator& allocator);
  ParameterRange parameterRangeFromJson(const std::string& name, const rapidjson::Value& json);

  // Non-finite values are written as null and read back as NaN
  rapidjson::Value numberToJson(double value);
  double numberFromJson(const rapidjson::Value& json, const std::string& context);

  rapidjson::Value stringToJson(const std::string& text, JsonAllocator& allocator);
  rapidjson::Value stringListToJson(const std::vector<std::string>& items, JsonAllocator& allocator);

  std::string jsonToString(const rapidjson::Value& json, bool pretty = false);

  // Parse a complete document; throws ExperimentConfigurationException on malformed text
  void parseJsonDocument(rapidjson::Document& doc, const std::string& text, const std::string& context);

  namespace json_access
  {
    // Lookups used when reading documents. Missing members yield nullopt
    // from the optional variants; wrong types always throw.
    enum class Origin { Configuration, Persistence };

    const rapidjson::Value* findMember(const rapidjson::Value& obj, const char* key);

    std::string requireString(const rapidjson::Value& obj, const char* key, Origin origin);
    std::optional<std::string> optionalString(const rapidjson::Value& obj, const char* key, Origin origin);
    std::optional<double> optionalDouble(const rapidjson::Value& obj, const char* key, Origin origin);
    std::optional<std::uint64_t> optionalUnsigned(const rapidjson::Value& obj, const char* key, Origin origin);
    std::optional<bool> optionalBool(const rapidjson::Value& obj, const char* key, Origin origin);
    std::vector<std::string> optionalStringList(const rapidjson::Value& obj, const char* key, Origin origin);

    [[noreturn]] void fail(Origin origin, const std::string& message);
  }
}

#endif
