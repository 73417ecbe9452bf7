// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ExperimentConfigurationReader.h"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem/fstream.hpp>
#include <sstream>
#include "ExperimentException.h"
#include "ExperimentJson.h"

using namespace rapidjson;

namespace stratlab
{
  using json_access::Origin;

  ExperimentConfiguration
  ExperimentConfigurationReader::readFile(const boost::filesystem::path& path) const
  {
    const std::string extension = boost::algorithm::to_lower_copy(path.extension().string());
    if (extension != ".json")
      throw ExperimentConfigurationException("unsupported experiment file format '" + extension
					     + "' for " + path.string() + " (expected .json)");

    boost::filesystem::ifstream in(path);
    if (!in)
      throw ExperimentConfigurationException("cannot open experiment file " + path.string());

    std::ostringstream contents;
    contents << in.rdbuf();
    return parseString(contents.str());
  }

  ExperimentConfiguration
  ExperimentConfigurationReader::parseString(const std::string& text) const
  {
    Document doc;
    parseJsonDocument(doc, text, "experiment configuration");
    return fromJson(doc);
  }

  ExperimentConfiguration
  ExperimentConfigurationReader::fromJson(const Value& json) const
  {
    if (!json.IsObject())
      throw ExperimentConfigurationException("experiment configuration must be a JSON object");

    const std::string name = json_access::requireString(json, "name", Origin::Configuration);
    const std::string strategy = json_access::requireString(json, "strategy", Origin::Configuration);
    const std::string timeframe = json_access::requireString(json, "timeframe", Origin::Configuration);
    const std::vector<std::string> symbols =
      json_access::optionalStringList(json, "symbols", Origin::Configuration);

    std::vector<ParameterRange> ranges;
    if (const Value* params = json_access::findMember(json, "parameters"))
      {
	if (!params->IsObject())
	  throw ExperimentConfigurationException("field 'parameters' must be an object");

	for (Value::ConstMemberIterator it = params->MemberBegin(); it != params->MemberEnd(); ++it)
	  ranges.push_back(parameterRangeFromJson(std::string(it->name.GetString(),
							      it->name.GetStringLength()),
						  it->value));
      }

    const ExpansionMode mode =
      expansionModeFromString(json_access::optionalString(json, "expansion_mode", Origin::Configuration)
			      .value_or("grid"));

    auto maxCombinations = json_access::optionalUnsigned(json, "max_combinations", Origin::Configuration);
    auto sampleSize = json_access::optionalUnsigned(json, "sample_size", Origin::Configuration);
    auto seed = json_access::optionalUnsigned(json, "seed", Origin::Configuration);

    std::vector<ParameterSet> combinations;
    if (const Value* combos = json_access::findMember(json, "combinations"))
      {
	if (!combos->IsArray())
	  throw ExperimentConfigurationException("field 'combinations' must be a list of objects");

	for (const auto& item : combos->GetArray())
	  combinations.push_back(parameterSetFromJson(item, "combinations"));
      }

    ExpansionPolicy policy(mode,
			   maxCombinations ? std::optional<std::size_t>(*maxCombinations) : std::nullopt,
			   sampleSize ? std::optional<std::size_t>(*sampleSize) : std::nullopt,
			   seed,
			   combinations);

    ExecutionDefaults defaults;
    ExecutionDefaults execution(json_access::optionalDouble(json, "initial_cash", Origin::Configuration)
				.value_or(defaults.getInitialCash()),
				json_access::optionalDouble(json, "fee_rate", Origin::Configuration)
				.value_or(defaults.getFeeRate()),
				json_access::optionalDouble(json, "leverage", Origin::Configuration)
				.value_or(defaults.getLeverage()),
				json_access::optionalDouble(json, "stop_loss_pct", Origin::Configuration),
				json_access::optionalDouble(json, "take_profit_pct", Origin::Configuration));

    ExperimentConfiguration config(name, strategy, symbols, timeframe, ranges, policy, execution);

    auto startDate = json_access::optionalString(json, "start_date", Origin::Configuration);
    auto endDate = json_access::optionalString(json, "end_date", Origin::Configuration);
    if (startDate.has_value() != endDate.has_value())
      throw ExperimentConfigurationException("start_date and end_date must be given together");

    if (startDate)
      {
	try
	  {
	    config = config.withDateRange(DateRange(parseIsoDate(*startDate), parseIsoDate(*endDate)));
	  }
	catch (const DateRangeException& e)
	  {
	    throw ExperimentConfigurationException(std::string("invalid backtest interval: ") + e.what());
	  }
      }

    if (auto description = json_access::optionalString(json, "description", Origin::Configuration))
      config = config.withDescription(*description);

    config = config.withTags(json_access::optionalStringList(json, "tags", Origin::Configuration));

    if (auto metric = json_access::optionalString(json, "metric", Origin::Configuration))
      config = config.withOptimizationMetric(*metric);

    return config;
  }
}
