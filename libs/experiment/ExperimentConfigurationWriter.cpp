// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ExperimentConfigurationWriter.h"
#include <boost/filesystem/fstream.hpp>
#include "ExperimentException.h"
#include "ExperimentJson.h"

using namespace rapidjson;

namespace stratlab
{
  Value ExperimentConfigurationWriter::toJson(const ExperimentConfiguration& config,
					      Document::AllocatorType& a) const
  {
    Value obj(kObjectType);
    obj.AddMember("name", stringToJson(config.getName(), a), a);
    obj.AddMember("strategy", stringToJson(config.getStrategyId(), a), a);
    obj.AddMember("symbols", stringListToJson(config.getSymbols(), a), a);
    obj.AddMember("timeframe", stringToJson(config.getTimeframe(), a), a);

    Value params(kObjectType);
    for (const auto& range : config.getParameters())
      params.AddMember(stringToJson(range.getName(), a), parameterRangeToJson(range, a), a);
    obj.AddMember("parameters", params, a);

    const ExpansionPolicy& policy = config.getExpansionPolicy();
    obj.AddMember("expansion_mode", stringToJson(stratlab::toString(policy.getMode()), a), a);
    if (policy.getMaxCombinations())
      obj.AddMember("max_combinations", static_cast<uint64_t>(*policy.getMaxCombinations()), a);
    if (policy.getSampleSize())
      obj.AddMember("sample_size", static_cast<uint64_t>(*policy.getSampleSize()), a);
    if (policy.getSeed())
      obj.AddMember("seed", static_cast<uint64_t>(*policy.getSeed()), a);
    if (!policy.getCombinations().empty())
      {
	Value combos(kArrayType);
	for (const auto& combination : policy.getCombinations())
	  combos.PushBack(parameterSetToJson(combination, a), a);
	obj.AddMember("combinations", combos, a);
      }

    if (config.getDateRange())
      {
	obj.AddMember("start_date", stringToJson(toIsoString(config.getDateRange()->getFirstDate()), a), a);
	obj.AddMember("end_date", stringToJson(toIsoString(config.getDateRange()->getLastDate()), a), a);
      }

    const ExecutionDefaults& execution = config.getExecutionDefaults();
    obj.AddMember("initial_cash", execution.getInitialCash(), a);
    obj.AddMember("fee_rate", execution.getFeeRate(), a);
    obj.AddMember("leverage", execution.getLeverage(), a);
    if (execution.getStopLossPct())
      obj.AddMember("stop_loss_pct", *execution.getStopLossPct(), a);
    if (execution.getTakeProfitPct())
      obj.AddMember("take_profit_pct", *execution.getTakeProfitPct(), a);

    obj.AddMember("description", stringToJson(config.getDescription(), a), a);
    obj.AddMember("tags", stringListToJson(config.getTags(), a), a);
    obj.AddMember("metric", stringToJson(config.getOptimizationMetric(), a), a);
    obj.AddMember("experiment_id", stringToJson(config.getExperimentId(), a), a);
    return obj;
  }

  std::string ExperimentConfigurationWriter::toString(const ExperimentConfiguration& config, bool pretty) const
  {
    Document doc;
    Value json = toJson(config, doc.GetAllocator());
    return jsonToString(json, pretty);
  }

  void ExperimentConfigurationWriter::writeFile(const ExperimentConfiguration& config,
						const boost::filesystem::path& path) const
  {
    boost::filesystem::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out)
      throw PersistenceException("cannot open " + path.string() + " for writing");

    out << toString(config, true) << '\n';
    if (!out)
      throw PersistenceException("failed writing " + path.string());
  }
}
