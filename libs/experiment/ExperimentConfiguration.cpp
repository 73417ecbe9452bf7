// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ExperimentConfiguration.h"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <set>
#include <sstream>
#include <boost/uuid/detail/md5.hpp>
#include "ExperimentException.h"
#include "ExperimentJson.h"

using namespace rapidjson;

namespace stratlab
{
  std::string md5Hex(const std::string& text)
  {
    boost::uuids::detail::md5 hash;
    boost::uuids::detail::md5::digest_type digest;

    hash.process_bytes(text.data(), text.size());
    hash.get_digest(digest);

    // The digest holds the sixteen MD5 bytes in output order
    static_assert(sizeof(digest) == 16, "MD5 digest must be 16 bytes");
    unsigned char bytes[sizeof(digest)];
    std::memcpy(bytes, &digest, sizeof(digest));

    std::ostringstream os;
    os << std::hex << std::setfill('0');
    for (unsigned char b : bytes)
      os << std::setw(2) << static_cast<unsigned int>(b);

    return os.str();
  }

  std::string toString(ExpansionMode mode)
  {
    switch (mode)
      {
      case ExpansionMode::Grid:
	return "grid";
      case ExpansionMode::Random:
	return "random";
      case ExpansionMode::List:
	return "list";
      }
    return "grid";
  }

  ExpansionMode expansionModeFromString(const std::string& text)
  {
    if (text == "grid")
      return ExpansionMode::Grid;

    if (text == "random")
      return ExpansionMode::Random;

    if (text == "list")
      return ExpansionMode::List;

    throw ExperimentConfigurationException("unknown expansion mode '" + text + "'");
  }

  ExpansionPolicy::ExpansionPolicy(ExpansionMode mode,
				   std::optional<std::size_t> maxCombinations,
				   std::optional<std::size_t> sampleSize,
				   std::optional<std::uint64_t> seed,
				   std::vector<ParameterSet> combinations)
    : mMode(mode),
      mMaxCombinations(maxCombinations),
      mSampleSize(sampleSize),
      mSeed(seed),
      mCombinations(std::move(combinations))
  {
    if (mMaxCombinations && *mMaxCombinations == 0)
      throw ExperimentConfigurationException("ExpansionPolicy: max_combinations must be positive");

    if (mSampleSize && *mSampleSize == 0)
      throw ExperimentConfigurationException("ExpansionPolicy: sample_size must be positive");

    if (mMode == ExpansionMode::List && mCombinations.empty())
      throw ExperimentConfigurationException("ExpansionPolicy: list mode requires at least one combination");
  }

  ExecutionDefaults::ExecutionDefaults(double initialCash,
				       double feeRate,
				       double leverage,
				       std::optional<double> stopLossPct,
				       std::optional<double> takeProfitPct)
    : mInitialCash(initialCash),
      mFeeRate(feeRate),
      mLeverage(leverage),
      mStopLossPct(stopLossPct),
      mTakeProfitPct(takeProfitPct)
  {
    if (!(mInitialCash > 0.0))
      throw ExperimentConfigurationException("ExecutionDefaults: initial cash must be positive");

    if (mFeeRate < 0.0)
      throw ExperimentConfigurationException("ExecutionDefaults: fee rate cannot be negative");

    if (!(mLeverage > 0.0))
      throw ExperimentConfigurationException("ExecutionDefaults: leverage must be positive");

    if (mStopLossPct && !(*mStopLossPct > 0.0))
      throw ExperimentConfigurationException("ExecutionDefaults: stop loss percentage must be positive");

    if (mTakeProfitPct && !(*mTakeProfitPct > 0.0))
      throw ExperimentConfigurationException("ExecutionDefaults: take profit percentage must be positive");
  }

  ExperimentConfiguration::ExperimentConfiguration(const std::string& name,
						   const std::string& strategyId,
						   const std::vector<std::string>& symbols,
						   const std::string& timeframe,
						   const std::vector<ParameterRange>& parameters,
						   const ExpansionPolicy& expansionPolicy,
						   const ExecutionDefaults& executionDefaults)
    : mName(name),
      mStrategyId(strategyId),
      mSymbols(symbols),
      mTimeframe(timeframe),
      mParameters(parameters),
      mExpansionPolicy(expansionPolicy),
      mExecutionDefaults(executionDefaults),
      mDateRange(),
      mDescription(),
      mTags(),
      mOptimizationMetric("sharpe_ratio"),
      mExperimentId()
  {
    std::stable_sort(mParameters.begin(), mParameters.end(),
		     [](const ParameterRange& a, const ParameterRange& b) {
		       return a.getName() < b.getName();
		     });
    validate();
    refreshIdentifier();
  }

  void ExperimentConfiguration::validate() const
  {
    if (mName.empty())
      throw ExperimentConfigurationException("ExperimentConfiguration: name cannot be empty");

    if (mStrategyId.empty())
      throw ExperimentConfigurationException("ExperimentConfiguration: strategy id cannot be empty");

    if (mSymbols.empty())
      throw ExperimentConfigurationException("ExperimentConfiguration: at least one symbol is required");

    std::set<std::string> seen;
    for (const auto& symbol : mSymbols)
      {
	if (symbol.empty())
	  throw ExperimentConfigurationException("ExperimentConfiguration: symbol cannot be empty");
	if (!seen.insert(symbol).second)
	  throw ExperimentConfigurationException("ExperimentConfiguration: duplicate symbol " + symbol);
      }

    for (std::size_t i = 1; i < mParameters.size(); ++i)
      if (mParameters[i].getName() == mParameters[i - 1].getName())
	throw ExperimentConfigurationException("ExperimentConfiguration: duplicate parameter "
					       + mParameters[i].getName());

    if (mOptimizationMetric.empty())
      throw ExperimentConfigurationException("ExperimentConfiguration: optimization metric cannot be empty");
  }

  std::string ExperimentConfiguration::getCanonicalForm() const
  {
    Document doc;
    doc.SetObject();
    auto& a = doc.GetAllocator();

    // Keys are added in lexicographic order so the text is stable
    if (mExpansionPolicy.getMode() == ExpansionMode::List)
      {
	Value combos(kArrayType);
	for (const auto& combination : mExpansionPolicy.getCombinations())
	  combos.PushBack(parameterSetToJson(combination, a), a);
	doc.AddMember("combinations", combos, a);
      }

    if (mDateRange)
      doc.AddMember("end_date", stringToJson(toIsoString(mDateRange->getLastDate()), a), a);

    Value execution(kObjectType);
    execution.AddMember("fee_rate", mExecutionDefaults.getFeeRate(), a);
    execution.AddMember("initial_cash", mExecutionDefaults.getInitialCash(), a);
    execution.AddMember("leverage", mExecutionDefaults.getLeverage(), a);
    if (mExecutionDefaults.getStopLossPct())
      execution.AddMember("stop_loss_pct", *mExecutionDefaults.getStopLossPct(), a);
    if (mExecutionDefaults.getTakeProfitPct())
      execution.AddMember("take_profit_pct", *mExecutionDefaults.getTakeProfitPct(), a);
    doc.AddMember("execution", execution, a);

    doc.AddMember("expansion_mode", stringToJson(toString(mExpansionPolicy.getMode()), a), a);

    if (mExpansionPolicy.getMaxCombinations())
      doc.AddMember("max_combinations", static_cast<uint64_t>(*mExpansionPolicy.getMaxCombinations()), a);

    doc.AddMember("metric", stringToJson(mOptimizationMetric, a), a);
    doc.AddMember("name", stringToJson(mName, a), a);

    Value params(kObjectType);
    for (const auto& range : mParameters)
      params.AddMember(stringToJson(range.getName(), a), parameterRangeToJson(range, a), a);
    doc.AddMember("parameters", params, a);

    if (mExpansionPolicy.getSampleSize())
      doc.AddMember("sample_size", static_cast<uint64_t>(*mExpansionPolicy.getSampleSize()), a);

    if (mExpansionPolicy.getSeed())
      doc.AddMember("seed", static_cast<uint64_t>(*mExpansionPolicy.getSeed()), a);

    if (mDateRange)
      doc.AddMember("start_date", stringToJson(toIsoString(mDateRange->getFirstDate()), a), a);

    doc.AddMember("strategy", stringToJson(mStrategyId, a), a);

    std::vector<std::string> sortedSymbols(mSymbols);
    std::sort(sortedSymbols.begin(), sortedSymbols.end());
    doc.AddMember("symbols", stringListToJson(sortedSymbols, a), a);

    doc.AddMember("timeframe", stringToJson(mTimeframe, a), a);

    return jsonToString(doc);
  }

  void ExperimentConfiguration::refreshIdentifier()
  {
    mExperimentId = mName + "_" + md5Hex(getCanonicalForm()).substr(0, 8);
  }

  ExperimentConfiguration ExperimentConfiguration::withDateRange(const DateRange& range) const
  {
    ExperimentConfiguration copy(*this);
    copy.mDateRange = range;
    copy.refreshIdentifier();
    return copy;
  }

  ExperimentConfiguration ExperimentConfiguration::withExpansionPolicy(const ExpansionPolicy& policy) const
  {
    ExperimentConfiguration copy(*this);
    copy.mExpansionPolicy = policy;
    copy.refreshIdentifier();
    return copy;
  }

  ExperimentConfiguration ExperimentConfiguration::withDescription(const std::string& description) const
  {
    ExperimentConfiguration copy(*this);
    copy.mDescription = description;
    return copy;
  }

  ExperimentConfiguration ExperimentConfiguration::withTags(const std::vector<std::string>& tags) const
  {
    ExperimentConfiguration copy(*this);
    copy.mTags = tags;
    return copy;
  }

  ExperimentConfiguration ExperimentConfiguration::withOptimizationMetric(const std::string& metric) const
  {
    if (metric.empty())
      throw ExperimentConfigurationException("ExperimentConfiguration: optimization metric cannot be empty");

    ExperimentConfiguration copy(*this);
    copy.mOptimizationMetric = metric;
    copy.refreshIdentifier();
    return copy;
  }
}
