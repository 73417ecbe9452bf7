// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_EXPERIMENT_CONFIGURATION_H
#define __STRATLAB_EXPERIMENT_CONFIGURATION_H 1

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "DateRange.h"
#include "ParameterRange.h"
#include "ParameterValue.h"

namespace stratlab
{
  enum class ExpansionMode { Grid, Random, List };

  std::string toString(ExpansionMode mode);

  // "grid", "random" or "list"; anything else is a configuration error
  ExpansionMode expansionModeFromString(const std::string& text);

  // Lower-case hex MD5 digest of text (32 characters)
  std::string md5Hex(const std::string& text);

  /**
   * @brief How the parameter space is turned into concrete assignments.
   */
  class ExpansionPolicy
  {
  public:
    ExpansionPolicy()
      : ExpansionPolicy(ExpansionMode::Grid)
    {}

    explicit ExpansionPolicy(ExpansionMode mode,
			     std::optional<std::size_t> maxCombinations = std::nullopt,
			     std::optional<std::size_t> sampleSize = std::nullopt,
			     std::optional<std::uint64_t> seed = std::nullopt,
			     std::vector<ParameterSet> combinations = {});

    ExpansionMode getMode() const
    {
      return mMode;
    }

    const std::optional<std::size_t>& getMaxCombinations() const
    {
      return mMaxCombinations;
    }

    const std::optional<std::size_t>& getSampleSize() const
    {
      return mSampleSize;
    }

    const std::optional<std::uint64_t>& getSeed() const
    {
      return mSeed;
    }

    // Literal assignments used in list mode
    const std::vector<ParameterSet>& getCombinations() const
    {
      return mCombinations;
    }

  private:
    ExpansionMode mMode;
    std::optional<std::size_t> mMaxCombinations;
    std::optional<std::size_t> mSampleSize;
    std::optional<std::uint64_t> mSeed;
    std::vector<ParameterSet> mCombinations;
  };

  /**
   * @brief Run settings passed through to the backtest collaborator.
   */
  class ExecutionDefaults
  {
  public:
    ExecutionDefaults()
      : ExecutionDefaults(10000.0, 0.0005, 1.0)
    {}

    ExecutionDefaults(double initialCash,
		      double feeRate,
		      double leverage,
		      std::optional<double> stopLossPct = std::nullopt,
		      std::optional<double> takeProfitPct = std::nullopt);

    double getInitialCash() const { return mInitialCash; }
    double getFeeRate() const { return mFeeRate; }
    double getLeverage() const { return mLeverage; }
    const std::optional<double>& getStopLossPct() const { return mStopLossPct; }
    const std::optional<double>& getTakeProfitPct() const { return mTakeProfitPct; }

  private:
    double mInitialCash;
    double mFeeRate;
    double mLeverage;
    std::optional<double> mStopLossPct;
    std::optional<double> mTakeProfitPct;
  };

  /**
   * @brief Immutable description of one experiment.
   *
   * The experiment identifier is "<name>_<8 hex digits>", the digits being
   * the head of an MD5 digest over a canonical JSON rendering of the
   * configuration with symbols sorted and parameters ordered by name.
   * Description and tags are free-form metadata and do not take part in the
   * identifier; every other field does.
   *
   * The with*() members return modified copies; the original is never
   * changed.
   */
  class ExperimentConfiguration
  {
  public:
    ExperimentConfiguration(const std::string& name,
			    const std::string& strategyId,
			    const std::vector<std::string>& symbols,
			    const std::string& timeframe,
			    const std::vector<ParameterRange>& parameters,
			    const ExpansionPolicy& expansionPolicy = ExpansionPolicy(),
			    const ExecutionDefaults& executionDefaults = ExecutionDefaults());

    ExperimentConfiguration(const ExperimentConfiguration&) = default;
    ExperimentConfiguration& operator=(const ExperimentConfiguration&) = default;
    ~ExperimentConfiguration() noexcept = default;

    const std::string& getName() const { return mName; }
    const std::string& getStrategyId() const { return mStrategyId; }
    const std::vector<std::string>& getSymbols() const { return mSymbols; }
    const std::string& getTimeframe() const { return mTimeframe; }

    // Ordered by parameter name
    const std::vector<ParameterRange>& getParameters() const { return mParameters; }

    const ExpansionPolicy& getExpansionPolicy() const { return mExpansionPolicy; }
    const ExecutionDefaults& getExecutionDefaults() const { return mExecutionDefaults; }
    const std::optional<DateRange>& getDateRange() const { return mDateRange; }
    const std::string& getDescription() const { return mDescription; }
    const std::vector<std::string>& getTags() const { return mTags; }
    const std::string& getOptimizationMetric() const { return mOptimizationMetric; }

    const std::string& getExperimentId() const { return mExperimentId; }

    // Text the identifier digest is computed over
    std::string getCanonicalForm() const;

    ExperimentConfiguration withDateRange(const DateRange& range) const;
    ExperimentConfiguration withExpansionPolicy(const ExpansionPolicy& policy) const;
    ExperimentConfiguration withDescription(const std::string& description) const;
    ExperimentConfiguration withTags(const std::vector<std::string>& tags) const;
    ExperimentConfiguration withOptimizationMetric(const std::string& metric) const;

  private:
    void validate() const;
    void refreshIdentifier();

  private:
    std::string mName;
    std::string mStrategyId;
    std::vector<std::string> mSymbols;
    std::string mTimeframe;
    std::vector<ParameterRange> mParameters;
    ExpansionPolicy mExpansionPolicy;
    ExecutionDefaults mExecutionDefaults;
    std::optional<DateRange> mDateRange;
    std::string mDescription;
    std::vector<std::string> mTags;
    std::string mOptimizationMetric;
    std::string mExperimentId;
  };
}

#endif
