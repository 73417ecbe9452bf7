// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "SearchStrategy.h"
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include "ExperimentException.h"
#include "GridSearch.h"
#include "ModelBasedSearch.h"
#include "RandomSearch.h"

namespace stratlab
{
  namespace search
  {
    std::string toString(SearchMethod method)
    {
      switch (method)
	{
	case SearchMethod::Grid:
	  return "grid";
	case SearchMethod::Random:
	  return "random";
	case SearchMethod::ModelBased:
	  return "model_based";
	}
      throw std::invalid_argument("toString: unknown search method");
    }

    SearchMethod searchMethodFromString(const std::string& text)
    {
      const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(text));
      if (key == "grid")
	return SearchMethod::Grid;
      if (key == "random")
	return SearchMethod::Random;
      if (key == "model_based" || key == "bayesian")
	return SearchMethod::ModelBased;

      throw ExperimentConfigurationException("searchMethodFromString: unknown search method '" + text + "'");
    }

    void validate(const OptimizationConfig& config)
    {
      if (config.metric.empty())
	throw ExperimentConfigurationException("OptimizationConfig: metric name is empty");

      if (config.batchSize == 0)
	throw ExperimentConfigurationException("OptimizationConfig: batch size must be positive");

      if (config.patience == 0)
	throw ExperimentConfigurationException("OptimizationConfig: patience must be positive");

      if (config.minImprovement < 0.0)
	throw ExperimentConfigurationException("OptimizationConfig: min improvement is negative");

      if (config.callBudget && *config.callBudget == 0)
	throw ExperimentConfigurationException("OptimizationConfig: call budget must be positive");

      if (config.candidatePoolSize == 0)
	throw ExperimentConfigurationException("OptimizationConfig: candidate pool size must be positive");
    }

    SearchStrategy::SearchStrategy(const OptimizationConfig& config)
      : mConfig(config),
	mExecutor()
    {
      validate(mConfig);
      mConfig.runner.maximize = mConfig.maximize;
    }

    void SearchStrategy::setExecutor(std::shared_ptr<concurrency::IParallelExecutor> executor)
    {
      mExecutor = std::move(executor);
    }

    ExperimentConfiguration
    SearchStrategy::prepareConfiguration(const ExperimentConfiguration& configuration) const
    {
      if (configuration.getOptimizationMetric() == mConfig.metric)
	return configuration;

      return configuration.withOptimizationMetric(mConfig.metric);
    }

    std::unique_ptr<BatchRunner> SearchStrategy::makeRunner(const BacktestFunction& backtest) const
    {
      auto runner = std::make_unique<BatchRunner>(backtest, mConfig.runner);
      if (mExecutor)
	runner->setExecutor(mExecutor);
      return runner;
    }

    std::optional<std::uint64_t>
    SearchStrategy::effectiveSeed(const ExperimentConfiguration& configuration) const
    {
      if (mConfig.seed)
	return mConfig.seed;

      return configuration.getExpansionPolicy().getSeed();
    }

    ExperimentResult SearchStrategy::makeEmptyResult(const ExperimentConfiguration& configuration) const
    {
      return ExperimentResult(configuration, 0, mConfig.maximize);
    }

    std::unique_ptr<SearchStrategy> makeSearchStrategy(SearchMethod method,
						       const OptimizationConfig& config,
						       SurrogateModelFactory surrogateFactory)
    {
      switch (method)
	{
	case SearchMethod::Grid:
	  return std::make_unique<GridSearch>(config);
	case SearchMethod::Random:
	  return std::make_unique<RandomSearch>(config);
	case SearchMethod::ModelBased:
	  return std::make_unique<ModelBasedSearch>(config, std::move(surrogateFactory));
	}
      throw std::invalid_argument("makeSearchStrategy: unknown search method");
    }
  }
}
