// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_SEARCH_STRATEGY_H
#define __STRATLAB_SEARCH_STRATEGY_H 1

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include "IParallelExecutor.h"
#include "BatchRunner.h"
#include "ExperimentConfiguration.h"
#include "ExperimentResult.h"
#include "OptimizationConfig.h"
#include "SurrogateModel.h"

namespace stratlab
{
  namespace search
  {
    enum class SearchMethod
    {
      Grid,
      Random,
      ModelBased
    };

    std::string toString(SearchMethod method);

    // Accepts "grid", "random", "model_based" and "bayesian"
    SearchMethod searchMethodFromString(const std::string& text);

    /**
     * @brief Chooses which parameter assignments to evaluate.
     *
     * Every strategy evaluates through a BatchRunner built from the
     * OptimizationConfig and returns the accumulated ExperimentResult. The
     * result tracks its best run under OptimizationConfig::metric, so the
     * configuration's optimization metric is replaced by it before the
     * search starts.
     */
    class SearchStrategy
    {
    public:
      explicit SearchStrategy(const OptimizationConfig& config);
      virtual ~SearchStrategy() = default;

      SearchStrategy(const SearchStrategy&) = delete;
      SearchStrategy& operator=(const SearchStrategy&) = delete;

      virtual ExperimentResult optimize(const ExperimentConfiguration& configuration,
					const BacktestFunction& backtest,
					std::ostream& os) = 0;

      virtual std::string name() const = 0;

      const OptimizationConfig& getConfig() const
      {
	return mConfig;
      }

      // Shared with every runner the strategy creates
      void setExecutor(std::shared_ptr<concurrency::IParallelExecutor> executor);

    protected:
      ExperimentConfiguration prepareConfiguration(const ExperimentConfiguration& configuration) const;
      std::unique_ptr<BatchRunner> makeRunner(const BacktestFunction& backtest) const;
      std::optional<std::uint64_t> effectiveSeed(const ExperimentConfiguration& configuration) const;

      // Empty result that batches are absorbed into
      ExperimentResult makeEmptyResult(const ExperimentConfiguration& configuration) const;

    protected:
      OptimizationConfig mConfig;

    private:
      std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
    };

    /**
     * The model-based strategy uses the factory for its surrogate; a factory
     * that is empty or returns nullptr makes it fall back to random search.
     */
    std::unique_ptr<SearchStrategy> makeSearchStrategy(SearchMethod method,
						       const OptimizationConfig& config,
						       SurrogateModelFactory surrogateFactory = gaussianProcessFactory());
  }
}

#endif
