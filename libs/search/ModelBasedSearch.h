// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_MODEL_BASED_SEARCH_H
#define __STRATLAB_MODEL_BASED_SEARCH_H 1

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include "SearchStrategy.h"
#include "SurrogateModel.h"

namespace stratlab
{
  namespace search
  {
    /**
     * @brief Sequential model-based search on the first symbol.
     *
     * Candidates are the configuration's parameter product (a seeded sample
     * of candidatePoolSize when the product is larger) or its literal
     * combinations in list mode. The call budget is callBudget, else the
     * configuration's max-combinations, else 100, and never more than the
     * number of candidates.
     *
     * After initialPoints random evaluations a surrogate is fitted to the
     * observed (normalized parameters -> objective) pairs and the
     * unevaluated candidate with the highest expected improvement is
     * evaluated next, until the budget is spent.
     *
     * When the factory yields no surrogate, a parameter is not numeric, or
     * the surrogate fails to fit or throws, a warning is written to the log
     * stream and the rest of the budget is spent on random candidates.
     */
    class ModelBasedSearch : public SearchStrategy
    {
    public:
      explicit ModelBasedSearch(const OptimizationConfig& config = OptimizationConfig(),
				SurrogateModelFactory surrogateFactory = gaussianProcessFactory());

      ExperimentResult optimize(const ExperimentConfiguration& configuration,
				const BacktestFunction& backtest,
				std::ostream& os) override;

      std::string name() const override
      {
	return "model_based";
      }

      // True when the last optimize() call degraded to random search
      bool usedFallback() const
      {
	return mUsedFallback;
      }

      // Evaluations proposed by the surrogate in the last optimize() call
      std::size_t getModelProposals() const
      {
	return mModelProposals;
      }

    private:
      std::vector<ParameterSet> buildCandidates(const ExperimentConfiguration& configuration) const;
      std::size_t callBudget(const ExperimentConfiguration& configuration, std::size_t candidates) const;

    private:
      SurrogateModelFactory mSurrogateFactory;
      bool mUsedFallback;
      std::size_t mModelProposals;
    };

    /**
     * Maps numeric assignments onto [0,1] per parameter using the bounds
     * seen over a candidate set. A parameter with a single value maps to 0.
     */
    class ParameterNormalizer
    {
    public:
      // Returns false when some candidate holds a non-numeric value
      bool fit(const std::vector<ParameterSet>& candidates);

      std::vector<double> normalize(const ParameterSet& parameters) const;

      std::size_t getDimensions() const
      {
	return mBounds.size();
      }

    private:
      std::vector<std::pair<std::string, std::pair<double, double>>> mBounds;
    };
  }
}

#endif
