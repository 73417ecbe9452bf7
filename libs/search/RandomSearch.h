// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_RANDOM_SEARCH_H
#define __STRATLAB_RANDOM_SEARCH_H 1

#include <vector>
#include "SearchStrategy.h"

namespace stratlab
{
  namespace search
  {
    /**
     * @brief Evaluates a random sample of the parameter space.
     *
     * The configuration is expanded in random mode (sample size, else
     * max-combinations, else the whole product) and the assignments are
     * visited in shuffled order. With early stopping the tasks run in
     * batches of batchSize; a batch improves the running best only when
     * it beats it by more than minImprovement, and the search stops after
     * patience consecutive batches without improvement.
     */
    class RandomSearch : public SearchStrategy
    {
    public:
      explicit RandomSearch(const OptimizationConfig& config = OptimizationConfig());

      ExperimentResult optimize(const ExperimentConfiguration& configuration,
				const BacktestFunction& backtest,
				std::ostream& os) override;

      std::string name() const override
      {
	return "random";
      }

      // Batches actually executed by the last optimize() call
      std::size_t getBatchesRun() const
      {
	return mBatchesRun;
      }

    private:
      ExperimentConfiguration toRandomMode(const ExperimentConfiguration& configuration) const;
      std::vector<ParameterSet> drawCandidates(const ExperimentConfiguration& randomConfiguration) const;

    private:
      std::size_t mBatchesRun;
    };
  }
}

#endif
