// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_OPTIMIZATION_CONFIG_H
#define __STRATLAB_OPTIMIZATION_CONFIG_H 1

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include "BacktestMetrics.h"
#include "BatchRunner.h"

namespace stratlab
{
  namespace search
  {
    /**
     * Settings shared by every search strategy. The runner options are
     * handed to the BatchRunner the strategy creates; their maximize flag
     * is overridden by the one here.
     */
    struct OptimizationConfig
    {
      std::string metric = BacktestMetrics::kSharpeRatio;
      bool maximize = true;

      // Random search
      bool earlyStopping = false;
      unsigned int patience = 10;           // consecutive non-improving batches
      double minImprovement = 0.01;
      std::size_t batchSize = 20;

      // Model-based search
      std::size_t initialPoints = 10;
      std::optional<std::size_t> callBudget;   // else max_combinations, else 100
      std::size_t candidatePoolSize = 10000;   // candidates scored per proposal

      // Overrides the configuration's seed when set
      std::optional<std::uint64_t> seed;

      BatchRunnerOptions runner;
    };

    // Throws ExperimentConfigurationException for unusable settings
    void validate(const OptimizationConfig& config);
  }
}

#endif
