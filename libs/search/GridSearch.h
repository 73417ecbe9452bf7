// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_GRID_SEARCH_H
#define __STRATLAB_GRID_SEARCH_H 1

#include "SearchStrategy.h"

namespace stratlab
{
  namespace search
  {
    // Evaluates the configuration's full expansion in one batch
    class GridSearch : public SearchStrategy
    {
    public:
      explicit GridSearch(const OptimizationConfig& config = OptimizationConfig());

      ExperimentResult optimize(const ExperimentConfiguration& configuration,
				const BacktestFunction& backtest,
				std::ostream& os) override;

      std::string name() const override
      {
	return "grid";
      }
    };
  }
}

#endif
