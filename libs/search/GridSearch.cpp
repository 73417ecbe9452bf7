// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "GridSearch.h"

namespace stratlab
{
  namespace search
  {
    GridSearch::GridSearch(const OptimizationConfig& config)
      : SearchStrategy(config)
    {}

    ExperimentResult GridSearch::optimize(const ExperimentConfiguration& configuration,
					  const BacktestFunction& backtest,
					  std::ostream& os)
    {
      const ExperimentConfiguration prepared = prepareConfiguration(configuration);
      const std::vector<ExperimentTask> tasks = ParameterExpander(prepared).expandTasks();

      os << "[SEARCH] grid search over " << tasks.size() << " tasks, optimizing "
	 << mConfig.metric << (mConfig.maximize ? " (max)" : " (min)") << std::endl;

      return makeRunner(backtest)->run(prepared, tasks, os);
    }
  }
}
