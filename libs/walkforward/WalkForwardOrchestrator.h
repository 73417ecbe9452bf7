// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_WALK_FORWARD_ORCHESTRATOR_H
#define __STRATLAB_WALK_FORWARD_ORCHESTRATOR_H 1

#include <ostream>
#include <vector>
#include "BacktestMetrics.h"
#include "BatchRunner.h"
#include "ExperimentConfiguration.h"
#include "SearchStrategy.h"
#include "WalkForwardConfig.h"
#include "WalkForwardResult.h"
#include "Window.h"

namespace stratlab
{
  namespace walkforward
  {
    /**
     * @brief Re-optimizes on each train window and validates on the test window after it.
     *
     * The configuration must carry a date range; it is sliced into windows
     * by WindowGenerator and the windows are processed one at a time, in
     * order. For each window the search strategy runs on the configuration
     * restricted to the train period. Completed runs are grouped by
     * parameter assignment and averaged across symbols (trades summed);
     * the best assignment with at least minTrades trades wins. The
     * backtest then runs once per symbol on the test period with the
     * winning assignment, and the mean across symbols becomes the test
     * metrics. A failing test backtest is recorded on the window, which is
     * still validated.
     *
     * Metric name and direction come from the strategy's OptimizationConfig.
     */
    class WalkForwardOrchestrator
    {
    public:
      WalkForwardOrchestrator(search::SearchStrategy& strategy,
			      BacktestFunction backtest,
			      const WalkForwardConfig& config = WalkForwardConfig());

      WalkForwardResult run(const ExperimentConfiguration& configuration, std::ostream& os);

      std::vector<Window> generateWindows(const ExperimentConfiguration& configuration) const;

      void optimizeWindow(Window& window, const ExperimentConfiguration& configuration, std::ostream& os);

      // Throws std::logic_error when the window is not optimized
      void validateWindow(Window& window, const ExperimentConfiguration& configuration, std::ostream& os) const;

      const WalkForwardConfig& getConfig() const
      {
	return mConfig;
      }

    private:
      search::SearchStrategy& mStrategy;
      BacktestFunction mBacktest;
      WalkForwardConfig mConfig;
    };

    // Field-wise mean across symbols, trade counts summed. Throws for an empty list.
    BacktestMetrics averageMetrics(const std::vector<BacktestMetrics>& metrics);
  }
}

#endif
