// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "RandomSearch.h"
#include <algorithm>
#include <random>

namespace stratlab
{
  namespace search
  {
    RandomSearch::RandomSearch(const OptimizationConfig& config)
      : SearchStrategy(config),
	mBatchesRun(0)
    {}

    ExperimentConfiguration
    RandomSearch::toRandomMode(const ExperimentConfiguration& configuration) const
    {
      const ExpansionPolicy& policy = configuration.getExpansionPolicy();
      if (policy.getMode() == ExpansionMode::List)
	return configuration;

      return configuration.withExpansionPolicy(ExpansionPolicy(ExpansionMode::Random,
							       policy.getMaxCombinations(),
							       policy.getSampleSize(),
							       effectiveSeed(configuration)));
    }

    std::vector<ParameterSet>
    RandomSearch::drawCandidates(const ExperimentConfiguration& randomConfiguration) const
    {
      std::vector<ParameterSet> candidates = ParameterExpander(randomConfiguration).expandCombinations();

      const std::optional<std::uint64_t> seed = effectiveSeed(randomConfiguration);
      std::mt19937_64 rng(seed ? *seed : std::random_device{}());
      std::shuffle(candidates.begin(), candidates.end(), rng);
      return candidates;
    }

    ExperimentResult RandomSearch::optimize(const ExperimentConfiguration& configuration,
					    const BacktestFunction& backtest,
					    std::ostream& os)
    {
      mBatchesRun = 0;
      const ExperimentConfiguration randomConfiguration = toRandomMode(prepareConfiguration(configuration));
      const std::vector<ExperimentTask> tasks =
	ParameterExpander::makeTasks(randomConfiguration.getSymbols(), drawCandidates(randomConfiguration));

      std::unique_ptr<BatchRunner> runner = makeRunner(backtest);

      os << "[SEARCH] random search over " << tasks.size() << " tasks, optimizing "
	 << mConfig.metric << (mConfig.maximize ? " (max)" : " (min)");
      if (mConfig.earlyStopping)
	os << ", batches of " << mConfig.batchSize << ", patience " << mConfig.patience;
      os << std::endl;

      if (!mConfig.earlyStopping)
	{
	  mBatchesRun = 1;
	  return runner->run(randomConfiguration, tasks, os);
	}

      ExperimentResult result = makeEmptyResult(randomConfiguration);
      std::optional<double> runningBest;
      unsigned int staleBatches = 0;

      for (std::size_t start = 0; start < tasks.size(); start += mConfig.batchSize)
	{
	  const std::size_t stop = std::min(tasks.size(), start + mConfig.batchSize);
	  const std::vector<ExperimentTask> batch(tasks.begin() + start, tasks.begin() + stop);

	  result.absorb(runner->run(randomConfiguration, batch, os));
	  ++mBatchesRun;

	  if (!result.getBestRun())
	    continue;

	  const std::optional<double> best = result.getBestRun()->getMetric(mConfig.metric);
	  if (!best)
	    continue;

	  if (!runningBest)
	    {
	      runningBest = best;
	      staleBatches = 0;
	      continue;
	    }

	  const double improvement = mConfig.maximize ? *best - *runningBest : *runningBest - *best;
	  if (improvement > mConfig.minImprovement)
	    {
	      runningBest = best;
	      staleBatches = 0;
	    }
	  else
	    ++staleBatches;

	  if (staleBatches >= mConfig.patience)
	    {
	      os << "[SEARCH] early stop after " << mBatchesRun << " batches ("
		 << result.getTotalRuns() << " of " << tasks.size() << " tasks), best "
		 << mConfig.metric << " " << *runningBest << std::endl;
	      break;
	    }
	}

      return result;
    }
  }
}
