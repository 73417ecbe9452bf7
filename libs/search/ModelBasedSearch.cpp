// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ModelBasedSearch.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>

namespace stratlab
{
  namespace search
  {
    namespace
    {
      constexpr std::size_t kDefaultCallBudget = 100;

      // Collects objective observations as the runner records them
      class ObservationCollector : public BatchObserver
      {
      public:
	ObservationCollector(const ParameterNormalizer& normalizer,
			     const std::string& metric,
			     bool maximize)
	  : mNormalizer(normalizer),
	    mMetric(metric),
	    mMaximize(maximize)
	{}

	void onRunFinished(const RunRecord& run, std::size_t, std::size_t, std::size_t) override
	{
	  const std::optional<double> value = run.getMetric(mMetric);
	  if (!value || !std::isfinite(*value))
	    return;

	  mPoints.push_back(mNormalizer.normalize(run.getParameters()));
	  mValues.push_back(mMaximize ? *value : -*value);
	}

	const std::vector<std::vector<double>>& getPoints() const { return mPoints; }
	const std::vector<double>& getValues() const { return mValues; }

      private:
	const ParameterNormalizer& mNormalizer;
	std::string mMetric;
	bool mMaximize;
	std::vector<std::vector<double>> mPoints;
	std::vector<double> mValues;
      };
    }

    bool ParameterNormalizer::fit(const std::vector<ParameterSet>& candidates)
    {
      mBounds.clear();
      if (candidates.empty())
	return true;

      for (const auto& entry : candidates.front())
	{
	  double low = std::numeric_limits<double>::infinity();
	  double high = -std::numeric_limits<double>::infinity();
	  for (const auto& candidate : candidates)
	    {
	      auto it = candidate.find(entry.first);
	      if (it == candidate.end() || !it->second.isNumeric())
		return false;

	      low = std::min(low, it->second.asDouble());
	      high = std::max(high, it->second.asDouble());
	    }
	  mBounds.emplace_back(entry.first, std::make_pair(low, high));
	}
      return true;
    }

    std::vector<double> ParameterNormalizer::normalize(const ParameterSet& parameters) const
    {
      std::vector<double> point;
      point.reserve(mBounds.size());
      for (const auto& bound : mBounds)
	{
	  const double low = bound.second.first;
	  const double high = bound.second.second;
	  const double value = parameters.at(bound.first).asDouble();
	  point.push_back(high > low ? (value - low) / (high - low) : 0.0);
	}
      return point;
    }

    ModelBasedSearch::ModelBasedSearch(const OptimizationConfig& config,
				       SurrogateModelFactory surrogateFactory)
      : SearchStrategy(config),
	mSurrogateFactory(std::move(surrogateFactory)),
	mUsedFallback(false),
	mModelProposals(0)
    {}

    std::vector<ParameterSet>
    ModelBasedSearch::buildCandidates(const ExperimentConfiguration& configuration) const
    {
      ParameterExpander expander(configuration);
      if (configuration.getExpansionPolicy().getMode() == ExpansionMode::List)
	return expander.expandCombinations();

      const std::size_t total = expander.countCombinations();
      return expander.sampleCombinations(std::min(total, mConfig.candidatePoolSize),
					 effectiveSeed(configuration));
    }

    std::size_t ModelBasedSearch::callBudget(const ExperimentConfiguration& configuration,
					     std::size_t candidates) const
    {
      std::size_t budget = kDefaultCallBudget;
      if (mConfig.callBudget)
	budget = *mConfig.callBudget;
      else if (configuration.getExpansionPolicy().getMaxCombinations())
	budget = *configuration.getExpansionPolicy().getMaxCombinations();

      return std::min(budget, candidates);
    }

    ExperimentResult ModelBasedSearch::optimize(const ExperimentConfiguration& configuration,
						const BacktestFunction& backtest,
						std::ostream& os)
    {
      mUsedFallback = false;
      mModelProposals = 0;

      const ExperimentConfiguration prepared = prepareConfiguration(configuration);
      const std::string& symbol = prepared.getSymbols().front();
      const std::vector<ParameterSet> candidates = buildCandidates(prepared);
      const std::size_t budget = callBudget(prepared, candidates.size());

      os << "[SEARCH] model-based search on " << symbol << ": budget " << budget << " of "
	 << candidates.size() << " candidates, optimizing " << mConfig.metric
	 << (mConfig.maximize ? " (max)" : " (min)") << std::endl;

      const std::optional<std::uint64_t> seed = effectiveSeed(prepared);
      std::mt19937_64 rng(seed ? *seed : std::random_device{}());
      std::vector<std::size_t> randomOrder(candidates.size());
      std::iota(randomOrder.begin(), randomOrder.end(), 0);
      std::shuffle(randomOrder.begin(), randomOrder.end(), rng);

      std::vector<bool> evaluated(candidates.size(), false);
      std::size_t evaluatedCount = 0;
      std::size_t randomCursor = 0;

      auto nextRandom = [&]() {
	while (evaluated[randomOrder[randomCursor]])
	  ++randomCursor;
	return randomOrder[randomCursor++];
      };

      ParameterNormalizer normalizer;
      const bool numeric = normalizer.fit(candidates);
      ObservationCollector observations(normalizer, mConfig.metric, mConfig.maximize);

      std::unique_ptr<BatchRunner> runner = makeRunner(backtest);
      if (numeric)
	runner->setObserver(&observations);

      ExperimentResult result = makeEmptyResult(prepared);

      auto evaluate = [&](const std::vector<std::size_t>& indices) {
	std::vector<ExperimentTask> tasks;
	tasks.reserve(indices.size());
	for (std::size_t index : indices)
	  {
	    evaluated[index] = true;
	    tasks.push_back(ExperimentTask{symbol, candidates[index]});
	  }
	evaluatedCount += indices.size();
	result.absorb(runner->run(prepared, tasks, os));
      };

      auto evaluateRandom = [&](std::size_t count) {
	std::vector<std::size_t> indices;
	for (std::size_t i = 0; i < count; ++i)
	  indices.push_back(nextRandom());
	if (!indices.empty())
	  evaluate(indices);
      };

      std::string fallbackReason;
      std::unique_ptr<SurrogateModel> surrogate;
      if (!numeric)
	fallbackReason = "parameters are not all numeric";
      else if (mSurrogateFactory)
	surrogate = mSurrogateFactory();

      if (fallbackReason.empty() && !surrogate)
	fallbackReason = "no surrogate model backend available";

      if (!fallbackReason.empty())
	{
	  mUsedFallback = true;
	  os << "[SEARCH] warning: " << fallbackReason << ", falling back to random search" << std::endl;
	  evaluateRandom(budget);
	  return result;
	}

      evaluateRandom(std::min(mConfig.initialPoints, budget));

      while (evaluatedCount < budget)
	{
	  if (observations.getValues().size() < 2)
	    {
	      evaluateRandom(1);
	      continue;
	    }

	  std::size_t proposal = candidates.size();
	  try
	    {
	      if (!surrogate->fit(observations.getPoints(), observations.getValues()))
		fallbackReason = surrogate->name() + " could not be fitted";
	      else
		{
		  const std::vector<double>& values = observations.getValues();
		  const double bestObserved = *std::max_element(values.begin(), values.end());
		  double bestScore = -1.0;
		  for (std::size_t i = 0; i < candidates.size(); ++i)
		    {
		      if (evaluated[i])
			continue;

		      const double score =
			expectedImprovement(surrogate->predict(normalizer.normalize(candidates[i])), bestObserved);
		      if (score > bestScore)
			{
			  bestScore = score;
			  proposal = i;
			}
		    }
		}
	    }
	  catch (const std::exception& e)
	    {
	      fallbackReason = surrogate->name() + " failed: " + describeException(e);
	    }

	  if (!fallbackReason.empty())
	    {
	      mUsedFallback = true;
	      os << "[SEARCH] warning: " << fallbackReason << ", falling back to random search" << std::endl;
	      evaluateRandom(budget - evaluatedCount);
	      break;
	    }

	  if (proposal == candidates.size())
	    {
	      evaluateRandom(1);
	      continue;
	    }

	  ++mModelProposals;
	  evaluate({proposal});
	}

      os << "[SEARCH] model-based search finished: " << result.getCompletedRuns() << " completed, "
	 << mModelProposals << " model proposals" << std::endl;
      return result;
    }
  }
}
