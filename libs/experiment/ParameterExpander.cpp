// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ParameterExpander.h"
#include "ExperimentException.h"
#include <limits>
#include <random>
#include <set>
#include <unordered_set>

namespace stratlab
{
  ParameterExpander::ParameterExpander(const ExperimentConfiguration& configuration)
    : mConfiguration(configuration),
      mAxes()
  {
    mAxes.reserve(configuration.getParameters().size());
    for (const auto& range : configuration.getParameters())
      mAxes.push_back(range.expand());
  }

  std::size_t ParameterExpander::countCombinations() const
  {
    const std::size_t limit = std::numeric_limits<std::size_t>::max();
    std::size_t total = 1;
    for (const auto& axis : mAxes)
      {
	if (total > limit / axis.size())
	  return limit;
	total *= axis.size();
      }
    return total;
  }

  ParameterSet ParameterExpander::combinationFromDigits(const std::vector<std::size_t>& digits) const
  {
    ParameterSet result;
    const auto& ranges = mConfiguration.getParameters();
    for (std::size_t i = 0; i < ranges.size(); ++i)
      result[ranges[i].getName()] = mAxes[i][digits[i]];
    return result;
  }

  // Mixed-radix decode, last axis fastest
  ParameterSet ParameterExpander::combinationAt(std::size_t index) const
  {
    std::vector<std::size_t> digits(mAxes.size(), 0);
    for (std::size_t i = mAxes.size(); i-- > 0; )
      {
	digits[i] = index % mAxes[i].size();
	index /= mAxes[i].size();
      }
    return combinationFromDigits(digits);
  }

  std::vector<ParameterSet> ParameterExpander::expandGrid() const
  {
    const std::size_t total = countCombinations();
    const std::optional<std::size_t>& cap = mConfiguration.getExpansionPolicy().getMaxCombinations();

    std::vector<ParameterSet> result;
    if (cap && total > *cap)
      {
	const std::size_t stride = total / *cap;
	result.reserve(*cap);
	for (std::size_t k = 0; k < *cap; ++k)
	  result.push_back(combinationAt(k * stride));
	return result;
      }

    if (total == std::numeric_limits<std::size_t>::max())
      throw ExperimentConfigurationException("parameter space of " + mConfiguration.getName()
					     + " is too large to enumerate; set max_combinations");

    result.reserve(total);
    for (std::size_t index = 0; index < total; ++index)
      result.push_back(combinationAt(index));
    return result;
  }

  std::vector<ParameterSet>
  ParameterExpander::sampleCombinations(std::size_t count, std::optional<std::uint64_t> seed) const
  {
    const std::size_t total = countCombinations();
    if (count >= total)
      {
	std::vector<ParameterSet> all;
	all.reserve(total);
	for (std::size_t index = 0; index < total; ++index)
	  all.push_back(combinationAt(index));
	return all;
      }

    std::mt19937_64 rng(seed ? *seed : std::random_device{}());
    std::vector<ParameterSet> result;
    result.reserve(count);

    if (total < std::numeric_limits<std::size_t>::max())
      {
	// Floyd's algorithm: count distinct indices in [0, total)
	std::unordered_set<std::size_t> chosen;
	std::vector<std::size_t> order;
	order.reserve(count);
	for (std::size_t j = total - count; j < total; ++j)
	  {
	    std::uniform_int_distribution<std::size_t> dist(0, j);
	    std::size_t t = dist(rng);
	    if (!chosen.insert(t).second)
	      {
		chosen.insert(j);
		t = j;
	      }
	    order.push_back(t);
	  }

	for (std::size_t index : order)
	  result.push_back(combinationAt(index));
	return result;
      }

    // Product too large to index; draw each axis independently and reject repeats
    std::set<std::vector<std::size_t>> seen;
    while (result.size() < count)
      {
	std::vector<std::size_t> digits(mAxes.size());
	for (std::size_t i = 0; i < mAxes.size(); ++i)
	  {
	    std::uniform_int_distribution<std::size_t> dist(0, mAxes[i].size() - 1);
	    digits[i] = dist(rng);
	  }

	if (seen.insert(digits).second)
	  result.push_back(combinationFromDigits(digits));
      }
    return result;
  }

  std::vector<ParameterSet> ParameterExpander::expandCombinations() const
  {
    const ExpansionPolicy& policy = mConfiguration.getExpansionPolicy();
    switch (policy.getMode())
      {
      case ExpansionMode::List:
	return policy.getCombinations();

      case ExpansionMode::Random:
	{
	  std::optional<std::size_t> n = policy.getSampleSize();
	  if (!n)
	    n = policy.getMaxCombinations();

	  if (!n)
	    return expandGrid();

	  return sampleCombinations(*n, policy.getSeed());
	}

      case ExpansionMode::Grid:
	break;
      }
    return expandGrid();
  }

  std::vector<ExperimentTask>
  ParameterExpander::makeTasks(const std::vector<std::string>& symbols,
			       const std::vector<ParameterSet>& combinations)
  {
    std::vector<ExperimentTask> tasks;
    tasks.reserve(symbols.size() * combinations.size());
    for (const auto& symbol : symbols)
      for (const auto& combination : combinations)
	tasks.push_back(ExperimentTask{symbol, combination});
    return tasks;
  }

  std::vector<ExperimentTask> ParameterExpander::expandTasks() const
  {
    return makeTasks(mConfiguration.getSymbols(), expandCombinations());
  }
}
