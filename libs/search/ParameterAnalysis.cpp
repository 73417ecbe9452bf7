// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "ParameterAnalysis.h"
#include <algorithm>
#include <cmath>
#include <set>
#include <utility>
#include "SampleStatistics.h"

namespace stratlab
{
  namespace search
  {
    namespace
    {
      using Observation = std::pair<const RunRecord*, double>;

      std::vector<Observation> usableRuns(const std::vector<RunRecord>& runs, const std::string& metric)
      {
	std::vector<Observation> usable;
	for (const auto& run : runs)
	  {
	    if (!run.isCompleted())
	      continue;

	    const std::optional<double> value = run.getMetric(metric);
	    if (value && std::isfinite(*value))
	      usable.emplace_back(&run, *value);
	  }
	return usable;
      }

      std::set<std::string> parameterNames(const std::vector<Observation>& observations)
      {
	std::set<std::string> names;
	for (const auto& observation : observations)
	  for (const auto& entry : observation.first->getParameters())
	    names.insert(entry.first);
	return names;
      }
    }

    ParameterScores analyzeParameterImportance(const std::vector<RunRecord>& runs,
					       const std::string& metric)
    {
      ParameterScores result;
      const std::vector<Observation> observations = usableRuns(runs, metric);
      result.runsUsed = observations.size();
      if (observations.size() < 2)
	return result;

      SampleStatistics overall;
      for (const auto& observation : observations)
	overall.add(observation.second);

      const double totalVariance = overall.getSampleVariance();
      if (!(totalVariance > 0.0))
	return result;

      double sum = 0.0;
      for (const auto& name : parameterNames(observations))
	{
	  std::map<ParameterValue, SampleStatistics> groups;
	  for (const auto& observation : observations)
	    {
	      const ParameterSet& parameters = observation.first->getParameters();
	      auto it = parameters.find(name);
	      if (it != parameters.end())
		groups[it->second].add(observation.second);
	    }

	  SampleStatistics within;
	  for (const auto& group : groups)
	    {
	      if (group.second.getCount() >= 2)
		within.add(group.second.getSampleVariance());
	    }

	  const double withinVariance = within.empty() ? 0.0 : within.getMean();
	  const double raw = std::min(1.0, std::max(0.0, 1.0 - withinVariance / totalVariance));
	  result.scores[name] = raw;
	  sum += raw;
	}

      if (sum > 0.0)
	{
	  for (auto& entry : result.scores)
	    entry.second /= sum;
	}

      result.status = StatisticStatus::Success;
      return result;
    }

    ParameterScores analyzeParameterImportance(const ExperimentResult& result)
    {
      return analyzeParameterImportance(result.getRuns(), result.getTrackedMetric());
    }

    ParameterScores analyzeParameterCorrelation(const std::vector<RunRecord>& runs,
						const std::string& metric)
    {
      ParameterScores result;
      const std::vector<Observation> observations = usableRuns(runs, metric);
      result.runsUsed = observations.size();
      if (observations.size() < 2)
	return result;

      for (const auto& name : parameterNames(observations))
	{
	  std::vector<std::pair<double, double>> pairs;
	  bool numeric = true;
	  for (const auto& observation : observations)
	    {
	      const ParameterSet& parameters = observation.first->getParameters();
	      auto it = parameters.find(name);
	      if (it == parameters.end())
		continue;

	      if (!it->second.isNumeric())
		{
		  numeric = false;
		  break;
		}
	      pairs.emplace_back(it->second.asDouble(), observation.second);
	    }

	  if (!numeric)
	    continue;

	  double correlation = 0.0;
	  if (pairs.size() >= 2)
	    {
	      SampleStatistics xs;
	      SampleStatistics ys;
	      for (const auto& p : pairs)
		{
		  xs.add(p.first);
		  ys.add(p.second);
		}

	      double covariance = 0.0;
	      for (const auto& p : pairs)
		covariance += (p.first - xs.getMean()) * (p.second - ys.getMean());
	      covariance /= static_cast<double>(pairs.size());

	      const double denominator = xs.getPopulationStdDev() * ys.getPopulationStdDev();
	      if (denominator > 0.0)
		correlation = std::min(1.0, std::max(-1.0, covariance / denominator));
	    }
	  result.scores[name] = correlation;
	}

      result.status = StatisticStatus::Success;
      return result;
    }

    std::vector<RunRecord> topRuns(const std::vector<RunRecord>& runs,
				   const std::string& metric,
				   std::size_t n,
				   bool maximize)
    {
      std::vector<Observation> observations = usableRuns(runs, metric);
      std::stable_sort(observations.begin(), observations.end(),
		       [maximize](const Observation& a, const Observation& b) {
			 return isBetterMetric(a.second, b.second, maximize);
		       });

      std::vector<RunRecord> top;
      for (std::size_t i = 0; i < observations.size() && i < n; ++i)
	top.push_back(*observations[i].first);
      return top;
    }
  }
}
