// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "RobustnessScorer.h"
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <limits>
#include "SampleStatistics.h"

namespace stratlab
{
  namespace walkforward
  {
    namespace
    {
      ScoreComponent makeComponent(double maxScore)
      {
	ScoreComponent component;
	component.maxScore = maxScore;
	return component;
      }

      double clampScore(double score, double maxScore)
      {
	return std::min(maxScore, std::max(0.0, score));
      }
    }

    double coefficientOfVariation(const std::vector<double>& values)
    {
      SampleStatistics stats(values);
      if (stats.empty())
	return std::numeric_limits<double>::quiet_NaN();

      const double mean = stats.getMean();
      if (mean == 0.0)
	return std::numeric_limits<double>::infinity();

      return stats.getPopulationStdDev() / std::fabs(mean);
    }

    RobustnessScorer::RobustnessScorer(bool maximize)
      : mMaximize(maximize)
    {}

    ScoreComponent RobustnessScorer::scoreConsistency(const std::vector<double>& outOfSample) const
    {
      ScoreComponent component = makeComponent(kConsistencyWeight);

      std::size_t count = 0;
      std::size_t favourable = 0;
      for (double value : outOfSample)
	{
	  if (!std::isfinite(value))
	    continue;

	  ++count;
	  if (mMaximize ? value > 0.0 : value < 0.0)
	    ++favourable;
	}

      if (count < 2)
	return component;

      component.value = static_cast<double>(favourable) / static_cast<double>(count);
      component.score = clampScore(component.value * kConsistencyWeight, kConsistencyWeight);
      component.status = StatisticStatus::Success;
      return component;
    }

    ScoreComponent RobustnessScorer::scoreDecay(const std::vector<double>& inSample,
						const std::vector<double>& outOfSample) const
    {
      ScoreComponent component = makeComponent(kDecayWeight);

      SampleStatistics is(inSample);
      SampleStatistics oos(outOfSample);
      if (is.getCount() < 2 || oos.getCount() < 2)
	return component;

      const double isMean = is.getMean();
      if (isMean == 0.0)
	return component;

      const double drop = mMaximize ? isMean - oos.getMean() : oos.getMean() - isMean;
      component.value = drop / std::fabs(isMean);
      component.score = clampScore(kDecayWeight * (1.0 - component.value), kDecayWeight);
      component.status = StatisticStatus::Success;
      return component;
    }

    ScoreComponent
    RobustnessScorer::scoreStability(const std::vector<std::vector<double>>& parameterValues) const
    {
      ScoreComponent component = makeComponent(kStabilityWeight);

      SampleStatistics cvs;
      for (const auto& values : parameterValues)
	{
	  if (SampleStatistics(values).getCount() < 2)
	    continue;

	  // add() drops the infinite CV of a zero-mean parameter
	  cvs.add(coefficientOfVariation(values));
	}

      if (cvs.empty())
	return component;

      component.value = cvs.getMean();
      component.score = clampScore(kStabilityWeight * (1.0 - std::min(component.value / kUnstableCv, 1.0)),
				   kStabilityWeight);
      component.status = StatisticStatus::Success;
      return component;
    }

    RobustnessScore RobustnessScorer::score(const std::vector<double>& inSample,
					    const std::vector<double>& outOfSample,
					    const std::vector<std::vector<double>>& parameterValues) const
    {
      RobustnessScore result;
      result.consistency = scoreConsistency(outOfSample);
      result.decay = scoreDecay(inSample, outOfSample);
      result.stability = scoreStability(parameterValues);

      for (const ScoreComponent* component : {&result.consistency, &result.decay, &result.stability})
	{
	  if (component->status != StatisticStatus::Success)
	    continue;

	  result.total += component->score;
	  result.status = StatisticStatus::Success;
	}

      result.total = std::min(100.0, std::max(0.0, result.total));
      return result;
    }
  }
}
