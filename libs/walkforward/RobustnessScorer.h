// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_ROBUSTNESS_SCORER_H
#define __STRATLAB_ROBUSTNESS_SCORER_H 1

#include <limits>
#include <vector>
#include "StatisticStatus.h"

namespace stratlab
{
  namespace walkforward
  {
    // One capped part of the score; value is the underlying ratio
    struct ScoreComponent
    {
      StatisticStatus status = StatisticStatus::InsufficientData;
      double score = 0.0;
      double maxScore = 0.0;
      double value = std::numeric_limits<double>::quiet_NaN();
    };

    struct RobustnessScore
    {
      StatisticStatus status = StatisticStatus::InsufficientData;
      double total = 0.0;
      ScoreComponent consistency;   // out-of-sample sign agreement
      ScoreComponent decay;         // in-sample to out-of-sample drop
      ScoreComponent stability;     // winning parameter variation
    };

    /**
     * @brief Composite 0-100 overfitting score of a walk-forward run.
     *
     * consistency: share of out-of-sample values with the favourable sign
     * (positive when maximizing), times 40.
     *
     * decay: (IS mean - OOS mean) / |IS mean|, sign flipped when
     * minimizing; 30 * (1 - decay) clamped to [0, 30].
     *
     * stability: mean coefficient of variation (population std / |mean|)
     * of the numeric winning parameters; 30 * (1 - min(cv / 0.5, 1)).
     *
     * A component with fewer than two values, a zero IS mean or no finite
     * CV is InsufficientData and adds nothing. The total is InsufficientData
     * only when every component is.
     */
    class RobustnessScorer
    {
    public:
      static constexpr double kConsistencyWeight = 40.0;
      static constexpr double kDecayWeight = 30.0;
      static constexpr double kStabilityWeight = 30.0;
      static constexpr double kUnstableCv = 0.5;

      explicit RobustnessScorer(bool maximize = true);

      ScoreComponent scoreConsistency(const std::vector<double>& outOfSample) const;

      ScoreComponent scoreDecay(const std::vector<double>& inSample,
				const std::vector<double>& outOfSample) const;

      // One vector of winning values per numeric parameter
      ScoreComponent scoreStability(const std::vector<std::vector<double>>& parameterValues) const;

      RobustnessScore score(const std::vector<double>& inSample,
			    const std::vector<double>& outOfSample,
			    const std::vector<std::vector<double>>& parameterValues) const;

    private:
      bool mMaximize;
    };

    // Population std / |mean|; infinity for a zero mean, NaN for no values
    double coefficientOfVariation(const std::vector<double>& values);
  }
}

#endif
