// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_PARAMETER_ANALYSIS_H
#define __STRATLAB_PARAMETER_ANALYSIS_H 1

#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "ExperimentResult.h"
#include "RunRecord.h"
#include "StatisticStatus.h"

namespace stratlab
{
  namespace search
  {
    // Per-parameter scores with the status of the analysis that produced them
    struct ParameterScores
    {
      StatisticStatus status = StatisticStatus::InsufficientData;
      std::size_t runsUsed = 0;
      std::map<std::string, double> scores;
    };

    /**
     * @brief Variance-based importance of each parameter for a metric.
     *
     * Uses completed runs that report the metric. For each parameter the
     * runs are grouped by its value; the mean sample variance of groups
     * with at least two runs (0 when there are none) is compared with the
     * total sample variance, raw importance being 1 - within / total
     * clamped to [0,1]. Raw scores are normalized to sum to 1 when their
     * sum is positive.
     *
     * InsufficientData (with no scores) for fewer than two usable runs or
     * zero total variance.
     */
    ParameterScores analyzeParameterImportance(const std::vector<RunRecord>& runs,
					       const std::string& metric);

    ParameterScores analyzeParameterImportance(const ExperimentResult& result);

    // Pearson correlation of each numeric parameter with the metric, 0 when undefined
    ParameterScores analyzeParameterCorrelation(const std::vector<RunRecord>& runs,
						const std::string& metric);

    // Completed runs reporting the metric, best first, at most n
    std::vector<RunRecord> topRuns(const std::vector<RunRecord>& runs,
				   const std::string& metric,
				   std::size_t n,
				   bool maximize = true);
  }
}

#endif
