// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_PARAMETER_EXPANDER_H
#define __STRATLAB_PARAMETER_EXPANDER_H 1

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "ExperimentConfiguration.h"
#include "ParameterValue.h"

namespace stratlab
{
  // One unit of work for the batch runner
  struct ExperimentTask
  {
    std::string symbol;
    ParameterSet parameters;
  };

  /**
   * @brief Turns an ExperimentConfiguration into concrete assignments and tasks.
   *
   * Grid mode enumerates the Cartesian product of every range in parameter
   * name order, the last parameter varying fastest. When the product exceeds
   * max-combinations it keeps every stride-th combination, stride being
   * total / max, truncated to exactly max entries; repeated calls return the
   * same list.
   *
   * Random mode draws sample-size (or max-combinations) distinct
   * assignments, seeded from the configuration when it carries a seed.
   *
   * List mode returns the configured combinations unchanged.
   *
   * An empty parameter map yields exactly one empty assignment.
   */
  class ParameterExpander
  {
  public:
    explicit ParameterExpander(const ExperimentConfiguration& configuration);

    std::vector<ParameterSet> expandCombinations() const;

    // Symbol-major: all assignments for the first symbol, then the next
    std::vector<ExperimentTask> expandTasks() const;

    // Size of the full product, saturating at SIZE_MAX
    std::size_t countCombinations() const;

    // Draw count distinct assignments from the full product
    std::vector<ParameterSet> sampleCombinations(std::size_t count, std::optional<std::uint64_t> seed) const;

    static std::vector<ExperimentTask> makeTasks(const std::vector<std::string>& symbols,
						 const std::vector<ParameterSet>& combinations);

  private:
    std::vector<ParameterSet> expandGrid() const;
    ParameterSet combinationAt(std::size_t index) const;
    ParameterSet combinationFromDigits(const std::vector<std::size_t>& digits) const;

  private:
    ExperimentConfiguration mConfiguration;
    std::vector<std::vector<ParameterValue>> mAxes;
  };
}

#endif
