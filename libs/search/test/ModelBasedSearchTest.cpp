#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <cstdlib>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include "ModelBasedSearch.h"
#include "SurrogateModel.h"
#include "ExperimentTestUtils.h"

using namespace stratlab;
using namespace stratlab::search;
using namespace stratlab::test;
using Catch::Approx;

namespace
{
  class ThrowingSurrogate : public SurrogateModel
  {
  public:
    std::string name() const override
    {
      return "throwing";
    }

    bool fit(const std::vector<std::vector<double>>&, const std::vector<double>&) override
    {
      throw std::runtime_error("solver diverged");
    }

    SurrogatePrediction predict(const std::vector<double>&) const override
    {
      return SurrogatePrediction{0.0, 0.0};
    }
  };

  std::vector<ParameterValue> integers(int from, int to)
  {
    std::vector<ParameterValue> values;
    for (int i = from; i <= to; ++i)
      values.push_back(ParameterValue(i));
    return values;
  }

  // Sharpe peaks at x == 30
  BacktestMetrics peaked(const BacktestRequest& request)
  {
    const double x = request.parameters.at("x").asDouble();
    const double sharpe = 2.0 - (x - 30.0) * (x - 30.0) / 100.0;
    return BacktestMetrics(sharpe / 10.0, -0.1, sharpe, 10, 0.5, 1.5);
  }

  OptimizationConfig budgetConfig(std::size_t budget, std::size_t initialPoints)
  {
    OptimizationConfig config;
    config.runner = fastOptions(2);
    config.callBudget = budget;
    config.initialPoints = initialPoints;
    config.seed = 3;
    return config;
  }

  std::set<std::string> distinctAssignments(const ExperimentResult& result)
  {
    std::set<std::string> distinct;
    for (const auto& run : result.getRuns())
      distinct.insert(toString(run.getParameters()));
    return distinct;
  }
}

TEST_CASE("GaussianProcessSurrogate: interpolates observations", "[Surrogate]")
{
  GaussianProcessSurrogate gp;
  std::vector<std::vector<double>> points{{0.0}, {0.5}, {1.0}};
  std::vector<double> values{1.0, 3.0, 2.0};

  REQUIRE(gp.fit(points, values));
  for (std::size_t i = 0; i < points.size(); ++i)
    {
      SurrogatePrediction p = gp.predict(points[i]);
      REQUIRE(p.mean == Approx(values[i]).margin(1e-3));
      REQUIRE(p.stdDev < 0.05);
    }

  // Uncertainty grows away from the data
  REQUIRE(gp.predict({0.25}).stdDev > gp.predict({0.5}).stdDev);
}

TEST_CASE("GaussianProcessSurrogate: rejects unusable observations", "[Surrogate]")
{
  GaussianProcessSurrogate gp;
  REQUIRE_FALSE(gp.fit({{0.5}}, {1.0}));
  REQUIRE_FALSE(gp.fit({{0.0}, {1.0, 2.0}}, {1.0, 2.0}));
  REQUIRE_FALSE(gp.fit({{0.0}, {1.0}}, {1.0, std::nan("")}));

  GaussianProcessOptions noiseless;
  noiseless.noiseVariance = 0.0;
  GaussianProcessSurrogate singular(noiseless);
  REQUIRE_FALSE(singular.fit({{0.5}, {0.5}}, {1.0, 2.0}));

  REQUIRE(gp.fit({{0.0}, {1.0}}, {1.0, 2.0}));
  REQUIRE_THROWS_AS(gp.predict({0.1, 0.2}), std::invalid_argument);
}

TEST_CASE("expectedImprovement: zero without uncertainty or gain", "[Surrogate]")
{
  REQUIRE(expectedImprovement(SurrogatePrediction{1.0, 0.0}, 2.0) == 0.0);
  REQUIRE(expectedImprovement(SurrogatePrediction{3.0, 0.0}, 2.0, 0.0) == Approx(1.0));
  REQUIRE(expectedImprovement(SurrogatePrediction{2.0, 1.0}, 2.0, 0.0) == Approx(0.3989422804).epsilon(1e-6));
  REQUIRE(expectedImprovement(SurrogatePrediction{2.0, 2.0}, 2.0) > expectedImprovement(SurrogatePrediction{2.0, 1.0}, 2.0));
}

TEST_CASE("ModelBasedSearch: surrogate proposals find the optimum", "[ModelBasedSearch]")
{
  ExperimentConfiguration config =
    makeConfiguration({ ParameterRange::fromValues("x", integers(0, 49)) }, {"BTCUSDT", "ETHUSDT"});

  ModelBasedSearch search(budgetConfig(20, 5));
  std::ostringstream log;
  ExperimentResult result = search.optimize(config, peaked, log);

  REQUIRE_FALSE(search.usedFallback());
  REQUIRE(search.getModelProposals() == 15);
  REQUIRE(result.getTotalRuns() == 20);
  REQUIRE(distinctAssignments(result).size() == 20);

  for (const auto& run : result.getRuns())
    REQUIRE(run.getSymbol() == "BTCUSDT");

  const long long best = result.getBestRun()->getParameters().at("x").asInteger();
  REQUIRE(std::llabs(best - 30) <= 2);
  REQUIRE(log.str().find("warning") == std::string::npos);
}

TEST_CASE("ModelBasedSearch: budget defaults to max combinations", "[ModelBasedSearch]")
{
  ExperimentConfiguration config =
    makeConfiguration({ ParameterRange::fromValues("x", integers(0, 49)) },
		      {"BTCUSDT"},
		      ExpansionPolicy(ExpansionMode::Grid, 12));

  OptimizationConfig options = budgetConfig(1, 4);
  options.callBudget.reset();

  ModelBasedSearch search(options);
  std::ostringstream log;
  REQUIRE(search.optimize(config, peaked, log).getTotalRuns() == 12);
}

TEST_CASE("ModelBasedSearch: missing backend falls back to random search", "[ModelBasedSearch]")
{
  ExperimentConfiguration config = makeConfiguration({ ParameterRange::fromValues("x", integers(0, 49)) });

  ModelBasedSearch search(budgetConfig(8, 3), []() { return std::unique_ptr<SurrogateModel>(); });
  std::ostringstream log;
  ExperimentResult result = search.optimize(config, peaked, log);

  REQUIRE(search.usedFallback());
  REQUIRE(result.getTotalRuns() == 8);
  REQUIRE(distinctAssignments(result).size() == 8);
  REQUIRE(log.str().find("[SEARCH] warning") != std::string::npos);
}

TEST_CASE("ModelBasedSearch: throwing surrogate falls back without failing", "[ModelBasedSearch]")
{
  ExperimentConfiguration config = makeConfiguration({ ParameterRange::fromValues("x", integers(0, 49)) });

  ModelBasedSearch search(budgetConfig(10, 4),
			  []() { return std::unique_ptr<SurrogateModel>(new ThrowingSurrogate()); });
  std::ostringstream log;
  std::optional<ExperimentResult> result;
  REQUIRE_NOTHROW(result.emplace(search.optimize(config, peaked, log)));

  REQUIRE(search.usedFallback());
  REQUIRE(search.getModelProposals() == 0);
  REQUIRE(result->getTotalRuns() == 10);
  REQUIRE(log.str().find("solver diverged") != std::string::npos);
}

TEST_CASE("ModelBasedSearch: non-numeric parameters fall back", "[ModelBasedSearch]")
{
  ExperimentConfiguration config =
    makeConfiguration({ ParameterRange::fromValues("mode", {"fast", "slow", "adaptive"}),
			ParameterRange::fromValues("x", {1, 2, 3}) });

  ModelBasedSearch search(budgetConfig(5, 2));
  std::ostringstream log;
  ExperimentResult result = search.optimize(config, deterministicMetrics, log);

  REQUIRE(search.usedFallback());
  REQUIRE(result.getTotalRuns() == 5);
  REQUIRE(log.str().find("not all numeric") != std::string::npos);
}

TEST_CASE("ParameterNormalizer: maps candidates onto the unit interval", "[ModelBasedSearch]")
{
  std::vector<ParameterSet> candidates{
    {{"a", ParameterValue(10)}, {"b", ParameterValue(0.5)}},
    {{"a", ParameterValue(20)}, {"b", ParameterValue(0.5)}},
    {{"a", ParameterValue(30)}, {"b", ParameterValue(0.5)}}};

  ParameterNormalizer normalizer;
  REQUIRE(normalizer.fit(candidates));
  REQUIRE(normalizer.getDimensions() == 2);

  std::vector<double> mid = normalizer.normalize(candidates[1]);
  REQUIRE(mid[0] == Approx(0.5));
  REQUIRE(mid[1] == Approx(0.0));

  candidates.push_back({{"a", ParameterValue("x")}, {"b", ParameterValue(1.0)}});
  REQUIRE_FALSE(normalizer.fit(candidates));
}
