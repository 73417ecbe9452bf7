#include <catch2/catch_test_macros.hpp>
#include <limits>
#include <set>
#include "ParameterExpander.h"
#include "ExperimentTestUtils.h"

using namespace stratlab;
using namespace stratlab::test;

namespace
{
  std::vector<ParameterRange> abRanges()
  {
    return { ParameterRange::fromValues("a", {1, 2}),
	     ParameterRange::fromValues("b", {10, 20, 30}) };
  }
}

TEST_CASE("ParameterExpander: grid over two symbols", "[ParameterExpander]")
{
  ExperimentConfiguration config = makeConfiguration(abRanges(), {"BTCUSDT", "ETHUSDT"});
  ParameterExpander expander(config);

  REQUIRE(expander.countCombinations() == 6);

  auto tasks = expander.expandTasks();
  REQUIRE(tasks.size() == 12);

  // Symbol-major, last parameter fastest
  REQUIRE(tasks[0].symbol == "BTCUSDT");
  REQUIRE(tasks[0].parameters.at("a").asInteger() == 1);
  REQUIRE(tasks[0].parameters.at("b").asInteger() == 10);
  REQUIRE(tasks[1].parameters.at("b").asInteger() == 20);
  REQUIRE(tasks[3].parameters.at("a").asInteger() == 2);
  REQUIRE(tasks[6].symbol == "ETHUSDT");

  std::set<std::pair<std::string, std::string>> distinct;
  for (const auto& t : tasks)
    distinct.insert({t.symbol, toString(t.parameters)});
  REQUIRE(distinct.size() == 12);
}

TEST_CASE("ParameterExpander: capped grid is stride sampled and reproducible", "[ParameterExpander]")
{
  std::vector<ParameterRange> ranges = { ParameterRange::fromStep("x", 1, 10, 1),
					 ParameterRange::fromStep("y", 1, 10, 1) };
  ExperimentConfiguration config =
    makeConfiguration(ranges, {"BTCUSDT"}, ExpansionPolicy(ExpansionMode::Grid, 7));

  auto first = ParameterExpander(config).expandCombinations();
  auto second = ParameterExpander(config).expandCombinations();

  REQUIRE(first.size() == 7);
  REQUIRE(first == second);

  // stride = 100 / 7 = 14: indices 0, 14, 28, ...
  REQUIRE(first[0].at("x").asInteger() == 1);
  REQUIRE(first[0].at("y").asInteger() == 1);
  REQUIRE(first[1].at("x").asInteger() == 2);
  REQUIRE(first[1].at("y").asInteger() == 5);

  REQUIRE(ParameterExpander(config).expandTasks().size() == 7);
}

TEST_CASE("ParameterExpander: cap above grid size keeps everything", "[ParameterExpander]")
{
  ExperimentConfiguration config =
    makeConfiguration(abRanges(), {"BTCUSDT"}, ExpansionPolicy(ExpansionMode::Grid, 100));
  REQUIRE(ParameterExpander(config).expandCombinations().size() == 6);
}

TEST_CASE("ParameterExpander: empty parameter map yields one default assignment", "[ParameterExpander]")
{
  ExperimentConfiguration config = makeConfiguration({}, {"BTCUSDT", "ETHUSDT"});
  ParameterExpander expander(config);

  auto combos = expander.expandCombinations();
  REQUIRE(combos.size() == 1);
  REQUIRE(combos[0].empty());
  REQUIRE(expander.expandTasks().size() == 2);
}

TEST_CASE("ParameterExpander: single value range is a factor of one", "[ParameterExpander]")
{
  std::vector<ParameterRange> ranges = abRanges();
  ranges.push_back(ParameterRange::fromValues("c", {true}));

  REQUIRE(ParameterExpander(makeConfiguration(ranges)).countCombinations() == 6);
}

TEST_CASE("ParameterExpander: list mode returns literal combinations", "[ParameterExpander]")
{
  std::vector<ParameterSet> combos = { {{"a", 1}, {"b", 99}}, {{"a", 1}, {"b", 99}} };
  ExperimentConfiguration config =
    makeConfiguration(abRanges(), {"BTCUSDT"},
		      ExpansionPolicy(ExpansionMode::List, 1, std::nullopt, std::nullopt, combos));

  auto result = ParameterExpander(config).expandCombinations();
  REQUIRE(result == combos);
}

TEST_CASE("ParameterExpander: seeded random sampling", "[ParameterExpander]")
{
  std::vector<ParameterRange> ranges = { ParameterRange::fromStep("x", 1, 20, 1),
					 ParameterRange::fromStep("y", 1, 20, 1) };
  ExperimentConfiguration config =
    makeConfiguration(ranges, {"BTCUSDT"},
		      ExpansionPolicy(ExpansionMode::Random, std::nullopt, 25, std::uint64_t(7)));

  auto a = ParameterExpander(config).expandCombinations();
  auto b = ParameterExpander(config).expandCombinations();

  REQUIRE(a.size() == 25);
  REQUIRE(a == b);

  std::set<std::string> distinct;
  for (const auto& combo : a)
    {
      distinct.insert(toString(combo));
      REQUIRE(combo.at("x").asInteger() >= 1);
      REQUIRE(combo.at("x").asInteger() <= 20);
    }
  REQUIRE(distinct.size() == 25);
}

TEST_CASE("ParameterExpander: random sample not smaller than the grid returns the grid", "[ParameterExpander]")
{
  ExperimentConfiguration config =
    makeConfiguration(abRanges(), {"BTCUSDT"},
		      ExpansionPolicy(ExpansionMode::Random, std::nullopt, 50, std::uint64_t(1)));
  REQUIRE(ParameterExpander(config).expandCombinations().size() == 6);
}

TEST_CASE("ParameterExpander: random mode falls back to max combinations", "[ParameterExpander]")
{
  ExperimentConfiguration config =
    makeConfiguration(abRanges(), {"BTCUSDT"},
		      ExpansionPolicy(ExpansionMode::Random, 4, std::nullopt, std::uint64_t(3)));
  REQUIRE(ParameterExpander(config).expandCombinations().size() == 4);
}

TEST_CASE("ParameterExpander: huge spaces saturate the count", "[ParameterExpander]")
{
  std::vector<ParameterRange> ranges;
  for (int i = 0; i < 8; ++i)
    ranges.push_back(ParameterRange::fromCount("p" + std::to_string(i), 0.0, 1.0, 1000));

  ExperimentConfiguration config =
    makeConfiguration(ranges, {"BTCUSDT"},
		      ExpansionPolicy(ExpansionMode::Random, std::nullopt, 10, std::uint64_t(5)));
  ParameterExpander expander(config);

  REQUIRE(expander.countCombinations() == std::numeric_limits<std::size_t>::max());
  REQUIRE(expander.expandCombinations().size() == 10);
}
