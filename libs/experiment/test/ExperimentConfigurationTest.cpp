#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <boost/filesystem/fstream.hpp>
#include "ExperimentConfiguration.h"
#include "ExperimentConfigurationReader.h"
#include "ExperimentConfigurationWriter.h"
#include "ExperimentException.h"
#include "ExperimentTestUtils.h"

using namespace stratlab;
using namespace stratlab::test;
using boost::gregorian::date;
using Catch::Approx;

namespace
{
  std::vector<ParameterRange> smaRanges()
  {
    return { ParameterRange::fromValues("fast", {5, 10}),
	     ParameterRange::fromStep("slow", 20, 100, 20) };
  }

  const char* kDocument = R"({
    "name": "sma_cross",
    "strategy": "dual_ma",
    "symbols": ["BTCUSDT", "ETHUSDT"],
    "timeframe": "1h",
    "parameters": {
      "fast": [5, 10],
      "slow": {"start": 20, "stop": 100, "step": 20},
      "alpha": {"start": 0.001, "stop": 1, "num": 4, "log": true}
    },
    "expansion_mode": "random",
    "sample_size": 5,
    "seed": 42,
    "start_date": "2023-01-01",
    "end_date": "2023-12-01",
    "initial_cash": 5000,
    "fee_rate": 0.001,
    "leverage": 2,
    "stop_loss_pct": 0.05,
    "description": "baseline",
    "tags": ["ma", "trend"],
    "metric": "total_return"
  })";
}

TEST_CASE("ExperimentConfiguration: identifier has name and eight hex digits", "[ExperimentConfiguration]")
{
  ExperimentConfiguration config = makeConfiguration(smaRanges());
  const std::string& id = config.getExperimentId();

  REQUIRE(id.size() == std::string("sma_cross_").size() + 8);
  REQUIRE(id.compare(0, 10, "sma_cross_") == 0);
  REQUIRE(id.find_first_not_of("0123456789abcdef", 10) == std::string::npos);
}

TEST_CASE("md5Hex: matches the RFC 1321 test suite", "[ExperimentConfiguration]")
{
  REQUIRE(md5Hex("") == "d41d8cd98f00b204e9800998ecf8427e");
  REQUIRE(md5Hex("abc") == "900150983cd24fb0d6963f7d28e17f72");
  REQUIRE(md5Hex("message digest") == "f96b697d7cb7938d525a2f31aaf161d0");

  ExperimentConfiguration config = makeConfiguration(smaRanges());
  REQUIRE(config.getExperimentId() == "sma_cross_" + md5Hex(config.getCanonicalForm()).substr(0, 8));
}

TEST_CASE("ExperimentConfiguration: equal configurations share an identifier", "[ExperimentConfiguration]")
{
  ExperimentConfiguration a = makeConfiguration(smaRanges(), {"BTCUSDT", "ETHUSDT"});

  // Same content, parameters and symbols declared in another order
  std::vector<ParameterRange> reversed = { ParameterRange::fromStep("slow", 20, 100, 20),
					   ParameterRange::fromValues("fast", {5, 10}) };
  ExperimentConfiguration b = makeConfiguration(reversed, {"ETHUSDT", "BTCUSDT"});

  REQUIRE(a.getExperimentId() == b.getExperimentId());
  REQUIRE(a.getCanonicalForm() == b.getCanonicalForm());
  REQUIRE(b.getParameters().front().getName() == "fast");
}

TEST_CASE("ExperimentConfiguration: changing a field changes the identifier", "[ExperimentConfiguration]")
{
  ExperimentConfiguration base = makeConfiguration(smaRanges());
  const std::string id = base.getExperimentId();

  SECTION("name")
    {
      ExperimentConfiguration other("sma_cross2", "dual_ma", {"BTCUSDT"}, "1h", smaRanges());
      REQUIRE(other.getExperimentId() != id);
    }
  SECTION("strategy")
    {
      ExperimentConfiguration other("sma_cross", "triple_ma", {"BTCUSDT"}, "1h", smaRanges());
      REQUIRE(other.getExperimentId() != id);
    }
  SECTION("symbols")
    {
      REQUIRE(makeConfiguration(smaRanges(), {"ETHUSDT"}).getExperimentId() != id);
    }
  SECTION("timeframe")
    {
      ExperimentConfiguration other("sma_cross", "dual_ma", {"BTCUSDT"}, "4h", smaRanges());
      REQUIRE(other.getExperimentId() != id);
    }
  SECTION("parameter range")
    {
      std::vector<ParameterRange> ranges = { ParameterRange::fromValues("fast", {5, 15}),
					     ParameterRange::fromStep("slow", 20, 100, 20) };
      REQUIRE(makeConfiguration(ranges).getExperimentId() != id);
    }
  SECTION("expansion policy")
    {
      REQUIRE(base.withExpansionPolicy(ExpansionPolicy(ExpansionMode::Grid, 3)).getExperimentId() != id);
    }
  SECTION("date range")
    {
      REQUIRE(base.withDateRange(DateRange(date(2023, 1, 1), date(2023, 6, 1))).getExperimentId() != id);
    }
  SECTION("execution defaults")
    {
      ExperimentConfiguration other("sma_cross", "dual_ma", {"BTCUSDT"}, "1h", smaRanges(),
				    ExpansionPolicy(), ExecutionDefaults(20000.0, 0.0005, 1.0));
      REQUIRE(other.getExperimentId() != id);
    }
  SECTION("description and tags are metadata only")
    {
      REQUIRE(base.withDescription("notes").withTags({"x"}).getExperimentId() == id);
    }
}

TEST_CASE("ExperimentConfiguration: with* helpers leave the original untouched", "[ExperimentConfiguration]")
{
  ExperimentConfiguration base = makeConfiguration(smaRanges());
  ExperimentConfiguration dated = base.withDateRange(DateRange(date(2023, 1, 1), date(2023, 3, 1)));

  REQUIRE_FALSE(base.getDateRange().has_value());
  REQUIRE(dated.getDateRange().has_value());
  REQUIRE(dated.getDateRange()->getFirstDate() == date(2023, 1, 1));
}

TEST_CASE("ExperimentConfiguration: invalid configurations are rejected", "[ExperimentConfiguration]")
{
  REQUIRE_THROWS_AS(ExperimentConfiguration("", "s", {"A"}, "1h", {}), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ExperimentConfiguration("n", "", {"A"}, "1h", {}), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ExperimentConfiguration("n", "s", {}, "1h", {}), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ExperimentConfiguration("n", "s", {"A", "A"}, "1h", {}), ExperimentConfigurationException);

  std::vector<ParameterRange> duplicate = { ParameterRange::fromValues("x", {1}),
					    ParameterRange::fromValues("x", {2}) };
  REQUIRE_THROWS_AS(ExperimentConfiguration("n", "s", {"A"}, "1h", duplicate), ExperimentConfigurationException);

  REQUIRE_THROWS_AS(ExpansionPolicy(ExpansionMode::List), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ExpansionPolicy(ExpansionMode::Grid, 0), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ExecutionDefaults(0.0, 0.0005, 1.0), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(expansionModeFromString("bayesian"), ExperimentConfigurationException);
}

TEST_CASE("ExperimentConfigurationReader: parses the declarative document", "[ExperimentConfigurationReader]")
{
  ExperimentConfiguration config = ExperimentConfigurationReader().parseString(kDocument);

  REQUIRE(config.getName() == "sma_cross");
  REQUIRE(config.getStrategyId() == "dual_ma");
  REQUIRE(config.getSymbols().size() == 2);
  REQUIRE(config.getParameters().size() == 3);
  REQUIRE(config.getParameters()[0].getName() == "alpha");
  REQUIRE(config.getParameters()[0].isLogScale());
  REQUIRE(config.getParameters()[0].size() == 4);
  REQUIRE(config.getExpansionPolicy().getMode() == ExpansionMode::Random);
  REQUIRE(*config.getExpansionPolicy().getSampleSize() == 5);
  REQUIRE(*config.getExpansionPolicy().getSeed() == 42);
  REQUIRE(config.getDateRange()->getLastDate() == date(2023, 12, 1));
  REQUIRE(config.getExecutionDefaults().getInitialCash() == Approx(5000.0));
  REQUIRE(config.getExecutionDefaults().getLeverage() == Approx(2.0));
  REQUIRE(*config.getExecutionDefaults().getStopLossPct() == Approx(0.05));
  REQUIRE_FALSE(config.getExecutionDefaults().getTakeProfitPct().has_value());
  REQUIRE(config.getDescription() == "baseline");
  REQUIRE(config.getTags().size() == 2);
  REQUIRE(config.getOptimizationMetric() == "total_return");
}

TEST_CASE("ExperimentConfigurationReader: defaults for omitted fields", "[ExperimentConfigurationReader]")
{
  ExperimentConfiguration config = ExperimentConfigurationReader().parseString(
    R"({"name": "n", "strategy": "s", "symbols": ["A"], "timeframe": "1d"})");

  REQUIRE(config.getParameters().empty());
  REQUIRE(config.getExpansionPolicy().getMode() == ExpansionMode::Grid);
  REQUIRE(config.getExecutionDefaults().getInitialCash() == Approx(10000.0));
  REQUIRE(config.getExecutionDefaults().getFeeRate() == Approx(0.0005));
  REQUIRE(config.getOptimizationMetric() == "sharpe_ratio");
}

TEST_CASE("ExperimentConfigurationReader: configuration errors are fatal", "[ExperimentConfigurationReader]")
{
  ExperimentConfigurationReader reader;

  REQUIRE_THROWS_AS(reader.parseString("{not json"), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(reader.parseString(R"({"strategy": "s", "symbols": ["A"], "timeframe": "1h"})"),
		    ExperimentConfigurationException);
  REQUIRE_THROWS_AS(reader.parseString(R"({"name": "n", "strategy": "s", "symbols": ["A"], "timeframe": "1h",
                                          "expansion_mode": "bayesian"})"),
		    ExperimentConfigurationException);
  REQUIRE_THROWS_AS(reader.parseString(R"({"name": "n", "strategy": "s", "symbols": ["A"], "timeframe": "1h",
                                          "parameters": {"x": {"start": 10, "stop": 1, "step": 1}}})"),
		    ExperimentConfigurationException);
  REQUIRE_THROWS_AS(reader.parseString(R"({"name": "n", "strategy": "s", "symbols": ["A"], "timeframe": "1h",
                                          "parameters": {"x": {"start": 1, "stop": 10}}})"),
		    ExperimentConfigurationException);
  REQUIRE_THROWS_AS(reader.parseString(R"({"name": "n", "strategy": "s", "symbols": "A", "timeframe": "1h"})"),
		    ExperimentConfigurationException);
  REQUIRE_THROWS_AS(reader.parseString(R"({"name": "n", "strategy": "s", "symbols": ["A"], "timeframe": "1h",
                                          "start_date": "2023-01-01"})"),
		    ExperimentConfigurationException);
}

TEST_CASE("ExperimentConfigurationReader: only JSON files are supported", "[ExperimentConfigurationReader]")
{
  TempDirectory dir;
  const boost::filesystem::path yamlPath = dir.path() / "experiment.yaml";
  {
    boost::filesystem::ofstream out(yamlPath);
    out << "name: n\n";
  }

  REQUIRE_THROWS_AS(ExperimentConfigurationReader().readFile(yamlPath), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ExperimentConfigurationReader().readFile(dir.path() / "missing.json"),
		    ExperimentConfigurationException);
}

TEST_CASE("ExperimentConfigurationWriter: write then read keeps the identifier", "[ExperimentConfigurationWriter]")
{
  ExperimentConfiguration original = ExperimentConfigurationReader().parseString(kDocument);

  SECTION("through a string")
    {
      ExperimentConfiguration copy =
	ExperimentConfigurationReader().parseString(ExperimentConfigurationWriter().toString(original));
      REQUIRE(copy.getExperimentId() == original.getExperimentId());
      REQUIRE(copy.getTags() == original.getTags());
    }

  SECTION("through a file")
    {
      TempDirectory dir;
      const boost::filesystem::path path = dir.path() / "experiment.json";
      ExperimentConfigurationWriter().writeFile(original, path);

      ExperimentConfiguration copy = ExperimentConfigurationReader().readFile(path);
      REQUIRE(copy.getExperimentId() == original.getExperimentId());
    }

  SECTION("list mode with real and text values")
    {
      std::vector<ParameterSet> combos = { {{"fast", 5}, {"kind", "ema"}, {"w", 0.5}},
					   {{"fast", 8}, {"kind", "sma"}, {"w", 2.0}} };
      ExperimentConfiguration listConfig =
	makeConfiguration({}, {"BTCUSDT"}, ExpansionPolicy(ExpansionMode::List, std::nullopt, std::nullopt,
							   std::nullopt, combos));

      ExperimentConfiguration copy =
	ExperimentConfigurationReader().parseString(ExperimentConfigurationWriter().toString(listConfig));
      REQUIRE(copy.getExperimentId() == listConfig.getExperimentId());
      REQUIRE(copy.getExpansionPolicy().getCombinations() == combos);
    }
}
