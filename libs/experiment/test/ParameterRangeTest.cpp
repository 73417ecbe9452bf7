#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include "ParameterRange.h"
#include "ExperimentException.h"

using namespace stratlab;
using Catch::Approx;

TEST_CASE("ParameterRange: explicit list expands unchanged", "[ParameterRange]")
{
  ParameterRange range = ParameterRange::fromValues("mode", {"fast", "slow", "adaptive"});

  REQUIRE(range.isExplicit());
  REQUIRE(range.size() == 3);

  auto values = range.expand();
  REQUIRE(values.size() == 3);
  REQUIRE(values[0].asString() == "fast");
  REQUIRE(values[2].asString() == "adaptive");
}

TEST_CASE("ParameterRange: step interval landing on stop", "[ParameterRange]")
{
  ParameterRange range = ParameterRange::fromStep("period", 10, 50, 10);
  auto values = range.expand();

  REQUIRE(values.size() == 5);
  REQUIRE(range.size() == values.size());
  REQUIRE(values.front().getKind() == ParameterValue::Kind::Integer);
  REQUIRE(values.front().asInteger() == 10);
  REQUIRE(values.back().asInteger() == 50);
}

TEST_CASE("ParameterRange: step count is ceil(span / step) + 1 and spans the interval", "[ParameterRange]")
{
  struct Case { double start, stop, step; };
  const Case cases[] = { {0.0, 10.0, 3.0}, {1.0, 2.0, 0.3}, {5.0, 6.0, 0.25}, {0.0, 1.0, 0.1} };

  for (const auto& c : cases)
    {
      ParameterRange range = ParameterRange::fromStep("x", c.start, c.stop, c.step);
      auto values = range.expand();

      const auto expected = static_cast<std::size_t>(std::ceil((c.stop - c.start) / c.step - 1e-9)) + 1;
      REQUIRE(values.size() == expected);
      REQUIRE(values.front().asDouble() == Approx(c.start));
      REQUIRE(values.back().asDouble() == Approx(c.stop));

      for (std::size_t i = 1; i < values.size(); ++i)
	REQUIRE(values[i].asDouble() > values[i - 1].asDouble());
    }
}

TEST_CASE("ParameterRange: overshooting step is clamped to stop", "[ParameterRange]")
{
  auto values = ParameterRange::fromStep("x", 0, 10, 3).expand();

  REQUIRE(values.size() == 5);
  REQUIRE(values[3].asInteger() == 9);
  REQUIRE(values[4].asInteger() == 10);
}

TEST_CASE("ParameterRange: fractional step produces reals", "[ParameterRange]")
{
  auto values = ParameterRange::fromStep("stop_loss", 0.01, 0.05, 0.01).expand();

  REQUIRE(values.size() == 5);
  REQUIRE(values[0].getKind() == ParameterValue::Kind::Real);
  REQUIRE(values[2].asDouble() == Approx(0.03));
}

TEST_CASE("ParameterRange: single point interval", "[ParameterRange]")
{
  auto values = ParameterRange::fromStep("x", 7, 7, 1).expand();
  REQUIRE(values.size() == 1);
  REQUIRE(values[0].asInteger() == 7);
}

TEST_CASE("ParameterRange: linear count includes both ends", "[ParameterRange]")
{
  auto values = ParameterRange::fromCount("x", 0.0, 1.0, 5).expand();

  REQUIRE(values.size() == 5);
  REQUIRE(values[0].asDouble() == Approx(0.0));
  REQUIRE(values[1].asDouble() == Approx(0.25));
  REQUIRE(values[4].asDouble() == Approx(1.0));

  auto single = ParameterRange::fromCount("x", 3.0, 9.0, 1).expand();
  REQUIRE(single.size() == 1);
  REQUIRE(single[0].asDouble() == Approx(3.0));
}

TEST_CASE("ParameterRange: log spacing is geometric", "[ParameterRange]")
{
  ParameterRange range = ParameterRange::fromCount("alpha", 0.001, 1.0, 4, ParameterRange::Spacing::Logarithmic);
  auto values = range.expand();

  REQUIRE(range.isLogScale());
  REQUIRE(values.size() == 4);
  REQUIRE(values[0].asDouble() == Approx(0.001));
  REQUIRE(values[1].asDouble() == Approx(0.01));
  REQUIRE(values[2].asDouble() == Approx(0.1));
  REQUIRE(values[3].asDouble() == Approx(1.0));
}

TEST_CASE("ParameterRange: invalid definitions are rejected", "[ParameterRange]")
{
  REQUIRE_THROWS_AS(ParameterRange::fromValues("x", {}), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ParameterRange::fromValues("", {1}), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ParameterRange::fromStep("x", 0, 10, 0), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ParameterRange::fromStep("x", 0, 10, -1), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ParameterRange::fromStep("x", 10, 0, 1), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ParameterRange::fromStep("x", 0, NAN, 1), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ParameterRange::fromCount("x", 0, 1, 0), ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ParameterRange::fromCount("x", 0.0, 1.0, 5, ParameterRange::Spacing::Logarithmic),
		    ExperimentConfigurationException);
  REQUIRE_THROWS_AS(ParameterRange::fromCount("x", -1.0, 1.0, 5, ParameterRange::Spacing::Logarithmic),
		    ExperimentConfigurationException);
}

TEST_CASE("ParameterRange: representation accessors", "[ParameterRange]")
{
  ParameterRange list = ParameterRange::fromValues("x", {1, 2});
  ParameterRange interval = ParameterRange::fromStep("x", 1, 2, 1);

  REQUIRE_THROWS_AS(list.getStart(), std::logic_error);
  REQUIRE_THROWS_AS(interval.getValues(), std::logic_error);
  REQUIRE(interval.getStep().has_value());
  REQUIRE_FALSE(interval.getCount().has_value());
  REQUIRE(list != interval);
  REQUIRE(interval == ParameterRange::fromStep("x", 1, 2, 1));
}

TEST_CASE("ParameterValue: kinds and conversions", "[ParameterValue]")
{
  ParameterValue i(5);
  ParameterValue d(2.5);
  ParameterValue b(true);
  ParameterValue s("ema");

  REQUIRE(i.isNumeric());
  REQUIRE(d.isNumeric());
  REQUIRE_FALSE(b.isNumeric());
  REQUIRE_FALSE(s.isNumeric());

  REQUIRE(i.asDouble() == Approx(5.0));
  REQUIRE_THROWS_AS(s.asDouble(), std::domain_error);
  REQUIRE_THROWS_AS(d.asInteger(), std::domain_error);
  REQUIRE(b.asBoolean());

  ParameterSet set{{"fast", 5}, {"kind", "ema"}};
  REQUIRE(toString(set) == "{fast=5, kind=ema}");
}
