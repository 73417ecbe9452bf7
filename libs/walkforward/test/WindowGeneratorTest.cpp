#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "WalkForwardException.h"
#include "Window.h"
#include "WindowGenerator.h"

using namespace stratlab;
using namespace stratlab::walkforward;
using boost::gregorian::date;

TEST_CASE("WindowGenerator: 2023 with 6/2/2 months", "[WindowGenerator]")
{
  const date start(2023, 1, 1);
  const date end(2023, 12, 1);
  std::vector<Window> windows = WindowGenerator(6, 2, 2).generate(start, end);

  REQUIRE(windows.size() == 2);

  REQUIRE(windows[0].getTrainStart() == date(2023, 1, 1));
  REQUIRE(windows[0].getTrainEnd() == date(2023, 7, 1));
  REQUIRE(windows[0].getTestEnd() == date(2023, 9, 1));

  REQUIRE(windows[1].getTrainStart() == date(2023, 3, 1));
  REQUIRE(windows[1].getTrainEnd() == date(2023, 9, 1));
  REQUIRE(windows[1].getTestEnd() == date(2023, 11, 1));

  for (std::size_t i = 0; i < windows.size(); ++i)
    {
      REQUIRE(windows[i].getIndex() == i);
      REQUIRE(windows[i].getTestStart() == windows[i].getTrainEnd());
      REQUIRE(windows[i].getTestEnd() <= end);
      REQUIRE(windows[i].getState() == WindowState::Pending);
    }
}

TEST_CASE("WindowGenerator: last window may end exactly on the end date", "[WindowGenerator]")
{
  std::vector<Window> windows = WindowGenerator(6, 2, 2).generate(date(2023, 1, 1), date(2024, 1, 1));

  REQUIRE(windows.size() == 3);
  REQUIRE(windows.back().getTestEnd() == date(2024, 1, 1));
}

TEST_CASE("WindowGenerator: overlapping train periods when step is short", "[WindowGenerator]")
{
  std::vector<Window> windows = WindowGenerator(3, 1, 1).generate(date(2023, 1, 1), date(2023, 12, 1));

  REQUIRE(windows.size() == 8);
  REQUIRE(windows[1].getTrainStart() < windows[0].getTrainEnd());
  REQUIRE(windows[7].getTestEnd() == date(2023, 12, 1));
}

TEST_CASE("WindowGenerator: range too short yields no windows", "[WindowGenerator]")
{
  REQUIRE(WindowGenerator(6, 2, 2).generate(date(2023, 1, 1), date(2023, 8, 15)).empty());
  REQUIRE(WindowGenerator(6, 2, 2).generate(date(2023, 1, 1), date(2023, 1, 1)).empty());
}

TEST_CASE("WindowGenerator: boundaries come from the global start", "[WindowGenerator]")
{
  std::vector<Window> windows = WindowGenerator(1, 1, 1).generate(date(2023, 1, 31), date(2023, 6, 30));

  REQUIRE(windows.size() == 4);
  REQUIRE(windows[0].getTrainEnd() == date(2023, 2, 28));
  REQUIRE(windows[0].getTestEnd() == date(2023, 3, 31));
  REQUIRE(windows[1].getTrainStart() == date(2023, 2, 28));
  REQUIRE(windows[1].getTestEnd() == date(2023, 4, 30));
  for (const auto& window : windows)
    REQUIRE(window.getTestStart() == window.getTrainEnd());
}

TEST_CASE("WindowGenerator: day of month is kept rather than snapped to month end", "[WindowGenerator]")
{
  std::vector<Window> windows = WindowGenerator(1, 1, 1).generate(date(2023, 2, 28), date(2023, 6, 30));

  REQUIRE(windows.size() == 3);
  REQUIRE(windows[0].getTrainEnd() == date(2023, 3, 28));
  REQUIRE(windows[0].getTestEnd() == date(2023, 4, 28));
  REQUIRE(windows[1].getTrainStart() == date(2023, 3, 28));
  REQUIRE(windows[2].getTestEnd() == date(2023, 6, 28));

  // The first test window ends exactly on the global end
  REQUIRE(WindowGenerator(1, 1, 1).generate(date(2023, 2, 28), date(2023, 4, 28)).size() == 1);

  REQUIRE(addMonths(date(2024, 1, 31), 1) == date(2024, 2, 29));
  REQUIRE(addMonths(date(2023, 11, 30), 3) == date(2024, 2, 29));
  REQUIRE(addMonths(date(2023, 5, 15), 12) == date(2024, 5, 15));
}

TEST_CASE("WindowGenerator: invalid arguments", "[WindowGenerator]")
{
  REQUIRE_THROWS_AS(WindowGenerator(0, 2, 2), WalkForwardConfigurationException);
  REQUIRE_THROWS_AS(WindowGenerator(6, -1, 2), WalkForwardConfigurationException);
  REQUIRE_THROWS_AS(WindowGenerator(6, 2, 0), WalkForwardConfigurationException);
  REQUIRE_THROWS_AS(WindowGenerator(6, 2, 2).generate(date(2023, 12, 1), date(2023, 1, 1)),
		    WalkForwardConfigurationException);

  WalkForwardConfig config;
  config.recommendationThreshold = 120.0;
  REQUIRE_THROWS_AS(validate(config), WalkForwardConfigurationException);
}

TEST_CASE("Window: state machine", "[Window]")
{
  Window window(0, date(2023, 1, 1), date(2023, 7, 1), date(2023, 7, 1), date(2023, 9, 1));

  REQUIRE_FALSE(window.isOptimized());
  REQUIRE_THROWS_AS(window.markValidated(std::nullopt), std::logic_error);

  window.markOptimized(ParameterSet{{"fast", ParameterValue(10)}}, std::nullopt);
  REQUIRE(window.isOptimized());
  REQUIRE_FALSE(window.isValidated());
  REQUIRE_THROWS_AS(window.markOptimized(ParameterSet(), std::nullopt), std::logic_error);

  window.markValidated(std::nullopt, "exchange unavailable");
  REQUIRE(window.isValidated());
  REQUIRE(window.getError() == "exchange unavailable");
  REQUIRE(window.getState() == WindowState::Validated);
  REQUIRE(toString(window.getState()) == "validated");
  REQUIRE(window.getTestRange() == DateRange(date(2023, 7, 1), date(2023, 9, 1)));
}
