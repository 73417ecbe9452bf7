// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "WalkForwardOrchestrator.h"
#include <limits>
#include <map>
#include <optional>
#include <stdexcept>
#include "ExperimentResult.h"
#include "TimeUtils.h"
#include "WalkForwardException.h"
#include "WindowGenerator.h"

namespace stratlab
{
  namespace walkforward
  {
    BacktestMetrics averageMetrics(const std::vector<BacktestMetrics>& metrics)
    {
      if (metrics.empty())
	throw std::invalid_argument("averageMetrics: no metrics to average");

      const double n = static_cast<double>(metrics.size());
      double totalReturn = 0.0, maxDrawdown = 0.0, sharpe = 0.0, winRate = 0.0, profitFactor = 0.0;
      unsigned long trades = 0;
      std::map<std::string, std::pair<double, std::size_t>> extensions;

      for (const auto& m : metrics)
	{
	  totalReturn += m.getTotalReturn();
	  maxDrawdown += m.getMaxDrawdown();
	  sharpe += m.getSharpeRatio();
	  winRate += m.getWinRate();
	  profitFactor += m.getProfitFactor();
	  trades += m.getNumTrades();

	  for (const auto& entry : m.getExtensions())
	    {
	      auto& sum = extensions[entry.first];
	      sum.first += entry.second;
	      ++sum.second;
	    }
	}

      BacktestMetrics mean(totalReturn / n, maxDrawdown / n, sharpe / n, trades, winRate / n, profitFactor / n);
      for (const auto& entry : extensions)
	mean.setExtension(entry.first, entry.second.first / static_cast<double>(entry.second.second));
      return mean;
    }

    WalkForwardOrchestrator::WalkForwardOrchestrator(search::SearchStrategy& strategy,
						     BacktestFunction backtest,
						     const WalkForwardConfig& config)
      : mStrategy(strategy),
	mBacktest(std::move(backtest)),
	mConfig(config)
    {
      if (!mBacktest)
	throw WalkForwardConfigurationException("WalkForwardOrchestrator: backtest function is empty");

      validate(mConfig);
    }

    std::vector<Window>
    WalkForwardOrchestrator::generateWindows(const ExperimentConfiguration& configuration) const
    {
      if (!configuration.getDateRange())
	throw WalkForwardConfigurationException("WalkForwardOrchestrator: experiment "
						+ configuration.getName() + " has no start and end date");

      return WindowGenerator(mConfig).generate(*configuration.getDateRange());
    }

    void WalkForwardOrchestrator::optimizeWindow(Window& window,
						 const ExperimentConfiguration& configuration,
						 std::ostream& os)
    {
      if (window.isOptimized())
	throw std::logic_error("WalkForwardOrchestrator: window " + std::to_string(window.getIndex())
			       + " is already optimized");

      const std::string& metric = mStrategy.getConfig().metric;
      const bool maximize = mStrategy.getConfig().maximize;

      os << "[WF] window " << window.getIndex() << " train "
	 << boost::gregorian::to_iso_extended_string(window.getTrainStart()) << " to "
	 << boost::gregorian::to_iso_extended_string(window.getTrainEnd()) << std::endl;

      const ExperimentResult trainResult =
	mStrategy.optimize(configuration.withDateRange(window.getTrainRange()), mBacktest, os);

      std::map<ParameterSet, std::vector<BacktestMetrics>> byAssignment;
      for (const auto& run : trainResult.getRuns())
	{
	  if (run.isCompleted())
	    byAssignment[run.getParameters()].push_back(*run.getMetrics());
	}

      if (byAssignment.empty() && trainResult.getBestRun())
	byAssignment[trainResult.getBestRun()->getParameters()].push_back(*trainResult.getBestRun()->getMetrics());

      const ParameterSet* bestParameters = nullptr;
      std::optional<BacktestMetrics> bestMetrics;
      double bestValue = std::numeric_limits<double>::quiet_NaN();

      for (const auto& entry : byAssignment)
	{
	  const BacktestMetrics aggregate = averageMetrics(entry.second);
	  if (aggregate.getNumTrades() < mConfig.minTrades)
	    continue;

	  const std::optional<double> value = aggregate.getMetric(metric);
	  if (!value || !isBetterMetric(*value, bestValue, maximize))
	    continue;

	  bestValue = *value;
	  bestParameters = &entry.first;
	  bestMetrics = aggregate;
	}

      if (!bestParameters)
	{
	  os << "[WF] window " << window.getIndex() << ": no eligible train run" << std::endl;
	  window.markOptimized(ParameterSet(), std::nullopt);
	  return;
	}

      os << "[WF] window " << window.getIndex() << " best " << toString(*bestParameters)
	 << " " << metric << "=" << bestValue << std::endl;
      window.markOptimized(*bestParameters, bestMetrics);
    }

    void WalkForwardOrchestrator::validateWindow(Window& window,
						 const ExperimentConfiguration& configuration,
						 std::ostream& os) const
    {
      if (!window.isOptimized() || window.isValidated())
	throw std::logic_error("WalkForwardOrchestrator: window " + std::to_string(window.getIndex())
			       + " cannot be validated while " + toString(window.getState()));

      const DateRange testRange = window.getTestRange();
      const ExperimentConfiguration testConfiguration = configuration.withDateRange(testRange);

      std::vector<BacktestMetrics> perSymbol;
      std::string error;
      try
	{
	  for (const auto& symbol : testConfiguration.getSymbols())
	    {
	      const BacktestRequest request{testConfiguration,
					    symbol,
					    testConfiguration.getTimeframe(),
					    window.getBestParameters(),
					    testRange};
	      perSymbol.push_back(mBacktest(request));
	    }
	}
      catch (const std::exception& e)
	{
	  error = describeException(e);
	}
      catch (...)
	{
	  error = "unknown error";
	}

      if (!error.empty())
	{
	  os << "[WF] window " << window.getIndex() << " validation failed: " << error << std::endl;
	  window.markValidated(std::nullopt, error);
	  return;
	}

      const BacktestMetrics testMetrics = averageMetrics(perSymbol);
      const std::optional<double> value = testMetrics.getMetric(mStrategy.getConfig().metric);
      os << "[WF] window " << window.getIndex() << " test "
	 << boost::gregorian::to_iso_extended_string(window.getTestStart()) << " to "
	 << boost::gregorian::to_iso_extended_string(window.getTestEnd()) << " "
	 << mStrategy.getConfig().metric << "=" << (value ? *value : std::numeric_limits<double>::quiet_NaN())
	 << std::endl;
      window.markValidated(testMetrics);
    }

    WalkForwardResult WalkForwardOrchestrator::run(const ExperimentConfiguration& configuration,
						   std::ostream& os)
    {
      std::vector<Window> windows = generateWindows(configuration);
      const search::OptimizationConfig& searchConfig = mStrategy.getConfig();

      os << "[WF] " << configuration.getName() << ": " << windows.size() << " windows (train "
	 << mConfig.trainMonths << "m, test " << mConfig.testMonths << "m, step " << mConfig.stepMonths
	 << "m), " << mStrategy.name() << " search on " << searchConfig.metric << std::endl;

      double trainSeconds = 0.0;
      double testSeconds = 0.0;
      for (auto& window : windows)
	{
	  const boost::posix_time::ptime trainStarted = utils::nowUtc();
	  optimizeWindow(window, configuration, os);
	  const boost::posix_time::ptime testStarted = utils::nowUtc();
	  trainSeconds += utils::secondsBetween(trainStarted, testStarted);

	  validateWindow(window, configuration, os);
	  testSeconds += utils::secondsBetween(testStarted, utils::nowUtc());
	}

      WalkForwardResult result(windows,
			       mConfig,
			       configuration.getName(),
			       configuration.getStrategyId(),
			       configuration.getSymbols(),
			       configuration.getTimeframe(),
			       searchConfig.metric,
			       searchConfig.maximize);
      result.setTiming(trainSeconds, testSeconds);

      const RobustnessScore score = result.getRobustnessScore();
      os << "[WF] robustness " << score.total << "/100 (" << stratlab::toString(score.status) << "), "
	 << (result.isRecommended() ? "recommended" : "not recommended") << std::endl;
      return result;
    }
  }
}
