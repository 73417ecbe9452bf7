// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_BACKTEST_METRICS_H
#define __STRATLAB_BACKTEST_METRICS_H 1

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stratlab
{
  /**
   * @brief Performance summary returned by the backtest collaborator.
   *
   * Six core metrics every backtest reports, plus an open map of extra
   * named metrics (expectancy, sortino, ...). getMetric() looks a name up
   * in both.
   */
  class BacktestMetrics
  {
  public:
    static constexpr const char* kTotalReturn = "total_return";
    static constexpr const char* kMaxDrawdown = "max_drawdown";
    static constexpr const char* kSharpeRatio = "sharpe_ratio";
    static constexpr const char* kNumTrades = "num_trades";
    static constexpr const char* kWinRate = "win_rate";
    static constexpr const char* kProfitFactor = "profit_factor";

    BacktestMetrics()
      : BacktestMetrics(0.0, 0.0, 0.0, 0, 0.0, 0.0)
    {}

    BacktestMetrics(double totalReturn,
		    double maxDrawdown,
		    double sharpeRatio,
		    unsigned long numTrades,
		    double winRate,
		    double profitFactor)
      : mTotalReturn(totalReturn),
	mMaxDrawdown(maxDrawdown),
	mSharpeRatio(sharpeRatio),
	mNumTrades(numTrades),
	mWinRate(winRate),
	mProfitFactor(profitFactor),
	mExtensions()
    {}

    double getTotalReturn() const { return mTotalReturn; }
    double getMaxDrawdown() const { return mMaxDrawdown; }
    double getSharpeRatio() const { return mSharpeRatio; }
    unsigned long getNumTrades() const { return mNumTrades; }
    double getWinRate() const { return mWinRate; }
    double getProfitFactor() const { return mProfitFactor; }

    const std::map<std::string, double>& getExtensions() const
    {
      return mExtensions;
    }

    // Core metric names cannot be used as extension names
    void setExtension(const std::string& name, double value);

    std::optional<double> getMetric(const std::string& name) const;

    static const std::vector<std::string>& coreMetricNames();
    static bool isCoreMetric(const std::string& name);

  private:
    double mTotalReturn;
    double mMaxDrawdown;
    double mSharpeRatio;
    unsigned long mNumTrades;
    double mWinRate;
    double mProfitFactor;
    std::map<std::string, double> mExtensions;
  };

  bool operator==(const BacktestMetrics& lhs, const BacktestMetrics& rhs);

  inline bool operator!=(const BacktestMetrics& lhs, const BacktestMetrics& rhs)
  {
    return !(lhs == rhs);
  }
}

#endif
