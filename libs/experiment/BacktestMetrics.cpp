// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "BacktestMetrics.h"
#include <algorithm>
#include <stdexcept>

namespace stratlab
{
  const std::vector<std::string>& BacktestMetrics::coreMetricNames()
  {
    static const std::vector<std::string> names = {
      kTotalReturn, kMaxDrawdown, kSharpeRatio, kNumTrades, kWinRate, kProfitFactor
    };
    return names;
  }

  bool BacktestMetrics::isCoreMetric(const std::string& name)
  {
    const auto& names = coreMetricNames();
    return std::find(names.begin(), names.end(), name) != names.end();
  }

  void BacktestMetrics::setExtension(const std::string& name, double value)
  {
    if (name.empty())
      throw std::invalid_argument("BacktestMetrics::setExtension - metric name cannot be empty");

    if (isCoreMetric(name))
      throw std::invalid_argument("BacktestMetrics::setExtension - " + name + " is a core metric");

    mExtensions[name] = value;
  }

  std::optional<double> BacktestMetrics::getMetric(const std::string& name) const
  {
    if (name == kTotalReturn)
      return mTotalReturn;
    if (name == kMaxDrawdown)
      return mMaxDrawdown;
    if (name == kSharpeRatio)
      return mSharpeRatio;
    if (name == kNumTrades)
      return static_cast<double>(mNumTrades);
    if (name == kWinRate)
      return mWinRate;
    if (name == kProfitFactor)
      return mProfitFactor;

    auto it = mExtensions.find(name);
    if (it == mExtensions.end())
      return std::nullopt;

    return it->second;
  }

  bool operator==(const BacktestMetrics& lhs, const BacktestMetrics& rhs)
  {
    return lhs.getTotalReturn() == rhs.getTotalReturn()
      && lhs.getMaxDrawdown() == rhs.getMaxDrawdown()
      && lhs.getSharpeRatio() == rhs.getSharpeRatio()
      && lhs.getNumTrades() == rhs.getNumTrades()
      && lhs.getWinRate() == rhs.getWinRate()
      && lhs.getProfitFactor() == rhs.getProfitFactor()
      && lhs.getExtensions() == rhs.getExtensions();
  }
}
