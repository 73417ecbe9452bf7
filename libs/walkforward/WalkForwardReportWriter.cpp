// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "WalkForwardReportWriter.h"
#include <iomanip>
#include <optional>
#include <sstream>
#include <boost/filesystem/fstream.hpp>
#include "ExperimentException.h"
#include "ExperimentJson.h"
#include "ExperimentSerializer.h"

using namespace rapidjson;

namespace stratlab
{
  namespace walkforward
  {
    namespace
    {
      Value dateToJson(const boost::gregorian::date& d, Document::AllocatorType& a)
      {
	return stringToJson(boost::gregorian::to_iso_extended_string(d), a);
      }

      Value componentToJson(const ScoreComponent& component, Document::AllocatorType& a)
      {
	Value obj(kObjectType);
	obj.AddMember("status", stringToJson(stratlab::toString(component.status), a), a);
	obj.AddMember("score", numberToJson(component.score), a);
	obj.AddMember("max_score", numberToJson(component.maxScore), a);
	obj.AddMember("value", numberToJson(component.value), a);
	return obj;
      }

      Value optionalMetricsToJson(const std::optional<BacktestMetrics>& metrics, Document::AllocatorType& a)
      {
	if (!metrics)
	  return Value(kNullType);
	return ExperimentSerializer::serializeMetrics(*metrics, a);
      }

      std::string formatPeriod(const boost::gregorian::date& start, const boost::gregorian::date& end)
      {
	return boost::gregorian::to_iso_extended_string(start) + "~" + boost::gregorian::to_iso_extended_string(end);
      }
    }

    Value WalkForwardReportWriter::toJson(const WalkForwardResult& result, Document::AllocatorType& a) const
    {
      Value obj(kObjectType);
      obj.AddMember("version", StringRef(kReportVersion), a);
      obj.AddMember("experiment", stringToJson(result.getExperimentName(), a), a);
      obj.AddMember("strategy", stringToJson(result.getStrategyId(), a), a);
      obj.AddMember("symbols", stringListToJson(result.getSymbols(), a), a);
      obj.AddMember("timeframe", stringToJson(result.getTimeframe(), a), a);
      obj.AddMember("metric", stringToJson(result.getMetric(), a), a);
      obj.AddMember("maximize", result.isMaximizing(), a);

      const WalkForwardConfig& config = result.getConfig();
      Value cfg(kObjectType);
      cfg.AddMember("train_months", config.trainMonths, a);
      cfg.AddMember("test_months", config.testMonths, a);
      cfg.AddMember("step_months", config.stepMonths, a);
      cfg.AddMember("min_trades", static_cast<uint64_t>(config.minTrades), a);
      cfg.AddMember("recommendation_threshold", numberToJson(config.recommendationThreshold), a);
      obj.AddMember("config", cfg, a);

      Value timing(kObjectType);
      timing.AddMember("train_seconds", numberToJson(result.getTrainSeconds()), a);
      timing.AddMember("test_seconds", numberToJson(result.getTestSeconds()), a);
      obj.AddMember("timing", timing, a);

      Value windows(kArrayType);
      for (const auto& window : result.getWindows())
	{
	  Value w(kObjectType);
	  w.AddMember("index", static_cast<uint64_t>(window.getIndex()), a);
	  w.AddMember("train_start", dateToJson(window.getTrainStart(), a), a);
	  w.AddMember("train_end", dateToJson(window.getTrainEnd(), a), a);
	  w.AddMember("test_start", dateToJson(window.getTestStart(), a), a);
	  w.AddMember("test_end", dateToJson(window.getTestEnd(), a), a);
	  w.AddMember("state", stringToJson(walkforward::toString(window.getState()), a), a);
	  w.AddMember("best_parameters", parameterSetToJson(window.getBestParameters(), a), a);
	  w.AddMember("train_metrics", optionalMetricsToJson(window.getTrainMetrics(), a), a);
	  w.AddMember("test_metrics", optionalMetricsToJson(window.getTestMetrics(), a), a);
	  if (window.getError().empty())
	    w.AddMember("error", Value(kNullType), a);
	  else
	    w.AddMember("error", stringToJson(window.getError(), a), a);
	  windows.PushBack(w, a);
	}
      obj.AddMember("windows", windows, a);

      const OutOfSampleSummary oos = result.getOutOfSampleSummary();
      Value summary(kObjectType);
      summary.AddMember("status", stringToJson(stratlab::toString(oos.status), a), a);
      summary.AddMember("windows", static_cast<uint64_t>(oos.windows), a);
      summary.AddMember("mean", numberToJson(oos.mean), a);
      summary.AddMember("std", numberToJson(oos.stdDev), a);
      summary.AddMember("max", numberToJson(oos.max), a);
      summary.AddMember("min", numberToJson(oos.min), a);
      summary.AddMember("positive_windows", static_cast<uint64_t>(oos.positiveWindows), a);
      obj.AddMember("oos_summary", summary, a);

      Value stability(kObjectType);
      for (const auto& entry : result.getParameterStability())
	{
	  Value s(kObjectType);
	  Value values(kArrayType);
	  for (double v : entry.second.values)
	    values.PushBack(numberToJson(v), a);
	  s.AddMember("values", values, a);
	  s.AddMember("mean", numberToJson(entry.second.mean), a);
	  s.AddMember("std", numberToJson(entry.second.stdDev), a);
	  s.AddMember("cv", numberToJson(entry.second.cv), a);
	  stability.AddMember(stringToJson(entry.first, a), s, a);
	}
      obj.AddMember("stability", stability, a);

      obj.AddMember("recommended_parameters", parameterSetToJson(result.getRobustParameters(), a), a);

      const RobustnessScore score = result.getRobustnessScore();
      Value robustness(kObjectType);
      robustness.AddMember("status", stringToJson(stratlab::toString(score.status), a), a);
      robustness.AddMember("score", numberToJson(score.total), a);
      robustness.AddMember("threshold", numberToJson(config.recommendationThreshold), a);
      robustness.AddMember("recommended", result.isRecommended(), a);
      Value components(kObjectType);
      components.AddMember("consistency", componentToJson(score.consistency, a), a);
      components.AddMember("decay", componentToJson(score.decay, a), a);
      components.AddMember("stability", componentToJson(score.stability, a), a);
      robustness.AddMember("components", components, a);
      obj.AddMember("robustness", robustness, a);

      return obj;
    }

    std::string WalkForwardReportWriter::toString(const WalkForwardResult& result, bool pretty) const
    {
      Document doc;
      Value report = toJson(result, doc.GetAllocator());
      return jsonToString(report, pretty);
    }

    void WalkForwardReportWriter::writeFile(const WalkForwardResult& result,
					    const boost::filesystem::path& path) const
    {
      if (path.has_parent_path())
	{
	  boost::system::error_code ec;
	  boost::filesystem::create_directories(path.parent_path(), ec);
	  if (ec)
	    throw PersistenceException("cannot create " + path.parent_path().string() + ": " + ec.message());
	}

      boost::filesystem::ofstream out(path, std::ios::out | std::ios::trunc);
      if (!out)
	throw PersistenceException("cannot open " + path.string() + " for writing");

      out << toString(result, true) << '\n';
      if (!out)
	throw PersistenceException("failed writing " + path.string());
    }

    void WalkForwardReportWriter::writeSummary(const WalkForwardResult& result, std::ostream& os) const
    {
      const std::string metric = result.getMetric();
      os << "[WF] " << result.getExperimentName() << " (" << result.getStrategyId() << ", "
	 << result.getSymbols().size() << " symbols, " << result.getTimeframe() << "): "
	 << result.getWindows().size() << " windows, optimizing " << metric << std::endl;

      std::ostringstream line;
      line << std::fixed << std::setprecision(4);
      for (const auto& window : result.getWindows())
	{
	  line.str("");
	  line << "[WF]   " << std::setw(3) << window.getIndex() << "  "
	       << formatPeriod(window.getTrainStart(), window.getTrainEnd()) << "  "
	       << formatPeriod(window.getTestStart(), window.getTestEnd()) << "  IS ";

	  std::optional<double> is = window.getTrainMetrics() ? window.getTrainMetrics()->getMetric(metric) : std::nullopt;
	  std::optional<double> oos = window.getTestMetrics() ? window.getTestMetrics()->getMetric(metric) : std::nullopt;
	  if (is)
	    line << *is;
	  else
	    line << "n/a";
	  line << "  OOS ";
	  if (oos)
	    line << *oos;
	  else
	    line << (window.getError().empty() ? "n/a" : "error");
	  os << line.str() << std::endl;
	}

      const OutOfSampleSummary oos = result.getOutOfSampleSummary();
      if (oos.status == StatisticStatus::Success)
	{
	  line.str("");
	  line << "[WF] OOS mean " << oos.mean << ", std " << oos.stdDev << ", max " << oos.max
	       << ", min " << oos.min << ", positive " << oos.positiveWindows << "/" << oos.windows;
	  os << line.str() << std::endl;
	}

      const ParameterSet robust = result.getRobustParameters();
      if (!robust.empty())
	os << "[WF] recommended parameters " << stratlab::toString(robust) << std::endl;

      const RobustnessScore score = result.getRobustnessScore();
      line.str("");
      line << std::setprecision(0) << "[WF] robustness score " << score.total << "/100";
      if (score.status != StatisticStatus::Success)
	line << " (insufficient data)";
      line << ", " << (result.isRecommended() ? "recommended" : "not recommended")
	   << " (threshold " << result.getConfig().recommendationThreshold << ")";
      os << line.str() << std::endl;
    }
  }
}
