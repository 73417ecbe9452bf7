#include "ExperimentSerializer.h"
#include "ExperimentConfigurationReader.h"
#include "ExperimentConfigurationWriter.h"
#include "ExperimentException.h"
#include "ExperimentJson.h"
#include "TimeUtils.h"

using namespace rapidjson;

namespace stratlab {

using json_access::Origin;

namespace {

const Value& requireMember(const Value& obj, const char* key, const std::string& context) {
    const Value* v = json_access::findMember(obj, key);
    if (!v) {
        throw PersistenceException(context + ": missing field '" + key + "'");
    }
    return *v;
}

std::size_t requireCount(const Value& obj, const char* key, const std::string& context) {
    auto value = json_access::optionalUnsigned(obj, key, Origin::Persistence);
    if (!value) {
        throw PersistenceException(context + ": missing field '" + key + "'");
    }
    return static_cast<std::size_t>(*value);
}

boost::posix_time::ptime readTimestamp(const Value& obj, const char* key) {
    auto text = json_access::optionalString(obj, key, Origin::Persistence);
    if (!text) {
        return boost::posix_time::ptime(boost::posix_time::not_a_date_time);
    }

    try {
        return utils::parseIsoTimestamp(*text);
    } catch (const std::invalid_argument& e) {
        throw PersistenceException(e.what());
    }
}

} // namespace

Value ExperimentSerializer::serializeMetrics(const BacktestMetrics& metrics,
                                             Document::AllocatorType& allocator) {
    Value obj(kObjectType);
    obj.AddMember(StringRef(BacktestMetrics::kTotalReturn), numberToJson(metrics.getTotalReturn()), allocator);
    obj.AddMember(StringRef(BacktestMetrics::kMaxDrawdown), numberToJson(metrics.getMaxDrawdown()), allocator);
    obj.AddMember(StringRef(BacktestMetrics::kSharpeRatio), numberToJson(metrics.getSharpeRatio()), allocator);
    obj.AddMember(StringRef(BacktestMetrics::kNumTrades), static_cast<uint64_t>(metrics.getNumTrades()), allocator);
    obj.AddMember(StringRef(BacktestMetrics::kWinRate), numberToJson(metrics.getWinRate()), allocator);
    obj.AddMember(StringRef(BacktestMetrics::kProfitFactor), numberToJson(metrics.getProfitFactor()), allocator);

    Value extra(kObjectType);
    for (const auto& entry : metrics.getExtensions()) {
        extra.AddMember(stringToJson(entry.first, allocator), numberToJson(entry.second), allocator);
    }
    obj.AddMember("extra", extra, allocator);
    return obj;
}

BacktestMetrics ExperimentSerializer::deserializeMetrics(const Value& json) {
    const std::string context = "metrics";
    if (!json.IsObject()) {
        throw PersistenceException(context + " must be an object");
    }

    BacktestMetrics metrics(
        numberFromJson(requireMember(json, BacktestMetrics::kTotalReturn, context), BacktestMetrics::kTotalReturn),
        numberFromJson(requireMember(json, BacktestMetrics::kMaxDrawdown, context), BacktestMetrics::kMaxDrawdown),
        numberFromJson(requireMember(json, BacktestMetrics::kSharpeRatio, context), BacktestMetrics::kSharpeRatio),
        static_cast<unsigned long>(requireCount(json, BacktestMetrics::kNumTrades, context)),
        numberFromJson(requireMember(json, BacktestMetrics::kWinRate, context), BacktestMetrics::kWinRate),
        numberFromJson(requireMember(json, BacktestMetrics::kProfitFactor, context), BacktestMetrics::kProfitFactor));

    if (const Value* extra = json_access::findMember(json, "extra")) {
        if (!extra->IsObject()) {
            throw PersistenceException("metrics.extra must be an object");
        }
        for (Value::ConstMemberIterator it = extra->MemberBegin(); it != extra->MemberEnd(); ++it) {
            std::string name(it->name.GetString(), it->name.GetStringLength());
            try {
                metrics.setExtension(name, numberFromJson(it->value, "metrics.extra." + name));
            } catch (const std::invalid_argument& e) {
                throw PersistenceException(e.what());
            }
        }
    }
    return metrics;
}

Value ExperimentSerializer::serializeRunRecord(const RunRecord& run, Document::AllocatorType& allocator) {
    Value obj(kObjectType);
    obj.AddMember("run_id", stringToJson(run.getRunId(), allocator), allocator);
    obj.AddMember("experiment_id", stringToJson(run.getExperimentId(), allocator), allocator);
    obj.AddMember("symbol", stringToJson(run.getSymbol(), allocator), allocator);
    obj.AddMember("parameters", parameterSetToJson(run.getParameters(), allocator), allocator);
    obj.AddMember("status", stringToJson(toString(run.getStatus()), allocator), allocator);
    obj.AddMember("started_at", stringToJson(utils::toIsoTimestamp(run.getStartedAt()), allocator), allocator);
    obj.AddMember("completed_at", stringToJson(utils::toIsoTimestamp(run.getCompletedAt()), allocator), allocator);
    obj.AddMember("duration_seconds", run.getDurationSeconds(), allocator);
    obj.AddMember("attempts", run.getAttempts(), allocator);

    if (run.getMetrics()) {
        obj.AddMember("metrics", serializeMetrics(*run.getMetrics(), allocator), allocator);
    } else {
        obj.AddMember("metrics", Value(kNullType), allocator);
    }

    if (run.isFailed()) {
        obj.AddMember("error", stringToJson(run.getError(), allocator), allocator);
    } else {
        obj.AddMember("error", Value(kNullType), allocator);
    }
    return obj;
}

RunRecord ExperimentSerializer::deserializeRunRecord(const Value& json) {
    if (!json.IsObject()) {
        throw PersistenceException("run record must be an object");
    }

    const std::string runId = json_access::requireString(json, "run_id", Origin::Persistence);
    const std::string context = "run " + runId;

    try {
        std::optional<BacktestMetrics> metrics;
        if (const Value* m = json_access::findMember(json, "metrics")) {
            metrics = deserializeMetrics(*m);
        }

        ParameterSet parameters;
        if (const Value* p = json_access::findMember(json, "parameters")) {
            parameters = parameterSetFromJson(*p, context + " parameters");
        }

        auto attempts = json_access::optionalUnsigned(json, "attempts", Origin::Persistence);

        return RunRecord::restore(runId,
                                  json_access::requireString(json, "experiment_id", Origin::Persistence),
                                  json_access::requireString(json, "symbol", Origin::Persistence),
                                  parameters,
                                  runStatusFromString(json_access::requireString(json, "status", Origin::Persistence)),
                                  readTimestamp(json, "started_at"),
                                  readTimestamp(json, "completed_at"),
                                  metrics,
                                  attempts ? static_cast<unsigned int>(*attempts) : 0u,
                                  json_access::optionalString(json, "error", Origin::Persistence).value_or(""));
    } catch (const ExperimentConfigurationException& e) {
        throw PersistenceException(context + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw PersistenceException(context + ": " + e.what());
    }
}

std::string ExperimentSerializer::runRecordToLine(const RunRecord& run) {
    Document doc;
    Value json = serializeRunRecord(run, doc.GetAllocator());
    return jsonToString(json, false);
}

RunRecord ExperimentSerializer::runRecordFromLine(const std::string& line) {
    Document doc;
    doc.Parse(line.c_str(), line.size());
    if (doc.HasParseError()) {
        throw PersistenceException("malformed run log line: " + line);
    }
    return deserializeRunRecord(doc);
}

std::string ExperimentSerializer::exportSummary(const ExperimentResult& result) {
    Document doc;
    doc.SetObject();
    Document::AllocatorType& allocator = doc.GetAllocator();

    doc.AddMember("version", StringRef(kSummaryVersion), allocator);
    doc.AddMember("experiment_id", stringToJson(result.getExperimentId(), allocator), allocator);
    doc.AddMember("config", ExperimentConfigurationWriter().toJson(result.getConfiguration(), allocator), allocator);

    doc.AddMember("total_runs", static_cast<uint64_t>(result.getTotalRuns()), allocator);
    doc.AddMember("completed_runs", static_cast<uint64_t>(result.getCompletedRuns()), allocator);
    doc.AddMember("failed_runs", static_cast<uint64_t>(result.getFailedRuns()), allocator);
    doc.AddMember("metric", stringToJson(result.getTrackedMetric(), allocator), allocator);
    doc.AddMember("maximize", result.isMaximizing(), allocator);
    doc.AddMember("started_at", stringToJson(utils::toIsoTimestamp(result.getStartedAt()), allocator), allocator);
    doc.AddMember("finished_at", stringToJson(utils::toIsoTimestamp(result.getFinishedAt()), allocator), allocator);
    doc.AddMember("duration_seconds", result.getDurationSeconds(), allocator);

    const ExperimentStatistics stats = result.getStatistics();
    Value statistics(kObjectType);
    statistics.AddMember("status", stringToJson(toString(stats.status), allocator), allocator);
    if (stats.status == StatisticStatus::Success) {
        statistics.AddMember("completed_runs", static_cast<uint64_t>(stats.completedRuns), allocator);
        statistics.AddMember("avg_return", numberToJson(stats.avgReturn), allocator);
        statistics.AddMember("avg_drawdown", numberToJson(stats.avgDrawdown), allocator);
        statistics.AddMember("avg_sharpe", numberToJson(stats.avgSharpe), allocator);
        statistics.AddMember("best_return", numberToJson(stats.bestReturn), allocator);
        statistics.AddMember("worst_return", numberToJson(stats.worstReturn), allocator);
        statistics.AddMember("best_sharpe", numberToJson(stats.bestSharpe), allocator);
    }
    doc.AddMember("statistics", statistics, allocator);

    if (result.getBestRun()) {
        doc.AddMember("best_run_id", stringToJson(result.getBestRun()->getRunId(), allocator), allocator);
        doc.AddMember("best_run", serializeRunRecord(*result.getBestRun(), allocator), allocator);
    } else {
        doc.AddMember("best_run_id", Value(kNullType), allocator);
        doc.AddMember("best_run", Value(kNullType), allocator);
    }

    Value runs(kArrayType);
    for (const auto& run : result.getRuns()) {
        runs.PushBack(serializeRunRecord(run, allocator), allocator);
    }
    doc.AddMember("runs", runs, allocator);

    return jsonToString(doc, true);
}

ExperimentResult ExperimentSerializer::importSummary(const std::string& jsonStr) {
    Document doc;
    doc.Parse(jsonStr.c_str(), jsonStr.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        throw PersistenceException("experiment summary is not a valid JSON object");
    }

    const Value* configJson = json_access::findMember(doc, "config");
    if (!configJson) {
        throw PersistenceException("experiment summary has no configuration");
    }

    std::optional<ExperimentConfiguration> config;
    try {
        config = ExperimentConfigurationReader().fromJson(*configJson);
    } catch (const ExperimentConfigurationException& e) {
        throw PersistenceException(std::string("stored configuration is invalid: ") + e.what());
    }

    std::vector<RunRecord> runs;
    if (const Value* list = json_access::findMember(doc, "runs")) {
        if (!list->IsArray()) {
            throw PersistenceException("summary field 'runs' must be a list");
        }
        for (const auto& item : list->GetArray()) {
            runs.push_back(deserializeRunRecord(item));
        }
    }

    ExperimentResult result = ExperimentResult::restore(
        *config,
        runs,
        requireCount(doc, "total_runs", "summary"),
        requireCount(doc, "completed_runs", "summary"),
        requireCount(doc, "failed_runs", "summary"),
        readTimestamp(doc, "started_at"),
        readTimestamp(doc, "finished_at"),
        json_access::optionalBool(doc, "maximize", Origin::Persistence).value_or(true));

    // The best run may have been flushed out of the retained list
    if (const Value* best = json_access::findMember(doc, "best_run")) {
        result.offerBestRun(deserializeRunRecord(*best));
    }
    return result;
}

} // namespace stratlab
