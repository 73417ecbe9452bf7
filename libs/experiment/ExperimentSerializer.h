#pragma once

#include <string>
#include <rapidjson/document.h>
#include "BacktestMetrics.h"
#include "ExperimentResult.h"
#include "RunRecord.h"

namespace stratlab {

/**
 * @brief Converts run records and experiment results to and from JSON
 *
 * Used for the append-only run log (one compact record per line) and for
 * the experiment summary document. Reading malformed or inconsistent data
 * throws PersistenceException.
 */
class ExperimentSerializer {
public:
    static constexpr const char* kSummaryVersion = "1.0";

    static rapidjson::Value serializeMetrics(const BacktestMetrics& metrics,
                                             rapidjson::Document::AllocatorType& allocator);
    static BacktestMetrics deserializeMetrics(const rapidjson::Value& json);

    static rapidjson::Value serializeRunRecord(const RunRecord& run,
                                               rapidjson::Document::AllocatorType& allocator);
    static RunRecord deserializeRunRecord(const rapidjson::Value& json);

    // Single-line JSON, no trailing newline
    static std::string runRecordToLine(const RunRecord& run);
    static RunRecord runRecordFromLine(const std::string& line);

    static std::string exportSummary(const ExperimentResult& result);
    static ExperimentResult importSummary(const std::string& jsonStr);
};

} // namespace stratlab
