#pragma once

#include <atomic>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include "BacktestMetrics.h"
#include "BatchRunner.h"
#include "ExperimentConfiguration.h"
#include "ParameterRange.h"

namespace stratlab
{
namespace test
{

// Removes the directory tree when it goes out of scope
class TempDirectory
{
public:
    TempDirectory()
        : mPath(boost::filesystem::temp_directory_path() /
                boost::filesystem::unique_path("stratlab-test-%%%%-%%%%-%%%%"))
    {
        boost::filesystem::create_directories(mPath);
    }

    ~TempDirectory()
    {
        boost::system::error_code ec;
        boost::filesystem::remove_all(mPath, ec);
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const boost::filesystem::path& path() const
    {
        return mPath;
    }

private:
    boost::filesystem::path mPath;
};

// Sharpe ratio grows with the sum of numeric parameters, so the best run is predictable
inline BacktestMetrics deterministicMetrics(const BacktestRequest& request)
{
    double sum = 0.0;
    for (const auto& entry : request.parameters)
    {
        if (entry.second.isNumeric())
            sum += entry.second.asDouble();
    }

    BacktestMetrics metrics(sum / 100.0, -0.1, sum / 10.0, 10, 0.5, 1.5);
    metrics.setExtension("expectancy", sum);
    return metrics;
}

inline BatchRunnerOptions fastOptions(std::size_t workers = 2)
{
    BatchRunnerOptions options;
    options.maxWorkers = workers;
    options.retryDelay = std::chrono::milliseconds(1);
    return options;
}

inline ExperimentConfiguration makeConfiguration(const std::vector<ParameterRange>& ranges,
                                                 const std::vector<std::string>& symbols = {"BTCUSDT"},
                                                 const ExpansionPolicy& policy = ExpansionPolicy())
{
    return ExperimentConfiguration("sma_cross", "dual_ma", symbols, "1h", ranges, policy);
}

} // namespace test
} // namespace stratlab
