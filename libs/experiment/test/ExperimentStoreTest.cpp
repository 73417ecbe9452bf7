#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <limits>
#include <sstream>
#include <boost/filesystem/fstream.hpp>
#include "BatchRunner.h"
#include "ExperimentException.h"
#include "ExperimentLog.h"
#include "ExperimentSerializer.h"
#include "ExperimentStore.h"
#include "TimeUtils.h"
#include "ExperimentTestUtils.h"

using namespace stratlab;
using namespace stratlab::test;
using Catch::Approx;

namespace
{
  ExperimentResult runSample(const ExperimentConfiguration& config, bool retain, RunLogWriter* runLog = nullptr)
  {
    BatchRunnerOptions options = fastOptions(2);
    options.retainRecords = retain;
    options.flushInterval = 3;

    BatchRunner runner([](const BacktestRequest& request) {
	if (request.parameters.at("x").asInteger() == 2)
	  throw BacktestException("no fills");
	return deterministicMetrics(request);
      }, options);
    runner.setRunLog(runLog);

    std::ostringstream log;
    return runner.run(config, log);
  }

  std::string readFile(const boost::filesystem::path& path)
  {
    boost::filesystem::ifstream in(path);
    std::ostringstream os;
    os << in.rdbuf();
    return os.str();
  }
}

TEST_CASE("ExperimentSerializer: run record line round trip", "[ExperimentSerializer]")
{
  RunRecord run("exp_run_000001", "exp", "BTCUSDT", {{"fast", 5}, {"kind", "ema"}, {"w", 0.25}});
  run.markRunning(utils::nowUtc());
  run.recordAttempt();
  BacktestMetrics metrics(0.12, -0.05, 1.7, 9, 0.55, 1.9);
  metrics.setExtension("expectancy", 0.8);
  run.markCompleted(metrics, utils::nowUtc());

  const std::string line = ExperimentSerializer::runRecordToLine(run);
  REQUIRE(line.find('\n') == std::string::npos);

  RunRecord copy = ExperimentSerializer::runRecordFromLine(line);
  REQUIRE(copy.getRunId() == run.getRunId());
  REQUIRE(copy.getStatus() == RunStatus::Completed);
  REQUIRE(copy.getParameters() == run.getParameters());
  REQUIRE(*copy.getMetrics() == metrics);
  REQUIRE(copy.getStartedAt() == run.getStartedAt());
  REQUIRE(copy.getAttempts() == 1);
}

TEST_CASE("ExperimentSerializer: non-finite metrics are stored as null", "[ExperimentSerializer]")
{
  RunRecord run("r", "exp", "BTCUSDT", {});
  run.markRunning(utils::nowUtc());
  run.markCompleted(BacktestMetrics(0.1, 0.0, std::numeric_limits<double>::quiet_NaN(), 0, 0.0, 0.0),
		    utils::nowUtc());

  const std::string line = ExperimentSerializer::runRecordToLine(run);
  REQUIRE(line.find("\"sharpe_ratio\":null") != std::string::npos);

  RunRecord copy = ExperimentSerializer::runRecordFromLine(line);
  REQUIRE(std::isnan(copy.getMetrics()->getSharpeRatio()));
}

TEST_CASE("ExperimentSerializer: malformed records are persistence errors", "[ExperimentSerializer]")
{
  REQUIRE_THROWS_AS(ExperimentSerializer::runRecordFromLine("{oops"), PersistenceException);
  REQUIRE_THROWS_AS(ExperimentSerializer::runRecordFromLine(R"({"run_id": "r", "experiment_id": "e",
      "symbol": "S", "status": "completed"})"), PersistenceException);
  REQUIRE_THROWS_AS(ExperimentSerializer::runRecordFromLine(R"({"run_id": "r", "experiment_id": "e",
      "symbol": "S", "status": "exploded"})"), PersistenceException);
}

TEST_CASE("ExperimentStore: summary round trip", "[ExperimentStore]")
{
  TempDirectory dir;
  ExperimentStore store(dir.path() / "experiments");
  ExperimentConfiguration config =
    makeConfiguration({ ParameterRange::fromValues("x", {1, 2, 3, 4}) }).withDescription("store test");

  ExperimentResult result = runSample(config, true);
  const boost::filesystem::path summaryPath = store.saveSummary(result);

  REQUIRE(boost::filesystem::exists(summaryPath));
  REQUIRE(boost::filesystem::exists(store.getExperimentDirectory(config.getExperimentId()) / "config.json"));

  ExperimentResult loaded = store.loadSummary(config.getExperimentId());
  REQUIRE(loaded.getExperimentId() == config.getExperimentId());
  REQUIRE(loaded.getConfiguration().getDescription() == "store test");
  REQUIRE(loaded.getTotalRuns() == 4);
  REQUIRE(loaded.getCompletedRuns() == 3);
  REQUIRE(loaded.getFailedRuns() == 1);
  REQUIRE(loaded.getRuns().size() == 4);
  REQUIRE(loaded.getBestRun()->getRunId() == result.getBestRun()->getRunId());
  REQUIRE(loaded.getStatistics().avgReturn == Approx(result.getStatistics().avgReturn));

  REQUIRE(store.listExperiments() == std::vector<std::string>{config.getExperimentId()});
}

TEST_CASE("ExperimentStore: summary keeps totals when records were dropped", "[ExperimentStore]")
{
  TempDirectory dir;
  ExperimentStore store(dir.path());
  ExperimentConfiguration config = makeConfiguration({ ParameterRange::fromValues("x", {1, 2, 3, 4, 5}) });

  std::unique_ptr<RunLogWriter> runLog = store.openRunLog(config.getExperimentId());
  ExperimentResult result = runSample(config, false, runLog.get());
  store.saveSummary(result);

  ExperimentResult loaded = store.loadSummary(config.getExperimentId());
  REQUIRE(loaded.getRuns().empty());
  REQUIRE(loaded.getCompletedRuns() == 4);
  REQUIRE(loaded.getFailedRuns() == 1);
  REQUIRE(loaded.getBestRun()->getParameters().at("x").asInteger() == 5);

  std::vector<RunRecord> logged = store.loadRunLog(config.getExperimentId());
  REQUIRE(logged.size() == 5);

  std::size_t failed = 0;
  for (const auto& run : logged)
    if (run.isFailed())
      {
	++failed;
	REQUIRE(run.getError().find("no fills") != std::string::npos);
      }
  REQUIRE(failed == 1);
}

TEST_CASE("ExperimentStore: missing summary is a persistence error", "[ExperimentStore]")
{
  TempDirectory dir;
  ExperimentStore store(dir.path());

  REQUIRE_THROWS_AS(store.loadSummary("nothing_here"), PersistenceException);
  REQUIRE(store.listExperiments().empty());
}

TEST_CASE("ExperimentLog: tee writes console and log file", "[ExperimentLog]")
{
  TempDirectory dir;
  std::ostringstream console;
  {
    std::unique_ptr<utils::ExperimentLog> log = utils::ExperimentLog::openTee(dir.path() / "exp", console);
    log->stream() << "[RUNNER] hello" << std::endl;
  }

  REQUIRE(console.str() == "[RUNNER] hello\n");
  REQUIRE(readFile(dir.path() / "exp" / "experiment.log") == "[RUNNER] hello\n");
}
