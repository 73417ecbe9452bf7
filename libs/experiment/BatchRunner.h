// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_BATCH_RUNNER_H
#define __STRATLAB_BATCH_RUNNER_H 1

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "IParallelExecutor.h"
#include "BacktestMetrics.h"
#include "DateRange.h"
#include "ExperimentConfiguration.h"
#include "ExperimentResult.h"
#include "ParameterExpander.h"
#include "RunLogWriter.h"
#include "RunRecord.h"

namespace stratlab
{
  /**
   * Arguments of one backtest call. The configuration reference is valid
   * only for the duration of the call.
   */
  struct BacktestRequest
  {
    const ExperimentConfiguration& configuration;
    std::string symbol;
    std::string timeframe;
    ParameterSet parameters;
    std::optional<DateRange> dateRange;
  };

  /**
   * The backtest collaborator. Must be callable concurrently. Any exception
   * it throws is a failure of that task (BacktestException is available for
   * failures the collaborator wants to name).
   */
  using BacktestFunction = std::function<BacktestMetrics(const BacktestRequest&)>;

  struct BatchRunnerOptions
  {
    std::size_t maxWorkers = 4;       // worker pool size, the only concurrency knob
    bool retryEnabled = true;
    unsigned int maxRetries = 2;      // extra attempts after the first
    std::chrono::milliseconds retryDelay{500};  // attempt k waits k * retryDelay
    bool failFast = false;            // stop dispatching after the first failure
    std::size_t flushInterval = 10;   // records per run log append
    bool retainRecords = true;        // keep flushed records in the result
    bool maximize = true;             // direction for the tracked best run
  };

  /**
   * Optional progress hooks. Every hook has a no-op default, so observers
   * override only what they need. Hooks run on the thread that called
   * BatchRunner::run().
   */
  class BatchObserver
  {
  public:
    virtual ~BatchObserver() = default;

    virtual void onRunFinished(const RunRecord& run,
			       std::size_t finished,
			       std::size_t total,
			       std::size_t failed)
    {
      (void) run; (void) finished; (void) total; (void) failed;
    }

    virtual void onFlush(std::size_t recordsWritten)
    {
      (void) recordsWritten;
    }
  };

  class NullBatchObserver : public BatchObserver
  {
  };

  /**
   * @brief Executes experiment tasks against a backtest function.
   *
   * Tasks are dispatched to a worker pool with at most maxWorkers in flight.
   * Workers push finished RunRecords onto a completion queue; the calling
   * thread is the single consumer that owns the ExperimentResult, the flush
   * buffer and the log stream, so results appear in completion order.
   *
   * A failing task is retried per the options and then recorded as failed;
   * it never aborts the batch unless failFast is set, in which case no
   * further tasks are dispatched and tasks already dispatched finish
   * normally. Task errors never escape run(); configuration and run log
   * I/O errors do, as do exceptions thrown by an observer. Such an error
   * stops dispatching and is rethrown once every dispatched task has
   * finished, so no worker outlives the call.
   *
   * Run ids are "<experiment-id>_run_<6 digit sequence>", the sequence
   * continuing across calls on the same runner, so re-running a task
   * produces a new record.
   */
  class BatchRunner
  {
  public:
    explicit BatchRunner(BacktestFunction backtest,
			 const BatchRunnerOptions& options = BatchRunnerOptions());

    BatchRunner(const BatchRunner&) = delete;
    BatchRunner& operator=(const BatchRunner&) = delete;

    const BatchRunnerOptions& getOptions() const
    {
      return mOptions;
    }

    // Use this executor instead of a pool of maxWorkers threads per run
    void setExecutor(std::shared_ptr<concurrency::IParallelExecutor> executor);

    // Completed records are appended here every flushInterval records; not owned
    void setRunLog(RunLogWriter* runLog);

    // Not owned; nullptr restores the no-op observer
    void setObserver(BatchObserver* observer);

    // Expands the configuration and runs every task
    ExperimentResult run(const ExperimentConfiguration& configuration, std::ostream& os);

    ExperimentResult run(const ExperimentConfiguration& configuration,
			 const std::vector<ExperimentTask>& tasks,
			 std::ostream& os);

    // Backtest calls started so far, retries excluded
    std::size_t getDispatchedCount() const
    {
      return mDispatched.load();
    }

  private:
    void executeTask(const ExperimentConfiguration& configuration,
		     const ExperimentTask& task,
		     RunRecord& record) const;

    std::string nextRunId(const std::string& experimentId);

    void flush(std::vector<RunRecord>& buffer, std::ostream& os);

  private:
    BacktestFunction mBacktest;
    BatchRunnerOptions mOptions;
    std::shared_ptr<concurrency::IParallelExecutor> mExecutor;
    RunLogWriter* mRunLog;
    NullBatchObserver mNullObserver;
    BatchObserver* mObserver;
    std::size_t mNextSequence;
    std::atomic<std::size_t> mDispatched;
    std::atomic<bool> mStopRequested;
  };

  // "<type>: <what>" for a caught exception
  std::string describeException(const std::exception& e);
}

#endif
