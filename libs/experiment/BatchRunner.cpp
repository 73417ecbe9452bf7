// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#include "BatchRunner.h"
#include <exception>
#include <future>
#include <iomanip>
#include <map>
#include <sstream>
#include <thread>
#include <typeinfo>
#include <boost/core/demangle.hpp>
#include "CompletionQueue.h"
#include "ExperimentException.h"
#include "ParallelExecutors.h"
#include "TimeUtils.h"

namespace stratlab
{
  std::string describeException(const std::exception& e)
  {
    std::string what(e.what());
    std::string type = boost::core::demangle(typeid(e).name());
    if (what.empty())
      return type;

    return type + ": " + what;
  }

  BatchRunner::BatchRunner(BacktestFunction backtest, const BatchRunnerOptions& options)
    : mBacktest(std::move(backtest)),
      mOptions(options),
      mExecutor(),
      mRunLog(nullptr),
      mNullObserver(),
      mObserver(&mNullObserver),
      mNextSequence(0),
      mDispatched(0),
      mStopRequested(false)
  {
    if (!mBacktest)
      throw ExperimentConfigurationException("BatchRunner: backtest function is required");

    if (mOptions.maxWorkers == 0)
      throw ExperimentConfigurationException("BatchRunner: maxWorkers must be at least 1");

    if (mOptions.flushInterval == 0)
      throw ExperimentConfigurationException("BatchRunner: flushInterval must be at least 1");
  }

  void BatchRunner::setExecutor(std::shared_ptr<concurrency::IParallelExecutor> executor)
  {
    mExecutor = std::move(executor);
  }

  void BatchRunner::setRunLog(RunLogWriter* runLog)
  {
    mRunLog = runLog;
  }

  void BatchRunner::setObserver(BatchObserver* observer)
  {
    mObserver = observer ? observer : &mNullObserver;
  }

  std::string BatchRunner::nextRunId(const std::string& experimentId)
  {
    std::ostringstream os;
    os << experimentId << "_run_" << std::setw(6) << std::setfill('0') << mNextSequence++;
    return os.str();
  }

  ExperimentResult BatchRunner::run(const ExperimentConfiguration& configuration, std::ostream& os)
  {
    return run(configuration, ParameterExpander(configuration).expandTasks(), os);
  }

  void BatchRunner::executeTask(const ExperimentConfiguration& configuration,
				const ExperimentTask& task,
				RunRecord& record) const
  {
    const BacktestRequest request{configuration,
				  task.symbol,
				  configuration.getTimeframe(),
				  task.parameters,
				  configuration.getDateRange()};

    const unsigned int maxAttempts = mOptions.retryEnabled ? mOptions.maxRetries + 1 : 1;
    std::string lastError;

    record.markRunning(utils::nowUtc());
    for (unsigned int attempt = 1; attempt <= maxAttempts; ++attempt)
      {
	record.recordAttempt();
	try
	  {
	    BacktestMetrics metrics = mBacktest(request);
	    record.markCompleted(metrics, utils::nowUtc());
	    return;
	  }
	catch (const std::exception& e)
	  {
	    lastError = describeException(e);
	  }
	catch (...)
	  {
	    lastError = "unknown error";
	  }

	if (attempt < maxAttempts && !mStopRequested.load())
	  std::this_thread::sleep_for(mOptions.retryDelay * attempt);
	else
	  break;
      }

    record.markFailed(lastError, utils::nowUtc());
  }

  void BatchRunner::flush(std::vector<RunRecord>& buffer, std::ostream& os)
  {
    if (buffer.empty())
      return;

    if (mRunLog)
      {
	mRunLog->append(buffer);
	os << "[RUNNER] flushed " << buffer.size() << " records to " << mRunLog->getPath().string()
	   << std::endl;
      }

    mObserver->onFlush(buffer.size());
    buffer.clear();
  }

  namespace
  {
    struct FinishedTask
    {
      std::size_t index;
      RunRecord record;
    };
  }

  ExperimentResult BatchRunner::run(const ExperimentConfiguration& configuration,
				    const std::vector<ExperimentTask>& tasks,
				    std::ostream& os)
  {
    ExperimentResult result(configuration, tasks.size(), mOptions.maximize);
    const boost::posix_time::ptime startedAt = utils::nowUtc();

    os << "[RUNNER] experiment " << configuration.getExperimentId() << ": " << tasks.size()
       << " tasks, " << mOptions.maxWorkers << " workers" << std::endl;

    // Declared before the pool so a pool we own joins while the queue is still alive
    concurrency::CompletionQueue<FinishedTask> completions;

    std::shared_ptr<concurrency::IParallelExecutor> executor = mExecutor;
    if (!executor)
      executor = std::make_shared<concurrency::ThreadPoolExecutor>(mOptions.maxWorkers);

    // Futures of in-flight tasks only, keyed by task index
    std::map<std::size_t, std::future<void>> pending;
    std::vector<RunRecord> flushBuffer;
    flushBuffer.reserve(mOptions.flushInterval);

    std::size_t next = 0;
    std::size_t finished = 0;
    std::size_t failed = 0;
    bool stopLogged = false;
    std::exception_ptr abortError;
    mStopRequested.store(false);

    for (;;)
      {
	while (next < tasks.size() && pending.size() < mOptions.maxWorkers && !mStopRequested.load())
	  {
	    const std::size_t index = next++;
	    RunRecord record(nextRunId(configuration.getExperimentId()),
			     configuration.getExperimentId(),
			     tasks[index].symbol,
			     tasks[index].parameters);
	    ++mDispatched;

	    pending[index] = executor->submit([this, &configuration, &tasks, &completions, index, record]() mutable {
		executeTask(configuration, tasks[index], record);
		if (record.isFailed() && mOptions.failFast)
		  mStopRequested.store(true);
		completions.push(FinishedTask{index, std::move(record)});
	      });
	  }

	if (pending.empty())
	  break;

	FinishedTask done = completions.pop();
	auto it = pending.find(done.index);
	std::future<void> taskFuture = std::move(it->second);
	pending.erase(it);

	// After an abort the remaining workers are only waited for
	if (abortError)
	  {
	    taskFuture.wait();
	    continue;
	  }

	try
	  {
	    // Task bodies capture their own errors; this only surfaces executor faults
	    taskFuture.get();

	    const RunRecord& run = done.record;
	    ++finished;

	    if (run.isFailed())
	      {
		++failed;
		os << "[RUNNER] " << run.getRunId() << " " << run.getSymbol() << " " << toString(run.getParameters())
		   << " failed after " << run.getAttempts() << " attempt(s): " << run.getError() << std::endl;

		if (mOptions.failFast && !stopLogged)
		  {
		    mStopRequested.store(true);
		    stopLogged = true;
		    os << "[RUNNER] fail-fast: no further tasks will be dispatched" << std::endl;
		  }
	      }

	    result.recordRun(run, mOptions.retainRecords);
	    flushBuffer.push_back(run);
	    mObserver->onRunFinished(run, finished, tasks.size(), failed);

	    if (flushBuffer.size() >= mOptions.flushInterval)
	      {
		flush(flushBuffer, os);
		os << "[RUNNER] progress " << finished << "/" << tasks.size() << " (" << failed << " failed)"
		   << std::endl;
	      }
	  }
	catch (const std::exception& e)
	  {
	    abortError = std::current_exception();
	    mStopRequested.store(true);
	    os << "[RUNNER] aborting after " << describeException(e) << ", waiting for "
	       << pending.size() << " running task(s)" << std::endl;
	  }
      }

    if (abortError)
      std::rethrow_exception(abortError);

    flush(flushBuffer, os);

    result.setTiming(startedAt, utils::nowUtc());

    std::ostringstream duration;
    duration << std::fixed << std::setprecision(2) << result.getDurationSeconds() << "s";
    os << "[RUNNER] done: " << result.getCompletedRuns() << " completed, " << result.getFailedRuns()
       << " failed, " << result.getUnfinishedRuns() << " not run, " << duration.str() << std::endl;

    return result;
  }
}
