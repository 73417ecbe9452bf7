// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_RUN_LOG_WRITER_H
#define __STRATLAB_RUN_LOG_WRITER_H 1

#include <cstddef>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include "RunRecord.h"

namespace stratlab
{
  /**
   * @brief Append-only JSON-lines log of finished runs.
   *
   * Each append() writes one line per record and flushes, so the file can
   * be tailed while an experiment is in progress and always ends on a
   * complete line. Not thread safe; the batch runner's consumer thread is
   * the only writer.
   */
  class RunLogWriter
  {
  public:
    static constexpr const char* kRunLogFileName = "runs.jsonl";

    // Creates parent directories; throws PersistenceException on failure
    explicit RunLogWriter(const boost::filesystem::path& logFile);

    RunLogWriter(const RunLogWriter&) = delete;
    RunLogWriter& operator=(const RunLogWriter&) = delete;

    void append(const std::vector<RunRecord>& records);

    std::size_t getRecordsWritten() const
    {
      return mRecordsWritten;
    }

    const boost::filesystem::path& getPath() const
    {
      return mPath;
    }

    // Blank lines are skipped; a malformed line throws PersistenceException
    static std::vector<RunRecord> readAll(const boost::filesystem::path& logFile);

  private:
    boost::filesystem::path mPath;
    boost::filesystem::ofstream mOut;
    std::size_t mRecordsWritten;
  };
}

#endif
