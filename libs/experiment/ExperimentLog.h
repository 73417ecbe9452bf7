#pragma once

#include <fstream>
#include <memory>
#include <ostream>
#include <streambuf>
#include <boost/filesystem.hpp>

namespace stratlab
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to send progress lines to the console and an experiment log file at
 * the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    int overflow(int c) override;
    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Log stream for one experiment directory
 *
 * Owns <dir>/experiment.log (opened for append) and a TeeStream that
 * mirrors everything written to it onto the console stream. Pass stream()
 * as the std::ostream& argument of BatchRunner, the search strategies and
 * the walk-forward orchestrator.
 */
class ExperimentLog
{
public:
    static constexpr const char* kLogFileName = "experiment.log";

    // Creates the directory if needed; throws PersistenceException on failure
    static std::unique_ptr<ExperimentLog> openTee(const boost::filesystem::path& directory,
                                                  std::ostream& console);

    ExperimentLog(const ExperimentLog&) = delete;
    ExperimentLog& operator=(const ExperimentLog&) = delete;

    std::ostream& stream()
    {
        return mTee;
    }

    const boost::filesystem::path& getLogFilePath() const
    {
        return mLogFilePath;
    }

private:
    ExperimentLog(const boost::filesystem::path& logFilePath, std::ostream& console);

private:
    boost::filesystem::path mLogFilePath;
    std::ofstream mLogFile;
    TeeStream mTee;
};

} // namespace utils
} // namespace stratlab
