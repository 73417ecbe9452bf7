#include "ExperimentLog.h"
#include "ExperimentException.h"

namespace stratlab
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

// mLogFile is declared before mTee, so it is open when the tee captures its buffer
ExperimentLog::ExperimentLog(const boost::filesystem::path& logFilePath, std::ostream& console)
    : mLogFilePath(logFilePath),
      mLogFile(logFilePath.string(), std::ios::out | std::ios::app),
      mTee(console, mLogFile)
{
}

std::unique_ptr<ExperimentLog> ExperimentLog::openTee(const boost::filesystem::path& directory,
                                                      std::ostream& console)
{
    boost::system::error_code ec;
    boost::filesystem::create_directories(directory, ec);
    if (ec)
        throw PersistenceException("cannot create log directory " + directory.string() + ": " + ec.message());

    const boost::filesystem::path logPath = directory / kLogFileName;
    std::unique_ptr<ExperimentLog> log(new ExperimentLog(logPath, console));
    if (!log->mLogFile.is_open())
        throw PersistenceException("cannot open log file " + logPath.string());

    return log;
}

} // namespace utils
} // namespace stratlab
