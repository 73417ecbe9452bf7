#pragma once

#include <string>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace stratlab
{
namespace utils
{

/**
 * @brief Current wall-clock time in UTC with microsecond resolution
 */
boost::posix_time::ptime nowUtc();

/**
 * @brief Format a timestamp as ISO-8601, e.g. "2024-08-25T14:30:05.123456"
 *
 * A not_a_date_time value formats as an empty string.
 */
std::string toIsoTimestamp(const boost::posix_time::ptime& t);

/**
 * @brief Parse a timestamp produced by toIsoTimestamp
 *
 * An empty string yields not_a_date_time. Malformed text throws std::invalid_argument.
 */
boost::posix_time::ptime parseIsoTimestamp(const std::string& text);

/**
 * @brief Seconds elapsed between two timestamps, 0 if either is missing
 */
double secondsBetween(const boost::posix_time::ptime& start, const boost::posix_time::ptime& end);

} // namespace utils
} // namespace stratlab
