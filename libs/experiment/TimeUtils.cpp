#include "TimeUtils.h"
#include <algorithm>
#include <stdexcept>

namespace stratlab
{
namespace utils
{

boost::posix_time::ptime nowUtc()
{
    return boost::posix_time::microsec_clock::universal_time();
}

std::string toIsoTimestamp(const boost::posix_time::ptime& t)
{
    if (t.is_special())
        return std::string();

    return boost::posix_time::to_iso_extended_string(t);
}

boost::posix_time::ptime parseIsoTimestamp(const std::string& text)
{
    if (text.empty())
        return boost::posix_time::ptime(boost::posix_time::not_a_date_time);

    std::string normalized(text);
    std::replace(normalized.begin(), normalized.end(), 'T', ' ');

    try
    {
        return boost::posix_time::time_from_string(normalized);
    }
    catch (const std::exception& e)
    {
        throw std::invalid_argument("invalid timestamp '" + text + "': " + e.what());
    }
}

double secondsBetween(const boost::posix_time::ptime& start, const boost::posix_time::ptime& end)
{
    if (start.is_special() || end.is_special())
        return 0.0;

    return static_cast<double>((end - start).total_microseconds()) / 1.0e6;
}

} // namespace utils
} // namespace stratlab
