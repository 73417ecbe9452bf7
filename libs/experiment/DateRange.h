// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_DATE_RANGE_H
#define __STRATLAB_DATE_RANGE_H 1

#include <stdexcept>
#include <string>
#include <boost/date_time/gregorian/gregorian.hpp>

namespace stratlab
{
  class DateRangeException : public std::runtime_error
  {
  public:
  DateRangeException(const std::string& msg)
    : std::runtime_error(msg)
      {}

    ~DateRangeException()
      {}
  };

  /**
   * @brief Half-open backtest interval [firstDate, lastDate).
   *
   * The last date of one range may be the first date of the next, which is
   * how a walk-forward window's test period follows its train period.
   */
  class DateRange
  {
  public:
    DateRange(const boost::gregorian::date& firstDate, const boost::gregorian::date& lastDate)
      : mFirstDate(firstDate),
	mLastDate(lastDate)
    {
      if (firstDate.is_special() || lastDate.is_special())
	throw DateRangeException ("DateRange::DateRange - dates must be valid calendar dates");

      if (lastDate < firstDate)
	throw DateRangeException ("DateRange::DateRange - Second date cannot occur before first date");
    }

    DateRange(const DateRange&) = default;
    DateRange& operator=(const DateRange&) = default;
    ~DateRange() noexcept = default;

    const boost::gregorian::date& getFirstDate() const
    {
      return mFirstDate;
    }

    const boost::gregorian::date& getLastDate() const
    {
      return mLastDate;
    }

    bool contains(const DateRange& other) const
    {
      return (other.mFirstDate >= mFirstDate) && (other.mLastDate <= mLastDate);
    }

  private:
    boost::gregorian::date mFirstDate;
    boost::gregorian::date mLastDate;
  };

  inline bool operator==(const DateRange& lhs, const DateRange& rhs)
    {
      return ((lhs.getFirstDate() == rhs.getFirstDate()) &&
	      (lhs.getLastDate() == rhs.getLastDate()));
    }

  inline bool operator!=(const DateRange& lhs, const DateRange& rhs)
    {
      return !(lhs == rhs);
    }

  // ISO "YYYY-MM-DD"; throws DateRangeException on anything else.
  inline boost::gregorian::date parseIsoDate(const std::string& text)
  {
    try
      {
	boost::gregorian::date d = boost::gregorian::from_simple_string(text);
	if (d.is_special())
	  throw DateRangeException("invalid date: " + text);
	return d;
      }
    catch (const DateRangeException&)
      {
	throw;
      }
    catch (const std::exception& e)
      {
	throw DateRangeException("invalid date '" + text + "': " + e.what());
      }
  }

  inline std::string toIsoString(const boost::gregorian::date& d)
  {
    return boost::gregorian::to_iso_extended_string(d);
  }
}

#endif
