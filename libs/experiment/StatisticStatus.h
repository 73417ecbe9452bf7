// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_STATISTIC_STATUS_H
#define __STRATLAB_STATISTIC_STATUS_H 1

#include <string>

namespace stratlab
{
  /**
   * Outcome of a derived statistic. InsufficientData is an ordinary result
   * (too few runs or windows), never signalled by an exception.
   */
  enum class StatisticStatus { Success, InsufficientData, Failed };

  inline std::string toString(StatisticStatus status)
  {
    switch (status)
      {
      case StatisticStatus::Success:
	return "success";
      case StatisticStatus::InsufficientData:
	return "insufficient_data";
      case StatisticStatus::Failed:
	return "failed";
      }
    return "failed";
  }
}

#endif
