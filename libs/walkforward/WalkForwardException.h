// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_WALK_FORWARD_EXCEPTION_H
#define __STRATLAB_WALK_FORWARD_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace stratlab
{
  namespace walkforward
  {
    // Non-positive window lengths, inverted date range, missing dates
    class WalkForwardConfigurationException : public std::runtime_error
    {
    public:
      explicit WalkForwardConfigurationException(const std::string& msg)
	: std::runtime_error(msg)
      {}

      ~WalkForwardConfigurationException() noexcept = default;
    };
  }
}

#endif
