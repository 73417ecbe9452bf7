// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_WALK_FORWARD_CONFIG_H
#define __STRATLAB_WALK_FORWARD_CONFIG_H 1

namespace stratlab
{
  namespace walkforward
  {
    struct WalkForwardConfig
    {
      int trainMonths = 6;
      int testMonths = 2;
      int stepMonths = 2;

      // Train candidates whose trades across symbols sum below this are
      // not eligible as a window's winner; 0 accepts everything
      unsigned long minTrades = 0;

      // Robustness score needed for a recommendation
      double recommendationThreshold = 70.0;
    };

    // Throws WalkForwardConfigurationException
    void validate(const WalkForwardConfig& config);
  }
}

#endif
