// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_EXPERIMENT_EXCEPTION_H
#define __STRATLAB_EXPERIMENT_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace stratlab
{
  // Invalid parameter range, unsupported document format, unknown
  // expansion mode. Always fatal at load time.
  class ExperimentConfigurationException : public std::runtime_error
  {
  public:
    explicit ExperimentConfigurationException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~ExperimentConfigurationException() noexcept = default;
  };

  // Run log or summary could not be written or read back.
  class PersistenceException : public std::runtime_error
  {
  public:
    explicit PersistenceException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~PersistenceException() noexcept = default;
  };

  // Typed failure a backtest function may throw. Any exception escaping the
  // backtest function is treated as a task failure; this one just carries a
  // reason the collaborator chose to name.
  class BacktestException : public std::runtime_error
  {
  public:
    explicit BacktestException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    ~BacktestException() noexcept = default;
  };
}

#endif
