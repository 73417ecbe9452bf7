// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_EXPERIMENT_CONFIGURATION_READER_H
#define __STRATLAB_EXPERIMENT_CONFIGURATION_READER_H 1

#include <string>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include "ExperimentConfiguration.h"

namespace stratlab
{
  /**
   * @brief Loads an ExperimentConfiguration from its declarative JSON form.
   *
   * Every problem with the document (unsupported extension, malformed JSON,
   * missing required field, wrong field type, invalid range, unknown
   * expansion mode) throws ExperimentConfigurationException. Nothing is
   * silently coerced.
   */
  class ExperimentConfigurationReader
  {
  public:
    ExperimentConfigurationReader() = default;

    ExperimentConfiguration readFile(const boost::filesystem::path& path) const;
    ExperimentConfiguration parseString(const std::string& text) const;
    ExperimentConfiguration fromJson(const rapidjson::Value& json) const;
  };
}

#endif
