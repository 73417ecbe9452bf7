// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_EXPERIMENT_CONFIGURATION_WRITER_H
#define __STRATLAB_EXPERIMENT_CONFIGURATION_WRITER_H 1

#include <string>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include "ExperimentConfiguration.h"

namespace stratlab
{
  // Writes the declarative form ExperimentConfigurationReader accepts.
  class ExperimentConfigurationWriter
  {
  public:
    ExperimentConfigurationWriter() = default;

    rapidjson::Value toJson(const ExperimentConfiguration& config,
			    rapidjson::Document::AllocatorType& allocator) const;

    std::string toString(const ExperimentConfiguration& config, bool pretty = true) const;

    // Throws PersistenceException if the file cannot be written
    void writeFile(const ExperimentConfiguration& config, const boost::filesystem::path& path) const;
  };
}

#endif
