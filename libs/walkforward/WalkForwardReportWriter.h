// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __STRATLAB_WALK_FORWARD_REPORT_WRITER_H
#define __STRATLAB_WALK_FORWARD_REPORT_WRITER_H 1

#include <ostream>
#include <string>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include "WalkForwardResult.h"

namespace stratlab
{
  namespace walkforward
  {
    /**
     * @brief Walk-forward report as JSON and as a console summary.
     *
     * The JSON report holds every window with its periods, state, winning
     * parameters and metrics, the out-of-sample summary, the parameter
     * stability table, the recommended parameters and the robustness score
     * with its components and verdict.
     */
    class WalkForwardReportWriter
    {
    public:
      static constexpr const char* kReportVersion = "1.0";
      static constexpr const char* kReportFileName = "walk_forward.json";

      WalkForwardReportWriter() = default;

      rapidjson::Value toJson(const WalkForwardResult& result,
			      rapidjson::Document::AllocatorType& allocator) const;

      std::string toString(const WalkForwardResult& result, bool pretty = true) const;

      // Throws PersistenceException if the file cannot be written
      void writeFile(const WalkForwardResult& result, const boost::filesystem::path& path) const;

      void writeSummary(const WalkForwardResult& result, std::ostream& os) const;
    };
  }
}

#endif
