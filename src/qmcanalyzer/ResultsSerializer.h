#pragma once

#include <string>

#include "AnalysisResults.h"

namespace qmc_sensitivity {
namespace analysis {

/**
 * @brief Writes AnalysisResults as a JSON document.
 *
 * Top-level members: element, version, statistical_moments, sobols_first,
 * sobols_total, conf_sobols_first, conf_sobols_total. A value of a scalar QoI
 * is written as a number, a vector QoI as an array. Non-finite values are
 * written as NaN / Infinity literals.
 */
class ResultsSerializer {
public:
    static std::string toJson(const AnalysisResults& results, bool pretty = true);

    /**
     * @return true if the file was written
     */
    static bool saveToFile(const AnalysisResults& results, const std::string& filePath);
};

} // namespace analysis
} // namespace qmc_sensitivity
