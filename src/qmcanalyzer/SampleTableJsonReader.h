#pragma once

#include <string>

#include "SampleTable.h"

namespace qmc_sensitivity {

/**
 * @brief Reads sample tables stored as JSON.
 *
 * Tabular form, one row per run (or several rows per run for vector QoIs):
 *
 *   { "format": "table",
 *     "rows": [ { "run_id": "Run_1", "f": 1.5, "g": 0.2 }, ... ] }
 *
 * Run dictionary form, evaluations are numbers or arrays of numbers:
 *
 *   { "format": "runs",
 *     "data": { "f": { "Run_1": 1.5, "Run_2": 0.7 }, "g": { "Run_1": [0, 1], ... } } }
 *
 * A document without "format" whose members are all objects is read as the
 * "data" part of the run dictionary form.
 */
class SampleTableJsonReader {
public:
    /**
     * @throws InputError on parse errors or documents of neither shape
     */
    static SampleTableSource readString(const std::string& jsonContent);

    /**
     * @throws InputError if the file is missing or unreadable, or per readString()
     */
    static SampleTableSource readFile(const std::string& filePath);
};

} // namespace qmc_sensitivity
