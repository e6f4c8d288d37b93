#pragma once

#include <map>
#include <string>
#include <variant>
#include <vector>

#include "EvaluationMatrix.h"

namespace qmc_sensitivity
{
  /**
   * @brief Per-QoI ordered evaluation lists, one entry per Saltelli run in
   * ascending run order.
   */
  using SampleTable = std::map<std::string, std::vector<EvaluationResult>>;

  /// One row of a run-indexed table: the run it belongs to plus one value per QoI column.
  struct RunTableRow
  {
    std::string                   runId;
    std::map<std::string, double> values;
  };

  /**
   * @brief Tabular input. Several rows may share a run id; their values, in row
   * order, form a vector-valued evaluation of that run.
   */
  struct RunTable
  {
    std::vector<RunTableRow> rows;
  };

  /**
   * @brief Dictionary input: QoI name -> "Run_<n>" label -> evaluation.
   */
  struct RunDictionary
  {
    std::map<std::string, std::map<std::string, EvaluationResult>> data;
  };

  using SampleTableSource = std::variant<RunTable, RunDictionary>;

} // namespace qmc_sensitivity
