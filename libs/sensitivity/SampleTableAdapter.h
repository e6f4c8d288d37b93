#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "SampleTable.h"

namespace qmc_sensitivity
{
  /**
   * @brief Normalizes the accepted sample-table shapes into a SampleTable.
   *
   * Tabular input keeps runs in order of first appearance of their run id.
   * Dictionary input is read by numeric run index, Run_1 up to the largest
   * index present, whatever order the labels are stored in. An optional output
   * index reduces every evaluation to the single element at that position.
   */
  class SampleTableAdapter
  {
  public:
    explicit SampleTableAdapter(std::vector<std::string> qoiColumns);

    /**
     * @throws InputError for empty input, missing QoIs or runs, malformed run
     *         labels, run-index gaps and out-of-range output indices.
     * @throws ShapeError if the evaluations of one QoI differ in length.
     */
    SampleTable adapt(const SampleTableSource& source,
                      std::optional<std::size_t> outputIndex = std::nullopt) const;

    const std::vector<std::string>& qoiColumns() const { return m_qoiColumns; }

    /**
     * @brief Append the per-QoI lists of each table in input order.
     * @throws InputError if a table lacks one of the QoIs.
     */
    static SampleTable concatenate(const std::vector<SampleTable>& tables,
                                   const std::vector<std::string>& qoiColumns);

    /**
     * @brief Extract n from a "Run_<n>" label.
     * @throws InputError if the label is malformed or n is not positive.
     */
    static std::size_t parseRunLabel(const std::string& label);

  private:
    SampleTable fromRunTable(const RunTable& table,
                             std::optional<std::size_t> outputIndex) const;

    SampleTable fromRunDictionary(const RunDictionary& dict,
                                  std::optional<std::size_t> outputIndex) const;

    static EvaluationResult selectOutput(const EvaluationResult& evaluation,
                                         std::optional<std::size_t> outputIndex,
                                         const std::string& qoi);

    static void checkUniformShape(const SampleTable& table);

  private:
    std::vector<std::string> m_qoiColumns;
  };

} // namespace qmc_sensitivity
