#include "SampleTableAdapter.h"

#include <algorithm>
#include <cctype>
#include <type_traits>
#include <unordered_map>

#include "SensitivityException.h"

namespace qmc_sensitivity
{
  namespace
  {
    const std::string kRunPrefix = "Run_";
  }

  SampleTableAdapter::SampleTableAdapter(std::vector<std::string> qoiColumns)
    : m_qoiColumns(std::move(qoiColumns))
  {
    if (m_qoiColumns.empty())
      throw ConfigError("SampleTableAdapter: no QoI columns configured");
  }

  SampleTable SampleTableAdapter::adapt(const SampleTableSource& source,
                                        std::optional<std::size_t> outputIndex) const
  {
    SampleTable table = std::visit(
      [this, outputIndex](const auto& input) -> SampleTable {
        using T = std::decay_t<decltype(input)>;
        if constexpr (std::is_same_v<T, RunTable>)
          return fromRunTable(input, outputIndex);
        else
          return fromRunDictionary(input, outputIndex);
      },
      source);

    checkUniformShape(table);
    return table;
  }

  SampleTable SampleTableAdapter::fromRunTable(const RunTable& table,
                                               std::optional<std::size_t> outputIndex) const
  {
    if (table.rows.empty())
      throw InputError("SampleTableAdapter: no data in sample table");

    // Group rows by run id, preserving first-appearance order
    std::vector<std::string> runOrder;
    std::unordered_map<std::string, std::vector<const RunTableRow*>> rowsByRun;
    for (const auto& row : table.rows)
      {
        auto it = rowsByRun.find(row.runId);
        if (it == rowsByRun.end())
          {
            runOrder.push_back(row.runId);
            rowsByRun[row.runId].push_back(&row);
          }
        else
          it->second.push_back(&row);
      }

    SampleTable out;
    for (const auto& qoi : m_qoiColumns)
      {
        auto& samples = out[qoi];
        samples.reserve(runOrder.size());

        for (const auto& runId : runOrder)
          {
            EvaluationResult evaluation;
            for (const RunTableRow* row : rowsByRun[runId])
              {
                auto v = row->values.find(qoi);
                if (v == row->values.end())
                  throw InputError("SampleTableAdapter: run '" + runId
                                   + "' has no value for QoI '" + qoi + "'");
                evaluation.push_back(v->second);
              }
            samples.push_back(selectOutput(evaluation, outputIndex, qoi));
          }
      }

    return out;
  }

  SampleTable SampleTableAdapter::fromRunDictionary(const RunDictionary& dict,
                                                    std::optional<std::size_t> outputIndex) const
  {
    if (dict.data.empty())
      throw InputError("SampleTableAdapter: no data in sample table");

    SampleTable out;
    for (const auto& qoi : m_qoiColumns)
      {
        auto runsIt = dict.data.find(qoi);
        if (runsIt == dict.data.end())
          throw InputError("SampleTableAdapter: QoI '" + qoi + "' not found in sample table");

        const auto& runs = runsIt->second;
        if (runs.empty())
          throw InputError("SampleTableAdapter: QoI '" + qoi + "' has no runs");

        std::map<std::size_t, const EvaluationResult*> byIndex;
        for (const auto& [label, evaluation] : runs)
          {
            const std::size_t index = parseRunLabel(label);
            if (!byIndex.emplace(index, &evaluation).second)
              throw InputError("SampleTableAdapter: duplicate run index "
                               + std::to_string(index) + " for QoI '" + qoi + "'");
          }

        // std::map keeps indices ascending, so the largest one is last
        const std::size_t maxRunIndex = byIndex.rbegin()->first;
        if (byIndex.size() != maxRunIndex)
          throw InputError("SampleTableAdapter: QoI '" + qoi + "' has "
                           + std::to_string(byIndex.size()) + " runs but the largest run index is "
                           + std::to_string(maxRunIndex));

        auto& samples = out[qoi];
        samples.reserve(maxRunIndex);
        for (const auto& entry : byIndex)
          samples.push_back(selectOutput(*entry.second, outputIndex, qoi));
      }

    return out;
  }

  EvaluationResult SampleTableAdapter::selectOutput(const EvaluationResult& evaluation,
                                                    std::optional<std::size_t> outputIndex,
                                                    const std::string& qoi)
  {
    if (!outputIndex)
      return evaluation;

    if (*outputIndex >= evaluation.size())
      throw InputError("SampleTableAdapter: output index " + std::to_string(*outputIndex)
                       + " out of range for QoI '" + qoi + "' with "
                       + std::to_string(evaluation.size()) + " elements");

    return EvaluationResult{ evaluation[*outputIndex] };
  }

  void SampleTableAdapter::checkUniformShape(const SampleTable& table)
  {
    for (const auto& [qoi, samples] : table)
      {
        if (samples.empty())
          continue;

        const std::size_t expected = samples.front().size();
        if (expected == 0)
          throw InputError("SampleTableAdapter: QoI '" + qoi + "' has an empty evaluation");

        for (std::size_t i = 1; i < samples.size(); ++i)
          {
            if (samples[i].size() != expected)
              throw ShapeError("SampleTableAdapter: QoI '" + qoi + "' run "
                               + std::to_string(i + 1) + " has "
                               + std::to_string(samples[i].size())
                               + " elements, expected " + std::to_string(expected));
          }
      }
  }

  SampleTable SampleTableAdapter::concatenate(const std::vector<SampleTable>& tables,
                                              const std::vector<std::string>& qoiColumns)
  {
    SampleTable merged;
    for (const auto& qoi : qoiColumns)
      merged[qoi];

    for (const auto& table : tables)
      {
        for (const auto& qoi : qoiColumns)
          {
            auto it = table.find(qoi);
            if (it == table.end())
              throw InputError("SampleTableAdapter::concatenate: QoI '" + qoi
                               + "' missing from one of the sample tables");

            auto& dst = merged[qoi];
            dst.insert(dst.end(), it->second.begin(), it->second.end());
          }
      }

    checkUniformShape(merged);
    return merged;
  }

  std::size_t SampleTableAdapter::parseRunLabel(const std::string& label)
  {
    if (label.size() <= kRunPrefix.size() || label.compare(0, kRunPrefix.size(), kRunPrefix) != 0)
      throw InputError("SampleTableAdapter: malformed run label '" + label + "'");

    const std::string digits = label.substr(kRunPrefix.size());
    if (!std::all_of(digits.begin(), digits.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; }))
      throw InputError("SampleTableAdapter: malformed run label '" + label + "'");

    std::size_t index = 0;
    try
      {
        index = static_cast<std::size_t>(std::stoull(digits));
      }
    catch (const std::out_of_range&)
      {
        throw InputError("SampleTableAdapter: run index out of range in '" + label + "'");
      }

    if (index == 0)
      throw InputError("SampleTableAdapter: run indices start at 1, got '" + label + "'");

    return index;
  }

} // namespace qmc_sensitivity
