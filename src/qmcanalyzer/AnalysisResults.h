#pragma once

#include <map>
#include <string>
#include <vector>

#include "BootstrapIntervals.h"
#include "SensitivityException.h"
#include "StatisticalMoments.h"

namespace qmc_sensitivity
{
namespace analysis
{

class QMCAnalysis;

/**
 * @brief Outcome of one QMC analysis, keyed by QoI and then parameter name.
 *
 *   statistical_moments[qoi]      = {mean, var, std}
 *   sobols_first[qoi][param]      = first-order indices
 *   sobols_total[qoi][param]      = total-order indices
 *   conf_sobols_first[qoi][param] = {low, high}
 *   conf_sobols_total[qoi][param] = {low, high}
 *
 * Every value is a vector with one entry per QoI element. Only QMCAnalysis
 * fills it in; callers see a read-only object.
 */
class AnalysisResults
{
public:
    using IndexMap    = std::map<std::string, std::vector<double>>;
    using IntervalMap = std::map<std::string, ConfidenceInterval>;

    const std::vector<std::string>& qoiColumns() const { return m_qoiColumns; }
    const std::vector<std::string>& parameterNames() const { return m_parameterNames; }

    const std::map<std::string, StatisticalMoments>& statisticalMoments() const { return m_moments; }
    const std::map<std::string, IndexMap>&           sobolsFirst() const { return m_sobolsFirst; }
    const std::map<std::string, IndexMap>&           sobolsTotal() const { return m_sobolsTotal; }
    const std::map<std::string, IntervalMap>&        confSobolsFirst() const { return m_confFirst; }
    const std::map<std::string, IntervalMap>&        confSobolsTotal() const { return m_confTotal; }

    /// @throws InputError for an unknown QoI
    const StatisticalMoments& statisticalMoments(const std::string& qoi) const
    {
        return lookup(m_moments, qoi, "QoI");
    }

    /// @throws InputError for an unknown QoI or parameter
    const std::vector<double>& sobolsFirst(const std::string& qoi, const std::string& param) const
    {
        return lookup(lookup(m_sobolsFirst, qoi, "QoI"), param, "parameter");
    }

    const std::vector<double>& sobolsTotal(const std::string& qoi, const std::string& param) const
    {
        return lookup(lookup(m_sobolsTotal, qoi, "QoI"), param, "parameter");
    }

    const ConfidenceInterval& confSobolsFirst(const std::string& qoi, const std::string& param) const
    {
        return lookup(lookup(m_confFirst, qoi, "QoI"), param, "parameter");
    }

    const ConfidenceInterval& confSobolsTotal(const std::string& qoi, const std::string& param) const
    {
        return lookup(lookup(m_confTotal, qoi, "QoI"), param, "parameter");
    }

private:
    friend class QMCAnalysis;

    AnalysisResults(std::vector<std::string> qoiColumns, std::vector<std::string> parameterNames)
        : m_qoiColumns(std::move(qoiColumns)),
          m_parameterNames(std::move(parameterNames))
    {}

    template <class Map>
    static const typename Map::mapped_type& lookup(const Map& m, const std::string& key, const char* what)
    {
        auto it = m.find(key);
        if (it == m.end())
            throw InputError(std::string("AnalysisResults: unknown ") + what + " '" + key + "'");
        return it->second;
    }

private:
    std::vector<std::string>                  m_qoiColumns;
    std::vector<std::string>                  m_parameterNames;
    std::map<std::string, StatisticalMoments> m_moments;
    std::map<std::string, IndexMap>           m_sobolsFirst;
    std::map<std::string, IndexMap>           m_sobolsTotal;
    std::map<std::string, IntervalMap>        m_confFirst;
    std::map<std::string, IntervalMap>        m_confTotal;
};

} // namespace analysis
} // namespace qmc_sensitivity
