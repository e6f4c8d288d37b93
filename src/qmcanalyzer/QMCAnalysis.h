#pragma once

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "AnalysisConfiguration.h"
#include "AnalysisResults.h"
#include "SampleTable.h"
#include "SampleTableAdapter.h"
#include "SamplerDescription.h"

namespace qmc_sensitivity
{
namespace analysis
{

/**
 * @brief One independently collected sample set plus the parameter names of
 * the sampler that produced it.
 */
struct CampaignSamples
{
    std::vector<std::string> parameterNames;
    SampleTableSource        samples;
};

/**
 * @brief Quasi-Monte Carlo (Saltelli) sensitivity analysis.
 *
 * For every configured QoI computes the statistical moments of all runs and
 * the first- and total-order Sobol indices of every varied parameter with
 * bootstrap confidence intervals.
 *
 * The configuration is fixed at construction, so one instance can analyse
 * independent sample tables concurrently as long as each thread logs to its
 * own stream.
 *
 * Each QoI draws its bootstrap indices from an engine derived from the master
 * seed and the QoI position. With a configured seed, identical sample tables
 * give identical results.
 */
class QMCAnalysis
{
public:
    /**
     * @throws ConfigError if the sampler is not a QMC or MC sampler, no
     *         parameters are varied, a parameter name repeats, or the
     *         configuration is invalid
     */
    QMCAnalysis(SamplerDescription    sampler,
                AnalysisConfiguration config,
                std::ostream&         log = std::clog);

    static std::string elementName() { return "QMC_Analysis"; }
    static std::string elementVersion() { return "0.2"; }

    /**
     * @brief Analyse one sample table in either accepted shape.
     *
     * @param outputIndex overrides the configured output index when set
     */
    AnalysisResults analyse(const SampleTableSource&   source,
                            std::optional<std::size_t> outputIndex = std::nullopt) const;

    /// Analyse an already normalized sample table.
    AnalysisResults analyse(const SampleTable& samples) const;

    /**
     * @brief Concatenate several sample sets QoI by QoI, in input order, and
     * analyse the result as one larger Saltelli sample.
     *
     * Only meaningful when all campaigns used the same sampling design; that is
     * not checked beyond the parameter names.
     *
     * @throws InputError for an empty list
     * @throws ConfigError if a campaign's parameter names differ from this analysis'
     */
    AnalysisResults merge(const std::vector<CampaignSamples>& campaigns) const;

    const std::vector<std::string>& qoiColumns() const { return m_qoiColumns; }
    const SamplerDescription&       sampler() const { return m_sampler; }
    const AnalysisConfiguration&    configuration() const { return m_config; }

private:
    AnalysisResults computeResults(const SampleTable& samples) const;

private:
    SamplerDescription       m_sampler;
    AnalysisConfiguration    m_config;
    std::vector<std::string> m_qoiColumns;
    SampleTableAdapter       m_adapter;
    std::ostream&            m_log;
};

} // namespace analysis
} // namespace qmc_sensitivity
