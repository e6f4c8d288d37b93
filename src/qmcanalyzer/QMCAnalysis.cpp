#include "QMCAnalysis.h"

#include <cstdint>
#include <random>
#include <set>

#include "BootstrapIndexSource.h"
#include "SensitivityException.h"
#include "SobolBootstrap.h"
#include "StatisticalMoments.h"

namespace qmc_sensitivity
{
namespace analysis
{

namespace
{

SamplerDescription checkedSampler(SamplerDescription sampler)
{
    if (sampler.kind != SamplerKind::QMC && sampler.kind != SamplerKind::MC)
        throw ConfigError("QMCAnalysis relies on a QMC or MC sampler, got '"
                          + toString(sampler.kind) + "'");

    if (sampler.parameterNames.empty())
        throw ConfigError("QMCAnalysis: the sampler varies no parameters");

    std::set<std::string> seen;
    for (const auto& name : sampler.parameterNames)
    {
        if (!seen.insert(name).second)
            throw ConfigError("QMCAnalysis: parameter '" + name + "' is listed twice");
    }
    return sampler;
}

AnalysisConfiguration checkedConfiguration(AnalysisConfiguration config)
{
    config.validate();
    return config;
}

std::vector<std::string> resolveQoiColumns(const SamplerDescription&    sampler,
                                           const AnalysisConfiguration& config,
                                           std::ostream&                log)
{
    if (!config.getQoiColumns().empty())
        return config.getQoiColumns();

    // Falls back to the varied parameter names. Only sensible when the QoIs
    // are named after the inputs, so say so.
    log << "QMCAnalysis: warning: no QoI columns configured, using the varied parameter names (";
    for (std::size_t i = 0; i < sampler.parameterNames.size(); ++i)
        log << (i ? ", " : "") << sampler.parameterNames[i];
    log << ") as QoI columns\n";

    return sampler.parameterNames;
}

} // namespace

QMCAnalysis::QMCAnalysis(SamplerDescription    sampler,
                         AnalysisConfiguration config,
                         std::ostream&         log)
    : m_sampler(checkedSampler(std::move(sampler))),
      m_config(checkedConfiguration(std::move(config))),
      m_qoiColumns(resolveQoiColumns(m_sampler, m_config, log)),
      m_adapter(m_qoiColumns),
      m_log(log)
{}

AnalysisResults QMCAnalysis::analyse(const SampleTableSource&   source,
                                     std::optional<std::size_t> outputIndex) const
{
    const std::optional<std::size_t> index = outputIndex ? outputIndex : m_config.getOutputIndex();
    return computeResults(m_adapter.adapt(source, index));
}

AnalysisResults QMCAnalysis::analyse(const SampleTable& samples) const
{
    return computeResults(samples);
}

AnalysisResults QMCAnalysis::merge(const std::vector<CampaignSamples>& campaigns) const
{
    if (campaigns.empty())
        throw InputError("QMCAnalysis::merge: no sample sets to merge");

    std::vector<SampleTable> tables;
    tables.reserve(campaigns.size());
    for (std::size_t i = 0; i < campaigns.size(); ++i)
    {
        if (campaigns[i].parameterNames != m_sampler.parameterNames)
            throw ConfigError("QMCAnalysis::merge: sample set " + std::to_string(i + 1)
                              + " was drawn for different parameters");

        tables.push_back(m_adapter.adapt(campaigns[i].samples, m_config.getOutputIndex()));
    }

    m_log << "QMCAnalysis: merging " << campaigns.size() << " sample sets\n";
    return computeResults(SampleTableAdapter::concatenate(tables, m_qoiColumns));
}

AnalysisResults QMCAnalysis::computeResults(const SampleTable& samples) const
{
    const std::size_t nParams = m_sampler.numParameters();

    SobolBootstrap<std::mt19937_64> bootstrap(nParams,
                                              m_config.getNumBootstrap(),
                                              m_config.getAlpha(),
                                              m_config.getIntervalMethod(),
                                              m_config.getResamplingMode(),
                                              m_config.getVectorizationThreshold());

    const std::uint64_t masterSeed = m_config.getSeed() ? *m_config.getSeed()
                                                        : rng_utils::entropy_seed();
    const rng_utils::SeedKey key(masterSeed);

    AnalysisResults results(m_qoiColumns, m_sampler.parameterNames);

    for (std::size_t k = 0; k < m_qoiColumns.size(); ++k)
    {
        const std::string& qoi = m_qoiColumns[k];

        auto it = samples.find(qoi);
        if (it == samples.end() || it->second.empty())
            throw InputError("QMCAnalysis: no data for QoI '" + qoi + "'");

        const std::vector<EvaluationResult>& runs = it->second;

        const std::size_t expectedRuns = m_sampler.expectedNumRuns();
        if (expectedRuns != 0 && runs.size() != expectedRuns)
            m_log << "QMCAnalysis: note: QoI '" << qoi << "' has " << runs.size()
                  << " runs, the sampler describes " << expectedRuns << "\n";

        results.m_moments[qoi] = computeStatisticalMoments(runs);

        auto rng = key.with_tag(static_cast<std::uint64_t>(k)).make_engine<std::mt19937_64>();
        const auto outcome = bootstrap.run(runs, rng);

        m_log << "QMCAnalysis: QoI '" << qoi << "': n_mc = " << outcome.n_mc
              << ", elements = " << outcome.n_qoi << ", "
              << (outcome.mode == ResamplingMode::VECTORIZED ? "Vectorized" : "Sequential")
              << " bootstrapping\n";

        for (std::size_t j = 0; j < nParams; ++j)
        {
            const std::string&          param = m_sampler.parameterNames[j];
            const ParameterSensitivity& p     = outcome.parameters[j];

            results.m_sobolsFirst[qoi][param] = p.firstOrder;
            results.m_sobolsTotal[qoi][param] = p.totalOrder;
            results.m_confFirst[qoi][param]   = p.firstOrderCI;
            results.m_confTotal[qoi][param]   = p.totalOrderCI;
        }
    }

    return results;
}

} // namespace analysis
} // namespace qmc_sensitivity
