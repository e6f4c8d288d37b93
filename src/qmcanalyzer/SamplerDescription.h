#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace qmc_sensitivity {

/**
 * @brief Family of the sampler that produced the runs.
 *
 * Only QMC (Saltelli/Sobol sequence) and plain MC samplers write runs in the
 * Saltelli block layout this analysis expects.
 */
enum class SamplerKind {
    QMC,
    MC,
    OTHER
};

std::string toString(SamplerKind kind);

/// @throws ConfigError for names other than "qmc", "mc" and "other" (case-insensitive).
SamplerKind samplerKindFromString(const std::string& name);

/**
 * @brief What the analysis needs to know about the sampler.
 */
struct SamplerDescription {
    SamplerKind kind = SamplerKind::QMC;
    std::vector<std::string> parameterNames;   // varied parameters, in sampling order
    std::size_t numMonteCarloSamples = 0;      // n_mc, 0 when unknown

    SamplerDescription() = default;
    SamplerDescription(SamplerKind kind,
                       std::vector<std::string> parameterNames,
                       std::size_t numMonteCarloSamples)
        : kind(kind),
          parameterNames(std::move(parameterNames)),
          numMonteCarloSamples(numMonteCarloSamples) {}

    std::size_t numParameters() const { return parameterNames.size(); }

    /// n_mc * (n_params + 2), or 0 when n_mc is unknown.
    std::size_t expectedNumRuns() const {
        return numMonteCarloSamples * (parameterNames.size() + 2);
    }
};

} // namespace qmc_sensitivity
