#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "BootstrapIntervals.h"
#include "ResamplingStrategy.h"
#include "SamplerDescription.h"

namespace qmc_sensitivity {

/**
 * @brief Settings of one QMC sensitivity analysis.
 *
 * Defaults: alpha 0.05, 1000 bootstrap trials, pivotal intervals, automatic
 * resampling strategy with a 10^7 threshold, fresh entropy for every run.
 */
class AnalysisConfiguration {
public:
    AnalysisConfiguration();

    double getAlpha() const { return alpha_; }
    void setAlpha(double alpha) { alpha_ = alpha; }

    std::size_t getNumBootstrap() const { return numBootstrap_; }
    void setNumBootstrap(std::size_t numBootstrap) { numBootstrap_ = numBootstrap; }

    /**
     * @brief Explicit QoI columns; empty means "not configured".
     */
    const std::vector<std::string>& getQoiColumns() const { return qoiColumns_; }
    void setQoiColumns(const std::vector<std::string>& qoiColumns) { qoiColumns_ = qoiColumns; }

    std::uint64_t getVectorizationThreshold() const { return vectorizationThreshold_; }
    void setVectorizationThreshold(std::uint64_t threshold) { vectorizationThreshold_ = threshold; }

    ResamplingMode getResamplingMode() const { return resamplingMode_; }
    void setResamplingMode(ResamplingMode mode) { resamplingMode_ = mode; }

    IntervalMethod getIntervalMethod() const { return intervalMethod_; }
    void setIntervalMethod(IntervalMethod method) { intervalMethod_ = method; }

    /**
     * @brief Master seed for the bootstrap index draws; unset means entropy.
     */
    const std::optional<std::uint64_t>& getSeed() const { return seed_; }
    void setSeed(std::uint64_t seed) { seed_ = seed; }
    void clearSeed() { seed_.reset(); }

    const std::optional<std::size_t>& getOutputIndex() const { return outputIndex_; }
    void setOutputIndex(std::size_t index) { outputIndex_ = index; }
    void clearOutputIndex() { outputIndex_.reset(); }

    /**
     * @brief Check value ranges.
     * @throws ConfigError if alpha is outside (0,1) or the bootstrap count is zero
     */
    void validate() const;

    /**
     * @brief Parse the analysis settings from a JSON object.
     *
     * Recognized members: alpha, n_bootstrap, qoi_cols, vectorization_threshold,
     * resampling ("automatic" | "vectorized" | "sequential"),
     * interval ("pivotal" | "percentile"), seed, output_index. Missing members
     * keep their defaults.
     *
     * @throws ConfigError on malformed JSON, wrong member types or invalid values
     */
    static AnalysisConfiguration fromJsonString(const std::string& jsonContent);

private:
    double alpha_;
    std::size_t numBootstrap_;
    std::vector<std::string> qoiColumns_;
    std::uint64_t vectorizationThreshold_;
    ResamplingMode resamplingMode_;
    IntervalMethod intervalMethod_;
    std::optional<std::uint64_t> seed_;
    std::optional<std::size_t> outputIndex_;
};

/**
 * @brief Contents of an analysis configuration file: the analysis settings
 * plus the description of the sampler that produced the runs.
 *
 * {
 *   "sampler":  { "kind": "qmc", "parameters": ["x1", "x2"], "n_mc_samples": 100 },
 *   "analysis": { "alpha": 0.05, "n_bootstrap": 1000, "qoi_cols": ["f"], "seed": 42 }
 * }
 */
struct ConfigurationFile {
    SamplerDescription sampler;
    AnalysisConfiguration analysis;
};

class ConfigurationFileReader {
public:
    /**
     * @throws ConfigError if the file is missing, unreadable or invalid
     */
    static ConfigurationFile readFile(const std::string& configPath);

    /**
     * @throws ConfigError if the content is not a valid configuration document
     */
    static ConfigurationFile readString(const std::string& jsonContent);
};

} // namespace qmc_sensitivity
