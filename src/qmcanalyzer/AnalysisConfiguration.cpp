#include "AnalysisConfiguration.h"

#include <cmath>
#include <fstream>
#include <sstream>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include "SensitivityException.h"

namespace fs = boost::filesystem;
using namespace rapidjson;

namespace qmc_sensitivity {

namespace {

Document parseDocument(const std::string& jsonContent, const std::string& what) {
    Document doc;
    doc.Parse(jsonContent.c_str());

    if (doc.HasParseError()) {
        throw ConfigError("JSON parse error in " + what + " at offset "
                          + std::to_string(doc.GetErrorOffset()) + ": "
                          + GetParseError_En(doc.GetParseError()));
    }
    if (!doc.IsObject()) {
        throw ConfigError(what + " must be a JSON object");
    }
    return doc;
}

std::uint64_t readUnsigned(const Value& value, const char* name) {
    if (value.IsUint64())
        return value.GetUint64();

    // Allow 1e7 style literals as long as they are whole and non-negative
    if (value.IsDouble()) {
        const double d = value.GetDouble();
        if (d >= 0.0 && std::floor(d) == d && d < 1.8e19)
            return static_cast<std::uint64_t>(d);
    }
    throw ConfigError(std::string("'") + name + "' must be a non-negative integer");
}

std::string readString(const Value& value, const char* name) {
    if (!value.IsString())
        throw ConfigError(std::string("'") + name + "' must be a string");
    return value.GetString();
}

std::vector<std::string> readStringArray(const Value& value, const char* name) {
    if (!value.IsArray())
        throw ConfigError(std::string("'") + name + "' must be an array of strings");

    std::vector<std::string> out;
    for (const auto& item : value.GetArray()) {
        out.push_back(readString(item, name));
    }
    return out;
}

ResamplingMode resamplingModeFromString(const std::string& name) {
    const std::string key = boost::algorithm::to_lower_copy(name);
    if (key == "automatic" || key == "auto")
        return ResamplingMode::AUTOMATIC;
    if (key == "vectorized")
        return ResamplingMode::VECTORIZED;
    if (key == "sequential")
        return ResamplingMode::SEQUENTIAL;
    throw ConfigError("Unknown resampling mode: '" + name + "'");
}

IntervalMethod intervalMethodFromString(const std::string& name) {
    const std::string key = boost::algorithm::to_lower_copy(name);
    if (key == "pivotal" || key == "basic")
        return IntervalMethod::PIVOTAL;
    if (key == "percentile")
        return IntervalMethod::PERCENTILE;
    throw ConfigError("Unknown interval method: '" + name + "'");
}

AnalysisConfiguration parseAnalysisObject(const Value& obj) {
    AnalysisConfiguration config;

    if (obj.HasMember("alpha")) {
        if (!obj["alpha"].IsNumber())
            throw ConfigError("'alpha' must be a number");
        config.setAlpha(obj["alpha"].GetDouble());
    }

    if (obj.HasMember("n_bootstrap")) {
        const Value& v = obj["n_bootstrap"];
        if (v.IsInt64() && v.GetInt64() <= 0)
            throw ConfigError("'n_bootstrap' must be positive");
        config.setNumBootstrap(static_cast<std::size_t>(readUnsigned(v, "n_bootstrap")));
    }

    if (obj.HasMember("qoi_cols") && !obj["qoi_cols"].IsNull())
        config.setQoiColumns(readStringArray(obj["qoi_cols"], "qoi_cols"));

    if (obj.HasMember("vectorization_threshold"))
        config.setVectorizationThreshold(readUnsigned(obj["vectorization_threshold"], "vectorization_threshold"));

    if (obj.HasMember("resampling"))
        config.setResamplingMode(resamplingModeFromString(readString(obj["resampling"], "resampling")));

    if (obj.HasMember("interval"))
        config.setIntervalMethod(intervalMethodFromString(readString(obj["interval"], "interval")));

    if (obj.HasMember("seed") && !obj["seed"].IsNull())
        config.setSeed(readUnsigned(obj["seed"], "seed"));

    if (obj.HasMember("output_index") && !obj["output_index"].IsNull())
        config.setOutputIndex(static_cast<std::size_t>(readUnsigned(obj["output_index"], "output_index")));

    config.validate();
    return config;
}

SamplerDescription parseSamplerObject(const Value& obj) {
    if (!obj.IsObject())
        throw ConfigError("'sampler' must be a JSON object");

    SamplerDescription sampler;
    if (obj.HasMember("kind"))
        sampler.kind = samplerKindFromString(readString(obj["kind"], "kind"));

    if (!obj.HasMember("parameters"))
        throw ConfigError("'sampler' has no 'parameters' list");
    sampler.parameterNames = readStringArray(obj["parameters"], "parameters");

    if (obj.HasMember("n_mc_samples"))
        sampler.numMonteCarloSamples = static_cast<std::size_t>(readUnsigned(obj["n_mc_samples"], "n_mc_samples"));

    return sampler;
}

} // namespace

AnalysisConfiguration::AnalysisConfiguration()
    : alpha_(0.05),
      numBootstrap_(1000),
      qoiColumns_(),
      vectorizationThreshold_(kDefaultVectorizationThreshold),
      resamplingMode_(ResamplingMode::AUTOMATIC),
      intervalMethod_(IntervalMethod::PIVOTAL),
      seed_(),
      outputIndex_() {
}

void AnalysisConfiguration::validate() const {
    if (!(alpha_ > 0.0 && alpha_ < 1.0)) {
        throw ConfigError("alpha must be in the open interval (0,1), got " + std::to_string(alpha_));
    }
    if (numBootstrap_ == 0) {
        throw ConfigError("n_bootstrap must be positive");
    }
}

AnalysisConfiguration AnalysisConfiguration::fromJsonString(const std::string& jsonContent) {
    Document doc = parseDocument(jsonContent, "analysis configuration");
    return parseAnalysisObject(doc);
}

ConfigurationFile ConfigurationFileReader::readFile(const std::string& configPath) {
    if (!fs::exists(configPath)) {
        throw ConfigError("Configuration file not found: " + configPath);
    }

    std::ifstream file(configPath);
    if (!file.is_open()) {
        throw ConfigError("Could not open configuration file: " + configPath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return readString(buffer.str());
}

ConfigurationFile ConfigurationFileReader::readString(const std::string& jsonContent) {
    Document doc = parseDocument(jsonContent, "configuration file");

    if (!doc.HasMember("sampler")) {
        throw ConfigError("No sampler configuration supplied");
    }

    ConfigurationFile out;
    out.sampler = parseSamplerObject(doc["sampler"]);

    if (doc.HasMember("analysis")) {
        if (!doc["analysis"].IsObject())
            throw ConfigError("'analysis' must be a JSON object");
        out.analysis = parseAnalysisObject(doc["analysis"]);
    }

    return out;
}

} // namespace qmc_sensitivity
