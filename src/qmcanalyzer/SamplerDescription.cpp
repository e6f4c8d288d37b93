#include "SamplerDescription.h"

#include <boost/algorithm/string.hpp>

#include "SensitivityException.h"

namespace qmc_sensitivity {

std::string toString(SamplerKind kind) {
    switch (kind) {
        case SamplerKind::QMC:
            return "qmc";
        case SamplerKind::MC:
            return "mc";
        case SamplerKind::OTHER:
            return "other";
    }
    return "other";
}

SamplerKind samplerKindFromString(const std::string& name) {
    const std::string key = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(name));
    if (key == "qmc")
        return SamplerKind::QMC;
    if (key == "mc")
        return SamplerKind::MC;
    if (key == "other")
        return SamplerKind::OTHER;

    throw ConfigError("Unknown sampler kind: '" + name + "'");
}

} // namespace qmc_sensitivity
