/**
 * @file distribution.cpp
 * @brief DistributionSampler over the <random> distribution catalog.
 */

#include "workload/distribution.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>
#include <optional>
#include <utility>

namespace tracie {

namespace {

struct FamilyEntry {
    std::string_view name;
    DistributionFamily family;
};

constexpr std::array<FamilyEntry, 8> kFamilies{{
    {"expon",       DistributionFamily::Exponential},
    {"norm",        DistributionFamily::Normal},
    {"lognorm",     DistributionFamily::LogNormal},
    {"gamma",       DistributionFamily::Gamma},
    {"weibull_min", DistributionFamily::Weibull},
    {"uniform",     DistributionFamily::Uniform},
    {"cauchy",      DistributionFamily::Cauchy},
    {"chi2",        DistributionFamily::ChiSquared},
}};

std::optional<DistributionFamily> find_family(std::string_view name) {
    auto it = std::find_if(kFamilies.begin(), kFamilies.end(),
                           [name](const FamilyEntry& e) { return e.name == name; });
    if (it == kFamilies.end()) return std::nullopt;
    return it->family;
}

}  // anonymous namespace

std::string_view to_string(DistributionFamily family) noexcept {
    for (const auto& entry : kFamilies) {
        if (entry.family == family) return entry.name;
    }
    return "unknown";
}

size_t shape_count(DistributionFamily family) noexcept {
    switch (family) {
        case DistributionFamily::LogNormal:
        case DistributionFamily::Gamma:
        case DistributionFamily::Weibull:
        case DistributionFamily::ChiSquared:
            return 1;
        case DistributionFamily::Exponential:
        case DistributionFamily::Normal:
        case DistributionFamily::Uniform:
        case DistributionFamily::Cauchy:
            return 0;
    }
    return 0;
}

Result<DistributionSampler> DistributionSampler::create(std::string_view family_name,
                                                        std::vector<double> params) {
    auto family = find_family(family_name);
    if (!family) {
        return Error{ErrorCode::ConfigurationError,
                     std::format("Unsupported distribution type '{}'", family_name)};
    }

    const size_t shapes = shape_count(*family);
    if (params.size() < shapes || params.size() > shapes + 2) {
        return Error{ErrorCode::ConfigurationError,
                     std::format("Distribution '{}' takes {} to {} parameters, got {}",
                                 family_name, shapes, shapes + 2, params.size())};
    }

    for (double p : params) {
        if (!std::isfinite(p)) {
            return Error{ErrorCode::ConfigurationError,
                         std::format("Distribution '{}' has a non-finite parameter", family_name)};
        }
    }

    double shape = shapes > 0 ? params[0] : 0.0;
    double loc = params.size() > shapes ? params[shapes] : 0.0;
    double scale = params.size() > shapes + 1 ? params[shapes + 1] : 1.0;

    if (shapes > 0 && shape <= 0.0) {
        return Error{ErrorCode::ConfigurationError,
                     std::format("Distribution '{}' requires a positive shape, got {}",
                                 family_name, shape)};
    }
    if (scale <= 0.0) {
        return Error{ErrorCode::ConfigurationError,
                     std::format("Distribution '{}' requires a positive scale, got {}",
                                 family_name, scale)};
    }

    return DistributionSampler(*family, std::move(params), shape, loc, scale);
}

DistributionSampler::DistributionSampler(DistributionFamily family, std::vector<double> params,
                                         double shape, double loc, double scale)
    : family_(family), params_(std::move(params)), shape_(shape), loc_(loc), scale_(scale) {}

double DistributionSampler::sample(RandomEngine& rng) const {
    return std::max(0.0, loc_ + scale_ * standard_variate(rng));
}

double DistributionSampler::standard_variate(RandomEngine& rng) const {
    // Distribution objects hold cached state; one per draw keeps sample() const.
    switch (family_) {
        case DistributionFamily::Exponential:
            return std::exponential_distribution<double>(1.0)(rng);
        case DistributionFamily::Normal:
            return std::normal_distribution<double>(0.0, 1.0)(rng);
        case DistributionFamily::LogNormal:
            return std::lognormal_distribution<double>(0.0, shape_)(rng);
        case DistributionFamily::Gamma:
            return std::gamma_distribution<double>(shape_, 1.0)(rng);
        case DistributionFamily::Weibull:
            return std::weibull_distribution<double>(shape_, 1.0)(rng);
        case DistributionFamily::Uniform:
            return std::uniform_real_distribution<double>(0.0, 1.0)(rng);
        case DistributionFamily::Cauchy:
            return std::cauchy_distribution<double>(0.0, 1.0)(rng);
        case DistributionFamily::ChiSquared:
            return std::chi_squared_distribution<double>(shape_)(rng);
    }
    return 0.0;
}

}  // namespace tracie
