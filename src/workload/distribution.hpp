/**
 * @file distribution.hpp
 * @brief Parametrized probability distributions for workload sampling.
 *
 * A thin lookup from a distribution family name to the matching <random>
 * distribution. Parameters follow the scipy.stats convention used by workload
 * profiles: shape parameters first, then optional loc and scale.
 */

#pragma once

#include "core/result.hpp"

#include <cstddef>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace tracie {

/// Random engine shared by all samplers of one generator run.
using RandomEngine = std::mt19937_64;

enum class DistributionFamily : uint8_t {
    Exponential,   ///< "expon"
    Normal,        ///< "norm"
    LogNormal,     ///< "lognorm"      shape: s
    Gamma,         ///< "gamma"        shape: a
    Weibull,       ///< "weibull_min"  shape: c
    Uniform,       ///< "uniform"      [loc, loc + scale)
    Cauchy,        ///< "cauchy"
    ChiSquared     ///< "chi2"         shape: df
};

[[nodiscard]] std::string_view to_string(DistributionFamily family) noexcept;

/**
 * @brief Number of leading shape parameters a family requires.
 */
[[nodiscard]] size_t shape_count(DistributionFamily family) noexcept;

/**
 * @brief One configured distribution producing non-negative draws.
 *
 * Immutable after construction; the random stream is passed in by the caller
 * so a fixed seed yields reproducible traces.
 */
class DistributionSampler {
public:
    /**
     * @brief Validate a family name and parameter list.
     *
     * Fails with ErrorCode::ConfigurationError for an unknown family, a wrong
     * parameter count, non-finite values, a non-positive shape or scale.
     */
    static Result<DistributionSampler> create(std::string_view family_name,
                                              std::vector<double> params);

    /// Draw once and clamp to >= 0.
    [[nodiscard]] double sample(RandomEngine& rng) const;

    [[nodiscard]] DistributionFamily family() const noexcept { return family_; }
    [[nodiscard]] const std::vector<double>& params() const noexcept { return params_; }
    [[nodiscard]] double loc() const noexcept { return loc_; }
    [[nodiscard]] double scale() const noexcept { return scale_; }

private:
    DistributionSampler(DistributionFamily family, std::vector<double> params,
                        double shape, double loc, double scale);

    double standard_variate(RandomEngine& rng) const;

    DistributionFamily family_;
    std::vector<double> params_;
    double shape_;
    double loc_;
    double scale_;
};

}  // namespace tracie
