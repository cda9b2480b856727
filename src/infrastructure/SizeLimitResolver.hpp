/**
 * @file SizeLimitResolver.hpp
 * @brief Derives clamped byte ceilings from untrusted configuration values.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/ConfigDocument.hpp"
#include "domain/SizeLimitPolicy.hpp"

namespace shotgate::infrastructure {

/**
 * @class SizeLimitResolver
 * @brief Per-file and aggregate ceilings that configuration cannot disable.
 *
 * A zero, negative, missing or mistyped aggregate value yields the hard
 * maximum, never "unlimited".
 */
class SizeLimitResolver {
public:
    static domain::SizeLimitPolicy Resolve(const nlohmann::json& config);
    static domain::SizeLimitPolicy Resolve(const domain::ConfigDocument& config);
};

} // namespace shotgate::infrastructure
