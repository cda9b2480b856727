/**
 * @file SizeLimitResolver.cpp
 * @brief Implementation of SizeLimitResolver.
 */

#include "infrastructure/SizeLimitResolver.hpp"

#include <algorithm>
#include <optional>

namespace shotgate::infrastructure {

using domain::SizeLimitPolicy;

namespace {

// Positive megabyte values only. Booleans are not numbers here.
std::optional<double> PositiveMegabytes(const nlohmann::json& config, const char* key) {
    if (!config.is_object()) {
        return std::nullopt;
    }
    auto it = config.find(key);
    if (it == config.end() || !it->is_number()) {
        return std::nullopt;
    }
    const double value = it->get<double>();
    if (!(value > 0)) {
        return std::nullopt;
    }
    return value;
}

std::uint64_t ToClampedBytes(double megabytes, std::uint64_t hardMax) {
    const double bytes = megabytes * static_cast<double>(domain::kBytesPerMegabyte);
    if (bytes >= static_cast<double>(hardMax)) {
        return hardMax;
    }
    return static_cast<std::uint64_t>(bytes);
}

} // namespace

SizeLimitPolicy SizeLimitResolver::Resolve(const nlohmann::json& config) {
    SizeLimitPolicy policy;

    auto fileMb = PositiveMegabytes(config, domain::config_keys::kMaxFileSizeMb);
    policy.maxFileBytes = fileMb ? ToClampedBytes(*fileMb, domain::kHardMaxFileSizeBytes)
                                 : std::min(domain::kDefaultMaxFileSizeBytes, domain::kHardMaxFileSizeBytes);

    auto totalMb = PositiveMegabytes(config, domain::config_keys::kMaxTotalSizeMb);
    policy.maxTotalBytes = totalMb ? ToClampedBytes(*totalMb, domain::kHardMaxTotalSizeBytes)
                                   : domain::kHardMaxTotalSizeBytes;

    return policy;
}

SizeLimitPolicy SizeLimitResolver::Resolve(const domain::ConfigDocument& config) {
    nlohmann::json j;
    j[domain::config_keys::kMaxFileSizeMb] = config.maxFileSizeMb;
    j[domain::config_keys::kMaxTotalSizeMb] = config.maxTotalSizeMb;
    return Resolve(j);
}

} // namespace shotgate::infrastructure
