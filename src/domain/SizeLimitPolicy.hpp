/**
 * @file SizeLimitPolicy.hpp
 * @brief Compiled-in ceilings and the per-invocation size policy.
 */

#pragma once
#include <cstdint>

namespace shotgate::domain {

constexpr std::uint64_t kBytesPerMegabyte = 1024ULL * 1024ULL;

constexpr std::uint64_t kHardMaxFileSizeBytes = 50ULL * kBytesPerMegabyte;
constexpr std::uint64_t kHardMaxTotalSizeBytes = 200ULL * kBytesPerMegabyte;
constexpr std::uint64_t kDefaultMaxFileSizeBytes = 50ULL * kBytesPerMegabyte;

// 1 GiB of RGBA data divided by 3.
constexpr std::uint64_t kMaxImagePixels = 89478485ULL;

/**
 * @struct SizeLimitPolicy
 * @brief Byte ceilings, both already clamped to the hard maxima.
 */
struct SizeLimitPolicy {
    std::uint64_t maxFileBytes = kDefaultMaxFileSizeBytes;
    std::uint64_t maxTotalBytes = kHardMaxTotalSizeBytes;
};

} // namespace shotgate::domain
