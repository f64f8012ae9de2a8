#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "item.h"

namespace Handoff {

enum class SourcePolicy {
    kMixed,     // each element an integer or a real with equal probability
    kIntegers,  // integers in [1, 100]
    kReals,     // reals in [0, 100)
};

std::optional<SourcePolicy> ParseSourcePolicy(const std::string& name);
const char* SourcePolicyName(SourcePolicy policy);

/**
 * Builds a source of n values according to policy. A seed of 0 draws from
 * std::random_device; any other seed makes the output reproducible.
 */
Source GenerateSource(size_t n, SourcePolicy policy = SourcePolicy::kMixed, uint64_t seed = 0);

} // namespace Handoff
