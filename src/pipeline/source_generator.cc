#include "source_generator.h"

#include <algorithm>
#include <cctype>
#include <random>

namespace Handoff {

namespace {

constexpr int64_t kMinInteger = 1;
constexpr int64_t kMaxInteger = 100;
constexpr double kRealScale = 100.0;

} // namespace

std::optional<SourcePolicy> ParseSourcePolicy(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "mixed") return SourcePolicy::kMixed;
    if (lower == "integers") return SourcePolicy::kIntegers;
    if (lower == "reals") return SourcePolicy::kReals;
    return std::nullopt;
}

const char* SourcePolicyName(SourcePolicy policy) {
    switch (policy) {
        case SourcePolicy::kMixed:
            return "mixed";
        case SourcePolicy::kIntegers:
            return "integers";
        case SourcePolicy::kReals:
            return "reals";
    }
    return "unknown";
}

Source GenerateSource(size_t n, SourcePolicy policy, uint64_t seed) {
    std::mt19937_64 gen(seed != 0 ? seed : std::random_device{}());
    std::uniform_int_distribution<int64_t> int_dist(kMinInteger, kMaxInteger);
    std::uniform_real_distribution<double> real_dist(0.0, kRealScale);
    std::bernoulli_distribution pick_integer(0.5);

    Source source;
    source.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        bool integer = policy == SourcePolicy::kIntegers ||
                       (policy == SourcePolicy::kMixed && pick_integer(gen));
        if (integer) {
            source.emplace_back(int_dist(gen));
        } else {
            source.emplace_back(real_dist(gen));
        }
    }
    return source;
}

} // namespace Handoff
