#include "channel.h"

#include <algorithm>
#include <cctype>

namespace Handoff {

std::optional<ChannelBackend> ParseChannelBackend(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "monitor") return ChannelBackend::kMonitor;
    if (lower == "mpmc" || lower == "folly") return ChannelBackend::kMpmc;
    return std::nullopt;
}

const char* ChannelBackendName(ChannelBackend backend) {
    switch (backend) {
        case ChannelBackend::kMonitor:
            return "monitor";
        case ChannelBackend::kMpmc:
            return "mpmc";
    }
    return "unknown";
}

} // namespace Handoff
