#include "pipeline_config.h"

namespace Handoff {

bool PipelineOptionsFromConfig(const HandoffConfig& config, PipelineOptions& options, std::string& error) {
    std::optional<SourcePolicy> policy = ParseSourcePolicy(config.source.policy.get());
    if (!policy) {
        error = "Unknown source policy '" + config.source.policy.get() +
                "' (expected mixed, integers or reals)";
        return false;
    }

    std::optional<ChannelBackend> backend = ParseChannelBackend(config.pipeline.backend.get());
    if (!backend) {
        error = "Unknown channel backend '" + config.pipeline.backend.get() +
                "' (expected monitor or mpmc)";
        return false;
    }

    options.source_length = config.pipeline.source_length.get();
    options.capacity = config.pipeline.capacity.get();
    options.seed = config.source.seed.get();
    options.policy = *policy;
    options.backend = *backend;
    return true;
}

} // namespace Handoff
