#pragma once

#include <string>

#include "common/configuration.h"
#include "pipeline.h"

namespace Handoff {

/**
 * Translates the loaded configuration into PipelineOptions.
 * @return false with error set when a policy or backend name is unknown.
 */
bool PipelineOptionsFromConfig(const HandoffConfig& config, PipelineOptions& options, std::string& error);

} // namespace Handoff
