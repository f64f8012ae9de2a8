#ifndef HANDOFF_RUNNER_RUNNER_H_
#define HANDOFF_RUNNER_RUNNER_H_

#include <ostream>

#include <cxxopts.hpp>

#include "common/configuration.h"
#include "pipeline/pipeline.h"

namespace Handoff {

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitBadOptions = 2;

// Options understood by handoff_run.
cxxopts::Options MakeRunnerOptions();

// Command line values replace file values. A set HANDOFF_* environment
// variable still takes precedence, as for every ConfigValue.
void ApplyCommandLine(const cxxopts::ParseResult& result, HandoffConfig& config);

// kExitPassed when every item arrived and neither worker faulted.
int ExitCodeFor(const PipelineReport& report);

void PrintReport(const PipelineReport& report, bool print_sequences, std::ostream& out);

/**
 * Parses argv, layers the YAML file and the command line over the
 * configuration, runs one pipeline and prints its report to out.
 * @return kExitPassed, kExitFailed, or kExitBadOptions for an unusable
 *         command line or configuration.
 */
int RunHandoff(int argc, char* argv[], Configuration& configuration, std::ostream& out);

} // namespace Handoff

#endif // HANDOFF_RUNNER_RUNNER_H_
