#include "runner.h"

#include <iomanip>
#include <memory>
#include <optional>
#include <string>

#include <glog/logging.h>

#include "pipeline/observer.h"
#include "pipeline/pipeline_config.h"

namespace Handoff {

cxxopts::Options MakeRunnerOptions() {
    cxxopts::Options options("handoff_run", "Bounded producer/consumer handoff");

    options.add_options()
        ("n,size", "Number of source values", cxxopts::value<size_t>()->default_value("10"))
        ("p,policy", "Source policy: mixed, integers, reals", cxxopts::value<std::string>()->default_value("mixed"))
        ("seed", "Source generator seed (0: random)", cxxopts::value<size_t>()->default_value("0"))
        ("c,capacity", "Channel capacity (0: half the source, at least 1)",
            cxxopts::value<size_t>()->default_value("0"))
        ("b,backend", "Channel backend: monitor, mpmc", cxxopts::value<std::string>()->default_value("monitor"))
        ("trace", "Log every produced and consumed item")
        ("print", "Print source and destination")
        ("f,config", "YAML configuration file", cxxopts::value<std::string>())
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("h,help", "Print usage");
    return options;
}

void ApplyCommandLine(const cxxopts::ParseResult& result, HandoffConfig& config) {
    if (result.count("size")) config.pipeline.source_length.set(result["size"].as<size_t>());
    if (result.count("capacity")) config.pipeline.capacity.set(result["capacity"].as<size_t>());
    if (result.count("backend")) config.pipeline.backend.set(result["backend"].as<std::string>());
    if (result.count("policy")) config.source.policy.set(result["policy"].as<std::string>());
    if (result.count("seed")) config.source.seed.set(result["seed"].as<size_t>());
    if (result.count("trace")) config.logging.trace_items.set(true);
    if (result.count("print")) config.logging.print_sequences.set(true);
    if (result.count("log_level")) config.logging.verbosity.set(result["log_level"].as<int>());
}

int ExitCodeFor(const PipelineReport& report) {
    return report.passed ? kExitPassed : kExitFailed;
}

void PrintReport(const PipelineReport& report, bool print_sequences, std::ostream& out) {
    if (print_sequences) {
        out << "Source:      " << FormatSequence(report.source) << "\n";
        out << "Destination: " << FormatSequence(report.destination) << "\n";
    }
    out << (report.passed ? "PASS" : "FAIL")
        << " items=" << report.source.size()
        << " capacity=" << report.capacity
        << " peak=" << report.peak_channel_size
        << " backend=" << ChannelBackendName(report.backend)
        << " elapsed=" << std::fixed << std::setprecision(4) << report.ElapsedSeconds() << "s"
        << std::endl;
}

int RunHandoff(int argc, char* argv[], Configuration& configuration, std::ostream& out) {
    cxxopts::Options options = MakeRunnerOptions();

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        LOG(ERROR) << "Failed to parse options: " << e.what();
        out << options.help() << std::endl;
        return kExitBadOptions;
    }
    const cxxopts::ParseResult& result = *parsed;

    if (result.count("help")) {
        out << options.help() << std::endl;
        return kExitPassed;
    }

    if (result.count("config") && !configuration.loadFromFile(result["config"].as<std::string>())) {
        return kExitBadOptions;
    }

    try {
        ApplyCommandLine(result, configuration.config());
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid option value: " << e.what();
        return kExitBadOptions;
    }
    if (!configuration.validate()) {
        return kExitBadOptions;
    }

    const HandoffConfig& config = configuration.config();
    FLAGS_v = config.logging.verbosity.get();

    PipelineOptions pipeline_options;
    std::string error;
    if (!PipelineOptionsFromConfig(config, pipeline_options, error)) {
        LOG(ERROR) << error;
        return kExitBadOptions;
    }

    Pipeline pipeline(pipeline_options);
    pipeline.SetObserver(std::make_shared<LoggingObserver>(config.logging.trace_items.get()));

    PipelineReport report = pipeline.Run();
    PrintReport(report, config.logging.print_sequences.get(), out);
    return ExitCodeFor(report);
}

} // namespace Handoff
