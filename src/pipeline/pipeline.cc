#include "pipeline.h"

#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include <glog/logging.h>

#include "bounded_channel.h"
#include "mpmc_channel.h"

namespace Handoff {

ValidationResult ValidateTransfer(const Source& source, const Destination& destination) {
    ValidationResult result;
    if (source.size() != destination.size()) {
        result.ok = false;
        result.size_mismatch = true;
        return result;
    }

    for (size_t i = 0; i < source.size(); ++i) {
        bool bad = false;
        if (!destination[i].has_value()) {
            ++result.missing;
            bad = true;
        } else if (!SameValue(*destination[i], source[i])) {
            ++result.mismatched;
            bad = true;
        }
        if (bad && result.ok) {
            result.ok = false;
            result.first_bad_index = i;
        }
    }
    return result;
}

std::unique_ptr<Channel<ChannelElement>> MakeChannel(ChannelBackend backend, size_t capacity) {
    switch (backend) {
        case ChannelBackend::kMonitor:
            return std::make_unique<BoundedChannel<ChannelElement>>(capacity);
        case ChannelBackend::kMpmc:
            return std::make_unique<MpmcChannel<ChannelElement>>(capacity);
    }
    throw std::invalid_argument("Unknown channel backend");
}

Pipeline::Pipeline(PipelineOptions options)
    : options_(std::move(options)),
      launcher_([](std::function<void()> body) { return std::thread(std::move(body)); }) {}

size_t Pipeline::CapacityFor(size_t n) const {
    if (options_.capacity > 0) {
        return options_.capacity;
    }
    return ChannelCapacityFor(n);
}

PipelineReport Pipeline::Run() {
    return Run(GenerateSource(options_.source_length, options_.policy, options_.seed));
}

PipelineReport Pipeline::Run(Source source) {
    PipelineReport report;
    report.source = std::move(source);
    report.destination.assign(report.source.size(), std::nullopt);
    report.capacity = CapacityFor(report.source.size());
    report.backend = options_.backend;

    std::unique_ptr<Channel<ChannelElement>> channel = MakeChannel(options_.backend, report.capacity);
    PipelineObserver* observer = observer_.get();

    LOG(INFO) << "Starting pipeline: items=" << report.source.size()
              << " capacity=" << report.capacity
              << " backend=" << ChannelBackendName(options_.backend);

    auto start = std::chrono::steady_clock::now();

    const Source& src = report.source;
    Destination& dst = report.destination;
    std::thread producer = launcher_([&report, &src, &channel, observer]() {
        report.producer = RunProducer(src, *channel, observer);
    });
    auto consume = [&report, &dst, &channel, observer]() {
        report.consumer = RunConsumer(*channel, dst, observer);
    };
    std::thread consumer;
    try {
        consumer = launcher_(consume);
    } catch (const std::system_error& e) {
        LOG(WARNING) << "Could not start consumer thread (" << e.what()
                     << "); consuming on the calling thread";
        consume();
    }

    producer.join();
    if (consumer.joinable()) {
        consumer.join();
    }

    report.elapsed = std::chrono::steady_clock::now() - start;
    report.peak_channel_size = channel->PeakSize();
    channel.reset();

    report.validation = ValidateTransfer(report.source, report.destination);
    report.passed = report.validation.ok &&
                    report.producer.outcome == WorkerOutcome::kCompleted &&
                    report.consumer.outcome == WorkerOutcome::kCompleted;

    if (report.passed) {
        LOG(INFO) << "All data transferred successfully in " << report.ElapsedSeconds() << "s";
    } else if (!report.validation.ok) {
        if (report.validation.size_mismatch) {
            LOG(ERROR) << "Validation failed: destination size " << report.destination.size()
                       << " != source size " << report.source.size();
        } else {
            LOG(ERROR) << "Validation failed: mismatched=" << report.validation.mismatched
                       << " missing=" << report.validation.missing
                       << " first_bad_index=" << report.validation.first_bad_index;
        }
    } else {
        LOG(ERROR) << "Pipeline finished with a worker fault";
    }
    return report;
}

} // namespace Handoff
