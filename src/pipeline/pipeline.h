#ifndef HANDOFF_PIPELINE_PIPELINE_H_
#define HANDOFF_PIPELINE_PIPELINE_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <thread>
#include <utility>

#include "channel.h"
#include "item.h"
#include "observer.h"
#include "source_generator.h"
#include "workers.h"

namespace Handoff {

struct PipelineOptions {
    size_t source_length = 10;
    SourcePolicy policy = SourcePolicy::kMixed;
    uint64_t seed = 0;
    // 0 derives the capacity from the source length (ChannelCapacityFor).
    size_t capacity = 0;
    ChannelBackend backend = ChannelBackend::kMonitor;
};

struct ValidationResult {
    bool ok = true;
    size_t mismatched = 0;      // slots holding a value other than the source's
    size_t missing = 0;         // slots never written
    size_t first_bad_index = 0; // meaningful only when !ok and sizes match
    bool size_mismatch = false;
};

/**
 * Compares destination with source element-wise using SameValue: integer and
 * real values of equal magnitude differ, NaN matches NaN.
 */
ValidationResult ValidateTransfer(const Source& source, const Destination& destination);

struct PipelineReport {
    bool passed = false;
    std::chrono::steady_clock::duration elapsed{};
    size_t capacity = 0;
    size_t peak_channel_size = 0;
    ChannelBackend backend = ChannelBackend::kMonitor;
    WorkerResult producer;
    WorkerResult consumer;
    ValidationResult validation;
    Source source;
    Destination destination;

    double ElapsedSeconds() const {
        return std::chrono::duration<double>(elapsed).count();
    }
};

std::unique_ptr<Channel<ChannelElement>> MakeChannel(ChannelBackend backend, size_t capacity);

/**
 * Pipeline runs one producer and one consumer over a fresh channel and
 * validates the result once both threads have joined.
 *
 * A worker that faults leaves the other one blocked on the channel; Run()
 * does not return in that case. If the consumer thread cannot be started the
 * consumer runs on the calling thread instead, so the producer is always
 * joined.
 */
class Pipeline {
public:
    // Starts one worker body on its own thread. Throws std::system_error when
    // no thread can be created, as the std::thread constructor does.
    using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

    explicit Pipeline(PipelineOptions options);

    void SetObserver(std::shared_ptr<PipelineObserver> observer) { observer_ = std::move(observer); }
    void SetThreadLauncher(ThreadLauncher launcher) { launcher_ = std::move(launcher); }

    // Generates the source from options.
    PipelineReport Run();

    // Transfers the given source; options.source_length and policy are ignored.
    PipelineReport Run(Source source);

    // Capacity the channel gets for a source of n elements.
    size_t CapacityFor(size_t n) const;

    const PipelineOptions& options() const { return options_; }

private:
    PipelineOptions options_;
    std::shared_ptr<PipelineObserver> observer_;
    ThreadLauncher launcher_;
};

} // namespace Handoff

#endif // HANDOFF_PIPELINE_PIPELINE_H_
