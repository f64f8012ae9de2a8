#ifndef HANDOFF_PIPELINE_CHANNEL_H_
#define HANDOFF_PIPELINE_CHANNEL_H_

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace Handoff {

/**
 * Raised by a channel when its internal synchronization fails. Fatal to the
 * worker that observes it.
 */
class ChannelFault : public std::runtime_error {
public:
    explicit ChannelFault(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Fixed-capacity FIFO shared by exactly one inserting and one removing thread.
 * Insert blocks while the channel holds Capacity() elements, Remove blocks
 * while it is empty. Neither call times out.
 */
template<typename T>
class Channel {
public:
    virtual ~Channel() = default;

    virtual void Insert(T element) = 0;
    virtual T Remove() = 0;

    virtual size_t Capacity() const = 0;

    // Snapshot of the current length; may be stale by the time it is read.
    virtual size_t Size() const = 0;

    // Largest length observed since construction.
    virtual size_t PeakSize() const = 0;
};

enum class ChannelBackend {
    kMonitor,   // mutex + not-full/not-empty conditions
    kMpmc,      // folly::MPMCQueue blocking read/write
};

std::optional<ChannelBackend> ParseChannelBackend(const std::string& name);
const char* ChannelBackendName(ChannelBackend backend);

/**
 * Capacity used for a source of n elements: half the source, at least one.
 */
constexpr size_t ChannelCapacityFor(size_t n) {
    return n / 2 > 1 ? n / 2 : 1;
}

} // namespace Handoff

#endif // HANDOFF_PIPELINE_CHANNEL_H_
