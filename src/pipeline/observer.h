#pragma once

#include <cstddef>
#include <string>

#include "item.h"

namespace Handoff {

enum class WorkerRole {
    kProducer,
    kConsumer,
};

const char* WorkerRoleName(WorkerRole role);

/**
 * Diagnostic hook for pipeline events. Not needed for correctness.
 * Methods are invoked from the producer and consumer threads concurrently,
 * so implementations must be thread-safe. channel_size is a snapshot taken
 * right after the insert or remove.
 */
class PipelineObserver {
public:
    virtual ~PipelineObserver() = default;

    virtual void OnItemProduced(const Item& item, size_t channel_size) {}
    virtual void OnEndOfStreamProduced(size_t items_produced) {}
    virtual void OnItemConsumed(const Item& item, size_t channel_size) {}
    virtual void OnEndOfStreamConsumed(size_t items_consumed) {}
    virtual void OnWorkerFault(WorkerRole role, const std::string& error_msg) {}
};

/**
 * Observer that writes to glog. Per-item lines are emitted only when
 * trace_items is set. Faults are already logged by the workers themselves.
 */
class LoggingObserver : public PipelineObserver {
public:
    explicit LoggingObserver(bool trace_items = false) : trace_items_(trace_items) {}

    void OnItemProduced(const Item& item, size_t channel_size) override;
    void OnEndOfStreamProduced(size_t items_produced) override;
    void OnItemConsumed(const Item& item, size_t channel_size) override;
    void OnEndOfStreamConsumed(size_t items_consumed) override;

private:
    const bool trace_items_;
};

} // namespace Handoff
