#include "observer.h"

#include <glog/logging.h>

namespace Handoff {

const char* WorkerRoleName(WorkerRole role) {
    switch (role) {
        case WorkerRole::kProducer:
            return "Producer";
        case WorkerRole::kConsumer:
            return "Consumer";
    }
    return "Unknown";
}

void LoggingObserver::OnItemProduced(const Item& item, size_t channel_size) {
    if (trace_items_) {
        LOG(INFO) << "[Producer] produced " << item << " channel_size=" << channel_size;
    }
}

void LoggingObserver::OnEndOfStreamProduced(size_t items_produced) {
    LOG(INFO) << "[Producer] finished producing " << items_produced << " items";
}

void LoggingObserver::OnItemConsumed(const Item& item, size_t channel_size) {
    if (trace_items_) {
        LOG(INFO) << "[Consumer] consumed " << item << " channel_size=" << channel_size;
    }
}

void LoggingObserver::OnEndOfStreamConsumed(size_t items_consumed) {
    LOG(INFO) << "[Consumer] finished consuming " << items_consumed << " items";
}

} // namespace Handoff
