#include "workers.h"

#include <exception>

#include <glog/logging.h>

namespace Handoff {

namespace {

WorkerResult Fault(WorkerRole role, WorkerResult result, const std::string& error_msg,
                   PipelineObserver* observer) {
	LOG(ERROR) << "[" << WorkerRoleName(role) << "] error after " << result.items
	           << " items: " << error_msg;
	if (observer) {
		observer->OnWorkerFault(role, error_msg);
	}
	result.outcome = WorkerOutcome::kFaulted;
	result.error = error_msg;
	return result;
}

} // namespace

WorkerResult RunProducer(const Source& source, Channel<ChannelElement>& channel,
                         PipelineObserver* observer) {
	WorkerResult result;
	try {
		for (size_t i = 0; i < source.size(); ++i) {
			Item item{i, source[i]};
			channel.Insert(item);
			++result.items;
			VLOG(3) << "[Producer] index=" << i << " channel_size=" << channel.Size();
			if (observer) {
				observer->OnItemProduced(item, channel.Size());
			}
		}

		// Always emitted, also for an empty source.
		channel.Insert(EndOfStream{});
		if (observer) {
			observer->OnEndOfStreamProduced(result.items);
		}
	} catch (const std::exception& e) {
		return Fault(WorkerRole::kProducer, result, e.what(), observer);
	}
	return result;
}

WorkerResult RunConsumer(Channel<ChannelElement>& channel, Destination& destination,
                         PipelineObserver* observer) {
	WorkerResult result;
	try {
		while (true) {
			ChannelElement element = channel.Remove();
			if (IsEndOfStream(element)) {
				break;
			}

			const Item& item = std::get<Item>(element);
			if (item.index >= destination.size()) {
				return Fault(WorkerRole::kConsumer, result,
				             "index " + std::to_string(item.index) + " outside destination of size " +
				                 std::to_string(destination.size()),
				             observer);
			}
			if (destination[item.index].has_value()) {
				return Fault(WorkerRole::kConsumer, result,
				             "slot " + std::to_string(item.index) + " written twice", observer);
			}

			destination[item.index] = item.value;
			++result.items;
			VLOG(3) << "[Consumer] index=" << item.index << " channel_size=" << channel.Size();
			if (observer) {
				observer->OnItemConsumed(item, channel.Size());
			}
		}

		if (observer) {
			observer->OnEndOfStreamConsumed(result.items);
		}
	} catch (const std::exception& e) {
		return Fault(WorkerRole::kConsumer, result, e.what(), observer);
	}
	return result;
}

} // namespace Handoff
