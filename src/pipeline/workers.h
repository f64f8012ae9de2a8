#ifndef HANDOFF_PIPELINE_WORKERS_H_
#define HANDOFF_PIPELINE_WORKERS_H_

#include <cstddef>
#include <string>

#include "channel.h"
#include "item.h"
#include "observer.h"

namespace Handoff {

enum class WorkerOutcome {
	kCompleted,
	kFaulted,
};

struct WorkerResult {
	WorkerOutcome outcome = WorkerOutcome::kCompleted;
	size_t items = 0;       // Items inserted (producer) or written (consumer)
	std::string error;      // Set when outcome == kFaulted
};

/**
 * Inserts Item{i, source[i]} for every i in order, then one EndOfStream.
 * Blocks inside Insert while the channel is full.
 *
 * A fault from the channel is logged and reported to the observer, and the
 * producer returns without inserting EndOfStream. The consumer is not told;
 * it keeps waiting on the channel.
 * @param observer May be null.
 */
WorkerResult RunProducer(const Source& source, Channel<ChannelElement>& channel,
                         PipelineObserver* observer);

/**
 * Removes elements until EndOfStream and writes each Item's value into
 * destination[index]. No Remove() follows EndOfStream.
 *
 * An index outside the destination or a slot written twice is a fault, as is
 * a fault from the channel. Faults are logged and reported to the observer;
 * the destination may be left partially populated.
 * @param observer May be null.
 */
WorkerResult RunConsumer(Channel<ChannelElement>& channel, Destination& destination,
                         PipelineObserver* observer);

} // namespace Handoff

#endif // HANDOFF_PIPELINE_WORKERS_H_
