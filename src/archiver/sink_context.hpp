#ifndef SINK_CONTEXT_HPP
#define SINK_CONTEXT_HPP

#include "partition_id.hpp"
#include <vector>
#include <cstdint>

// Operations the coordinator needs from the host runtime that delivers records
class SinkContext {
public:
    virtual ~SinkContext() = default;

    // Partitions currently assigned to this consumer
    virtual std::vector<PartitionId> assignment() = 0;

    // Stop delivering records for a partition until resume() is called
    virtual void pause(const PartitionId& partition) = 0;
    virtual void resume(const PartitionId& partition) = 0;

    // Next record delivered for the partition will be at this offset
    virtual void seek(const PartitionId& partition, int64_t offset) = 0;
};

#endif // SINK_CONTEXT_HPP
