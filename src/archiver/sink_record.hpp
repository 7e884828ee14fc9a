#ifndef SINK_RECORD_HPP
#define SINK_RECORD_HPP

#include "partition_id.hpp"
#include <string>
#include <cstdint>

// A single record delivered by the host runtime
struct SinkRecord {
    PartitionId partition;
    int64_t offset = -1;       // -1 when the host does not supply one
    int64_t timestamp_ms = 0;  // 0 when unknown
    std::string key;
    std::string value;

    size_t sizeBytes() const { return key.size() + value.size(); }
};

#endif // SINK_RECORD_HPP
