#ifndef PARTITION_ID_HPP
#define PARTITION_ID_HPP

#include <string>
#include <cstdint>
#include <cstdio>
#include <tuple>
#include <utility>

// Identifies one ordered record stream: a topic and a partition number
struct PartitionId {
    std::string topic;
    int32_t partition = 0;

    PartitionId() = default;
    PartitionId(std::string t, int32_t p) : topic(std::move(t)), partition(p) {}

    // "<topic>-<partition padded to 5 digits>", used in file names and object keys
    std::string toString() const {
        char suffix[16];
        std::snprintf(suffix, sizeof(suffix), "-%05d", partition);
        return topic + suffix;
    }

    bool operator<(const PartitionId& other) const {
        return std::tie(topic, partition) < std::tie(other.topic, other.partition);
    }

    bool operator==(const PartitionId& other) const {
        return partition == other.partition && topic == other.topic;
    }

    bool operator!=(const PartitionId& other) const {
        return !(*this == other);
    }
};

#endif // PARTITION_ID_HPP
