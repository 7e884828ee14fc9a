#ifndef QUEUE_CONSUMER_HPP
#define QUEUE_CONSUMER_HPP

#include "../config.hpp"
#include "partition_id.hpp"
#include "sink_context.hpp"
#include "sink_record.hpp"
#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

#include <cppkafka/cppkafka.h>

// Callback types for rebalance events
using PartitionAssignmentCallback = std::function<void(const std::vector<PartitionId>&)>;
using PartitionRevocationCallback = std::function<void(const std::vector<PartitionId>&)>;

// Consumer group member delivering records to the archiver.
// Offsets are committed manually, only for data that is already archived.
class QueueConsumer : public SinkContext {
public:
    QueueConsumer(const ArchiverConfig& config);
    ~QueueConsumer() override;

    // Create the consumer and subscribe (set callbacks first)
    bool initialize();

    // Poll up to max_records. Rebalance callbacks run inside this call; an
    // exception thrown by one of them is rethrown here once polling returns.
    std::vector<SinkRecord> poll(size_t max_records, std::chrono::milliseconds timeout);

    // Leave the consumer group
    void close();

    bool isInitialized() const { return consumer_ != nullptr; }

    // Commit the next offset to read for each partition
    bool commitOffsets(const std::map<PartitionId, int64_t>& offsets);

    void setAssignmentCallback(PartitionAssignmentCallback callback);
    void setRevocationCallback(PartitionRevocationCallback callback);

    // SinkContext
    std::vector<PartitionId> assignment() override;
    void pause(const PartitionId& partition) override;
    void resume(const PartitionId& partition) override;
    void seek(const PartitionId& partition, int64_t offset) override;

private:
    ArchiverConfig config_;

    std::unique_ptr<cppkafka::Consumer> consumer_;
    std::unique_ptr<cppkafka::Configuration> kafka_config_;

    PartitionAssignmentCallback assignment_callback_;
    PartitionRevocationCallback revocation_callback_;

    // While an assignment callback runs the partitions are not assigned yet:
    // seeks are collected here and written into the assignment list
    bool in_assignment_;
    std::map<PartitionId, int64_t> pending_seeks_;

    std::exception_ptr rebalance_error_;

    static std::vector<PartitionId> toPartitionIds(const cppkafka::TopicPartitionList& partitions);
    static SinkRecord toSinkRecord(const cppkafka::Message& msg);

    // Reassign with a new position for one partition
    bool seekPartition(const PartitionId& partition, int64_t offset);
};

#endif // QUEUE_CONSUMER_HPP
