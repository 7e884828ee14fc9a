#include "queue_consumer.hpp"
#include <iostream>
#include <librdkafka/rdkafka.h>

QueueConsumer::QueueConsumer(const ArchiverConfig& config)
    : config_(config), in_assignment_(false) {
}

QueueConsumer::~QueueConsumer() {
    close();
}

bool QueueConsumer::initialize() {
    try {
        // Create Kafka configuration
        kafka_config_ = std::make_unique<cppkafka::Configuration>(cppkafka::Configuration{
            {"metadata.broker.list", config_.queue_brokers},
            {"group.id", config_.consumer_group},
            {"enable.auto.commit", "false"},  // Offsets follow the archive, never the poll position
            {"auto.offset.reset", "earliest"},
            {"enable.partition.eof", "false"},
        });

        consumer_ = std::make_unique<cppkafka::Consumer>(*kafka_config_);

        consumer_->set_assignment_callback([this](cppkafka::TopicPartitionList& partitions) {
            in_assignment_ = true;
            pending_seeks_.clear();
            try {
                if (assignment_callback_) {
                    assignment_callback_(toPartitionIds(partitions));
                }
            } catch (const std::exception& e) {
                std::cerr << "Error handling partition assignment: " << e.what() << std::endl;
                rebalance_error_ = std::current_exception();
            }
            in_assignment_ = false;

            // Start each partition where the archive ends
            for (auto& tp : partitions) {
                auto it = pending_seeks_.find(PartitionId(tp.get_topic(), tp.get_partition()));
                if (it != pending_seeks_.end()) {
                    tp.set_offset(it->second);
                }
            }
            pending_seeks_.clear();
        });

        consumer_->set_revocation_callback([this](const cppkafka::TopicPartitionList& partitions) {
            try {
                if (revocation_callback_) {
                    revocation_callback_(toPartitionIds(partitions));
                }
            } catch (const std::exception& e) {
                std::cerr << "Error handling partition revocation: " << e.what() << std::endl;
                rebalance_error_ = std::current_exception();
            }
        });

        consumer_->subscribe(config_.queue_topics);

        std::cout << "QueueConsumer initialized with brokers: " << config_.queue_brokers
                  << ", topics: ";
        for (const auto& topic : config_.queue_topics) {
            std::cout << topic << " ";
        }
        std::cout << ", group: " << config_.consumer_group << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize QueueConsumer: " << e.what() << std::endl;
        consumer_.reset();
        return false;
    }
}

std::vector<SinkRecord> QueueConsumer::poll(size_t max_records, std::chrono::milliseconds timeout) {
    std::vector<SinkRecord> records;
    if (!consumer_) {
        return records;
    }

    std::vector<cppkafka::Message> messages = consumer_->poll_batch(max_records, timeout);

    if (rebalance_error_) {
        std::exception_ptr error = rebalance_error_;
        rebalance_error_ = nullptr;
        std::rethrow_exception(error);
    }

    records.reserve(messages.size());
    for (const auto& msg : messages) {
        if (!msg) {
            continue;
        }
        if (msg.get_error()) {
            if (!msg.is_eof()) {
                std::cerr << "Consumer error: " << msg.get_error() << std::endl;
            }
            continue;
        }
        records.push_back(toSinkRecord(msg));
    }
    return records;
}

void QueueConsumer::close() {
    if (!consumer_) {
        return;
    }

    try {
        consumer_->unsubscribe();
    } catch (const std::exception& e) {
        std::cerr << "Error during consumer shutdown: " << e.what() << std::endl;
    }
    consumer_.reset();
    std::cout << "Queue consumer closed" << std::endl;
}

bool QueueConsumer::commitOffsets(const std::map<PartitionId, int64_t>& offsets) {
    if (!consumer_ || offsets.empty()) {
        return true; // Nothing to commit
    }

    try {
        std::vector<cppkafka::TopicPartition> offsets_to_commit;
        for (const auto& kv : offsets) {
            offsets_to_commit.emplace_back(kv.first.topic, kv.first.partition, kv.second);
        }

        consumer_->commit(offsets_to_commit);
        std::cout << "Committed offsets for " << offsets_to_commit.size() << " partition(s)" << std::endl;
        return true;
    } catch (const cppkafka::HandleException& e) {
        std::cerr << "Error committing offsets: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "Unexpected error committing offsets: " << e.what() << std::endl;
        return false;
    }
}

void QueueConsumer::setAssignmentCallback(PartitionAssignmentCallback callback) {
    assignment_callback_ = std::move(callback);
}

void QueueConsumer::setRevocationCallback(PartitionRevocationCallback callback) {
    revocation_callback_ = std::move(callback);
}

std::vector<PartitionId> QueueConsumer::assignment() {
    if (!consumer_) {
        return {};
    }
    return toPartitionIds(consumer_->get_assignment());
}

void QueueConsumer::pause(const PartitionId& partition) {
    // Partitions being assigned are not fetching yet
    if (!consumer_ || in_assignment_) {
        return;
    }
    consumer_->pause_partitions({cppkafka::TopicPartition(partition.topic, partition.partition)});
}

void QueueConsumer::resume(const PartitionId& partition) {
    if (!consumer_ || in_assignment_) {
        return;
    }
    consumer_->resume_partitions({cppkafka::TopicPartition(partition.topic, partition.partition)});
}

void QueueConsumer::seek(const PartitionId& partition, int64_t offset) {
    if (in_assignment_) {
        pending_seeks_[partition] = offset;
        return;
    }
    if (!seekPartition(partition, offset)) {
        throw std::runtime_error("Failed to seek partition " + partition.toString() +
                                 " to offset " + std::to_string(offset));
    }
}

bool QueueConsumer::seekPartition(const PartitionId& partition, int64_t offset) {
    if (!consumer_) {
        return false;
    }

    try {
        auto assignment = consumer_->get_assignment();

        // Build new assignment list with updated offset for this partition
        std::vector<cppkafka::TopicPartition> new_assignment;
        for (const auto& tp : assignment) {
            if (tp.get_topic() == partition.topic && tp.get_partition() == partition.partition) {
                new_assignment.emplace_back(partition.topic, partition.partition, offset);
            } else {
                new_assignment.push_back(tp);
            }
        }

        consumer_->assign(new_assignment);
        std::cout << "Sought partition " << partition.toString() << " to offset " << offset << std::endl;
        return true;
    } catch (const cppkafka::HandleException& e) {
        std::cerr << "Error seeking partition " << partition.toString() << ": " << e.what() << std::endl;
        return false;
    }
}

std::vector<PartitionId> QueueConsumer::toPartitionIds(const cppkafka::TopicPartitionList& partitions) {
    std::vector<PartitionId> ids;
    ids.reserve(partitions.size());
    for (const auto& tp : partitions) {
        ids.emplace_back(tp.get_topic(), tp.get_partition());
    }
    return ids;
}

SinkRecord QueueConsumer::toSinkRecord(const cppkafka::Message& msg) {
    SinkRecord record;
    record.partition = PartitionId(msg.get_topic(), msg.get_partition());
    record.offset = msg.get_offset();

    rd_kafka_timestamp_type_t timestamp_type;
    int64_t timestamp = rd_kafka_message_timestamp(msg.get_handle(), &timestamp_type);
    if (timestamp_type != RD_KAFKA_TIMESTAMP_NOT_AVAILABLE && timestamp > 0) {
        record.timestamp_ms = timestamp;
    }

    if (msg.get_key()) {
        record.key = static_cast<std::string>(msg.get_key());
    }
    record.value = static_cast<std::string>(msg.get_payload());
    return record;
}
