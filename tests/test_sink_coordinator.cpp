#include <gtest/gtest.h>
#include "../src/archiver/sink_coordinator.hpp"
#include "../src/archiver/errors.hpp"
#include "test_fakes.hpp"
#include <algorithm>
#include <iostream>
#include <random>

class SinkCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<FakeObjectStore>(factory_);
        coordinator_ = std::make_unique<SinkCoordinator>(context_, *store_, factory_,
                                                         "/tmp/s3-archiver-test", 1024);
    }

    void TearDown() override {
        coordinator_.reset();
    }

    // Records [from, to) for one partition
    std::vector<SinkRecord> records(const PartitionId& partition, int64_t from, int64_t to) {
        std::vector<SinkRecord> batch;
        for (int64_t offset = from; offset < to; ++offset) {
            SinkRecord r;
            r.partition = partition;
            r.offset = offset;
            r.timestamp_ms = 1700000000000 + offset;
            r.key = "k" + std::to_string(offset);
            r.value = "value-" + std::to_string(offset);
            batch.push_back(r);
        }
        return batch;
    }

    PartitionStatus status(const PartitionId& partition) {
        for (const auto& s : coordinator_->getPartitionStatus()) {
            if (s.partition == partition) {
                return s;
            }
        }
        ADD_FAILURE() << "Partition " << partition.toString() << " not assigned";
        return PartitionStatus();
    }

    // Host checkpoint: everything delivered so far
    std::map<PartitionId, int64_t> checkpoints() {
        std::map<PartitionId, int64_t> result;
        for (const auto& s : coordinator_->getPartitionStatus()) {
            result[s.partition] = s.next_offset;
        }
        return result;
    }

    static bool isRetriable(const std::function<void()>& call) {
        try {
            call();
        } catch (const RetriableError&) {
            return true;
        } catch (const ArchiverError&) {
            return false;
        }
        ADD_FAILURE() << "Expected an ArchiverError";
        return false;
    }

    PartitionId p0_{"events", 0};
    PartitionId p1_{"events", 1};

    FakeSinkContext context_;
    FakeChunkWriterFactory factory_;
    std::unique_ptr<FakeObjectStore> store_;
    std::unique_ptr<SinkCoordinator> coordinator_;
};

// A partition with nothing archived starts at offset 0
TEST_F(SinkCoordinatorTest, FreshPartitionStartsAtZero) {
    coordinator_->onAssigned({p0_});

    EXPECT_TRUE(coordinator_->isAssigned(p0_));
    EXPECT_EQ(status(p0_).start_offset, 0);
    EXPECT_EQ(context_.seeks[p0_], 0);

    std::vector<std::string> expected = {
        "pause events-00000", "seek events-00000 0", "resume events-00000"
    };
    EXPECT_EQ(context_.events, expected);
    EXPECT_TRUE(context_.paused.empty());

    ASSERT_EQ(factory_.writers.size(), 1u);
    EXPECT_EQ(factory_.writers[0]->start_offset, 0);
    EXPECT_EQ(factory_.last_threshold, 1024u);
}

TEST_F(SinkCoordinatorTest, RecoveryResumesFromArchivedOffset) {
    store_->committed[p0_] = 42;

    coordinator_->onAssigned({p0_});

    EXPECT_EQ(status(p0_).start_offset, 42);
    EXPECT_EQ(status(p0_).next_offset, 42);
    EXPECT_EQ(context_.seeks[p0_], 42);
}

// Re-assignment of a partition that already has a buffer changes nothing
TEST_F(SinkCoordinatorTest, RecoveryIsIdempotent) {
    coordinator_->onAssigned({p0_});
    coordinator_->put(records(p0_, 0, 5));

    coordinator_->onAssigned({p0_});

    EXPECT_EQ(store_->fetch_calls, 1);
    EXPECT_EQ(factory_.writers.size(), 1u);
    EXPECT_EQ(status(p0_).record_count, 5u);
    EXPECT_EQ(context_.events.size(), 3u);
}

TEST_F(SinkCoordinatorTest, StartRecoversCurrentAssignment) {
    context_.assigned = {p0_, p1_};
    store_->committed[p1_] = 7;

    coordinator_->start();

    EXPECT_EQ(coordinator_->getPartitionCount(), 2u);
    EXPECT_EQ(status(p0_).start_offset, 0);
    EXPECT_EQ(status(p1_).start_offset, 7);
}

// Flushing [0, 10) uploads one chunk and leaves a fresh buffer at 10
TEST_F(SinkCoordinatorTest, FlushUploadsChunkAndStartsNextBuffer) {
    coordinator_->onAssigned({p0_});
    coordinator_->put(records(p0_, 0, 10));

    auto committed = coordinator_->flush({{p0_, 10}});

    ASSERT_EQ(committed.size(), 1u);
    EXPECT_EQ(committed[p0_], 10);

    auto chunks = store_->chunksFor(p0_);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].start_offset, 0);
    EXPECT_EQ(chunks[0].next_offset, 10);
    EXPECT_EQ(chunks[0].offsets.size(), 10u);

    PartitionStatus s = status(p0_);
    EXPECT_EQ(s.start_offset, 10);
    EXPECT_EQ(s.next_offset, 10);
    EXPECT_EQ(s.record_count, 0u);
    EXPECT_FALSE(s.sealed);

    auto writers = factory_.writersFor(p0_);
    ASSERT_EQ(writers.size(), 2u);
    EXPECT_TRUE(writers[0]->discarded);
    EXPECT_EQ(writers[1]->start_offset, 10);
    EXPECT_FALSE(writers[1]->discarded);
}

TEST_F(SinkCoordinatorTest, EmptyFlushSkipsUpload) {
    store_->committed[p0_] = 25;
    coordinator_->onAssigned({p0_});

    auto committed = coordinator_->flush({{p0_, 25}});

    EXPECT_EQ(committed[p0_], 25);
    EXPECT_EQ(store_->upload_calls, 0);
    EXPECT_EQ(factory_.writers.size(), 1u);
    EXPECT_EQ(factory_.writers[0]->finalize_calls, 0);
}

// The archived end wins over a host checkpoint that disagrees with it
TEST_F(SinkCoordinatorTest, CommittedOffsetIsArchivedEnd) {
    coordinator_->onAssigned({p0_});
    coordinator_->put(records(p0_, 0, 10));

    auto committed = coordinator_->flush({{p0_, 7}});

    EXPECT_EQ(committed[p0_], 10);
    EXPECT_EQ(status(p0_).start_offset, 10);
}

// A failed upload keeps the sealed chunk; the retry uploads it exactly once
TEST_F(SinkCoordinatorTest, FailedUploadIsRetriedWithSameChunk) {
    coordinator_->onAssigned({p0_});
    coordinator_->put(records(p0_, 0, 10));
    store_->fail_uploads = 1;

    EXPECT_TRUE(isRetriable([this] { coordinator_->flush({{p0_, 10}}); }));
    EXPECT_TRUE(store_->chunks.empty());
    EXPECT_TRUE(status(p0_).sealed);

    auto committed = coordinator_->flush({{p0_, 10}});

    EXPECT_EQ(committed[p0_], 10);
    EXPECT_EQ(store_->upload_calls, 2);
    ASSERT_EQ(store_->chunksFor(p0_).size(), 1u);
    EXPECT_EQ(store_->chunksFor(p0_)[0].offsets.size(), 10u);

    auto writers = factory_.writersFor(p0_);
    ASSERT_EQ(writers.size(), 2u);
    EXPECT_EQ(writers[0]->finalize_calls, 1);
}

// Records for a sealed chunk are refused until its upload succeeds
TEST_F(SinkCoordinatorTest, PutToSealedBufferIsRetriable) {
    coordinator_->onAssigned({p0_});
    coordinator_->put(records(p0_, 0, 10));
    store_->fail_uploads = 1;
    EXPECT_THROW(coordinator_->flush({{p0_, 10}}), RetriableError);

    EXPECT_TRUE(isRetriable([this] { coordinator_->put(records(p0_, 10, 12)); }));

    coordinator_->flush({{p0_, 10}});
    coordinator_->put(records(p0_, 10, 12));
    EXPECT_EQ(status(p0_).next_offset, 12);
    EXPECT_EQ(status(p0_).record_count, 2u);
}

TEST_F(SinkCoordinatorTest, FinalizeFailureIsRetriableAndKeepsRecords) {
    coordinator_->onAssigned({p0_});
    coordinator_->put(records(p0_, 0, 4));
    factory_.writers[0]->fail_next_finalize = true;

    EXPECT_TRUE(isRetriable([this] { coordinator_->flush({{p0_, 4}}); }));
    EXPECT_FALSE(status(p0_).sealed);
    EXPECT_EQ(status(p0_).record_count, 4u);

    auto committed = coordinator_->flush({{p0_, 4}});
    EXPECT_EQ(committed[p0_], 4);
}

// One failing partition does not stop the others from being archived
TEST_F(SinkCoordinatorTest, FlushContinuesPastFailedPartition) {
    coordinator_->onAssigned({p0_, p1_});
    coordinator_->put(records(p0_, 0, 3));
    coordinator_->put(records(p1_, 0, 5));
    store_->fail_uploads = 1;

    EXPECT_THROW(coordinator_->flush({{p0_, 3}, {p1_, 5}}), RetriableError);

    EXPECT_TRUE(status(p0_).sealed);
    EXPECT_EQ(status(p1_).start_offset, 5);
    EXPECT_EQ(store_->chunksFor(p1_).size(), 1u);

    auto committed = coordinator_->flush({{p0_, 3}, {p1_, 5}});
    EXPECT_EQ(committed[p0_], 3);
    EXPECT_EQ(committed[p1_], 5);
    EXPECT_EQ(store_->chunksFor(p0_).size(), 1u);
    EXPECT_EQ(store_->chunksFor(p1_).size(), 1u);
}

TEST_F(SinkCoordinatorTest, RedeliveredRecordsAreSkipped) {
    coordinator_->onAssigned({p0_});
    coordinator_->put(records(p0_, 0, 5));
    coordinator_->put(records(p0_, 3, 8));

    EXPECT_EQ(status(p0_).record_count, 8u);
    EXPECT_EQ(status(p0_).next_offset, 8);
}

// Buffered [10, 15) is dropped on revoke and read again after reassignment
TEST_F(SinkCoordinatorTest, RevokeThenReassignResumesAtArchivedOffset) {
    coordinator_->onAssigned({p0_});
    coordinator_->put(records(p0_, 0, 10));
    coordinator_->flush({{p0_, 10}});
    coordinator_->put(records(p0_, 10, 15));

    coordinator_->onRevoked({p0_});

    EXPECT_FALSE(coordinator_->isAssigned(p0_));
    auto writers = factory_.writersFor(p0_);
    ASSERT_EQ(writers.size(), 2u);
    EXPECT_TRUE(writers[1]->discarded);
    EXPECT_EQ(writers[1]->records.size(), 5u);

    coordinator_->onAssigned({p0_});

    EXPECT_EQ(context_.seeks[p0_], 10);
    EXPECT_EQ(status(p0_).start_offset, 10);
    EXPECT_EQ(status(p0_).record_count, 0u);
}

TEST_F(SinkCoordinatorTest, RevokeUnknownPartitionIsIgnored) {
    coordinator_->onAssigned({p0_});
    coordinator_->onRevoked({p1_});
    EXPECT_TRUE(coordinator_->isAssigned(p0_));
}

// A partition revoked while its upload is in flight keeps no buffer
TEST_F(SinkCoordinatorTest, RevokedDuringUploadIgnoresResult) {
    coordinator_->onAssigned({p0_});
    coordinator_->put(records(p0_, 0, 6));
    store_->after_upload = [this](const PartitionId& partition) {
        coordinator_->onRevoked({partition});
    };

    auto committed = coordinator_->flush({{p0_, 6}});

    EXPECT_TRUE(committed.empty());
    EXPECT_FALSE(coordinator_->isAssigned(p0_));
    for (const auto& writer : factory_.writersFor(p0_)) {
        EXPECT_TRUE(writer->discarded);
    }

    store_->after_upload = nullptr;
    coordinator_->onAssigned({p0_});
    EXPECT_EQ(status(p0_).start_offset, 6);
}

// A failed upload of a partition revoked meanwhile is ignored as well
TEST_F(SinkCoordinatorTest, RevokedDuringFailedUploadIgnoresFailure) {
    coordinator_->onAssigned({p0_, p1_});
    coordinator_->put(records(p0_, 0, 3));
    coordinator_->put(records(p1_, 0, 2));
    store_->fail_uploads = 1;
    store_->before_upload = [this](const PartitionId& partition) {
        if (partition == p0_) {
            coordinator_->onRevoked({partition});
        }
    };

    std::map<PartitionId, int64_t> committed;
    EXPECT_NO_THROW(committed = coordinator_->flush({{p0_, 3}, {p1_, 2}}));

    EXPECT_EQ(committed.count(p0_), 0u);
    EXPECT_EQ(committed[p1_], 2);
    EXPECT_FALSE(coordinator_->isAssigned(p0_));
    EXPECT_TRUE(store_->chunksFor(p0_).empty());

    // The host's next flush only names what is still assigned
    store_->before_upload = nullptr;
    EXPECT_NO_THROW(coordinator_->flush(checkpoints()));

    coordinator_->onAssigned({p0_});
    EXPECT_EQ(status(p0_).start_offset, 0);
    EXPECT_EQ(context_.seeks[p0_], 0);
}

TEST_F(SinkCoordinatorTest, PutForUnassignedPartitionIsFatal) {
    coordinator_->onAssigned({p0_});
    EXPECT_FALSE(isRetriable([this] { coordinator_->put(records(p1_, 0, 1)); }));
}

// Validation happens before any partition is uploaded
TEST_F(SinkCoordinatorTest, FlushForUnassignedPartitionIsFatal) {
    coordinator_->onAssigned({p0_});
    coordinator_->put(records(p0_, 0, 5));

    EXPECT_FALSE(isRetriable([this] { coordinator_->flush({{p0_, 5}, {p1_, 0}}); }));
    EXPECT_EQ(store_->upload_calls, 0);
    EXPECT_EQ(status(p0_).record_count, 5u);
}

// An unreachable store fails recovery and the partition stays paused
TEST_F(SinkCoordinatorTest, RecoveryFailureIsFatal) {
    store_->fail_fetch = true;

    EXPECT_FALSE(isRetriable([this] { coordinator_->onAssigned({p0_}); }));
    EXPECT_FALSE(coordinator_->isAssigned(p0_));
    EXPECT_EQ(context_.paused.count(p0_), 1u);
    EXPECT_TRUE(context_.seeks.empty());
}

TEST_F(SinkCoordinatorTest, WriterCreationFailureDuringRecoveryIsFatal) {
    factory_.fail_create = true;

    EXPECT_FALSE(isRetriable([this] { coordinator_->onAssigned({p0_}); }));
    EXPECT_FALSE(coordinator_->isAssigned(p0_));
}

TEST_F(SinkCoordinatorTest, AppendFailureIsRetriable) {
    coordinator_->onAssigned({p0_});
    factory_.writers[0]->fail_append = true;

    EXPECT_TRUE(isRetriable([this] { coordinator_->put(records(p0_, 0, 1)); }));
}

// Another writer archived past our start: uploading would overlap
TEST_F(SinkCoordinatorTest, OverlappingChunkIsFatal) {
    coordinator_->onAssigned({p0_});
    coordinator_->put(records(p0_, 0, 10));
    store_->committed[p0_] = 5;

    EXPECT_FALSE(isRetriable([this] { coordinator_->flush({{p0_, 10}}); }));
}

TEST_F(SinkCoordinatorTest, StatisticsCoverAllPartitions) {
    coordinator_->onAssigned({p0_, p1_});
    coordinator_->put(records(p0_, 0, 3));
    coordinator_->put(records(p1_, 0, 2));

    EXPECT_EQ(coordinator_->getPartitionCount(), 2u);
    EXPECT_EQ(coordinator_->getTotalRecordCount(), 5u);

    size_t expected_bytes = 0;
    for (const auto& r : records(p0_, 0, 3)) expected_bytes += r.sizeBytes();
    for (const auto& r : records(p1_, 0, 2)) expected_bytes += r.sizeBytes();
    EXPECT_EQ(coordinator_->getTotalBufferedBytes(), expected_bytes);

    PartitionStatus s = status(p0_);
    EXPECT_EQ(s.next_offset, 3);
    EXPECT_EQ(s.record_count, 3u);
}

TEST_F(SinkCoordinatorTest, StopDiscardsAllBuffers) {
    coordinator_->onAssigned({p0_, p1_});
    coordinator_->put(records(p0_, 0, 3));

    coordinator_->stop();

    EXPECT_EQ(coordinator_->getPartitionCount(), 0u);
    for (const auto& writer : factory_.writers) {
        EXPECT_TRUE(writer->discarded);
    }
    EXPECT_TRUE(store_->chunks.empty());
}

// Under intermittent upload failures, revocations, reassignments and
// crashes, every partition's archive is the exact sequence of offsets with
// no gap or overlap
TEST_F(SinkCoordinatorTest, ArchiveHasNoGapsOrOverlaps) {
    std::vector<PartitionId> partitions = {p0_, p1_};
    context_.assigned = partitions;
    coordinator_->start();
    store_->fail_every = 3;

    std::mt19937 rng(1234);
    std::uniform_int_distribution<int> batch_size(1, 7);
    std::uniform_int_distribution<int> action(0, 19);

    // Host read position: where the next delivered record starts
    std::map<PartitionId, int64_t> position;
    for (const auto& partition : partitions) {
        position[partition] = context_.seeks[partition];
    }

    auto tryFlush = [this](const char* reason) {
        try {
            coordinator_->flush(checkpoints());
        } catch (const RetriableError& e) {
            std::cout << reason << " flush failed: " << e.what() << std::endl;
        }
    };

    for (int round = 0; round < 120; ++round) {
        int step = action(rng);

        if (step == 0) {
            // Crash: buffered data is lost, a new coordinator recovers from the archive
            coordinator_.reset();
            coordinator_ = std::make_unique<SinkCoordinator>(context_, *store_, factory_,
                                                             "/tmp/s3-archiver-test", 1024);
            context_.seeks.clear();
            coordinator_->start();
            for (const auto& partition : partitions) {
                ASSERT_EQ(context_.seeks.count(partition), 1u);
                position[partition] = context_.seeks[partition];
            }
            continue;
        }

        if (step == 1 || step == 2) {
            // Rebalance moves one partition away and back
            const PartitionId& partition = partitions[step - 1];
            coordinator_->onRevoked({partition});
            context_.seeks.erase(partition);
            coordinator_->onAssigned({partition});
            ASSERT_EQ(context_.seeks.count(partition), 1u);
            position[partition] = context_.seeks[partition];
            continue;
        }

        std::vector<SinkRecord> batch;
        for (const auto& partition : partitions) {
            int64_t from = position[partition];
            auto part = records(partition, from, from + batch_size(rng));
            batch.insert(batch.end(), part.begin(), part.end());
        }

        // Host loop: a retriable put is redelivered after a flush attempt
        bool applied = false;
        for (int attempt = 0; attempt < 10 && !applied; ++attempt) {
            try {
                coordinator_->put(batch);
                applied = true;
            } catch (const RetriableError&) {
                tryFlush("Before retry");
            }
        }
        ASSERT_TRUE(applied);
        for (const auto& r : batch) {
            position[r.partition] = std::max(position[r.partition], r.offset + 1);
        }

        if (step >= 15) {
            tryFlush("Periodic");
        }
    }

    // Drain whatever is still buffered
    store_->fail_every = 0;
    auto committed = coordinator_->flush(checkpoints());

    for (const auto& partition : partitions) {
        EXPECT_EQ(committed[partition], position[partition]);

        int64_t expected = 0;
        for (const auto& chunk : store_->chunksFor(partition)) {
            EXPECT_EQ(chunk.start_offset, expected);
            for (int64_t offset : chunk.offsets) {
                EXPECT_EQ(offset, expected);
                ++expected;
            }
            EXPECT_EQ(chunk.next_offset, expected);
        }
        EXPECT_EQ(expected, position[partition]);
        EXPECT_EQ(store_->committed[partition], position[partition]);
    }
}
