#include <gtest/gtest.h>
#include "chunkrelay/transfer/transfer_manager.hpp"
#include "chunkrelay/storage/transfer_journal.hpp"
#include "unit/test_fakes.hpp"
#include <chrono>
#include <filesystem>
#include <regex>
#include <thread>

using namespace chunkrelay::transfer;
using namespace chunkrelay::fakes;
using namespace std::chrono_literals;

namespace {

constexpr uint64_t CHUNK = 32;

TransferOptions fast_options() {
    TransferOptions options;
    options.chunk_size = CHUNK;
    options.buffer_chunks = 2;
    options.chunk_retry.base_delay = 1ms;
    options.chunk_retry.max_delay = 2ms;
    options.metadata_retry.base_delay = 1ms;
    options.metadata_retry.max_delay = 2ms;
    options.jitter = [](std::chrono::milliseconds) { return 0ms; };
    return options;
}

template<typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = 2000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(1ms);
    }
    return predicate();
}

}

class TransferManagerTest : public ::testing::Test {
protected:
    TransferJob make_job(const std::string& id, const std::vector<uint8_t>& payload,
                         FakeChunkSource** source_out = nullptr,
                         RecordingSink** sink_out = nullptr) {
        TransferJob job;
        job.session_id = id;
        job.spec.object_id = "objects/" + (id.empty() ? std::string("anon") : id);
        job.spec.source_url = "https://files.example.test/" + job.spec.object_id;
        job.spec.total_size = payload.size();
        job.spec.chunk_size = CHUNK;
        job.spec.buffer_capacity = 2;
        job.spec.destination = "recording://" + job.spec.object_id;
        job.metadata = &metadata_;

        auto source = std::make_unique<FakeChunkSource>(payload);
        auto sink = std::make_unique<RecordingSink>(job.spec.destination);
        if (source_out) *source_out = source.get();
        if (sink_out) *sink_out = sink.get();
        job.source = std::move(source);
        job.sink = std::move(sink);
        return job;
    }

    FixedSizeMetadataSource metadata_{std::nullopt};
};

TEST_F(TransferManagerTest, RunsSubmittedSession) {
    TransferManager manager(fast_options(), 2);
    auto payload = make_payload(CHUNK * 3 + 5);
    RecordingSink* sink = nullptr;

    std::string id;
    ASSERT_TRUE(manager.submit(make_job("job-1", payload, nullptr, &sink), id));
    EXPECT_EQ(id, "job-1");
    EXPECT_TRUE(manager.has_session("job-1"));

    auto outcome = manager.wait("job-1");
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->state, TransferState::COMPLETED) << outcome->error.describe();
    EXPECT_EQ(outcome->bytes_transferred, payload.size());
    EXPECT_EQ(sink->data(), payload);
    EXPECT_EQ(manager.get_state("job-1"), TransferState::COMPLETED);
    EXPECT_EQ(manager.get_active_transfer_count(), 0u);
}

TEST_F(TransferManagerTest, GeneratesSessionIds) {
    TransferManager manager(fast_options(), 1);

    std::string first;
    std::string second;
    ASSERT_TRUE(manager.submit(make_job("", make_payload(8)), first));
    ASSERT_TRUE(manager.submit(make_job("", make_payload(8)), second));

    std::regex pattern("session_[0-9a-f]{8}");
    EXPECT_TRUE(std::regex_match(first, pattern)) << first;
    EXPECT_TRUE(std::regex_match(second, pattern)) << second;
    EXPECT_NE(first, second);
    EXPECT_EQ(manager.wait_all().size(), 2u);
}

TEST_F(TransferManagerTest, RejectsIncompleteJob) {
    TransferManager manager(fast_options(), 1);

    auto job = make_job("broken", make_payload(8));
    job.sink.reset();

    std::string id;
    auto result = manager.submit(std::move(job), id);
    EXPECT_EQ(result.kind, ErrorKind::PERMANENT);
    EXPECT_FALSE(manager.has_session("broken"));

    auto no_metadata = make_job("no-metadata", make_payload(8));
    no_metadata.metadata = nullptr;
    EXPECT_EQ(manager.submit(std::move(no_metadata), id).kind, ErrorKind::PERMANENT);
}

TEST_F(TransferManagerTest, RejectsDuplicateSessionId) {
    TransferManager manager(fast_options(), 1);

    std::string id;
    ASSERT_TRUE(manager.submit(make_job("dup", make_payload(8)), id));
    auto result = manager.submit(make_job("dup", make_payload(8)), id);
    EXPECT_EQ(result.kind, ErrorKind::PERMANENT);
    EXPECT_NE(result.message.find("already exists"), std::string::npos);

    EXPECT_EQ(manager.wait_all().size(), 1u);
}

TEST_F(TransferManagerTest, CancelsBlockedSession) {
    TransferManager manager(fast_options(), 1);
    FakeChunkSource* source = nullptr;
    RecordingSink* sink = nullptr;

    auto job = make_job("slow", make_payload(CHUNK * 4), &source, &sink);
    source->block_from(CHUNK);

    std::string id;
    ASSERT_TRUE(manager.submit(std::move(job), id));
    ASSERT_TRUE(wait_until([&] { return source->blocked(); }));
    EXPECT_EQ(manager.get_active_transfer_count(), 1u);

    ASSERT_TRUE(manager.cancel("slow"));

    auto outcome = manager.wait("slow");
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->state, TransferState::CANCELLED);
    EXPECT_FALSE(sink->finalized());
    EXPECT_GE(sink->abort_calls(), 1);
}

TEST_F(TransferManagerTest, CancelUnknownOrFinishedSession) {
    TransferManager manager(fast_options(), 1);
    EXPECT_EQ(manager.cancel("nobody").kind, ErrorKind::PERMANENT);

    std::string id;
    ASSERT_TRUE(manager.submit(make_job("done", make_payload(8)), id));
    ASSERT_TRUE(manager.wait("done").has_value());
    EXPECT_EQ(manager.cancel("done").kind, ErrorKind::PERMANENT);
}

TEST_F(TransferManagerTest, ForgetsOnlyFinishedSessions) {
    TransferManager manager(fast_options(), 1);
    EXPECT_EQ(manager.forget("nobody").kind, ErrorKind::PERMANENT);

    FakeChunkSource* source = nullptr;
    auto job = make_job("held", make_payload(CHUNK * 4), &source);
    source->block_from(CHUNK);

    std::string id;
    ASSERT_TRUE(manager.submit(std::move(job), id));
    ASSERT_TRUE(wait_until([&] { return source->blocked(); }));

    auto running = manager.forget("held");
    EXPECT_EQ(running.kind, ErrorKind::PERMANENT);
    EXPECT_NE(running.message.find("has not finished"), std::string::npos);
    EXPECT_TRUE(manager.has_session("held"));

    ASSERT_TRUE(manager.cancel("held"));
    ASSERT_TRUE(manager.wait("held").has_value());

    ASSERT_TRUE(manager.forget("held"));
    EXPECT_FALSE(manager.has_session("held"));
    EXPECT_FALSE(manager.get_state("held").has_value());
    EXPECT_TRUE(manager.wait_all().empty());
    EXPECT_EQ(manager.forget("held").kind, ErrorKind::PERMANENT);

    // The id is free again.
    ASSERT_TRUE(manager.submit(make_job("held", make_payload(8)), id));
    auto outcome = manager.wait("held");
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->state, TransferState::COMPLETED);
}

TEST_F(TransferManagerTest, WaitOnUnknownSession) {
    TransferManager manager(fast_options(), 1);
    EXPECT_FALSE(manager.wait("ghost").has_value());
    EXPECT_FALSE(manager.get_state("ghost").has_value());
}

TEST_F(TransferManagerTest, WaitAllKeepsSubmissionOrder) {
    TransferManager manager(fast_options(), 3);

    std::vector<std::string> ids = {"c", "a", "b"};
    for (const auto& name : ids) {
        std::string id;
        ASSERT_TRUE(manager.submit(make_job(name, make_payload(CHUNK * 2, static_cast<uint8_t>(name[0]))), id));
    }

    auto outcomes = manager.wait_all();
    ASSERT_EQ(outcomes.size(), ids.size());
    for (size_t i = 0; i < ids.size(); ++i) {
        EXPECT_EQ(outcomes[i].session_id, ids[i]);
        EXPECT_TRUE(outcomes[i].success()) << outcomes[i].error.describe();
    }
}

TEST_F(TransferManagerTest, FailureStaysInItsSession) {
    TransferManager manager(fast_options(), 2);
    FakeChunkSource* failing = nullptr;

    std::string id;
    auto bad = make_job("bad", make_payload(CHUNK * 2), &failing);
    failing->fail_at(0, TransferResult::permanent("HTTP 404"));
    ASSERT_TRUE(manager.submit(std::move(bad), id));
    ASSERT_TRUE(manager.submit(make_job("good", make_payload(CHUNK * 2)), id));

    auto outcomes = manager.wait_all();
    ASSERT_EQ(outcomes.size(), 2u);
    EXPECT_EQ(outcomes[0].state, TransferState::FAILED);
    EXPECT_EQ(outcomes[0].error.kind, ErrorKind::PERMANENT);
    EXPECT_EQ(outcomes[1].state, TransferState::COMPLETED);
}

TEST_F(TransferManagerTest, JournalsEveryOutcome) {
    auto db_path = std::filesystem::temp_directory_path() / "test_manager_journal.db";
    std::filesystem::remove(db_path);

    {
        chunkrelay::storage::TransferJournal journal(db_path);
        ASSERT_TRUE(journal.initialize());

        {
            TransferManager manager(fast_options(), 2, &journal);
            std::string id;
            ASSERT_TRUE(manager.submit(make_job("journaled", make_payload(CHUNK + 1)), id));
            manager.wait_all();
        }

        auto entry = journal.find("journaled");
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(entry->state, TransferState::COMPLETED);
        EXPECT_EQ(entry->bytes_transferred, CHUNK + 1);
        EXPECT_EQ(entry->object_id, "objects/journaled");
        EXPECT_FALSE(entry->digest.empty());
    }

    std::filesystem::remove(db_path);
}

TEST_F(TransferManagerTest, DestructorCancelsRunningSessions) {
    FakeChunkSource* source = nullptr;
    auto started = std::chrono::steady_clock::now();

    {
        TransferManager manager(fast_options(), 1);
        auto job = make_job("abandoned", make_payload(CHUNK * 4), &source);
        source->block_from(0);

        std::string id;
        ASSERT_TRUE(manager.submit(std::move(job), id));
        ASSERT_TRUE(wait_until([&] { return source->blocked(); }));
    }

    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}
