/*
 * voxa - Offline Voice Transcription Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include <future>
#include <stdexcept>

#include "fakes.hpp"
#include "voxa/processor.hpp"

using namespace voxa;
using namespace voxa::test;
using namespace std::chrono_literals;

namespace {

constexpr int kRate = 1000;
constexpr std::size_t kChunk = 30000;    // 30 s at 1 kHz
constexpr std::size_t kSamples = 180000; // six chunks

}

class ProcessorTest : public ::testing::Test {
protected:
    TempDir dir;
    JobStore store{dir / "ws"};
    AdmissionQueue queue{1, 8, OwnerPolicy::Reject, true};
    Config config;
    std::shared_ptr<Script> script = std::make_shared<Script>();
    std::shared_ptr<RecordingDelivery> delivery = std::make_shared<RecordingDelivery>();
    std::unique_ptr<Processor> processor;
    std::string audio;

    void SetUp() override {
        ASSERT_TRUE(store.createLayout());
        config.sampleRate = kRate;
        config.chunkMs = 30000;
        audio = writePcm(dir / "audio.raw", kSamples);
        build({"cat"});
    }

    void build(std::vector<std::string> argv, std::shared_ptr<ResultCache> cache = nullptr) {
        TranscoderOptions options;
        options.argv = std::move(argv);
        options.sampleRate = kRate;
        options.chunkSamples = kChunk;
        options.maxAudioMs = 3600 * 1000;
        processor = std::make_unique<Processor>(store, queue, config,
                                                std::make_shared<TranscoderNormalizer>(options),
                                                std::make_shared<FileSourceResolver>(dir.path()),
                                                delivery, std::move(cache));
        ASSERT_TRUE(processor->initializeEngines(scriptedFactory(script, kRate), 1));
    }

    JobId submit(const std::string& sourceRef, const std::string& owner = "alice") {
        auto job = store.create(owner, sourceRef);
        EXPECT_TRUE(job);
        if (!job) return {};
        EXPECT_TRUE(store.transition(job->id, JobState::Received, JobState::Queued));
        EXPECT_EQ(queue.submit(job->id, owner), AdmitStatus::Accepted);
        return job->id;
    }

    ProcessResult runNext() {
        auto lease = queue.acquireSlot();
        EXPECT_TRUE(lease);
        if (!lease) return ProcessResult::Lost;
        return processor->process(*lease, 0);
    }

    Job stored(const JobId& id) {
        auto job = store.get(id);
        EXPECT_TRUE(job);
        return job ? *job : Job{};
    }
};

TEST_F(ProcessorTest, CompletesAndDelivers)
{
    JobId id = submit("audio.raw");
    EXPECT_EQ(runNext(), ProcessResult::Completed);

    Job job = stored(id);
    EXPECT_EQ(job.state, JobState::Completed);
    EXPECT_EQ(job.audioMs, 180000);
    ASSERT_EQ(job.segments.size(), 6u);
    EXPECT_EQ(job.segments[5].text, "w150");

    EXPECT_EQ(delivery->textsFor(id), std::vector<std::string>{"w0 w30 w60 w90 w120 w150"});
    EXPECT_TRUE(job.delivered);
    EXPECT_EQ(queue.activeCount(), 0u);
    EXPECT_EQ(queue.check("alice"), AdmitStatus::Accepted);
}

TEST_F(ProcessorTest, RefusedDeliveryStaysUnmarked)
{
    delivery->refuseAfter(0);
    JobId id = submit("audio.raw");

    EXPECT_EQ(runNext(), ProcessResult::Completed);
    Job job = stored(id);
    EXPECT_EQ(job.state, JobState::Completed);
    EXPECT_FALSE(job.delivered);

    // A later attempt that gets through records it.
    delivery->refuseAfter(100);
    EXPECT_TRUE(processor->notify(job));
    EXPECT_TRUE(stored(id).delivered);
}

TEST_F(ProcessorTest, UnclaimableJobFailsAndFreesOwner)
{
    // Admitted while the record never reached Queued.
    auto job = store.create("alice", "audio.raw");
    ASSERT_TRUE(job);
    ASSERT_EQ(queue.submit(job->id, "alice"), AdmitStatus::Accepted);

    EXPECT_EQ(runNext(), ProcessResult::Failed);
    Job failed = stored(job->id);
    EXPECT_EQ(failed.state, JobState::Failed);
    EXPECT_EQ(failed.errorKind, ErrorKind::Internal);
    EXPECT_TRUE(script->fedOffsets().empty());
    EXPECT_EQ(queue.check("alice"), AdmitStatus::Accepted);
}

TEST_F(ProcessorTest, RepeatedAudioIsServedFromCache)
{
    auto cache = std::make_shared<ResultCache>(dir / "ws" / "cache", "scripted@1000",
                                               std::chrono::hours(24), 1024 * 1024);
    build({"cat"}, cache);

    JobId first = submit("audio.raw");
    EXPECT_EQ(runNext(), ProcessResult::Completed);
    EXPECT_EQ(script->fedOffsets().size(), 6u);

    writePcm(dir / "copy.raw", kSamples);
    JobId second = submit("copy.raw", "bob");
    EXPECT_EQ(runNext(), ProcessResult::Completed);

    EXPECT_EQ(script->fedOffsets().size(), 6u);
    Job job = stored(second);
    EXPECT_EQ(job.state, JobState::Completed);
    EXPECT_EQ(job.audioMs, 180000);
    EXPECT_EQ(job.segments.size(), 6u);
    EXPECT_EQ(delivery->textsFor(second), delivery->textsFor(first));
}

TEST_F(ProcessorTest, DifferentAudioMissesCache)
{
    auto cache = std::make_shared<ResultCache>(dir / "ws" / "cache", "scripted@1000",
                                               std::chrono::hours(24), 1024 * 1024);
    build({"cat"}, cache);

    submit("audio.raw");
    EXPECT_EQ(runNext(), ProcessResult::Completed);

    writePcm(dir / "short.raw", kChunk);
    JobId id = submit("short.raw", "bob");
    EXPECT_EQ(runNext(), ProcessResult::Completed);
    EXPECT_EQ(script->fedOffsets().size(), 7u);
    EXPECT_EQ(delivery->textsFor(id), std::vector<std::string>{"w0"});
}

TEST_F(ProcessorTest, RejectedChunkResumesFromCheckpoint)
{
    script->rejectTimes[90000] = 1;
    JobId id = submit("audio.raw");

    EXPECT_EQ(runNext(), ProcessResult::Requeued);
    Job mid = stored(id);
    EXPECT_EQ(mid.state, JobState::Queued);
    EXPECT_EQ(mid.stage, JobState::Transcribing);
    EXPECT_EQ(mid.attempts, 1);
    EXPECT_EQ(mid.resumeOffsetMs, 90000);
    EXPECT_EQ(mid.errorKind, ErrorKind::ChunkRejected);
    EXPECT_EQ(mid.segments.size(), 3u);
    EXPECT_TRUE(delivery->all().empty());

    EXPECT_EQ(runNext(), ProcessResult::Completed);
    Job done = stored(id);
    EXPECT_EQ(done.errorKind, ErrorKind::None);
    ASSERT_EQ(done.segments.size(), 6u);

    EXPECT_EQ(script->beginOffsets(), (std::vector<std::int64_t>{0, 90000}));
    EXPECT_EQ(script->fedOffsets(),
              (std::vector<std::int64_t>{0, 30000, 60000, 90000, 90000, 120000, 150000}));
    EXPECT_EQ(delivery->textsFor(id), std::vector<std::string>{"w0 w30 w60 w90 w120 w150"});
}

TEST_F(ProcessorTest, FlushedTextSurvivesRejection)
{
    script->rejectTimes[60000] = 1;
    script->flushText = "tail";
    JobId id = submit("audio.raw");

    EXPECT_EQ(runNext(), ProcessResult::Requeued);
    Job mid = stored(id);
    ASSERT_EQ(mid.segments.size(), 3u);
    EXPECT_EQ(mid.segments[2].text, "tail");
    EXPECT_EQ(mid.resumeOffsetMs, 60000);
}

TEST_F(ProcessorTest, EngineFaultIsNotRetried)
{
    script->faultAt.insert(30000);
    JobId id = submit("audio.raw");

    EXPECT_EQ(runNext(), ProcessResult::Failed);
    Job job = stored(id);
    EXPECT_EQ(job.state, JobState::Failed);
    EXPECT_EQ(job.errorKind, ErrorKind::EngineFault);
    EXPECT_EQ(job.attempts, 0);
    EXPECT_EQ(queue.depth(), 0u);

    auto texts = delivery->textsFor(id);
    ASSERT_EQ(texts.size(), 1u);
    EXPECT_EQ(texts[0], "Transcription failed: the speech recognizer failed (scripted fault)");
}

TEST_F(ProcessorTest, RetryBudgetIsBounded)
{
    script->rejectTimes[60000] = 10;
    JobId id = submit("audio.raw");

    EXPECT_EQ(runNext(), ProcessResult::Requeued);
    EXPECT_EQ(runNext(), ProcessResult::Requeued);
    EXPECT_EQ(runNext(), ProcessResult::Failed);

    Job job = stored(id);
    EXPECT_EQ(job.state, JobState::Failed);
    EXPECT_EQ(job.errorKind, ErrorKind::ChunkRejected);
    EXPECT_EQ(job.attempts, 2);
    EXPECT_EQ(delivery->textsFor(id).size(), 1u);
}

TEST_F(ProcessorTest, UndecodableAudioFails)
{
    build({"false"});
    JobId id = submit("audio.raw");

    EXPECT_EQ(runNext(), ProcessResult::Failed);
    Job job = stored(id);
    EXPECT_EQ(job.errorKind, ErrorKind::UnsupportedFormat);
    EXPECT_TRUE(script->fedOffsets().empty());
    EXPECT_TRUE(script->beginOffsets().empty());
}

TEST_F(ProcessorTest, MissingTranscoderIsRetried)
{
    build({"voxa-no-such-transcoder"});
    JobId id = submit("audio.raw");

    EXPECT_EQ(runNext(), ProcessResult::Requeued);
    Job job = stored(id);
    EXPECT_EQ(job.state, JobState::Queued);
    EXPECT_EQ(job.stage, JobState::Converting);
    EXPECT_EQ(job.errorKind, ErrorKind::ConversionFailed);
    EXPECT_EQ(job.attempts, 1);
}

TEST_F(ProcessorTest, MissingSourceFails)
{
    JobId id = submit("missing.raw");

    EXPECT_EQ(runNext(), ProcessResult::Failed);
    EXPECT_EQ(stored(id).errorKind, ErrorKind::SourceUnavailable);
}

TEST_F(ProcessorTest, CancelledBeforeClaim)
{
    JobId id = submit("audio.raw");
    auto lease = queue.acquireSlot();
    ASSERT_TRUE(lease);
    EXPECT_EQ(queue.cancel(id), CancelOutcome::Flagged);

    EXPECT_EQ(processor->process(*lease, 0), ProcessResult::Cancelled);
    EXPECT_EQ(stored(id).state, JobState::Cancelled);
    EXPECT_TRUE(script->fedOffsets().empty());
    EXPECT_EQ(delivery->textsFor(id), std::vector<std::string>{"Transcription cancelled."});
}

TEST_F(ProcessorTest, CancelStopsAtNextChunk)
{
    script->holdAt = 30000;
    JobId id = submit("audio.raw");
    auto lease = queue.acquireSlot();
    ASSERT_TRUE(lease);

    auto running = std::async(std::launch::async, [&] { return processor->process(*lease, 0); });
    ASSERT_TRUE(script->waitHeld(1));
    EXPECT_EQ(queue.cancel(id), CancelOutcome::Flagged);
    script->release();

    ASSERT_EQ(running.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(running.get(), ProcessResult::Cancelled);
    EXPECT_EQ(script->fedOffsets(), (std::vector<std::int64_t>{0, 30000}));

    Job job = stored(id);
    EXPECT_EQ(job.state, JobState::Cancelled);
    EXPECT_EQ(job.segments.size(), 2u);
    EXPECT_EQ(delivery->textsFor(id), std::vector<std::string>{"Transcription cancelled."});
}

TEST_F(ProcessorTest, StopLeavesJobActive)
{
    script->holdAt = 30000;
    JobId id = submit("audio.raw");
    auto lease = queue.acquireSlot();
    ASSERT_TRUE(lease);

    auto running = std::async(std::launch::async, [&] { return processor->process(*lease, 0); });
    ASSERT_TRUE(script->waitHeld(1));
    processor->requestStop();
    script->release();

    ASSERT_EQ(running.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(running.get(), ProcessResult::Interrupted);
    EXPECT_EQ(stored(id).state, JobState::Transcribing);
    EXPECT_EQ(queue.activeCount(), 0u);
    EXPECT_EQ(queue.check("alice"), AdmitStatus::DuplicateActiveJob);
    EXPECT_TRUE(delivery->all().empty());
}

TEST_F(ProcessorTest, SegmentOffsetsNeverGoBackwards)
{
    Segment late;
    late.text = "late";
    late.startMs = 10000;
    late.endMs = 12000;
    script->custom[60000] = {late};
    JobId id = submit("audio.raw");

    EXPECT_EQ(runNext(), ProcessResult::Completed);
    Job job = stored(id);
    ASSERT_EQ(job.segments.size(), 6u);
    EXPECT_EQ(job.segments[2].text, "late");
    EXPECT_EQ(job.segments[2].startMs, 30000);
    EXPECT_GE(job.segments[2].endMs, job.segments[2].startMs);
    for (std::size_t i = 1; i < job.segments.size(); ++i) {
        EXPECT_GE(job.segments[i].startMs, job.segments[i - 1].startMs);
    }
    EXPECT_EQ(delivery->textsFor(id), std::vector<std::string>{"w0 w30 late w90 w120 w150"});
}

TEST_F(ProcessorTest, SilentAudioCompletesWithNotice)
{
    writePcm(dir / "empty.raw", 0);
    JobId id = submit("empty.raw");

    EXPECT_EQ(runNext(), ProcessResult::Completed);
    Job job = stored(id);
    EXPECT_TRUE(job.segments.empty());
    EXPECT_EQ(delivery->textsFor(id), std::vector<std::string>{"No speech recognized."});
}

TEST_F(ProcessorTest, FactoryFailureIsReported)
{
    RecognizerFactory broken = [](int) -> std::unique_ptr<Recognizer> {
        throw std::runtime_error("model missing");
    };
    EXPECT_FALSE(processor->initializeEngines(broken, 1));
}
