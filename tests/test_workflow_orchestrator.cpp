//
// Created by Giuseppe Francione on 16/10/26.
//

#include <gtest/gtest.h>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>
#include "test_support.hpp"
#include "../libfetchtag/include/event_bus.hpp"
#include "../libfetchtag/include/events.hpp"
#include "../libfetchtag/include/progress_sink.hpp"
#include "../libfetchtag/include/remote_trigger.hpp"
#include "../libfetchtag/include/tag_mutation_engine.hpp"
#include "../libfetchtag/include/workflow_orchestrator.hpp"

using namespace fetchtag;
using fetchtag::test::TempDir;
namespace fs = std::filesystem;

namespace {

constexpr auto kUrl = "https://www.youtube.com/watch?v=dQw4w9WgXcQ";

WorkflowRequest good_request() {
    return WorkflowRequest{kUrl, MetadataFields{"Artist", "Title", "Album", 3}};
}

// starts a "browser download" into the watched directory shortly after being triggered
class DownloadingTrigger : public IRemoteTrigger {
public:
    explicit DownloadingTrigger(fs::path target) : target_(std::move(target)) {}

    void open() override { ++opens; }

    void perform_remote_conversion(const std::string& url, std::stop_token) override {
        last_url = url;
        writer_ = std::jthread([this] {
            std::this_thread::sleep_for(std::chrono::milliseconds(300));
            const auto bytes = test::mp3_bytes(100);
            const std::vector<char> head(bytes.begin(), bytes.begin() + 20000);
            const std::vector<char> tail(bytes.begin() + 20000, bytes.end());
            test::write_bytes(target_, head);
            std::this_thread::sleep_for(std::chrono::milliseconds(150));
            test::write_bytes(target_, tail, true);
        });
    }

    bool close() override {
        ++closes;
        if (writer_.joinable()) writer_.join();
        return true;
    }

    std::atomic<int> opens{0};
    std::atomic<int> closes{0};
    std::string last_url;

private:
    fs::path target_;
    std::jthread writer_;
};

// blocks in perform until the run is cancelled
class BlockingTrigger : public IRemoteTrigger {
public:
    void open() override { ++opens; }

    void perform_remote_conversion(const std::string&, const std::stop_token st) override {
        ++performs;
        std::mutex mtx;
        std::condition_variable_any cv;
        std::unique_lock lock(mtx);
        entered = true;
        cv.wait(lock, st, [] { return false; });
        throw FetchtagError(ErrorKind::Cancelled, Stage::Triggering, "conversion cancelled");
    }

    bool close() override {
        ++closes;
        return true;
    }

    std::atomic<bool> entered{false};
    std::atomic<int> opens{0};
    std::atomic<int> performs{0};
    std::atomic<int> closes{0};
};

// triggers nothing and never fails, or fails with a fixed error
class ScriptedTrigger : public IRemoteTrigger {
public:
    explicit ScriptedTrigger(std::optional<ClassifiedError> failure = std::nullopt, bool close_ok = true)
        : failure_(std::move(failure)), close_ok_(close_ok) {}

    void open() override { ++opens; }

    void perform_remote_conversion(const std::string&, std::stop_token) override {
        ++performs;
        if (failure_) throw FetchtagError(*failure_);
    }

    bool close() override { return close_ok_; }

    std::atomic<int> opens{0};
    std::atomic<int> performs{0};

private:
    std::optional<ClassifiedError> failure_;
    bool close_ok_;
};

class RecordingProgress : public IProgressSink {
public:
    void report(const std::string& message, const int percent) override {
        std::lock_guard lock(mtx);
        messages.push_back(message);
        percents.push_back(percent);
    }

    std::vector<int> snapshot() {
        std::lock_guard lock(mtx);
        return percents;
    }

    std::string last_message() {
        std::lock_guard lock(mtx);
        return messages.empty() ? std::string{} : messages.back();
    }

    std::mutex mtx;
    std::vector<std::string> messages;
    std::vector<int> percents;
};

// takes its time writing, so a run can be cancelled while it is Mutating
class SlowEngine : public TagMutationEngine {
public:
    using TagMutationEngine::TagMutationEngine;

    std::atomic<bool> writing{false};

protected:
    void write_tags(const fs::path& path, const MetadataFields& fields) override {
        writing = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(800));
        TagMutationEngine::write_tags(path, fields);
    }
};

DetectorSettings fast_detector() {
    DetectorSettings s;
    s.poll_interval = std::chrono::milliseconds(100);
    s.poll_ceiling = std::chrono::seconds(5);
    return s;
}

WorkflowSettings workflow_for(const fs::path& dir) {
    WorkflowSettings s;
    s.watch = WatchTarget{dir, ".mp3"};
    s.download_timeout = std::chrono::seconds(10);
    s.fallback_lookback = std::chrono::seconds(600);
    s.max_retry_attempts = 3;
    return s;
}

}

TEST(WorkflowState, TransitionTable) {
    EXPECT_TRUE(is_allowed_transition(WorkflowState::Idle, WorkflowState::Triggering));
    EXPECT_TRUE(is_allowed_transition(WorkflowState::Failed, WorkflowState::Triggering));
    EXPECT_TRUE(is_allowed_transition(WorkflowState::Triggering, WorkflowState::AwaitingFile));
    EXPECT_TRUE(is_allowed_transition(WorkflowState::AwaitingFile, WorkflowState::Failed));
    EXPECT_FALSE(is_allowed_transition(WorkflowState::Triggering, WorkflowState::Mutating));
    EXPECT_FALSE(is_allowed_transition(WorkflowState::Idle, WorkflowState::Succeeded));
    EXPECT_FALSE(is_allowed_transition(WorkflowState::Succeeded, WorkflowState::Failed));
    EXPECT_TRUE(is_in_flight(WorkflowState::Mutating));
    EXPECT_FALSE(is_in_flight(WorkflowState::Failed));
}

TEST(WorkflowOrchestrator, DownloadsAndTagsTheFile) {
    const TempDir dir;
    const auto target = dir / "Some Video.mp3";
    DownloadingTrigger trigger(target);
    CompletionDetector detector(fast_detector());
    TagMutationEngine engine;
    EventBus bus;
    RecordingProgress progress;

    std::vector<WorkflowState> stages;
    std::mutex stages_mtx;
    bus.subscribe<WorkflowStageEvent>([&](const WorkflowStageEvent& e) {
        std::lock_guard lock(stages_mtx);
        stages.push_back(e.state);
    });
    std::optional<fs::path> succeeded;
    bus.subscribe<WorkflowSucceededEvent>([&](const WorkflowSucceededEvent& e) { succeeded = e.path; });

    WorkflowOrchestrator orchestrator(trigger, detector, engine, workflow_for(dir.path()), bus, &progress);
    orchestrator.submit(good_request());
    ASSERT_TRUE(orchestrator.wait());

    EXPECT_EQ(orchestrator.state(), WorkflowState::Succeeded);
    ASSERT_TRUE(orchestrator.result_path().has_value());
    EXPECT_EQ(*orchestrator.result_path(), target);
    EXPECT_EQ(succeeded, target);
    EXPECT_FALSE(orchestrator.last_error().has_value());
    EXPECT_EQ(trigger.last_url, kUrl);
    EXPECT_EQ(trigger.opens.load(), 1);
    EXPECT_EQ(trigger.closes.load(), 1);
    EXPECT_FALSE(detector.is_watching());

    const auto tags = engine.read_fields(target);
    EXPECT_EQ(tags.at("ARTIST"), "Artist");
    EXPECT_EQ(tags.at("TRACKNUMBER"), "3");

    EXPECT_EQ(progress.snapshot(), (std::vector<int>{0, 30, 40, 80, 100}));
    {
        std::lock_guard lock(stages_mtx);
        EXPECT_EQ(stages, (std::vector<WorkflowState>{WorkflowState::Triggering, WorkflowState::AwaitingFile,
                                                      WorkflowState::Mutating, WorkflowState::Succeeded}));
    }

    const auto status = orchestrator.status();
    EXPECT_EQ(status.attempt, 1);
    EXPECT_FALSE(status.detector_active);
    EXPECT_GT(status.elapsed.count(), 0);
}

TEST(WorkflowOrchestrator, InvalidRequestHasNoSideEffects) {
    const TempDir dir;
    ScriptedTrigger trigger;
    CompletionDetector detector(fast_detector());
    TagMutationEngine engine;
    EventBus bus;
    WorkflowOrchestrator orchestrator(trigger, detector, engine, workflow_for(dir.path()), bus);

    try {
        orchestrator.submit(WorkflowRequest{"https://example.com/x", MetadataFields{"A", "T", "", 1}});
        FAIL() << "expected FetchtagError";
    } catch (const FetchtagError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InputValidation);
        EXPECT_NE(e.error().message.find("Invalid video URL"), std::string::npos);
        EXPECT_NE(e.error().message.find("Album field cannot be empty."), std::string::npos);
    }
    EXPECT_EQ(orchestrator.state(), WorkflowState::Idle);
    EXPECT_EQ(trigger.performs.load(), 0);
    EXPECT_FALSE(detector.is_watching());
}

TEST(WorkflowOrchestrator, SecondSubmitIsRejectedWhileRunning) {
    const TempDir dir;
    BlockingTrigger trigger;
    CompletionDetector detector(fast_detector());
    TagMutationEngine engine;
    EventBus bus;
    WorkflowOrchestrator orchestrator(trigger, detector, engine, workflow_for(dir.path()), bus);

    orchestrator.submit(good_request());
    while (!trigger.entered.load()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    try {
        orchestrator.submit(good_request());
        FAIL() << "expected FetchtagError";
    } catch (const FetchtagError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::WorkflowAlreadyRunning);
    }
    EXPECT_TRUE(is_in_flight(orchestrator.state()));
    EXPECT_EQ(trigger.opens.load(), 1);
    EXPECT_EQ(trigger.performs.load(), 1);
    EXPECT_EQ(trigger.closes.load(), 0);
    EXPECT_FALSE(detector.is_watching());
    EXPECT_TRUE(orchestrator.cancel());
    EXPECT_EQ(trigger.closes.load(), 1);
}

TEST(WorkflowOrchestrator, SecondSubmitKeepsTheRunningDetectorSession) {
    const TempDir dir;
    ScriptedTrigger trigger;
    CompletionDetector detector(fast_detector());
    TagMutationEngine engine;
    EventBus bus;
    const auto settings = workflow_for(dir.path());
    WorkflowOrchestrator orchestrator(trigger, detector, engine, settings, bus);

    orchestrator.submit(good_request());
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!detector.is_watching() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(detector.is_watching());
    // idempotent while the session is active, so this is the orchestrator's own session
    const auto session = detector.start_watching(settings.watch);

    EXPECT_THROW(orchestrator.submit(good_request()), FetchtagError);
    EXPECT_EQ(orchestrator.state(), WorkflowState::AwaitingFile);
    EXPECT_EQ(trigger.opens.load(), 1);
    EXPECT_EQ(trigger.performs.load(), 1);
    EXPECT_EQ(detector.start_watching(settings.watch).id, session.id);

    EXPECT_TRUE(orchestrator.cancel());
    EXPECT_FALSE(detector.is_watching());
}

TEST(WorkflowOrchestrator, CancelWhileMutatingEndsInFailure) {
    const TempDir dir;
    const auto target = dir / "Some Video.mp3";
    DownloadingTrigger trigger(target);
    CompletionDetector detector(fast_detector());
    SlowEngine engine;
    EventBus bus;
    RecordingProgress progress;
    std::atomic<bool> succeeded{false};
    bus.subscribe<WorkflowSucceededEvent>([&](const WorkflowSucceededEvent&) { succeeded = true; });
    WorkflowOrchestrator orchestrator(trigger, detector, engine, workflow_for(dir.path()), bus, &progress);

    orchestrator.submit(good_request());
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!engine.writing.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ASSERT_TRUE(engine.writing.load());
    EXPECT_EQ(orchestrator.state(), WorkflowState::Mutating);

    EXPECT_TRUE(orchestrator.cancel());
    EXPECT_EQ(orchestrator.state(), WorkflowState::Failed);
    ASSERT_TRUE(orchestrator.last_error().has_value());
    EXPECT_EQ(orchestrator.last_error()->kind, ErrorKind::Cancelled);
    EXPECT_EQ(orchestrator.last_error()->stage, Stage::Mutating);
    EXPECT_FALSE(orchestrator.result_path().has_value());
    EXPECT_FALSE(succeeded.load());

    // the write itself was not interrupted
    EXPECT_EQ(engine.read_fields(target).at("ARTIST"), "Artist");
    EXPECT_EQ(progress.snapshot().back(), 80);
}

TEST(WorkflowOrchestrator, CancelEndsInCancelledFailure) {
    const TempDir dir;
    BlockingTrigger trigger;
    CompletionDetector detector(fast_detector());
    TagMutationEngine engine;
    EventBus bus;
    std::optional<WorkflowFailedEvent> failed;
    bus.subscribe<WorkflowFailedEvent>([&](const WorkflowFailedEvent& e) { failed = e; });

    WorkflowOrchestrator orchestrator(trigger, detector, engine, workflow_for(dir.path()), bus);
    orchestrator.submit(good_request());
    while (!trigger.entered.load()) std::this_thread::sleep_for(std::chrono::milliseconds(5));

    EXPECT_TRUE(orchestrator.cancel());
    EXPECT_EQ(orchestrator.state(), WorkflowState::Failed);
    ASSERT_TRUE(orchestrator.last_error().has_value());
    EXPECT_EQ(orchestrator.last_error()->kind, ErrorKind::Cancelled);
    EXPECT_EQ(trigger.closes.load(), 1);
    EXPECT_FALSE(detector.is_watching());
    ASSERT_TRUE(failed.has_value());
    EXPECT_TRUE(failed->cleanup_ok);
    EXPECT_FALSE(orchestrator.wait());
}

TEST(WorkflowOrchestrator, NoDownloadTimesOutAndIsRetryable) {
    const TempDir dir;
    ScriptedTrigger trigger;
    CompletionDetector detector(fast_detector());
    TagMutationEngine engine;
    EventBus bus;
    auto settings = workflow_for(dir.path());
    settings.download_timeout = std::chrono::seconds(1);
    settings.max_retry_attempts = 2;
    WorkflowOrchestrator orchestrator(trigger, detector, engine, settings, bus);

    orchestrator.submit(good_request());
    EXPECT_FALSE(orchestrator.wait());
    auto error = orchestrator.last_error();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->kind, ErrorKind::DownloadTimeout);
    EXPECT_EQ(error->stage, Stage::AwaitingFile);
    EXPECT_TRUE(error->retryable);
    EXPECT_FALSE(detector.is_watching());

    orchestrator.retry();
    EXPECT_FALSE(orchestrator.wait());
    EXPECT_EQ(orchestrator.status().attempt, 2);
    EXPECT_EQ(trigger.performs.load(), 2);

    // attempt cap reached
    try {
        orchestrator.retry();
        FAIL() << "expected FetchtagError";
    } catch (const FetchtagError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DownloadTimeout);
    }
    EXPECT_EQ(trigger.performs.load(), 2);
}

TEST(WorkflowOrchestrator, FallbackScanPicksUpAMissedDownload) {
    const TempDir dir;
    ScriptedTrigger trigger;
    CompletionDetector detector(fast_detector());
    TagMutationEngine engine;
    EventBus bus;
    auto settings = workflow_for(dir.path());
    settings.download_timeout = std::chrono::seconds(1);

    // finished before anyone was watching
    const auto early = dir / "early.mp3";
    test::write_mp3(early);

    WorkflowOrchestrator orchestrator(trigger, detector, engine, settings, bus);
    orchestrator.submit(good_request());
    ASSERT_TRUE(orchestrator.wait());
    EXPECT_EQ(*orchestrator.result_path(), early);
    EXPECT_EQ(engine.read_fields(early).at("TITLE"), "Title");
}

TEST(WorkflowOrchestrator, RemoteFailureIsReportedWithItsKind) {
    const TempDir dir;
    ScriptedTrigger trigger(ClassifiedError::make(ErrorKind::RemoteElementMissing, Stage::Triggering,
                                                  "convert button not found"));
    CompletionDetector detector(fast_detector());
    TagMutationEngine engine;
    EventBus bus;
    RecordingProgress progress;
    WorkflowOrchestrator orchestrator(trigger, detector, engine, workflow_for(dir.path()), bus, &progress);

    orchestrator.submit(good_request());
    EXPECT_FALSE(orchestrator.wait());
    EXPECT_EQ(orchestrator.last_error()->kind, ErrorKind::RemoteElementMissing);
    // the failure is the last thing the sink hears, without moving the bar
    EXPECT_EQ(progress.snapshot(), (std::vector<int>{0, 0}));
    const auto shown = progress.last_message();
    EXPECT_NE(shown.find(orchestrator.last_error()->user_message()), std::string::npos);
    EXPECT_NE(shown.find("(triggering)"), std::string::npos);
    EXPECT_FALSE(detector.is_watching());
}

TEST(WorkflowOrchestrator, NonRetryableFailureRefusesRetry) {
    const TempDir dir;
    ScriptedTrigger trigger(ClassifiedError::make(ErrorKind::RemoteAutomationUnavailable, Stage::Triggering,
                                                  "no browser"));
    CompletionDetector detector(fast_detector());
    TagMutationEngine engine;
    EventBus bus;
    WorkflowOrchestrator orchestrator(trigger, detector, engine, workflow_for(dir.path()), bus);

    EXPECT_THROW(orchestrator.retry(), FetchtagError);   // nothing to retry yet

    orchestrator.submit(good_request());
    EXPECT_FALSE(orchestrator.wait());
    try {
        orchestrator.retry();
        FAIL() << "expected FetchtagError";
    } catch (const FetchtagError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::RemoteAutomationUnavailable);
    }
    EXPECT_EQ(trigger.performs.load(), 1);
}

TEST(WorkflowOrchestrator, CleanupProblemsAreReported) {
    const TempDir dir;
    ScriptedTrigger trigger(ClassifiedError::make(ErrorKind::RemoteUnreachable, Stage::Triggering, "offline"),
                            false);
    CompletionDetector detector(fast_detector());
    TagMutationEngine engine;
    EventBus bus;
    std::optional<WorkflowFailedEvent> failed;
    bus.subscribe<WorkflowFailedEvent>([&](const WorkflowFailedEvent& e) { failed = e; });
    WorkflowOrchestrator orchestrator(trigger, detector, engine, workflow_for(dir.path()), bus);

    orchestrator.submit(good_request());
    EXPECT_FALSE(orchestrator.wait());
    ASSERT_TRUE(failed.has_value());
    EXPECT_FALSE(failed->cleanup_ok);
    EXPECT_EQ(failed->error.kind, ErrorKind::RemoteUnreachable);
}

TEST(WorkflowOrchestrator, NewSubmitAfterFailureStartsOver) {
    const TempDir dir;
    ScriptedTrigger trigger(ClassifiedError::make(ErrorKind::RemoteUnreachable, Stage::Triggering, "offline"));
    CompletionDetector detector(fast_detector());
    TagMutationEngine engine;
    EventBus bus;
    WorkflowOrchestrator orchestrator(trigger, detector, engine, workflow_for(dir.path()), bus);

    orchestrator.submit(good_request());
    EXPECT_FALSE(orchestrator.wait());
    orchestrator.submit(good_request());
    EXPECT_FALSE(orchestrator.wait());
    EXPECT_EQ(orchestrator.status().attempt, 1);
    EXPECT_EQ(trigger.performs.load(), 2);
}
