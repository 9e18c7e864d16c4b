#include <catch2/catch_test_macros.hpp>

#include "jobs/job_orchestrator.hpp"
#include "storage/sqlite_job_store.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;

namespace {

// Runner whose calls block until released and whose outcome is scripted.
struct FakeRunner {
    std::atomic<int> calls{0};
    std::atomic<bool> release{false};
    std::atomic<bool> fail_next{false};
    std::atomic<bool> throw_next{false};
    double audio_duration = 45.0;
    std::string text; // empty = "transcript of <audio>"

    JobOrchestrator::Runner runner() {
        return [this](const std::string& audio, const std::string&,
                      const JobOrchestrator::LoadedCallback& on_loaded)
                   -> std::expected<TranscriptionResult, Error> {
            calls++;
            if (on_loaded) on_loaded(audio_duration);
            while (!release) std::this_thread::sleep_for(1ms);
            if (fail_next.exchange(false)) {
                return std::unexpected(Error{ErrorCode::ContextLost, "context recovery failed"});
            }
            if (throw_next.exchange(false)) throw std::runtime_error("decoder ran out of memory");
            TranscriptionResult r;
            r.text = text.empty() ? "transcript of " + audio : text;
            r.duration = audio_duration;
            r.confidence = 0.95;
            r.processing_time = 1.5;
            return r;
        };
    }
};

bool wait_for_status(JobOrchestrator& orch, const std::string& id, JobStatus want) {
    for (int i = 0; i < 2000; ++i) {
        auto rec = orch.get_status(id);
        if (rec && rec->status == want) return true;
        std::this_thread::sleep_for(1ms);
    }
    return false;
}

} // namespace

TEST_CASE("JobOrchestrator", "[jobs]") {
    std::atomic<double> now{5000.0};
    SqliteJobStore store([&now] { return now.load(); });
    REQUIRE(store.open(":memory:"));

    FakeRunner fake;
    WorkerPool pool(2);
    JobOrchestrator orch(store, pool, fake.runner(), 3600s, 90.0, false,
                         [&now] { return now.load(); });

    // Unblocks and joins the workers before orch goes away, even when a check fails.
    struct Drain {
        FakeRunner& fake;
        WorkerPool& pool;
        ~Drain() {
            fake.release = true;
            pool.shutdown();
        }
    } drain{fake, pool};

    SECTION("NewJobIsAccepted") {
        auto res = orch.submit("a", "/tmp/a.wav", "en");
        REQUIRE(res.has_value());
        REQUIRE(res->accepted);
        REQUIRE(res->record.status == JobStatus::Processing);
        REQUIRE(res->record.created_at == 5000.0);

        auto polled = orch.get_status("a");
        REQUIRE(polled.has_value());
        REQUIRE(polled->status == JobStatus::Processing);

        fake.release = true;
        REQUIRE(wait_for_status(orch, "a", JobStatus::Completed));

        auto done = orch.get_status("a");
        REQUIRE(done->transcription == "transcript of /tmp/a.wav");
        REQUIRE(done->duration == 45.0);
        REQUIRE(done->confidence == 0.95);
        REQUIRE(done->processing_time == 1.5);
        REQUIRE(done->finished_at.has_value());
    }

    SECTION("DuplicateWhileProcessingLaunchesNothing") {
        auto first = orch.submit("a", "/tmp/a.wav", "en");
        auto second = orch.submit("a", "/tmp/a.wav", "en");
        REQUIRE(first->accepted);
        REQUIRE_FALSE(second->accepted);
        REQUIRE(second->record.status == JobStatus::Processing);
        REQUIRE(second->record.created_at == first->record.created_at);

        REQUIRE(orch.get_status("a")->status == JobStatus::Processing);
        REQUIRE(orch.get_status("a")->status == JobStatus::Processing);

        fake.release = true;
        pool.shutdown();
        REQUIRE(fake.calls == 1);
    }

    SECTION("CompletedIsNeverRecomputed") {
        fake.release = true;
        REQUIRE(orch.submit("a", "/tmp/a.wav", "en")->accepted);
        REQUIRE(wait_for_status(orch, "a", JobStatus::Completed));

        auto again = orch.submit("a", "/tmp/other.wav", "en");
        REQUIRE(again.has_value());
        REQUIRE_FALSE(again->accepted);
        REQUIRE(again->record.status == JobStatus::Completed);
        REQUIRE(again->record.transcription == "transcript of /tmp/a.wav");

        pool.shutdown();
        REQUIRE(fake.calls == 1);
    }

    SECTION("FailedJobIsRetriedFresh") {
        fake.fail_next = true;
        fake.release = true;
        REQUIRE(orch.submit("a", "/tmp/a.wav", "en")->accepted);
        REQUIRE(wait_for_status(orch, "a", JobStatus::Failed));

        auto failed = orch.get_status("a");
        REQUIRE(failed->error == "context recovery failed");
        REQUIRE(failed->error_code == "context_lost");

        fake.release = false;
        now += 10;
        auto retry = orch.submit("a", "/tmp/a.wav", "en");
        REQUIRE(retry.has_value());
        REQUIRE(retry->accepted);
        REQUIRE(retry->record.status == JobStatus::Processing);
        REQUIRE(retry->record.created_at == 5010.0);
        REQUIRE_FALSE(retry->record.error.has_value());

        fake.release = true;
        REQUIRE(wait_for_status(orch, "a", JobStatus::Completed));
        pool.shutdown();
        REQUIRE(fake.calls == 2);
    }

    SECTION("UnknownJobIsNotFound") {
        auto rec = orch.get_status("missing");
        REQUIRE_FALSE(rec.has_value());
        REQUIRE(rec.error().code == ErrorCode::NotFound);
    }

    SECTION("ExpiredJobIsNotFound") {
        fake.release = true;
        REQUIRE(orch.submit("a", "/tmp/a.wav", "en")->accepted);
        REQUIRE(wait_for_status(orch, "a", JobStatus::Completed));
        now += 3601;
        REQUIRE(orch.get_status("a").error().code == ErrorCode::NotFound);
    }

    SECTION("InvalidRequests") {
        REQUIRE(orch.submit("", "/tmp/a.wav", "en").error().code == ErrorCode::InvalidRequest);
        REQUIRE(orch.submit("a", "", "en").error().code == ErrorCode::InvalidRequest);
        REQUIRE(orch.submit(std::string(300, 'x'), "/tmp/a.wav", "en").error().code ==
                ErrorCode::InvalidRequest);
    }

    SECTION("OverdueUsesAdaptiveTimeout") {
        fake.audio_duration = 100.0; // budget is max(90, 150) = 150s
        REQUIRE(orch.submit("a", "/tmp/a.wav", "en")->accepted);
        while (fake.calls == 0) std::this_thread::sleep_for(1ms);

        // duration is recorded once the audio is loaded
        JobRecord rec;
        for (int i = 0; i < 2000; ++i) {
            rec = *orch.get_status("a");
            if (rec.duration) break;
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(rec.duration == 100.0);
        REQUIRE(rec.status == JobStatus::Processing);

        now += 120;
        REQUIRE_FALSE(orch.is_overdue(*orch.get_status("a")));
        now += 40;
        REQUIRE(orch.is_overdue(*orch.get_status("a")));

        fake.release = true;
        REQUIRE(wait_for_status(orch, "a", JobStatus::Completed));
        REQUIRE_FALSE(orch.is_overdue(*orch.get_status("a")));
    }

    SECTION("RejectedWhenShuttingDown") {
        pool.shutdown();
        auto res = orch.submit("late", "/tmp/a.wav", "en");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(orch.get_status("late")->status == JobStatus::Failed);
    }
    SECTION("RunnerExceptionFailsTheJob") {
        fake.throw_next = true;
        fake.release = true;
        REQUIRE(orch.submit("a", "/tmp/a.wav", "en")->accepted);
        REQUIRE(wait_for_status(orch, "a", JobStatus::Failed));

        auto failed = orch.get_status("a");
        REQUIRE(failed->error_code == "inference_failed");
        REQUIRE(failed->error->find("decoder ran out of memory") != std::string::npos);
        REQUIRE(failed->finished_at.has_value());

        auto retry = orch.submit("a", "/tmp/a.wav", "en");
        REQUIRE(retry.has_value());
        REQUIRE(retry->accepted);
        REQUIRE(wait_for_status(orch, "a", JobStatus::Completed));
        pool.shutdown();
        REQUIRE(fake.calls == 2);
    }

    SECTION("SplitUtf8TranscriptIsStored") {
        fake.text = "abc \xC3";
        fake.release = true;
        REQUIRE(orch.submit("a", "/tmp/a.wav", "vi")->accepted);
        REQUIRE(wait_for_status(orch, "a", JobStatus::Completed));
        REQUIRE(orch.get_status("a")->transcription == "abc \xEF\xBF\xBD");
    }
}
