#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "bundl/core/config.hpp"
#include "bundl/core/diagnostics.hpp"
#include "bundl/core/errors.hpp"
#include "bundl/core/types.hpp"
#include "bundl/net/probe.hpp"
#include "bundl/storage/staging.hpp"

namespace bundl::net {

    struct ReconcileResult {
        bundl::storage::StagedArtifacts needs_upload;  // probe said NotFound, input order
        bundl::storage::StagedArtifacts published;     // probe said Found, input order
        bundl::storage::StagedArtifacts unresolved;    // still pending when cancelled
        bundl::core::ArtifactErrors errors;            // ProbeIndeterminate after the last retry
        bundl::core::u64 attempts{0};                  // probe calls made
        bool cancelled{false};
    };

    // Decides which staged artifacts are missing from the remote store.
    //
    // Each artifact is probed by its canonical file name. An Indeterminate
    // answer (or a probe that throws) is retried up to cfg.max_retries times,
    // cfg.retry_delay apart; an artifact still indeterminate after that is a
    // ProbeIndeterminate error and lands in neither needs_upload nor
    // published. At most cfg.max_concurrency probes are in flight; an
    // artifact waiting out its retry delay does not count.
    //
    // Either start() it and observe with done()/wait()/wait_for()/future(),
    // or call run() to drive it on the calling thread. The probe must
    // outlive the task: the destructor joins the workers, so it waits for
    // abandoned probes to return.
    class ReconcileTask {
    public:
        ReconcileTask(bundl::storage::StagedArtifacts staged, ExistenceProbe* probe, bundl::core::ReconcileConfig cfg);
        ~ReconcileTask();

        ReconcileTask(const ReconcileTask&) = delete;
        ReconcileTask& operator=(const ReconcileTask&) = delete;

        // Spawns max_concurrency workers and returns. Invalid for a bad
        // config or null probe, Conflict when already started.
        [[nodiscard]] bundl::core::Status start() noexcept;

        // Probes on the calling thread (plus max_concurrency - 1 workers)
        // until every artifact is resolved or the task is cancelled.
        [[nodiscard]] bundl::core::Status run(ReconcileResult* out) noexcept;

        [[nodiscard]] bool done() const;
        [[nodiscard]] bundl::core::Status wait(ReconcileResult* out);
        [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout);
        [[nodiscard]] std::shared_future<ReconcileResult> future() const { return future_; }

        // Stops dispatching, drops pending retries and completes the task at
        // once. Probes still in flight are abandoned: their artifacts are
        // reported as unresolved and their late answers are ignored. run()
        // returns once the probe on the calling thread, if any, returns.
        void cancel();

    private:
        enum class Outcome : bundl::core::u8 { Pending, NeedsUpload, Published, Failed };

        using Clock = std::chrono::steady_clock;

        [[nodiscard]] bundl::core::Status prepare_locked();
        void worker();
        ProbeResult probe_once(std::size_t index);
        void settle_locked(std::size_t index, ProbeResult r);
        void resolve_locked(std::size_t index, Outcome outcome);
        void maybe_finish_locked();
        [[nodiscard]] ReconcileResult collect_locked() const;

        bundl::storage::StagedArtifacts staged_;
        std::vector<std::string> file_names_;
        ExistenceProbe* probe_;
        bundl::core::ReconcileConfig cfg_;

        mutable std::mutex mu_;
        std::condition_variable work_cv_;
        std::condition_variable done_cv_;

        std::deque<std::size_t> ready_;
        std::multimap<Clock::time_point, std::size_t> delayed_;
        std::vector<Outcome> outcomes_;
        std::vector<bundl::core::u32> attempts_;
        bundl::core::ArtifactErrors errors_by_index_;      // one slot per input, status ok while unused
        std::size_t remaining_{0};
        bool started_{false};
        bool cancelled_{false};
        bool finished_{false};
        ReconcileResult result_;

        std::promise<ReconcileResult> promise_;
        std::shared_future<ReconcileResult> future_;

        std::vector<std::jthread> workers_;
    };

    // Blocking convenience over ReconcileTask::run().
    [[nodiscard]] bundl::core::Status reconcile(const bundl::storage::StagedArtifacts& staged,
        ExistenceProbe& probe,
        const bundl::core::ReconcileConfig& cfg,
        ReconcileResult* out) noexcept;

} // namespace bundl::net
