#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "bundl/net/probe.hpp"
#include "bundl/net/reconcile.hpp"

using bundl::core::PlatformKey;
using bundl::core::StatusCode;
using bundl::net::ProbeResult;
using bundl::net::ReconcileResult;
using bundl::net::ReconcileTask;
using bundl::storage::StagedArtifact;
using bundl::storage::StagedArtifacts;
using namespace std::chrono_literals;

namespace {
    enum class Answer { Found, NotFound, Indeterminate, Throw };

    StagedArtifact staged(const std::string& name, PlatformKey platform = PlatformKey::Android) {
        StagedArtifact a{};
        a.identity.name = name;
        a.identity.platform = platform;
        a.identity.hash.b.fill(0x5a);
        a.path = "/staging/" + name;
        return a;
    }

    std::string file_name(const StagedArtifact& a) {
        std::string out;
        EXPECT_EQ(bundl::storage::staged_file_name(a, &out).code, StatusCode::Ok);
        return out;
    }

    std::vector<std::string> names(const StagedArtifacts& list) {
        std::vector<std::string> out;
        for (const StagedArtifact& a : list) {
            out.push_back(a.identity.name);
        }
        return out;
    }

    // Answers from a per-file script (the last answer repeats) and records
    // how many probes overlap.
    class ScriptedProbe final : public bundl::net::ExistenceProbe {
    public:
        void script(const StagedArtifact& a, std::vector<Answer> answers) {
            std::lock_guard lk(mu_);
            scripts_[file_name(a)] = std::move(answers);
        }

        void set_latency(std::chrono::milliseconds latency) { latency_ = latency; }

        ProbeResult probe(const std::string& file) override {
            const int now = ++in_flight_;
            int seen = max_in_flight_.load();
            while (now > seen && !max_in_flight_.compare_exchange_weak(seen, now)) {
            }

            std::this_thread::sleep_for(latency_);

            Answer answer = Answer::NotFound;
            {
                std::lock_guard lk(mu_);
                const std::size_t n = calls_[file]++;
                const auto it = scripts_.find(file);
                if (it != scripts_.end() && !it->second.empty()) {
                    answer = it->second[std::min(n, it->second.size() - 1)];
                }
            }
            ++total_calls_;
            --in_flight_;

            switch (answer) {
            case Answer::Found:
                return ProbeResult::Found;
            case Answer::NotFound:
                return ProbeResult::NotFound;
            case Answer::Indeterminate:
                return ProbeResult::Indeterminate;
            case Answer::Throw:
                throw std::runtime_error("connection reset");
            }
            return ProbeResult::Indeterminate;
        }

        std::size_t calls(const StagedArtifact& a) {
            std::lock_guard lk(mu_);
            return calls_[file_name(a)];
        }

        int max_in_flight() const { return max_in_flight_.load(); }
        int total_calls() const { return total_calls_.load(); }

    private:
        std::mutex mu_;
        std::map<std::string, std::vector<Answer>> scripts_;
        std::map<std::string, std::size_t> calls_;
        std::chrono::milliseconds latency_{0};
        std::atomic<int> in_flight_{0};
        std::atomic<int> max_in_flight_{0};
        std::atomic<int> total_calls_{0};
    };

    // Blocks the probe of one file until release(); everything else is
    // NotFound.
    class GatedProbe final : public bundl::net::ExistenceProbe {
    public:
        explicit GatedProbe(std::string gated) : gated_(std::move(gated)) {}

        ProbeResult probe(const std::string& file) override {
            if (file != gated_) {
                return ProbeResult::NotFound;
            }
            std::unique_lock lk(mu_);
            entered_ = true;
            cv_.notify_all();
            cv_.wait(lk, [this] { return released_; });
            returned_ = true;
            cv_.notify_all();
            return ProbeResult::Found;
        }

        bool wait_entered(std::chrono::milliseconds timeout) {
            std::unique_lock lk(mu_);
            return cv_.wait_for(lk, timeout, [this] { return entered_; });
        }

        bool wait_returned(std::chrono::milliseconds timeout) {
            std::unique_lock lk(mu_);
            return cv_.wait_for(lk, timeout, [this] { return returned_; });
        }

        void release() {
            std::lock_guard lk(mu_);
            released_ = true;
            cv_.notify_all();
        }

    private:
        std::string gated_;
        std::mutex mu_;
        std::condition_variable cv_;
        bool entered_{false};
        bool released_{false};
        bool returned_{false};
    };

    bundl::core::ReconcileConfig fast_config(bundl::core::u32 retries, bundl::core::u32 concurrency = 4) {
        bundl::core::ReconcileConfig cfg;
        cfg.max_retries = retries;
        cfg.retry_delay = 1ms;
        cfg.max_concurrency = concurrency;
        return cfg;
    }
} // namespace

TEST(Reconcile, FoundNotFoundIndeterminate) {
    const StagedArtifacts input = {staged("a"), staged("b"), staged("c")};
    ScriptedProbe probe;
    probe.script(input[0], {Answer::Found});
    probe.script(input[1], {Answer::NotFound});
    probe.script(input[2], {Answer::Indeterminate});

    ReconcileResult r;
    ASSERT_EQ(bundl::net::reconcile(input, probe, fast_config(2), &r).code, StatusCode::Ok);

    EXPECT_EQ(names(r.needs_upload), std::vector<std::string>{"b"});
    EXPECT_EQ(names(r.published), std::vector<std::string>{"a"});
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].artifact, "c");
    EXPECT_EQ(r.errors[0].platform, "Android");
    EXPECT_EQ(r.errors[0].status.code, StatusCode::ProbeIndeterminate);
    EXPECT_EQ(r.errors[0].status.aux, 3u);
    EXPECT_TRUE(r.unresolved.empty());
    EXPECT_FALSE(r.cancelled);

    EXPECT_EQ(probe.calls(input[0]), 1u);
    EXPECT_EQ(probe.calls(input[1]), 1u);
    EXPECT_EQ(probe.calls(input[2]), 3u);
    EXPECT_EQ(r.attempts, 5u);
}

TEST(Reconcile, RetrySucceedsWithinBudget) {
    const StagedArtifacts input = {staged("flaky")};
    ScriptedProbe probe;
    probe.script(input[0], {Answer::Indeterminate, Answer::Indeterminate, Answer::NotFound});

    ReconcileResult r;
    ASSERT_EQ(bundl::net::reconcile(input, probe, fast_config(2), &r).code, StatusCode::Ok);
    EXPECT_EQ(names(r.needs_upload), std::vector<std::string>{"flaky"});
    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(probe.calls(input[0]), 3u);
}

TEST(Reconcile, RetryBudgetExhausted) {
    const StagedArtifacts input = {staged("flaky")};
    ScriptedProbe probe;
    probe.script(input[0], {Answer::Indeterminate, Answer::Indeterminate, Answer::NotFound});

    ReconcileResult r;
    ASSERT_EQ(bundl::net::reconcile(input, probe, fast_config(1), &r).code, StatusCode::Ok);
    EXPECT_TRUE(r.needs_upload.empty());
    EXPECT_TRUE(r.published.empty());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].status.code, StatusCode::ProbeIndeterminate);
    EXPECT_EQ(probe.calls(input[0]), 2u);
}

TEST(Reconcile, NoRetriesMeansOneAttempt) {
    const StagedArtifacts input = {staged("once")};
    ScriptedProbe probe;
    probe.script(input[0], {Answer::Indeterminate, Answer::Found});

    ReconcileResult r;
    ASSERT_EQ(bundl::net::reconcile(input, probe, fast_config(0), &r).code, StatusCode::Ok);
    EXPECT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(probe.calls(input[0]), 1u);
}

TEST(Reconcile, ThrowingProbeIsIndeterminate) {
    const StagedArtifacts input = {staged("a"), staged("b")};
    ScriptedProbe probe;
    probe.script(input[0], {Answer::Throw, Answer::Found});
    probe.script(input[1], {Answer::Throw});

    ReconcileResult r;
    ASSERT_EQ(bundl::net::reconcile(input, probe, fast_config(1), &r).code, StatusCode::Ok);
    EXPECT_EQ(names(r.published), std::vector<std::string>{"a"});
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].artifact, "b");
}

TEST(Reconcile, ConcurrencyBound) {
    StagedArtifacts input;
    for (int i = 0; i < 40; ++i) {
        input.push_back(staged("artifact" + std::to_string(i)));
    }

    for (bundl::core::u32 limit : {1u, 3u, 8u}) {
        ScriptedProbe probe;
        probe.set_latency(2ms);
        // Every fourth artifact needs a retry, to mix delayed work in.
        for (std::size_t i = 0; i < input.size(); i += 4) {
            probe.script(input[i], {Answer::Indeterminate, Answer::NotFound});
        }

        ReconcileResult r;
        ASSERT_EQ(bundl::net::reconcile(input, probe, fast_config(2, limit), &r).code, StatusCode::Ok);
        EXPECT_LE(probe.max_in_flight(), static_cast<int>(limit));
        EXPECT_GE(probe.max_in_flight(), 1);
        EXPECT_EQ(r.needs_upload.size(), input.size());
        EXPECT_EQ(probe.total_calls(), 50);
    }
}

TEST(Reconcile, NeedsUploadKeepsInputOrder) {
    StagedArtifacts input;
    for (int i = 0; i < 12; ++i) {
        input.push_back(staged("n" + std::to_string(i)));
    }
    ScriptedProbe probe;
    probe.set_latency(1ms);
    // Early entries resolve late.
    for (std::size_t i = 0; i < 6; ++i) {
        probe.script(input[i], {Answer::Indeterminate, Answer::Indeterminate, Answer::NotFound});
    }

    ReconcileResult r;
    ASSERT_EQ(bundl::net::reconcile(input, probe, fast_config(3, 4), &r).code, StatusCode::Ok);
    EXPECT_EQ(names(r.needs_upload), names(input));
}

TEST(Reconcile, StartThenWaitAndFuture) {
    const StagedArtifacts input = {staged("a"), staged("b"), staged("c", PlatformKey::WebGLPlayer)};
    ScriptedProbe probe;
    probe.set_latency(1ms);
    probe.script(input[1], {Answer::Found});

    ReconcileTask task(input, &probe, fast_config(1, 2));
    std::shared_future<ReconcileResult> future = task.future();
    ASSERT_EQ(task.start().code, StatusCode::Ok);
    EXPECT_EQ(task.start().code, StatusCode::Conflict);

    ASSERT_TRUE(task.wait_for(5s));
    EXPECT_TRUE(task.done());

    ReconcileResult waited;
    ASSERT_EQ(task.wait(&waited).code, StatusCode::Ok);
    const ReconcileResult& from_future = future.get();
    EXPECT_EQ(names(waited.needs_upload), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(names(from_future.needs_upload), names(waited.needs_upload));
    EXPECT_EQ(names(from_future.published), std::vector<std::string>{"b"});
}

TEST(Reconcile, CancelKeepsPartialResults) {
    const StagedArtifacts input = {staged("a"), staged("b"), staged("c"), staged("d")};
    ScriptedProbe probe;
    probe.script(input[1], {Answer::Indeterminate});
    probe.script(input[3], {Answer::Indeterminate});

    bundl::core::ReconcileConfig cfg = fast_config(5, 2);
    cfg.retry_delay = 10s;
    ReconcileTask task(input, &probe, cfg);
    ASSERT_EQ(task.start().code, StatusCode::Ok);

    // Wait until every artifact has been probed once; b and d now sit out
    // their retry delay.
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (probe.total_calls() < 4 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_EQ(probe.total_calls(), 4);
    EXPECT_FALSE(task.done());

    task.cancel();
    ASSERT_TRUE(task.wait_for(2s));

    ReconcileResult r;
    ASSERT_EQ(task.wait(&r).code, StatusCode::Ok);
    EXPECT_TRUE(r.cancelled);
    EXPECT_EQ(names(r.needs_upload), (std::vector<std::string>{"a", "c"}));
    EXPECT_EQ(names(r.unresolved), (std::vector<std::string>{"b", "d"}));
    EXPECT_TRUE(r.errors.empty());
}

TEST(Reconcile, CancelReturnsWhileLookupHangs) {
    const StagedArtifacts input = {staged("quick"), staged("hang")};
    GatedProbe probe(file_name(input[1]));

    // One worker: quick is settled before hang is dispatched.
    ReconcileTask task(input, &probe, fast_config(0, 1));
    struct ReleaseOnExit {
        GatedProbe& probe;
        ~ReleaseOnExit() { probe.release(); }
    } release_on_exit{probe};
    std::shared_future<ReconcileResult> future = task.future();
    ASSERT_EQ(task.start().code, StatusCode::Ok);
    ASSERT_TRUE(probe.wait_entered(5s));

    const auto begin = std::chrono::steady_clock::now();
    task.cancel();
    EXPECT_TRUE(task.done());
    ASSERT_TRUE(task.wait_for(500ms));
    ASSERT_EQ(future.wait_for(0ms), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 500ms);

    ReconcileResult r;
    ASSERT_EQ(task.wait(&r).code, StatusCode::Ok);
    EXPECT_TRUE(r.cancelled);
    EXPECT_EQ(names(r.needs_upload), std::vector<std::string>{"quick"});
    EXPECT_EQ(names(r.unresolved), std::vector<std::string>{"hang"});
    EXPECT_TRUE(r.published.empty());

    // The late Found answer does not change the result.
    probe.release();
    ASSERT_TRUE(probe.wait_returned(5s));
    ReconcileResult after;
    ASSERT_EQ(task.wait(&after).code, StatusCode::Ok);
    EXPECT_EQ(names(after.unresolved), std::vector<std::string>{"hang"});
    EXPECT_TRUE(after.published.empty());
    EXPECT_EQ(names(future.get().unresolved), std::vector<std::string>{"hang"});
}

TEST(Reconcile, CancelBeforeStart) {
    const StagedArtifacts input = {staged("a")};
    ScriptedProbe probe;
    ReconcileTask task(input, &probe, fast_config(0));
    task.cancel();
    EXPECT_TRUE(task.done());

    ReconcileResult r;
    ASSERT_EQ(task.run(&r).code, StatusCode::Ok);
    EXPECT_TRUE(r.cancelled);
    EXPECT_EQ(names(r.unresolved), std::vector<std::string>{"a"});
    EXPECT_EQ(probe.total_calls(), 0);
}

TEST(Reconcile, RetryDelayIsHonoured) {
    const StagedArtifacts input = {staged("slow")};
    ScriptedProbe probe;
    probe.script(input[0], {Answer::Indeterminate, Answer::NotFound});

    bundl::core::ReconcileConfig cfg = fast_config(1, 1);
    cfg.retry_delay = 50ms;

    const auto begin = std::chrono::steady_clock::now();
    ReconcileResult r;
    ASSERT_EQ(bundl::net::reconcile(input, probe, cfg, &r).code, StatusCode::Ok);
    EXPECT_GE(std::chrono::steady_clock::now() - begin, 50ms);
    EXPECT_EQ(r.needs_upload.size(), 1u);
}

TEST(Reconcile, EmptyInput) {
    ScriptedProbe probe;
    ReconcileResult r;
    ASSERT_EQ(bundl::net::reconcile({}, probe, fast_config(3), &r).code, StatusCode::Ok);
    EXPECT_TRUE(r.needs_upload.empty());
    EXPECT_EQ(r.attempts, 0u);
}

TEST(Reconcile, InvalidConfigAndIdentity) {
    ScriptedProbe probe;
    ReconcileResult r;
    EXPECT_EQ(bundl::net::reconcile({staged("a")}, probe, fast_config(1, 0), &r).code, StatusCode::Invalid);

    ReconcileTask no_probe({staged("a")}, nullptr, fast_config(1));
    EXPECT_EQ(no_probe.start().code, StatusCode::Invalid);

    // A staged entry whose name cannot be encoded is an error, not a probe.
    const StagedArtifacts input = {staged("bad_name"), staged("ok")};
    ASSERT_EQ(bundl::net::reconcile(input, probe, fast_config(1), &r).code, StatusCode::Ok);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].status.code, StatusCode::InvalidArtifactName);
    EXPECT_EQ(names(r.needs_upload), std::vector<std::string>{"ok"});
    EXPECT_EQ(probe.total_calls(), 1);
}

TEST(Reconcile, RetryDelayBeyondLimitIsRejected) {
    const StagedArtifacts input = {staged("a")};
    ScriptedProbe probe;
    probe.script(input[0], {Answer::Indeterminate});

    bundl::core::ReconcileConfig cfg = fast_config(1, 1);
    cfg.retry_delay = std::chrono::milliseconds::max();
    ReconcileResult r;
    EXPECT_EQ(bundl::net::reconcile(input, probe, cfg, &r).code, StatusCode::Invalid);
    EXPECT_EQ(probe.total_calls(), 0);

    cfg.retry_delay = bundl::core::kMaxRetryDelay + 1ms;
    ReconcileTask task(input, &probe, cfg);
    EXPECT_EQ(task.start().code, StatusCode::Invalid);
}

class DirectoryProbeTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "bundl_probe_test";
        std::filesystem::remove_all(root_);
        std::filesystem::create_directories(root_);
        std::ofstream(root_ / "a_Android_5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a.bundle") << "x";
    }

    void TearDown() override { std::filesystem::remove_all(root_); }

    std::filesystem::path root_;
};

TEST_F(DirectoryProbeTest, FoundAndNotFound) {
    bundl::net::DirectoryProbe probe(root_);
    EXPECT_EQ(probe.probe("a_Android_5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a.bundle"), ProbeResult::Found);
    EXPECT_EQ(probe.probe("b_Android_5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a.bundle"), ProbeResult::NotFound);
}

TEST_F(DirectoryProbeTest, MissingRootIsIndeterminate) {
    bundl::net::DirectoryProbe probe(root_ / "not-mounted");
    EXPECT_EQ(probe.probe("a_Android_5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a5a.bundle"), ProbeResult::Indeterminate);
}

TEST_F(DirectoryProbeTest, EndToEndThroughReconcile) {
    const StagedArtifacts input = {staged("a"), staged("b")};
    bundl::net::DirectoryProbe probe(root_);
    ReconcileResult r;
    ASSERT_EQ(bundl::net::reconcile(input, probe, fast_config(0), &r).code, StatusCode::Ok);
    EXPECT_EQ(names(r.published), std::vector<std::string>{"a"});
    EXPECT_EQ(names(r.needs_upload), std::vector<std::string>{"b"});
}
