#include "bundl/net/reconcile.hpp"

#include <exception>
#include <new>
#include <system_error>
#include <utility>

#include "bundl/core/log.hpp"

namespace bundl::net {
    using bundl::core::Status;
    using bundl::core::StatusCode;
    using bundl::core::StatusDomain;

    ReconcileTask::ReconcileTask(bundl::storage::StagedArtifacts staged,
        ExistenceProbe* probe,
        bundl::core::ReconcileConfig cfg)
        : staged_(std::move(staged)),
          probe_(probe),
          cfg_(cfg),
          outcomes_(staged_.size(), Outcome::Pending),
          attempts_(staged_.size(), 0),
          errors_by_index_(staged_.size()),
          remaining_(staged_.size()) {
        future_ = promise_.get_future().share();
    }

    ReconcileTask::~ReconcileTask() {
        cancel();
        workers_.clear();
    }

    Status ReconcileTask::prepare_locked() {
        const Status cs = bundl::core::config_validate(cfg_);
        if (!bundl::core::is_ok(cs)) {
            return cs;
        }
        if (probe_ == nullptr) {
            return bundl::core::make_status(StatusDomain::Reconcile, StatusCode::Invalid);
        }
        if (started_ || finished_) {
            return bundl::core::make_status(StatusDomain::Reconcile, StatusCode::Conflict);
        }
        started_ = true;

        file_names_.resize(staged_.size());
        for (std::size_t i = 0; i < staged_.size(); ++i) {
            const Status s = bundl::storage::staged_file_name(staged_[i], &file_names_[i]);
            if (!bundl::core::is_ok(s)) {
                const bundl::storage::ArtifactIdentity& id = staged_[i].identity;
                errors_by_index_[i] = bundl::core::make_error(s, id.name, bundl::core::platform_name(id.platform),
                    "no canonical file name");
                resolve_locked(i, Outcome::Failed);
                continue;
            }
            ready_.push_back(i);
        }
        maybe_finish_locked();
        return bundl::core::ok_status();
    }

    Status ReconcileTask::start() noexcept {
        try {
            {
                std::lock_guard lk(mu_);
                const Status s = prepare_locked();
                if (!bundl::core::is_ok(s) || finished_) {
                    return s;
                }
            }
            for (bundl::core::u32 i = 0; i < cfg_.max_concurrency; ++i) {
                workers_.emplace_back([this] { worker(); });
            }
            return bundl::core::ok_status();
        } catch (const std::system_error& e) {
            bundl::core::log_error("reconcile: cannot start workers: %s", e.what());
            cancel();
            return bundl::core::make_status(StatusDomain::Reconcile, StatusCode::Unavailable);
        } catch (const std::bad_alloc&) {
            cancel();
            return bundl::core::make_status(StatusDomain::Reconcile, StatusCode::Unavailable);
        }
    }

    Status ReconcileTask::run(ReconcileResult* out) noexcept {
        try {
            bool drive = false;
            {
                std::lock_guard lk(mu_);
                if (!started_ && !finished_) {
                    const Status s = prepare_locked();
                    if (!bundl::core::is_ok(s)) {
                        return s;
                    }
                    drive = !finished_;
                }
            }
            if (drive) {
                for (bundl::core::u32 i = 1; i < cfg_.max_concurrency; ++i) {
                    workers_.emplace_back([this] { worker(); });
                }
                worker();
            }
            return wait(out);
        } catch (const std::system_error& e) {
            bundl::core::log_error("reconcile: %s", e.what());
            cancel();
            return bundl::core::make_status(StatusDomain::Reconcile, StatusCode::Unavailable);
        } catch (const std::bad_alloc&) {
            cancel();
            return bundl::core::make_status(StatusDomain::Reconcile, StatusCode::Unavailable);
        }
    }

    bool ReconcileTask::done() const {
        std::lock_guard lk(mu_);
        return finished_;
    }

    Status ReconcileTask::wait(ReconcileResult* out) {
        std::unique_lock lk(mu_);
        if (!started_ && !finished_) {
            return bundl::core::make_status(StatusDomain::Reconcile, StatusCode::Unavailable);
        }
        done_cv_.wait(lk, [this] { return finished_; });
        if (out != nullptr) {
            *out = result_;
        }
        return bundl::core::ok_status();
    }

    bool ReconcileTask::wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock lk(mu_);
        return done_cv_.wait_for(lk, timeout, [this] { return finished_; });
    }

    void ReconcileTask::cancel() {
        std::lock_guard lk(mu_);
        if (finished_) {
            return;
        }
        cancelled_ = true;
        ready_.clear();
        delayed_.clear();
        maybe_finish_locked();
        work_cv_.notify_all();
    }

    void ReconcileTask::worker() {
        std::unique_lock lk(mu_);
        for (;;) {
            if (cancelled_ || remaining_ == 0) {
                return;
            }

            const Clock::time_point now = Clock::now();
            while (!delayed_.empty() && delayed_.begin()->first <= now) {
                ready_.push_back(delayed_.begin()->second);
                delayed_.erase(delayed_.begin());
            }

            if (!ready_.empty()) {
                const std::size_t index = ready_.front();
                ready_.pop_front();
                ++attempts_[index];

                lk.unlock();
                const ProbeResult r = probe_once(index);
                lk.lock();

                settle_locked(index, r);
                continue;
            }

            if (!delayed_.empty()) {
                const Clock::time_point due = delayed_.begin()->first;
                work_cv_.wait_until(lk, due);
            } else {
                work_cv_.wait(lk);
            }
        }
    }

    ProbeResult ReconcileTask::probe_once(std::size_t index) {
        try {
            return probe_->probe(file_names_[index]);
        } catch (const std::exception& e) {
            bundl::core::log_warn("probe %s threw: %s", file_names_[index].c_str(), e.what());
            return ProbeResult::Indeterminate;
        }
    }

    void ReconcileTask::settle_locked(std::size_t index, ProbeResult r) {
        if (finished_) {
            // Abandoned by cancel(); the result is already published.
            return;
        }
        switch (r) {
        case ProbeResult::Found:
            resolve_locked(index, Outcome::Published);
            break;
        case ProbeResult::NotFound:
            resolve_locked(index, Outcome::NeedsUpload);
            break;
        case ProbeResult::Indeterminate:
            if (cancelled_) {
                break;
            }
            if (attempts_[index] <= cfg_.max_retries) {
                bundl::core::log_debug("probe %s indeterminate (attempt %u), retrying",
                    file_names_[index].c_str(), attempts_[index]);
                delayed_.emplace(Clock::now() + cfg_.retry_delay, index);
                work_cv_.notify_one();
                break;
            }
            {
                const bundl::storage::ArtifactIdentity& id = staged_[index].identity;
                errors_by_index_[index] = bundl::core::make_error(
                    bundl::core::make_status(StatusDomain::Reconcile, StatusCode::ProbeIndeterminate, attempts_[index]),
                    id.name,
                    bundl::core::platform_name(id.platform),
                    file_names_[index] + " still indeterminate after " + std::to_string(attempts_[index]) + " attempts");
                bundl::core::log_warn("%s: existence could not be determined", file_names_[index].c_str());
                resolve_locked(index, Outcome::Failed);
            }
            break;
        }
        maybe_finish_locked();
    }

    void ReconcileTask::resolve_locked(std::size_t index, Outcome outcome) {
        outcomes_[index] = outcome;
        --remaining_;
    }

    void ReconcileTask::maybe_finish_locked() {
        if (finished_) {
            return;
        }
        if (remaining_ != 0 && !cancelled_) {
            return;
        }
        finished_ = true;
        result_ = collect_locked();
        promise_.set_value(result_);
        done_cv_.notify_all();
        work_cv_.notify_all();
    }

    ReconcileResult ReconcileTask::collect_locked() const {
        ReconcileResult r{};
        r.cancelled = cancelled_;
        for (std::size_t i = 0; i < staged_.size(); ++i) {
            r.attempts += attempts_[i];
            switch (outcomes_[i]) {
            case Outcome::Pending:
                r.unresolved.push_back(staged_[i]);
                break;
            case Outcome::NeedsUpload:
                r.needs_upload.push_back(staged_[i]);
                break;
            case Outcome::Published:
                r.published.push_back(staged_[i]);
                break;
            case Outcome::Failed:
                r.errors.push_back(errors_by_index_[i]);
                break;
            }
        }
        return r;
    }

    Status reconcile(const bundl::storage::StagedArtifacts& staged,
        ExistenceProbe& probe,
        const bundl::core::ReconcileConfig& cfg,
        ReconcileResult* out) noexcept {
        try {
            ReconcileTask task(staged, &probe, cfg);
            return task.run(out);
        } catch (const std::bad_alloc&) {
            return bundl::core::make_status(StatusDomain::Reconcile, StatusCode::Unavailable);
        }
    }

} // namespace bundl::net
