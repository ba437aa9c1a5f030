#include "job_coordinator.hpp"
#include "errors.hpp"
#include <iostream>

namespace dre {

namespace {

std::string transition_error(const std::string& request_id, const char* action, JobStatus status) {
    return "Cannot " + std::string(action) + " job " + request_id +
           " in state " + to_string(status);
}

}  // namespace

JobCoordinator::JobCoordinator(const JobConfig& config, ClockFn clock)
    : config_(config)
    , clock_(std::move(clock)) {

    if (!clock_) {
        clock_ = []() { return Clock::now(); };
    }
}

JobCoordinator::TimePoint JobCoordinator::now() const {
    return clock_();
}

bool JobCoordinator::expired(const Entry& entry, TimePoint now) const {
    return now - entry.job.last_activity > config_.ttl;
}

JobCoordinator::Entry& JobCoordinator::find_locked(const std::string& request_id, TimePoint now) {
    auto it = jobs_.find(request_id);
    if (it == jobs_.end()) {
        throw NotFoundError("Job not found: " + request_id);
    }

    if (expired(it->second, now)) {
        it->second.token->cancel(CancelReason::TIMEOUT);
        jobs_.erase(it);
        throw NotFoundError("Job expired: " + request_id);
    }

    return it->second;
}

JobCoordinator::Entry& JobCoordinator::find_owned_locked(const std::string& request_id,
                                                         const CancellationTokenPtr& owner,
                                                         TimePoint now) {
    if (superseded(request_id, owner)) {
        throw NotFoundError("Job superseded: " + request_id);
    }
    return find_locked(request_id, now);
}

bool JobCoordinator::superseded(const std::string& request_id,
                                const CancellationTokenPtr& owner) const {
    if (!owner) {
        return false;
    }
    auto it = jobs_.find(request_id);
    return it == jobs_.end() || it->second.token != owner;
}

CancellationTokenPtr JobCoordinator::create(const std::string& request_id,
                                            RecognitionMode mode,
                                            const SearchFilters& filters) {
    TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(request_id);
    if (it != jobs_.end()) {
        Entry& existing = it->second;
        if (!is_terminal(existing.job.status) && !expired(existing, t)) {
            throw DuplicateJobError("Job already active: " + request_id);
        }
        // A terminal or expired job gives its id up to the new one
        existing.token->cancel(CancelReason::TIMEOUT);
        jobs_.erase(it);
    }

    Entry entry;
    entry.job.request_id = request_id;
    entry.job.mode = mode;
    entry.job.filters = filters;
    entry.job.created_at = t;
    entry.job.last_activity = t;
    entry.token = std::make_shared<CancellationToken>();

    CancellationTokenPtr token = entry.token;
    jobs_.emplace(request_id, std::move(entry));
    return token;
}

bool JobCoordinator::start(const std::string& request_id, const CancellationTokenPtr& owner) {
    TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);

    if (superseded(request_id, owner)) {
        std::cerr << "Stale task for job " << request_id << " not started" << std::endl;
        return false;
    }

    Entry& entry = find_locked(request_id, t);
    RecognitionJob& job = entry.job;

    if (job.status == JobStatus::CANCELLED || job.status == JobStatus::FAILED) {
        return false;
    }
    if (job.status != JobStatus::PENDING) {
        throw InvalidTransitionError(transition_error(request_id, "start", job.status));
    }

    job.status = JobStatus::RUNNING;
    job.started_at = t;
    job.last_activity = t;
    return true;
}

bool JobCoordinator::report_progress(const std::string& request_id, uint64_t processed, uint64_t total,
                                     const CancellationTokenPtr& owner) {
    TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(request_id);
    if (it == jobs_.end() || superseded(request_id, owner)) {
        return false;
    }

    RecognitionJob& job = it->second.job;
    if (job.status != JobStatus::RUNNING) {
        return false;
    }

    bool total_changed = job.total != 0 && total != job.total;
    if (processed < job.processed || processed > total || total_changed) {
        std::cerr << "Rejected progress for job " << request_id << ": "
                  << processed << "/" << total << " after "
                  << job.processed << "/" << job.total << std::endl;
        return false;
    }

    job.processed = processed;
    job.total = total;
    job.last_activity = t;
    return true;
}

void JobCoordinator::record_path(const std::string& request_id, RecognitionPath path,
                                 const CancellationTokenPtr& owner) {
    TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);

    Entry& entry = find_owned_locked(request_id, owner, t);
    entry.job.path = path;
}

bool JobCoordinator::cancel(const std::string& request_id) {
    TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = jobs_.find(request_id);
    if (it == jobs_.end()) {
        return false;
    }

    Entry& entry = it->second;
    RecognitionJob& job = entry.job;

    if (job.status == JobStatus::PENDING) {
        entry.token->cancel(CancelReason::USER);
        job.status = JobStatus::CANCELLED;
        job.last_activity = t;
        return true;
    }

    if (job.status == JobStatus::RUNNING) {
        // The worker observes the token at its next batch boundary. A job
        // already timed out ends Failed, so the cancel is not acknowledged.
        if (!entry.token->cancel(CancelReason::USER)) {
            return false;
        }
        job.last_activity = t;
        return true;
    }

    return false;
}

void JobCoordinator::complete(const std::string& request_id, std::vector<SimilarityResult> results,
                              const CancellationTokenPtr& owner) {
    TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);

    Entry& entry = find_owned_locked(request_id, owner, t);
    RecognitionJob& job = entry.job;

    if (job.status != JobStatus::RUNNING) {
        throw InvalidTransitionError(transition_error(request_id, "complete", job.status));
    }

    job.results = std::move(results);
    job.status = JobStatus::COMPLETED;
    job.processed = job.total;
    job.last_activity = t;
}

JobStatus JobCoordinator::finish_cancelled(const std::string& request_id,
                                           const CancellationTokenPtr& owner) {
    TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);

    Entry& entry = find_owned_locked(request_id, owner, t);
    RecognitionJob& job = entry.job;

    if (job.status != JobStatus::RUNNING) {
        throw InvalidTransitionError(transition_error(request_id, "finish cancelled", job.status));
    }

    job.results.clear();
    job.last_activity = t;

    if (entry.token->reason() == CancelReason::TIMEOUT) {
        job.status = JobStatus::FAILED;
        job.error = ErrorKind::TIMEOUT;
        job.message = "Job exceeded maximum duration";
    } else {
        job.status = JobStatus::CANCELLED;
    }

    return job.status;
}

void JobCoordinator::fail(const std::string& request_id, ErrorKind kind, const std::string& message,
                          const CancellationTokenPtr& owner) {
    TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);

    Entry& entry = find_owned_locked(request_id, owner, t);
    RecognitionJob& job = entry.job;

    if (is_terminal(job.status)) {
        throw InvalidTransitionError(transition_error(request_id, "fail", job.status));
    }

    job.status = JobStatus::FAILED;
    job.error = kind;
    job.message = message;
    job.results.clear();
    job.last_activity = t;
}

SweepStats JobCoordinator::sweep() {
    TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);

    SweepStats stats;

    for (auto it = jobs_.begin(); it != jobs_.end();) {
        Entry& entry = it->second;
        RecognitionJob& job = entry.job;

        if (expired(entry, t)) {
            entry.token->cancel(CancelReason::TIMEOUT);
            it = jobs_.erase(it);
            stats.purged++;
            continue;
        }

        if (job.status == JobStatus::PENDING &&
            t - job.created_at > config_.max_duration) {
            entry.token->cancel(CancelReason::TIMEOUT);
            job.status = JobStatus::FAILED;
            job.error = ErrorKind::TIMEOUT;
            job.message = "Job waited longer than maximum duration";
            job.last_activity = t;
            stats.timed_out++;
        } else if (job.status == JobStatus::RUNNING &&
                   t - job.started_at > config_.max_duration) {
            // The worker records the failure once it sees the token
            if (entry.token->cancel(CancelReason::TIMEOUT)) {
                stats.timed_out++;
            }
        }

        ++it;
    }

    return stats;
}

JobProgress JobCoordinator::get_progress(const std::string& request_id) {
    TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);

    const RecognitionJob& job = find_locked(request_id, t).job;

    JobProgress progress;
    progress.status = job.status;
    progress.processed = job.processed;
    progress.total = job.total;

    if (job.total > 0) {
        progress.percent = 100.0 * static_cast<double>(job.processed) /
                           static_cast<double>(job.total);
    } else if (job.status == JobStatus::COMPLETED) {
        progress.percent = 100.0;
    }

    return progress;
}

RecognitionJob JobCoordinator::snapshot(const std::string& request_id) {
    TimePoint t = now();
    std::lock_guard<std::mutex> lock(mutex_);

    return find_locked(request_id, t).job;
}

size_t JobCoordinator::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

}  // namespace dre
