#pragma once

#include "cancellation.hpp"
#include "recognition_types.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dre {

struct JobConfig {
    std::chrono::milliseconds ttl;           // purge after this much inactivity
    std::chrono::milliseconds max_duration;  // Pending/Running deadline

    JobConfig()
        : ttl(std::chrono::minutes(10))
        , max_duration(std::chrono::seconds(120)) {}
};

struct RecognitionJob {
    using TimePoint = std::chrono::steady_clock::time_point;

    std::string request_id;
    JobStatus status;
    uint64_t processed;
    uint64_t total;
    RecognitionMode mode;
    SearchFilters filters;
    std::optional<RecognitionPath> path;
    TimePoint created_at;
    TimePoint started_at;
    TimePoint last_activity;
    std::vector<SimilarityResult> results;
    ErrorKind error;
    std::string message;

    RecognitionJob()
        : status(JobStatus::PENDING), processed(0), total(0)
        , mode(RecognitionMode::AUTO), error(ErrorKind::NONE) {}
};

struct SweepStats {
    size_t purged;
    size_t timed_out;

    SweepStats() : purged(0), timed_out(0) {}
};

// Registry and state machine for recognition jobs.
//
//   Pending -> Running -> Completed
//      |          |----> Cancelled   (user cancel observed by the worker)
//      |          '----> Failed      (error, or deadline observed by the worker)
//      |----> Cancelled              (cancelled while queued)
//      '----> Failed                 (deadline passed while queued)
//
// All public methods are thread-safe. Only the worker that started a job
// drives it out of Running.
//
// Worker-side calls take the token create() returned as `owner`. A request
// id can be reused once its job is terminal or purged, so a call whose
// owner is not the current job's token belongs to a superseded job and
// never touches the new one. A null owner addresses whichever job holds
// the id.
class JobCoordinator {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using ClockFn = std::function<TimePoint()>;

    explicit JobCoordinator(const JobConfig& config = JobConfig(), ClockFn clock = ClockFn());

    JobCoordinator(const JobCoordinator&) = delete;
    JobCoordinator& operator=(const JobCoordinator&) = delete;

    // Throws DuplicateJobError if an active job owns request_id
    CancellationTokenPtr create(const std::string& request_id,
                                RecognitionMode mode,
                                const SearchFilters& filters);

    // Pending -> Running. False if the job was cancelled or timed out
    // while queued, or if owner's job was superseded or purged;
    // InvalidTransitionError from any other state.
    bool start(const std::string& request_id,
               const CancellationTokenPtr& owner = CancellationTokenPtr());

    // Only while Running; decreasing or inconsistent updates are rejected
    bool report_progress(const std::string& request_id, uint64_t processed, uint64_t total,
                         const CancellationTokenPtr& owner = CancellationTokenPtr());

    // The calls below throw NotFoundError when owner's job is gone
    void record_path(const std::string& request_id, RecognitionPath path,
                     const CancellationTokenPtr& owner = CancellationTokenPtr());

    // Whether this call cancelled an active job; unknown, terminal or
    // already cancelled is a no-op
    bool cancel(const std::string& request_id);

    // Running -> Completed
    void complete(const std::string& request_id, std::vector<SimilarityResult> results,
                  const CancellationTokenPtr& owner = CancellationTokenPtr());

    // Running -> Cancelled, or Failed/TimeoutError when the deadline fired
    JobStatus finish_cancelled(const std::string& request_id,
                               const CancellationTokenPtr& owner = CancellationTokenPtr());

    // Pending|Running -> Failed
    void fail(const std::string& request_id, ErrorKind kind, const std::string& message,
              const CancellationTokenPtr& owner = CancellationTokenPtr());

    SweepStats sweep();

    // NotFoundError for unknown or expired ids
    JobProgress get_progress(const std::string& request_id);

    RecognitionJob snapshot(const std::string& request_id);

    size_t size() const;

    const JobConfig& config() const {
        return config_;
    }

private:
    struct Entry {
        RecognitionJob job;
        CancellationTokenPtr token;
    };

    TimePoint now() const;

    bool expired(const Entry& entry, TimePoint now) const;

    // Looks up a live job, purging it first if it has expired
    Entry& find_locked(const std::string& request_id, TimePoint now);

    // As find_locked, and the job must still be owner's
    Entry& find_owned_locked(const std::string& request_id,
                             const CancellationTokenPtr& owner, TimePoint now);

    bool superseded(const std::string& request_id, const CancellationTokenPtr& owner) const;

    JobConfig config_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> jobs_;
};

}  // namespace dre
