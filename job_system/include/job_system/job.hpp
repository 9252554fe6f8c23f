#ifndef JOB_SYSTEM_JOB_HPP
#define JOB_SYSTEM_JOB_HPP

#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

namespace job_system {

/**
 * One unit of pool work: a callable tagged with the kind of work it is (for stepgraph,
 * running or resuming a task tree node). Whatever the callable captures is released when
 * the job is destroyed, which the pool does before counting the job as completed.
 */
template<typename JobType>
class Job {
public:
    using Body = std::function<void()>;

    Job(Body body, JobType type) : body_(std::move(body)), type_(type) {
        if (!body_) {
            throw std::invalid_argument("Job created without a body");
        }
    }

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    void execute() { body_(); }

    JobType get_type() const { return type_; }

private:
    Body body_;
    JobType type_;
};

template<typename JobType>
using JobPtr = std::unique_ptr<Job<JobType>>;

template<typename JobType, typename Func>
JobPtr<JobType> make_job(Func&& func, JobType type) {
    return std::make_unique<Job<JobType>>(typename Job<JobType>::Body(std::forward<Func>(func)), type);
}

enum class ScheduleMode {
    LIFO,  // pushed on the worker's hot end; resumed nodes run while their state is cached
    FIFO   // queued behind earlier work
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_HPP
