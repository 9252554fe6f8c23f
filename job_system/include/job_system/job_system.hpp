#ifndef JOB_SYSTEM_JOB_SYSTEM_HPP
#define JOB_SYSTEM_JOB_SYSTEM_HPP

#include <job_system/job.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <new>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

namespace job_system {

// Error types that can escape a job
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

/**
 * Work-stealing worker pool. Each worker owns a deque; idle workers steal half of a
 * random victim's queue. Jobs are expected to handle their own failures; anything that
 * escapes a job is recorded (first one wins) and stops the pool.
 */
template<typename JobType>
class JobSystem {
private:
    struct WorkerData {
        std::deque<JobPtr<JobType>> tasks;  // Supports both LIFO and FIFO
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        std::atomic<std::size_t> jobs_executed{0};
        std::atomic<std::size_t> jobs_executing{0};
        std::atomic<std::size_t> jobs_stolen{0};
    };

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<std::size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};

    // Global work tracking for completion detection
    std::atomic<std::size_t> total_submitted_{0};
    std::atomic<std::size_t> total_completed_{0};
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    std::atomic<ErrorType> error_type_{ErrorType::None};
    std::mutex error_mutex_;
    std::exception_ptr first_error_;

    // Moves the older half of a random victim's queue to `thief`; false if nothing was taken
    bool steal_into(WorkerData* thief, std::mt19937& gen) {
        std::uniform_int_distribution<std::size_t> pick(0, workers_.size() - 1);

        for (std::size_t attempt = 0; attempt < workers_.size(); ++attempt) {
            WorkerData* victim = workers_[pick(gen)].get();
            if (victim == thief) {
                continue;
            }

            std::vector<JobPtr<JobType>> taken;
            {
                std::unique_lock<std::mutex> victim_lock(victim->mutex, std::try_to_lock);
                if (!victim_lock.owns_lock() || victim->tasks.empty()) {
                    continue;
                }
                std::size_t count = std::max<std::size_t>(1, victim->tasks.size() / 2);
                taken.reserve(count);
                while (taken.size() < count) {
                    taken.push_back(std::move(victim->tasks.front()));
                    victim->tasks.pop_front();
                }
            }

            std::lock_guard<std::mutex> own_lock(thief->mutex);
            for (auto& job : taken) {
                thief->tasks.push_back(std::move(job));
            }
            thief->jobs_stolen.fetch_add(taken.size());
            return true;
        }
        return false;
    }

    void record_error(ErrorType type, std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            if (!first_error_) {
                first_error_ = error;
                error_type_.store(type, std::memory_order_release);
            }
        }
        for (auto& w : workers_) {
            w->stop.store(true);
        }
    }

    // Null job with `exit` set once the worker is stopped and drained
    JobPtr<JobType> next_job(WorkerData* self, std::mt19937& gen, bool& exit) {
        bool idle;
        {
            std::lock_guard<std::mutex> lock(self->mutex);
            idle = self->tasks.empty() && !self->stop.load();
        }
        if (idle) {
            steal_into(self, gen);
        }

        std::unique_lock<std::mutex> lock(self->mutex);
        self->cv.wait_for(lock, std::chrono::milliseconds(1), [self] {
            return self->stop.load() || !self->tasks.empty();
        });

        if (self->tasks.empty()) {
            exit = self->stop.load();
            return nullptr;
        }
        JobPtr<JobType> job = std::move(self->tasks.back());
        self->tasks.pop_back();
        return job;
    }

    void run_job(WorkerData* self, JobPtr<JobType> job) {
        self->jobs_executing.fetch_add(1);

        // Nothing may escape a worker thread
        try {
            job->execute();
        } catch (const std::bad_alloc&) {
            record_error(ErrorType::OutOfMemory, std::current_exception());
        } catch (const std::exception&) {
            record_error(ErrorType::Exception, std::current_exception());
        } catch (...) {
            record_error(ErrorType::Unhandled, std::current_exception());
        }

        // Whatever the job captured dies before the job counts as completed
        job.reset();

        self->jobs_executing.fetch_sub(1);
        self->jobs_executed.fetch_add(1);
        total_completed_.fetch_add(1);
        completion_cv_.notify_all();
    }

    void worker_loop(WorkerData* self) {
        std::mt19937 gen(std::random_device{}());
        bool exit = false;
        while (!exit) {
            if (JobPtr<JobType> job = next_job(self, gen, exit)) {
                run_job(self, std::move(job));
            }
        }
    }

    bool all_completed() const {
        return total_submitted_.load() == total_completed_.load();
    }

    // No queued job and no job mid-execution on any worker
    bool drained() {
        for (const auto& worker : workers_) {
            std::lock_guard<std::mutex> guard(worker->mutex);
            if (!worker->tasks.empty() || worker->jobs_executing.load() > 0) {
                return false;
            }
        }
        return all_completed();
    }

    void push_to_worker(WorkerData* worker, JobPtr<JobType> job, ScheduleMode mode) {
        total_submitted_.fetch_add(1);
        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            if (mode == ScheduleMode::LIFO) {
                worker->tasks.push_back(std::move(job));
            } else {
                // Popped from the back, so the oldest FIFO work waits at the back
                worker->tasks.push_front(std::move(job));
            }
        }
        worker->cv.notify_one();
    }

public:
    explicit JobSystem(std::size_t num_threads = 0) {
        std::size_t count = num_threads == 0 ? std::thread::hardware_concurrency() : num_threads;
        if (count == 0) count = 1;

        workers_.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    ~JobSystem() {
        shutdown();
    }

    JobSystem(const JobSystem&) = delete;
    JobSystem& operator=(const JobSystem&) = delete;

    void start() {
        if (is_running_.load()) return;

        total_submitted_.store(0);
        total_completed_.store(0);
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            first_error_ = nullptr;
            error_type_.store(ErrorType::None, std::memory_order_relaxed);
        }

        for (auto& worker : workers_) {
            worker->stop.store(false);
            auto* data = worker.get();
            data->thread = std::thread([this, data] {
                worker_loop(data);
            });
        }

        is_running_.store(true);
    }

    void shutdown() {
        if (!is_running_.load()) return;

        for (auto& worker : workers_) {
            {
                std::lock_guard<std::mutex> lock(worker->mutex);
                worker->stop.store(true);
            }
            worker->cv.notify_all();
        }

        for (auto& worker : workers_) {
            if (worker->thread.joinable()) {
                worker->thread.join();
            }
        }

        is_running_.store(false);
    }

    void submit(JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        std::size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        push_to_worker(workers_[worker_idx].get(), std::move(job), mode);
    }

    void submit_to_worker(std::size_t worker_id, JobPtr<JobType> job, ScheduleMode mode = ScheduleMode::LIFO) {
        if (!is_running_.load()) {
            throw std::runtime_error("JobSystem is not running");
        }

        if (worker_id >= workers_.size()) {
            throw std::out_of_range("Invalid worker ID");
        }

        push_to_worker(workers_[worker_id].get(), std::move(job), mode);
    }

    template<typename F>
    void submit_function(F&& func, JobType job_type, ScheduleMode mode = ScheduleMode::LIFO) {
        submit(make_job(std::forward<F>(func), job_type), mode);
    }

    /**
     * Blocks until every submitted job, including jobs submitted by running jobs, has
     * finished. Returns early if the pool stopped because a job failed.
     */
    void wait_for_completion() {
        std::unique_lock<std::mutex> lock(completion_mutex_);
        for (;;) {
            completion_cv_.wait_for(lock, std::chrono::milliseconds(10), [this] {
                return has_error() || all_completed();
            });
            if (has_error() || (all_completed() && drained())) {
                return;
            }
        }
    }

    std::size_t get_num_workers() const {
        return workers_.size();
    }

    // Submitted but not yet completed
    std::size_t get_pending_count() const {
        std::size_t submitted = total_submitted_.load(std::memory_order_relaxed);
        std::size_t completed = total_completed_.load(std::memory_order_relaxed);
        return submitted > completed ? submitted - completed : 0;
    }

    bool is_running() const {
        return is_running_.load();
    }

    ErrorType get_error_type() const {
        return error_type_.load(std::memory_order_acquire);
    }

    bool has_error() const {
        return get_error_type() != ErrorType::None;
    }

    std::exception_ptr first_error() {
        std::lock_guard<std::mutex> lock(error_mutex_);
        return first_error_;
    }

    const char* get_error_description() const {
        switch (get_error_type()) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

    struct SystemStatistics {
        std::size_t total_jobs_executed;
        std::size_t total_jobs_stolen;
    };

    SystemStatistics get_statistics() const {
        SystemStatistics stats{0, 0};
        for (const auto& worker : workers_) {
            stats.total_jobs_executed += worker->jobs_executed.load();
            stats.total_jobs_stolen += worker->jobs_stolen.load();
        }
        return stats;
    }
};

} // namespace job_system

#endif // JOB_SYSTEM_JOB_SYSTEM_HPP
