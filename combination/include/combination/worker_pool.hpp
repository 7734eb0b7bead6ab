#ifndef COMBINATION_WORKER_POOL_HPP
#define COMBINATION_WORKER_POOL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <new>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace combination {

// =============================================================================
// Jobs
// =============================================================================

class Job {
public:
    virtual ~Job() = default;
    virtual void execute() = 0;
};

template<typename Func>
class FunctionJob : public Job {
private:
    Func function_;

public:
    template<typename F>
    explicit FunctionJob(F&& func) : function_(std::forward<F>(func)) {}

    void execute() override {
        static_assert(std::is_invocable_v<Func>, "Function must be callable");
        function_();
    }
};

template<typename Func>
auto make_job(Func&& func) {
    return std::make_unique<FunctionJob<std::decay_t<Func>>>(std::forward<Func>(func));
}

using JobPtr = std::unique_ptr<Job>;

// Error types that can occur during job execution
enum class ErrorType {
    None = 0,
    OutOfMemory,   // std::bad_alloc caught
    Exception,     // std::exception caught
    Unhandled      // Non-std::exception type caught
};

// =============================================================================
// WorkerPool
// =============================================================================
// Fixed set of threads, each draining its own FIFO queue. Search shards are
// pinned to a worker with submit_to_worker(); there is no stealing, a shard
// runs start to finish on the thread it was given.
//
// Worker threads never let an exception escape. The first one is recorded
// (ErrorType + exception_ptr), every worker is told to stop taking new jobs,
// and the owner rethrows it with rethrow_if_error() once the pool is idle.

class WorkerPool {
private:
    struct WorkerData {
        std::deque<JobPtr> tasks;
        std::mutex mutex;
        std::condition_variable cv;
        std::thread thread;
        std::atomic<bool> stop{false};
        std::atomic<size_t> jobs_executed{0};
    };

    std::vector<std::unique_ptr<WorkerData>> workers_;
    std::atomic<size_t> round_robin_{0};
    std::atomic<bool> is_running_{false};

    std::atomic<size_t> total_submitted_{0};
    std::atomic<size_t> total_completed_{0};
    std::mutex completion_mutex_;
    std::condition_variable completion_cv_;

    std::atomic<ErrorType> error_type_{ErrorType::None};
    std::mutex error_mutex_;
    std::exception_ptr first_error_;

    void record_error(ErrorType type, std::exception_ptr error) {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            if (!first_error_) {
                first_error_ = std::move(error);
                error_type_.store(type, std::memory_order_release);
            }
        }
        // Queued jobs are dropped from here on
        for (auto& w : workers_) {
            {
                std::lock_guard<std::mutex> lock(w->mutex);
                w->stop.store(true);
            }
            w->cv.notify_all();
        }
    }

    void mark_completed(size_t count) {
        {
            std::lock_guard<std::mutex> lock(completion_mutex_);
            total_completed_.fetch_add(count);
        }
        completion_cv_.notify_all();
    }

    void worker_loop(WorkerData* data) {
        while (true) {
            JobPtr job;
            {
                std::unique_lock<std::mutex> lock(data->mutex);
                data->cv.wait(lock, [data] {
                    return data->stop.load() || !data->tasks.empty();
                });

                if (data->stop.load()) {
                    // Jobs never started still count as completed so waiters wake up
                    size_t dropped = data->tasks.size();
                    data->tasks.clear();
                    if (dropped > 0) {
                        mark_completed(dropped);
                    }
                    break;
                }

                job = std::move(data->tasks.front());
                data->tasks.pop_front();
            }

            try {
                job->execute();
            } catch (const std::bad_alloc&) {
                record_error(ErrorType::OutOfMemory, std::current_exception());
            } catch (const std::exception&) {
                record_error(ErrorType::Exception, std::current_exception());
            } catch (...) {
                record_error(ErrorType::Unhandled, std::current_exception());
            }
            job.reset();

            data->jobs_executed.fetch_add(1);
            mark_completed(1);
        }
    }

    void enqueue(WorkerData* worker, JobPtr job) {
        total_submitted_.fetch_add(1);
        bool accepted = false;
        {
            std::lock_guard<std::mutex> lock(worker->mutex);
            if (!worker->stop.load()) {
                worker->tasks.push_back(std::move(job));
                accepted = true;
            }
        }
        if (!accepted) {
            // Worker already stopped after an error; the job is dropped
            mark_completed(1);
            return;
        }
        worker->cv.notify_one();
    }

public:
    explicit WorkerPool(size_t num_threads = 0) {
        size_t n = num_threads == 0 ? std::thread::hardware_concurrency() : num_threads;
        if (n == 0) n = 1;

        workers_.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            workers_.emplace_back(std::make_unique<WorkerData>());
        }
    }

    ~WorkerPool() {
        shutdown();
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start() {
        if (is_running_.load()) return;

        total_submitted_.store(0);
        total_completed_.store(0);
        error_type_.store(ErrorType::None, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            first_error_ = nullptr;
        }

        for (auto& worker : workers_) {
            worker->stop.store(false);
            WorkerData* data = worker.get();
            data->thread = std::thread([this, data] {
                worker_loop(data);
            });
        }

        is_running_.store(true);
    }

    // Finishes the job each thread is running, drops anything still queued
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

    void submit(JobPtr job) {
        if (!is_running_.load()) {
            throw std::runtime_error("WorkerPool is not running");
        }
        size_t worker_idx = round_robin_.fetch_add(1) % workers_.size();
        enqueue(workers_[worker_idx].get(), std::move(job));
    }

    void submit_to_worker(size_t worker_id, JobPtr job) {
        if (!is_running_.load()) {
            throw std::runtime_error("WorkerPool is not running");
        }
        if (worker_id >= workers_.size()) {
            throw std::out_of_range("Invalid worker ID");
        }
        enqueue(workers_[worker_id].get(), std::move(job));
    }

    template<typename F>
    void submit_function(F&& func) {
        submit(make_job(std::forward<F>(func)));
    }

    bool is_idle() const {
        return total_submitted_.load() == total_completed_.load();
    }

    void wait_for_completion() {
        std::unique_lock<std::mutex> lock(completion_mutex_);
        completion_cv_.wait(lock, [this] { return is_idle(); });
    }

    // Waits until idle or until abort_check() returns true.
    // abort_check runs on the calling thread roughly every `poll`.
    // Returns true if aborted, false if every job completed.
    template<typename AbortCheck>
    bool wait_for_completion_with_abort(AbortCheck&& abort_check,
                                        std::chrono::milliseconds poll = std::chrono::milliseconds(50)) {
        while (true) {
            if (abort_check()) {
                return true;
            }
            std::unique_lock<std::mutex> lock(completion_mutex_);
            if (completion_cv_.wait_for(lock, poll, [this] { return is_idle(); })) {
                return false;
            }
        }
    }

    size_t get_num_workers() const {
        return workers_.size();
    }

    size_t get_pending_count() const {
        size_t submitted = total_submitted_.load(std::memory_order_relaxed);
        size_t completed = total_completed_.load(std::memory_order_relaxed);
        return submitted > completed ? submitted - completed : 0;
    }

    size_t get_jobs_executed(size_t worker_id) const {
        return workers_.at(worker_id)->jobs_executed.load();
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

    const char* get_error_description() const {
        switch (get_error_type()) {
            case ErrorType::None: return "No error";
            case ErrorType::OutOfMemory: return "Out of memory";
            case ErrorType::Exception: return "Exception thrown";
            case ErrorType::Unhandled: return "Unhandled exception type";
        }
        return "Unknown error";
    }

    void rethrow_if_error() {
        std::exception_ptr error;
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            error = first_error_;
        }
        if (error) {
            std::rethrow_exception(error);
        }
    }
};

}  // namespace combination

#endif  // COMBINATION_WORKER_POOL_HPP
