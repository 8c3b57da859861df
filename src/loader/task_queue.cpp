#include "task_queue.h"
#include "errors.h"

#include <string>
#include <system_error>
#include <utility>

namespace covtable {

Task::Task(std::string task_id) : task_id_(std::move(task_id)) {}

TaskQueue::TaskQueue(int num_workers) {
    if (num_workers < 1) {
        throw WorkerPoolError("Worker pool needs at least one worker, got " +
                              std::to_string(num_workers));
    }

    try {
        workers_.reserve(static_cast<size_t>(num_workers));
        for (int i = 0; i < num_workers; ++i) {
            workers_.emplace_back(&TaskQueue::worker_loop, this);
        }
    } catch (const std::system_error& e) {
        shutdown();
        throw WorkerPoolError(std::string("Failed to start worker threads: ") + e.what());
    }
}

TaskQueue::~TaskQueue() {
    shutdown();
}

void TaskQueue::shutdown() {
    close();
    for (auto& w : workers_) {
        if (w.joinable()) w.join();
    }
}

bool TaskQueue::submit(std::unique_ptr<Task> task) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) return false;
    queue_.push(std::move(task));
    ++pending_;
    cv_.notify_one();
    return true;
}

void TaskQueue::close() {
    std::unique_lock<std::mutex> lock(mutex_);
    closed_ = true;
    cv_.notify_all();
}

void TaskQueue::wait() {
    std::exception_ptr error;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_done_.wait(lock, [this]() {
            return pending_ == 0;
        });
        error = first_error_;
        first_error_ = nullptr;
    }
    if (error) {
        std::rethrow_exception(error);
    }
}

size_t TaskQueue::size() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return queue_.size();
}

void TaskQueue::worker_loop() {
    while (true) {
        std::unique_ptr<Task> task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() {
                return closed_ || !queue_.empty();
            });

            if (queue_.empty()) return;

            task = std::move(queue_.front());
            queue_.pop();
        }

        std::exception_ptr error;
        try {
            task->execute();
        } catch (...) {
            error = std::current_exception();
        }

        {
            std::unique_lock<std::mutex> lock(mutex_);
            if (error && !first_error_) {
                first_error_ = error;
            }
            --pending_;
            if (pending_ == 0) {
                cv_done_.notify_all();
            }
        }
    }
}

}  // namespace covtable
