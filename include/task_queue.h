#ifndef COVTABLE_TASK_QUEUE_H
#define COVTABLE_TASK_QUEUE_H

#include <condition_variable>
#include <cstddef>
#include <exception>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace covtable {

class Task {
public:
    explicit Task(std::string task_id);
    virtual ~Task() = default;

    const std::string& get_task_id() const { return task_id_; }
    virtual void execute() = 0;

private:
    std::string task_id_;
};

/**
 * TaskQueue: fixed-size worker pool
 * - single producer submits tasks
 * - num_workers threads execute them, no ordering between tasks
 *
 * Pool setup failures raise WorkerPoolError from the constructor. A task
 * that throws does not stop the other workers; the first such exception is
 * rethrown from wait().
 */
class TaskQueue {
public:
    explicit TaskQueue(int num_workers = 4);

    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    // Returns false once the queue has been closed
    bool submit(std::unique_ptr<Task> task);

    // Stop accepting tasks; workers drain what is queued, then exit
    void close();

    // Block until every submitted task has finished
    void wait();

    size_t size() const;
    size_t worker_count() const { return workers_.size(); }

private:
    void worker_loop();
    void shutdown();

    std::queue<std::unique_ptr<Task>> queue_;
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable cv_done_;
    bool closed_ = false;
    size_t pending_ = 0;  // submitted but not yet finished
    std::exception_ptr first_error_;
};

}  // namespace covtable

#endif  // COVTABLE_TASK_QUEUE_H
