// modules/executor/worker_pool.h
#ifndef LOOM_MODULES_EXECUTOR_WORKER_POOL_H
#define LOOM_MODULES_EXECUTOR_WORKER_POOL_H

#include "modules/executor/blocking_queue.h"
#include <functional>
#include <thread>
#include <vector>

namespace loom {

// Fixed set of threads draining a task queue. The thread count is the upper
// bound on concurrently running sandbox workers.
class WorkerPool {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(int threads);
    ~WorkerPool(); // drains queued tasks, then joins

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(Task task);
    int size() const { return static_cast<int>(threads_.size()); }

private:
    void loop();

    BlockingQueue<Task> tasks_;
    std::vector<std::thread> threads_;
};

} // namespace loom

#endif // LOOM_MODULES_EXECUTOR_WORKER_POOL_H
