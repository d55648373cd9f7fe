// modules/executor/worker_pool.cpp
#include "modules/executor/worker_pool.h"
#include "common/logging/logging.h"
#include <algorithm>
#include <exception>

namespace loom {

WorkerPool::WorkerPool(int threads) {
    const int n = std::max(threads, 1);
    threads_.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        threads_.emplace_back([this] { loop(); });
    }
}

WorkerPool::~WorkerPool() {
    tasks_.shutdown();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::submit(Task task) {
    tasks_.push(std::move(task));
}

void WorkerPool::loop() {
    while (auto task = tasks_.pop()) {
        try {
            (*task)();
        } catch (const std::exception& e) {
            // 任务自己负责报告结果；这里只防止线程退出
            LOOM_LOG_ERROR("worker pool task threw", {StringField("error", e.what())});
        }
    }
}

} // namespace loom
