#include "WorkerService.h"
#include "Logger.h"

#include <exception>

WorkerService::WorkerService(std::size_t numThreads) {
  if (numThreads == 0)
    numThreads = 1;
  workers_.reserve(numThreads);
  for (std::size_t i = 0; i < numThreads; ++i) {
    workers_.emplace_back([this, i] { this->workerLoop(i); });
  }
  LOG_D("WorkerService", "Started {} worker threads", numThreads);
}

WorkerService::~WorkerService() { stop(); }

void WorkerService::workerLoop(std::size_t index) {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(queueMutex_);
      condition_.wait(lock, [this] { return shouldStop_ || !tasks_.empty(); });

      if (shouldStop_ && tasks_.empty()) {
        return;
      }

      task = std::move(tasks_.front());
      tasks_.pop();
    }
    try {
      task();
    } catch (const std::exception &e) {
      LOG_E("WorkerService", "Exception in worker {} task: {}", index,
            e.what());
    } catch (...) {
      LOG_E("WorkerService", "Unknown exception in worker {} task", index);
    }
  }
}

bool WorkerService::submitTask(std::function<void()> task) {
  {
    std::unique_lock<std::mutex> lock(queueMutex_);
    if (shouldStop_) {
      return false;
    }
    tasks_.push(std::move(task));
  }
  condition_.notify_one();
  return true;
}

void WorkerService::stop() {
  {
    std::unique_lock<std::mutex> lock(queueMutex_);
    if (shouldStop_) {
      return;
    }
    shouldStop_ = true;
  }
  condition_.notify_all();
  for (std::thread &worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}
