#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed-size pool that runs cache-miss renders off the caller's thread, so a
// caller can give up waiting without abandoning the render.
class WorkerService {
public:
  explicit WorkerService(std::size_t numThreads);
  ~WorkerService();

  WorkerService(const WorkerService &) = delete;
  WorkerService &operator=(const WorkerService &) = delete;

  // Returns false once stop() has begun; the task is dropped.
  bool submitTask(std::function<void()> task);

  // Drains queued tasks, then joins all workers.
  void stop();

private:
  void workerLoop(std::size_t index);

  bool shouldStop_ = false;
  std::vector<std::thread> workers_;
  std::queue<std::function<void()>> tasks_;
  std::mutex queueMutex_;
  std::condition_variable condition_;
};
