#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/worker/base_worker.hpp"

namespace jobclaim::worker {

/*
  N identical workers on one queue, each on its own thread.
*/
class WorkerPool {
 public:
  using Factory = std::function<std::unique_ptr<BaseWorker>(std::size_t index)>;

  WorkerPool(std::string name, std::size_t concurrency, Factory factory);
  ~WorkerPool();

  void Start();

  // Signals every worker first, then joins them.
  void Stop();

  const std::string& Name() const {
    return name_;
  }

  std::size_t Size() const {
    return workers_.size();
  }

  // Sum over all workers.
  WorkerStats Stats() const;

 private:
  std::string                              name_;
  std::vector<std::unique_ptr<BaseWorker>> workers_;
};

} // namespace jobclaim::worker
