#pragma once

#include <condition_variable> // std::condition_variable_any
#include <deque>              // std::deque
#include <stop_token>         // std::stop_token
#include <thread>             // std::jthread

#include "Error.hpp"
#include "Types.hpp"

namespace almanac::utils::concurrency {
  namespace {
    using types::Fn;
    using types::Mutex;
    using types::Result;
    using types::Unit;
    using types::usize;
    using types::Vec;
  } // namespace

  /**
   * @brief Fixed-width pool of worker threads draining a FIFO job queue.
   *
   * The width never changes after construction, so at most `size()` jobs run at
   * once. Destroying the pool discards jobs that have not started and joins the
   * workers, waiting for jobs already running to return.
   */
  class WorkerPool {
   public:
    using Job = Fn<Unit()>;

    /**
     * @param workerCount Number of threads to start. Must be at least one.
     */
    explicit WorkerPool(usize workerCount);

    ~WorkerPool();

    WorkerPool(const WorkerPool&)                = delete;
    WorkerPool(WorkerPool&&)                     = delete;
    fn operator=(const WorkerPool&)->WorkerPool& = delete;
    fn operator=(WorkerPool&&)->WorkerPool&      = delete;

    /**
     * @brief Queues a job for the next free worker.
     * @return InternalError if the pool is shutting down.
     */
    fn submit(Job job) -> Result<>;

    [[nodiscard]] fn size() const -> usize {
      return m_workers.size();
    }

    /// Jobs queued but not yet picked up by a worker.
    [[nodiscard]] fn pending() const -> usize;

   private:
    mutable Mutex               m_mutex;
    std::condition_variable_any m_condition;
    std::deque<Job>             m_jobs;
    bool                        m_stopping = false;
    Vec<std::jthread>           m_workers;

    fn workerLoop(const std::stop_token& stopToken) -> Unit;
  };
} // namespace almanac::utils::concurrency
