#include <Almanac/Utils/WorkerPool.hpp>

#include <mutex> // std::unique_lock

#include <Almanac/Utils/Error.hpp>
#include <Almanac/Utils/Logging.hpp>
#include <Almanac/Utils/Types.hpp>

using namespace almanac::utils::types;
using almanac::utils::concurrency::WorkerPool;
using enum almanac::utils::error::AlmanacErrorCode;

WorkerPool::WorkerPool(const usize workerCount) {
  const usize count = workerCount == 0 ? 1 : workerCount;

  m_workers.reserve(count);

  for (usize i = 0; i < count; ++i)
    m_workers.emplace_back([this](const std::stop_token& stopToken) { workerLoop(stopToken); });
}

WorkerPool::~WorkerPool() {
  {
    const LockGuard lock(m_mutex);
    m_stopping = true;
    m_jobs.clear();
  }

  for (std::jthread& worker : m_workers)
    worker.request_stop();

  m_workers.clear();
}

fn WorkerPool::submit(Job job) -> Result<> {
  {
    const LockGuard lock(m_mutex);

    if (m_stopping)
      ERR(InternalError, "Cannot submit a job to a worker pool that is shutting down");

    m_jobs.push_back(std::move(job));
  }

  m_condition.notify_one();

  return {};
}

fn WorkerPool::pending() const -> usize {
  const LockGuard lock(m_mutex);
  return m_jobs.size();
}

fn WorkerPool::workerLoop(const std::stop_token& stopToken) -> Unit {
  while (true) {
    Job job;

    {
      std::unique_lock lock(m_mutex);

      // Returns false only once a stop is requested with nothing left to run.
      if (!m_condition.wait(lock, stopToken, [this] { return !m_jobs.empty(); }))
        return;

      job = std::move(m_jobs.front());
      m_jobs.pop_front();
    }

    try {
      job();
    } catch (const Exception& e) {
      error_log("Worker job threw an exception: {}", e.what());
    }
  }
}
