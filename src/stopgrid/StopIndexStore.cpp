#include "stopgrid/StopIndexStore.hpp"

#include <exception>
#include <utility>

namespace stopgrid {

std::shared_ptr<const StopIndex> BuildStopIndex(std::vector<StopPoint> stops, const StopIndexConfig& cfg)
{
  return std::make_shared<const StopIndex>(std::move(stops), cfg);
}

std::uint64_t StopIndexStore::reserveSequence()
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return ++m_lastSequence;
}

std::uint64_t StopIndexStore::publish(std::shared_ptr<const StopIndex> index, std::uint64_t hash,
                                      std::uint64_t sequence)
{
  StopIndexSnapshot next{};
  next.index = std::move(index);
  next.hash = hash;

  // The old handle (or a stale new one) is released outside the lock; its
  // destructor may be heavy.
  StopIndexSnapshot old{};
  std::uint64_t gen = 0;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (sequence == 0) {
      sequence = ++m_lastSequence;
    } else if (sequence > m_lastSequence) {
      m_lastSequence = sequence;
    }
    if (sequence < m_current.sequence) return 0;

    next.sequence = sequence;
    next.generation = m_current.generation + 1;
    gen = next.generation;
    old = std::exchange(m_current, std::move(next));
  }
  return gen;
}

StopIndexSnapshot StopIndexStore::current() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_current;
}

std::shared_ptr<const StopIndex> StopIndexStore::index() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_current.index;
}

std::uint64_t StopIndexStore::generation() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_current.generation;
}

BackgroundIndexBuilder::BackgroundIndexBuilder(StopIndexStore& store, StopIndexBuildFn build, FailureFn onFailure)
    : m_store(store)
    , m_build(build ? std::move(build) : StopIndexBuildFn(BuildStopIndex))
    , m_onFailure(std::move(onFailure))
{
}

BackgroundIndexBuilder::~BackgroundIndexBuilder()
{
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stop = true;
  }
  m_wake.notify_all();
  if (m_worker.joinable()) m_worker.join();
}

void BackgroundIndexBuilder::request(std::vector<StopPoint> stops, const StopIndexConfig& cfg, std::uint64_t hash,
                                     std::uint64_t sequence)
{
  if (sequence == 0) sequence = m_store.reserveSequence();
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_pending) ++m_superseded;

    Request r{};
    r.stops = std::move(stops);
    r.cfg = cfg;
    r.hash = hash;
    r.sequence = sequence;
    m_pending = std::move(r);

    if (!m_worker.joinable()) {
      m_worker = std::thread([this]() { run(); });
    }
  }
  m_wake.notify_one();
}

bool BackgroundIndexBuilder::cancelPending()
{
  bool dropped = false;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_pending) {
      m_pending.reset();
      ++m_superseded;
      dropped = true;
    }
  }
  if (dropped) m_idle.notify_all();
  return dropped;
}

void BackgroundIndexBuilder::waitIdle()
{
  std::unique_lock<std::mutex> lock(m_mutex);
  m_idle.wait(lock, [&]() { return !m_pending && !m_busy; });
}

bool BackgroundIndexBuilder::idle() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return !m_pending && !m_busy;
}

int BackgroundIndexBuilder::buildsCompleted() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_completed;
}

int BackgroundIndexBuilder::buildsFailed() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_failed;
}

std::string BackgroundIndexBuilder::lastError() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_lastError;
}

int BackgroundIndexBuilder::requestsSuperseded() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_superseded;
}

void BackgroundIndexBuilder::run()
{
  for (;;) {
    Request job{};
    {
      std::unique_lock<std::mutex> lock(m_mutex);
      m_wake.wait(lock, [&]() { return m_stop || m_pending.has_value(); });
      if (m_stop) break;

      job = std::move(*m_pending);
      m_pending.reset();
      m_busy = true;
    }

    bool ok = false;
    std::string error;
    try {
      std::shared_ptr<const StopIndex> built = m_build(std::move(job.stops), job.cfg);
      if (built) {
        m_store.publish(std::move(built), job.hash, job.sequence);
        ok = true;
      } else {
        error = "index build returned no index";
      }
    } catch (const std::exception& e) {
      error = e.what();
    }

    // The previous snapshot stays current on failure.
    if (!ok && m_onFailure) m_onFailure(job.sequence, job.hash, error);

    {
      std::lock_guard<std::mutex> lock(m_mutex);
      m_busy = false;
      if (ok) {
        ++m_completed;
      } else {
        ++m_failed;
        m_lastError = error;
      }
    }
    m_idle.notify_all();
  }

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_busy = false;
  }
  m_idle.notify_all();
}

} // namespace stopgrid
