#pragma once

#include "stopgrid/StopIndex.hpp"

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace stopgrid {

// -----------------------------------------------------------------------------
// Snapshot publishing for StopIndex
//
// An index is never mutated after construction. A data refresh builds a new
// index and publishes it here; readers take a shared handle and keep querying
// it for as long as they hold it, even after a newer snapshot replaced it.
//
// The lock only guards the handle copy (a refcount bump). Builds run outside
// of it, so queries never wait on a build.
//
// Every publish carries a sequence number taken when the update was accepted.
// A build that finishes after a newer one was published is dropped, so a slow
// background build can never replace fresher data.
// -----------------------------------------------------------------------------

struct StopIndexSnapshot {
  std::shared_ptr<const StopIndex> index;
  std::uint64_t hash = 0;

  // 0 until the first publish.
  std::uint64_t generation = 0;

  // Sequence of the update this index was built from.
  std::uint64_t sequence = 0;
};

// Builds the index for one update. May throw (allocation failure).
using StopIndexBuildFn =
    std::function<std::shared_ptr<const StopIndex>(std::vector<StopPoint> stops, const StopIndexConfig& cfg)>;

std::shared_ptr<const StopIndex> BuildStopIndex(std::vector<StopPoint> stops, const StopIndexConfig& cfg);

class StopIndexStore {
public:
  StopIndexStore() = default;

  StopIndexStore(const StopIndexStore&) = delete;
  StopIndexStore& operator=(const StopIndexStore&) = delete;

  // Next update sequence (strictly increasing, starts at 1).
  std::uint64_t reserveSequence();

  // Replace the current snapshot unless `sequence` is older than the current
  // one. sequence == 0 reserves a fresh one. Returns the new generation, or 0
  // when the index was dropped as stale.
  std::uint64_t publish(std::shared_ptr<const StopIndex> index, std::uint64_t hash, std::uint64_t sequence = 0);

  StopIndexSnapshot current() const;
  std::shared_ptr<const StopIndex> index() const;
  std::uint64_t generation() const;

private:
  mutable std::mutex m_mutex;
  StopIndexSnapshot m_current;
  std::uint64_t m_lastSequence = 0;
};

// Builds indices on a worker thread and publishes them into a store.
//
// Only the most recent request matters: a request that arrives while another
// is still pending replaces it ("latest wins"). A build already running is
// allowed to finish and is published, then the newer request follows.
//
// A build that throws leaves the store untouched. The failure is counted,
// kept in lastError() and handed to the failure callback (on the worker
// thread, no builder lock held).
class BackgroundIndexBuilder {
public:
  using FailureFn = std::function<void(std::uint64_t sequence, std::uint64_t hash, const std::string& error)>;

  explicit BackgroundIndexBuilder(StopIndexStore& store, StopIndexBuildFn build = {}, FailureFn onFailure = {});
  ~BackgroundIndexBuilder();

  BackgroundIndexBuilder(const BackgroundIndexBuilder&) = delete;
  BackgroundIndexBuilder& operator=(const BackgroundIndexBuilder&) = delete;

  // Queue a build. Never blocks on a running build. sequence == 0 reserves
  // one from the store.
  void request(std::vector<StopPoint> stops, const StopIndexConfig& cfg, std::uint64_t hash,
               std::uint64_t sequence = 0);

  // Drop the pending request, if any (counted as superseded). A running build
  // is not interrupted.
  bool cancelPending();

  // Block until nothing is pending or running.
  void waitIdle();

  bool idle() const;

  // Builds that ran to the end (published, or dropped as stale).
  int buildsCompleted() const;

  int buildsFailed() const;
  std::string lastError() const;

  // Requests dropped because a newer one replaced them before they started.
  int requestsSuperseded() const;

private:
  struct Request {
    std::vector<StopPoint> stops;
    StopIndexConfig cfg{};
    std::uint64_t hash = 0;
    std::uint64_t sequence = 0;
  };

  void run();

  StopIndexStore& m_store;
  StopIndexBuildFn m_build;
  FailureFn m_onFailure;

  mutable std::mutex m_mutex;
  std::condition_variable m_wake;
  std::condition_variable m_idle;
  std::optional<Request> m_pending;
  bool m_busy = false;
  bool m_stop = false;
  int m_completed = 0;
  int m_superseded = 0;
  int m_failed = 0;
  std::string m_lastError;

  // Started on the first request.
  std::thread m_worker;
};

} // namespace stopgrid
