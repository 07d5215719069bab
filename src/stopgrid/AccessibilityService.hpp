#pragma once

#include "stopgrid/Accessibility.hpp"
#include "stopgrid/StopIndexStore.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace stopgrid {

// Consumer-facing facade: owns the current index snapshot and answers
// accessibility queries against it.
//
// Data refreshes go through updateStops / updateStopsAsync. Both memoize on
// HashStops(): delivering the same stop list again is a no-op. Queries always
// run against whatever snapshot is current when they start; before the first
// publish they behave like an empty index.
//
// Updates are ordered by acceptance: once a newer update is published, an
// older background build that finishes later is discarded. A build that fails
// is forgotten by the memo, so delivering the same list again retries it.
//
// Updates are expected from a single writer (the refresh path). Queries may
// come from any thread.
class AccessibilityService {
public:
  explicit AccessibilityService(const StopIndexConfig& indexCfg = {}, const AccessibilityConfig& accessCfg = {},
                                StopIndexBuildFn build = {});

  AccessibilityService(const AccessibilityService&) = delete;
  AccessibilityService& operator=(const AccessibilityService&) = delete;

  // Build on the calling thread and publish. Returns false if the data is
  // unchanged since the last update (nothing rebuilt). A pending background
  // request is dropped. Build exceptions propagate after the update has been
  // forgotten.
  bool updateStops(std::vector<StopPoint> stops);

  // Hand the build to the background builder. Returns false if unchanged.
  bool updateStopsAsync(std::vector<StopPoint> stops);

  // Block until any background build has been published (or has failed).
  void waitForPendingBuild();

  int backgroundBuildsFailed() const { return m_builder.buildsFailed(); }
  std::string lastBackgroundBuildError() const { return m_builder.lastError(); }

  StopIndexSnapshot snapshot() const;

  AccessibilitySummary summarize(const LatLon& at) const;
  HeatGrid heatGrid(const LatLon& center) const;

  const StopIndexConfig& indexConfig() const { return m_indexCfg; }
  const AccessibilityConfig& accessibilityConfig() const { return m_accessCfg; }

private:
  // Sequence for a new update, or nullopt when `hash` matches the last
  // accepted update.
  std::optional<std::uint64_t> acceptUpdate(std::uint64_t hash);

  // Undo acceptUpdate() for a failed build, unless a newer update followed.
  void forgetUpdate(std::uint64_t sequence);

  std::shared_ptr<const StopIndex> currentOrEmpty() const;

  StopIndexConfig m_indexCfg{};
  AccessibilityConfig m_accessCfg{};

  StopIndexBuildFn m_build;
  StopIndexStore m_store;

  std::mutex m_updateMutex;
  bool m_hasUpdate = false;
  std::uint64_t m_lastHash = 0;
  std::uint64_t m_lastSequence = 0;

  // Declared last: joins its worker before the store goes away.
  BackgroundIndexBuilder m_builder;
};

} // namespace stopgrid
