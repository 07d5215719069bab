#include "stopgrid/AccessibilityService.hpp"

#include "stopgrid/Hash.hpp"

#include <memory>
#include <utility>

namespace stopgrid {

AccessibilityService::AccessibilityService(const StopIndexConfig& indexCfg, const AccessibilityConfig& accessCfg,
                                           StopIndexBuildFn build)
    : m_indexCfg(SanitizeStopIndexConfig(indexCfg))
    , m_accessCfg(SanitizeAccessibilityConfig(accessCfg))
    , m_build(build ? std::move(build) : StopIndexBuildFn(BuildStopIndex))
    , m_builder(m_store, m_build,
                [this](std::uint64_t sequence, std::uint64_t, const std::string&) { forgetUpdate(sequence); })
{
}

std::optional<std::uint64_t> AccessibilityService::acceptUpdate(std::uint64_t hash)
{
  std::lock_guard<std::mutex> lock(m_updateMutex);
  if (m_hasUpdate && hash == m_lastHash) return std::nullopt;
  m_hasUpdate = true;
  m_lastHash = hash;
  m_lastSequence = m_store.reserveSequence();
  return m_lastSequence;
}

void AccessibilityService::forgetUpdate(std::uint64_t sequence)
{
  std::lock_guard<std::mutex> lock(m_updateMutex);
  if (m_hasUpdate && m_lastSequence == sequence) m_hasUpdate = false;
}

bool AccessibilityService::updateStops(std::vector<StopPoint> stops)
{
  const std::uint64_t hash = HashStops(stops, m_indexCfg);
  const std::optional<std::uint64_t> seq = acceptUpdate(hash);
  if (!seq) return false;

  // Anything still queued is older than this update.
  m_builder.cancelPending();

  std::shared_ptr<const StopIndex> built;
  try {
    built = m_build(std::move(stops), m_indexCfg);
  } catch (...) {
    forgetUpdate(*seq);
    throw;
  }
  if (!built) {
    forgetUpdate(*seq);
    return false;
  }
  m_store.publish(std::move(built), hash, *seq);
  return true;
}

bool AccessibilityService::updateStopsAsync(std::vector<StopPoint> stops)
{
  const std::uint64_t hash = HashStops(stops, m_indexCfg);
  const std::optional<std::uint64_t> seq = acceptUpdate(hash);
  if (!seq) return false;

  m_builder.request(std::move(stops), m_indexCfg, hash, *seq);
  return true;
}

void AccessibilityService::waitForPendingBuild()
{
  m_builder.waitIdle();
}

StopIndexSnapshot AccessibilityService::snapshot() const
{
  return m_store.current();
}

std::shared_ptr<const StopIndex> AccessibilityService::currentOrEmpty() const
{
  std::shared_ptr<const StopIndex> idx = m_store.index();
  if (idx) return idx;

  static const std::shared_ptr<const StopIndex> kEmpty = std::make_shared<const StopIndex>();
  return kEmpty;
}

AccessibilitySummary AccessibilityService::summarize(const LatLon& at) const
{
  const std::shared_ptr<const StopIndex> idx = currentOrEmpty();
  return ComputeAccessibilitySummary(*idx, at, m_accessCfg);
}

HeatGrid AccessibilityService::heatGrid(const LatLon& center) const
{
  const std::shared_ptr<const StopIndex> idx = currentOrEmpty();
  return RasterizeHeatGrid(*idx, center, m_accessCfg);
}

} // namespace stopgrid
