/**
 * @file Dispatcher.cpp
 * @brief CORE:Dispatcher - Pipeline implementation
 */

#include "Dispatcher.h"

namespace PBScan {

Dispatcher::Dispatcher(ScanRadio *radio, Presenter *presenter,
                       const ObserverConfig &config)
    : radio_(radio), presenter_(presenter), config_(config),
      eventsReceived_(0), protocolMatched_(0), registry_(config_, stats_),
      names_(registry_, stats_, config_.maxPendingNames),
      health_(radio, presenter, stats_) {
  health_.configure(config_);

  radio_->onAdvertisement([this](const RawEvent &event) { capture(event); });
  radio_->onScanStopped([this]() { health_.onScanStopped(); });
}

bool Dispatcher::setConfig(const ObserverConfig &config) {
  if (started_)
    return false;

  config_ = config;
  registry_.reset();
  names_.reset(config_.maxPendingNames);
  health_.configure(config_);
  return true;
}

bool Dispatcher::begin(uint32_t nowMs) {
  if (started_)
    return true;

  presenter_->begin(config_);

  startMs_ = nowMs;
  lastHeartbeatMs_ = nowMs;
  started_ = true;

  syncStats();
  return health_.begin(nowMs);
}

// ============================================================================
// RADIO CONTEXT
// ============================================================================

void Dispatcher::capture(const RawEvent &event) {
  eventsReceived_.fetch_add(1, std::memory_order_relaxed);

  const size_t len =
      event.length > PBSCAN_MAX_PAYLOAD ? PBSCAN_MAX_PAYLOAD : event.length;
  const bool matched = Protocol::containsCompanyId(event.payload, len);
  if (matched)
    protocolMatched_.fetch_add(1, std::memory_order_relaxed);

  // Scan responses may carry the only copy of a hub's name
  if (matched || event.kind == AdvKind::SCAN_RESPONSE) {
    queue_.push(event);
    return;
  }

  // Keep the sender in order with its names, drop the payload
  RawEvent marker;
  marker.address = event.address;
  marker.kind = AdvKind::NON_PROTOCOL;
  marker.rssi = event.rssi;
  marker.length = 0;
  marker.timestampMs = event.timestampMs;
  queue_.push(marker);
}

// ============================================================================
// MAIN CONTEXT
// ============================================================================

size_t Dispatcher::poll(uint32_t nowMs) {
  // Bounded so a flooding radio cannot starve the health checks
  size_t processed = 0;
  RawEvent event;
  while (processed < queue_.capacity() && queue_.pop(event)) {
    process(event, nowMs);
    processed++;
  }

  if (!started_)
    return processed;

  syncStats();
  health_.poll(nowMs);

  if (config_.heartbeatMs > 0 &&
      nowMs - lastHeartbeatMs_ >= config_.heartbeatMs) {
    lastHeartbeatMs_ = nowMs;
    syncStats();
    notify(NoticeKind::HEARTBEAT, nowMs);
  }
  return processed;
}

void Dispatcher::process(const RawEvent &event, uint32_t nowMs) {
  stats_.packetsProcessed++;

  if (event.kind == AdvKind::NON_PROTOCOL) {
    stats_.foreignPackets++;
    names_.onForeignAdvertisement(event.address);
    return;
  }

  DecodeResult result;
  switch (Protocol::decode(event, result)) {
  case DecodeStatus::MALFORMED:
    stats_.malformedPackets++;
    return;

  case DecodeStatus::FOREIGN:
    stats_.foreignPackets++;
    if (event.kind == AdvKind::ADVERTISEMENT &&
        !registry_.find(event.address)) {
      // A regular advertisement that is not a broadcast means the name
      // belongs to something else
      names_.onForeignAdvertisement(event.address);
      return;
    }
    handleName(event, result, nowMs);
    return;

  case DecodeStatus::DECODED:
    break;
  }

  stats_.decodedPackets++;

  Peer *peer = registry_.find(event.address);
  if (!peer) {
    peer = registry_.add(event.address);
    if (!peer) {
      names_.purge(event.address);
      return;
    }
    names_.promote(*peer);
    if (result.hasName)
      names_.onName(event.address, result.name, result.nameComplete);
  } else {
    handleName(event, result, nowMs);
  }

  ChangeEvent change;
  if (registry_.observe(event.address, result.channel, result.value,
                        event.rssi, change, event.length)) {
    change.elapsedSeconds = elapsedSeconds(nowMs);
    present(change, nowMs);
  }
}

void Dispatcher::present(const ChangeEvent &change, uint32_t nowMs) {
  stats_.linesEmitted++;
  if (!clock_) {
    presenter_->onChange(change);
    return;
  }

  const uint32_t t0 = clock_();
  presenter_->onChange(change);
  const uint32_t took = clock_() - t0;
  if (took > PBSCAN_PRINT_BLOCKED_MS) {
    stats_.queueLength = (uint32_t)queue_.size();
    notify(NoticeKind::PRINT_BLOCKED, nowMs, nullptr, took);
  }
}

void Dispatcher::handleName(const RawEvent &event, const DecodeResult &result,
                            uint32_t nowMs) {
  if (!result.hasName)
    return;

  Peer *renamed =
      names_.onName(event.address, result.name, result.nameComplete);
  if (renamed)
    notify(NoticeKind::NAME_RESOLVED, nowMs, renamed);
}

void Dispatcher::end(uint32_t nowMs) {
  if (!started_)
    return;

  health_.stop();

  // Keep whatever was captured before the stop
  RawEvent event;
  while (queue_.pop(event)) {
    process(event, nowMs);
  }

  started_ = false;
  presenter_->onSummary(buildSummary(nowMs));
}

// ============================================================================
// STATISTICS
// ============================================================================

void Dispatcher::syncStats() {
  stats_.eventsReceived = eventsReceived_.load(std::memory_order_relaxed);
  stats_.protocolPacketsMatched =
      protocolMatched_.load(std::memory_order_relaxed);
  stats_.queueDrops = queue_.dropped();
  stats_.queueHighWater = queue_.highWater();
  stats_.queueLength = (uint32_t)queue_.size();
}

Stats Dispatcher::getStats() const {
  Stats snapshot = stats_;
  snapshot.eventsReceived = eventsReceived_.load(std::memory_order_relaxed);
  snapshot.protocolPacketsMatched =
      protocolMatched_.load(std::memory_order_relaxed);
  snapshot.queueDrops = queue_.dropped();
  snapshot.queueHighWater = queue_.highWater();
  snapshot.queueLength = (uint32_t)queue_.size();
  return snapshot;
}

Summary Dispatcher::buildSummary(uint32_t nowMs) const {
  Summary summary;
  summary.elapsedMs = nowMs - startMs_;
  summary.stats = getStats();
  summary.peers.reserve(registry_.size());
  for (const Peer &peer : registry_.peers()) {
    summary.peers.push_back({peer.tag, peer.addressText, peer.name});
  }
  return summary;
}

void Dispatcher::notify(NoticeKind kind, uint32_t nowMs, const Peer *peer,
                        uint32_t detail) {
  Notice notice;
  notice.kind = kind;
  notice.elapsedSeconds = elapsedSeconds(nowMs);
  notice.detail = detail;
  if (peer) {
    notice.tag = peer->tag;
    notice.addressText = peer->addressText;
    notice.name = peer->name;
  }
  notice.stats = stats_;
  presenter_->onNotice(notice);
}

} // namespace PBScan
