/**
 * @file PeerRegistry.cpp
 * @brief CORE:PeerRegistry - Peer tracking implementation
 */

#include "PeerRegistry.h"

namespace PBScan {

PeerRegistry::PeerRegistry(const ObserverConfig &config, Stats &stats)
    : config_(config), stats_(stats), capacity_(config.maxPeers) {
  peers_.reserve(capacity_);
}

void PeerRegistry::reset() {
  peers_.clear();
  index_.clear();
  assigned_ = 0;
  capacity_ = config_.maxPeers;
  peers_.reserve(capacity_);
}

Peer *PeerRegistry::find(const Address &address) {
  auto it = index_.find(address);
  if (it == index_.end())
    return nullptr;
  return &peers_[it->second];
}

const Peer *PeerRegistry::find(const Address &address) const {
  auto it = index_.find(address);
  if (it == index_.end())
    return nullptr;
  return &peers_[it->second];
}

Peer *PeerRegistry::add(const Address &address) {
  Peer *existing = find(address);
  if (existing)
    return existing;

  // Storage is reserved up front so Peer pointers stay valid
  if (peers_.size() >= capacity_) {
    stats_.peersRejected++;
    return nullptr;
  }

  Peer peer;
  peer.address = address;
  peer.addressText = formatAddress(address);
  peer.tag = (char)('A' + (assigned_ % PBSCAN_TAG_COUNT));
  peer.colorIndex = (uint8_t)(assigned_ % PBSCAN_COLOR_COUNT);
  assigned_++;

  index_[address] = peers_.size();
  peers_.push_back(std::move(peer));
  stats_.peersSeen = (uint32_t)peers_.size();
  return &peers_.back();
}

float PeerRegistry::updateRssi(Peer &peer, int8_t rssi) {
  const float sample = (float)rssi;
  if (!peer.rssiSeeded) {
    peer.rssiEma = sample;
    peer.rssiSeeded = true;
  } else {
    peer.rssiEma = peer.rssiEma + config_.rssiAlpha * (sample - peer.rssiEma);
  }
  return peer.rssiEma;
}

bool PeerRegistry::observe(const Address &address, uint8_t channel,
                           const Value &value, int8_t rssi, ChangeEvent &out,
                           size_t payloadLen) {
  Peer *peer = add(address);
  if (!peer)
    return false;

  peer->packets++;
  peer->bytes += (uint32_t)payloadLen;
  const float ema = updateRssi(*peer, rssi);

  auto last = peer->lastValues.find(channel);
  const bool seen = last != peer->lastValues.end();

  if (config_.suppressDuplicates && seen && last->second == value) {
    peer->suppressed++;
    stats_.suppressedByDedup++;
    return false;
  }

  if (seen)
    last->second = value;
  else
    peer->lastValues.emplace(channel, value);
  peer->lastChannel = channel;
  peer->lastValue = value;
  peer->emitted++;

  out.address = peer->address;
  out.addressText = peer->addressText;
  out.tag = peer->tag;
  out.colorIndex = peer->colorIndex;
  out.name = peer->name;
  out.channel = channel;
  out.signalLabel = signalLabel(ema);
  out.smoothedRssi = ema;
  out.value = value;
  return true;
}

const char *PeerRegistry::signalLabel(float dbm) const {
  if (dbm >= config_.rssiVeryClose)
    return "Very close";
  if (dbm >= config_.rssiNearby)
    return "Nearby";
  if (dbm >= config_.rssiFar)
    return "Far";
  return "Weak";
}

} // namespace PBScan
