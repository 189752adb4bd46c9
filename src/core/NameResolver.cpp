/**
 * @file NameResolver.cpp
 * @brief CORE:NameResolver - Name hold/promote implementation
 */

#include "NameResolver.h"

namespace PBScan {

NameResolver::NameResolver(PeerRegistry &registry, Stats &stats,
                           size_t capacity)
    : registry_(registry), stats_(stats), capacity_(capacity) {
  pending_.reserve(capacity_);
  foreign_.reserve(PBSCAN_FOREIGN_MEMORY);
}

void NameResolver::reset(size_t capacity) {
  pending_.clear();
  foreign_.clear();
  capacity_ = capacity;
  pending_.reserve(capacity_);
}

int NameResolver::indexOf(const Address &address) const {
  for (size_t i = 0; i < pending_.size(); i++) {
    if (pending_[i].address == address)
      return (int)i;
  }
  return -1;
}

bool NameResolver::applyName(Peer &peer, const std::string &name,
                             bool complete) {
  if (name.empty() || peer.name == name)
    return false;
  // A shortened name never replaces a complete one
  if (!complete && peer.nameComplete && !peer.name.empty())
    return false;

  peer.name = name;
  peer.nameComplete = complete;
  return true;
}

Peer *NameResolver::onName(const Address &address, const std::string &name,
                           bool complete) {
  if (name.empty())
    return nullptr;

  Peer *peer = registry_.find(address);
  if (peer) {
    return applyName(*peer, name, complete) ? peer : nullptr;
  }

  int idx = indexOf(address);
  if (idx >= 0) {
    PendingName &held = pending_[idx];
    if (complete || !held.complete) {
      held.name = name;
      held.complete = complete;
    }
    return nullptr;
  }

  if (isForeign(address)) {
    stats_.namesPurged++;
    return nullptr;
  }

  if (capacity_ == 0)
    return nullptr;

  if (pending_.size() >= capacity_) {
    pending_.erase(pending_.begin());
    stats_.pendingEvicted++;
  }
  pending_.push_back({address, name, complete});
  return nullptr;
}

bool NameResolver::promote(Peer &peer) {
  for (size_t i = 0; i < foreign_.size(); i++) {
    if (foreign_[i] == peer.address) {
      foreign_.erase(foreign_.begin() + i);
      break;
    }
  }

  int idx = indexOf(peer.address);
  if (idx < 0)
    return false;

  applyName(peer, pending_[idx].name, pending_[idx].complete);
  pending_.erase(pending_.begin() + idx);
  stats_.namesPromoted++;
  return true;
}

bool NameResolver::purge(const Address &address) {
  int idx = indexOf(address);
  if (idx < 0)
    return false;

  pending_.erase(pending_.begin() + idx);
  stats_.namesPurged++;
  return true;
}

bool NameResolver::onForeignAdvertisement(const Address &address) {
  if (registry_.find(address))
    return false;

  if (!isForeign(address)) {
    if (foreign_.size() >= PBSCAN_FOREIGN_MEMORY)
      foreign_.erase(foreign_.begin());
    foreign_.push_back(address);
  }
  return purge(address);
}

bool NameResolver::isForeign(const Address &address) const {
  for (const Address &known : foreign_) {
    if (known == address)
      return true;
  }
  return false;
}

bool NameResolver::isHeld(const Address &address) const {
  return indexOf(address) >= 0;
}

const std::string *NameResolver::heldName(const Address &address) const {
  int idx = indexOf(address);
  return idx < 0 ? nullptr : &pending_[idx].name;
}

} // namespace PBScan
