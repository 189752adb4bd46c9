/**
 * @file NameResolver.h
 * @brief CORE:NameResolver - Friendly names for peers
 * @version 1.0.0
 *
 * City and Technic hubs put their name in regular advertisements; Move Hub
 * only sends it in scan responses shortly after boot, often before its
 * first broadcast. Names seen before a peer exists are held and promoted
 * onto the Peer when its first protocol packet arrives.
 *
 * A regular advertisement without a broadcast element marks its sender as
 * non-protocol: a held name for it is purged, and names it sends afterwards
 * are not held. The marks are bounded and the oldest is forgotten first.
 */
#pragma once
#include "PeerRegistry.h"
#include "Types.h"
#include <string>
#include <vector>

namespace PBScan {

/**
 * @class NameResolver
 * @brief Two-stage (held, promoted) name cache
 */
class NameResolver {
public:
  /**
   * @brief Construct resolver
   * @param registry Peer registry to resolve against
   * @param stats Dispatcher-owned counters
   * @param capacity Maximum held names
   */
  NameResolver(PeerRegistry &registry, Stats &stats, size_t capacity);

  /// @brief Drop all held names and apply a new capacity
  void reset(size_t capacity);

  /**
   * @brief Handle a name fragment
   * @param address Sender address
   * @param name Local name text
   * @param complete true for a complete, false for a shortened name
   * @return Peer whose name changed, nullptr if held or unchanged
   */
  Peer *onName(const Address &address, const std::string &name,
               bool complete);

  /**
   * @brief Attach a held name to a newly confirmed peer
   * @param peer Confirmed peer
   * @return true if a held name was attached
   */
  bool promote(Peer &peer);

  /**
   * @brief Forget a held name
   * @param address Sender address
   * @return true if an entry was removed
   */
  bool purge(const Address &address);

  /**
   * @brief A regular advertisement without a broadcast element arrived
   * Ignored for confirmed peers.
   * @param address Sender address
   * @return true if a held name was purged
   */
  bool onForeignAdvertisement(const Address &address);

  bool isForeign(const Address &address) const;
  size_t foreignCount() const { return foreign_.size(); }

  bool isHeld(const Address &address) const;
  const std::string *heldName(const Address &address) const;
  size_t heldCount() const { return pending_.size(); }

private:
  struct PendingName {
    Address address;
    std::string name;
    bool complete;
  };

  PeerRegistry &registry_;
  Stats &stats_;
  size_t capacity_;
  std::vector<PendingName> pending_; // oldest first
  std::vector<Address> foreign_;     // oldest first

  static bool applyName(Peer &peer, const std::string &name, bool complete);
  int indexOf(const Address &address) const;
};

} // namespace PBScan
