/**
 * @file PeerRegistry.h
 * @brief CORE:PeerRegistry - Confirmed peers, signal smoothing and dedup
 * @version 1.0.0
 *
 * Peers are created on their first protocol packet, tagged A, B, C... in
 * first-seen order and kept until teardown.
 */
#pragma once
#include "Config.h"
#include "Types.h"
#include <map>
#include <vector>

namespace PBScan {

/**
 * @class PeerRegistry
 * @brief Address to Peer map with bounded capacity
 */
class PeerRegistry {
public:
  /**
   * @brief Construct registry
   * @param config Shared configuration (alpha, dedup, thresholds, maxPeers)
   * @param stats Dispatcher-owned counters
   */
  PeerRegistry(const ObserverConfig &config, Stats &stats);
  ~PeerRegistry() = default;

  /// @brief Re-read limits after a configuration change (before first use)
  void reset();

  /**
   * @brief Look up a peer
   * @param address Peer address
   * @return Peer or nullptr if unknown
   */
  Peer *find(const Address &address);
  const Peer *find(const Address &address) const;

  /**
   * @brief Create a peer for a new address
   * @param address Peer address
   * @return New or existing peer, nullptr if the registry is full
   */
  Peer *add(const Address &address);

  /**
   * @brief Record a decoded value from a peer
   * @param address Peer address (created if new)
   * @param channel Broadcast channel
   * @param value Decoded value
   * @param rssi Raw signal strength sample
   * @param out Filled when the value changed
   * @param payloadLen Packet size for the byte counter
   * @return true if out holds a change to present
   */
  bool observe(const Address &address, uint8_t channel, const Value &value,
               int8_t rssi, ChangeEvent &out, size_t payloadLen = 0);

  /**
   * @brief Map a smoothed RSSI to a signal label
   * @param dbm Smoothed RSSI
   * @return Label text
   */
  const char *signalLabel(float dbm) const;

  size_t size() const { return peers_.size(); }
  bool full() const { return peers_.size() >= capacity_; }

  /// @brief Peers in first-seen order
  const std::vector<Peer> &peers() const { return peers_; }

private:
  const ObserverConfig &config_;
  Stats &stats_;
  size_t capacity_;
  uint32_t assigned_ = 0;

  std::vector<Peer> peers_;
  std::map<Address, size_t> index_;

  float updateRssi(Peer &peer, int8_t rssi);
};

} // namespace PBScan
