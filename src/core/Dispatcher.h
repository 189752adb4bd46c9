/**
 * @file Dispatcher.h
 * @brief CORE:Dispatcher - Capture, decode and present broadcast values
 * @version 1.0.0
 *
 * Owns the pipeline state. capture() is the only entry point called from
 * the radio callback; everything else runs from the main loop.
 */
#pragma once
#include "../interfaces/Presenter.h"
#include "../interfaces/ScanRadio.h"
#include "CaptureBuffer.h"
#include "Config.h"
#include "NameResolver.h"
#include "PeerRegistry.h"
#include "Protocol.h"
#include "ScanHealth.h"
#include "Types.h"
#include <atomic>

namespace PBScan {

/// @brief Millisecond clock used to time presenter output
using Clock = uint32_t (*)();

/**
 * @class Dispatcher
 * @brief Drains captured events through decoder, names and registry
 */
class Dispatcher {
public:
  /**
   * @brief Construct and hook the radio callbacks
   * @param radio Scan radio (required, not owned)
   * @param presenter Output sink (required, not owned)
   * @param config Initial configuration
   */
  Dispatcher(ScanRadio *radio, Presenter *presenter,
             const ObserverConfig &config = ObserverConfig());
  ~Dispatcher() = default;

  /**
   * @brief Replace the configuration
   * @return false once begin() has been called
   */
  bool setConfig(const ObserverConfig &config);
  const ObserverConfig &getConfig() const { return config_; }

  /**
   * @brief Start scanning
   * @param nowMs Current time
   * @return true if the radio accepted the scan request
   */
  bool begin(uint32_t nowMs);

  /**
   * @brief Time presenter output and report slow lines
   * @param clock Millisecond clock, nullptr disables the check
   */
  void setClock(Clock clock) { clock_ = clock; }

  /**
   * @brief Radio callback entry point
   * Counts the event and queues it. Regular advertisements without the
   * company id are queued as address-only NON_PROTOCOL markers. Never
   * blocks.
   */
  void capture(const RawEvent &event);

  /**
   * @brief Main loop step
   * Drains the capture queue, then runs scan health and the heartbeat.
   * @param nowMs Current time
   * @return Number of events processed
   */
  size_t poll(uint32_t nowMs);

  /**
   * @brief Process one captured event
   * @param event Captured event
   * @param nowMs Current time
   */
  void process(const RawEvent &event, uint32_t nowMs);

  /**
   * @brief Stop scanning and hand the summary to the presenter
   * @param nowMs Current time
   */
  void end(uint32_t nowMs);

  /// @brief Counter snapshot including callback-side atomics
  Stats getStats() const;

  Summary buildSummary(uint32_t nowMs) const;

  bool isStarted() const { return started_; }
  size_t queued() const { return queue_.size(); }
  const PeerRegistry &getRegistry() const { return registry_; }
  const NameResolver &getNames() const { return names_; }
  ScanHealth &getHealth() { return health_; }

  Dispatcher(const Dispatcher &) = delete;
  Dispatcher &operator=(const Dispatcher &) = delete;

private:
  ScanRadio *radio_;
  Presenter *presenter_;
  ObserverConfig config_;
  Stats stats_;

  std::atomic<uint32_t> eventsReceived_;
  std::atomic<uint32_t> protocolMatched_;
  CaptureBuffer<RawEvent, PBSCAN_CAPTURE_CAPACITY> queue_;

  PeerRegistry registry_;
  NameResolver names_;
  ScanHealth health_;

  Clock clock_ = nullptr;
  bool started_ = false;
  uint32_t startMs_ = 0;
  uint32_t lastHeartbeatMs_ = 0;

  void syncStats();
  void handleName(const RawEvent &event, const DecodeResult &result,
                  uint32_t nowMs);
  void present(const ChangeEvent &change, uint32_t nowMs);
  void notify(NoticeKind kind, uint32_t nowMs, const Peer *peer = nullptr,
              uint32_t detail = 0);
  uint32_t elapsedSeconds(uint32_t nowMs) const {
    return (nowMs - startMs_) / 1000;
  }
};

} // namespace PBScan
