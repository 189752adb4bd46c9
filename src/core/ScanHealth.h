/**
 * @file ScanHealth.h
 * @brief CORE:ScanHealth - Scan stall watchdog and preventive restart
 * @version 1.0.0
 *
 * The BLE controller can silently stop delivering events, and its internal
 * event buffer degrades over long sessions. The monitor restarts the scan
 * when events stop arriving (watchdog), after a fixed number of events
 * (preventive), or when the radio reports a stop nobody asked for.
 */
#pragma once
#include "../interfaces/Presenter.h"
#include "../interfaces/ScanRadio.h"
#include "Config.h"
#include "Types.h"
#include <atomic>

namespace PBScan {

enum class ScanState : uint8_t { RUNNING = 0, RESTARTING = 1 };

enum class RestartReason : uint8_t {
  WATCHDOG = 0,
  PREVENTIVE = 1,
  UNEXPECTED_STOP = 2
};

/**
 * @class ScanHealth
 * @brief RUNNING/RESTARTING state machine around the scan radio
 */
class ScanHealth {
public:
  /**
   * @brief Construct monitor
   * @param radio Scan radio (not owned)
   * @param presenter Notice sink (not owned, may be nullptr)
   * @param stats Dispatcher-owned counters; eventsReceived is read as the
   * event clock
   */
  ScanHealth(ScanRadio *radio, Presenter *presenter, Stats &stats);

  /// @brief Apply scan parameters and thresholds
  void configure(const ObserverConfig &config);

  /**
   * @brief Start the first scan
   * @param nowMs Current time
   * @return true if the scan request was accepted
   */
  bool begin(uint32_t nowMs);

  /**
   * @brief Evaluate restart conditions (main loop)
   * @param nowMs Current time
   */
  void poll(uint32_t nowMs);

  /**
   * @brief Restart the scan now
   * Coalesced while a restart is already in progress.
   * @return true if a restart was issued
   */
  bool restart(RestartReason reason, uint32_t nowMs);

  /// @brief Stop scanning for good (teardown)
  void stop();

  /**
   * @brief Platform "scan stopped" notification
   * Safe from the radio callback; only records the event.
   */
  void onScanStopped();

  ScanState getState() const { return state_; }
  bool isRestartIntentional() const { return intentional_.load(); }
  uint32_t getExpectedStops() const { return expectedStops_.load(); }
  uint32_t getConsecutiveFailures() const { return failures_; }
  uint32_t getEventsSinceRestart() const {
    return stats_.eventsReceived - baselineEvents_;
  }

  ScanHealth(const ScanHealth &) = delete;
  ScanHealth &operator=(const ScanHealth &) = delete;

private:
  ScanRadio *radio_;
  Presenter *presenter_;
  Stats &stats_;

  ScanParams params_;
  uint32_t watchdogMs_;
  uint32_t preventiveEvents_;
  uint32_t retryMs_;

  ScanState state_ = ScanState::RESTARTING;
  bool started_ = false;
  uint32_t startMs_ = 0;
  uint32_t restartMs_ = 0;
  uint32_t lastEventMs_ = 0;
  uint32_t lastSeenEvents_ = 0;
  uint32_t baselineEvents_ = 0;
  uint32_t failures_ = 0;

  std::atomic<bool> intentional_;
  std::atomic<uint32_t> unexpectedPending_;
  std::atomic<uint32_t> expectedStops_;

  void issueRestart(uint32_t nowMs, bool stopFirst);
  void confirmRunning(uint32_t nowMs);
  void notify(NoticeKind kind, uint32_t nowMs, uint32_t detail = 0);
};

} // namespace PBScan
