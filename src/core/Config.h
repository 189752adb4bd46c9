/**
 * @file Config.h
 * @brief CORE:Config - Compile-time limits and runtime tunables
 * @version 1.0.0
 *
 * Defaults can be overridden with -D flags. ObserverConfig carries the
 * runtime copy that the components read.
 */
#pragma once
#include <cstddef>
#include <cstdint>

// Pybricks broadcast framing
#define PBSCAN_COMPANY_ID 0x0397
#define PBSCAN_AD_TYPE_SHORT_NAME 0x08
#define PBSCAN_AD_TYPE_COMPLETE_NAME 0x09
#define PBSCAN_AD_TYPE_MANUFACTURER 0xFF

// Static bounds
#define PBSCAN_AD_UNIT_MAX 31
#define PBSCAN_MAX_PAYLOAD (2 * PBSCAN_AD_UNIT_MAX)
#define PBSCAN_MAX_NESTING PBSCAN_AD_UNIT_MAX
#define PBSCAN_ADDRESS_LEN 6
#define PBSCAN_TAG_COUNT 26
#define PBSCAN_COLOR_COUNT 10

// Recent non-protocol advertisers whose names are not held
#define PBSCAN_FOREIGN_MEMORY 32
// Output slower than this is reported
#define PBSCAN_PRINT_BLOCKED_MS 200

#ifndef PBSCAN_CAPTURE_CAPACITY
#define PBSCAN_CAPTURE_CAPACITY 192
#endif

// Runtime defaults
#ifndef PBSCAN_DEFAULT_SUPPRESS_DUPLICATES
#define PBSCAN_DEFAULT_SUPPRESS_DUPLICATES true
#endif
#ifndef PBSCAN_DEFAULT_ACTIVE_SCAN
#define PBSCAN_DEFAULT_ACTIVE_SCAN true // needed for names in scan responses
#endif
#ifndef PBSCAN_DEFAULT_SCAN_INTERVAL_US
#define PBSCAN_DEFAULT_SCAN_INTERVAL_US 100000
#endif
#ifndef PBSCAN_DEFAULT_SCAN_WINDOW_US
#define PBSCAN_DEFAULT_SCAN_WINDOW_US 50000 // 50% duty cycle
#endif
#ifndef PBSCAN_DEFAULT_WATCHDOG_MS
#define PBSCAN_DEFAULT_WATCHDOG_MS 10000
#endif
// IRQ event count, not time. ~120 ambient events/s gives ~50 s between
// restarts; lower values collide with the hubs' boot-time name window.
#ifndef PBSCAN_DEFAULT_PREVENTIVE_RESTART_EVENTS
#define PBSCAN_DEFAULT_PREVENTIVE_RESTART_EVENTS 6000
#endif
#ifndef PBSCAN_DEFAULT_RESTART_RETRY_MS
#define PBSCAN_DEFAULT_RESTART_RETRY_MS 2000
#endif
#ifndef PBSCAN_DEFAULT_RSSI_ALPHA
#define PBSCAN_DEFAULT_RSSI_ALPHA 0.2f
#endif
#ifndef PBSCAN_DEFAULT_HEARTBEAT_MS
#define PBSCAN_DEFAULT_HEARTBEAT_MS 30000
#endif
#ifndef PBSCAN_DEFAULT_MAX_PEERS
#define PBSCAN_DEFAULT_MAX_PEERS 64
#endif
#ifndef PBSCAN_DEFAULT_MAX_PENDING_NAMES
#define PBSCAN_DEFAULT_MAX_PENDING_NAMES 16
#endif

namespace PBScan {

/**
 * @enum ColorTheme
 * @brief Terminal background the presenter picks its palette for
 */
enum class ColorTheme : uint8_t { LIGHT = 0, DARK = 1 };

/**
 * @struct ObserverConfig
 * @brief Read-only tunables consumed by the core components
 */
struct ObserverConfig {
  bool suppressDuplicates = PBSCAN_DEFAULT_SUPPRESS_DUPLICATES;
  bool activeScan = PBSCAN_DEFAULT_ACTIVE_SCAN;
  uint32_t scanIntervalUs = PBSCAN_DEFAULT_SCAN_INTERVAL_US;
  uint32_t scanWindowUs = PBSCAN_DEFAULT_SCAN_WINDOW_US;
  uint32_t watchdogMs = PBSCAN_DEFAULT_WATCHDOG_MS;
  uint32_t preventiveRestartEvents = PBSCAN_DEFAULT_PREVENTIVE_RESTART_EVENTS;
  uint32_t restartRetryMs = PBSCAN_DEFAULT_RESTART_RETRY_MS;

  // RSSI smoothing, alpha in (0, 1]
  float rssiAlpha = PBSCAN_DEFAULT_RSSI_ALPHA;

  // Signal label thresholds (dBm), tuned for indoor room-scale BLE
  int8_t rssiVeryClose = -55;
  int8_t rssiNearby = -70;
  int8_t rssiFar = -80;

  bool debug = true;
  uint32_t heartbeatMs = PBSCAN_DEFAULT_HEARTBEAT_MS;
  ColorTheme theme = ColorTheme::LIGHT;

  size_t maxPeers = PBSCAN_DEFAULT_MAX_PEERS;
  size_t maxPendingNames = PBSCAN_DEFAULT_MAX_PENDING_NAMES;
};

} // namespace PBScan
