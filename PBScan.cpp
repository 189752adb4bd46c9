/**
 * @file PBScan.cpp
 * @brief Main PBScan controller implementation
 *
 * Thin orchestrator that couples the radio, dispatcher and presenter to the
 * Arduino main loop.
 */

#include "PBScan.h"
#include <Arduino.h>

static const char *TAG = "PBScan";

namespace PBScan {

Observer::Observer(ScanRadio *radio, Presenter *presenter)
    : radio_(radio), dispatcher_(radio, presenter) {
  dispatcher_.setClock([]() -> uint32_t { return millis(); });
}

Observer::~Observer() {
  // Interfaces are not owned, don't delete
}

bool Observer::setConfig(const ObserverConfig &config) {
  if (!dispatcher_.setConfig(config)) {
    Serial.printf("[%s] Config ignored while running\n", TAG);
    return false;
  }
  return true;
}

bool Observer::begin() {
  Serial.printf("[%s] Starting v%s...\n", TAG, PBSCAN_VERSION);

  if (!radio_->begin()) {
    Serial.printf("[%s] Radio init failed\n", TAG);
    return false;
  }

  const ObserverConfig &cfg = dispatcher_.getConfig();
  Serial.printf("[%s] Scan %s interval=%luus window=%luus watchdog=%lums "
                "preventive=%lu events\n",
                TAG, cfg.activeScan ? "active" : "passive",
                (unsigned long)cfg.scanIntervalUs,
                (unsigned long)cfg.scanWindowUs, (unsigned long)cfg.watchdogMs,
                (unsigned long)cfg.preventiveRestartEvents);

  if (!dispatcher_.begin(millis())) {
    // The health monitor keeps retrying from loop()
    Serial.printf("[%s] Scan request rejected, will retry\n", TAG);
  }
  return true;
}

void Observer::loop() { dispatcher_.poll(millis()); }

void Observer::end() {
  if (!dispatcher_.isStarted()) {
    return;
  }
  dispatcher_.end(millis());
  Serial.printf("[%s] Stopped\n", TAG);
}

} // namespace PBScan
