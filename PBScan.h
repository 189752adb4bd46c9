/**
 * @file PBScan.h
 * @brief Unified PBScan library include
 *
 * Main entry point for the Pybricks broadcast observer. Include this file,
 * instantiate a radio and a presenter, and hand them to the Observer.
 *
 * @example Basic usage:
 * @code
 * #include <PBScan.h>
 * using namespace PBScan;
 *
 * ESP32ScanRadio radio;
 * SerialPresenter presenter;
 *
 * Observer observer(&radio, &presenter);
 *
 * void setup() {
 *   Serial.begin(115200);
 *   observer.begin();
 * }
 *
 * void loop() {
 *   observer.loop();
 *   delay(20);
 * }
 * @endcode
 */

#pragma once

// Interfaces
#include "src/interfaces/Presenter.h"
#include "src/interfaces/ScanRadio.h"

// Core
#include "src/core/Config.h"
#include "src/core/Dispatcher.h"
#include "src/core/Protocol.h"
#include "src/core/Types.h"

// ESP32 Drivers (optional - user can provide their own)
#ifdef ESP32
#include "src/drivers/ESP32ScanRadio.h"
#include "src/drivers/SerialPresenter.h"
#endif

#define PBSCAN_VERSION "1.0.1"

namespace PBScan {

/**
 * @brief Main PBScan controller
 *
 * Thin wrapper that brings up the radio and drives the Dispatcher from the
 * Arduino loop.
 */
class Observer {
public:
  /**
   * @brief Construct with injected dependencies
   * @param radio Scan radio driver (required)
   * @param presenter Output sink (required)
   */
  Observer(ScanRadio *radio, Presenter *presenter);
  ~Observer();

  /**
   * @brief Replace the configuration
   * @return false once running
   */
  bool setConfig(const ObserverConfig &config);
  const ObserverConfig &getConfig() const { return dispatcher_.getConfig(); }

  /**
   * @brief Bring up the radio and start scanning
   * @return true on success
   */
  bool begin();

  /**
   * @brief Main processing loop
   * Call from Arduino loop() - drains captured packets and supervises the
   * scan
   */
  void loop();

  /**
   * @brief Stop scanning and print the summary
   */
  void end();

  bool isRunning() const { return dispatcher_.isStarted(); }
  Dispatcher &getDispatcher() { return dispatcher_; }

private:
  ScanRadio *radio_;
  Dispatcher dispatcher_;
};

} // namespace PBScan
