/**
 * @file ScanRadio.h
 * @brief PBScan::ScanRadio - BLE scanner hardware interface
 * @version 1.0.0
 *
 * Fire-and-forget scan control with asynchronous delivery. Callbacks run in
 * the radio's callback context and must only hand data off.
 */
#pragma once
#include "../core/Types.h"
#include <functional>

namespace PBScan {

using AdvertisementCallback = std::function<void(const RawEvent &event)>;
using ScanStoppedCallback = std::function<void()>;

/**
 * @struct ScanParams
 * @brief Scan request parameters
 */
struct ScanParams {
  bool active;
  uint32_t intervalUs;
  uint32_t windowUs;
};

/**
 * @interface ScanRadio
 * @brief Observer-role BLE radio
 */
class ScanRadio {
public:
  virtual ~ScanRadio() = default;

  /**
   * @brief Bring up the radio stack
   * @return true on success
   */
  virtual bool begin() = 0;

  /**
   * @brief Request a continuous scan
   * @param params Active/passive mode, interval and window
   * @return true if the request was accepted
   */
  virtual bool startScan(const ScanParams &params) = 0;

  /**
   * @brief Request the scan to stop
   */
  virtual void stopScan() = 0;

  /**
   * @brief Check whether the controller confirmed an active scan
   * @return true if scanning
   */
  virtual bool isScanning() const = 0;

  /**
   * @brief Register advertisement delivery callback
   * @param callback Handler, invoked in radio callback context
   */
  virtual void onAdvertisement(AdvertisementCallback callback) = 0;

  /**
   * @brief Register scan-stopped notification
   * @param callback Handler, invoked in radio callback context
   */
  virtual void onScanStopped(ScanStoppedCallback callback) = 0;
};

} // namespace PBScan
