/**
 * @file ESP32ScanRadio.h
 * @brief DRIVERS:ESP32ScanRadio - Bluedroid GAP observer
 * @version 1.0.0
 *
 * Implements ScanRadio on the raw GAP API so scan results arrive with the
 * advertisement and scan response bytes untouched. Only one instance may
 * exist; the GAP handler is a plain function.
 * @see
 * https://docs.espressif.com/projects/esp-idf/en/latest/esp32/api-reference/bluetooth/esp_gap_ble.html
 */
#pragma once
#include "../interfaces/ScanRadio.h"
#include <atomic>
#include <esp_gap_ble_api.h>

namespace PBScan {

/**
 * @class ESP32ScanRadio
 * @brief ESP32 BLE scanner driver
 */
class ESP32ScanRadio : public ScanRadio {
public:
  ESP32ScanRadio();
  ~ESP32ScanRadio();

  /**
   * @brief Initialize the BLE stack and hook the GAP handler
   * @return true on success
   */
  bool begin() override;

  /**
   * @brief Configure and start an unbounded scan
   * Scanning begins once the controller acknowledges the parameters.
   * @param params Scan parameters
   * @return true if both requests were queued
   */
  bool startScan(const ScanParams &params) override;

  /**
   * @brief Stop scanning
   */
  void stopScan() override;

  /**
   * @brief Check if the controller confirmed scanning
   * @return true if scanning
   */
  bool isScanning() const override { return scanning_.load(); }

  void onAdvertisement(AdvertisementCallback callback) override {
    advCallback_ = callback;
  }

  void onScanStopped(ScanStoppedCallback callback) override {
    stopCallback_ = callback;
  }

  /// @brief GAP results truncated to the payload size
  uint32_t getOversized() const { return oversized_.load(); }

  ESP32ScanRadio(const ESP32ScanRadio &) = delete;
  ESP32ScanRadio &operator=(const ESP32ScanRadio &) = delete;

private:
  static void gapHandler(esp_gap_ble_cb_event_t event,
                         esp_ble_gap_cb_param_t *param);

  void handleResult(const esp_ble_gap_cb_param_t::ble_scan_result_evt_param
                        &result);
  void handleStopped();

  AdvertisementCallback advCallback_;
  ScanStoppedCallback stopCallback_;
  bool initialized_ = false;

  std::atomic<bool> scanning_;
  std::atomic<bool> stopRequested_;
  std::atomic<uint32_t> oversized_;
};

} // namespace PBScan
