/**
 * @file ESP32ScanRadio.cpp
 * @brief ESP32 BLE scanner driver implementation
 * @version 1.0.0
 */

#include "ESP32ScanRadio.h"
#include <Arduino.h>
#include <BLEDevice.h>
#include <cstring>
#include <esp_log.h>

static const char *TAG = "ESP32ScanRadio";

namespace PBScan {

namespace {
// GAP timing unit is 0.625 ms
constexpr uint32_t GAP_UNIT_US = 625;
constexpr uint16_t GAP_SCAN_MIN = 0x0004;
constexpr uint16_t GAP_SCAN_MAX = 0x4000;

uint16_t toGapUnits(uint32_t us) {
  uint32_t units = us / GAP_UNIT_US;
  if (units < GAP_SCAN_MIN)
    units = GAP_SCAN_MIN;
  if (units > GAP_SCAN_MAX)
    units = GAP_SCAN_MAX;
  return (uint16_t)units;
}
} // namespace

static ESP32ScanRadio *s_instance = nullptr;

ESP32ScanRadio::ESP32ScanRadio()
    : scanning_(false), stopRequested_(false), oversized_(0) {}

ESP32ScanRadio::~ESP32ScanRadio() {
  if (s_instance == this) {
    stopScan();
    s_instance = nullptr;
  }
}

bool ESP32ScanRadio::begin() {
  if (initialized_) {
    return true;
  }

  if (s_instance && s_instance != this) {
    ESP_LOGE(TAG, "Another scanner instance is active");
    return false;
  }
  s_instance = this;

  BLEDevice::init("");
  BLEDevice::setCustomGapHandler(&ESP32ScanRadio::gapHandler);

  initialized_ = true;
  ESP_LOGI(TAG, "BLE stack ready");
  return true;
}

bool ESP32ScanRadio::startScan(const ScanParams &params) {
  if (!initialized_) {
    ESP_LOGE(TAG, "startScan before begin");
    return false;
  }

  uint16_t interval = toGapUnits(params.intervalUs);
  uint16_t window = toGapUnits(params.windowUs);
  if (window > interval) {
    window = interval;
  }

  esp_ble_scan_params_t scanParams = {};
  scanParams.scan_type = params.active ? BLE_SCAN_TYPE_ACTIVE
                                       : BLE_SCAN_TYPE_PASSIVE;
  scanParams.own_addr_type = BLE_ADDR_TYPE_PUBLIC;
  scanParams.scan_filter_policy = BLE_SCAN_FILTER_ALLOW_ALL;
  scanParams.scan_interval = interval;
  scanParams.scan_window = window;
  scanParams.scan_duplicate = BLE_SCAN_DUPLICATE_DISABLE;

  // Scanning starts from the GAP handler once parameters are applied
  esp_err_t err = esp_ble_gap_set_scan_params(&scanParams);
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Set scan params failed: %s", esp_err_to_name(err));
    return false;
  }

  ESP_LOGI(TAG, "Scan requested (%s, interval=%u window=%u)",
           params.active ? "active" : "passive", interval, window);
  return true;
}

void ESP32ScanRadio::stopScan() {
  if (!initialized_) {
    return;
  }

  stopRequested_.store(true);
  esp_err_t err = esp_ble_gap_stop_scanning();
  if (err != ESP_OK) {
    stopRequested_.store(false);
    ESP_LOGE(TAG, "Stop scan failed: %s", esp_err_to_name(err));
    return;
  }
  scanning_.store(false);
}

// ============================================================================
// GAP CALLBACK CONTEXT
// ============================================================================

void ESP32ScanRadio::gapHandler(esp_gap_ble_cb_event_t event,
                                esp_ble_gap_cb_param_t *param) {
  ESP32ScanRadio *self = s_instance;
  if (!self || !param) {
    return;
  }

  switch (event) {
  case ESP_GAP_BLE_SCAN_PARAM_SET_COMPLETE_EVT:
    if (param->scan_param_cmpl.status == ESP_BT_STATUS_SUCCESS) {
      esp_ble_gap_start_scanning(0);
    } else {
      ESP_LOGW(TAG, "Scan params rejected: %d",
               param->scan_param_cmpl.status);
    }
    break;

  case ESP_GAP_BLE_SCAN_START_COMPLETE_EVT:
    if (param->scan_start_cmpl.status == ESP_BT_STATUS_SUCCESS) {
      self->stopRequested_.store(false);
      self->scanning_.store(true);
    } else {
      ESP_LOGW(TAG, "Scan start failed: %d", param->scan_start_cmpl.status);
    }
    break;

  case ESP_GAP_BLE_SCAN_RESULT_EVT:
    if (param->scan_rst.search_evt == ESP_GAP_SEARCH_INQ_RES_EVT) {
      self->handleResult(param->scan_rst);
    } else if (param->scan_rst.search_evt == ESP_GAP_SEARCH_INQ_CMPL_EVT) {
      // Scan duration elapsed; we always scan with duration 0
      self->handleStopped();
    }
    break;

  case ESP_GAP_BLE_SCAN_STOP_COMPLETE_EVT:
    self->handleStopped();
    break;

  default:
    break;
  }
}

void ESP32ScanRadio::handleResult(
    const esp_ble_gap_cb_param_t::ble_scan_result_evt_param &result) {
  if (!advCallback_) {
    return;
  }

  RawEvent raw;
  memcpy(raw.address.data(), result.bda, PBSCAN_ADDRESS_LEN);
  raw.kind = result.ble_evt_type == ESP_BLE_EVT_SCAN_RSP
                 ? AdvKind::SCAN_RESPONSE
                 : AdvKind::ADVERTISEMENT;
  raw.rssi = (int8_t)result.rssi;
  raw.timestampMs = millis();

  size_t len = (size_t)result.adv_data_len + result.scan_rsp_len;
  if (len > PBSCAN_MAX_PAYLOAD) {
    oversized_.fetch_add(1);
    len = PBSCAN_MAX_PAYLOAD;
  }
  raw.length = (uint8_t)len;
  memcpy(raw.payload, result.ble_adv, len);

  advCallback_(raw);
}

void ESP32ScanRadio::handleStopped() {
  scanning_.store(false);

  // Stops we asked for are not news
  if (stopRequested_.exchange(false)) {
    return;
  }

  if (stopCallback_) {
    stopCallback_();
  }
}

} // namespace PBScan
