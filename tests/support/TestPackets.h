/**
 * @file TestPackets.h
 * @brief Helpers for building captured events in tests
 */
#pragma once
#include "core/Protocol.h"
#include "core/Types.h"
#include <cstring>
#include <vector>

namespace PBScan {

inline Address testAddress(uint8_t last) {
  Address address = {0x90, 0x84, 0x2B, 0x00, 0x00, last};
  return address;
}

inline RawEvent makeEvent(const Address &address,
                          const std::vector<uint8_t> &payload,
                          AdvKind kind = AdvKind::ADVERTISEMENT,
                          int8_t rssi = -60, uint32_t timestampMs = 0) {
  RawEvent event;
  std::memset(&event, 0, sizeof(event));
  event.address = address;
  event.kind = kind;
  event.rssi = rssi;
  event.timestampMs = timestampMs;
  size_t len = payload.size();
  if (len > PBSCAN_MAX_PAYLOAD)
    len = PBSCAN_MAX_PAYLOAD;
  event.length = (uint8_t)len;
  if (len > 0)
    std::memcpy(event.payload, payload.data(), len);
  return event;
}

inline RawEvent broadcastEvent(const Address &address, uint8_t channel,
                               const Value &value, int8_t rssi = -60,
                               const std::string &name = "") {
  return makeEvent(address, Protocol::buildAdvertisement(channel, value, name),
                   AdvKind::ADVERTISEMENT, rssi);
}

inline RawEvent nameEvent(const Address &address, const std::string &name,
                          bool complete = true) {
  return makeEvent(address, Protocol::buildScanResponse(name, complete),
                   AdvKind::SCAN_RESPONSE);
}

} // namespace PBScan
