/**
 * @file Protocol.h
 * @brief CORE:Protocol - Pybricks broadcast decoder and encoder
 * @version 1.0.0
 *
 * Broadcast data rides in a manufacturer-specific AD element:
 *   [len][0xFF][0x97 0x03][channel][value...]
 *
 * Each value starts with a header byte (type << 5) | length:
 *   0 SINGLE_OBJECT  0x00      wraps exactly one value
 *   1 TRUE           0x20
 *   2 FALSE          0x40
 *   3 INT            0x61/0x62/0x64  int8/int16/int32 LE
 *   4 FLOAT          0x84      IEEE 754 LE
 *   5 STR            0xA0|len  UTF-8
 *   6 BYTES          0xC0|len
 *   7 LIST           0xE0|len  nested values, len bytes
 *   0 TUPLE          0x00|len  nested values, len > 0 bytes
 *
 * Without the SINGLE_OBJECT marker the top level is a tuple of values
 * back-to-back up to the end of the element.
 */
#pragma once
#include "Types.h"
#include <string>
#include <vector>

namespace PBScan {

/**
 * @enum DecodeStatus
 * @brief Per-packet decode outcome
 */
enum class DecodeStatus : uint8_t {
  DECODED = 0,  ///< channel and value valid
  FOREIGN = 1,  ///< no broadcast element, not our protocol
  MALFORMED = 2 ///< broadcast element present but invalid
};

/**
 * @struct DecodeResult
 * @brief Everything extracted from one packet in a single walk
 */
struct DecodeResult {
  DecodeStatus status = DecodeStatus::FOREIGN;
  uint8_t channel = 0;
  Value value;
  bool hasName = false;
  bool nameComplete = false;
  std::string name;
};

/**
 * @class Protocol
 * @brief Broadcast protocol utilities
 */
class Protocol {
public:
  /**
   * @brief Decode one captured packet
   * @param event Captured advertisement or scan response
   * @param out Result, including any local name found
   * @return Decode status (also stored in out.status)
   */
  static DecodeStatus decode(const RawEvent &event, DecodeResult &out);

  /**
   * @brief Decode raw AD payload bytes
   * @param data Payload
   * @param len Payload length
   * @param out Result
   * @return Decode status
   */
  static DecodeStatus decode(const uint8_t *data, size_t len,
                             DecodeResult &out);

  /**
   * @brief Decode a broadcast value body (the bytes after the channel)
   * @param data Value bytes
   * @param len Byte count
   * @param out Decoded value
   * @return true if well formed and fully consumed
   */
  static bool decodeValue(const uint8_t *data, size_t len, Value &out);

  /**
   * @brief Cheap pre-filter: does the payload contain the company id bytes?
   * Safe to call from the radio callback.
   */
  static bool containsCompanyId(const uint8_t *data, size_t len);

  /**
   * @brief Encode a value body
   * @param value Value to encode
   * @param outBuffer Output buffer
   * @param maxLen Buffer capacity
   * @return Bytes written, 0 if the value does not fit or cannot be encoded
   */
  static size_t encodeValue(const Value &value, uint8_t *outBuffer,
                            size_t maxLen);

  /**
   * @brief Build a complete advertisement payload
   * @param channel Broadcast channel
   * @param value Broadcast value
   * @param name Optional complete local name element (empty = none)
   * @return AD payload, empty if it would exceed one AD unit
   */
  static std::vector<uint8_t> buildAdvertisement(uint8_t channel,
                                                 const Value &value,
                                                 const std::string &name = "");

  /// @brief Build a scan response carrying only a local name
  static std::vector<uint8_t> buildScanResponse(const std::string &name,
                                                bool complete = true);
};

} // namespace PBScan
