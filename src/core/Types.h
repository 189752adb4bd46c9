/**
 * @file Types.h
 * @brief CORE:Types - Runtime structures shared by the observer pipeline
 * @version 1.0.0
 *
 * Defines captured radio events, the decoded value variant, peer records
 * and the events handed to the presentation layer.
 */
#pragma once
#include "Config.h"
#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace PBScan {

using Address = std::array<uint8_t, PBSCAN_ADDRESS_LEN>;

/**
 * @enum AdvKind
 * @brief Advertisement frame kinds delivered by the radio
 *
 * NON_PROTOCOL marks a regular advertisement without the company id. Only
 * its address is queued.
 */
enum class AdvKind : uint8_t {
  ADVERTISEMENT = 0,
  SCAN_RESPONSE = 1,
  NON_PROTOCOL = 2
};

/**
 * @struct RawEvent
 * @brief One advertisement as captured in radio callback context
 *
 * Fixed size so it can be copied into the capture ring without allocating.
 */
struct RawEvent {
  Address address;
  AdvKind kind;
  int8_t rssi;
  uint8_t length;
  uint8_t payload[PBSCAN_MAX_PAYLOAD];
  uint32_t timestampMs;
};

/**
 * @enum ValueType
 * @brief Decoded value kinds
 */
enum class ValueType : uint8_t {
  INT = 0,
  FLOAT = 1,
  BOOL = 2,
  STR = 3,
  BYTES = 4,
  LIST = 5,
  TUPLE = 6
};

/**
 * @struct Value
 * @brief Tagged variant over the broadcast value kinds
 *
 * Scalars share the union; STR uses strVal, BYTES uses bytesVal, LIST and
 * TUPLE use items.
 */
struct Value {
  ValueType type;
  union {
    int32_t intVal;
    float floatVal;
    bool boolVal;
  };
  std::string strVal;
  std::vector<uint8_t> bytesVal;
  std::vector<Value> items;

  Value() : type(ValueType::TUPLE), intVal(0) {}

  static Value makeInt(int32_t v);
  static Value makeFloat(float v);
  static Value makeBool(bool v);
  static Value makeStr(const std::string &v);
  static Value makeBytes(const std::vector<uint8_t> &v);
  static Value makeList(const std::vector<Value> &v = {});
  static Value makeTuple(const std::vector<Value> &v = {});

  bool isContainer() const {
    return type == ValueType::LIST || type == ValueType::TUPLE;
  }

  /// @brief Structural equality, recursing into containers
  bool operator==(const Value &other) const;
  bool operator!=(const Value &other) const { return !(*this == other); }

  /**
   * @brief Render for display
   * Floats use %.6g, bytes are hex, booleans True/False. Strings nested in
   * containers are quoted.
   */
  std::string toString() const;

private:
  void appendTo(std::string &out, bool nested) const;
};

/**
 * @struct Peer
 * @brief A device confirmed to speak the broadcast protocol
 */
struct Peer {
  Address address;
  std::string addressText; // formatted once at creation
  char tag = 'A';
  uint8_t colorIndex = 0;
  std::string name;
  bool nameComplete = false;

  uint8_t lastChannel = 0;
  Value lastValue;
  std::map<uint8_t, Value> lastValues; // dedup state per channel

  float rssiEma = 0.0f;
  bool rssiSeeded = false;

  uint32_t packets = 0;
  uint32_t bytes = 0;
  uint32_t emitted = 0;
  uint32_t suppressed = 0;
};

/**
 * @struct ChangeEvent
 * @brief A new value from a peer, handed to the presentation layer
 */
struct ChangeEvent {
  uint32_t elapsedSeconds = 0;
  Address address{};
  std::string addressText;
  char tag = 'A';
  uint8_t colorIndex = 0;
  std::string name;
  uint8_t channel = 0;
  const char *signalLabel = "";
  float smoothedRssi = 0.0f;
  Value value;
};

/**
 * @struct Stats
 * @brief Pipeline counters
 *
 * Owned by the Dispatcher and passed by reference to the components that
 * update them. eventsReceived, protocolPacketsMatched, queueDrops and
 * queueHighWater are filled from atomics when a snapshot is taken.
 */
struct Stats {
  uint32_t eventsReceived = 0;
  uint32_t protocolPacketsMatched = 0;
  uint32_t queueDrops = 0;
  uint32_t queueHighWater = 0;
  uint32_t queueLength = 0;

  uint32_t packetsProcessed = 0;
  uint32_t decodedPackets = 0;
  uint32_t foreignPackets = 0;
  uint32_t malformedPackets = 0;
  uint32_t suppressedByDedup = 0;
  uint32_t linesEmitted = 0;

  uint32_t namesPromoted = 0;
  uint32_t namesPurged = 0;
  uint32_t pendingEvicted = 0;
  uint32_t peersSeen = 0;
  uint32_t peersRejected = 0;

  uint32_t restarts = 0;
  uint32_t unexpectedStops = 0;
  uint32_t restartFailures = 0;
};

/**
 * @enum NoticeKind
 * @brief Out-of-band events reported to the presentation layer
 */
enum class NoticeKind : uint8_t {
  SCAN_STARTED = 0,
  PREVENTIVE_RESTART = 1,
  WATCHDOG = 2,
  UNEXPECTED_STOP = 3,
  RESTART_FAILED = 4,
  NAME_RESOLVED = 5,
  HEARTBEAT = 6,
  PRINT_BLOCKED = 7
};

/**
 * @struct Notice
 * @brief Diagnostic line; detail carries the kind-specific number
 * (failure count for RESTART_FAILED, milliseconds for PRINT_BLOCKED)
 */
struct Notice {
  NoticeKind kind = NoticeKind::HEARTBEAT;
  uint32_t elapsedSeconds = 0;
  uint32_t detail = 0;
  char tag = 0;
  std::string addressText;
  std::string name;
  Stats stats;
};

struct PeerSummary {
  char tag;
  std::string addressText;
  std::string name;
};

/**
 * @struct Summary
 * @brief Final statistics record emitted when observation ends
 */
struct Summary {
  uint32_t elapsedMs = 0;
  Stats stats;
  std::vector<PeerSummary> peers;
};

/**
 * @brief Format an address as AA:BB:CC:DD:EE:FF
 */
std::string formatAddress(const Address &address);

} // namespace PBScan
