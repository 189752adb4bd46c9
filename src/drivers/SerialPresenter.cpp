/**
 * @file SerialPresenter.cpp
 * @brief Serial terminal presenter implementation
 * @version 1.0.0
 */

#include "SerialPresenter.h"
#include "../core/LineFormat.h"

namespace PBScan {

namespace {
constexpr const char *ANSI_RESET = "\x1b[0m";

// Stand out on a dark terminal background
constexpr const char *PALETTE_DARK[PBSCAN_COLOR_COUNT] = {
    "\x1b[91m", "\x1b[92m", "\x1b[93m", "\x1b[94m", "\x1b[95m",
    "\x1b[96m", "\x1b[31m", "\x1b[32m", "\x1b[33m", "\x1b[35m"};

// Stand out on a light terminal background
constexpr const char *PALETTE_LIGHT[PBSCAN_COLOR_COUNT] = {
    "\x1b[31m", "\x1b[32m", "\x1b[34m", "\x1b[35m", "\x1b[36m",
    "\x1b[33m", "\x1b[91m", "\x1b[92m", "\x1b[94m", "\x1b[95m"};

constexpr size_t HEADER_RULE_LEN = 70;
} // namespace

SerialPresenter::SerialPresenter(Print &out)
    : out_(out), palette_(PALETTE_LIGHT) {}

const char *SerialPresenter::colorFor(uint8_t index) const {
  return palette_[index % PBSCAN_COLOR_COUNT];
}

void SerialPresenter::begin(const ObserverConfig &config) {
  debug_ = config.debug;
  palette_ = config.theme == ColorTheme::DARK ? PALETTE_DARK : PALETTE_LIGHT;

  out_.printf("Scanning for Pybricks BLE broadcasts  [dedup=%s  theme=%s  "
              "debug=%s]\n",
              config.suppressDuplicates ? "on" : "off",
              config.theme == ColorTheme::DARK ? "dark" : "light",
              config.debug ? "on" : "off");
  printHeader();
}

void SerialPresenter::printHeader() {
  out_.print(formatHeaderLine().c_str());
  for (size_t i = 0; i < HEADER_RULE_LEN; i++) {
    out_.print('-');
  }
  out_.print('\n');
}

void SerialPresenter::onChange(const ChangeEvent &event) {
  out_.print(formatChangeLine(event, colorFor(event.colorIndex), ANSI_RESET)
                 .c_str());
}

void SerialPresenter::onNotice(const Notice &notice) {
  const Stats &s = notice.stats;

  switch (notice.kind) {
  case NoticeKind::UNEXPECTED_STOP:
    out_.printf("  --- scan stopped unexpectedly at %6lus, restarting ---\n",
                (unsigned long)notice.elapsedSeconds);
    return;

  case NoticeKind::RESTART_FAILED:
    out_.printf("  --- scan restart not confirmed at %6lus (attempt %lu), "
                "retrying ---\n",
                (unsigned long)notice.elapsedSeconds,
                (unsigned long)notice.detail);
    return;

  case NoticeKind::HEARTBEAT:
    if (debug_) {
      out_.printf("  --- heartbeat %6lus  irq=%lu  queued=%lu  processed=%lu"
                  "  drops=%lu  printed=%lu  qlen=%lu ---\n",
                  (unsigned long)notice.elapsedSeconds,
                  (unsigned long)s.eventsReceived,
                  (unsigned long)s.protocolPacketsMatched,
                  (unsigned long)s.packetsProcessed,
                  (unsigned long)s.queueDrops, (unsigned long)s.linesEmitted,
                  (unsigned long)s.queueLength);
    }
    printHeader();
    return;

  default:
    break;
  }

  if (!debug_)
    return;

  switch (notice.kind) {
  case NoticeKind::SCAN_STARTED:
    out_.printf("  --- scan started ---\n");
    break;
  case NoticeKind::PREVENTIVE_RESTART:
    out_.printf("  --- preventive restart at %6lus  irq=%lu  queued=%lu  "
                "printed=%lu ---\n",
                (unsigned long)notice.elapsedSeconds,
                (unsigned long)s.eventsReceived,
                (unsigned long)s.protocolPacketsMatched,
                (unsigned long)s.linesEmitted);
    break;
  case NoticeKind::WATCHDOG:
    out_.printf("  --- watchdog %6lus: IRQ stalled, restarting ---\n",
                (unsigned long)notice.elapsedSeconds);
    break;
  case NoticeKind::PRINT_BLOCKED:
    // Short on purpose, output is already slow
    out_.printf("  --- print blocked %lums qlen=%lu\n",
                (unsigned long)notice.detail,
                (unsigned long)s.queueLength);
    break;
  case NoticeKind::NAME_RESOLVED:
    out_.printf("  --- [%c] %s is '%s' ---\n", notice.tag,
                notice.addressText.c_str(), notice.name.c_str());
    break;
  default:
    break;
  }
}

void SerialPresenter::onSummary(const Summary &summary) {
  const Stats &s = summary.stats;
  const uint32_t elapsed = summary.elapsedMs / 1000;
  const uint32_t hrs = elapsed / 3600;
  const uint32_t mins = (elapsed % 3600) / 60;
  const uint32_t secs = elapsed % 60;
  const uint32_t events = s.eventsReceived > 0 ? s.eventsReceived : 1;

  out_.printf("\nScan stopped after %02lu:%02lu:%02lu\n", (unsigned long)hrs,
              (unsigned long)mins, (unsigned long)secs);
  out_.printf("  BLE events received : %8lu\n",
              (unsigned long)s.eventsReceived);
  out_.printf("  Pybricks packets    : %8lu   (%lu%% of events)\n",
              (unsigned long)s.protocolPacketsMatched,
              (unsigned long)(100ULL * s.protocolPacketsMatched / events));
  out_.printf("  Packets processed   : %8lu\n",
              (unsigned long)s.packetsProcessed);
  out_.printf("  Deduped (suppressed): %8lu\n",
              (unsigned long)s.suppressedByDedup);
  out_.printf("  Lines printed       : %8lu\n", (unsigned long)s.linesEmitted);
  out_.printf("  Malformed packets   : %8lu\n",
              (unsigned long)s.malformedPackets);
  out_.printf("  Queue drops         : %8lu%s\n", (unsigned long)s.queueDrops,
              s.queueDrops > 0 ? "  *** packets lost!" : "  (none)");
  out_.printf("  Scan restarts       : %8lu\n", (unsigned long)s.restarts);
  out_.printf("  Hubs seen           : %8lu\n", (unsigned long)s.peersSeen);

  for (const PeerSummary &peer : summary.peers) {
    if (peer.name.empty()) {
      out_.printf("    [%c] %s\n", peer.tag, peer.addressText.c_str());
    } else {
      out_.printf("    [%c] %s (%s)\n", peer.tag, peer.addressText.c_str(),
                  peer.name.c_str());
    }
  }
}

} // namespace PBScan
