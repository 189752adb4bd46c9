/**
 * @file LineFormat.cpp
 * @brief CORE:LineFormat - Output line formatting
 */

#include "LineFormat.h"
#include <cstdio>

namespace PBScan {

std::string formatHeaderLine() {
  char buf[96];
  snprintf(buf, sizeof(buf), "%8s  %-17s [T] %-12s ch %-18s %s\n", "secs",
           "Address", "Hub name", "Signal", "Value");
  return std::string(buf);
}

std::string formatChangeLine(const ChangeEvent &event, const char *color,
                             const char *reset) {
  std::string name;
  if (!event.name.empty()) {
    name = " ";
    name += event.name;
  }

  char buf[160];
  snprintf(buf, sizeof(buf), "%8lus %s%s%s [%c]%-12s %3u %-*s %4ddBm ",
           (unsigned long)event.elapsedSeconds, color,
           event.addressText.c_str(), reset, event.tag, name.c_str(),
           (unsigned)event.channel, PBSCAN_SIGNAL_LABEL_WIDTH,
           event.signalLabel, (int)event.smoothedRssi);

  std::string line(buf);
  line += event.value.toString();
  line += '\n';
  return line;
}

} // namespace PBScan
