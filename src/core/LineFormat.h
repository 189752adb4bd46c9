/**
 * @file LineFormat.h
 * @brief CORE:LineFormat - Text layout of the observer's output lines
 * @version 1.0.0
 *
 * Column layout shared by the header and the change lines:
 *   secs  Address  [T] Hub name  ch  Signal  Value
 */
#pragma once
#include "Types.h"
#include <string>

// Widest signal label ("Very close")
#define PBSCAN_SIGNAL_LABEL_WIDTH 10

namespace PBScan {

/**
 * @brief Column header line, without the rule below it
 */
std::string formatHeaderLine();

/**
 * @brief One change line, newline terminated
 * @param event Change to format
 * @param color ANSI color prefix for the address ("" for none)
 * @param reset ANSI reset after the address ("" for none)
 */
std::string formatChangeLine(const ChangeEvent &event, const char *color,
                             const char *reset);

} // namespace PBScan
