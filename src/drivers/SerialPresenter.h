/**
 * @file SerialPresenter.h
 * @brief DRIVERS:SerialPresenter - ANSI terminal output on a serial port
 * @version 1.0.0
 *
 * One line per value change, colored per hub. Debug notices are printed
 * only when the configuration enables them; scan faults always are. Line
 * layout comes from core/LineFormat.
 */
#pragma once
#include "../interfaces/Presenter.h"
#include <Arduino.h>

namespace PBScan {

/**
 * @class SerialPresenter
 * @brief Presenter writing to an Arduino Print stream
 */
class SerialPresenter : public Presenter {
public:
  /**
   * @brief Construct presenter
   * @param out Output stream (default Serial)
   */
  explicit SerialPresenter(Print &out = Serial);

  void begin(const ObserverConfig &config) override;
  void onChange(const ChangeEvent &event) override;
  void onNotice(const Notice &notice) override;
  void onSummary(const Summary &summary) override;

  /// @brief Print the column header
  void printHeader();

  SerialPresenter(const SerialPresenter &) = delete;
  SerialPresenter &operator=(const SerialPresenter &) = delete;

private:
  Print &out_;
  bool debug_ = true;
  const char *const *palette_;

  const char *colorFor(uint8_t index) const;
};

} // namespace PBScan
