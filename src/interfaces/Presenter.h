/**
 * @file Presenter.h
 * @brief PBScan::Presenter - Output side of the observer
 * @version 1.0.0
 *
 * Receives deduplicated value changes, diagnostic notices and the final
 * summary. Called from the main loop only.
 */
#pragma once
#include "../core/Types.h"

namespace PBScan {

/**
 * @interface Presenter
 * @brief Presentation layer for observed values
 */
class Presenter {
public:
  virtual ~Presenter() = default;

  /**
   * @brief Called once before scanning starts
   * @param config Active configuration
   */
  virtual void begin(const ObserverConfig &config) { (void)config; }

  /**
   * @brief A peer broadcast a new value
   * @param event Change details
   */
  virtual void onChange(const ChangeEvent &event) = 0;

  /**
   * @brief Scan health, name and heartbeat notices
   * @param notice Notice details
   */
  virtual void onNotice(const Notice &notice) = 0;

  /**
   * @brief Observation ended
   * @param summary Final statistics
   */
  virtual void onSummary(const Summary &summary) = 0;
};

} // namespace PBScan
