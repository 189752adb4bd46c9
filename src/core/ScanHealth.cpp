/**
 * @file ScanHealth.cpp
 * @brief CORE:ScanHealth - Scan supervision implementation
 */

#include "ScanHealth.h"

namespace PBScan {

ScanHealth::ScanHealth(ScanRadio *radio, Presenter *presenter, Stats &stats)
    : radio_(radio), presenter_(presenter), stats_(stats), intentional_(false),
      unexpectedPending_(0), expectedStops_(0) {
  configure(ObserverConfig());
}

void ScanHealth::configure(const ObserverConfig &config) {
  params_.active = config.activeScan;
  params_.intervalUs = config.scanIntervalUs;
  params_.windowUs = config.scanWindowUs;
  watchdogMs_ = config.watchdogMs;
  preventiveEvents_ = config.preventiveRestartEvents;
  retryMs_ = config.restartRetryMs;
}

bool ScanHealth::begin(uint32_t nowMs) {
  startMs_ = nowMs;
  started_ = true;
  failures_ = 0;
  lastSeenEvents_ = stats_.eventsReceived;
  baselineEvents_ = stats_.eventsReceived;
  lastEventMs_ = nowMs;
  unexpectedPending_.store(0);

  state_ = ScanState::RESTARTING;
  restartMs_ = nowMs;

  bool accepted = radio_->startScan(params_);
  if (accepted && radio_->isScanning()) {
    confirmRunning(nowMs);
  }
  return accepted;
}

void ScanHealth::stop() {
  intentional_.store(true);
  radio_->stopScan();
  intentional_.store(false);
  started_ = false;
}

void ScanHealth::onScanStopped() {
  if (intentional_.load()) {
    expectedStops_.fetch_add(1);
  } else {
    unexpectedPending_.fetch_add(1);
  }
}

void ScanHealth::poll(uint32_t nowMs) {
  if (!started_)
    return;

  const uint32_t events = stats_.eventsReceived;
  if (events != lastSeenEvents_) {
    lastSeenEvents_ = events;
    lastEventMs_ = nowMs;
  }

  const uint32_t unexpected = unexpectedPending_.exchange(0);
  stats_.unexpectedStops += unexpected;

  if (state_ == ScanState::RESTARTING) {
    if (radio_->isScanning()) {
      confirmRunning(nowMs);
      return;
    }
    if (nowMs - restartMs_ >= retryMs_) {
      failures_++;
      stats_.restartFailures++;
      notify(NoticeKind::RESTART_FAILED, nowMs, failures_);
      issueRestart(nowMs, true);
    }
    return;
  }

  if (unexpected > 0) {
    restart(RestartReason::UNEXPECTED_STOP, nowMs);
    return;
  }

  if (preventiveEvents_ > 0 && events - baselineEvents_ >= preventiveEvents_) {
    restart(RestartReason::PREVENTIVE, nowMs);
    return;
  }

  if (watchdogMs_ > 0 && nowMs - lastEventMs_ >= watchdogMs_) {
    restart(RestartReason::WATCHDOG, nowMs);
  }
}

bool ScanHealth::restart(RestartReason reason, uint32_t nowMs) {
  if (state_ == ScanState::RESTARTING)
    return false;

  switch (reason) {
  case RestartReason::WATCHDOG:
    notify(NoticeKind::WATCHDOG, nowMs);
    break;
  case RestartReason::PREVENTIVE:
    notify(NoticeKind::PREVENTIVE_RESTART, nowMs);
    break;
  case RestartReason::UNEXPECTED_STOP:
    notify(NoticeKind::UNEXPECTED_STOP, nowMs);
    break;
  }

  issueRestart(nowMs, true);
  return true;
}

void ScanHealth::issueRestart(uint32_t nowMs, bool stopFirst) {
  state_ = ScanState::RESTARTING;
  restartMs_ = nowMs;
  stats_.restarts++;

  // Any stop notification raised in between is ours
  intentional_.store(true);
  if (stopFirst)
    radio_->stopScan();
  bool accepted = radio_->startScan(params_);
  intentional_.store(false);

  if (accepted && radio_->isScanning()) {
    confirmRunning(nowMs);
  }
}

void ScanHealth::confirmRunning(uint32_t nowMs) {
  const bool first = stats_.restarts == 0 && failures_ == 0;
  state_ = ScanState::RUNNING;
  failures_ = 0;
  baselineEvents_ = stats_.eventsReceived;
  lastSeenEvents_ = stats_.eventsReceived;
  lastEventMs_ = nowMs;
  if (first)
    notify(NoticeKind::SCAN_STARTED, nowMs);
}

void ScanHealth::notify(NoticeKind kind, uint32_t nowMs, uint32_t detail) {
  if (!presenter_)
    return;

  Notice notice;
  notice.kind = kind;
  notice.elapsedSeconds = (nowMs - startMs_) / 1000;
  notice.detail = detail;
  notice.stats = stats_;
  presenter_->onNotice(notice);
}

} // namespace PBScan
