/*
 * 설명: 연결별 송신 큐의 드롭/교체/느린 소비자 판정을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/outbound_queue_test.cpp
 */
#include "telemetry/outbound_queue.hpp"

#include <algorithm>

namespace telemetry {

OutboundQueue::OutboundQueue(const OutboundQueueLimits& limits) : limits_(limits) {
  if (limits_.hard_limit < limits_.soft_limit) {
    limits_.hard_limit = limits_.soft_limit;
  }
}

EnqueueResult OutboundQueue::Push(MessageKind kind, std::string payload) {
  bool is_snapshot = kind == MessageKind::kPresenceSnapshot || kind == MessageKind::kGlobalSnapshot;
  if (!(is_snapshot && ReplaceQueuedSnapshot(kind, payload))) {
    bytes_ += payload.size();
    entries_.push_back(Entry{kind, std::move(payload)});
  }

  while (entries_.size() > limits_.soft_limit || bytes_ > limits_.max_bytes) {
    if (!DropOldestEvent()) {
      break;
    }
  }

  if (dropped_since_drain_ > limits_.hard_limit || entries_.size() > limits_.hard_limit) {
    return EnqueueResult::kSlowConsumer;
  }
  return degraded_ ? EnqueueResult::kQueuedDegraded : EnqueueResult::kQueued;
}

bool OutboundQueue::ReplaceQueuedSnapshot(MessageKind kind, std::string& payload) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [kind](const Entry& entry) { return entry.kind == kind; });
  if (it == entries_.end()) {
    return false;
  }
  bytes_ -= it->payload.size();
  bytes_ += payload.size();
  it->payload = std::move(payload);
  return true;
}

bool OutboundQueue::DropOldestEvent() {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [](const Entry& entry) { return entry.kind == MessageKind::kAnalyticsEvent; });
  if (it == entries_.end()) {
    return false;
  }
  bytes_ -= it->payload.size();
  entries_.erase(it);
  ++dropped_since_drain_;
  ++total_dropped_;
  if (!degraded_) {
    degraded_ = true;
    notice_pending_ = true;
  }
  return true;
}

std::string OutboundQueue::TakeFront() {
  if (entries_.empty()) {
    return {};
  }
  auto payload = std::move(entries_.front().payload);
  bytes_ -= payload.size();
  entries_.pop_front();
  return payload;
}

void OutboundQueue::OnWriteComplete() {
  if (!entries_.empty()) {
    return;
  }
  degraded_ = false;
  notice_pending_ = false;
  dropped_since_drain_ = 0;
}

bool OutboundQueue::TakeDegradedNotice() {
  if (!notice_pending_) {
    return false;
  }
  notice_pending_ = false;
  return true;
}

void OutboundQueue::Clear() {
  entries_.clear();
  bytes_ = 0;
}

}  // namespace telemetry
