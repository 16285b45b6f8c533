/*
 * 설명: 연결별 송신 큐. 소프트 한도를 넘으면 가장 오래된 분석 이벤트부터 버리고(degraded),
 *       비워지지 않은 채 버린 수가 하드 한도를 넘으면 느린 소비자로 판정한다.
 *       프레즌스 스냅샷은 버리지 않고 같은 종류의 대기 중인 스냅샷을 새 것으로 교체한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/outbound_queue_test.cpp
 */
#pragma once

#include <cstddef>
#include <deque>
#include <string>

namespace telemetry {

enum class MessageKind { kControl, kPresenceSnapshot, kGlobalSnapshot, kAnalyticsEvent };

enum class EnqueueResult { kQueued, kQueuedDegraded, kSlowConsumer };

struct OutboundQueueLimits {
  std::size_t soft_limit{64};
  std::size_t hard_limit{256};
  std::size_t max_bytes{1024 * 1024};
};

class OutboundQueue {
 public:
  explicit OutboundQueue(const OutboundQueueLimits& limits);

  EnqueueResult Push(MessageKind kind, std::string payload);

  bool Empty() const { return entries_.empty(); }
  std::size_t Size() const { return entries_.size(); }
  std::size_t Bytes() const { return bytes_; }

  // 맨 앞 메시지를 꺼낸다. 꺼낸 메시지는 더 이상 드롭/교체 대상이 아니다.
  std::string TakeFront();
  // 전송 완료 후 호출. 큐가 비어 있으면 degraded 상태와 드롭 누계가 초기화된다.
  void OnWriteComplete();

  bool Degraded() const { return degraded_; }
  // degraded 구간마다 한 번만 true를 반환한다.
  bool TakeDegradedNotice();
  std::size_t DroppedSinceDrain() const { return dropped_since_drain_; }
  std::size_t TotalDropped() const { return total_dropped_; }

  void Clear();

 private:
  struct Entry {
    MessageKind kind;
    std::string payload;
  };

  bool ReplaceQueuedSnapshot(MessageKind kind, std::string& payload);
  bool DropOldestEvent();

  OutboundQueueLimits limits_;
  std::deque<Entry> entries_;
  std::size_t bytes_{0};
  bool degraded_{false};
  bool notice_pending_{false};
  std::size_t dropped_since_drain_{0};
  std::size_t total_dropped_{0};
};

}  // namespace telemetry
