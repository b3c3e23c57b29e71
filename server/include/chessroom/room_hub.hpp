/*
 * 설명: 실시간 구독자(WebSocket 연결)와 게임 방(room) 멤버십을 관리하고 이벤트를 방 단위로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_protocol_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>

#include "chessroom/observability.hpp"

namespace chessroom {

class RoomSubscriber {
 public:
  virtual ~RoomSubscriber() = default;
  virtual const std::string& SubscriberId() const = 0;
  // 여러 스레드에서 호출될 수 있다. 구현은 자신의 실행 컨텍스트로 넘겨 순서를 유지해야 한다.
  virtual void Deliver(const std::string& event, const nlohmann::json& payload) = 0;
};

class RoomHub {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }

  void Register(const std::shared_ptr<RoomSubscriber>& subscriber);
  void Unregister(const std::string& subscriber_id);
  // 구독자는 한 번에 하나의 방에만 속한다. 다른 방에 들어가면 이전 방에서 빠진다.
  void JoinRoom(const std::string& subscriber_id, const std::string& room);

  void SendTo(const std::string& subscriber_id, const std::string& event, const nlohmann::json& payload);
  void Broadcast(const std::string& room, const std::string& event, const nlohmann::json& payload);
  void BroadcastExcept(const std::string& room, const std::string& except_subscriber_id, const std::string& event,
                       const nlohmann::json& payload);

  std::size_t ActiveConnections() const;
  std::size_t RoomSize(const std::string& room) const;

 private:
  struct Entry {
    std::weak_ptr<RoomSubscriber> subscriber;
    std::string room;
  };

  std::vector<std::shared_ptr<RoomSubscriber>> CollectLocked(const std::string& room,
                                                             const std::string& except_subscriber_id) const;

  std::unordered_map<std::string, Entry> subscribers_;
  std::unordered_map<std::string, std::unordered_set<std::string>> rooms_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace chessroom
