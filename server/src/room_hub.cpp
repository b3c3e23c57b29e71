/*
 * 설명: 구독자/방 멤버십 관리와 방 단위 이벤트 전달 구현.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_protocol_test.cpp
 */
#include "chessroom/room_hub.hpp"

namespace chessroom {

void RoomHub::Register(const std::shared_ptr<RoomSubscriber>& subscriber) {
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_[subscriber->SubscriberId()] = Entry{subscriber, ""};
  if (observability_) {
    observability_->SetWebsocketActive(subscribers_.size());
  }
}

void RoomHub::Unregister(const std::string& subscriber_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscribers_.find(subscriber_id);
  if (it == subscribers_.end()) {
    return;
  }
  if (!it->second.room.empty()) {
    auto room_it = rooms_.find(it->second.room);
    if (room_it != rooms_.end()) {
      room_it->second.erase(subscriber_id);
      if (room_it->second.empty()) {
        rooms_.erase(room_it);
      }
    }
  }
  subscribers_.erase(it);
  if (observability_) {
    observability_->SetWebsocketActive(subscribers_.size());
  }
}

void RoomHub::JoinRoom(const std::string& subscriber_id, const std::string& room) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = subscribers_.find(subscriber_id);
  if (it == subscribers_.end() || it->second.room == room) {
    return;
  }
  if (!it->second.room.empty()) {
    auto old_it = rooms_.find(it->second.room);
    if (old_it != rooms_.end()) {
      old_it->second.erase(subscriber_id);
      if (old_it->second.empty()) {
        rooms_.erase(old_it);
      }
    }
  }
  it->second.room = room;
  rooms_[room].insert(subscriber_id);
}

void RoomHub::SendTo(const std::string& subscriber_id, const std::string& event, const nlohmann::json& payload) {
  std::shared_ptr<RoomSubscriber> subscriber;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(subscriber_id);
    if (it == subscribers_.end()) {
      return;
    }
    subscriber = it->second.subscriber.lock();
  }
  if (subscriber) {
    subscriber->Deliver(event, payload);
  }
}

void RoomHub::Broadcast(const std::string& room, const std::string& event, const nlohmann::json& payload) {
  BroadcastExcept(room, "", event, payload);
}

void RoomHub::BroadcastExcept(const std::string& room, const std::string& except_subscriber_id,
                              const std::string& event, const nlohmann::json& payload) {
  std::vector<std::shared_ptr<RoomSubscriber>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets = CollectLocked(room, except_subscriber_id);
  }
  for (const auto& target : targets) {
    target->Deliver(event, payload);
  }
}

std::size_t RoomHub::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

std::size_t RoomHub::RoomSize(const std::string& room) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = rooms_.find(room);
  return it == rooms_.end() ? 0 : it->second.size();
}

std::vector<std::shared_ptr<RoomSubscriber>> RoomHub::CollectLocked(const std::string& room,
                                                                    const std::string& except_subscriber_id) const {
  std::vector<std::shared_ptr<RoomSubscriber>> targets;
  auto room_it = rooms_.find(room);
  if (room_it == rooms_.end()) {
    return targets;
  }
  for (const auto& member : room_it->second) {
    if (member == except_subscriber_id) {
      continue;
    }
    auto it = subscribers_.find(member);
    if (it == subscribers_.end()) {
      continue;
    }
    if (auto subscriber = it->second.subscriber.lock()) {
      targets.push_back(std::move(subscriber));
    }
  }
  return targets;
}

}  // namespace chessroom
