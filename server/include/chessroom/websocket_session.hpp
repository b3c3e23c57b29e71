/*
 * 설명: WebSocket 연결 하나. 수신 프레임을 프로토콜 핸들러로 넘기고, 방 이벤트를 제한된 송신 큐로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "chessroom/game_protocol.hpp"
#include "chessroom/observability.hpp"
#include "chessroom/room_hub.hpp"

namespace chessroom {

class WebSocketSession : public RoomSubscriber, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, std::string subscriber_id,
                   std::shared_ptr<RoomHub> hub, std::shared_ptr<GameProtocolHandler> handler,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  const std::string& SubscriberId() const override { return connection_.subscriber_id; }
  // 임의의 스레드에서 호출된다. 소켓 실행 컨텍스트(strand)로 넘겨 순서대로 보낸다.
  void Deliver(const std::string& event, const nlohmann::json& payload) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void SendEvent(const std::string& event, const nlohmann::json& payload, std::uint64_t seq);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();
  void StartClose();
  void Shutdown();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  ProtocolConnection connection_;
  std::shared_ptr<RoomHub> hub_;
  std::shared_ptr<GameProtocolHandler> handler_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool close_after_write_{false};
  bool shut_down_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace chessroom
