/*
 * 설명: HTTP 연결 하나를 읽어 REST 라우터로 넘기거나 /ws 업그레이드를 수락한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "chessroom/api_routes.hpp"
#include "chessroom/config.hpp"
#include "chessroom/game_protocol.hpp"
#include "chessroom/observability.hpp"
#include "chessroom/room_hub.hpp"

namespace chessroom {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config, std::shared_ptr<ApiRouter> router,
              std::shared_ptr<RoomHub> hub, std::shared_ptr<GameProtocolHandler> protocol,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res);
  void HandleWebSocket();
  std::string RemoteIp();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<ApiRouter> router_;
  std::shared_ptr<RoomHub> hub_;
  std::shared_ptr<GameProtocolHandler> protocol_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace chessroom
