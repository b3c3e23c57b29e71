/*
 * 설명: HTTP 요청을 읽어 REST 라우터 응답을 쓰고, /ws 요청은 WebSocket 세션으로 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "chessroom/http_session.hpp"

#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>

#include "chessroom/api_response.hpp"
#include "chessroom/id_generator.hpp"
#include "chessroom/websocket_session.hpp"

namespace chessroom {

namespace {
constexpr const char* kServerName = "chessroom";
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<ApiRouter> router, std::shared_ptr<RoomHub> hub,
                         std::shared_ptr<GameProtocolHandler> protocol, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), router_(std::move(router)), hub_(std::move(hub)),
      protocol_(std::move(protocol)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  namespace http = boost::beast::http;
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto reply = router_->Handle(req_.method(), std::string(req_.target()), req_.body(), RemoteIp());

  auto res = std::make_shared<http::response<http::string_body>>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");
  res->result(reply.status);
  res->body() = reply.body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res) {
  auto self = shared_from_this();
  if (observability_) {
    const bool failed = static_cast<unsigned>(res->result_int()) >= 400;
    if (failed) {
      observability_->IncrementError();
    }
    auto latency =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
            .count();
    observability_->Log(LogContext{trace_id_, std::nullopt, std::nullopt,
                                   std::string(req_.method_string()) + " " + std::string(req_.target()), latency,
                                   failed ? LogLevel::kWarn : LogLevel::kInfo,
                                   "status=" + std::to_string(res->result_int())});
  }
  boost::beast::http::async_write(stream_, *res,
                                  [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
                                    if (ec) {
                                      return;
                                    }
                                    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
                                  });
}

void HttpSession::HandleWebSocket() {
  std::string target(req_.target());
  if (target.substr(0, target.find('?')) != "/ws") {
    auto res = std::make_shared<boost::beast::http::response<boost::beast::http::string_body>>();
    res->version(req_.version());
    res->result(boost::beast::http::status::not_found);
    res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
    res->body() = MakeErrorEnvelope("not_found", "WebSocket 경로는 /ws 입니다").dump();
    res->content_length(res->body().size());
    return SendResponse(res);
  }
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), GeneratePlayerId(), hub_, protocol_, observability_,
                                       config_.ws_queue_limit_messages, config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Log(LogContext{trace_id_, std::nullopt, std::nullopt, "ws.accept_failed", 0, LogLevel::kWarn,
                                     ex.what()});
    }
  }
}

std::string HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

}  // namespace chessroom
