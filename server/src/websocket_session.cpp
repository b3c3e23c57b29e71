/*
 * 설명: WebSocket 수신/송신 루프, 백프레셔 종료, 연결 해제 시 이탈 처리.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "chessroom/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

#include "chessroom/api_response.hpp"

namespace chessroom {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::string subscriber_id, std::shared_ptr<RoomHub> hub,
                                   std::shared_ptr<GameProtocolHandler> handler,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), hub_(std::move(hub)), handler_(std::move(handler)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {
  connection_.subscriber_id = std::move(subscriber_id);
}

WebSocketSession::~WebSocketSession() { hub_->Unregister(connection_.subscriber_id); }

void WebSocketSession::Run() {
  hub_->Register(shared_from_this());
  if (observability_) {
    observability_->LogEvent("ws.open", "", std::nullopt, connection_.subscriber_id, LogLevel::kDebug);
  }
  DoRead();
}

void WebSocketSession::Deliver(const std::string& event, const nlohmann::json& payload) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, event, payload]() { self->SendEvent(event, payload, 0); });
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec || closing_) {
    return Shutdown();
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  std::string error_message;
  auto envelope = ParseWsEnvelope(data, error_message);
  if (!envelope) {
    SendError("bad_request", error_message, 0);
  } else {
    handler_->HandleEvent(connection_, envelope->event, envelope->payload);
  }

  if (!closing_) {
    DoRead();
  }
}

void WebSocketSession::SendEvent(const std::string& event, const nlohmann::json& payload, std::uint64_t seq) {
  WsEnvelope env{.type = "event", .event = event, .seq = seq, .payload = payload};
  EnqueueMessage(ToWsJson(env).dump());
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  SendEvent("error-msg", {{"code", code}, {"message", message}}, seq);
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || closing_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    closing_ = true;
    return;
  }
  if (close_after_write_) {
    close_after_write_ = false;
    return StartClose();
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (closing_) {
    return;
  }
  closing_ = true;
  if (observability_) {
    observability_->LogEvent("ws.backpressure_close", connection_.game_id, std::nullopt, connection_.subscriber_id,
                             LogLevel::kWarn);
  }
  // 진행 중인 쓰기 버퍼는 완료 콜백에서 꺼내므로 남겨 둔다. close는 쓰기가 끝난 뒤에만 시작한다.
  if (writing_) {
    while (send_queue_.size() > 1) {
      queued_bytes_ -= send_queue_.back().size();
      send_queue_.pop_back();
    }
    close_after_write_ = true;
    return;
  }
  send_queue_.clear();
  queued_bytes_ = 0;
  StartClose();
}

void WebSocketSession::StartClose() {
  boost::beast::websocket::close_reason reason{boost::beast::websocket::close_code::policy_error};
  reason.reason = "backpressure_exceeded";
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) { self->Shutdown(); });
}

void WebSocketSession::Shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  closing_ = true;
  try {
    handler_->HandleDisconnect(connection_);
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->LogEvent("ws.disconnect_failed", connection_.game_id, std::nullopt, ex.what(),
                               LogLevel::kError);
    }
  }
  hub_->Unregister(connection_.subscriber_id);
  if (observability_) {
    observability_->LogEvent("ws.close", "", std::nullopt, connection_.subscriber_id, LogLevel::kDebug);
  }
}

}  // namespace chessroom
