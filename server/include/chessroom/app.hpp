/*
 * 설명: 서버 전체 수명주기와 구성 요소 조립을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "chessroom/api_routes.hpp"
#include "chessroom/config.hpp"
#include "chessroom/game_protocol.hpp"
#include "chessroom/game_store.hpp"
#include "chessroom/observability.hpp"
#include "chessroom/room_hub.hpp"
#include "chessroom/session_registry.hpp"

namespace chessroom {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  void Run();
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<GameStore> GetStore() { return store_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<GameStore> store_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<RoomHub> hub_;
  std::shared_ptr<GameProtocolHandler> protocol_;
  std::shared_ptr<ApiRouter> router_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace chessroom
