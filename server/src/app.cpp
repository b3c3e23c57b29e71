/*
 * 설명: 서버 수명주기, 저장소 선택, 리스닝 소켓과 워커 스레드를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "chessroom/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "chessroom/chess_rules.hpp"
#include "chessroom/db_client.hpp"
#include "chessroom/http_session.hpp"
#include "chessroom/mariadb_game_store.hpp"
#include "chessroom/memory_game_store.hpp"
#include "chessroom/rate_limiter.hpp"

namespace chessroom {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<ApiRouter> router, std::shared_ptr<RoomHub> hub,
           std::shared_ptr<GameProtocolHandler> protocol, std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), router_(std::move(router)),
        hub_(std::move(hub)), protocol_(std::move(protocol)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::beast::error_code ec;
    acceptor_.close(ec);
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->router_, self->hub_,
                                          self->protocol_, self->observability_)
                ->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<ApiRouter> router_;
  std::shared_ptr<RoomHub> hub_;
  std::shared_ptr<GameProtocolHandler> protocol_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), ioc_(1), work_guard_(boost::asio::make_work_guard(ioc_)) {
  observability_ = std::make_shared<Observability>();
  observability_->SetMinLevel(ParseLogLevel(config.log_level));

  if (config.store_backend == "memory") {
    store_ = std::make_shared<MemoryGameStore>();
  } else {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    store_ = std::make_shared<MariaDbGameStore>(std::make_shared<MariaDbClient>(db_config));
  }

  registry_ = std::make_shared<SessionRegistry>(ioc_, store_, MakeStandardRulesFactory(), observability_,
                                                std::chrono::seconds(config.eviction_delay_seconds));
  hub_ = std::make_shared<RoomHub>();
  hub_->SetObservability(observability_);
  protocol_ = std::make_shared<GameProtocolHandler>(registry_, hub_, store_, observability_,
                                                    std::chrono::seconds(config.disconnect_grace_seconds));
  auto rate_limiter =
      std::make_shared<RateLimiter>(config.api_rate_limit_max, std::chrono::seconds(config.api_rate_window_seconds));
  router_ = std::make_shared<ApiRouter>(registry_, store_, observability_, rate_limiter);
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, router_, hub_, protocol_, observability_);
    listener_->Run();

    boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      observability_->LogEvent("server.signal", "", std::nullopt, std::to_string(signal_number));
      work_guard_.reset();
      listener_->Stop();
      ioc_.stop();
    });

    observability_->LogEvent("server.start", "", std::nullopt,
                             "port=" + std::to_string(config_.port) + " store=" + config_.store_backend);
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    observability_->LogEvent("server.failure", "", std::nullopt, ex.what(), LogLevel::kError);
  }
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(1u, std::thread::hardware_concurrency());
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (unsigned int i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

}  // namespace chessroom
