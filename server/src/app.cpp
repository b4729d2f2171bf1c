/*
 * 설명: 서버 수명주기와 리스닝/워커 스레드, 리퍼 타이머를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp, server/tests/e2e/reconnect_test.cpp,
 *         server/tests/unit/config_test.cpp
 */
#include "ttt/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "ttt/http_session.hpp"

namespace ttt {
namespace {
std::size_t ResolveThreadCount(const AppConfig& config) {
  if (config.worker_threads > 0) {
    return config.worker_threads;
  }
  return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

void ThrowOnError(const boost::beast::error_code& ec) {
  if (ec) {
    throw boost::beast::system_error{ec};
  }
}
}  // namespace

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<SessionRegistry> registry, std::shared_ptr<ConnectionSupervisor> supervisor,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), registry_(std::move(registry)),
        supervisor_(std::move(supervisor)), observability_(std::move(observability)) {
    boost::beast::error_code ec;
    acceptor_.open(endpoint.protocol(), ec);
    ThrowOnError(ec);
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    ThrowOnError(ec);
    acceptor_.bind(endpoint, ec);
    ThrowOnError(ec);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    ThrowOnError(ec);
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

 private:
  void DoAccept() {
    // 연결마다 별도 strand를 주어 연결 간에는 병렬로 처리한다.
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->registry_, self->supervisor_,
                                          self->observability_)
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
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<ConnectionSupervisor> supervisor_;
  std::shared_ptr<Observability> observability_;
};

ServerApp::ServerApp(const AppConfig& config)
    : config_(config),
      ioc_(static_cast<int>(ResolveThreadCount(config))),
      work_guard_(boost::asio::make_work_guard(ioc_)) {
  auto level = ParseLogLevel(config.log_level);
  if (!level) {
    throw std::invalid_argument("LOG_LEVEL 값이 올바르지 않습니다: " + config.log_level);
  }
  observability_ = std::make_shared<Observability>(*level);
  registry_ = std::make_shared<SessionRegistry>();
  supervisor_ = std::make_shared<ConnectionSupervisor>(registry_, observability_);
  reaper_ = std::make_shared<Reaper>(ioc_, registry_, observability_,
                                     std::chrono::seconds(config.reaper_interval_seconds),
                                     std::chrono::seconds(config.session_stale_seconds));
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Run() {
  try {
    running_ = true;
    boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
    listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, registry_, supervisor_, observability_);
    listener_->Run();
    reaper_->Start();
    std::cout << "서버 시작: 포트 " << config_.port << "\n";
    RunWorkers();
    ioc_.run();
  } catch (const std::exception& ex) {
    std::cerr << "서버 실행 중 예외: " << ex.what() << "\n";
  }
}

void ServerApp::RunWorkers() {
  const std::size_t thread_count = ResolveThreadCount(config_);
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (std::size_t i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  work_guard_.reset();
  if (listener_) {
    listener_->Stop();
  }
  reaper_->Stop();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "32")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "65536")));
  cfg.heartbeat_timeout_seconds = static_cast<std::size_t>(std::stoul(get_env("HEARTBEAT_TIMEOUT_SECONDS", "30")));
  cfg.reaper_interval_seconds = static_cast<std::size_t>(std::stoul(get_env("REAPER_INTERVAL_SECONDS", "600")));
  cfg.session_stale_seconds = static_cast<std::size_t>(std::stoul(get_env("SESSION_STALE_SECONDS", "1200")));
  cfg.worker_threads = static_cast<std::size_t>(std::stoul(get_env("WORKER_THREADS", "0")));
  if (cfg.heartbeat_timeout_seconds == 0 || cfg.reaper_interval_seconds == 0) {
    throw std::invalid_argument("HEARTBEAT_TIMEOUT_SECONDS와 REAPER_INTERVAL_SECONDS는 0보다 커야 합니다");
  }
  return cfg;
}

}  // namespace ttt
