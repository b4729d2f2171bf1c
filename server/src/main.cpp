/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행하고 종료 시그널을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>

#include <boost/asio/signal_set.hpp>

#include "ttt/app.hpp"

int main() {
  using namespace ttt;
  AppConfig config{};
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }

  try {
    ServerApp app(config);

    // 핸들러는 워커 스레드에서 실행되므로 워커를 join하는 Stop 대신 io_context만 멈춘다.
    boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
    signals.async_wait([&app](const boost::system::error_code& ec, int signal_number) {
      if (ec) {
        return;
      }
      std::cout << "시그널 " << signal_number << " 수신, 종료를 준비합니다\n";
      app.GetContext().stop();
    });

    app.Run();
    app.Stop();
  } catch (const std::exception& ex) {
    std::cerr << "서버 초기화 실패: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
