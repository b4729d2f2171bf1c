/*
 * 설명: 살아 있는 연결이 없고 오래 방치된 세션을 주기적으로 레지스트리에서 제거한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/reaper_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "ttt/observability.hpp"
#include "ttt/session_registry.hpp"

namespace ttt {

class Reaper : public std::enable_shared_from_this<Reaper> {
 public:
  Reaper(boost::asio::io_context& ioc, std::shared_ptr<SessionRegistry> registry,
         std::shared_ptr<Observability> observability, std::chrono::seconds interval,
         std::chrono::seconds stale_after);

  void Start();
  void Stop();

  // 제거한 세션 수를 반환한다.
  std::size_t Sweep(std::chrono::steady_clock::time_point now);

 private:
  void ScheduleNext();
  void OnTick(const boost::system::error_code& ec);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<Observability> observability_;
  std::chrono::seconds interval_;
  std::chrono::seconds stale_after_;
  bool stopped_{false};
};

}  // namespace ttt
