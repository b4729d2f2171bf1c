/*
 * 설명: WebSocket 연결 하나의 메시지 처리, 백프레셔, 유휴 타임아웃과 세션 바인딩 해제를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp, server/tests/e2e/reconnect_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include "ttt/client_channel.hpp"
#include "ttt/connection_supervisor.hpp"
#include "ttt/observability.hpp"

namespace ttt {

class WebSocketSession : public ClientChannel, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<ConnectionSupervisor> supervisor, std::shared_ptr<Observability> observability,
                   std::size_t max_queue_messages, std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  bool Deliver(const std::string& message) override;
  void Close(std::string_view reason) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void Dispatch(const nlohmann::json& message);
  void HandleJoin(const nlohmann::json& payload, std::uint64_t seq);
  void HandleMove(const nlohmann::json& payload, std::uint64_t seq);
  void HandleReset(std::uint64_t seq);
  void HandleLeave(std::uint64_t seq);
  void SendError(std::string_view code, std::string_view message, std::uint64_t seq);
  void SendRejection(Rejection rejection, std::uint64_t seq);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void CloseWith(boost::beast::websocket::close_code code, std::string_view reason);
  void ReleaseBinding(std::string_view cause);
  void LogConnection(LogLevel level, const std::string& event, std::string detail = {}) const;

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<ConnectionSupervisor> supervisor_;
  std::shared_ptr<Observability> observability_;
  std::uint64_t connection_id_;
  std::optional<Binding> binding_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  // Deliver는 다른 세션의 스레드에서도 호출되므로 닫힘 여부만 원자적으로 공유한다.
  std::atomic<bool> closed_{false};
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace ttt
