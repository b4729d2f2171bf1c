/*
 * 설명: WebSocket 메시지를 읽어 참가/착수/리셋/퇴장을 감독자에 넘기고 서버 이벤트를 순서대로 전송한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp, server/tests/e2e/reconnect_test.cpp
 */
#include "ttt/websocket_session.hpp"

#include <cstdint>
#include <iterator>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/websocket.hpp>

#include "ttt/api_response.hpp"

namespace ttt {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<ConnectionSupervisor> supervisor,
                                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                                   std::size_t max_queue_bytes)
    : ws_(std::move(ws)), supervisor_(std::move(supervisor)), observability_(std::move(observability)),
      connection_id_(supervisor_->NextConnectionId()), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {
  if (observability_) {
    observability_->ConnectionOpened();
  }
}

WebSocketSession::~WebSocketSession() {
  closed_ = true;
  ReleaseBinding("destroyed");
  if (observability_) {
    observability_->ConnectionClosed();
  }
}

void WebSocketSession::Run() {
  LogConnection(LogLevel::kDebug, "ws.connected");
  DoRead();
}

bool WebSocketSession::Deliver(const std::string& message) {
  if (closed_.load()) {
    return false;
  }
  boost::asio::post(ws_.get_executor(),
                    [self = shared_from_this(), message]() { self->EnqueueMessage(message); });
  return true;
}

void WebSocketSession::Close(std::string_view reason) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), reason = std::string(reason)]() {
    self->CloseWith(boost::beast::websocket::close_code::policy_error, reason);
  });
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
  if (ec) {
    closed_ = true;
    if (ec == boost::beast::error::timeout) {
      ReleaseBinding("idle_timeout");
    } else if (ec == boost::beast::websocket::error::closed) {
      ReleaseBinding("closed");
    } else {
      ReleaseBinding(ec.message());
    }
    return;
  }
  if (closing_) {
    return;
  }

  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(data);
  } catch (const nlohmann::json::exception&) {
    SendError("bad_request", "JSON 파싱 오류", 0);
    return DoRead();
  }

  try {
    Dispatch(message);
  } catch (const InvariantViolation& ex) {
    // 이 연결만 닫는다. 다른 세션과 프로세스는 계속 동작한다.
    LogConnection(LogLevel::kError, "session.invariant_violation", ex.what());
    CloseWith(boost::beast::websocket::close_code::internal_error, "invariant_violation");
    return;
  }

  if (!closing_) {
    DoRead();
  }
}

void WebSocketSession::Dispatch(const nlohmann::json& message) {
  if (!message.is_object()) {
    return SendError("bad_request", "잘못된 메시지 형식", 0);
  }
  std::uint64_t seq = 0;
  auto seq_it = message.find("seq");
  if (seq_it != message.end() && seq_it->is_number_unsigned()) {
    seq = seq_it->get<std::uint64_t>();
  }
  auto type_it = message.find("t");
  auto event_it = message.find("event");
  if (type_it == message.end() || !type_it->is_string() || *type_it != "event" || event_it == message.end() ||
      !event_it->is_string()) {
    return SendError("bad_request", "잘못된 메시지 형식", seq);
  }

  static const nlohmann::json kEmptyPayload = nlohmann::json::object();
  auto payload_it = message.find("p");
  const auto& payload = (payload_it != message.end() && payload_it->is_object()) ? *payload_it : kEmptyPayload;

  const auto event = event_it->get<std::string>();
  if (event == "game.join") {
    HandleJoin(payload, seq);
  } else if (event == "game.move") {
    HandleMove(payload, seq);
  } else if (event == "game.reset") {
    HandleReset(seq);
  } else if (event == "game.leave") {
    HandleLeave(seq);
  } else if (event == "ping") {
    EnqueueMessage(MakeWsEvent("pong", seq, nlohmann::json::object()));
  } else {
    SendError("bad_request", "알 수 없는 이벤트", seq);
  }
}

void WebSocketSession::HandleJoin(const nlohmann::json& payload, std::uint64_t seq) {
  if (binding_) {
    return SendRejection(Rejection::kAlreadyJoined, seq);
  }
  auto session_it = payload.find("sessionId");
  auto name_it = payload.find("name");
  if (session_it == payload.end() || !session_it->is_string() || name_it == payload.end() ||
      !name_it->is_string()) {
    return SendError("bad_request", "sessionId와 name이 필요합니다", seq);
  }
  auto session_id = session_it->get<std::string>();
  auto name = name_it->get<std::string>();
  if (session_id.empty() || name.empty()) {
    return SendError("bad_request", "sessionId와 name은 비어 있을 수 없습니다", seq);
  }

  auto result = supervisor_->Bind(connection_id_, shared_from_this(), session_id, name);
  if (!result.accepted) {
    return SendRejection(result.rejection, seq);
  }
  binding_ = std::move(result.binding);
}

void WebSocketSession::HandleMove(const nlohmann::json& payload, std::uint64_t seq) {
  auto cell_it = payload.find("cell");
  if (cell_it == payload.end() || !cell_it->is_number_integer()) {
    return SendError("bad_request", "cell은 정수여야 합니다", seq);
  }
  if (!binding_) {
    return SendRejection(Rejection::kNotJoined, seq);
  }
  // 범위 밖 값은 엔진이 InvalidCell로 거절하도록 -1로 접는다.
  const auto raw = cell_it->get<std::int64_t>();
  const int cell = (raw < 0 || raw >= kBoardCells) ? -1 : static_cast<int>(raw);
  auto result = supervisor_->Move(*binding_, cell);
  if (!result.accepted) {
    if (result.rejection == Rejection::kNotJoined) {
      binding_.reset();
    }
    SendRejection(result.rejection, seq);
  }
}

void WebSocketSession::HandleReset(std::uint64_t seq) {
  if (!binding_) {
    return SendRejection(Rejection::kNotJoined, seq);
  }
  auto result = supervisor_->Reset(*binding_);
  if (!result.accepted) {
    binding_.reset();
    SendRejection(result.rejection, seq);
  }
}

void WebSocketSession::HandleLeave(std::uint64_t seq) {
  if (!binding_) {
    return SendRejection(Rejection::kNotJoined, seq);
  }
  auto binding = std::move(*binding_);
  binding_.reset();
  auto result = supervisor_->Leave(binding);
  if (!result.accepted) {
    return SendRejection(result.rejection, seq);
  }
  EnqueueMessage(MakeWsEvent("game.left", seq, {{"sessionId", binding.session_id}}));
}

void WebSocketSession::SendError(std::string_view code, std::string_view message, std::uint64_t seq) {
  EnqueueMessage(MakeWsError(code, message, seq));
}

void WebSocketSession::SendRejection(Rejection rejection, std::uint64_t seq) {
  SendError(RejectionCode(rejection), RejectionMessage(rejection), seq);
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    // 느린 소비자는 끊는다. 오래된 스냅샷을 버리지 않는다.
    CloseWith(boost::beast::websocket::close_code::policy_error, "backpressure_exceeded");
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
    closed_ = true;
    ReleaseBinding("write_failed");
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
  }
}

void WebSocketSession::CloseWith(boost::beast::websocket::close_code code, std::string_view reason) {
  if (closing_) {
    return;
  }
  closing_ = true;
  closed_ = true;
  // 진행 중인 쓰기가 참조하는 맨 앞 버퍼는 완료 콜백까지 남겨 둔다.
  if (writing_ && !send_queue_.empty()) {
    send_queue_.erase(std::next(send_queue_.begin()), send_queue_.end());
    queued_bytes_ = send_queue_.front().size();
  } else {
    send_queue_.clear();
    queued_bytes_ = 0;
  }
  LogConnection(LogLevel::kInfo, "ws.closing", std::string(reason));
  ReleaseBinding(reason);

  boost::beast::websocket::close_reason close_reason{code};
  close_reason.reason = std::string(reason);
  auto self = shared_from_this();
  ws_.async_close(close_reason, [self](boost::beast::error_code) {});
}

void WebSocketSession::ReleaseBinding(std::string_view cause) {
  if (!binding_) {
    return;
  }
  auto binding = std::move(*binding_);
  binding_.reset();
  if (observability_ && observability_->Enabled(LogLevel::kDebug)) {
    LogContext ctx;
    ctx.trace_id = observability_->NextTraceId();
    ctx.session_id = binding.session_id;
    ctx.role = std::string(MarkToString(binding.role));
    ctx.name = "ws.release_binding";
    ctx.level = LogLevel::kDebug;
    ctx.detail = std::string(cause);
    observability_->Log(ctx);
  }
  supervisor_->Unbind(binding);
}

void WebSocketSession::LogConnection(LogLevel level, const std::string& event, std::string detail) const {
  if (!observability_ || !observability_->Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.trace_id = observability_->NextTraceId();
  if (binding_) {
    ctx.session_id = binding_->session_id;
    ctx.role = std::string(MarkToString(binding_->role));
  }
  ctx.name = event;
  ctx.level = level;
  ctx.detail = "connection=" + std::to_string(connection_id_) + (detail.empty() ? "" : " " + detail);
  observability_->Log(ctx);
}

}  // namespace ttt
