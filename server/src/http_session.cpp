/*
 * 설명: HTTP 요청을 처리하고 헬스/메트릭/세션 생성·조회/WS 업그레이드를 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/game_flow_test.cpp
 */
#include "ttt/http_session.hpp"

#include <iomanip>
#include <mutex>
#include <optional>
#include <sstream>
#include <vector>

#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <openssl/rand.h>

#include "ttt/api_response.hpp"
#include "ttt/websocket_session.hpp"

namespace ttt {

namespace {
constexpr std::string_view kSessionsPath = "/api/sessions";

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::optional<std::string> RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    return std::nullopt;
  }
  return BytesToHex(buffer.data(), buffer.size());
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<SessionRegistry> registry, std::shared_ptr<ConnectionSupervisor> supervisor,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), registry_(std::move(registry)),
      supervisor_(std::move(supervisor)), observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
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

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }

  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "tictactoe-server");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str.substr(0, target_str.find('?'));

  if (req_.method() == http::verb::get && path == "/api/health") {
    return Respond(res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
  }

  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(registry_->Size());
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"sessions", {{"active", snapshot.active_sessions}, {"reaped", snapshot.sessions_reaped}}},
                        {"game", {{"moves", snapshot.moves_total}, {"rejections", snapshot.rejections_total}}}};
    return Respond(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::post && path == kSessionsPath) {
    std::optional<std::string> session_id;
    do {
      session_id = RandomHex(8);
      if (!session_id) {
        return Respond(res, http::status::internal_server_error,
                       MakeErrorEnvelope("internal_error", "세션 ID를 생성하지 못했습니다"));
      }
    } while (registry_->Find(*session_id));
    registry_->GetOrCreate(*session_id);
    return Respond(res, http::status::created, MakeSuccessEnvelope({{"sessionId", *session_id}}));
  }

  if (req_.method() == http::verb::get && path.size() > kSessionsPath.size() + 1 &&
      path.compare(0, kSessionsPath.size() + 1, std::string(kSessionsPath) + "/") == 0) {
    auto session_id = path.substr(kSessionsPath.size() + 1);
    auto entry = registry_->Find(session_id);
    if (!entry) {
      return Respond(res, http::status::not_found, MakeErrorEnvelope("session_not_found", "세션을 찾을 수 없습니다"));
    }
    nlohmann::json snapshot;
    {
      std::lock_guard<std::mutex> lock(entry->mutex);
      if (entry->retired) {
        snapshot = nullptr;
      } else {
        snapshot = entry->hub.VersionedSnapshot(entry->session);
      }
    }
    if (snapshot.is_null()) {
      return Respond(res, http::status::not_found, MakeErrorEnvelope("session_not_found", "세션을 찾을 수 없습니다"));
    }
    return Respond(res, http::status::ok, MakeSuccessEnvelope(snapshot));
  }

  Respond(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::Respond(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                          const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    LogContext ctx;
    ctx.trace_id = trace_id_;
    ctx.name = std::string(req_.target());
    ctx.latency_ms = static_cast<long>(latency);
    ctx.detail = "status=" + std::to_string(res->result_int());
    observability_->Log(ctx);
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::HandleWebSocket() {
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  // HTTP 읽기용 만료 시각을 지우고 websocket 자체 타임아웃에 맡긴다.
  boost::beast::get_lowest_layer(ws).expires_never();
  // 하트비트 간격 동안 아무 프레임도 받지 못하면 읽기가 timeout으로 끝나고 바인딩이 해제된다.
  boost::beast::websocket::stream_base::timeout timeout_opt{
      std::chrono::seconds(30), std::chrono::seconds(config_.heartbeat_timeout_seconds), false};
  ws.set_option(timeout_opt);
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, "tictactoe-server");
  }));
  try {
    ws.accept(req_);
    std::make_shared<WebSocketSession>(std::move(ws), supervisor_, observability_, config_.ws_queue_limit_messages,
                                       config_.ws_queue_limit_bytes)
        ->Run();
  } catch (const boost::system::system_error& ex) {
    if (observability_) {
      LogContext ctx;
      ctx.trace_id = observability_->NextTraceId();
      ctx.name = "ws.handshake_failed";
      ctx.level = LogLevel::kWarn;
      ctx.detail = ex.what();
      observability_->Log(ctx);
    }
  }
}

}  // namespace ttt
