/*
 * 설명: 주기 타이머로 세션 ID 스냅샷을 순회하며 방치된 세션을 제거한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/reaper_test.cpp
 */
#include "ttt/reaper.hpp"

#include <mutex>
#include <string>

#include <boost/asio/post.hpp>

namespace ttt {

Reaper::Reaper(boost::asio::io_context& ioc, std::shared_ptr<SessionRegistry> registry,
               std::shared_ptr<Observability> observability, std::chrono::seconds interval,
               std::chrono::seconds stale_after)
    : strand_(boost::asio::make_strand(ioc)), timer_(strand_), registry_(std::move(registry)),
      observability_(std::move(observability)), interval_(interval), stale_after_(stale_after) {}

void Reaper::Start() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    self->stopped_ = false;
    self->ScheduleNext();
  });
}

void Reaper::Stop() {
  boost::asio::post(strand_, [self = shared_from_this()]() {
    self->stopped_ = true;
    self->timer_.cancel();
  });
}

void Reaper::ScheduleNext() {
  timer_.expires_after(interval_);
  timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) { self->OnTick(ec); });
}

void Reaper::OnTick(const boost::system::error_code& ec) {
  if (ec || stopped_) {
    return;
  }
  Sweep(std::chrono::steady_clock::now());
  ScheduleNext();
}

std::size_t Reaper::Sweep(std::chrono::steady_clock::time_point now) {
  std::size_t removed = 0;
  for (const auto& id : registry_->SnapshotIds()) {
    auto entry = registry_->Find(id);
    if (!entry) {
      continue;
    }
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (entry->retired || entry->session.HasLiveConnection()) {
      continue;
    }
    if (now - entry->session.last_activity <= stale_after_) {
      continue;
    }
    entry->retired = true;
    if (registry_->RemoveIf(id, entry)) {
      ++removed;
    }
  }

  if (observability_ && removed > 0) {
    observability_->AddReaped(removed);
    LogContext ctx;
    ctx.trace_id = observability_->NextTraceId();
    ctx.name = "reaper.sweep";
    ctx.detail = "removed=" + std::to_string(removed) + " remaining=" + std::to_string(registry_->Size());
    observability_->Log(ctx);
  }
  return removed;
}

}  // namespace ttt
