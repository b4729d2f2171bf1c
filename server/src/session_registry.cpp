/*
 * 설명: 맵 락은 조회/삽입/삭제 동안만 잡고, 세션 변경은 항목별 락으로 분리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#include "ttt/session_registry.hpp"

namespace ttt {

SessionHandle SessionRegistry::GetOrCreate(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it != sessions_.end()) {
    return it->second;
  }
  auto entry = std::make_shared<SessionEntry>(session_id, std::chrono::steady_clock::now());
  sessions_.emplace(session_id, entry);
  return entry;
}

SessionHandle SessionRegistry::Find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

bool SessionRegistry::Remove(const std::string& session_id) {
  SessionHandle removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      return false;
    }
    removed = std::move(it->second);
    sessions_.erase(it);
  }
  std::lock_guard<std::mutex> entry_lock(removed->mutex);
  removed->retired = true;
  return true;
}

bool SessionRegistry::RemoveIf(const std::string& session_id, const SessionHandle& expected) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end() || it->second != expected) {
    return false;
  }
  sessions_.erase(it);
  return true;
}

std::vector<std::string> SessionRegistry::SnapshotIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(sessions_.size());
  for (const auto& [id, entry] : sessions_) {
    ids.push_back(id);
  }
  return ids;
}

std::size_t SessionRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

}  // namespace ttt
