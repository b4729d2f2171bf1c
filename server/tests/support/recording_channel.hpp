/*
 * 설명: 세션 코어 테스트용 ClientChannel 구현으로 전달된 메시지와 종료 사유를 기록한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_hub_test.cpp, server/tests/unit/connection_supervisor_test.cpp
 */
#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ttt/client_channel.hpp"

namespace ttt::test_support {

class RecordingChannel : public ClientChannel {
 public:
  bool Deliver(const std::string& message) override {
    if (!accept_.load()) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(message);
    return true;
  }

  void Close(std::string_view reason) override {
    std::lock_guard<std::mutex> lock(mutex_);
    close_reasons_.emplace_back(reason);
    accept_ = false;
  }

  void SetAccepting(bool accept) { accept_ = accept; }

  std::vector<nlohmann::json> Messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<nlohmann::json> parsed;
    parsed.reserve(messages_.size());
    for (const auto& raw : messages_) {
      parsed.push_back(nlohmann::json::parse(raw));
    }
    return parsed;
  }

  // event 이름이 일치하는 메시지의 payload만 모은다.
  std::vector<nlohmann::json> Events(const std::string& event) const {
    std::vector<nlohmann::json> payloads;
    for (const auto& message : Messages()) {
      if (message["t"] == "event" && message["event"] == event) {
        payloads.push_back(message["p"]);
      }
    }
    return payloads;
  }

  nlohmann::json LastState() const {
    auto states = Events("game.state");
    return states.empty() ? nlohmann::json{} : states.back();
  }

  std::vector<std::string> CloseReasons() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reasons_;
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.clear();
  }

 private:
  mutable std::mutex mutex_;
  std::vector<std::string> messages_;
  std::vector<std::string> close_reasons_;
  std::atomic<bool> accept_{true};
};

}  // namespace ttt::test_support
