/*
 * 설명: 세션 코어가 전송 계층 연결에 메시지를 넘기는 경계 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcast_hub_test.cpp, server/tests/unit/connection_supervisor_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

namespace ttt {

class ClientChannel {
 public:
  virtual ~ClientChannel() = default;

  // 직렬화된 서버 메시지를 송신 큐에 넣는다. 채널이 이미 닫혔으면 false.
  // 여러 스레드에서 호출될 수 있으며 호출 순서대로 전송해야 한다.
  virtual bool Deliver(const std::string& message) = 0;
  virtual void Close(std::string_view reason) = 0;
};

}  // namespace ttt
