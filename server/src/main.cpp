/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/gateway_flow_test.cpp
 */
#include <csignal>
#include <iostream>

#include "telemetry/app.hpp"

int main() {
  using namespace telemetry;
  AppConfig config = LoadConfigFromEnv();
  ServerApp app(config);

  std::signal(SIGINT, [](int) {
    std::cout << "SIGINT 수신, 종료를 준비합니다\n";
  });

  app.Run();
  return 0;
}
