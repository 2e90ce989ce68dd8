#include "Core/Application.h"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <vector>

using namespace DeviceWatch::Core;

std::unique_ptr<CollectorApplication> g_app;

void SignalHandler(int signal_num) {
  std::cout << "\n🛑 종료 신호 받음 (Signal: " << signal_num << ")"
            << std::endl;
  if (g_app) {
    g_app->Stop();
  }
}

namespace {

void PrintUsage(const char *program) {
  std::cout << "Usage: " << program << " [--config=<file>] [command]\n"
            << "\n"
            << "Commands:\n"
            << "  run                 모니터링 시작 (기본값, Ctrl+C로 종료)\n"
            << "  --once              한 사이클만 실행하고 결과 출력\n"
            << "  alerts [--all]      저장된 활성 알람 (--all: 해제 포함)\n"
            << "  ack <alert_id>      알람 확인 처리\n"
            << "  prune --days <N>    N일 지난 해제 알람 / 메트릭 삭제\n"
            << "  devices             저장된 디바이스 목록\n"
            << std::endl;
}

bool ParseDays(const std::string &text, int &days) {
  try {
    size_t pos = 0;
    days = std::stoi(text, &pos);
    return pos == text.size() && days >= 0;
  } catch (const std::exception &) {
    return false;
  }
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    signal(SIGINT, SignalHandler);
    signal(SIGTERM, SignalHandler);

    // Command line argument parsing
    std::string config_path;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.find("--config=") == 0) {
        config_path = arg.substr(9);
      } else if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else {
        args.push_back(arg);
      }
    }

    const std::string command = args.empty() ? "run" : args[0];
    g_app = std::make_unique<CollectorApplication>(config_path);

    int rc = 1;
    if (command == "run") {
      std::cout << R"(
🚀 DeviceWatch Collector
Device Health Monitoring & Alerting
)" << std::endl;
      rc = g_app->Run();

    } else if (command == "--once" || command == "once") {
      rc = g_app->RunOnce();

    } else if (command == "alerts") {
      bool include_resolved = args.size() > 1 && args[1] == "--all";
      rc = g_app->ListAlerts(include_resolved);

    } else if (command == "ack") {
      if (args.size() < 2) {
        std::cerr << "❌ Error: ack requires an alert id" << std::endl;
        return 1;
      }
      rc = g_app->AcknowledgeAlert(args[1]);

    } else if (command == "prune") {
      int days = -1;
      if (args.size() >= 3 && args[1] == "--days") {
        if (!ParseDays(args[2], days)) {
          std::cerr << "❌ Error: Invalid --days value" << std::endl;
          return 1;
        }
      } else if (args.size() >= 2 && args[1].find("--days=") == 0) {
        if (!ParseDays(args[1].substr(7), days)) {
          std::cerr << "❌ Error: Invalid --days value" << std::endl;
          return 1;
        }
      } else {
        std::cerr << "❌ Error: prune requires --days <N>" << std::endl;
        return 1;
      }
      rc = g_app->Prune(days);

    } else if (command == "devices") {
      rc = g_app->ListDevices();

    } else {
      std::cerr << "❌ Error: Unknown command '" << command << "'"
                << std::endl;
      PrintUsage(argv[0]);
      return 1;
    }

    g_app.reset();
    return rc;

  } catch (const std::exception &e) {
    std::cerr << "💥 Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
