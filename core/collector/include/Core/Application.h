/**
 * @file Application.h
 * @brief DeviceWatch Collector 애플리케이션 (엔진 실행 + 오프라인 유지보수 명령)
 */

#ifndef DEVICEWATCH_APPLICATION_H
#define DEVICEWATCH_APPLICATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>

#include "Common/Structs.h"
#include "Core/MonitoringConfig.h"

namespace DbLib {
class ConnectionPool;
}

namespace DeviceWatch {
namespace Database {
class AlertStore;
class DbLoggerAdapter;
} // namespace Database
namespace Workers {
class ITelemetryProvider;
}
} // namespace DeviceWatch

namespace DeviceWatch {
namespace Core {

class MonitoringEngine;

/**
 * @brief DeviceWatch Collector 메인 애플리케이션 클래스
 *
 * - Run(): 엔진 초기화 -> 스케줄러 시작 -> 메인루프 -> 정리
 * - RunOnce(): 한 사이클만 실행하고 결과 출력
 * - ListAlerts / AcknowledgeAlert / Prune / ListDevices: 엔진 없이 DB만 연다
 *
 * 모든 명령은 프로세스 종료 코드(0 성공)를 반환한다.
 */
class CollectorApplication {
public:
  // ==========================================================================
  // 생성자/소멸자
  // ==========================================================================
  explicit CollectorApplication(std::string config_path = "");
  ~CollectorApplication();

  // 테스트 / 대체 전송 계층용. 지정하지 않으면 SimulatedTelemetryProvider
  void SetProvider(std::shared_ptr<Workers::ITelemetryProvider> provider);

  // ==========================================================================
  // 명령
  // ==========================================================================
  int Run();
  int RunOnce();
  int ListAlerts(bool include_resolved);
  int AcknowledgeAlert(const std::string &alert_id);
  int Prune(int days);
  int ListDevices();

  /**
   * @brief 애플리케이션 종료 요청
   * @details 시그널 핸들러에서 호출된다.
   */
  void Stop();

  bool IsRunning() const { return is_running_.load(); }

private:
  // ==========================================================================
  // 초기화 및 설정 메서드들
  // ==========================================================================
  bool LoadConfiguration();
  bool InitializeEngine();
  bool OpenStore();

  // ==========================================================================
  // 런타임 메서드들
  // ==========================================================================

  /**
   * @brief 메인 실행 루프
   * @details
   * - STATS_REPORT_INTERVAL_SECONDS 마다 통계 리포트
   * - 24시간마다 보관 기간 초과 로그 / 해제 알람 / 메트릭 정리
   */
  void MainLoop();
  void RunRetention();
  void Cleanup();

private:
  std::string config_path_;
  MonitoringConfig config_;
  std::shared_ptr<Workers::ITelemetryProvider> provider_;
  std::unique_ptr<MonitoringEngine> engine_;

  // 오프라인 명령용
  std::unique_ptr<Database::DbLoggerAdapter> db_logger_;
  std::shared_ptr<DbLib::ConnectionPool> pool_;
  std::shared_ptr<Database::AlertStore> store_;

  // ==========================================================================
  // 실행 상태 관리
  // ==========================================================================
  std::atomic<bool> is_running_{false};
  std::condition_variable stop_cv_;
  std::mutex stop_mutex_;

  // 보관 설정
  int log_retention_days_{30};
  int alert_retention_days_{30};
  int metric_retention_days_{7};
  std::chrono::seconds stats_report_interval_{std::chrono::minutes(10)};
};

} // namespace Core
} // namespace DeviceWatch

#endif // DEVICEWATCH_APPLICATION_H
