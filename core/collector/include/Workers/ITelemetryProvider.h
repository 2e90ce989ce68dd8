// =============================================================================
// collector/include/Workers/ITelemetryProvider.h
// 원격 호스트 연결 / 메트릭 수집 경계 (전송 계층은 구현체가 담당)
// =============================================================================

#ifndef WORKERS_ITELEMETRY_PROVIDER_H
#define WORKERS_ITELEMETRY_PROVIDER_H

#include <string>

#include <nlohmann/json.hpp>

#include "Common/Structs.h"

namespace DeviceWatch::Workers {

class ITelemetryProvider {
public:
    virtual ~ITelemetryProvider() = default;

    /**
     * @brief 디바이스 연결 확인
     * @return true 연결됨, false 연결 실패, 에러는 CONNECTION_FAILED 등
     * @note 상태(status, connection_errors) 갱신은 호출자(스케줄러)가 한다.
     */
    virtual Structs::OpResult<bool> connect(Structs::DeviceInfo& device) = 0;

    /**
     * @brief 메트릭 페이로드 수집
     * @details cpu / memory / disk 숫자 필드가 필수. 파싱은 호출자가 한다.
     */
    virtual Structs::OpResult<nlohmann::json> fetchMetrics(const Structs::DeviceInfo& device) = 0;

    virtual std::string name() const = 0;
};

} // namespace DeviceWatch::Workers

#endif // WORKERS_ITELEMETRY_PROVIDER_H
