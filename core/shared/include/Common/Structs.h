#ifndef DEVICEWATCH_COMMON_STRUCTS_H
#define DEVICEWATCH_COMMON_STRUCTS_H

/**
 * @file Structs.h
 * @brief DeviceWatch 핵심 구조체 정의
 */

#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "BasicTypes.h"
#include "Constants.h"
#include "Enums.h"

namespace DeviceWatch {
namespace Structs {

using namespace DeviceWatch::BasicTypes;
using namespace DeviceWatch::Enums;
using JsonType = nlohmann::json;

// =========================================================================
// 에러 정보
// =========================================================================

/**
 * @brief 실패한 작업의 에러 코드와 메시지
 */
struct ErrorInfo {
  ErrorCode code = ErrorCode::SUCCESS;
  std::string message = "";
  Timestamp occurred_at = std::chrono::system_clock::now();

  ErrorInfo() = default;

  ErrorInfo(ErrorCode error_code, const std::string &error_message)
      : code(error_code), message(error_message) {}

  bool IsSuccess() const { return code == ErrorCode::SUCCESS; }
  bool IsFailure() const { return code != ErrorCode::SUCCESS; }

  std::string GetSummary() const {
    if (IsSuccess())
      return "Success";
    return "[" + ErrorCodeToString(code) + "] " + message;
  }
};

/**
 * @brief 값 또는 ErrorInfo를 담는 결과 타입
 */
template <typename T> class OpResult {
public:
  OpResult(T value) : value_(std::move(value)) {}
  OpResult(ErrorInfo error) : error_(std::move(error)) {}

  static OpResult Failure(ErrorCode code, const std::string &message) {
    return OpResult(ErrorInfo(code, message));
  }

  bool IsSuccess() const { return value_.has_value(); }
  bool IsFailure() const { return !value_.has_value(); }
  explicit operator bool() const { return IsSuccess(); }

  const T &Value() const {
    if (!value_)
      throw std::logic_error("OpResult::Value() on failure: " +
                             error_.GetSummary());
    return *value_;
  }
  T &Value() {
    if (!value_)
      throw std::logic_error("OpResult::Value() on failure: " +
                             error_.GetSummary());
    return *value_;
  }

  const ErrorInfo &Error() const { return error_; }
  ErrorCode Code() const { return error_.code; }

private:
  std::optional<T> value_;
  ErrorInfo error_;
};

template <> class OpResult<void> {
public:
  OpResult() = default;
  OpResult(ErrorInfo error) : error_(std::move(error)) {}

  static OpResult Success() { return OpResult(); }
  static OpResult Failure(ErrorCode code, const std::string &message) {
    return OpResult(ErrorInfo(code, message));
  }

  bool IsSuccess() const { return error_.IsSuccess(); }
  bool IsFailure() const { return error_.IsFailure(); }
  explicit operator bool() const { return IsSuccess(); }

  const ErrorInfo &Error() const { return error_; }
  ErrorCode Code() const { return error_.code; }

private:
  ErrorInfo error_;
};

// =========================================================================
// 디바이스
// =========================================================================

/**
 * @brief 모니터링 대상 디바이스
 * @details DeviceRegistry가 소유하며 레코드 락을 잡은 상태에서만 변경된다.
 */
struct DeviceInfo {
  DeviceID id;
  std::string ip;
  std::string hostname;
  std::string os_type;
  DeviceStatus status = DeviceStatus::UNKNOWN;
  bool monitoring_enabled = true;
  uint32_t connection_errors = 0;
  std::optional<Timestamp> last_update;
  JsonType hardware_info = JsonType::object();
  std::map<std::string, double> services; // 서비스별 CPU 사용률

  JsonType toJson() const {
    JsonType j;
    j["id"] = id;
    j["ip"] = ip;
    j["hostname"] = hostname;
    j["os_type"] = os_type;
    j["status"] = DeviceStatusToString(status);
    j["monitoring_enabled"] = monitoring_enabled;
    j["connection_errors"] = connection_errors;
    j["last_update"] =
        last_update ? JsonType(TimestampToIsoString(*last_update)) : JsonType();
    j["hardware_info"] = hardware_info;
    j["services"] = services;
    return j;
  }
};

struct MetricSample {
  double value = 0.0;
  Timestamp timestamp;

  MetricSample() = default;
  MetricSample(double v, Timestamp ts) : value(v), timestamp(ts) {}
};

// =========================================================================
// 알람
// =========================================================================

struct AlertThreshold {
  std::string metric;
  double warning_level = 0.0;
  double critical_level = 0.0;
  int duration_seconds = Constants::DEFAULT_THRESHOLD_DURATION_SECONDS;
  bool enabled = true;

  JsonType toJson() const {
    return JsonType{{"metric", metric},
                    {"warning_level", warning_level},
                    {"critical_level", critical_level},
                    {"duration_seconds", duration_seconds},
                    {"enabled", enabled}};
  }
};

/**
 * @brief (device, metric) 당 하나만 존재하는 알람 레코드
 */
struct Alert {
  AlertID id;
  DeviceID device_id;
  std::string metric;
  AlertLevel level = AlertLevel::WARNING;
  double value = 0.0;
  double threshold = 0.0;
  Timestamp timestamp;
  bool acknowledged = false;
  bool resolved = false;
  std::string message;

  static AlertID MakeId(const DeviceID &device_id, const std::string &metric) {
    return device_id + "_" + metric;
  }

  JsonType toJson() const {
    return JsonType{{"id", id},
                    {"device_id", device_id},
                    {"metric", metric},
                    {"level", AlertLevelToString(level)},
                    {"value", value},
                    {"threshold", threshold},
                    {"timestamp", TimestampToIsoString(timestamp)},
                    {"acknowledged", acknowledged},
                    {"resolved", resolved},
                    {"message", message}};
  }
};

// =========================================================================
// 메트릭 스냅샷 (provider payload 파싱 결과)
// =========================================================================

struct MetricSnapshot {
  double cpu = 0.0;
  double memory = 0.0;
  double disk = 0.0;
  std::optional<int64_t> network_bytes_sent;
  std::optional<int64_t> network_bytes_recv;
  std::vector<double> load_avg;
  std::optional<int64_t> processes;
  std::map<std::string, double> top_services;
  std::map<std::string, double> extra; // 그 외 숫자 필드

  /**
   * @brief 히스토리/알람 평가 대상 (metric, value) 목록
   * @details cpu, memory, disk 순서가 먼저 오고 나머지가 뒤따른다.
   */
  std::vector<std::pair<std::string, double>> GetMetricValues() const {
    std::vector<std::pair<std::string, double>> values;
    values.emplace_back("cpu", cpu);
    values.emplace_back("memory", memory);
    values.emplace_back("disk", disk);
    if (network_bytes_sent)
      values.emplace_back("network_bytes_sent",
                          static_cast<double>(*network_bytes_sent));
    if (network_bytes_recv)
      values.emplace_back("network_bytes_recv",
                          static_cast<double>(*network_bytes_recv));
    if (!load_avg.empty())
      values.emplace_back("load_avg_1", load_avg.front());
    if (processes)
      values.emplace_back("processes", static_cast<double>(*processes));
    for (const auto &kv : extra)
      values.emplace_back(kv.first, kv.second);
    return values;
  }

  /**
   * @brief provider JSON을 파싱한다.
   * @return cpu/memory/disk 누락 또는 숫자가 아니면 DATA_FORMAT_ERROR.
   *         NaN/Inf 값, int64 범위를 벗어난 카운터도 DATA_FORMAT_ERROR.
   */
  static OpResult<MetricSnapshot> FromJson(const JsonType &payload) {
    if (!payload.is_object()) {
      return OpResult<MetricSnapshot>::Failure(ErrorCode::DATA_FORMAT_ERROR,
                                               "payload is not an object");
    }

    MetricSnapshot snapshot;
    const std::pair<const char *, double *> required[] = {
        {"cpu", &snapshot.cpu},
        {"memory", &snapshot.memory},
        {"disk", &snapshot.disk}};
    for (const auto &field : required) {
      auto it = payload.find(field.first);
      if (it == payload.end() || !it->is_number()) {
        return OpResult<MetricSnapshot>::Failure(
            ErrorCode::DATA_FORMAT_ERROR,
            std::string("missing or non-numeric field '") + field.first + "'");
      }
      if (!ReadFinite(*it, *field.second)) {
        return NonFinite(field.first);
      }
    }

    for (auto it = payload.begin(); it != payload.end(); ++it) {
      const std::string &key = it.key();
      const JsonType &value = it.value();

      if (key == "cpu" || key == "memory" || key == "disk") {
        continue;
      } else if ((key == "network_bytes_sent" || key == "network_bytes_recv" ||
                  key == "processes") &&
                 value.is_number()) {
        int64_t counter = 0;
        if (!ReadCounter(value, counter)) {
          return OpResult<MetricSnapshot>::Failure(
              ErrorCode::DATA_FORMAT_ERROR,
              "counter field '" + key + "' is not a finite int64 value");
        }
        if (key == "network_bytes_sent")
          snapshot.network_bytes_sent = counter;
        else if (key == "network_bytes_recv")
          snapshot.network_bytes_recv = counter;
        else
          snapshot.processes = counter;
      } else if (key == "load_avg" && value.is_array()) {
        for (const auto &v : value) {
          if (!v.is_number())
            continue;
          double load = 0.0;
          if (!ReadFinite(v, load))
            return NonFinite(key);
          snapshot.load_avg.push_back(load);
        }
      } else if (key == "top_services" && value.is_object()) {
        // 서비스 맵은 알람 평가 대상이 아니므로 비정상 값만 건너뛴다
        for (auto svc = value.begin(); svc != value.end(); ++svc) {
          double cpu_share = 0.0;
          if (svc.value().is_number() && ReadFinite(svc.value(), cpu_share))
            snapshot.top_services[svc.key()] = cpu_share;
        }
      } else if (value.is_number()) {
        double extra_value = 0.0;
        if (!ReadFinite(value, extra_value))
          return NonFinite(key);
        snapshot.extra[key] = extra_value;
      }
    }
    return snapshot;
  }

private:
  static bool ReadFinite(const JsonType &value, double &out) {
    out = value.get<double>();
    return std::isfinite(out);
  }

  static bool ReadCounter(const JsonType &value, int64_t &out) {
    if (value.is_number_unsigned()) {
      uint64_t u = value.get<uint64_t>();
      if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        return false;
      out = static_cast<int64_t>(u);
      return true;
    }
    if (value.is_number_integer()) {
      out = value.get<int64_t>();
      return true;
    }
    // 실수 표기 카운터 (예: 1.5e9) 는 범위 안일 때만 정수로 자른다
    double d = value.get<double>();
    if (!std::isfinite(d) ||
        d < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
        d >= static_cast<double>(std::numeric_limits<int64_t>::max()))
      return false;
    out = static_cast<int64_t>(d);
    return true;
  }

  static OpResult<MetricSnapshot> NonFinite(const std::string &field) {
    return OpResult<MetricSnapshot>::Failure(
        ErrorCode::DATA_FORMAT_ERROR,
        "non-finite value in field '" + field + "'");
  }
};

} // namespace Structs
} // namespace DeviceWatch

#endif // DEVICEWATCH_COMMON_STRUCTS_H
