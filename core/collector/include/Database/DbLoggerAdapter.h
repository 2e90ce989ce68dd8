// =============================================================================
// collector/include/Database/DbLoggerAdapter.h - DbLib 로그를 LogManager로 연결
// =============================================================================

#ifndef DATABASE_DB_LOGGER_ADAPTER_H
#define DATABASE_DB_LOGGER_ADAPTER_H

#include "DatabaseTypes.hpp"
#include "Logging/LogManager.h"

namespace DeviceWatch {
namespace Database {

class DbLoggerAdapter : public DbLib::IDbLogger {
public:
    void log(const std::string& category, int level, const std::string& message) override {
        LogLevel mapped = LogLevel::INFO;
        switch (level) {
            case 0: mapped = LogLevel::DEBUG; break;
            case 1: mapped = LogLevel::INFO; break;
            case 2: mapped = LogLevel::WARN; break;
            default: mapped = LogLevel::LOG_ERROR; break;
        }
        LogManager::getInstance().log(category, mapped, message);
    }
};

} // namespace Database
} // namespace DeviceWatch

#endif // DATABASE_DB_LOGGER_ADAPTER_H
