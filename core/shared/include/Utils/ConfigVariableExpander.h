// =============================================================================
// shared/include/Utils/ConfigVariableExpander.h
// 설정값 안의 ${VAR} / ${VAR:-default} 참조 치환
// =============================================================================

#ifndef DEVICEWATCH_UTILS_CONFIG_VARIABLE_EXPANDER_H
#define DEVICEWATCH_UTILS_CONFIG_VARIABLE_EXPANDER_H

#include <cstddef>
#include <functional>
#include <string>

namespace DeviceWatch {
namespace Utils {

/**
 * @brief ${NAME} 참조를 provider 값으로 바꾼다
 * @details
 * - NAME은 영문/숫자/'_'만 허용. 그 외 형태는 원문 그대로 둔다.
 * - provider가 빈 문자열을 주면 ":-" 뒤 기본값을 쓰고, 기본값도 없으면
 *   참조를 원문 그대로 남긴다.
 * - 치환된 값 안의 참조도 kMaxDepth 단계까지 다시 치환한다.
 */
class ConfigVariableExpander {
public:
    using ValueProvider = std::function<std::string(const std::string&)>;

    static constexpr int kMaxDepth = 8;

    static std::string expand(const std::string& input, ValueProvider provider);

private:
    static std::string expandAt(const std::string& input, const ValueProvider& provider, int depth);
    static bool IsValidName(const std::string& name);
};

} // namespace Utils
} // namespace DeviceWatch

#endif // DEVICEWATCH_UTILS_CONFIG_VARIABLE_EXPANDER_H
