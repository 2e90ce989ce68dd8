// =============================================================================
// shared/src/Utils/ConfigVariableExpander.cpp
// =============================================================================

#include "Utils/ConfigVariableExpander.h"

#include <cctype>

namespace DeviceWatch {
namespace Utils {

namespace {
// open 위치의 "${" 에 짝이 맞는 '}' (기본값 안의 중첩 참조 포함)
size_t FindClosingBrace(const std::string& input, size_t open) {
    int nested = 0;
    for (size_t i = open + 2; i < input.size(); ++i) {
        if (input[i] == '$' && i + 1 < input.size() && input[i + 1] == '{') {
            ++nested;
            ++i;
        } else if (input[i] == '}') {
            if (nested == 0) return i;
            --nested;
        }
    }
    return std::string::npos;
}
} // namespace

std::string ConfigVariableExpander::expand(const std::string& input, ValueProvider provider) {
    if (input.empty() || !provider) return input;
    return expandAt(input, provider, 0);
}

std::string ConfigVariableExpander::expandAt(const std::string& input, const ValueProvider& provider, int depth) {
    std::string out;
    out.reserve(input.size());

    size_t pos = 0;
    while (pos < input.size()) {
        size_t open = input.find("${", pos);
        if (open == std::string::npos) {
            out.append(input, pos, std::string::npos);
            break;
        }
        out.append(input, pos, open - pos);

        size_t close = FindClosingBrace(input, open);
        if (close == std::string::npos) {
            // 닫히지 않은 참조
            out.append(input, open, std::string::npos);
            break;
        }

        const std::string token = input.substr(open, close - open + 1);
        std::string body = input.substr(open + 2, close - open - 2);
        std::string fallback;
        bool has_fallback = false;
        size_t sep = body.find(":-");
        if (sep != std::string::npos) {
            fallback = body.substr(sep + 2);
            body.resize(sep);
            has_fallback = true;
        }

        std::string value;
        if (IsValidName(body)) {
            value = provider(body);
            if (value.empty() && has_fallback) value = fallback;
        }

        if (value.empty()) {
            out += token;
        } else if (depth + 1 < kMaxDepth) {
            out += expandAt(value, provider, depth + 1);
        } else {
            out += value;
        }
        pos = close + 1;
    }
    return out;
}

bool ConfigVariableExpander::IsValidName(const std::string& name) {
    if (name.empty()) return false;
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
    }
    return true;
}

} // namespace Utils
} // namespace DeviceWatch
