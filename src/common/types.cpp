// ---------------------------------------------------------------------------
// types.cpp
//
// ThreatLevel / ThreatCategory 문자열 변환.
// 문자열 형식은 감사 로그와 YAML 규칙 파일이 공유하므로 변경 시 주의.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace {

// ASCII 대소문자 무관 비교 (설정 키워드 전용, 사용자 텍스트에는 사용 금지)
bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

}  // namespace

std::string_view to_string(ThreatLevel level) noexcept {
    switch (level) {
        case ThreatLevel::kSafe:     return "SAFE";
        case ThreatLevel::kLow:      return "LOW";
        case ThreatLevel::kMedium:   return "MEDIUM";
        case ThreatLevel::kHigh:     return "HIGH";
        case ThreatLevel::kCritical: return "CRITICAL";
        default:                     return "UNKNOWN";
    }
}

std::string_view to_string(ThreatCategory category) noexcept {
    switch (category) {
        case ThreatCategory::kInstructionOverride: return "instruction-override";
        case ThreatCategory::kRoleManipulation:    return "role-manipulation";
        case ThreatCategory::kCommandInjection:    return "command-injection";
        case ThreatCategory::kPromptLeak:          return "prompt-leak";
        case ThreatCategory::kEncodingBypass:      return "encoding-bypass";
        default:                                   return "unknown";
    }
}

std::string_view to_string(ValidationErrorCode code) noexcept {
    switch (code) {
        case ValidationErrorCode::kEmptyInput:      return "empty_input";
        case ValidationErrorCode::kInputTooLarge:   return "input_too_large";
        case ValidationErrorCode::kInvalidEncoding: return "invalid_encoding";
        case ValidationErrorCode::kEmptySessionId:  return "empty_session_id";
        default:                                    return "unknown";
    }
}

std::optional<ThreatLevel> parse_threat_level(std::string_view text) {
    constexpr ThreatLevel kAll[] = {
        ThreatLevel::kSafe, ThreatLevel::kLow, ThreatLevel::kMedium,
        ThreatLevel::kHigh, ThreatLevel::kCritical,
    };
    for (const auto level : kAll) {
        if (iequals(text, to_string(level))) {
            return level;
        }
    }
    return std::nullopt;
}

std::optional<ThreatCategory> parse_threat_category(std::string_view text) {
    constexpr ThreatCategory kAll[] = {
        ThreatCategory::kInstructionOverride, ThreatCategory::kRoleManipulation,
        ThreatCategory::kCommandInjection,    ThreatCategory::kPromptLeak,
        ThreatCategory::kEncodingBypass,
    };
    for (const auto category : kAll) {
        if (iequals(text, to_string(category))) {
            return category;
        }
    }
    return std::nullopt;
}
