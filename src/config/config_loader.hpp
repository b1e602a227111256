#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일(config/promptgate.yaml) 과 규칙 파일(config/rules.yaml) 로더,
// 그리고 PROMPTGATE_* 환경변수 오버라이드.
//
// [설계 원칙]
// - All-or-nothing: 한 섹션이라도 실패하면 std::unexpected 를 반환하고
//   부분적으로 파싱된 설정을 반환하지 않는다.
// - 타입이 맞지 않는 값은 기본값으로 대체하지 않고 kParseFailure 로 거부한다.
// - security.level 은 필수다. 없거나 LOW/MEDIUM/HIGH 가 아니면 kInvalidLevel.
//   (탐지 임계값이 조용히 기본값으로 바뀌는 것을 막는다)
// - 값의 범위 검증은 하지 않는다. validate_security_config() 가 담당한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [환경변수]
// 라이브러리는 getenv 를 직접 호출하지 않는다. 조회 함수(EnvLookup)를
// 주입받으며 CLI 가 std::getenv 기반 조회 함수를 넘긴다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/security_config.hpp"
#include "detector/rule.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level     : "debug" | "info" | "warn" | "error"
//   sweep_interval: idle 세션 sweep 주기
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string           log_level{"info"};
    std::filesystem::path log_path{"logs/promptgate.log"};
    std::chrono::seconds  sweep_interval{60};
};

// ---------------------------------------------------------------------------
// AppConfig
//   rules                : 사용자 정의 규칙 (rules: 섹션)
//   include_default_rules: true 이면 내장 규칙 뒤에 사용자 규칙을 덧붙인다.
//                          false 이면 사용자 규칙만 사용한다.
// ---------------------------------------------------------------------------
struct AppConfig {
    GlobalConfig          global{};
    SecurityConfig        security{};
    std::vector<RuleSpec> rules{};
    bool                  include_default_rules{true};
};

class ConfigLoader {
public:
    // 환경변수 조회 함수. 없거나 빈 값이면 std::nullopt.
    using EnvLookup = std::function<std::optional<std::string>(std::string_view name)>;

    // load
    //   실패: kFileNotFound | kParseFailure | kInvalidLevel | kInvalidRule
    [[nodiscard]] static std::expected<AppConfig, ConfigError>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   YAML 문자열에서 직접 파싱한다. source 는 오류 메시지용 이름.
    [[nodiscard]] static std::expected<AppConfig, ConfigError>
    load_from_string(std::string_view yaml_text, std::string_view source = "<string>");

    // load_rules
    //   최상위 rules: 목록만 담은 파일을 읽는다. 빈 목록은 kEmptyRuleSet.
    [[nodiscard]] static std::expected<std::vector<RuleSpec>, ConfigError>
    load_rules(const std::filesystem::path& rules_path);

    // apply_env_overrides
    //   PROMPTGATE_SECURITY_LEVEL 이 잘못되면 kInvalidLevel.
    //   숫자/불리언/기간 형식 오류는 경고 로그 후 무시한다.
    [[nodiscard]] static std::expected<void, ConfigError>
    apply_env_overrides(AppConfig& config, const EnvLookup& lookup);

    // rule_specs
    //   include_default_rules 를 반영한 최종 규칙 목록.
    [[nodiscard]] static std::vector<RuleSpec> rule_specs(const AppConfig& config);

    // parse_duration
    //   "600", "600s", "10m", "1h" → 초. 형식 오류 또는 음수면 std::nullopt.
    [[nodiscard]] static std::optional<std::chrono::seconds> parse_duration(std::string_view text);
};
