// ---------------------------------------------------------------------------
// config_loader.cpp
//
// [YAML 스키마]
//   global:
//     log_level: info
//     log_path: logs/promptgate.log
//     sweep_interval: 60s
//   security:
//     level: MEDIUM                (필수)
//     max_input_length: 2000
//     hard_input_cap: 65536
//     rate_limit_per_minute: 10
//     session_idle_ttl: 10m
//     enable_sanitization: true
//     enable_injection_detection: true
//     enable_content_moderation: true
//     blacklist: [ ... ]
//     whitelist: [ ... ]
//   include_default_rules: true
//   rules:
//     - id: custom-1
//       category: role-manipulation
//       level: HIGH
//       pattern: "..."
//       description: "..."
//
// 필드가 없으면 SecurityConfig / GlobalConfig 구조체 기본값을 적용한다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include "detector/rule_set.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

[[nodiscard]] std::string to_lower_ascii(std::string_view text) {
    std::string out(text);
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

[[nodiscard]] std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

[[nodiscard]] std::optional<std::int64_t> parse_int64(std::string_view text) noexcept {
    text = trim(text);
    std::int64_t value{0};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] std::optional<bool> parse_bool(std::string_view text) {
    const std::string lower = to_lower_ascii(trim(text));
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
        return false;
    }
    return std::nullopt;
}

[[nodiscard]] ConfigError parse_failure(std::string message, std::string context) {
    return ConfigError{ConfigErrorCode::kParseFailure, std::move(message), std::move(context)};
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 스칼라 읽기. 노드가 없으면 fallback, 타입 불일치는 예외.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] T read_scalar(const YAML::Node& node, const T& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<T>();
}

[[nodiscard]] std::expected<std::chrono::seconds, ConfigError>
read_duration(const YAML::Node& node, std::chrono::seconds fallback, std::string_view field) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    const auto raw    = node.as<std::string>();
    const auto parsed = ConfigLoader::parse_duration(raw);
    if (!parsed) {
        return std::unexpected(parse_failure(
            fmt::format("invalid duration '{}' (expected e.g. 600s, 10m, 1h)", raw),
            std::string(field)));
    }
    return *parsed;
}

[[nodiscard]] std::expected<std::vector<std::string>, ConfigError>
read_string_list(const YAML::Node& node, std::string_view field) {
    std::vector<std::string> result;
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsSequence()) {
        return std::unexpected(parse_failure(
            fmt::format("'{}' must be a sequence", field), std::string(field)));
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return std::unexpected(ConfigError{
                ConfigErrorCode::kMalformedListEntry,
                fmt::format("'{}' entries must be strings", field),
                std::string(field),
            });
        }
        result.push_back(item.as<std::string>());
    }
    return result;
}

// ---------------------------------------------------------------------------
// 섹션 파서
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<GlobalConfig, ConfigError> parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        return std::unexpected(parse_failure("'global' must be a map", "global"));
    }

    cfg.log_level = read_scalar<std::string>(node["log_level"], cfg.log_level);
    cfg.log_path  = read_scalar<std::string>(node["log_path"], cfg.log_path.string());

    auto interval = read_duration(node["sweep_interval"], cfg.sweep_interval, "sweep_interval");
    if (!interval) {
        return std::unexpected(interval.error());
    }
    if (interval->count() <= 0) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kNonPositiveLimit, "sweep_interval must be > 0", "sweep_interval"});
    }
    cfg.sweep_interval = *interval;
    return cfg;
}

[[nodiscard]] std::expected<SecurityConfig, ConfigError> parse_security(const YAML::Node& node) {
    SecurityConfig cfg{};
    if (!node || !node.IsMap()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kInvalidLevel, "missing 'security' section (security.level is required)",
            "security"});
    }

    const YAML::Node level_node = node["level"];
    if (!level_node || !level_node.IsScalar()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kInvalidLevel, "security.level is required", "security.level"});
    }
    const auto level_raw = level_node.as<std::string>();
    const auto level     = parse_security_level(level_raw);
    if (!level) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kInvalidLevel,
            fmt::format("unknown security level '{}' (expected LOW, MEDIUM or HIGH)", level_raw),
            "security.level"});
    }
    cfg.level = *level;

    cfg.max_input_length      = read_scalar<std::int64_t>(node["max_input_length"], cfg.max_input_length);
    cfg.hard_input_cap        = read_scalar<std::int64_t>(node["hard_input_cap"], cfg.hard_input_cap);
    cfg.rate_limit_per_minute = read_scalar<std::int64_t>(node["rate_limit_per_minute"],
                                                          cfg.rate_limit_per_minute);

    auto ttl = read_duration(node["session_idle_ttl"], cfg.session_idle_ttl, "session_idle_ttl");
    if (!ttl) {
        return std::unexpected(ttl.error());
    }
    cfg.session_idle_ttl = *ttl;

    cfg.enable_sanitization = read_scalar<bool>(node["enable_sanitization"], cfg.enable_sanitization);
    cfg.enable_injection_detection =
        read_scalar<bool>(node["enable_injection_detection"], cfg.enable_injection_detection);
    cfg.enable_content_moderation =
        read_scalar<bool>(node["enable_content_moderation"], cfg.enable_content_moderation);

    auto blacklist = read_string_list(node["blacklist"], "blacklist");
    if (!blacklist) {
        return std::unexpected(blacklist.error());
    }
    cfg.blacklist = std::move(*blacklist);

    auto whitelist = read_string_list(node["whitelist"], "whitelist");
    if (!whitelist) {
        return std::unexpected(whitelist.error());
    }
    cfg.whitelist = std::move(*whitelist);

    return cfg;
}

[[nodiscard]] ConfigError invalid_rule(std::string message, std::string context) {
    return ConfigError{ConfigErrorCode::kInvalidRule, std::move(message), std::move(context)};
}

[[nodiscard]] std::expected<std::vector<RuleSpec>, ConfigError> parse_rules(const YAML::Node& node) {
    std::vector<RuleSpec> rules;
    if (!node || node.IsNull()) {
        return rules;
    }
    if (!node.IsSequence()) {
        return std::unexpected(parse_failure("'rules' must be a sequence", "rules"));
    }

    rules.reserve(node.size());
    std::size_t index = 0;
    for (const auto& item : node) {
        const std::string where = fmt::format("rules[{}]", index++);
        if (!item.IsMap()) {
            return std::unexpected(invalid_rule("rule must be a map", where));
        }

        RuleSpec spec{};
        spec.id          = read_scalar<std::string>(item["id"], "");
        spec.pattern     = read_scalar<std::string>(item["pattern"], "");
        spec.description = read_scalar<std::string>(item["description"], "");
        if (spec.id.empty()) {
            return std::unexpected(invalid_rule("rule id is required", where));
        }
        if (spec.pattern.empty()) {
            return std::unexpected(invalid_rule("rule pattern is required", spec.id));
        }

        const auto category_raw = read_scalar<std::string>(item["category"], "");
        const auto category     = parse_threat_category(category_raw);
        if (!category) {
            return std::unexpected(invalid_rule(
                fmt::format("unknown category '{}'", category_raw), spec.id));
        }
        spec.category = *category;

        if (item["level"]) {
            const auto level_raw = item["level"].as<std::string>();
            const auto level     = parse_threat_level(level_raw);
            if (!level || *level == ThreatLevel::kSafe) {
                return std::unexpected(invalid_rule(
                    fmt::format("invalid rule level '{}'", level_raw), spec.id));
            }
            spec.level = *level;
        }

        rules.push_back(std::move(spec));
    }
    return rules;
}

// ---------------------------------------------------------------------------
// 파일 → YAML 루트 노드
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<YAML::Node, ConfigError> load_yaml_file(const std::filesystem::path& path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(path, ec);
    if (ec) {
        const std::string err = fmt::format("config_loader: cannot resolve config path '{}': {}",
                                            path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(ConfigError{ConfigErrorCode::kFileNotFound, err, path.string()});
    }

    spdlog::info("config_loader: loading '{}'", canonical_path.string());

    try {
        return YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err =
            fmt::format("config_loader: cannot open file '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(ConfigError{ConfigErrorCode::kFileNotFound, err, path.string()});
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(parse_failure(err, path.string()));
    } catch (const YAML::Exception& e) {
        const std::string err =
            fmt::format("config_loader: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(parse_failure(err, path.string()));
    }
}

// 섹션 파서 호출 + yaml-cpp 예외를 kParseFailure 로 변환
template <typename Fn>
[[nodiscard]] auto parse_section(std::string_view section, Fn&& fn) -> decltype(fn()) {
    try {
        auto result = fn();
        if (!result) {
            spdlog::error("config_loader: error in '{}' section: {} ({})", section,
                          result.error().message, result.error().context);
        }
        return result;
    } catch (const YAML::Exception& e) {
        const std::string err =
            fmt::format("config_loader: error parsing '{}' section: {}", section, e.what());
        spdlog::error("{}", err);
        return std::unexpected(parse_failure(err, std::string(section)));
    }
}

[[nodiscard]] std::expected<AppConfig, ConfigError> parse_root(const YAML::Node& root,
                                                               std::string_view  source) {
    if (!root || !root.IsMap()) {
        const std::string err =
            fmt::format("config_loader: '{}' is not a valid YAML map (top-level)", source);
        spdlog::error("{}", err);
        return std::unexpected(parse_failure(err, std::string(source)));
    }

    AppConfig cfg{};

    auto global = parse_section("global", [&] { return parse_global(root["global"]); });
    if (!global) {
        return std::unexpected(global.error());
    }
    cfg.global = std::move(*global);

    auto security = parse_section("security", [&] { return parse_security(root["security"]); });
    if (!security) {
        return std::unexpected(security.error());
    }
    cfg.security = std::move(*security);

    auto rules = parse_section("rules", [&] { return parse_rules(root["rules"]); });
    if (!rules) {
        return std::unexpected(rules.error());
    }
    cfg.rules = std::move(*rules);

    auto include_defaults = parse_section("include_default_rules", [&]() -> std::expected<bool, ConfigError> {
        return read_scalar<bool>(root["include_default_rules"], true);
    });
    if (!include_defaults) {
        return std::unexpected(include_defaults.error());
    }
    cfg.include_default_rules = *include_defaults;

    if (!cfg.include_default_rules && cfg.rules.empty()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kEmptyRuleSet,
            "include_default_rules is false but no rules are defined",
            "rules"});
    }

    spdlog::info("config_loader: loaded '{}' (level={}, custom_rules={}, blacklist={}, whitelist={})",
                 source, to_string(cfg.security.level), cfg.rules.size(),
                 cfg.security.blacklist.size(), cfg.security.whitelist.size());
    return cfg;
}

// ---------------------------------------------------------------------------
// 환경변수 헬퍼
// ---------------------------------------------------------------------------
void override_int64(const ConfigLoader::EnvLookup& lookup, std::string_view name,
                    std::int64_t& target) {
    const auto raw = lookup(name);
    if (!raw) {
        return;
    }
    const auto parsed = parse_int64(*raw);
    if (!parsed) {
        spdlog::warn("env {}: invalid value '{}', keeping {}", name, *raw, target);
        return;
    }
    target = *parsed;
}

void override_bool(const ConfigLoader::EnvLookup& lookup, std::string_view name, bool& target) {
    const auto raw = lookup(name);
    if (!raw) {
        return;
    }
    const auto parsed = parse_bool(*raw);
    if (!parsed) {
        spdlog::warn("env {}: invalid boolean '{}', keeping {}", name, *raw, target);
        return;
    }
    target = *parsed;
}

// "a, b,,c" → {"a", "b", "c"}
void append_csv(const ConfigLoader::EnvLookup& lookup, std::string_view name,
                std::vector<std::string>& target) {
    const auto raw = lookup(name);
    if (!raw) {
        return;
    }
    std::string_view rest = *raw;
    while (!rest.empty()) {
        const auto comma = rest.find(',');
        const auto item  = trim(rest.substr(0, comma));
        if (!item.empty() &&
            std::find(target.begin(), target.end(), item) == target.end()) {
            target.emplace_back(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<AppConfig, ConfigError> ConfigLoader::load(const std::filesystem::path& config_path) {
    auto root = load_yaml_file(config_path);
    if (!root) {
        return std::unexpected(root.error());
    }
    return parse_root(*root, config_path.string());
}

std::expected<AppConfig, ConfigError> ConfigLoader::load_from_string(std::string_view yaml_text,
                                                                     std::string_view source) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml_text));
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format("config_loader: YAML parse error in '{}' at line {}, col {}: {}",
                                            source, e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(parse_failure(err, std::string(source)));
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("config_loader: YAML error in '{}': {}", source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(parse_failure(err, std::string(source)));
    }
    return parse_root(root, source);
}

// ---------------------------------------------------------------------------
// ConfigLoader::load_rules
// ---------------------------------------------------------------------------
std::expected<std::vector<RuleSpec>, ConfigError>
ConfigLoader::load_rules(const std::filesystem::path& rules_path) {
    auto root = load_yaml_file(rules_path);
    if (!root) {
        return std::unexpected(root.error());
    }
    if (!root->IsMap()) {
        return std::unexpected(parse_failure(
            fmt::format("config_loader: '{}' is not a valid YAML map (top-level)", rules_path.string()),
            rules_path.string()));
    }

    auto rules = parse_section("rules", [&] { return parse_rules((*root)["rules"]); });
    if (!rules) {
        return std::unexpected(rules.error());
    }
    if (rules->empty()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kEmptyRuleSet, "rules file defines no rules", rules_path.string()});
    }

    spdlog::info("config_loader: loaded {} rules from '{}'", rules->size(), rules_path.string());
    return rules;
}

// ---------------------------------------------------------------------------
// ConfigLoader::apply_env_overrides
// ---------------------------------------------------------------------------
std::expected<void, ConfigError> ConfigLoader::apply_env_overrides(AppConfig&       config,
                                                                   const EnvLookup& lookup) {
    if (!lookup) {
        return {};
    }

    if (const auto raw = lookup("PROMPTGATE_SECURITY_LEVEL")) {
        const auto level = parse_security_level(trim(*raw));
        if (!level) {
            spdlog::error("env PROMPTGATE_SECURITY_LEVEL: unknown level '{}'", *raw);
            return std::unexpected(ConfigError{
                ConfigErrorCode::kInvalidLevel,
                fmt::format("unknown security level '{}' (expected LOW, MEDIUM or HIGH)", *raw),
                "PROMPTGATE_SECURITY_LEVEL"});
        }
        config.security.level = *level;
    }

    override_int64(lookup, "PROMPTGATE_MAX_INPUT_LENGTH", config.security.max_input_length);
    override_int64(lookup, "PROMPTGATE_HARD_INPUT_CAP", config.security.hard_input_cap);
    override_int64(lookup, "PROMPTGATE_RATE_LIMIT_PER_MINUTE", config.security.rate_limit_per_minute);

    if (const auto raw = lookup("PROMPTGATE_SESSION_IDLE_TTL")) {
        if (const auto ttl = parse_duration(*raw)) {
            config.security.session_idle_ttl = *ttl;
        } else {
            spdlog::warn("env PROMPTGATE_SESSION_IDLE_TTL: invalid duration '{}', keeping {}s",
                         *raw, config.security.session_idle_ttl.count());
        }
    }

    override_bool(lookup, "PROMPTGATE_ENABLE_SANITIZATION", config.security.enable_sanitization);
    override_bool(lookup, "PROMPTGATE_ENABLE_INJECTION_DETECTION",
                  config.security.enable_injection_detection);
    override_bool(lookup, "PROMPTGATE_ENABLE_CONTENT_MODERATION",
                  config.security.enable_content_moderation);

    append_csv(lookup, "PROMPTGATE_BLACKLIST", config.security.blacklist);
    append_csv(lookup, "PROMPTGATE_WHITELIST", config.security.whitelist);

    if (const auto raw = lookup("PROMPTGATE_LOG_LEVEL")) {
        config.global.log_level = to_lower_ascii(trim(*raw));
    }
    if (const auto raw = lookup("PROMPTGATE_LOG_PATH")) {
        config.global.log_path = *raw;
    }
    return {};
}

std::vector<RuleSpec> ConfigLoader::rule_specs(const AppConfig& config) {
    std::vector<RuleSpec> specs;
    if (config.include_default_rules) {
        specs = RuleSet::default_specs();
    }
    specs.insert(specs.end(), config.rules.begin(), config.rules.end());
    return specs;
}

// ---------------------------------------------------------------------------
// ConfigLoader::parse_duration
// ---------------------------------------------------------------------------
std::optional<std::chrono::seconds> ConfigLoader::parse_duration(std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        return std::nullopt;
    }

    std::int64_t multiplier = 1;
    switch (text.back()) {
        case 's': multiplier = 1;    text.remove_suffix(1); break;
        case 'm': multiplier = 60;   text.remove_suffix(1); break;
        case 'h': multiplier = 3600; text.remove_suffix(1); break;
        default: break;
    }

    const auto value = parse_int64(text);
    if (!value || *value < 0) {
        return std::nullopt;
    }
    return std::chrono::seconds{*value * multiplier};
}
