#include "config/security_config.hpp"

#include <cctype>
#include <limits>

#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] std::string to_upper_ascii(std::string_view text) {
    std::string out(text);
    for (auto& ch : out) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return out;
}

[[nodiscard]] ConfigError non_positive(std::string_view field) {
    return ConfigError{
        ConfigErrorCode::kNonPositiveLimit,
        std::string(field) + " must be > 0",
        std::string(field),
    };
}

}  // namespace

std::string_view to_string(SecurityLevel level) noexcept {
    switch (level) {
        case SecurityLevel::kLow:    return "LOW";
        case SecurityLevel::kMedium: return "MEDIUM";
        case SecurityLevel::kHigh:   return "HIGH";
        default:                     return "UNKNOWN";
    }
}

std::optional<SecurityLevel> parse_security_level(std::string_view text) {
    const std::string upper = to_upper_ascii(text);
    if (upper == "LOW") {
        return SecurityLevel::kLow;
    }
    if (upper == "MEDIUM") {
        return SecurityLevel::kMedium;
    }
    if (upper == "HIGH") {
        return SecurityLevel::kHigh;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// validate_security_config
// ---------------------------------------------------------------------------
std::expected<void, ConfigError> validate_security_config(const SecurityConfig& config) {
    if (config.level != SecurityLevel::kLow && config.level != SecurityLevel::kMedium &&
        config.level != SecurityLevel::kHigh) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kInvalidLevel,
            "security level must be LOW, MEDIUM or HIGH",
            std::to_string(static_cast<int>(config.level)),
        });
    }
    if (config.max_input_length <= 0) {
        return std::unexpected(non_positive("max_input_length"));
    }
    if (config.hard_input_cap <= 0) {
        return std::unexpected(non_positive("hard_input_cap"));
    }
    if (config.rate_limit_per_minute <= 0) {
        return std::unexpected(non_positive("rate_limit_per_minute"));
    }
    if (config.rate_limit_per_minute > std::numeric_limits<std::uint32_t>::max()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kNonPositiveLimit,
            "rate_limit_per_minute out of range",
            std::to_string(config.rate_limit_per_minute),
        });
    }
    if (config.session_idle_ttl.count() <= 0) {
        return std::unexpected(non_positive("session_idle_ttl"));
    }

    for (const auto* list : {&config.blacklist, &config.whitelist}) {
        for (const auto& entry : *list) {
            if (entry.empty()) {
                return std::unexpected(ConfigError{
                    ConfigErrorCode::kMalformedListEntry,
                    "list entry must not be empty",
                    list == &config.blacklist ? "blacklist" : "whitelist",
                });
            }
        }
    }

    // idle TTL 이 윈도우보다 짧으면 sweep 이 rate limit 기록을 지울 수 있다
    if (config.session_idle_ttl < std::chrono::seconds{60}) {
        spdlog::warn("security_config: session_idle_ttl {}s is shorter than the 60s rate "
                     "limit window", config.session_idle_ttl.count());
    }
    if (!config.enable_injection_detection) {
        spdlog::warn("security_config: injection detection disabled by configuration");
    }
    return {};
}
