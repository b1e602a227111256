// ---------------------------------------------------------------------------
// main.cpp
//
// promptgate CLI.
//
// stdin 한 줄 = 메시지 하나. 형식: "<session_id>\t<text>"
// 탭이 없으면 세션 ID 는 "default".
// stdout 한 줄 = 판정 JSON 하나. 진단/감사 로그는 stderr 와 로그 파일로 간다.
//
// [설정 우선순위]
//   argv[1] > PROMPTGATE_CONFIG > config/promptgate.yaml
//   그 위에 PROMPTGATE_* 환경변수 오버라이드.
//
// [시그널]
//   SIGHUP → 설정/규칙 재로드. 실패 시 기존 설정 유지.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"
#include "detector/rule_set.hpp"
#include "logger/json_format.hpp"
#include "logger/structured_logger.hpp"
#include "moderator/session_sweeper.hpp"
#include "pipeline/security_pipeline.hpp"
#include "sanitizer/input_sanitizer.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <expected>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

constexpr const char* kDefaultConfigPath = "config/promptgate.yaml";
constexpr const char* kDefaultSessionId  = "default";

std::optional<std::string> getenv_lookup(std::string_view name) {
    const char* val = std::getenv(std::string(name).c_str());  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return std::string(val);
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// load_app_config
//   기본 경로의 파일이 없으면 내장 기본값으로 동작한다.
//   명시적으로 지정한 경로가 없으면 오류.
// ---------------------------------------------------------------------------
std::expected<AppConfig, ConfigError> load_app_config(const std::filesystem::path& path,
                                                      bool                         explicit_path) {
    AppConfig config{};
    if (!explicit_path && !std::filesystem::exists(path)) {
        spdlog::warn("config: {} not found, using built-in defaults", path.string());
    } else {
        auto loaded = ConfigLoader::load(path);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        config = std::move(*loaded);
    }

    if (auto env = ConfigLoader::apply_env_overrides(config, getenv_lookup); !env) {
        return std::unexpected(env.error());
    }
    return config;
}

std::expected<std::shared_ptr<const RuleSet>, ConfigError> build_rules(const AppConfig& config) {
    if (config.include_default_rules && config.rules.empty()) {
        return RuleSet::defaults();
    }
    return RuleSet::build(ConfigLoader::rule_specs(config));
}

void report_config_error(const ConfigError& err) {
    spdlog::critical("config error: {} ({})", err.message, err.context);
}

// ---------------------------------------------------------------------------
// format_result / format_error
//   stdout 판정 JSON. 원문은 출력하지 않고 ALLOW 일 때만 정제된 텍스트를 낸다.
// ---------------------------------------------------------------------------
std::string format_result(std::string_view session_id, const PipelineResult& result) {
    std::ostringstream json;
    json << R"({"session_id":")" << escape_json_string(session_id)
         << R"(","action":")" << to_string(result.action)
         << R"(","reason":")" << escape_json_string(result.reason) << '"';

    if (result.detection) {
        json << R"(,"threat_level":")" << to_string(result.detection->level) << '"';

        std::vector<std::string> categories;
        for (const auto category : result.detection->categories()) {
            categories.emplace_back(to_string(category));
        }
        json << R"(,"categories":)" << format_json_string_array(categories);

        if (result.detection->decoded_from) {
            json << R"(,"decoded_from":")"
                 << to_string(result.detection->decoded_from->encoding) << '"';
        }
    }
    if (result.retry_after) {
        json << R"(,"retry_after_ms":)" << result.retry_after->count();
    }
    if (result.whitelisted) {
        json << R"(,"whitelisted":true)";
    }
    if (result.truncated) {
        json << R"(,"truncated":true)";
    }
    if (result.sanitized_text) {
        json << R"(,"sanitized_text":")" << escape_json_string(*result.sanitized_text) << '"';
    }
    json << '}';
    return json.str();
}

std::string format_error(std::string_view session_id, const ValidationError& err) {
    std::ostringstream json;
    json << R"({"session_id":")" << escape_json_string(session_id)
         << R"(","error":")" << to_string(err.code)
         << R"(","message":")" << escape_json_string(err.message) << R"("})";
    return json.str();
}

void audit(StructuredLogger&     logger,
           std::string_view      session_id,
           std::string_view      text,
           const PipelineResult& result) {
    const auto now        = std::chrono::system_clock::now();
    const bool suspicious = InputSanitizer::has_suspicious_encoding(text);

    if (result.allowed()) {
        logger.log_decision(DecisionLog{
            .session_id          = std::string(session_id),
            .input_bytes         = text.size(),
            .threat_level        = std::string(result.detection ? to_string(result.detection->level)
                                                                : to_string(ThreatLevel::kSafe)),
            .whitelisted         = result.whitelisted,
            .truncated           = result.truncated,
            .suspicious_encoding = suspicious,
            .timestamp           = now,
        });
        return;
    }

    BlockLog entry{};
    entry.session_id          = std::string(session_id);
    entry.reason              = result.reason;
    entry.suspicious_encoding = suspicious;
    entry.timestamp           = now;
    if (result.detection) {
        entry.threat_level = std::string(to_string(result.detection->level));
        for (const auto category : result.detection->categories()) {
            entry.categories.emplace_back(to_string(category));
        }
        for (const auto& m : result.detection->matches) {
            entry.rule_ids.push_back(m.rule_id);
        }
    }
    if (result.retry_after) {
        entry.retry_after_ms = result.retry_after->count();
    }
    logger.log_block(entry);
}

}  // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // stdout 은 판정 JSON 전용
    spdlog::set_default_logger(spdlog::stderr_color_mt("console"));

    // ── 설정 로드 ───────────────────────────────────────────────────────
    bool                  explicit_path = false;
    std::filesystem::path config_path{kDefaultConfigPath};
    if (argc > 1) {
        config_path   = argv[1];
        explicit_path = true;
    } else if (const auto env_path = getenv_lookup("PROMPTGATE_CONFIG")) {
        config_path   = *env_path;
        explicit_path = true;
    }

    auto app_config = load_app_config(config_path, explicit_path);
    if (!app_config) {
        report_config_error(app_config.error());
        return EXIT_FAILURE;
    }

    const auto log_level = parse_log_level(app_config->global.log_level);
    if (!log_level) {
        spdlog::critical("config error: unknown log level '{}'", app_config->global.log_level);
        return EXIT_FAILURE;
    }

    std::unique_ptr<StructuredLogger> logger;
    try {
        logger = std::make_unique<StructuredLogger>(*log_level, app_config->global.log_path);
    } catch (const std::runtime_error& e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }
    if (*log_level == LogLevel::kDebug) {
        spdlog::set_level(spdlog::level::debug);
    }

    // ── 파이프라인 생성 ─────────────────────────────────────────────────
    auto rules = build_rules(*app_config);
    if (!rules) {
        report_config_error(rules.error());
        return EXIT_FAILURE;
    }

    auto pipeline = SecurityPipeline::create(app_config->security, std::move(*rules));
    if (!pipeline) {
        report_config_error(pipeline.error());
        return EXIT_FAILURE;
    }
    SecurityPipeline& gate = **pipeline;

    spdlog::info("Starting promptgate");
    spdlog::info("Config: {}", config_path.string());
    spdlog::info("Security level: {}", to_string(app_config->security.level));
    spdlog::info("Log path: {}", app_config->global.log_path.string());

    // ── 백그라운드: idle 세션 sweep + SIGHUP 재로드 ─────────────────────
    boost::asio::io_context ioc;
    auto                    work = boost::asio::make_work_guard(ioc);

    SessionSweeper sweeper{
        gate.moderator(),
        std::chrono::duration_cast<std::chrono::milliseconds>(app_config->global.sweep_interval),
        ioc,
        [&logger](std::size_t evicted) {
            logger->log_session(SessionLog{
                .event      = "session_evicted",
                .session_id = {},
                .count      = evicted,
                .timestamp  = std::chrono::system_clock::now(),
            });
        }};

    boost::asio::co_spawn(
        ioc,
        sweeper.run(),
        [](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("session_sweeper: stopped with error: {}", e.what());
                }
            }
        }
    );

    auto signals_hup = std::make_shared<boost::asio::signal_set>(ioc, SIGHUP);
    std::function<void()> setup_hup;
    setup_hup = [&]() {
        signals_hup->async_wait(
            [&](const boost::system::error_code& ec, int /*signum*/) {
                if (ec) {
                    return;
                }
                spdlog::info("config: SIGHUP received, reloading {}", config_path.string());
                auto reloaded = load_app_config(config_path, explicit_path);
                if (!reloaded) {
                    report_config_error(reloaded.error());
                } else if (auto new_rules = build_rules(*reloaded); !new_rules) {
                    report_config_error(new_rules.error());
                } else if (auto r = gate.reload(reloaded->security, std::move(*new_rules)); !r) {
                    report_config_error(r.error());
                }
                setup_hup();
            }
        );
    };
    setup_hup();

    std::thread io_thread([&ioc]() { ioc.run(); });

    // ── stdin 루프 ─────────────────────────────────────────────────────
    std::string line;
    while (std::getline(std::cin, line)) {
        std::string_view view{line};
        if (!view.empty() && view.back() == '\r') {
            view.remove_suffix(1);
        }

        std::string_view session_id{kDefaultSessionId};
        std::string_view text = view;
        if (const auto tab = view.find('\t'); tab != std::string_view::npos) {
            session_id = view.substr(0, tab);
            text       = view.substr(tab + 1);
        }

        auto result = gate.process(text, session_id);
        if (!result) {
            std::cout << format_error(session_id, result.error()) << '\n';
        } else {
            audit(*logger, session_id, text, *result);
            std::cout << format_result(session_id, *result) << '\n';
        }
        std::cout.flush();
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    sweeper.stop();
    boost::asio::post(ioc, [signals_hup]() { signals_hup->cancel(); });
    work.reset();
    io_thread.join();

    const auto stats = gate.stats();
    spdlog::info("promptgate stopped: total={} allowed={} blocked={} (rate_limited={} "
                 "blacklisted={} threat={}) validation_failures={}",
                 stats.total_messages, stats.allowed_messages, stats.blocked_messages,
                 stats.rate_limited, stats.blacklisted, stats.threat_blocked,
                 stats.validation_failures);
    logger->flush();

    return EXIT_SUCCESS;
}
