// ---------------------------------------------------------------------------
// rule_set.cpp
//
// RuleSet 컴파일 및 내장 규칙 정의.
//
// [내장 규칙 (카테고리별)]
// instruction-override : ignore/disregard/forget previous, bypass safety
// prompt-leak          : system prompt 질의/노출/반복 요청
// role-manipulation    : "you are now", act as, pretend, DAN/developer mode
// command-injection    : execute the following, ${...}, `...`, 가짜 구분자
//
// [오탐/미탐 트레이드오프]
// - rm-act-as (MEDIUM): "act as a translator" 같은 정상 요청도 매칭된다.
//   MEDIUM 정책에서는 차단되므로 필요 시 whitelist 로 예외 처리할 것.
// - ci-backtick-code (LOW): 인라인 코드 질문 전체가 LOW 로 분류된다.
//   HIGH 정책(threshold LOW)에서만 차단된다.
// - rm-jailbreak-mode: 단어 경계(\b) 를 사용하여 "dance", "danger" 의
//   "dan" 부분 매칭을 방지한다.
// - 동의어/의역("pay no attention to the earlier rules")은 탐지하지 못한다.
//   규칙 corpus 는 YAML 로 확장 가능한 설정 데이터로 취급한다.
// ---------------------------------------------------------------------------

#include "detector/rule_set.hpp"

#include <memory>
#include <regex>
#include <string>
#include <unordered_set>
#include <utility>

#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// CompiledRule: 헤더에서 전방 선언한 내부 구조체
// ---------------------------------------------------------------------------
struct RuleSet::CompiledRule {
    RuleSpec                          spec;
    std::shared_ptr<const std::regex> compiled;
};

RuleSet::~RuleSet() = default;

// ---------------------------------------------------------------------------
// RuleSet::default_specs
// ---------------------------------------------------------------------------
std::vector<RuleSpec> RuleSet::default_specs() {
    using C = ThreatCategory;
    using L = ThreatLevel;

    return {
        // ── instruction-override ────────────────────────────────────────
        {"io-ignore-previous", C::kInstructionOverride, L::kCritical,
         R"(ignore\s+(all\s+)?(previous|prior|above)\s+(instructions?|prompts?|commands?))",
         "ignore previous instructions"},
        {"io-disregard-previous", C::kInstructionOverride, L::kCritical,
         R"(disregard\s+(all\s+)?(previous|prior|above)\s+(instructions?|prompts?|commands?))",
         "disregard previous instructions"},
        {"io-forget-previous", C::kInstructionOverride, L::kCritical,
         R"(forget\s+(all\s+|everything\s+)?(previous|prior|above))",
         "forget previous context"},
        {"io-bypass-safety", C::kInstructionOverride, L::kCritical,
         R"(bypass\s+(all\s+)?(safety|security|filters?))",
         "bypass safety filters"},

        // ── prompt-leak ─────────────────────────────────────────────────
        {"pl-system-prompt-statement", C::kPromptLeak, L::kHigh,
         R"((your|the)\s+system\s+prompt\s+(is|was|should))",
         "statement about the system prompt"},
        {"pl-ask-system-prompt", C::kPromptLeak, L::kHigh,
         R"(what\s+(is|are|was)\s+(your|the)\s+system\s+(prompt|instructions?))",
         "asks for the system prompt"},
        {"pl-show-system-prompt", C::kPromptLeak, L::kHigh,
         R"(show\s+(me\s+)?(your|the)\s+system\s+(prompt|instructions?))",
         "asks to show the system prompt"},
        {"pl-reveal-system-prompt", C::kPromptLeak, L::kHigh,
         R"(reveal\s+(your|the)\s+system\s+(prompt|instructions?))",
         "asks to reveal the system prompt"},
        {"pl-repeat-above", C::kPromptLeak, L::kHigh,
         R"(repeat\s+(everything|all)\s+(above|before))",
         "asks to repeat prior context"},
        {"pl-print-instructions", C::kPromptLeak, L::kHigh,
         R"(print\s+(your|the)\s+(instructions?|prompt|system))",
         "asks to print instructions"},

        // ── role-manipulation ───────────────────────────────────────────
        {"rm-you-are-now", C::kRoleManipulation, L::kHigh,
         R"(you\s+are\s+now\s+(a|an)\s+\w+)",
         "reassigns the assistant role"},
        {"rm-from-now-on", C::kRoleManipulation, L::kHigh,
         R"(from\s+now\s+on,?\s+you\s+(are|will))",
         "persistent role change"},
        {"rm-jailbreak-mode", C::kRoleManipulation, L::kHigh,
         R"(\b(dan|developer\s+mode|god\s+mode)\b)",
         "known jailbreak persona"},
        {"rm-act-as", C::kRoleManipulation, L::kMedium,
         R"(act\s+as\s+(a|an)\s+\w+)",
         "act as persona"},
        {"rm-pretend", C::kRoleManipulation, L::kMedium,
         R"(pretend\s+(to\s+be|you\s+are)\s+(a|an)\s+\w+)",
         "pretend persona"},
        {"rm-no-restrictions", C::kRoleManipulation, L::kMedium,
         R"(without\s+(any\s+)?(restrictions?|limitations?|filters?))",
         "asks to drop restrictions"},

        // ── command-injection ───────────────────────────────────────────
        {"ci-execute-following", C::kCommandInjection, L::kHigh,
         R"(execute\s+the\s+following)",
         "execute the following"},
        {"ci-run-this", C::kCommandInjection, L::kHigh,
         R"(run\s+this\s+(command|code|script))",
         "run this command"},
        {"ci-fake-delimiter", C::kCommandInjection, L::kHigh,
         R"(---+\s*(new|system|assistant|user)\s*(prompt|message|instruction))",
         "fake conversation delimiter"},
        {"ci-markdown-role-header", C::kCommandInjection, L::kMedium,
         R"(###\s*(new|system|assistant|user))",
         "markdown role header"},
        {"ci-role-tag", C::kCommandInjection, L::kMedium,
         R"(\[(system|assistant|user)\])",
         "bracketed role tag"},
        {"ci-variable-substitution", C::kCommandInjection, L::kMedium,
         R"(\$\{[^}\n]{0,200}\})",
         "template variable substitution"},
        {"ci-backtick-code", C::kCommandInjection, L::kLow,
         R"(`[^`\n]{1,200}`)",
         "inline code span"},
    };
}

// ---------------------------------------------------------------------------
// RuleSet::build
// ---------------------------------------------------------------------------
std::expected<std::shared_ptr<const RuleSet>, ConfigError>
RuleSet::build(std::vector<RuleSpec> specs) {
    if (specs.empty()) {
        return std::unexpected(ConfigError{
            ConfigErrorCode::kEmptyRuleSet,
            "rule set must contain at least one rule",
            "",
        });
    }

    std::shared_ptr<RuleSet> set(new RuleSet());
    set->rules_.reserve(specs.size());

    std::unordered_set<std::string> seen_ids;
    for (auto& spec : specs) {
        if (spec.id.empty()) {
            return std::unexpected(ConfigError{
                ConfigErrorCode::kInvalidRule, "rule id must not be empty", spec.pattern});
        }
        if (!seen_ids.insert(spec.id).second) {
            return std::unexpected(ConfigError{
                ConfigErrorCode::kInvalidRule, "duplicate rule id", spec.id});
        }
        if (spec.pattern.empty()) {
            return std::unexpected(ConfigError{
                ConfigErrorCode::kInvalidRule, "rule pattern must not be empty", spec.id});
        }
        if (spec.level == ThreatLevel::kSafe) {
            // SAFE 규칙은 매칭되어도 레벨에 기여하지 않으므로 설정 실수로 본다
            return std::unexpected(ConfigError{
                ConfigErrorCode::kInvalidRule, "rule level must be above SAFE", spec.id});
        }

        try {
            auto re = std::make_shared<const std::regex>(
                spec.pattern,
                std::regex_constants::ECMAScript | std::regex_constants::icase |
                    std::regex_constants::optimize);
            set->rules_.push_back(CompiledRule{std::move(spec), std::move(re)});
        } catch (const std::regex_error& e) {
            spdlog::error("rule_set: invalid regex in rule '{}': {}", spec.id, e.what());
            return std::unexpected(ConfigError{
                ConfigErrorCode::kInvalidRule,
                std::string("invalid regex: ") + e.what(),
                spec.id,
            });
        }
    }

    spdlog::info("rule_set: compiled {} rules", set->rules_.size());
    return std::shared_ptr<const RuleSet>(std::move(set));
}

// ---------------------------------------------------------------------------
// RuleSet::defaults
//   내장 규칙은 테스트로 검증된 고정 데이터이므로 build 실패는 프로그래밍 오류다.
// ---------------------------------------------------------------------------
std::shared_ptr<const RuleSet> RuleSet::defaults() {
    static const std::shared_ptr<const RuleSet> instance = [] {
        auto built = build(default_specs());
        if (!built) {
            throw std::logic_error("rule_set: built-in rules failed to compile: " +
                                   built.error().message + " (" + built.error().context + ")");
        }
        return std::move(built).value();
    }();
    return instance;
}

// ---------------------------------------------------------------------------
// RuleSet::match_all
// ---------------------------------------------------------------------------
std::vector<PatternMatch> RuleSet::match_all(std::string_view folded_text,
                                             std::uint8_t     depth) const {
    std::vector<PatternMatch> matches;

    using Iter = std::string_view::const_iterator;
    for (const auto& rule : rules_) {
        std::match_results<Iter> m;
        if (std::regex_search(folded_text.begin(), folded_text.end(), m, *rule.compiled)) {
            const auto start = static_cast<std::size_t>(m.position(0));
            matches.push_back(PatternMatch{
                rule.spec.id,
                rule.spec.category,
                rule.spec.level,
                TextSpan{start, start + static_cast<std::size_t>(m.length(0))},
                depth,
            });
        }
    }
    return matches;
}

std::size_t RuleSet::size() const noexcept {
    return rules_.size();
}

const RuleSpec* RuleSet::find(std::string_view id) const noexcept {
    for (const auto& rule : rules_) {
        if (rule.spec.id == id) {
            return &rule.spec;
        }
    }
    return nullptr;
}
