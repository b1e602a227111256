// ---------------------------------------------------------------------------
// heuristic_scorer.cpp
//
// 반복 문자는 코드포인트 단위로 센다 ("ㅋㅋㅋㅋㅋㅋ" 도 반복이다).
// ---------------------------------------------------------------------------

#include "detector/heuristic_scorer.hpp"

#include <algorithm>
#include <array>

#include <unicode/utf8.h>

namespace {

constexpr std::array<std::string_view, 18> kSuspiciousKeywords = {
    "ignore",    "disregard", "forget",     "override",   "bypass",       "system",
    "prompt",    "instruction", "command",  "execute",    "admin",        "root",
    "sudo",      "privilege", "permission", "jailbreak",  "unrestricted", "uncensored",
};

constexpr std::array<std::string_view, 4> kRoleIndicators = {
    "you are", "act as", "pretend", "imagine you",
};

constexpr std::array<std::string_view, 4> kCommandVerbs = {
    "do", "execute", "run", "perform",
};

constexpr std::size_t kMinPunctuationRun = 3;
constexpr std::size_t kMinRepeatRun      = 6;

[[nodiscard]] bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

template <std::size_t N>
[[nodiscard]] std::size_t count_present(std::string_view text,
                                        const std::array<std::string_view, N>& needles) {
    std::size_t hits = 0;
    for (const auto needle : needles) {
        if (text.find(needle) != std::string_view::npos) {
            ++hits;
        }
    }
    return hits;
}

// [!?] 가 3자 이상 이어진 최대 구간 수
[[nodiscard]] std::size_t count_punctuation_runs(std::string_view text) noexcept {
    std::size_t runs = 0;
    std::size_t len  = 0;
    for (const char c : text) {
        if (c == '!' || c == '?') {
            ++len;
            continue;
        }
        if (len >= kMinPunctuationRun) {
            ++runs;
        }
        len = 0;
    }
    if (len >= kMinPunctuationRun) {
        ++runs;
    }
    return runs;
}

// 앞쪽 공백 뒤에 명령 동사 + 공백으로 시작하는지
[[nodiscard]] bool starts_with_command(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size() && is_space(text[i])) {
        ++i;
    }
    const std::string_view rest = text.substr(i);
    return std::any_of(kCommandVerbs.begin(), kCommandVerbs.end(), [&](std::string_view verb) {
        return rest.size() > verb.size() && rest.substr(0, verb.size()) == verb &&
               is_space(rest[verb.size()]);
    });
}

[[nodiscard]] bool has_repeated_code_point(std::string_view text) noexcept {
    const auto* data   = reinterpret_cast<const std::uint8_t*>(text.data());
    const auto  length = static_cast<std::int32_t>(text.size());

    UChar32     prev = U_SENTINEL;
    std::size_t run  = 0;
    for (std::int32_t i = 0; i < length;) {
        UChar32 c = 0;
        U8_NEXT(data, i, length, c);
        if (c < 0 || c == '\n') {
            prev = U_SENTINEL;
            run  = 0;
            continue;
        }
        run  = (c == prev) ? run + 1 : 1;
        prev = c;
        if (run >= kMinRepeatRun) {
            return true;
        }
    }
    return false;
}

}  // namespace

HeuristicScore HeuristicScorer::score(std::string_view folded) {
    HeuristicScore s{};
    s.keyword_hits     = count_present(folded, kSuspiciousKeywords);
    s.punctuation_runs = count_punctuation_runs(folded);
    s.role_hits        = count_present(folded, kRoleIndicators);
    s.command_opening  = starts_with_command(folded);
    s.char_repetition  = has_repeated_code_point(folded);

    std::uint32_t points = 0;
    points += static_cast<std::uint32_t>(std::min<std::size_t>(40, s.keyword_hits * 10));
    points += static_cast<std::uint32_t>(std::min<std::size_t>(10, s.punctuation_runs * 5));
    points += static_cast<std::uint32_t>(std::min<std::size_t>(20, s.role_hits * 10));
    points += s.command_opening ? 15u : 0u;
    points += s.char_repetition ? 10u : 0u;
    s.points = std::min<std::uint32_t>(100, points);
    return s;
}

ThreatLevel HeuristicScorer::escalation(const HeuristicScore& score) noexcept {
    if (score.points > kHighPoints) {
        return ThreatLevel::kHigh;
    }
    if (score.points > kModeratePoints) {
        return ThreatLevel::kMedium;
    }
    return ThreatLevel::kSafe;
}
