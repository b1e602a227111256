// ---------------------------------------------------------------------------
// injection_detector.cpp
//
// [재귀 디코딩 흐름]
//   detect(text)
//     ├─ match_all(fold(text), 0)
//     ├─ HeuristicScorer::score(fold(text))
//     └─ scan_layer(text, 1)
//          for candidate in scan_layer(text):   (상한 초과 시 scan-limit 매치)
//            ├─ match_all(fold(decoded), 1) → 매치 있으면 escalate
//            └─ scan_layer(decoded, 2)       (depth < kMaxDecodeDepth 일 때만)
//
// 인코딩 스캔은 folding 전 원문에 대해 수행한다 (base64 는 대소문자 구분).
//
// [escalation]
// 디코딩된 텍스트에서 규칙이 매칭되면
//   - 규칙 매치를 그대로 (원래 카테고리/레벨, 해당 depth) 추가하고
//   - 합성 매치 "encoding-bypass.<kind>" 를 후보 span 과 함께 추가한다.
//     합성 매치 레벨 = max(HIGH, 디코딩 계층 매치 최고 레벨)
//   인코딩으로 숨겼다는 사실 자체를 공격 의도로 본다.
// ---------------------------------------------------------------------------

#include "detector/injection_detector.hpp"

#include "common/text_utils.hpp"
#include "detector/encoding_scanner.hpp"
#include "detector/heuristic_scorer.hpp"

#include <algorithm>
#include <iterator>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kPreviewBytes = 64;

// 앞 kPreviewBytes 바이트. UTF-8 문자 중간에서 자르지 않는다.
[[nodiscard]] std::string make_preview(std::string_view decoded) {
    if (decoded.size() <= kPreviewBytes) {
        return std::string(decoded);
    }
    std::size_t cut = kPreviewBytes;
    while (cut > 0 && (static_cast<unsigned char>(decoded[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return std::string(decoded.substr(0, cut));
}

[[nodiscard]] ThreatLevel max_level(const std::vector<PatternMatch>& matches) noexcept {
    ThreatLevel level = ThreatLevel::kSafe;
    for (const auto& m : matches) {
        level = std::max(level, m.level);
    }
    return level;
}

// 디코딩 상한 초과 매치. 결과당 한 번만 추가한다.
void flag_scan_limit(DetectionResult& out, TextSpan span, std::uint8_t depth) {
    const bool already = std::any_of(out.matches.begin(), out.matches.end(), [](const PatternMatch& m) {
        return m.rule_id == PromptInjectionDetector::kScanLimitId;
    });
    if (already) {
        return;
    }
    spdlog::warn("injection_detector: decode limit reached at depth {}, "
                 "unscanned candidates treated as encoding bypass", depth);
    out.matches.push_back(PatternMatch{
        std::string(PromptInjectionDetector::kScanLimitId),
        ThreatCategory::kEncodingBypass,
        ThreatLevel::kHigh,
        span,
        depth,
    });
}

[[nodiscard]] double compute_confidence(const DetectionResult& r, std::size_t direct_matches) noexcept {
    const double pattern = std::min(1.0, 0.3 * static_cast<double>(direct_matches));
    double       conf    = std::min(1.0, (pattern + r.heuristic_score) / 2.0);
    if (r.decoded_from) {
        conf = std::max(conf, 0.9);
    }
    return conf;
}

}  // namespace

PromptInjectionDetector::PromptInjectionDetector(std::shared_ptr<const RuleSet> rules)
    : rules_(std::move(rules)) {
    if (!rules_) {
        spdlog::error("injection_detector: no rule set, all input will be rejected (fail-close)");
    } else {
        spdlog::debug("injection_detector: initialized with {} rules", rules_->size());
    }
}

PromptInjectionDetector::~PromptInjectionDetector() = default;

// ---------------------------------------------------------------------------
// detect
// ---------------------------------------------------------------------------
DetectionResult PromptInjectionDetector::detect(std::string_view text) const {
    DetectionResult result{};

    if (!rules_) {
        result.level = ThreatLevel::kCritical;
        result.matches.push_back(PatternMatch{
            std::string(kNoRulesId),
            ThreatCategory::kInstructionOverride,
            ThreatLevel::kCritical,
            TextSpan{0, text.size()},
            0,
        });
        result.confidence = 1.0;
        return result;
    }

    const std::string folded = fold_case(text);
    result.matches = rules_->match_all(folded, 0);
    const std::size_t direct_matches = result.matches.size();

    const HeuristicScore heuristic = HeuristicScorer::score(folded);
    result.heuristic_score         = heuristic.value();
    if (const ThreatLevel h = HeuristicScorer::escalation(heuristic); h != ThreatLevel::kSafe) {
        result.matches.push_back(PatternMatch{
            std::string(h == ThreatLevel::kHigh ? kHeuristicHighId : kHeuristicModerateId),
            ThreatCategory::kInstructionOverride,
            h,
            TextSpan{0, folded.size()},
            0,
        });
        spdlog::debug("injection_detector: heuristic score {:.2f} escalates to {}",
                      result.heuristic_score, to_string(h));
    }

    std::size_t budget = kMaxTotalCandidates;
    scan_layer(text, 1, result, budget);

    result.level      = max_level(result.matches);
    result.confidence = compute_confidence(result, direct_matches);

    if (!result.is_safe()) {
        spdlog::debug("injection_detector: level={} matches={} decoded={}",
                      to_string(result.level), result.matches.size(),
                      result.decoded_from.has_value());
    }
    return result;
}

bool PromptInjectionDetector::is_safe(std::string_view text) const {
    return detect(text).is_safe();
}

// ---------------------------------------------------------------------------
// scan_layer
//   text  : 후보를 찾을 텍스트 (depth 1 이면 원문, depth 2 이면 1계층 디코딩 결과)
//   depth : 이 계층에서 디코딩된 텍스트가 갖게 될 depth
//   budget: 남은 디코딩 후보 수 (모든 계층 공유)
// ---------------------------------------------------------------------------
void PromptInjectionDetector::scan_layer(std::string_view text, std::uint8_t depth,
                                         DetectionResult& out, std::size_t& budget) const {
    if (depth > kMaxDecodeDepth) {
        return;
    }

    auto scan = EncodingScanner::scan_layer(text);
    if (scan.truncated) {
        flag_scan_limit(out, TextSpan{scan.truncated_at, text.size()}, depth);
    }

    for (auto& candidate : scan.candidates) {
        if (budget == 0) {
            // 공유 상한 소진: 남은 후보는 디코딩하지 않고 fail-close
            flag_scan_limit(out, TextSpan{candidate.span.start, text.size()}, depth);
            return;
        }
        --budget;

        auto inner = rules_->match_all(fold_case(candidate.decoded), depth);
        if (!inner.empty()) {
            const ThreatLevel escalated = std::max(ThreatLevel::kHigh, max_level(inner));

            out.matches.insert(out.matches.end(), std::make_move_iterator(inner.begin()),
                               std::make_move_iterator(inner.end()));
            out.matches.push_back(PatternMatch{
                "encoding-bypass." + std::string(to_string(candidate.kind)),
                ThreatCategory::kEncodingBypass,
                escalated,
                candidate.span,
                depth,
            });

            if (!out.decoded_from) {
                out.decoded_from = DecodedLayer{
                    candidate.kind,
                    depth,
                    candidate.span,
                    make_preview(candidate.decoded),
                };
            }
            spdlog::info("injection_detector: {} payload matched rules at depth {}",
                         to_string(candidate.kind), depth);
        }

        if (depth < kMaxDecodeDepth) {
            scan_layer(candidate.decoded, static_cast<std::uint8_t>(depth + 1), out, budget);
        }
    }
}
