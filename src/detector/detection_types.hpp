#pragma once

// ---------------------------------------------------------------------------
// detection_types.hpp
//
// 프롬프트 인젝션 탐지 결과 타입.
//
// [불변성]
// PatternMatch 는 탐지기가 생성한 뒤 수정하지 않는다. DetectionResult 는
// 호출자에게 값으로 반환되며 탐지기 내부 상태를 참조하지 않는다.
//
// [오프셋 기준]
// span 은 "평가된 텍스트" 기준 바이트 오프셋이다.
//   depth == 0 : case-folded 입력 텍스트
//   depth >= 1 : 해당 인코딩 계층을 디코딩한 뒤 case-folding 한 텍스트
//   합성 encoding-bypass 매치의 span 은 후보가 발견된 텍스트(folding 전) 기준.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct TextSpan {
    std::size_t start{0};
    std::size_t end{0};
};

// ---------------------------------------------------------------------------
// PatternMatch
//   규칙 하나가 매칭된 결과.
// ---------------------------------------------------------------------------
struct PatternMatch {
    std::string    rule_id{};
    ThreatCategory category{ThreatCategory::kInstructionOverride};
    ThreatLevel    level{ThreatLevel::kSafe};
    TextSpan       span{};
    std::uint8_t   depth{0};  // 0 = 원문, 1~2 = 디코딩 계층
};

enum class EncodingKind : std::uint8_t {
    kBase64        = 0,
    kHex           = 1,
    kPercent       = 2,  // %NN URL 인코딩
    kUnicodeEscape = 3,  // \uNNNN, \xNN
};

[[nodiscard]] inline std::string_view to_string(EncodingKind kind) noexcept {
    switch (kind) {
        case EncodingKind::kBase64:        return "base64";
        case EncodingKind::kHex:           return "hex";
        case EncodingKind::kPercent:       return "percent";
        case EncodingKind::kUnicodeEscape: return "unicode-escape";
        default:                           return "unknown";
    }
}

// ---------------------------------------------------------------------------
// DecodedLayer
//   위협 레벨을 상향시킨 첫 번째 인코딩 후보.
//   decoded_preview: 디코딩 결과 앞 64 바이트 (감사 로그용, 클라이언트 노출 금지)
// ---------------------------------------------------------------------------
struct DecodedLayer {
    EncodingKind encoding{EncodingKind::kBase64};
    std::uint8_t depth{1};
    TextSpan     candidate_span{};
    std::string  decoded_preview{};
};

// ---------------------------------------------------------------------------
// DetectionResult
//   level 은 항상 matches 의 level 최댓값이다 (매치 없으면 kSafe).
//   confidence = min(1, (min(1, 0.3 x 평문 규칙 매치 수) + heuristic_score) / 2),
//   인코딩 우회가 확인되면 최소 0.9.
// ---------------------------------------------------------------------------
struct DetectionResult {
    ThreatLevel                 level{ThreatLevel::kSafe};
    std::vector<PatternMatch>   matches{};       // 스캔 순서
    std::optional<DecodedLayer> decoded_from{};
    double                      heuristic_score{0.0};  // HeuristicScorer 점수 (0.0 ~ 1.0)
    double                      confidence{0.0};       // 판정 신뢰도 (0.0 ~ 1.0), 감사 로그용

    [[nodiscard]] bool is_safe() const noexcept { return level == ThreatLevel::kSafe; }

    // 매치된 카테고리 (중복 제거, 최초 등장 순서)
    [[nodiscard]] std::vector<ThreatCategory> categories() const {
        std::vector<ThreatCategory> out;
        for (const auto& m : matches) {
            if (std::find(out.begin(), out.end(), m.category) == out.end()) {
                out.push_back(m.category);
            }
        }
        return out;
    }
};
