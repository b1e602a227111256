#pragma once

// ---------------------------------------------------------------------------
// heuristic_scorer.hpp
//
// 규칙에 걸리지 않는 입력의 "수상함" 점수 (0.0 ~ 1.0).
// 개별 신호는 약하지만 여러 개가 겹치면 레벨을 올린다.
//
// [점수 구성] (1/100 단위 정수로 누적)
//   의심 키워드 (ignore, system, sudo ...)   : 개당 10, 최대 40
//   !!! / ??? 같은 [!?] 3자 이상 연속 구간    : 구간당 5, 최대 10
//   역할 지시 표현 (you are, act as ...)      : 개당 10, 최대 20
//   명령형 시작 (do / execute / run / perform) : 15
//   같은 문자 6회 이상 연속                    : 10
//
// [상향 기준]
//   score > 0.7 → HIGH, score > 0.5 → MEDIUM, 그 외 상향 없음
//
// [오탐/미탐 트레이드오프]
// - 키워드는 부분 문자열로 센다 ("ecosystem" 도 "system" 으로 센다).
//   키워드만으로는 최대 0.4 이므로 다른 신호 없이 상향되지 않는다.
// - 입력은 case-folded 텍스트여야 한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>

struct HeuristicScore {
    std::uint32_t points{0};  // 0 ~ 100
    std::size_t   keyword_hits{0};
    std::size_t   punctuation_runs{0};
    std::size_t   role_hits{0};
    bool          command_opening{false};
    bool          char_repetition{false};

    [[nodiscard]] double value() const noexcept { return static_cast<double>(points) / 100.0; }
};

class HeuristicScorer {
public:
    static constexpr std::uint32_t kModeratePoints = 50;  // 초과 시 MEDIUM
    static constexpr std::uint32_t kHighPoints     = 70;  // 초과 시 HIGH

    // score
    //   folded: case-folded 텍스트. 선형 스캔, 동시 호출 안전.
    [[nodiscard]] static HeuristicScore score(std::string_view folded);

    // escalation
    //   점수에 따른 상향 레벨. 기준 이하이면 kSafe.
    [[nodiscard]] static ThreatLevel escalation(const HeuristicScore& score) noexcept;
};
