#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 탐지 규칙 설정 구조체 (헤더만, 구현 없음).
// 기본 규칙은 RuleSet::default_specs() 에서, 사용자 규칙은 YAML
// (config/rules.yaml 또는 promptgate.yaml 의 rules: 섹션) 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 common/types.hpp 외에 의존하지 않는다.
// - RuleSpec 은 컴파일 전 원본 값이다. 정규식 컴파일/검증은
//   RuleSet::build 가 담당하며 실패 시 ConfigError 를 반환한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <string>

// ---------------------------------------------------------------------------
// RuleSpec
//   id      : 규칙 식별자 (감사 로그에 노출, 규칙 집합 내 유일)
//   pattern : ECMAScript 정규식. case-folded 텍스트에 대해 평가된다.
//             소문자로 작성할 것 (icase 플래그가 있으나 folding 결과 기준).
// ---------------------------------------------------------------------------
struct RuleSpec {
    std::string    id{};
    ThreatCategory category{ThreatCategory::kInstructionOverride};
    ThreatLevel    level{ThreatLevel::kMedium};
    std::string    pattern{};
    std::string    description{};
};
