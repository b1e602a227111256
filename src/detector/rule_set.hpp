#pragma once

// ---------------------------------------------------------------------------
// rule_set.hpp
//
// 컴파일된 불변 탐지 규칙 집합.
//
// [불변성 / 교체 방식]
// - RuleSet 은 build() 로 한 번 생성된 뒤 수정되지 않는다.
// - 탐지기는 std::shared_ptr<const RuleSet> 을 공유하며, 규칙 추가는
//   새 RuleSet 을 build 하여 포인터를 교체하는 방식으로만 수행한다.
//   진행 중인 탐지는 이전 RuleSet 으로 완료된다 (참조 카운트 보장).
//
// [fail-fast]
// 잘못된 정규식, 빈/중복 id, 빈 목록은 모두 ConfigError 로 거부한다.
// 잘못된 규칙을 건너뛰면 탐지 범위가 조용히 줄어들기 때문이다 (false negative).
//
// [성능 고려사항]
// - std::regex 컴파일 비용은 build() 에서 한 번만 발생한다.
// - match_all() 은 O(규칙 수 * 텍스트 길이). 입력 길이 제한은 호출자
//   (sanitizer max_length, EncodingScanner 후보 크기 상한) 가 보장한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "detector/detection_types.hpp"
#include "detector/rule.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string_view>
#include <vector>

class RuleSet {
public:
    ~RuleSet();

    RuleSet(const RuleSet&)            = delete;
    RuleSet& operator=(const RuleSet&) = delete;

    // build
    //   specs 를 ECMAScript | icase 로 컴파일한다.
    //   실패: ConfigError{kInvalidRule | kEmptyRuleSet}
    [[nodiscard]] static std::expected<std::shared_ptr<const RuleSet>, ConfigError>
    build(std::vector<RuleSpec> specs);

    // defaults
    //   내장 규칙 집합. 최초 호출 시 한 번 컴파일하여 공유한다.
    [[nodiscard]] static std::shared_ptr<const RuleSet> defaults();

    // default_specs
    //   내장 규칙 원본. 사용자 규칙과 병합할 때 사용한다.
    [[nodiscard]] static std::vector<RuleSpec> default_specs();

    // match_all
    //   folded_text: case-folded 평가 대상 텍스트
    //   규칙마다 최초 매치 하나를 PatternMatch 로 기록한다 (규칙 순서 = 스캔 순서).
    [[nodiscard]] std::vector<PatternMatch> match_all(std::string_view folded_text,
                                                      std::uint8_t     depth) const;

    [[nodiscard]] std::size_t size() const noexcept;

    // id 로 규칙 원본 조회. 없으면 nullptr.
    [[nodiscard]] const RuleSpec* find(std::string_view id) const noexcept;

private:
    RuleSet() = default;

    struct CompiledRule;
    std::vector<CompiledRule> rules_;
};
