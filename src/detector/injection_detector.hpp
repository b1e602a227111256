#pragma once

// ---------------------------------------------------------------------------
// injection_detector.hpp
//
// 정규식 규칙 + 재귀 디코딩 기반 프롬프트 인젝션 탐지기.
//
// [탐지 단계]
// 1. 패턴 단계: case-folded 입력에 RuleSet 전체를 적용 (depth 0)
// 2. 인코딩 단계: EncodingScanner 후보를 디코딩하여 패턴 단계를 재적용.
//    디코딩 결과에서 규칙이 매칭되면 encoding-bypass 매치를 추가하고
//    레벨을 최소 HIGH 로 상향한다. 디코딩 결과 안에 또 후보가 있으면
//    한 번 더 재귀한다 (최대 depth 2).
// 3. 휴리스틱 단계: case-folded 원문을 HeuristicScorer 로 채점하여
//    0.5 초과면 MEDIUM, 0.7 초과면 HIGH 합성 매치("heuristic.*")를 추가한다.
// 4. 최종 레벨 = 모든 매치 레벨의 최댓값. 매치가 없으면 SAFE.
//
// [디코딩 상한과 fail-close]
// 계층당 후보 수(EncodingScanner::kMaxCandidatesPerLayer)나 전체 후보 수
// (kMaxTotalCandidates) 상한 때문에 디코딩하지 못한 후보가 남으면
// 합성 매치 kScanLimitId (encoding-bypass, HIGH) 를 추가한다. 앞쪽을 무해한
// 인코딩 조각으로 채워 뒤쪽 페이로드를 숨기는 우회를 막는다.
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 의역/동의어: 규칙에 없는 표현은 탐지 불가. 규칙은 YAML 로 확장한다.
// 2. homoglyph: 키릴/그리스 문자 혼용은 sanitizer 가 정규화하지 않으므로 미탐.
// 3. 3중 이상 인코딩: depth 2 에서 중단한다 (자원 상한 우선).
// 4. 짧은 인코딩 조각(16자 미만 base64, 이스케이프 2개 이하)은 스캔하지 않는다.
//
// [보안 원칙]
// - DetectionResult 의 매치 정보는 감사 로그 전용이다. 클라이언트에는
//   차단 사유 코드만 노출한다 (공격자 피드백 최소화).
// - RuleSet 이 없으면 (nullptr) 모든 입력을 CRITICAL 로 판정한다 (fail-close).
// ---------------------------------------------------------------------------

#include "detector/detection_types.hpp"
#include "detector/rule_set.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

class PromptInjectionDetector {
public:
    static constexpr std::uint8_t kMaxDecodeDepth     = 2;
    // 모든 계층을 합친 디코딩 후보 시도 상한
    static constexpr std::size_t  kMaxTotalCandidates = 64;

    // 규칙 없음 상태에서 생성되는 fail-close 매치 id
    static constexpr std::string_view kNoRulesId = "detector.no-rules";
    // 디코딩 상한 초과 시 생성되는 fail-close 매치 id
    static constexpr std::string_view kScanLimitId = "encoding-bypass.scan-limit";
    // 휴리스틱 상향 매치 id
    static constexpr std::string_view kHeuristicModerateId = "heuristic.moderate";
    static constexpr std::string_view kHeuristicHighId     = "heuristic.high";

    explicit PromptInjectionDetector(std::shared_ptr<const RuleSet> rules);
    ~PromptInjectionDetector();

    PromptInjectionDetector(const PromptInjectionDetector&)            = delete;
    PromptInjectionDetector& operator=(const PromptInjectionDetector&) = delete;

    // detect
    //   text: 정제된 입력 (InputSanitizer 출력 권장)
    //   순수 함수. 여러 스레드에서 동시에 호출해도 안전하다.
    [[nodiscard]] DetectionResult detect(std::string_view text) const;

    [[nodiscard]] bool is_safe(std::string_view text) const;

    [[nodiscard]] const std::shared_ptr<const RuleSet>& rules() const noexcept { return rules_; }

private:
    void scan_layer(std::string_view text, std::uint8_t depth, DetectionResult& out,
                    std::size_t& budget) const;

    std::shared_ptr<const RuleSet> rules_;
};
