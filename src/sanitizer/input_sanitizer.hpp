#pragma once

// ---------------------------------------------------------------------------
// input_sanitizer.hpp
//
// 신뢰할 수 없는 자유 텍스트 입력을 정규화하는 상태 없는 정제기.
// 탐지기/모더레이터보다 먼저 실행되어, 이후 단계가 항상 동일한 형태의
// 텍스트를 보도록 보장한다.
//
// [정제 단계 (순서 고정)]
// 1. UTF-8 검증. 실패 시 SanitizeError::kInvalidEncoding (유일한 실패 경로)
// 2. ANSI CSI 이스케이프 시퀀스 제거 (ESC [ ... letter)
// 3. denylist 코드포인트 제거 (제어문자, zero-width, BOM, 방향 제어 문자)
// 4. NFKC 정규화 후 3단계 재적용
// 5. 공백 연속 구간 → 단일 공백, 양끝 trim
// 6. max_length 코드포인트로 절단 (정규화 이후 길이 기준)
//
// [설계 한계 / 알려진 우회 가능성]
// - NFKC 는 호환 문자(전각 문자, 합자 등)만 통합한다. 키릴 'а' 와 라틴 'a'
//   같은 교차 스크립트 homoglyph 는 정규화되지 않는다 (confusable 매핑 미적용).
// - ZWJ 제거로 이모지 결합 시퀀스가 분리된다 (표시 형태만 변함, 의미 손실 적음).
//
// [멱등성]
// sanitize(sanitize(x)) == sanitize(x). 3단계를 NFKC 앞뒤로 두 번 수행하는
// 이유는 제거 후 새로 인접한 결합 문자가 두 번째 호출에서 재조합되는
// 것을 막기 위해서다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// SanitizationResult
//   정제 결과 값 객체. 입력에 대한 결정적 함수이며 식별자를 갖지 않는다.
//   original_length: 원본 입력의 코드포인트 수
// ---------------------------------------------------------------------------
struct SanitizationResult {
    std::string cleaned_text{};
    bool        truncated{false};
    std::size_t original_length{0};
};

enum class SanitizeErrorCode : std::uint8_t {
    kInvalidEncoding       = 0,  // UTF-8 형식 오류
    kNormalizerUnavailable = 1,  // ICU 정규화 데이터 로드 실패 (환경 오류)
};

struct SanitizeError {
    SanitizeErrorCode code{SanitizeErrorCode::kInvalidEncoding};
    std::string       message{};
    std::string       context{};  // 오류 위치 (바이트 오프셋 등)
};

// ---------------------------------------------------------------------------
// InputSanitizer
//   모든 메서드는 static 순수 함수. 동시 호출 안전.
// ---------------------------------------------------------------------------
class InputSanitizer {
public:
    // sanitize
    //   raw       : 원본 입력 (UTF-8)
    //   max_length: 절단 기준 코드포인트 수
    [[nodiscard]] static std::expected<SanitizationResult, SanitizeError>
    sanitize(std::string_view raw, std::size_t max_length);

    // sanitize_strict
    //   sanitize() 후 반복 문자 제한(2회) + 문자/숫자/공백/.,!?- 외 문자 제거.
    //   고보안 모드의 부가 정제용. 일반 파이프라인 경로에서는 사용하지 않는다.
    [[nodiscard]] static std::expected<SanitizationResult, SanitizeError>
    sanitize_strict(std::string_view raw, std::size_t max_length);

    // has_suspicious_encoding
    //   \xNN, \uNNNN, %NN, &#NNN;, &name; 형태의 인코딩 흔적 존재 여부.
    //   판정에는 쓰지 않는다. CLI 감사 로그의 suspicious_encoding 필드로만 기록된다.
    [[nodiscard]] static bool has_suspicious_encoding(std::string_view text);

    // limit_repetition
    //   같은 코드포인트가 max_run 회를 넘겨 연속되면 max_run 회로 줄인다.
    //   예: limit_repetition("aaaaaa", 3) == "aaa"
    [[nodiscard]] static std::string limit_repetition(std::string_view text,
                                                      std::size_t      max_run);
};
