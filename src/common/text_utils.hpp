#pragma once

// ---------------------------------------------------------------------------
// text_utils.hpp
//
// ICU 기반 UTF-8 텍스트 헬퍼.
//
// [설계 원칙]
// - 모든 함수는 순수 함수이며 스레드 안전하다 (ICU 정적 데이터만 참조).
// - 입력은 UTF-8 로 가정한다. is_valid_utf8() 로 사전 검증한 뒤 호출할 것.
//   잘못된 시퀀스가 섞이면 ICU 가 U+FFFD 로 치환한다 (예외 없음).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>

// 잘 형성된 UTF-8 인지 검사한다. surrogate 코드포인트, overlong 인코딩 포함 거부.
[[nodiscard]] bool is_valid_utf8(std::string_view text) noexcept;

// 코드포인트 개수. 잘못된 시퀀스는 1개로 센다.
[[nodiscard]] std::size_t count_code_points(std::string_view text) noexcept;

// Unicode full case folding (ICU foldCase). 대소문자 무관 비교용.
// 결과 길이는 입력과 다를 수 있다 (예: "ß" → "ss").
[[nodiscard]] std::string fold_case(std::string_view text);
