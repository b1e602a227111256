#pragma once

// ---------------------------------------------------------------------------
// json_format.hpp
//
// 구조화 로그와 CLI 출력이 함께 쓰는 JSON 직렬화 헬퍼.
// 외부 JSON 라이브러리 없이 한 줄짜리 객체만 만든다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

// escape_json_string
//   ", \, 제어 문자(< 0x20) 를 이스케이프한다. UTF-8 멀티바이트는 그대로 둔다.
[[nodiscard]] std::string escape_json_string(std::string_view str);

// format_iso8601
//   UTC, 밀리초 정밀도. 예: 2024-01-01T00:00:00.000Z
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);

// format_json_string_array
//   ["a","b"] 형태. 빈 목록은 [].
[[nodiscard]] std::string format_json_string_array(const std::vector<std::string>& items);
