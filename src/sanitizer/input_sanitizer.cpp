// ---------------------------------------------------------------------------
// input_sanitizer.cpp
//
// ICU 기반 입력 정제기 구현.
//
// [denylist 구성]
// 명시 목록:
//   U+00AD (soft hyphen), U+200B~U+200D (ZWSP/ZWNJ/ZWJ), U+200E/U+200F (LRM/RLM),
//   U+202A~U+202E (방향 embedding/override), U+2060 (word joiner),
//   U+2066~U+2069 (방향 isolate), U+FEFF (BOM)
// 일반 범주:
//   Cc (제어), Cf (형식), Cs (surrogate), Co (사용자 정의), Cn (미할당)
// 단, White_Space 속성을 가진 문자(\t, \n, \r, U+0085 등)는 제거하지 않고
// 5단계에서 단일 공백으로 치환한다.
//
// [오탐/미탐 트레이드오프]
// - Cf 전체 제거: 일부 스크립트(아랍어 등)의 표시용 제어 문자가 사라진다.
//   텍스트 의미는 유지되며 탐지 우회 방지가 우선이다.
// - Co/Cn 제거: 최신 Unicode 버전에서 추가된 문자는 ICU 버전에 따라
//   미할당으로 판정되어 제거될 수 있다.
//
// [std::regex 미사용]
// libstdc++ 의 std::regex 는 반복 구간 길이만큼 재귀한다. 입력은 hard cap
// (기본 64 KiB) 까지 들어오므로 모든 스캔을 선형 루프로 구현한다.
// ---------------------------------------------------------------------------

#include "sanitizer/input_sanitizer.hpp"

#include "common/text_utils.hpp"

#include <string>

#include <spdlog/spdlog.h>
#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

namespace {

// ---------------------------------------------------------------------------
// 내부 헬퍼: 첫 번째 잘못된 UTF-8 바이트 오프셋. 전부 유효하면 -1.
// ---------------------------------------------------------------------------
[[nodiscard]] std::int64_t first_invalid_utf8_offset(std::string_view text) noexcept {
    const auto* data   = reinterpret_cast<const std::uint8_t*>(text.data());
    const auto  length = static_cast<std::int32_t>(text.size());

    std::int32_t i = 0;
    while (i < length) {
        const std::int32_t start = i;
        UChar32 c = 0;
        U8_NEXT(data, i, length, c);
        if (c < 0) {
            return start;
        }
    }
    return -1;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: denylist 판정
// ---------------------------------------------------------------------------
[[nodiscard]] bool is_denylisted(UChar32 c) noexcept {
    if (u_isUWhiteSpace(c)) {
        return false;
    }

    switch (c) {
        case 0x00AD:
        case 0x200B: case 0x200C: case 0x200D:
        case 0x200E: case 0x200F:
        case 0x202A: case 0x202B: case 0x202C: case 0x202D: case 0x202E:
        case 0x2060:
        case 0x2066: case 0x2067: case 0x2068: case 0x2069:
        case 0xFEFF:
            return true;
        default:
            break;
    }

    switch (u_charType(c)) {
        case U_CONTROL_CHAR:
        case U_FORMAT_CHAR:
        case U_SURROGATE:
        case U_PRIVATE_USE_CHAR:
        case U_UNASSIGNED:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] icu::UnicodeString strip_denylisted(const icu::UnicodeString& in) {
    icu::UnicodeString out;
    for (std::int32_t i = 0; i < in.length();) {
        const UChar32 c = in.char32At(i);
        if (!is_denylisted(c)) {
            out.append(c);
        }
        i = in.moveIndex32(i, 1);
    }
    return out;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 공백 연속 구간을 단일 ASCII 공백으로 치환하고 양끝 trim.
// ---------------------------------------------------------------------------
[[nodiscard]] icu::UnicodeString collapse_whitespace(const icu::UnicodeString& in) {
    icu::UnicodeString out;
    bool pending_space = false;
    for (std::int32_t i = 0; i < in.length();) {
        const UChar32 c = in.char32At(i);
        if (u_isUWhiteSpace(c)) {
            pending_space = true;
        } else {
            if (pending_space && !out.isEmpty()) {
                out.append(static_cast<UChar>(0x20));
            }
            pending_space = false;
            out.append(c);
        }
        i = in.moveIndex32(i, 1);
    }
    return out;
}

[[nodiscard]] icu::UnicodeString from_utf8(std::string_view text) {
    return icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<std::int32_t>(text.size())));
}

[[nodiscard]] std::string to_utf8(const icu::UnicodeString& ustr) {
    std::string out;
    ustr.toUTF8String(out);
    return out;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: ANSI CSI 시퀀스 제거 (ESC [ [0-9;?]* letter)
//   선형 스캔. 종료 문자가 없는 불완전 시퀀스는 그대로 둔다
//   (ESC 자체는 3단계 denylist 에서 제거된다).
// ---------------------------------------------------------------------------
[[nodiscard]] bool is_ascii_alpha(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

[[nodiscard]] bool is_ascii_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] std::string strip_ansi_csi(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());

    std::size_t i = 0;
    while (i < raw.size()) {
        if (raw[i] == '\x1b' && i + 1 < raw.size() && raw[i + 1] == '[') {
            std::size_t j = i + 2;
            while (j < raw.size() && (is_ascii_digit(raw[j]) || raw[j] == ';' || raw[j] == '?')) {
                ++j;
            }
            if (j < raw.size() && is_ascii_alpha(raw[j])) {
                i = j + 1;
                continue;
            }
        }
        out.push_back(raw[i]);
        ++i;
    }
    return out;
}

[[nodiscard]] bool is_strict_punct(UChar32 c) noexcept {
    return c == '.' || c == ',' || c == '!' || c == '?' || c == '-';
}

[[nodiscard]] bool is_hex_digit(char c) noexcept {
    return is_ascii_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// text[pos..] 가 count 개의 16진수로 시작하는지
[[nodiscard]] bool hex_digits_at(std::string_view text, std::size_t pos, std::size_t count) noexcept {
    if (pos + count > text.size()) {
        return false;
    }
    for (std::size_t k = 0; k < count; ++k) {
        if (!is_hex_digit(text[pos + k])) {
            return false;
        }
    }
    return true;
}

// '&' 위치에서 &#NNN; 또는 &name; 형태인지
[[nodiscard]] bool html_entity_at(std::string_view text, std::size_t pos) noexcept {
    std::size_t j = pos + 1;
    if (j < text.size() && text[j] == '#') {
        ++j;
        const std::size_t digits_start = j;
        while (j < text.size() && is_ascii_digit(text[j])) {
            ++j;
        }
        return j > digits_start && j < text.size() && text[j] == ';';
    }
    const std::size_t name_start = j;
    while (j < text.size() && is_ascii_alpha(text[j])) {
        ++j;
    }
    return j > name_start && j < text.size() && text[j] == ';';
}

}  // namespace

// ---------------------------------------------------------------------------
// InputSanitizer::sanitize
// ---------------------------------------------------------------------------
std::expected<SanitizationResult, SanitizeError>
InputSanitizer::sanitize(std::string_view raw, std::size_t max_length) {
    // 1. UTF-8 검증
    if (const auto bad = first_invalid_utf8_offset(raw); bad >= 0) {
        return std::unexpected(SanitizeError{
            SanitizeErrorCode::kInvalidEncoding,
            "input is not well-formed UTF-8",
            "byte offset " + std::to_string(bad),
        });
    }

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkc = icu::Normalizer2::getNFKCInstance(status);
    if (U_FAILURE(status) || nfkc == nullptr) {
        spdlog::error("input_sanitizer: cannot load NFKC normalizer: {}", u_errorName(status));
        return std::unexpected(SanitizeError{
            SanitizeErrorCode::kNormalizerUnavailable,
            "unicode normalizer unavailable",
            u_errorName(status),
        });
    }

    SanitizationResult result{};
    result.original_length = count_code_points(raw);

    // 2. ANSI 이스케이프 제거 (ESC 가 3단계에서 먼저 지워지면 파라미터가 남는다)
    const std::string without_ansi = strip_ansi_csi(raw);

    // 3. denylist 제거
    icu::UnicodeString text = strip_denylisted(from_utf8(without_ansi));

    // 4. NFKC 정규화 + denylist 재적용
    icu::UnicodeString normalized = nfkc->normalize(text, status);
    if (U_FAILURE(status)) {
        spdlog::error("input_sanitizer: NFKC normalization failed: {}", u_errorName(status));
        return std::unexpected(SanitizeError{
            SanitizeErrorCode::kNormalizerUnavailable,
            "unicode normalization failed",
            u_errorName(status),
        });
    }
    text = strip_denylisted(normalized);

    // 5. 공백 정리
    text = collapse_whitespace(text);

    // 6. 절단 (코드포인트 기준)
    const auto cp_count = static_cast<std::size_t>(text.countChar32());
    if (cp_count > max_length) {
        const std::int32_t cut = text.moveIndex32(0, static_cast<std::int32_t>(max_length));
        text.truncate(cut);
        // 절단 지점이 공백이면 trailing space 가 남아 멱등성이 깨진다
        while (!text.isEmpty() && text.charAt(text.length() - 1) == 0x20) {
            text.truncate(text.length() - 1);
        }
        result.truncated = true;
        spdlog::warn("input_sanitizer: input truncated from {} to {} code points",
                     cp_count, max_length);
    }

    result.cleaned_text = to_utf8(text);

    if (result.cleaned_text.size() != raw.size()) {
        spdlog::debug("input_sanitizer: sanitized {} -> {} bytes", raw.size(),
                      result.cleaned_text.size());
    }
    return result;
}

// ---------------------------------------------------------------------------
// InputSanitizer::sanitize_strict
// ---------------------------------------------------------------------------
std::expected<SanitizationResult, SanitizeError>
InputSanitizer::sanitize_strict(std::string_view raw, std::size_t max_length) {
    auto base = sanitize(raw, max_length);
    if (!base) {
        return base;
    }

    const icu::UnicodeString limited = from_utf8(limit_repetition(base->cleaned_text, 2));

    // 문자/숫자/공백/기본 문장부호만 유지
    icu::UnicodeString filtered;
    for (std::int32_t i = 0; i < limited.length();) {
        const UChar32 c = limited.char32At(i);
        const bool keep = u_isalnum(c) || u_isUWhiteSpace(c) || c == '.' || c == ',' ||
                          c == '!' || c == '?' || c == '-';
        if (keep) {
            filtered.append(c);
        }
        i = limited.moveIndex32(i, 1);
    }

    // 문장부호 3개 이상 연속 → 마지막 문자 2개
    const icu::UnicodeString collapsed = collapse_whitespace(filtered);
    icu::UnicodeString       squeezed;
    std::int32_t             i = 0;
    while (i < collapsed.length()) {
        const UChar32 c = collapsed.char32At(i);
        if (!is_strict_punct(c)) {
            squeezed.append(c);
            i = collapsed.moveIndex32(i, 1);
            continue;
        }
        icu::UnicodeString run;
        UChar32            last = c;
        while (i < collapsed.length() && is_strict_punct(collapsed.char32At(i))) {
            last = collapsed.char32At(i);
            run.append(last);
            i = collapsed.moveIndex32(i, 1);
        }
        if (run.length() >= 3) {
            squeezed.append(last).append(last);
        } else {
            squeezed.append(run);
        }
    }
    std::string out = to_utf8(squeezed);

    base->cleaned_text = std::move(out);
    return base;
}

// ---------------------------------------------------------------------------
// InputSanitizer::has_suspicious_encoding
// ---------------------------------------------------------------------------
bool InputSanitizer::has_suspicious_encoding(std::string_view text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        bool found = false;
        if (text[i] == '\\' && i + 1 < text.size()) {
            found = (text[i + 1] == 'x' && hex_digits_at(text, i + 2, 2)) ||
                    (text[i + 1] == 'u' && hex_digits_at(text, i + 2, 4));
        } else if (text[i] == '%') {
            found = hex_digits_at(text, i + 1, 2);
        } else if (text[i] == '&') {
            found = html_entity_at(text, i);
        }
        if (found) {
            spdlog::debug("input_sanitizer: suspicious encoding pattern at byte {}", i);
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// InputSanitizer::limit_repetition
// ---------------------------------------------------------------------------
std::string InputSanitizer::limit_repetition(std::string_view text, std::size_t max_run) {
    const icu::UnicodeString in = from_utf8(text);
    icu::UnicodeString out;

    UChar32     prev = U_SENTINEL;
    std::size_t run  = 0;
    for (std::int32_t i = 0; i < in.length();) {
        const UChar32 c = in.char32At(i);
        run = (c == prev) ? run + 1 : 1;
        prev = c;
        if (run <= max_run) {
            out.append(c);
        }
        i = in.moveIndex32(i, 1);
    }
    return to_utf8(out);
}
