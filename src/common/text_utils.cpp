// ---------------------------------------------------------------------------
// text_utils.cpp
//
// ICU 기반 UTF-8 텍스트 헬퍼 구현.
// ---------------------------------------------------------------------------

#include "common/text_utils.hpp"

#include <cstdint>

#include <unicode/stringpiece.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

bool is_valid_utf8(std::string_view text) noexcept {
    const auto* data   = reinterpret_cast<const std::uint8_t*>(text.data());
    const auto  length = static_cast<std::int32_t>(text.size());

    std::int32_t i = 0;
    while (i < length) {
        UChar32 c = 0;
        U8_NEXT(data, i, length, c);
        if (c < 0) {
            return false;
        }
    }
    return true;
}

std::size_t count_code_points(std::string_view text) noexcept {
    const auto* data   = reinterpret_cast<const std::uint8_t*>(text.data());
    const auto  length = static_cast<std::int32_t>(text.size());

    std::size_t  count = 0;
    std::int32_t i     = 0;
    while (i < length) {
        U8_FWD_1(data, i, length);
        ++count;
    }
    return count;
}

std::string fold_case(std::string_view text) {
    icu::UnicodeString ustr = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<std::int32_t>(text.size())));
    ustr.foldCase();

    std::string out;
    out.reserve(text.size());
    ustr.toUTF8String(out);
    return out;
}
