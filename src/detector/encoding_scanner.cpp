// ---------------------------------------------------------------------------
// encoding_scanner.cpp
//
// [스캔 방식]
// 텍스트를 ASCII 공백 기준 토큰으로 나눈 뒤 토큰마다 한 가지 형태만 시도한다.
//   1. %NN 이 3개 이상이면 토큰 전체를 percent 후보로 본다.
//   2. \xNN / \uNNNN 이 3개 이상이면 토큰 전체를 unicode-escape 후보로 본다.
//   3. 그 외에는 토큰 안의 base64 알파벳 최대 구간을 찾는다.
//      구간 전체가 16진수이면 hex 로 먼저 시도하고, 실패할 때만 base64 로 시도한다.
//
// std::regex 없이 선형 스캔한다. 계층당 비용은 O(텍스트 길이).
// ---------------------------------------------------------------------------

#include "detector/encoding_scanner.hpp"

#include "common/text_utils.hpp"

#include <cstdint>
#include <utility>

#include <spdlog/spdlog.h>
#include <unicode/uchar.h>
#include <unicode/utf8.h>
#include <unicode/utf16.h>

namespace {

[[nodiscard]] int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

[[nodiscard]] bool is_hex_digits(std::string_view s) noexcept {
    for (const char c : s) {
        if (hex_value(c) < 0) {
            return false;
        }
    }
    return true;
}

[[nodiscard]] int base64_value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+' || c == '-') return 62;  // '-' : URL-safe
    if (c == '/' || c == '_') return 63;  // '_' : URL-safe
    return -1;
}

[[nodiscard]] bool is_ascii_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

void append_code_point(std::string& out, UChar32 cp) {
    std::uint8_t buf[U8_MAX_LENGTH];
    std::int32_t len = 0;
    U8_APPEND_UNSAFE(buf, len, cp);
    out.append(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(len));
}

// 출력 가능 코드포인트(공백 포함) 비율. 빈 문자열은 0.
[[nodiscard]] double printable_ratio(std::string_view text) noexcept {
    const auto* data   = reinterpret_cast<const std::uint8_t*>(text.data());
    const auto  length = static_cast<std::int32_t>(text.size());

    std::size_t total     = 0;
    std::size_t printable = 0;
    for (std::int32_t i = 0; i < length;) {
        UChar32 c = 0;
        U8_NEXT(data, i, length, c);
        ++total;
        if (c >= 0 && (u_isprint(c) || u_isUWhiteSpace(c))) {
            ++printable;
        }
    }
    return total == 0 ? 0.0 : static_cast<double>(printable) / static_cast<double>(total);
}

[[nodiscard]] std::size_t count_percent_escapes(std::string_view token) noexcept {
    std::size_t count = 0;
    for (std::size_t i = 0; i + 2 < token.size(); ++i) {
        if (token[i] == '%' && hex_value(token[i + 1]) >= 0 && hex_value(token[i + 2]) >= 0) {
            ++count;
            i += 2;
        }
    }
    return count;
}

[[nodiscard]] std::size_t count_backslash_escapes(std::string_view token) noexcept {
    std::size_t count = 0;
    for (std::size_t i = 0; i + 1 < token.size(); ++i) {
        if (token[i] != '\\') {
            continue;
        }
        if (token[i + 1] == 'x' && i + 4 <= token.size() &&
            is_hex_digits(token.substr(i + 2, 2))) {
            ++count;
            i += 3;
        } else if (token[i + 1] == 'u' && i + 6 <= token.size() &&
                   is_hex_digits(token.substr(i + 2, 4))) {
            ++count;
            i += 5;
        }
    }
    return count;
}

// ---------------------------------------------------------------------------
// CandidateCollector
//   한 계층의 후보 수집 상태. 인정된 후보만 상한에 포함한다.
// ---------------------------------------------------------------------------
class CandidateCollector {
public:
    // 상한을 넘는 후보가 나와 수집을 멈췄다
    [[nodiscard]] bool stopped() const noexcept { return overflow_at_.has_value(); }

    // 디코딩 결과가 비어 있지 않고 (require_printable 이면) 출력 가능하면
    // 후보로 인정한다. 상한에 도달한 뒤 인정 가능한 후보가 오면 위치만 기록한다.
    bool offer(EncodingKind kind, std::size_t start, std::size_t end,
               std::optional<std::string> decoded, bool require_printable) {
        if (!decoded || decoded->empty()) {
            return false;
        }
        if (require_printable &&
            printable_ratio(*decoded) < EncodingScanner::kMinPrintableRatio) {
            return false;
        }
        if (out_.size() >= EncodingScanner::kMaxCandidatesPerLayer) {
            overflow_at_ = start;
            return false;
        }
        out_.push_back(EncodingCandidate{kind, TextSpan{start, end}, std::move(*decoded)});
        return true;
    }

    [[nodiscard]] EncodingScan take() {
        EncodingScan scan{};
        scan.candidates   = std::move(out_);
        scan.truncated    = overflow_at_.has_value();
        scan.truncated_at = overflow_at_.value_or(0);
        return scan;
    }

private:
    std::vector<EncodingCandidate> out_;
    std::optional<std::size_t>     overflow_at_;
};

// 토큰 안의 base64 알파벳 구간(hex 포함)을 처리한다.
void scan_alphabet_runs(std::string_view token, std::size_t offset, CandidateCollector& col) {
    std::size_t j = 0;
    while (j < token.size() && !col.stopped()) {
        if (base64_value(token[j]) < 0) {
            ++j;
            continue;
        }

        const std::size_t run_start = j;
        while (j < token.size() && base64_value(token[j]) >= 0) {
            ++j;
        }
        const std::size_t body_end = j;
        std::size_t       pad      = 0;
        while (j < token.size() && token[j] == '=' && pad < 2) {
            ++j;
            ++pad;
        }

        const std::string_view run = token.substr(run_start, j - run_start);
        if (run.size() > EncodingScanner::kMaxCandidateBytes) {
            continue;
        }

        // hex: "0x" 접두사는 span 에서 제외
        std::string_view  hex_body  = token.substr(run_start, body_end - run_start);
        std::size_t       hex_start = run_start;
        if (hex_body.size() > 2 && hex_body[0] == '0' && (hex_body[1] == 'x' || hex_body[1] == 'X')) {
            hex_body.remove_prefix(2);
            hex_start += 2;
        }
        if (pad == 0 && hex_body.size() >= EncodingScanner::kMinHexLength &&
            hex_body.size() % 2 == 0 && is_hex_digits(hex_body)) {
            if (col.offer(EncodingKind::kHex, offset + hex_start, offset + body_end,
                          EncodingScanner::decode_hex(hex_body), true)) {
                continue;
            }
            if (col.stopped()) {
                break;
            }
        }

        if (body_end - run_start >= EncodingScanner::kMinBase64Length) {
            col.offer(EncodingKind::kBase64, offset + run_start, offset + j,
                      EncodingScanner::decode_base64(run), true);
        }
    }
}

}  // namespace

// ---------------------------------------------------------------------------
// EncodingScanner::scan_layer
// ---------------------------------------------------------------------------
EncodingScan EncodingScanner::scan_layer(std::string_view text) {
    CandidateCollector col;

    std::size_t i = 0;
    while (i < text.size() && !col.stopped()) {
        while (i < text.size() && is_ascii_space(text[i])) {
            ++i;
        }
        const std::size_t start = i;
        while (i < text.size() && !is_ascii_space(text[i])) {
            ++i;
        }
        if (start == i) {
            break;
        }

        const std::string_view token = text.substr(start, i - start);
        const bool             fits  = token.size() <= kMaxCandidateBytes;

        if (fits && count_percent_escapes(token) >= kMinEscapeCount) {
            col.offer(EncodingKind::kPercent, start, i, decode_percent(token), false);
        } else if (fits && count_backslash_escapes(token) >= kMinEscapeCount) {
            col.offer(EncodingKind::kUnicodeEscape, start, i, decode_unicode_escapes(token), false);
        } else {
            scan_alphabet_runs(token, start, col);
        }
    }

    auto scan = col.take();
    if (scan.truncated) {
        spdlog::warn("encoding_scanner: candidate limit {} reached, scan stopped at byte {} of {}",
                     kMaxCandidatesPerLayer, scan.truncated_at, text.size());
    } else if (!scan.candidates.empty()) {
        spdlog::debug("encoding_scanner: {} decodable candidates in {} bytes",
                      scan.candidates.size(), text.size());
    }
    return scan;
}

std::vector<EncodingCandidate> EncodingScanner::scan(std::string_view text) {
    return scan_layer(text).candidates;
}

// ---------------------------------------------------------------------------
// EncodingScanner::decode_base64
//   표준/URL-safe 알파벳 모두 허용, 패딩 생략 허용.
// ---------------------------------------------------------------------------
std::optional<std::string> EncodingScanner::decode_base64(std::string_view run) {
    while (!run.empty() && run.back() == '=') {
        run.remove_suffix(1);
    }
    if (run.empty() || run.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string   out;
    out.reserve(run.size() * 3 / 4);
    std::uint32_t buffer = 0;
    int           bits   = 0;
    for (const char c : run) {
        const int v = base64_value(c);
        if (v < 0) {
            return std::nullopt;
        }
        buffer = (buffer << 6) | static_cast<std::uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
            buffer &= (1u << bits) - 1u;
        }
    }

    if (!is_valid_utf8(out)) {
        return std::nullopt;
    }
    return out;
}

// ---------------------------------------------------------------------------
// EncodingScanner::decode_hex
// ---------------------------------------------------------------------------
std::optional<std::string> EncodingScanner::decode_hex(std::string_view run) {
    if (run.size() > 2 && run[0] == '0' && (run[1] == 'x' || run[1] == 'X')) {
        run.remove_prefix(2);
    }
    if (run.empty() || run.size() % 2 != 0) {
        return std::nullopt;
    }

    std::string out;
    out.reserve(run.size() / 2);
    for (std::size_t i = 0; i < run.size(); i += 2) {
        const int hi = hex_value(run[i]);
        const int lo = hex_value(run[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((hi << 4) | lo));
    }

    if (!is_valid_utf8(out)) {
        return std::nullopt;
    }
    return out;
}

// ---------------------------------------------------------------------------
// EncodingScanner::decode_percent
//   %NN 은 바이트로, 나머지 문자는 그대로 둔다.
// ---------------------------------------------------------------------------
std::optional<std::string> EncodingScanner::decode_percent(std::string_view token) {
    std::string out;
    out.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '%' && i + 2 < token.size()) {
            const int hi = hex_value(token[i + 1]);
            const int lo = hex_value(token[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(token[i]);
    }

    if (!is_valid_utf8(out)) {
        return std::nullopt;
    }
    return out;
}

// ---------------------------------------------------------------------------
// EncodingScanner::decode_unicode_escapes
//   \xNN   : 바이트 (UTF-8 바이트열을 이스케이프한 경우 포함)
//   \uNNNN : 코드포인트. surrogate pair 는 결합하며 짝 없는 surrogate 는 실패.
// ---------------------------------------------------------------------------
std::optional<std::string> EncodingScanner::decode_unicode_escapes(std::string_view token) {
    std::string out;
    out.reserve(token.size());

    const auto read_u4 = [&](std::size_t pos) -> std::int32_t {
        if (pos + 6 > token.size() || token[pos] != '\\' || token[pos + 1] != 'u') {
            return -1;
        }
        const std::string_view digits = token.substr(pos + 2, 4);
        if (!is_hex_digits(digits)) {
            return -1;
        }
        std::int32_t value = 0;
        for (const char c : digits) {
            value = (value << 4) | hex_value(c);
        }
        return value;
    };

    std::size_t i = 0;
    while (i < token.size()) {
        if (token[i] == '\\' && i + 4 <= token.size() && token[i + 1] == 'x' &&
            is_hex_digits(token.substr(i + 2, 2))) {
            out.push_back(static_cast<char>((hex_value(token[i + 2]) << 4) |
                                            hex_value(token[i + 3])));
            i += 4;
            continue;
        }

        const std::int32_t unit = read_u4(i);
        if (unit >= 0) {
            UChar32 cp = unit;
            i += 6;
            if (U16_IS_LEAD(unit)) {
                const std::int32_t trail = read_u4(i);
                if (trail < 0 || !U16_IS_TRAIL(trail)) {
                    return std::nullopt;
                }
                cp = U16_GET_SUPPLEMENTARY(unit, trail);
                i += 6;
            } else if (U16_IS_TRAIL(unit)) {
                return std::nullopt;
            }
            append_code_point(out, cp);
            continue;
        }

        out.push_back(token[i]);
        ++i;
    }

    if (!is_valid_utf8(out)) {
        return std::nullopt;
    }
    return out;
}
