#pragma once

// ---------------------------------------------------------------------------
// encoding_scanner.hpp
//
// 텍스트에서 인코딩된 페이로드 후보를 찾아 디코딩한다.
// PromptInjectionDetector 의 재귀 디코딩 단계에서 사용한다.
//
// [후보 형태]
//   base64         : [A-Za-z0-9+/] 또는 URL-safe [-_] 16자 이상, '=' 패딩 허용
//   hex            : 16진수 짝수 길이 16자 이상 ("0x" 접두사 허용)
//   percent        : 공백 없는 구간 안의 %NN 3개 이상
//   unicode-escape : 공백 없는 구간 안의 \xNN / \uNNNN 3개 이상
//
// [오탐/미탐 트레이드오프]
// - 긴 영단어("internationalization")도 base64 알파벳 구간이다.
//   디코딩 결과가 유효한 UTF-8 이 아니거나 출력 가능 문자 비율이 80% 미만이면
//   후보에서 제외하여 일반 텍스트 오탐을 줄인다.
// - 16자 미만의 짧은 base64 ("aWdub3Jl" = "ignore") 는 탐지하지 않는다.
//
// [자원 상한]
// - 후보 하나는 최대 kMaxCandidateBytes 바이트. 초과 구간은 건너뛴다.
// - 한 계층에서 최대 kMaxCandidatesPerLayer 개의 후보를 반환한다.
//   디코딩에 실패하거나 출력 가능 비율 미달로 버려진 구간은 상한에 포함하지
//   않는다. 구간마다 디코딩은 한 번(hex 는 base64 재시도 포함 두 번)이므로
//   계층당 비용은 텍스트 길이에 선형이다.
// - 상한을 채운 뒤 인정 가능한 후보가 더 나오면 스캔을 멈추고
//   EncodingScan::truncated 와 그 위치를 보고한다. 호출자가 fail-close 한다.
// - 디코딩 실패는 오류가 아니다. 해당 후보를 버릴 뿐이다.
// ---------------------------------------------------------------------------

#include "detector/detection_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// EncodingCandidate
//   span   : 스캔한 텍스트 기준 바이트 범위
//   decoded: 디코딩된 UTF-8 텍스트 (검증 완료)
// ---------------------------------------------------------------------------
struct EncodingCandidate {
    EncodingKind kind{EncodingKind::kBase64};
    TextSpan     span{};
    std::string  decoded{};
};

// ---------------------------------------------------------------------------
// EncodingScan
//   truncated   : 상한 때문에 스캔하지 못한 후보가 남았다
//   truncated_at: 버려진 첫 후보의 시작 오프셋 (truncated 일 때만 의미 있음)
// ---------------------------------------------------------------------------
struct EncodingScan {
    std::vector<EncodingCandidate> candidates{};
    bool                           truncated{false};
    std::size_t                    truncated_at{0};
};

class EncodingScanner {
public:
    static constexpr std::size_t kMinBase64Length       = 16;
    static constexpr std::size_t kMinHexLength          = 16;
    static constexpr std::size_t kMinEscapeCount        = 3;
    static constexpr std::size_t kMaxCandidateBytes     = 4096;
    static constexpr std::size_t kMaxCandidatesPerLayer = 32;
    static constexpr double      kMinPrintableRatio     = 0.8;

    // scan_layer
    //   text 에서 디코딩에 성공한 후보를 등장 순서대로 반환하고,
    //   상한으로 잘렸는지 함께 보고한다.
    [[nodiscard]] static EncodingScan scan_layer(std::string_view text);

    // scan_layer(text).candidates
    [[nodiscard]] static std::vector<EncodingCandidate> scan(std::string_view text);

    // 개별 디코더. 형식 오류 또는 결과가 유효한 UTF-8 이 아니면 std::nullopt.
    [[nodiscard]] static std::optional<std::string> decode_base64(std::string_view run);
    [[nodiscard]] static std::optional<std::string> decode_hex(std::string_view run);
    [[nodiscard]] static std::optional<std::string> decode_percent(std::string_view token);
    [[nodiscard]] static std::optional<std::string> decode_unicode_escapes(std::string_view token);
};
