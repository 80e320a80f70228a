#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// kRedactionMarker
//   시크릿 형태 부분문자열을 대체하는 고정 마커.
//   원본 길이/내용에 대한 정보를 전혀 담지 않는다.
//   [불변식] 마커 자체는 어떤 시크릿 패턴에도 매칭되지 않는다 (멱등성 전제).
// ---------------------------------------------------------------------------
inline constexpr std::string_view kRedactionMarker{"[REDACTED]"};

// ---------------------------------------------------------------------------
// InputCategory
//   검증 대상 입력의 분류. ValidationError 에 포함되어 어떤 검증기가
//   거부했는지 식별한다.
// ---------------------------------------------------------------------------
enum class InputCategory : std::uint8_t {
    kRepository    = 0,   // owner/repo
    kFilePath      = 1,
    kFilename      = 2,
    kYamlDocument  = 3,
    kUrl           = 4,
    kEnvName       = 5,
    kEnvValue      = 6,
    kBoundedString = 7,
    kGitRef        = 8,   // branch / tag
    kCommitSha     = 9,
    kShellArgument = 10,
};

// ---------------------------------------------------------------------------
// ValidationErrorCode
//   검증 실패 분류. 모든 실패는 단일 ValidationError 타입으로 표현되며
//   이 코드로 구분한다. Sanitizer 는 실패하지 않으므로 해당 코드가 없다.
// ---------------------------------------------------------------------------
enum class ValidationErrorCode : std::uint8_t {
    kInvalidFormat     = 0,
    kTooLong           = 1,
    kDangerousPattern  = 2,
    kDisallowedScheme  = 3,
    kPathTraversal     = 4,
    kNullOrControlChar = 5,
    kNotAMapping       = 6,  // YAML 최상위가 mapping 이 아님
    kParseFailure      = 7,  // YAML/URL 파싱 실패
};

// ---------------------------------------------------------------------------
// ValidationError
//   검증 실패 시 반환되는 오류 정보.
//   std::expected<T, ValidationError> 패턴과 함께 사용한다.
//
//   [보안 원칙]
//   message 는 위반한 규칙만 설명하며, 거부된 원문 부분문자열을 절대
//   포함하지 않는다. 원문 자체가 시크릿일 수 있기 때문이다.
//   호출자는 message 를 stderr/로그에 그대로 출력해도 안전하다.
// ---------------------------------------------------------------------------
struct ValidationError {
    ValidationErrorCode code{ValidationErrorCode::kInvalidFormat};
    InputCategory       category{InputCategory::kBoundedString};
    std::string         rule{};     // 위반 규칙 식별자 (예: "owner-repo-shape")
    std::string         message{};  // 사람이 읽을 수 있는 안전한 설명
};

template <typename T>
using ValidationResult = std::expected<T, ValidationError>;

// ---------------------------------------------------------------------------
// RedactionResult
//   Sanitizer 출력. redactions 는 가려진 구간 수이며, 무엇이 가려졌는지는
//   알려주지 않는다.
// ---------------------------------------------------------------------------
struct RedactionResult {
    std::string text{};
    std::size_t redactions{0};
};

[[nodiscard]] std::string_view to_string(InputCategory category) noexcept;
[[nodiscard]] std::string_view to_string(ValidationErrorCode code) noexcept;
