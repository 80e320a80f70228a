#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [민감정보 취급 원칙]
// - 어떤 구조체도 거부/가림 대상 원문을 담지 않는다. 길이, 개수,
//   규칙 이름처럼 원문을 복원할 수 없는 값만 기록한다.
// - source 필드는 호출자가 정하는 고정 식별자 ("stdin", "env:WFGUARD_CONFIG")
//   이며, 그래도 싱크에서 한 번 더 Sanitizer 를 거친다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
    kOff   = 4,
};

// "trace"/"debug" → kDebug, "error"/"critical" → kError, "off" → kOff
// 알 수 없는 값은 kInfo.
[[nodiscard]] LogLevel parse_log_level(std::string_view level) noexcept;

// ---------------------------------------------------------------------------
// RejectionLog
//   Validator 거부 이벤트.
//   input_length: 거부된 입력의 바이트 길이 (원문 대신 기록)
// ---------------------------------------------------------------------------
struct RejectionLog {
    std::string                           source{};        // 입력 출처 식별자
    InputCategory                         category{InputCategory::kBoundedString};
    ValidationErrorCode                   code{ValidationErrorCode::kInvalidFormat};
    std::string                           rule{};          // 위반 규칙 식별자
    std::string                           message{};       // ValidationError::message
    std::size_t                           input_length{0};
    std::chrono::system_clock::time_point timestamp{};
};

// ValidationError 를 거부 이벤트로 옮긴다. timestamp 는 현재 시각.
[[nodiscard]] RejectionLog to_rejection_log(std::string_view       source,
                                            const ValidationError& error,
                                            std::size_t            input_length);

// ---------------------------------------------------------------------------
// RedactionLog
//   Sanitizer 적용 결과 요약. 무엇이 가려졌는지는 기록하지 않는다.
// ---------------------------------------------------------------------------
struct RedactionLog {
    std::string                           source{};
    std::size_t                           redactions{0};
    std::size_t                           input_bytes{0};
    std::size_t                           output_bytes{0};
    std::chrono::system_clock::time_point timestamp{};
};
