#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 모든 싱크(stderr, rotating file)는 redacting_sink 뒤에 둔다.
//   JSON 필드 값은 직렬화 전에도 Sanitizer 를 거친다 (이스케이프 이후에는
//   패턴 경계가 달라질 수 있음).
// - stdout 은 wfguard 의 필터 출력 전용이므로 로그는 stderr 로 보낸다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger
//   RejectionLog / RedactionLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로. 비어 있으면 파일 싱크 없이 stderr 만 사용.
    //
    //   [예외] 로그 디렉터리/파일 생성 실패 시 std::runtime_error
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path = {});

    ~StructuredLogger() = default;

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    // make_console_logger
    //   설정 로드 전 부트스트랩용. stderr 하나를 redacting_sink 로 감싼 로거.
    //   main 에서 spdlog::set_default_logger() 에 넘긴다.
    [[nodiscard]] static std::shared_ptr<spdlog::logger>
    make_console_logger(const std::string& name);

    // log_rejection
    //   Validator 거부 이벤트를 JSON 으로 기록한다 (warn).
    void log_rejection(const RejectionLog& entry);

    // log_redaction
    //   Sanitizer 적용 요약을 JSON 으로 기록한다 (info).
    void log_redaction(const RedactionLog& entry);

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    void flush();

    // 전역 기본 로거로 지정할 때 사용 (spdlog::set_default_logger)
    [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const noexcept { return logger_; }

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
