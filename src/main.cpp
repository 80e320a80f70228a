// ---------------------------------------------------------------------------
// main.cpp
//
// wfguard: stdin 을 읽어 시크릿을 가린 텍스트를 stdout 으로 쓰는 필터.
//
//   some-command 2>&1 | wfguard > safe.log
//   wfguard --list-patterns
//
// [환경 변수]
//   WFGUARD_CONFIG     설정 파일 경로 (없으면 기본값)
//   WFGUARD_LOG_PATH   로그 파일 경로 (설정 파일 값보다 우선)
//   WFGUARD_LOG_LEVEL  로그 레벨 (설정 파일 값보다 우선)
//
// [종료 코드]
//   0: 성공  1: 환경/설정 오류  2: 사용법 오류
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "config/config_loader.hpp"
#include "logger/structured_logger.hpp"
#include "patterns/pattern_library.hpp"
#include "sanitizer/sanitizer.hpp"
#include "validator/input_validator.hpp"

namespace {

constexpr int kExitConfigError = 1;
constexpr int kExitUsage       = 2;

constexpr std::string_view kUsage =
    "usage: wfguard [--list-patterns]\n"
    "  reads text on stdin and writes it to stdout with secrets replaced by [REDACTED]\n";

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 + 검증
//   값이 없으면 빈 optional. 검증 실패 시 ValidationError
//   (원문은 어디에도 출력하지 않는다).
// ---------------------------------------------------------------------------
ValidationResult<std::optional<std::string>> env_str(const InputValidator& validator,
                                                     const char*           name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return std::optional<std::string>{};
    }
    auto checked = validator.validate_env_value(val);
    if (!checked) {
        return std::unexpected(checked.error());
    }
    return std::optional<std::string>{std::move(*checked)};
}

std::size_t env_length(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    return val == nullptr ? 0 : std::strlen(val);
}

// ---------------------------------------------------------------------------
// Helper: 거부 이벤트 기록
//   설정 로드 전이므로 stderr 전용 StructuredLogger 로 JSON 을 남긴다.
// ---------------------------------------------------------------------------
void report_rejection(std::string_view var, const ValidationError& err, std::size_t input_length) {
    const std::string source = fmt::format("env:{}", var);
    try {
        StructuredLogger rejection_logger(LogLevel::kWarn);
        rejection_logger.log_rejection(to_rejection_log(source, err, input_length));
        rejection_logger.flush();
    } catch (const std::runtime_error& ex) {
        spdlog::error("wfguard: {} rejected: [{}] {} ({}); structured logger unavailable: {}",
                      source, to_string(err.code), err.message, err.rule, ex.what());
    }
}

int list_patterns() {
    const auto& library = PatternLibrary::instance();
    for (const auto& info : library.describe()) {
        std::cout << to_string(info.kind) << '\t' << to_string(info.category) << '\t'
                  << info.name << '\n';
    }
    return library.fail_closed() ? kExitConfigError : EXIT_SUCCESS;
}

}  // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    // ── 부트스트랩 로거: 첫 로그부터 redacting_sink 를 거치게 한다 ──────
    spdlog::set_default_logger(StructuredLogger::make_console_logger("wfguard"));

    // ── 인자 처리 ───────────────────────────────────────────────────────
    bool list_only = false;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg(argv[i]);
        if (arg == "--list-patterns") {
            list_only = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << kUsage;
            return EXIT_SUCCESS;
        } else {
            std::cerr << kUsage;
            return kExitUsage;
        }
    }

    if (list_only) {
        return list_patterns();
    }

    // [Fail-close] 패턴 컴파일 실패 시 필터 출력은 전부 가려진다.
    if (PatternLibrary::instance().fail_closed()) {
        spdlog::error("wfguard: pattern library failed to compile, fail-close active, "
                      "all output will be redacted");
    }

    // ── 환경 변수 (값 자체도 비신뢰 입력) ──────────────────────────────
    const InputValidator env_validator;

    auto config_path = env_str(env_validator, "WFGUARD_CONFIG");
    auto log_path    = env_str(env_validator, "WFGUARD_LOG_PATH");
    auto log_level   = env_str(env_validator, "WFGUARD_LOG_LEVEL");
    if (!config_path) {
        report_rejection("WFGUARD_CONFIG", config_path.error(), env_length("WFGUARD_CONFIG"));
        return kExitConfigError;
    }
    if (!log_path) {
        report_rejection("WFGUARD_LOG_PATH", log_path.error(), env_length("WFGUARD_LOG_PATH"));
        return kExitConfigError;
    }
    if (!log_level) {
        report_rejection("WFGUARD_LOG_LEVEL", log_level.error(), env_length("WFGUARD_LOG_LEVEL"));
        return kExitConfigError;
    }

    // ── 설정 로드 ───────────────────────────────────────────────────────
    GuardConfig config{};
    if (config_path->has_value()) {
        auto path = env_validator.validate_path(**config_path, /*allow_absolute=*/true);
        if (!path) {
            report_rejection("WFGUARD_CONFIG", path.error(), (**config_path).size());
            return kExitConfigError;
        }
        auto loaded = ConfigLoader::load(*path);
        if (!loaded) {
            // ConfigLoader 가 이미 상세 오류를 기록했다
            return kExitConfigError;
        }
        config = std::move(*loaded);
    }
    if (log_path->has_value()) {
        auto path = env_validator.validate_path(**log_path, /*allow_absolute=*/true);
        if (!path) {
            report_rejection("WFGUARD_LOG_PATH", path.error(), (**log_path).size());
            return kExitConfigError;
        }
        config.logging.file_path = std::move(*path);
    }
    if (log_level->has_value()) {
        config.logging.level = **log_level;
    }

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    std::optional<StructuredLogger> logger;
    try {
        logger.emplace(parse_log_level(config.logging.level), config.logging.file_path);
    } catch (const std::runtime_error& ex) {
        spdlog::error("wfguard: {}", ex.what());
        return kExitConfigError;
    }
    spdlog::set_default_logger(logger->logger());

    // ── 필터 ────────────────────────────────────────────────────────────
    const std::string input{std::istreambuf_iterator<char>(std::cin),
                            std::istreambuf_iterator<char>()};

    const Sanitizer sanitizer;
    const auto      result = sanitizer.sanitize(input);

    std::cout << result.text;
    std::cout.flush();

    logger->log_redaction(RedactionLog{
        "stdin",
        result.redactions,
        input.size(),
        result.text.size(),
        std::chrono::system_clock::now(),
    });
    logger->flush();

    return std::cout.good() ? EXIT_SUCCESS : kExitConfigError;
}
