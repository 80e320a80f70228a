// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "logger/redacting_sink.hpp"
#include "sanitizer/sanitizer.hpp"

namespace {

constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm     tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프
// ---------------------------------------------------------------------------
std::string escape_json_string(std::string_view str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    result += fmt::format("\\u{:04x}", static_cast<unsigned int>(ch));
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }
    return result;
}

// 가림 → 이스케이프 순서. 싱크에서 한 번 더 가려지지만 JSON 이스케이프로
// 따옴표 경계가 바뀌기 전에 원래 형태로 검사한다.
std::string safe_field(std::string_view value) {
    static const Sanitizer sanitizer;
    return escape_json_string(sanitizer.sanitize(value).text);
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
        case LogLevel::kOff:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

LogLevel parse_log_level(std::string_view level) noexcept {
    if (level == "trace" || level == "debug") {
        return LogLevel::kDebug;
    }
    if (level == "warn" || level == "warning") {
        return LogLevel::kWarn;
    }
    if (level == "error" || level == "critical") {
        return LogLevel::kError;
    }
    if (level == "off") {
        return LogLevel::kOff;
    }
    return LogLevel::kInfo;
}

RejectionLog to_rejection_log(std::string_view       source,
                              const ValidationError& error,
                              std::size_t            input_length) {
    return RejectionLog{
        std::string(source),
        error.category,
        error.code,
        error.rule,
        error.message,
        input_length,
        std::chrono::system_clock::now(),
    };
}

// ---------------------------------------------------------------------------
// make_console_logger
// ---------------------------------------------------------------------------
std::shared_ptr<spdlog::logger> StructuredLogger::make_console_logger(const std::string& name) {
    std::vector<spdlog::sink_ptr> children{std::make_shared<spdlog::sinks::stderr_sink_mt>()};
    auto redacting = std::make_shared<redacting_sink_mt>(std::move(children));

    auto logger = std::make_shared<spdlog::logger>(name, redacting);
    logger->set_pattern(kLogPattern);
    return logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        std::vector<spdlog::sink_ptr> children;

        // stderr sink (stdout 은 필터 출력 전용)
        children.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());

        if (!log_path_.empty()) {
            if (log_path_.has_parent_path()) {
                std::filesystem::create_directories(log_path_.parent_path());
            }
            // Rotating file sink (100MB, 3개 파일 유지)
            const std::size_t max_file_size = 100 * 1024 * 1024;
            const std::size_t max_files     = 3;
            children.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path_.string(), max_file_size, max_files));
        }

        // 로거에는 redacting_sink 하나만 연결한다
        auto redacting = std::make_shared<redacting_sink_mt>(std::move(children));

        logger_ = std::make_shared<spdlog::logger>("wfguard", redacting);
        logger_->set_level(to_spdlog_level(min_level_));

        // 기본 패턴: 타임스탬프 + 레벨 (구조화 로그는 각 메서드에서 JSON 으로 생성)
        logger_->set_pattern(kLogPattern);

        // 매 로그마다 플러시
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

// ---------------------------------------------------------------------------
// log_rejection: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_rejection(const RejectionLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kWarn)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"input_rejected","source":")" << safe_field(entry.source)
         << R"(","category":")" << to_string(entry.category)
         << R"(","code":")" << to_string(entry.code)
         << R"(","rule":")" << safe_field(entry.rule)
         << R"(","message":")" << safe_field(entry.message)
         << R"(","input_length":)" << entry.input_length
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->warn(json.str());
}

// ---------------------------------------------------------------------------
// log_redaction: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_redaction(const RedactionLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"output_sanitized","source":")" << safe_field(entry.source)
         << R"(","redactions":)" << entry.redactions
         << R"(,"input_bytes":)" << entry.input_bytes
         << R"(,"output_bytes":)" << entry.output_bytes
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
