#pragma once

// ---------------------------------------------------------------------------
// redacting_sink.hpp
//
// 모든 로그 메시지를 Sanitizer 에 통과시킨 뒤 하위 싱크로 전달하는 spdlog 싱크.
// 프로세스의 모든 로그 출력은 이 싱크 하나를 거친다 (단일 가림 지점).
//
// [설계 원칙]
// - 호출 지점별 sanitize() 호출에 의존하지 않는다. 로거에 연결된 싱크가
//   이것 하나뿐이면, 어떤 코드가 무엇을 로그로 남기든 가림이 보장된다.
// - 하위 싱크는 이 싱크가 소유한다. 로거에는 하위 싱크를 직접 붙이지 않는다.
// - 가림은 payload(메시지 본문)에만 적용한다. 타임스탬프/레벨 같은
//   포매터 출력은 시크릿을 담을 수 없다.
//
// [재진입 주의]
// Sanitizer / PatternLibrary 는 spdlog 를 호출하지 않는다. 호출하게 되면
// 이 싱크의 mutex 를 잡은 상태에서 같은 로거로 재진입하여 교착된다.
// ---------------------------------------------------------------------------

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/details/log_msg.h>
#include <spdlog/details/null_mutex.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/base_sink.h>

#include "sanitizer/sanitizer.hpp"

template <typename Mutex>
class redacting_sink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit redacting_sink(std::vector<spdlog::sink_ptr> sinks)
        : sinks_(std::move(sinks))
    {}

    redacting_sink(const redacting_sink&)            = delete;
    redacting_sink& operator=(const redacting_sink&) = delete;

    [[nodiscard]] const std::vector<spdlog::sink_ptr>& sinks() const noexcept { return sinks_; }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        const std::string_view payload(msg.payload.data(), msg.payload.size());
        const auto redacted = sanitizer_.sanitize(payload);

        spdlog::details::log_msg copy = msg;
        copy.payload = spdlog::string_view_t(redacted.text.data(), redacted.text.size());
        // 가림으로 길이가 바뀌면 색상 구간이 어긋나므로 해제한다
        if (redacted.redactions > 0) {
            copy.color_range_start = 0;
            copy.color_range_end   = 0;
        }

        for (auto& sink : sinks_) {
            if (sink->should_log(copy.level)) {
                sink->log(copy);
            }
        }
    }

    void flush_() override {
        for (auto& sink : sinks_) {
            sink->flush();
        }
    }

    void set_pattern_(const std::string& pattern) override {
        set_formatter_(std::make_unique<spdlog::pattern_formatter>(pattern));
    }

    void set_formatter_(std::unique_ptr<spdlog::formatter> sink_formatter) override {
        spdlog::sinks::base_sink<Mutex>::formatter_ = std::move(sink_formatter);
        for (auto& sink : sinks_) {
            sink->set_formatter(spdlog::sinks::base_sink<Mutex>::formatter_->clone());
        }
    }

private:
    std::vector<spdlog::sink_ptr> sinks_;
    Sanitizer                     sanitizer_;
};

using redacting_sink_mt = redacting_sink<std::mutex>;
using redacting_sink_st = redacting_sink<spdlog::details::null_mutex>;
