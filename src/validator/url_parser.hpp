#pragma once

// ---------------------------------------------------------------------------
// url_parser.hpp
//
// ada (WHATWG URL) 파서 위에 얹은 얇은 래퍼. 검증기가 보는 구성 요소만
// 꺼내 ParsedUrl 로 복사한다.
//
// [설계 원칙]
// - 구성 요소는 string 으로 복사해 보관한다 (ada 결과 수명 비의존).
// - 스킴 문자열, 호스트 정규화, 포트 범위 검사는 ada 가 맡는다.
//   비특수 스킴(ssh:// 등)의 불투명 호스트는 ada 가 대소문자를 보존하므로
//   여기서 소문자로 맞춘다.
// - 파싱 실패는 std::unexpected(UrlParseError) 로 반환하며 예외를 던지지 않는다.
//
// [알려진 한계]
// - 호스트가 없는 URL (mailto:, javascript:, file:/// 등) 은 거부한다.
//   이 엔진이 받아야 할 URL 은 전부 호스트를 가진 계층형이다.
// - ada 는 기본 포트(https 의 443 등)를 직렬화에서 제거한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

struct ParsedUrl {
    std::string                  scheme{};     // ':' 제외, 소문자
    std::string                  username{};   // 퍼센트 인코딩된 원형
    std::string                  password{};
    std::string                  host{};       // 소문자. IPv6 는 대괄호 포함
    std::optional<std::uint16_t> port{};       // 기본 포트면 nullopt
    std::string                  rest{};       // 경로 + 쿼리 + 프래그먼트

    [[nodiscard]] bool has_credentials() const noexcept {
        return !username.empty() || !password.empty();
    }
};

enum class UrlParseError : std::uint8_t {
    kMalformed   = 0,  // ada 파싱 실패
    kMissingHost = 1,  // opaque URL 또는 빈 호스트
};

[[nodiscard]] std::expected<ParsedUrl, UrlParseError> parse_url(std::string_view url);

// WHATWG 직렬화 규칙으로 재조립한다. 비특수 스킴도 호스트는 소문자.
[[nodiscard]] std::string to_normalized_string(const ParsedUrl& url);

[[nodiscard]] std::string_view to_string(UrlParseError error) noexcept;
