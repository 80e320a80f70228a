#pragma once

// ---------------------------------------------------------------------------
// secret_references.hpp
//
// 워크플로우 텍스트에서 ${{ secrets.NAME }} 직접 참조를 찾는다.
//
// [예외 테이블]
// kAllowedSecretReferences 에 있는 이름은 보고하지 않는다.
// GITHUB_TOKEN 은 러너가 실행마다 발급하는 단기 토큰이므로 직접 참조해도
// 저장된 시크릿 노출로 보지 않는다. 이것은 정책 선택이며, 항목 추가는
// 이 테이블에만 한다.
//
// [한계]
// - 텍스트 형태만 본다. 참조가 주석 안에 있는지, 어떤 step 에서 쓰이는지는
//   판단하지 않는다.
// - secrets['NAME'] 인덱스 표기는 찾지 않는다.
// ---------------------------------------------------------------------------

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

inline constexpr std::array<std::string_view, 1> kAllowedSecretReferences{
    "GITHUB_TOKEN",
};

struct SecretReference {
    std::string name{};    // secrets. 뒤의 이름 (원문 대소문자 유지)
    std::size_t line{0};   // 1-based
};

// 등장 순서대로 반환. 이름 비교는 대소문자 무시 (GitHub 시크릿 이름 규칙).
// 정규식 실행 한도 초과 시 std::regex_error 를 던진다.
[[nodiscard]] std::vector<SecretReference> find_direct_secret_references(std::string_view content);

[[nodiscard]] bool is_allowed_secret_reference(std::string_view name);
