#pragma once

// ---------------------------------------------------------------------------
// input_validator.hpp
//
// 도구로 들어오는 모든 비신뢰 값(CLI 인자, 파일 경로, 워크플로우 YAML,
// URL, 환경 변수)을 분류별 규칙으로 검사하고 정규화된 값을 반환한다.
//
// [규칙 평가 순서] (모든 검증기 공통, 첫 위반 규칙 하나만 보고)
//  1. 빈 입력                  → InvalidFormat
//  2. 길이/크기 상한           → TooLong      (패턴 스캔/파싱보다 먼저)
//  3. 디렉터리 탐색 (../ ..\)  → PathTraversal
//  4. NUL / 제어 문자          → NullOrControlChar
//  5. 형식 규칙                → InvalidFormat / DisallowedScheme / ParseFailure
//  6. Dangerous 패턴 스캔      → DangerousPattern
//
// [설계 원칙]
// - 상태 없음. 모든 메서드는 const 이며 스레드 간 동시 호출 가능.
// - 실패는 std::unexpected(ValidationError). 부분 수용은 없다 (fail-close).
// - 이 모듈은 로그를 남기지 않는다. 거부 기록은 호출자가 StructuredLogger
//   의 log_rejection() 으로 남긴다.
//
// [보안 원칙]
// - ValidationError::message 에 입력 원문이나 그 일부를 넣지 않는다.
//   한도 값, 허용 목록 같은 설정 값만 포함할 수 있다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "common/types.hpp"
#include "config/guard_config.hpp"

// validate_network_url 이 적용하는 기본 host 허용 목록
inline const std::vector<std::string> kDefaultNetworkHosts{
    "github.com",
    "api.github.com",
    "raw.githubusercontent.com",
    "codeload.github.com",
};

class InputValidator {
public:
    explicit InputValidator(ValidationLimits limits = {});
    ~InputValidator() = default;

    InputValidator(const InputValidator&)            = default;
    InputValidator& operator=(const InputValidator&) = default;
    InputValidator(InputValidator&&)                 = default;
    InputValidator& operator=(InputValidator&&)      = default;

    // owner/repo. 앞뒤 공백은 허용하지 않는다. 성공 시 입력 그대로.
    [[nodiscard]] ValidationResult<std::string> validate_repo(std::string_view repo) const;

    // validate_path
    //   성공 시 lexically normal 형태 ("a/./b/" → "a/b").
    //   allow_absolute=false 이면 '/', '\', "C:" 로 시작하는 경로 거부.
    //   UNC (\\server, //server) 는 allow_absolute 와 무관하게 거부.
    [[nodiscard]] ValidationResult<std::string>
    validate_path(std::string_view path, bool allow_absolute = false) const;

    [[nodiscard]] ValidationResult<std::string> validate_filename(std::string_view filename) const;

    // validate_yaml_content
    //   1) 크기 상한 (파싱 전)  2) NUL  3) 원문 Dangerous 스캔
    //   4) yaml-cpp 파싱        5) 노드 수/깊이 상한, 비표준 태그 거부
    //   6) 최상위 mapping 확인
    //
    //   [yaml-cpp 와 안전 로딩]
    //   yaml-cpp 는 태그로 객체를 생성하지 않는다. 그래도 !!python/object
    //   같은 명시 태그가 붙은 문서는 다른 도구로 넘어갈 때 위험하므로
    //   core schema 외 태그는 거부한다.
    [[nodiscard]] ValidationResult<YAML::Node> validate_yaml_content(std::string_view content) const;

    // 설정의 allowed_url_schemes / allowed_hosts 사용
    [[nodiscard]] ValidationResult<std::string> validate_url(std::string_view url) const;

    // 호출자가 scheme 허용 목록을 직접 지정 (비교는 대소문자 무시)
    [[nodiscard]] ValidationResult<std::string>
    validate_url(std::string_view url, const std::vector<std::string>& allowed_schemes) const;

    // https + kDefaultNetworkHosts
    [[nodiscard]] ValidationResult<std::string> validate_network_url(std::string_view url) const;

    [[nodiscard]] ValidationResult<std::string> validate_env_name(std::string_view name) const;

    // 빈 값은 허용한다 (빈 환경 변수는 정상).
    [[nodiscard]] ValidationResult<std::string> validate_env_value(std::string_view value) const;

    [[nodiscard]] ValidationResult<std::string>
    validate_bounded(std::string_view value, std::size_t max_length) const;

    [[nodiscard]] ValidationResult<std::string> validate_github_ref(std::string_view ref) const;

    // 7~40 자리 hex. 성공 시 소문자로 정규화.
    [[nodiscard]] ValidationResult<std::string> validate_commit_sha(std::string_view sha) const;

    // allowed_extensions 예: {".yml", ".yaml"}
    [[nodiscard]] ValidationResult<std::string>
    validate_file_extension(std::string_view filename,
                            const std::vector<std::string>& allowed_extensions) const;

    // check_shell_safe
    //   셸 명령줄에 끼워 넣을 값을 검사한다. 성공 시 입력 그대로.
    //   [한계] 인용(quoting)은 하지 않는다. 이 검사를 통과한 값도 argv 배열로
    //   전달하는 것이 원칙이다.
    [[nodiscard]] ValidationResult<std::string> check_shell_safe(std::string_view value) const;

    [[nodiscard]] const ValidationLimits& limits() const noexcept { return limits_; }

private:
    ValidationLimits limits_;
};
