#pragma once

// ---------------------------------------------------------------------------
// guard_config.hpp
//
// 검증 한도와 로깅 설정 구조체 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/guard.yaml 에서 로드된다.
//
// [설계 원칙]
// - 모든 멤버는 안전한 기본값을 가진다. 설정 파일이 없어도 기본값만으로
//   엔진이 동작해야 한다.
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ValidationLimits
//   Validator 가 적용하는 크기 상한과 URL 허용 목록.
//
//   [보안 원칙]
//   - 크기 상한은 패턴 스캔/파싱보다 먼저 적용된다. 호출자는 상한으로
//     최악 비용을 예측할 수 있다.
//   - allowed_hosts 가 비어 있으면 host 제한 없음 (scheme 만 검사).
// ---------------------------------------------------------------------------
struct ValidationLimits {
    std::size_t max_repo_length{100};
    std::size_t max_path_length{4096};
    std::size_t max_filename_length{255};
    std::size_t max_yaml_bytes{1024 * 1024};      // 1 MiB
    std::size_t max_env_value_length{4096};       // 4 KiB
    std::size_t max_url_length{2048};
    std::size_t max_ref_length{200};

    std::vector<std::string> allowed_url_schemes{"https"};
    std::vector<std::string> allowed_hosts{};      // 비어 있으면 제한 없음
};

// ---------------------------------------------------------------------------
// LoggingConfig
//   level: trace/debug/info/warn/error/critical/off
//   file_path: 비어 있으면 파일 싱크 없이 stderr 만 사용
// ---------------------------------------------------------------------------
struct LoggingConfig {
    std::string level{"info"};
    std::string file_path{};
};

struct GuardConfig {
    ValidationLimits limits{};
    LoggingConfig    logging{};
};
