#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// config/guard.yaml 을 읽어 GuardConfig 로 파싱한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는 실패 시
//   기동을 중단해야 한다 (기본값으로 조용히 진행하지 않는다).
// - 키가 없으면 구조체 기본값을 유지한다. 값이 있는데 잘못되었으면 실패.
//
// [보안 고려사항]
// - 설정 파일 경로는 호출자가 validate_path() 로 먼저 검증한다.
// - 오류 메시지에 YAML 원문을 넣지 않는다. 키 이름과 위치만 보고한다.
//
// [YAML 스키마]
//   limits:
//     max_repo_length: 100
//     max_path_length: 4096
//     max_filename_length: 255
//     max_yaml_size: 1MiB          # 정수(바이트) 또는 B/KiB/MiB 접미사
//     max_env_value_length: 4KiB
//     max_url_length: 2048
//     max_ref_length: 200
//   url:
//     allowed_schemes: [https]     # 비어 있으면 실패
//     allowed_hosts: []            # 비어 있으면 host 제한 없음
//   logging:
//     level: info
//     file: /var/log/wfguard/guard.log
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "config/guard_config.hpp"

class ConfigLoader {
public:
    ConfigLoader()  = default;
    ~ConfigLoader() = default;

    ConfigLoader(const ConfigLoader&)            = default;
    ConfigLoader& operator=(const ConfigLoader&) = default;
    ConfigLoader(ConfigLoader&&)                 = default;
    ConfigLoader& operator=(ConfigLoader&&)      = default;

    // load
    //   성공: GuardConfig
    //   실패: std::unexpected(error_message)
    //
    //   [fail-close 요구사항]
    //   파일 없음, 파싱 오류, 0 또는 상한 초과 한도, 빈 scheme 목록,
    //   형식이 잘못된 scheme/host 는 모두 실패로 처리한다.
    //   부분적으로 파싱된 설정을 반환하지 않는다.
    [[nodiscard]] static std::expected<GuardConfig, std::string>
    load(const std::filesystem::path& config_path);

    // "1MiB" → 1048576, "4KiB" → 4096, "512B"/"512" → 512
    // 형식 오류, 오버플로우: std::unexpected(사유)
    [[nodiscard]] static std::expected<std::size_t, std::string>
    parse_size(std::string_view text);
};
