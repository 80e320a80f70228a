// ---------------------------------------------------------------------------
// config_loader.cpp
//
// [설계 원칙]
// - All-or-nothing: 어느 섹션이든 오류가 있으면 설정 전체를 거부한다.
// - 한도 값은 정수 또는 "4KiB" 형태 문자열 모두 허용한다.
// - 한도 0 은 모든 입력 거부와 같으므로 설정 실수로 보고 실패 처리한다.
// - 한도 상한(kMaxLimitBytes)은 "사실상 무제한" 설정으로 크기 검사를
//   무력화하는 것을 막는다.
//
// [알려진 한계]
// - logging.level 이 알 수 없는 값이면 경고 후 "info" 를 적용한다
//   (로그 수준은 보안 판정에 영향이 없으므로 fail-close 대상이 아님).
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <functional>
#include <limits>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kMaxLimitBytes = 64 * 1024 * 1024;

constexpr std::array<std::string_view, 7> kLogLevels{
    "trace", "debug", "info", "warn", "error", "critical", "off",
};

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// sequence 가 아니면 std::unexpected.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<std::string>, std::string>
read_string_sequence(const YAML::Node& node, std::string_view key) {
    std::vector<std::string> result;
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsSequence()) {
        return std::unexpected(fmt::format("'{}' must be a sequence of strings", key));
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return std::unexpected(fmt::format("'{}' must contain only scalar values", key));
        }
        result.push_back(item.as<std::string>());
    }
    return result;
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    return node.as<std::string>();
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 크기 한도 하나를 읽는다. 키가 없으면 현재 값 유지.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<void, std::string>
read_limit(const YAML::Node& parent, std::string_view key, std::size_t& target) {
    const YAML::Node node = parent[std::string(key)];
    if (!node) {
        return {};
    }
    if (!node.IsScalar()) {
        return std::unexpected(fmt::format("'limits.{}' must be a scalar", key));
    }

    auto parsed = ConfigLoader::parse_size(node.Scalar());
    if (!parsed) {
        return std::unexpected(fmt::format("'limits.{}': {}", key, parsed.error()));
    }
    if (*parsed == 0) {
        return std::unexpected(fmt::format("'limits.{}' must be greater than zero", key));
    }
    if (*parsed > kMaxLimitBytes) {
        return std::unexpected(
            fmt::format("'limits.{}' must not exceed {} bytes", key, kMaxLimitBytes));
    }
    target = *parsed;
    return {};
}

[[nodiscard]] std::expected<void, std::string>
parse_limits(const YAML::Node& node, ValidationLimits& limits) {
    if (!node || node.IsNull()) {
        return {};
    }
    if (!node.IsMap()) {
        return std::unexpected(std::string("'limits' must be a mapping"));
    }

    const std::array<std::pair<std::string_view, std::size_t*>, 7> fields{{
        {"max_repo_length",      &limits.max_repo_length},
        {"max_path_length",      &limits.max_path_length},
        {"max_filename_length",  &limits.max_filename_length},
        {"max_yaml_size",        &limits.max_yaml_bytes},
        {"max_env_value_length", &limits.max_env_value_length},
        {"max_url_length",       &limits.max_url_length},
        {"max_ref_length",       &limits.max_ref_length},
    }};

    for (const auto& [key, target] : fields) {
        if (auto r = read_limit(node, key, *target); !r) {
            return r;
        }
    }
    return {};
}

// RFC 3986 scheme: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ), 소문자로 정규화
[[nodiscard]] bool is_valid_scheme(std::string_view scheme) noexcept {
    if (scheme.empty() || scheme.size() > 32 ||
        std::isalpha(static_cast<unsigned char>(scheme.front())) == 0) {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '+' || c == '-' || c == '.';
    });
}

[[nodiscard]] bool is_valid_host(std::string_view host) noexcept {
    if (host.empty() || host.size() > 253) {
        return false;
    }
    return std::all_of(host.begin(), host.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '.';
    });
}

[[nodiscard]] std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

[[nodiscard]] std::expected<void, std::string>
parse_url_section(const YAML::Node& node, ValidationLimits& limits) {
    if (!node || node.IsNull()) {
        return {};
    }
    if (!node.IsMap()) {
        return std::unexpected(std::string("'url' must be a mapping"));
    }

    if (node["allowed_schemes"]) {
        auto schemes = read_string_sequence(node["allowed_schemes"], "url.allowed_schemes");
        if (!schemes) {
            return std::unexpected(schemes.error());
        }
        // [Fail-close] 빈 목록은 모든 URL 거부와 같다. 설정 실수로 본다.
        if (schemes->empty()) {
            return std::unexpected(
                std::string("'url.allowed_schemes' must list at least one scheme"));
        }
        for (auto& s : *schemes) {
            if (!is_valid_scheme(s)) {
                return std::unexpected(
                    std::string("'url.allowed_schemes' contains an invalid scheme name"));
            }
            s = to_lower(std::move(s));
        }
        limits.allowed_url_schemes = std::move(*schemes);
    }

    auto hosts = read_string_sequence(node["allowed_hosts"], "url.allowed_hosts");
    if (!hosts) {
        return std::unexpected(hosts.error());
    }
    for (auto& h : *hosts) {
        if (!is_valid_host(h)) {
            return std::unexpected(
                std::string("'url.allowed_hosts' contains an invalid host name"));
        }
        h = to_lower(std::move(h));
    }
    limits.allowed_hosts = std::move(*hosts);
    return {};
}

[[nodiscard]] std::expected<void, std::string>
parse_logging(const YAML::Node& node, LoggingConfig& logging) {
    if (!node || node.IsNull()) {
        return {};
    }
    if (!node.IsMap()) {
        return std::unexpected(std::string("'logging' must be a mapping"));
    }

    logging.level     = to_lower(read_string(node["level"], logging.level));
    logging.file_path = read_string(node["file"], logging.file_path);

    if (std::find(kLogLevels.begin(), kLogLevels.end(), logging.level) == kLogLevels.end()) {
        spdlog::warn("config_loader: logging.level is not a known level, defaulting to 'info'");
        logging.level = "info";
    }
    return {};
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::parse_size
// ---------------------------------------------------------------------------
std::expected<std::size_t, std::string> ConfigLoader::parse_size(std::string_view text) {
    if (text.empty()) {
        return std::unexpected(std::string("size value is empty"));
    }

    const char* begin = text.data();
    const char* end   = text.data() + text.size();

    std::size_t value{0};
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec == std::errc::result_out_of_range) {
        return std::unexpected(std::string("size value is out of range"));
    }
    if (ec != std::errc{}) {
        return std::unexpected(std::string("size value must start with a number"));
    }

    const std::string_view unit(ptr, static_cast<std::size_t>(end - ptr));
    std::size_t multiplier = 1;
    if (unit.empty() || unit == "B") {
        multiplier = 1;
    } else if (unit == "KiB") {
        multiplier = 1024;
    } else if (unit == "MiB") {
        multiplier = 1024 * 1024;
    } else {
        return std::unexpected(std::string("size unit must be one of B, KiB, MiB"));
    }

    if (value > std::numeric_limits<std::size_t>::max() / multiplier) {
        return std::unexpected(std::string("size value is out of range"));
    }
    return value * multiplier;
}

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<GuardConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading configuration from '{}'", canonical_path.string());

    // 2. YAML 로드
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile&) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}'", canonical_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        // 파서 메시지는 원문 조각을 담을 수 있으므로 위치만 보고한다
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1);
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception&) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}'", canonical_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)", canonical_path.string());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 섹션별 파싱 (어느 하나라도 실패하면 전체 실패)
    GuardConfig cfg{};

    struct Section {
        std::string_view                                   name;
        std::function<std::expected<void, std::string>()> parse;
    };
    const std::array<Section, 3> sections{{
        {"limits",  [&] { return parse_limits(root["limits"], cfg.limits); }},
        {"url",     [&] { return parse_url_section(root["url"], cfg.limits); }},
        {"logging", [&] { return parse_logging(root["logging"], cfg.logging); }},
    }};

    for (const auto& section : sections) {
        std::expected<void, std::string> result;
        try {
            result = section.parse();
        } catch (const YAML::Exception&) {
            result = std::unexpected(fmt::format("'{}' section is malformed", section.name));
        }
        if (!result) {
            const std::string err = fmt::format(
                "config_loader: error in '{}' section: {}", section.name, result.error());
            spdlog::error("{}", err);
            return std::unexpected(err);
        }
    }

    spdlog::info(
        "config_loader: configuration loaded - max_yaml_size={}, max_env_value_length={}, "
        "schemes={}, hosts={}",
        cfg.limits.max_yaml_bytes, cfg.limits.max_env_value_length,
        cfg.limits.allowed_url_schemes.size(), cfg.limits.allowed_hosts.size());

    return cfg;
}
