// ---------------------------------------------------------------------------
// input_validator.cpp
//
// [오탐/미탐 트레이드오프]
// - YAML 원문 Dangerous 스캔은 run: 블록의 $( 나 `...` 를 가진 정상
//   워크플로우도 거부한다. 단, ${{ }} 표현식은 패턴에서 제외되어 있어
//   일반적인 워크플로우는 통과한다.
// - owner/repo 의 "." ".." 절반은 GitHub 에서 유효하지 않은 이름이며
//   탐색 시도로 간주하여 PathTraversal 로 거부한다.
// - 파일 경로의 Windows 예약 이름(CON, NUL, COM1 ...) 은 리눅스에서도
//   거부한다. 결과물이 Windows 러너로 넘어갈 수 있기 때문이다.
//
// [YAML 자원 상한]
// yaml-cpp 는 앨리어스를 같은 노드로 공유하지만, 트리 순회는 앨리어스를
// 매번 다시 방문한다. 순회 노드 수 상한(kMaxYamlNodes)으로 billion-laughs
// 형태의 문서를 거부한다.
// ---------------------------------------------------------------------------

#include "validator/input_validator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <optional>
#include <regex>

#include <fmt/format.h>

#include "patterns/pattern_library.hpp"
#include "validator/url_parser.hpp"

namespace {

constexpr std::size_t kMaxYamlNodes = 100000;
constexpr std::size_t kMaxYamlDepth = 256;
constexpr std::size_t kMaxShaLength = 40;
constexpr std::size_t kMinShaLength = 7;

constexpr std::array<std::string_view, 22> kReservedWindowsNames{
    "CON",  "PRN",  "AUX",  "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
};

constexpr std::array<std::string_view, 2> kReservedEnvNames{"LD_PRELOAD", "IFS"};

// yaml-cpp 가 untagged 노드에 부여하는 태그 ("?" plain, "!" quoted) 와
// core schema 태그만 허용한다.
constexpr std::array<std::string_view, 12> kAllowedYamlTags{
    "",
    "?",
    "!",
    "tag:yaml.org,2002:str",
    "tag:yaml.org,2002:int",
    "tag:yaml.org,2002:float",
    "tag:yaml.org,2002:bool",
    "tag:yaml.org,2002:null",
    "tag:yaml.org,2002:map",
    "tag:yaml.org,2002:seq",
    "tag:yaml.org,2002:binary",
    "tag:yaml.org,2002:timestamp",
};

[[nodiscard]] std::unexpected<ValidationError> reject(ValidationErrorCode code,
                                                      InputCategory       category,
                                                      std::string         rule,
                                                      std::string         message) {
    return std::unexpected(ValidationError{code, category, std::move(rule), std::move(message)});
}

[[nodiscard]] std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

[[nodiscard]] std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

[[nodiscard]] bool contains_traversal(std::string_view s) noexcept {
    return s.find("../") != std::string_view::npos || s.find("..\\") != std::string_view::npos;
}

// allow_line_breaks: YAML 처럼 \t \n \r 이 정상인 입력용
[[nodiscard]] bool has_control_char(std::string_view s, bool allow_line_breaks) noexcept {
    return std::any_of(s.begin(), s.end(), [allow_line_breaks](char c) {
        const auto u = static_cast<unsigned char>(c);
        if (allow_line_breaks && (c == '\t' || c == '\n' || c == '\r')) {
            return false;
        }
        return u < 0x20 || u == 0x7f;
    });
}

[[nodiscard]] bool is_name_char(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) != 0 || c == '.' || c == '_' || c == '-';
}

// 경로 구성 요소의 '.' 앞 부분이 Windows 예약 이름인지 검사 ("nul.txt" 포함)
[[nodiscard]] bool is_reserved_windows_name(std::string_view component) {
    const auto base  = component.substr(0, component.find('.'));
    const auto upper = to_upper(base);
    return std::find(kReservedWindowsNames.begin(), kReservedWindowsNames.end(), upper) !=
           kReservedWindowsNames.end();
}

// '/' 와 '\' 양쪽을 구분자로 보고 구성 요소를 나눈다
[[nodiscard]] std::vector<std::string_view> split_components(std::string_view path) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    for (std::size_t i = 0; i <= path.size(); ++i) {
        if (i == path.size() || path[i] == '/' || path[i] == '\\') {
            if (i > start) {
                parts.push_back(path.substr(start, i - start));
            }
            start = i + 1;
        }
    }
    return parts;
}

// ---------------------------------------------------------------------------
// scan_dangerous
//   Pattern Library 의 Dangerous 패턴을 적용한다.
//   traversal 카테고리 매치는 PathTraversal, 그 외는 DangerousPattern.
//   메시지에는 카테고리 이름만 넣는다 (매치된 원문 금지).
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<ValidationError> scan_dangerous(std::string_view text,
                                                            InputCategory    category) {
    const auto match = PatternLibrary::instance().first_dangerous(text);
    if (!match) {
        return std::nullopt;
    }
    if (match->category == PatternCategory::kTraversal) {
        return ValidationError{
            ValidationErrorCode::kPathTraversal, category, std::string(match->name),
            "directory traversal sequence is not allowed"};
    }
    return ValidationError{
        ValidationErrorCode::kDangerousPattern, category, std::string(match->name),
        fmt::format("value matches a dangerous {} pattern", to_string(match->category))};
}

// ---------------------------------------------------------------------------
// check_yaml_tree
//   노드 수/깊이 상한과 명시 태그를 검사한다. 첫 위반만 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::optional<ValidationError> check_yaml_tree(const YAML::Node& node,
                                                             std::size_t       depth,
                                                             std::size_t&      visited) {
    if (++visited > kMaxYamlNodes) {
        return ValidationError{
            ValidationErrorCode::kTooLong, InputCategory::kYamlDocument, "max-nodes",
            fmt::format("YAML document exceeds {} nodes", kMaxYamlNodes)};
    }
    if (depth > kMaxYamlDepth) {
        return ValidationError{
            ValidationErrorCode::kTooLong, InputCategory::kYamlDocument, "max-depth",
            fmt::format("YAML document nesting exceeds depth {}", kMaxYamlDepth)};
    }

    const std::string& tag = node.Tag();
    if (std::find(kAllowedYamlTags.begin(), kAllowedYamlTags.end(), tag) ==
        kAllowedYamlTags.end()) {
        return ValidationError{
            ValidationErrorCode::kDangerousPattern, InputCategory::kYamlDocument,
            "explicit-type-tag", "YAML explicit type tags outside the core schema are not allowed"};
    }

    if (node.IsMap()) {
        for (const auto& kv : node) {
            if (auto err = check_yaml_tree(kv.first, depth + 1, visited)) {
                return err;
            }
            if (auto err = check_yaml_tree(kv.second, depth + 1, visited)) {
                return err;
            }
        }
    } else if (node.IsSequence()) {
        for (const auto& item : node) {
            if (auto err = check_yaml_tree(item, depth + 1, visited)) {
                return err;
            }
        }
    }
    return std::nullopt;
}

[[nodiscard]] std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) {
            out += ", ";
        }
        out += item;
    }
    return out;
}

// ---------------------------------------------------------------------------
// validate_url_with
//   validate_url 계열의 공통 구현. hosts 가 비어 있으면 host 제한 없음.
// ---------------------------------------------------------------------------
[[nodiscard]] ValidationResult<std::string>
validate_url_with(std::string_view                url,
                  const std::vector<std::string>& schemes,
                  const std::vector<std::string>& hosts,
                  std::size_t                     max_length) {
    constexpr auto kCat = InputCategory::kUrl;

    if (url.empty()) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "non-empty",
                      "URL must not be empty");
    }
    if (url.size() > max_length) {
        return reject(ValidationErrorCode::kTooLong, kCat, "max-length",
                      fmt::format("URL exceeds {} characters", max_length));
    }
    if (contains_traversal(url)) {
        return reject(ValidationErrorCode::kPathTraversal, kCat, "path-traversal",
                      "directory traversal sequence is not allowed");
    }
    // URL 안의 공백도 제어 문자와 같이 취급한다
    if (std::any_of(url.begin(), url.end(), [](char c) {
            const auto u = static_cast<unsigned char>(c);
            return u <= 0x20 || u == 0x7f;
        })) {
        return reject(ValidationErrorCode::kNullOrControlChar, kCat, "control-or-space",
                      "URL must not contain whitespace or control characters");
    }

    auto parsed = parse_url(url);
    if (!parsed) {
        return reject(ValidationErrorCode::kParseFailure, kCat, "url-syntax",
                      fmt::format("URL is malformed: {}", to_string(parsed.error())));
    }

    const auto scheme = to_lower(parsed->scheme);
    const bool scheme_ok = std::any_of(schemes.begin(), schemes.end(),
                                       [&scheme](const std::string& s) {
                                           return to_lower(s) == scheme;
                                       });
    if (!scheme_ok) {
        return reject(ValidationErrorCode::kDisallowedScheme, kCat, "scheme-allow-list",
                      fmt::format("URL scheme is not in the allowed list ({})", join(schemes)));
    }

    if (parsed->has_credentials()) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "embedded-credentials",
                      "URL must not contain embedded user information");
    }

    if (auto err = scan_dangerous(url, kCat)) {
        return std::unexpected(std::move(*err));
    }

    if (!hosts.empty()) {
        const auto host = to_lower(parsed->host);
        const bool host_ok = std::any_of(hosts.begin(), hosts.end(),
                                         [&host](const std::string& h) {
                                             return to_lower(h) == host;
                                         });
        if (!host_ok) {
            return reject(ValidationErrorCode::kInvalidFormat, kCat, "host-allow-list",
                          fmt::format("URL host is not in the allowed list ({})", join(hosts)));
        }
    }

    return to_normalized_string(*parsed);
}

}  // namespace

InputValidator::InputValidator(ValidationLimits limits)
    : limits_(std::move(limits))
{}

// ---------------------------------------------------------------------------
// validate_repo
// ---------------------------------------------------------------------------
ValidationResult<std::string> InputValidator::validate_repo(std::string_view repo) const {
    constexpr auto kCat = InputCategory::kRepository;

    if (repo.empty()) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "non-empty",
                      "repository identifier must not be empty");
    }
    if (repo.size() > limits_.max_repo_length) {
        return reject(ValidationErrorCode::kTooLong, kCat, "max-length",
                      fmt::format("repository identifier exceeds {} characters",
                                  limits_.max_repo_length));
    }
    if (contains_traversal(repo)) {
        return reject(ValidationErrorCode::kPathTraversal, kCat, "path-traversal",
                      "directory traversal sequence is not allowed");
    }
    if (has_control_char(repo, false)) {
        return reject(ValidationErrorCode::kNullOrControlChar, kCat, "control-char",
                      "repository identifier must not contain control characters");
    }

    const auto slash = repo.find('/');
    if (slash == std::string_view::npos || repo.find('/', slash + 1) != std::string_view::npos) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "owner-repo-shape",
                      "repository identifier must have the form owner/repo");
    }
    const auto owner = repo.substr(0, slash);
    const auto name  = repo.substr(slash + 1);
    if (owner.empty() || name.empty() ||
        !std::all_of(owner.begin(), owner.end(), is_name_char) ||
        !std::all_of(name.begin(), name.end(), is_name_char)) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "owner-repo-shape",
                      "repository identifier must have the form owner/repo "
                      "using [A-Za-z0-9._-]");
    }
    if (owner == "." || owner == ".." || name == "." || name == "..") {
        return reject(ValidationErrorCode::kPathTraversal, kCat, "dot-segment",
                      "repository owner or name must not be '.' or '..'");
    }

    if (auto err = scan_dangerous(repo, kCat)) {
        return std::unexpected(std::move(*err));
    }
    return std::string(repo);
}

// ---------------------------------------------------------------------------
// validate_path
// ---------------------------------------------------------------------------
ValidationResult<std::string>
InputValidator::validate_path(std::string_view path, bool allow_absolute) const {
    constexpr auto kCat = InputCategory::kFilePath;

    if (path.empty()) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "non-empty",
                      "file path must not be empty");
    }
    if (path.size() > limits_.max_path_length) {
        return reject(ValidationErrorCode::kTooLong, kCat, "max-length",
                      fmt::format("file path exceeds {} characters", limits_.max_path_length));
    }

    const auto components = split_components(path);
    if (std::any_of(components.begin(), components.end(),
                    [](std::string_view c) { return c == ".."; })) {
        return reject(ValidationErrorCode::kPathTraversal, kCat, "path-traversal",
                      "directory traversal is not allowed in file paths");
    }
    if (has_control_char(path, false)) {
        return reject(ValidationErrorCode::kNullOrControlChar, kCat, "control-char",
                      "file path must not contain NUL or control characters");
    }

    if (path.starts_with("\\\\") || path.starts_with("//")) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "unc-path",
                      "UNC paths are not allowed");
    }
    const bool drive_letter = path.size() >= 2 &&
                              std::isalpha(static_cast<unsigned char>(path[0])) != 0 &&
                              path[1] == ':';
    const bool absolute = path.front() == '/' || path.front() == '\\' || drive_letter;
    if (absolute && !allow_absolute) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "absolute-path",
                      "absolute paths are not allowed");
    }
    for (const auto component : components) {
        // 드라이브 문자 구성 요소 ("C:") 는 예약 이름 검사 대상이 아니다
        if (drive_letter && component.data() == path.data()) {
            continue;
        }
        if (is_reserved_windows_name(component)) {
            return reject(ValidationErrorCode::kInvalidFormat, kCat, "reserved-name",
                          "file path contains a reserved device name");
        }
    }

    if (auto err = scan_dangerous(path, kCat)) {
        return std::unexpected(std::move(*err));
    }

    std::string cleaned =
        std::filesystem::path(std::string(path)).lexically_normal().generic_string();
    while (cleaned.size() > 1 && cleaned.back() == '/') {
        cleaned.pop_back();
    }
    if (cleaned.empty()) {
        cleaned = ".";
    }
    return cleaned;
}

// ---------------------------------------------------------------------------
// validate_filename
// ---------------------------------------------------------------------------
ValidationResult<std::string> InputValidator::validate_filename(std::string_view filename) const {
    constexpr auto kCat = InputCategory::kFilename;

    if (filename.empty()) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "non-empty",
                      "filename must not be empty");
    }
    if (filename.size() > limits_.max_filename_length) {
        return reject(ValidationErrorCode::kTooLong, kCat, "max-length",
                      fmt::format("filename exceeds {} characters", limits_.max_filename_length));
    }
    if (contains_traversal(filename) || filename == "..") {
        return reject(ValidationErrorCode::kPathTraversal, kCat, "path-traversal",
                      "directory traversal is not allowed in filenames");
    }
    if (has_control_char(filename, false)) {
        return reject(ValidationErrorCode::kNullOrControlChar, kCat, "control-char",
                      "filename must not contain NUL or control characters");
    }
    if (filename.find_first_of("/\\") != std::string_view::npos) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "path-separator",
                      "filename must not contain path separators");
    }
    if (filename == "." || is_reserved_windows_name(filename)) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "reserved-name",
                      "filename is a reserved name");
    }
    if (auto err = scan_dangerous(filename, kCat)) {
        return std::unexpected(std::move(*err));
    }
    return std::string(filename);
}

// ---------------------------------------------------------------------------
// validate_yaml_content
// ---------------------------------------------------------------------------
ValidationResult<YAML::Node>
InputValidator::validate_yaml_content(std::string_view content) const {
    constexpr auto kCat = InputCategory::kYamlDocument;

    if (content.empty()) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "non-empty",
                      "YAML content must not be empty");
    }
    // 크기 상한은 어떤 스캔보다 먼저
    if (content.size() > limits_.max_yaml_bytes) {
        return reject(ValidationErrorCode::kTooLong, kCat, "max-size",
                      fmt::format("YAML content exceeds {} bytes", limits_.max_yaml_bytes));
    }
    if (std::all_of(content.begin(), content.end(),
                    [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; })) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "non-empty",
                      "YAML content must not be blank");
    }
    if (has_control_char(content, true)) {
        return reject(ValidationErrorCode::kNullOrControlChar, kCat, "control-char",
                      "YAML content must not contain NUL or control characters");
    }
    if (auto err = scan_dangerous(content, kCat)) {
        return std::unexpected(std::move(*err));
    }

    YAML::Node root;
    try {
        root = YAML::Load(std::string(content));
    } catch (const YAML::ParserException& e) {
        // 파서 메시지는 원문 조각을 포함할 수 있으므로 위치만 보고한다
        return reject(ValidationErrorCode::kParseFailure, kCat, "yaml-syntax",
                      fmt::format("YAML syntax error at line {}, column {}",
                                  e.mark.line + 1, e.mark.column + 1));
    } catch (const YAML::Exception&) {
        return reject(ValidationErrorCode::kParseFailure, kCat, "yaml-syntax",
                      "YAML content could not be parsed");
    }

    if (!root || !root.IsMap()) {
        return reject(ValidationErrorCode::kNotAMapping, kCat, "top-level-mapping",
                      "YAML top level must be a mapping");
    }

    try {
        std::size_t visited = 0;
        if (auto err = check_yaml_tree(root, 0, visited)) {
            return std::unexpected(std::move(*err));
        }
    } catch (const YAML::Exception&) {
        return reject(ValidationErrorCode::kParseFailure, kCat, "yaml-structure",
                      "YAML content could not be traversed");
    }

    return root;
}

// ---------------------------------------------------------------------------
// validate_url
// ---------------------------------------------------------------------------
ValidationResult<std::string> InputValidator::validate_url(std::string_view url) const {
    return validate_url_with(url, limits_.allowed_url_schemes, limits_.allowed_hosts,
                             limits_.max_url_length);
}

ValidationResult<std::string>
InputValidator::validate_url(std::string_view                url,
                             const std::vector<std::string>& allowed_schemes) const {
    return validate_url_with(url, allowed_schemes, limits_.allowed_hosts, limits_.max_url_length);
}

ValidationResult<std::string> InputValidator::validate_network_url(std::string_view url) const {
    static const std::vector<std::string> kHttpsOnly{"https"};
    return validate_url_with(url, kHttpsOnly, kDefaultNetworkHosts, limits_.max_url_length);
}

// ---------------------------------------------------------------------------
// 환경 변수
// ---------------------------------------------------------------------------
ValidationResult<std::string> InputValidator::validate_env_name(std::string_view name) const {
    constexpr auto kCat = InputCategory::kEnvName;

    if (name.empty()) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "non-empty",
                      "environment variable name must not be empty");
    }
    if (name.size() > limits_.max_env_value_length) {
        return reject(ValidationErrorCode::kTooLong, kCat, "max-length",
                      fmt::format("environment variable name exceeds {} characters",
                                  limits_.max_env_value_length));
    }
    if (contains_traversal(name)) {
        return reject(ValidationErrorCode::kPathTraversal, kCat, "path-traversal",
                      "directory traversal sequence is not allowed");
    }

    const auto first_ok = [](char c) { return (c >= 'A' && c <= 'Z') || c == '_'; };
    const auto rest_ok  = [](char c) {
        return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    };
    if (!first_ok(name.front()) || !std::all_of(name.begin() + 1, name.end(), rest_ok)) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "env-name-shape",
                      "environment variable name must match ^[A-Z_][A-Z0-9_]*$");
    }
    if (std::find(kReservedEnvNames.begin(), kReservedEnvNames.end(), name) !=
        kReservedEnvNames.end()) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "reserved-name",
                      "environment variable name is reserved");
    }
    return std::string(name);
}

ValidationResult<std::string> InputValidator::validate_env_value(std::string_view value) const {
    constexpr auto kCat = InputCategory::kEnvValue;

    if (value.size() > limits_.max_env_value_length) {
        return reject(ValidationErrorCode::kTooLong, kCat, "max-length",
                      fmt::format("environment variable value exceeds {} characters",
                                  limits_.max_env_value_length));
    }
    if (contains_traversal(value)) {
        return reject(ValidationErrorCode::kPathTraversal, kCat, "path-traversal",
                      "directory traversal sequence is not allowed");
    }
    if (has_control_char(value, false)) {
        return reject(ValidationErrorCode::kNullOrControlChar, kCat, "control-char",
                      "environment variable value must not contain NUL or control characters");
    }
    if (auto err = scan_dangerous(value, kCat)) {
        return std::unexpected(std::move(*err));
    }
    return std::string(value);
}

ValidationResult<std::string>
InputValidator::validate_bounded(std::string_view value, std::size_t max_length) const {
    constexpr auto kCat = InputCategory::kBoundedString;

    if (value.size() > max_length) {
        return reject(ValidationErrorCode::kTooLong, kCat, "max-length",
                      fmt::format("value exceeds {} characters", max_length));
    }
    if (contains_traversal(value)) {
        return reject(ValidationErrorCode::kPathTraversal, kCat, "path-traversal",
                      "directory traversal sequence is not allowed");
    }
    if (has_control_char(value, true)) {
        return reject(ValidationErrorCode::kNullOrControlChar, kCat, "control-char",
                      "value must not contain NUL or control characters");
    }
    if (auto err = scan_dangerous(value, kCat)) {
        return std::unexpected(std::move(*err));
    }
    return std::string(value);
}

// ---------------------------------------------------------------------------
// git ref / commit SHA
// ---------------------------------------------------------------------------
ValidationResult<std::string> InputValidator::validate_github_ref(std::string_view ref) const {
    constexpr auto kCat = InputCategory::kGitRef;

    if (ref.empty()) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "non-empty",
                      "git reference must not be empty");
    }
    if (ref.size() > limits_.max_ref_length) {
        return reject(ValidationErrorCode::kTooLong, kCat, "max-length",
                      fmt::format("git reference exceeds {} characters", limits_.max_ref_length));
    }
    if (ref.find("..") != std::string_view::npos) {
        return reject(ValidationErrorCode::kPathTraversal, kCat, "dot-dot",
                      "git reference must not contain '..'");
    }
    if (has_control_char(ref, false)) {
        return reject(ValidationErrorCode::kNullOrControlChar, kCat, "control-char",
                      "git reference must not contain control characters");
    }
    if (!std::all_of(ref.begin(), ref.end(),
                     [](char c) { return is_name_char(c) || c == '/'; })) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "ref-charset",
                      "git reference must use only [A-Za-z0-9._/-]");
    }
    if (auto err = scan_dangerous(ref, kCat)) {
        return std::unexpected(std::move(*err));
    }
    return std::string(ref);
}

ValidationResult<std::string> InputValidator::validate_commit_sha(std::string_view sha) const {
    constexpr auto kCat = InputCategory::kCommitSha;

    if (sha.empty()) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "non-empty",
                      "commit SHA must not be empty");
    }
    if (sha.size() > kMaxShaLength) {
        return reject(ValidationErrorCode::kTooLong, kCat, "max-length",
                      fmt::format("commit SHA exceeds {} characters", kMaxShaLength));
    }
    if (contains_traversal(sha)) {
        return reject(ValidationErrorCode::kPathTraversal, kCat, "path-traversal",
                      "directory traversal sequence is not allowed");
    }
    if (sha.size() < kMinShaLength ||
        !std::all_of(sha.begin(), sha.end(),
                     [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; })) {
        return reject(ValidationErrorCode::kInvalidFormat, kCat, "sha-shape",
                      fmt::format("commit SHA must be {} to {} hexadecimal characters",
                                  kMinShaLength, kMaxShaLength));
    }
    return to_lower(sha);
}

ValidationResult<std::string>
InputValidator::validate_file_extension(std::string_view                filename,
                                        const std::vector<std::string>& allowed_extensions) const {
    auto checked = validate_filename(filename);
    if (!checked) {
        return checked;
    }

    const auto lowered = to_lower(*checked);
    const bool ok = std::any_of(allowed_extensions.begin(), allowed_extensions.end(),
                                [&lowered](const std::string& ext) {
                                    return !ext.empty() && lowered.ends_with(to_lower(ext));
                                });
    if (!ok) {
        return reject(ValidationErrorCode::kInvalidFormat, InputCategory::kFilename,
                      "file-extension",
                      fmt::format("file extension must be one of: {}", join(allowed_extensions)));
    }
    return checked;
}

// ---------------------------------------------------------------------------
// check_shell_safe
// ---------------------------------------------------------------------------
ValidationResult<std::string> InputValidator::check_shell_safe(std::string_view value) const {
    constexpr auto kCat = InputCategory::kShellArgument;

    static const std::regex kShellWords(R"(\b(?:eval|exec|system|popen)\b)",
                                        std::regex_constants::icase |
                                        std::regex_constants::ECMAScript);
    static const std::regex kEscapes(R"(\\x[0-9a-fA-F]{2}|\\[0-7]{1,3})",
                                     std::regex_constants::ECMAScript);

    if (value.size() > limits_.max_env_value_length) {
        return reject(ValidationErrorCode::kTooLong, kCat, "max-length",
                      fmt::format("shell argument exceeds {} characters",
                                  limits_.max_env_value_length));
    }
    if (contains_traversal(value)) {
        return reject(ValidationErrorCode::kPathTraversal, kCat, "path-traversal",
                      "directory traversal sequence is not allowed");
    }
    if (has_control_char(value, false)) {
        return reject(ValidationErrorCode::kNullOrControlChar, kCat, "control-char",
                      "shell argument must not contain NUL or control characters");
    }
    if (value.find_first_of(";&|`$(){}<>*?[]~") != std::string_view::npos) {
        return reject(ValidationErrorCode::kDangerousPattern, kCat, "shell-metacharacter",
                      "shell argument contains a shell metacharacter");
    }

    const char* first = value.data();
    const char* last  = value.data() + value.size();
    try {
        if (std::regex_search(first, last, kShellWords)) {
            return reject(ValidationErrorCode::kDangerousPattern, kCat, "shell-command-word",
                          "shell argument contains eval, exec, system or popen");
        }
        if (std::regex_search(first, last, kEscapes)) {
            return reject(ValidationErrorCode::kDangerousPattern, kCat, "escape-sequence",
                          "shell argument contains a hex or octal escape sequence");
        }
    } catch (const std::regex_error&) {
        return reject(ValidationErrorCode::kDangerousPattern, kCat, "shell-scan",
                      "shell argument could not be scanned");
    }

    if (auto err = scan_dangerous(value, kCat)) {
        return std::unexpected(std::move(*err));
    }
    return std::string(value);
}
