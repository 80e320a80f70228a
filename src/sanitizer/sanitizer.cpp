// ---------------------------------------------------------------------------
// sanitizer.cpp
//
// [겹침 처리]
// find_secrets() 결과를 (begin 오름차순, end 내림차순) 정렬한 뒤, 다음
// 구간의 begin 이 현재 병합 구간의 end 이하이면 같은 그룹으로 합친다.
// 인접 구간("...][...")도 합쳐서 마커가 연달아 붙지 않게 한다.
// 예: "GITHUB_TOKEN=ghp_xxx" 는 generic-secret-assignment 값 구간과
//     github-token 구간이 겹치므로 "GITHUB_TOKEN=[REDACTED]" 하나가 된다.
//
// [오탐/미탐 트레이드오프]
// - mask_url 은 userinfo 만 가린다. 쿼리의 token= 파라미터는 sanitize()
//   의 generic-secret-assignment 가 담당한다.
// - is_sensitive_key 는 "key" 단독 이름은 민감으로 보지만 "normal_key"
//   같은 접미사는 보지 않는다. 워크플로우의 cache key 류 설정까지
//   가리면 보고서가 쓸모없어지기 때문이다.
// ---------------------------------------------------------------------------

#include "sanitizer/sanitizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

#include "patterns/pattern_library.hpp"

namespace {

struct Span {
    std::size_t begin{0};
    std::size_t end{0};
};

constexpr std::array<std::string_view, 10> kSensitiveExactKeys{
    "token", "password", "secret", "key", "auth",
    "credential", "private", "passwd", "authorization", "bearer",
};

constexpr std::array<std::string_view, 6> kSensitiveSuffixes{
    "_token", "_password", "_secret", "_auth", "_credential", "_passwd",
};

constexpr std::array<std::string_view, 4> kSensitivePrefixes{
    "token_", "password_", "secret_", "auth_",
};

constexpr std::array<std::string_view, 5> kSensitiveInfixes{
    "github_token", "api_key", "access_token", "private_key", "secret_key",
};

[[nodiscard]] std::string normalize_key(std::string_view key) {
    std::string out(key);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return c == '-' ? '_' : static_cast<char>(std::tolower(c));
    });
    return out;
}

// 정렬 + 병합. 반환 구간은 서로 떨어져 있다.
[[nodiscard]] std::vector<Span> merge_spans(std::vector<Span> spans) {
    std::sort(spans.begin(), spans.end(), [](const Span& a, const Span& b) {
        return a.begin != b.begin ? a.begin < b.begin : a.end > b.end;
    });

    std::vector<Span> merged;
    for (const auto& s : spans) {
        if (s.end <= s.begin) {
            continue;
        }
        if (!merged.empty() && s.begin <= merged.back().end) {
            merged.back().end = std::max(merged.back().end, s.end);
        } else {
            merged.push_back(s);
        }
    }
    return merged;
}

[[nodiscard]] RedactionResult apply_spans(std::string_view text, const std::vector<Span>& spans) {
    RedactionResult result{};
    result.text.reserve(text.size());

    std::size_t cursor = 0;
    for (const auto& s : spans) {
        result.text.append(text.substr(cursor, s.begin - cursor));
        result.text.append(kRedactionMarker);
        cursor = s.end;
    }
    result.text.append(text.substr(cursor));
    result.redactions = spans.size();
    return result;
}

}  // namespace

RedactionResult Sanitizer::sanitize(std::string_view text) const {
    if (text.empty()) {
        return RedactionResult{};
    }

    const auto matches = PatternLibrary::instance().find_secrets(text);
    if (matches.empty()) {
        return RedactionResult{std::string(text), 0};
    }

    std::vector<Span> spans;
    spans.reserve(matches.size());
    for (const auto& m : matches) {
        spans.push_back(Span{m.begin, std::min(m.end, text.size())});
    }
    return apply_spans(text, merge_spans(std::move(spans)));
}

// ---------------------------------------------------------------------------
// mask_url
//   authority 는 "://" 다음부터 첫 '/', '?', '#' 전까지.
//   authority 안의 마지막 '@' 앞이 userinfo 다 (비밀번호에 '@' 가 섞인 경우 포함).
// ---------------------------------------------------------------------------
std::string Sanitizer::mask_url(std::string_view url) const {
    const auto sep = url.find("://");
    if (sep == std::string_view::npos) {
        return sanitize(url).text;
    }

    const std::size_t auth_begin = sep + 3;
    std::size_t auth_end = url.find_first_of("/?#", auth_begin);
    if (auth_end == std::string_view::npos) {
        auth_end = url.size();
    }

    const auto authority = url.substr(auth_begin, auth_end - auth_begin);
    const auto at        = authority.rfind('@');
    if (at == std::string_view::npos) {
        return std::string(url);
    }

    std::string out;
    out.reserve(url.size());
    out.append(url.substr(0, auth_begin));
    out.append(kRedactionMarker);
    out.append(url.substr(auth_begin + at));  // '@' 부터 원문 그대로
    return out;
}

RedactionResult
Sanitizer::sanitize_subprocess_output(std::string_view output,
                                      const std::vector<std::string>& argv) const {
    auto result = sanitize(output);

    const bool auth_command = std::any_of(argv.begin(), argv.end(), [](const std::string& arg) {
        return arg.find("auth") != std::string::npos;
    });
    if (!auth_command || result.text.empty()) {
        return result;
    }

    // gh auth status 류 출력: "user: <name>", "token: <value>"
    static const std::regex kAuthField(R"(\b(?:user|token):[ \t]{0,16}(?!\[REDACTED\](?:\s|$))(\S{1,1024}))",
                                       std::regex_constants::icase |
                                       std::regex_constants::ECMAScript);

    const std::string& text = result.text;
    std::vector<Span> spans;
    try {
        for (std::sregex_iterator it(text.begin(), text.end(), kAuthField), end; it != end; ++it) {
            const auto begin = static_cast<std::size_t>(it->position(1));
            std::size_t stop = begin + static_cast<std::size_t>(it->length(1));
            while (stop < text.size() && std::isspace(static_cast<unsigned char>(text[stop])) == 0) {
                ++stop;
            }
            spans.push_back(Span{begin, stop});
        }
    } catch (const std::regex_error&) {
        // 스캔 불가: 전체를 가린다
        return RedactionResult{std::string(kRedactionMarker), result.redactions + 1};
    }

    if (spans.empty()) {
        return result;
    }
    auto extra = apply_spans(text, merge_spans(std::move(spans)));
    extra.redactions += result.redactions;
    return extra;
}

YAML::Node Sanitizer::sanitize_mapping(const YAML::Node& node) const {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            YAML::Node out(YAML::NodeType::Map);
            for (const auto& kv : node) {
                if (kv.first.IsScalar()) {
                    const std::string& key = kv.first.Scalar();
                    const auto clean_key   = sanitize(key).text;
                    if (is_sensitive_key(key)) {
                        out[clean_key] = std::string(kRedactionMarker);
                    } else {
                        out[clean_key] = sanitize_mapping(kv.second);
                    }
                } else {
                    out[sanitize_mapping(kv.first)] = sanitize_mapping(kv.second);
                }
            }
            return out;
        }
        case YAML::NodeType::Sequence: {
            YAML::Node out(YAML::NodeType::Sequence);
            for (const auto& item : node) {
                out.push_back(sanitize_mapping(item));
            }
            return out;
        }
        case YAML::NodeType::Scalar:
            return YAML::Node(sanitize(node.Scalar()).text);
        case YAML::NodeType::Null:
            return YAML::Node(YAML::NodeType::Null);
        case YAML::NodeType::Undefined:
            break;
    }
    return YAML::Node();
}

bool Sanitizer::is_sensitive_key(std::string_view key) {
    if (key.empty()) {
        return false;
    }
    const auto k = normalize_key(key);

    const auto eq = [&k](std::string_view w) { return k == w; };
    const auto ends = [&k](std::string_view w) { return k.ends_with(w); };
    const auto starts = [&k](std::string_view w) { return k.starts_with(w); };
    const auto contains = [&k](std::string_view w) { return k.find(w) != std::string::npos; };

    return std::any_of(kSensitiveExactKeys.begin(), kSensitiveExactKeys.end(), eq) ||
           std::any_of(kSensitiveSuffixes.begin(), kSensitiveSuffixes.end(), ends) ||
           std::any_of(kSensitivePrefixes.begin(), kSensitivePrefixes.end(), starts) ||
           std::any_of(kSensitiveInfixes.begin(), kSensitiveInfixes.end(), contains);
}

bool Sanitizer::looks_like_github_token(std::string_view token) {
    if (token.empty()) {
        return false;
    }

    const auto body_ok = [](std::string_view body) {
        return std::all_of(body.begin(), body.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
        });
    };

    if (token.size() >= 40 && token.size() <= 255 && token.substr(0, 2) == "gh" &&
        std::string_view("pousr").find(token[2]) != std::string_view::npos && token[3] == '_') {
        return body_ok(token.substr(4));
    }
    if (token.starts_with("github_pat_") && token.size() >= 11 + 22) {
        return body_ok(token.substr(11));
    }
    if (token.size() == 40) {
        return std::all_of(token.begin(), token.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
    }
    return false;
}
