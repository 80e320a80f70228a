// ---------------------------------------------------------------------------
// pattern_library.cpp
//
// 정적 패턴 테이블과 매칭 구현.
//
// [Dangerous 패턴]
//  traversal      : ../ ..\ 및 %2e%2e%2f 류 인코딩 변형
//  injection      : ${...} (단, ${{ }} 표현식 제외), $( , `...`
//  script         : javascript: vbscript: <script
//  code-eval      : eval( exec( system(
//  dynamic-import : __import__, import os, subprocess., os.system,
//                   require('child_process')
//
// [Secret 패턴]
//  secret-token              : ghp_/gho_/ghu_/ghs_/ghr_ + 36자 이상, github_pat_
//  bearer                    : "Bearer <token>" 의 token 부분
//  authorization-header      : "Authorization: <값>" 의 줄 끝까지
//  private-key               : PEM BEGIN ~ END 블록 전체
//  cloud-credential          : AKIA/ASIA 액세스 키 ID
//  url-credential            : scheme://userinfo@ 의 userinfo 부분
//  generic-secret-assignment : password/secret/token/api_key 류 키의 값
//
// [오탐/미탐 트레이드오프]
// - `...` 과 $( 는 셸 스니펫이 포함된 정상 워크플로우 run: 블록에서
//   false positive 를 낸다. 거부 대상은 문서 전체가 아니라 검증 호출자가
//   넘긴 값이므로 수용한다.
// - 맨 "script:" 는 actions/github-script 의 정상 키와 충돌하므로
//   javascript:/vbscript: 로 한정했다.
// - generic-secret-assignment 는 "token: ${{ secrets.X }}" 같은 표현식
//   참조 값도 가린다 (과다 가림 방향).
// - 36자 미만 ghp_ 접두 문자열은 토큰으로 보지 않는다 (미탐 가능).
//
// [멱등성]
// 가림 마커 "[REDACTED]" 는 어떤 Secret 패턴에도 매칭되지 않는다.
// 키-값 형태 패턴은 값 위치에 선행 검사를 두어, 값 전체가 마커일 때만
// 건너뛴다. "[REDACTED]hunter2" 처럼 마커로 시작하는 값은 다시 가린다.
//
// [라이브러리는 로그를 남기지 않는다]
// 로거 싱크가 Sanitizer 를 통해 이 라이브러리를 사용하므로, 여기서
// spdlog 를 호출하면 싱크 재진입이 발생한다. 컴파일 실패는 fail_closed()
// 로만 노출하고, 로그는 호출자(main)가 남긴다.
// ---------------------------------------------------------------------------

#include "patterns/pattern_library.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <regex>
#include <string>

namespace {

struct PatternDef {
    std::string_view name;
    PatternCategory  category;
    PatternKind      kind;
    std::string_view expression;
    bool             icase;
    int              redact_group;       // 0: 매치 전체
    SpanExtension    extension;
    std::string_view block_end;          // kPemBlock 전용
};

constexpr auto D = PatternKind::kDangerous;
constexpr auto S = PatternKind::kSecret;

constexpr std::array<PatternDef, 24> kPatternTable{{
    // -- traversal --------------------------------------------------------
    {"path-traversal", PatternCategory::kTraversal, D,
     R"re(\.\.[/\\])re", false, 0, SpanExtension::kNone, {}},
    {"encoded-traversal", PatternCategory::kTraversal, D,
     R"re(%2e%2e(?:%2f|%5c|/|\\))re", true, 0, SpanExtension::kNone, {}},

    // -- injection --------------------------------------------------------
    {"variable-injection", PatternCategory::kInjection, D,
     R"re(\$\{(?!\{)[^}]{0,64}\})re", false, 0, SpanExtension::kNone, {}},
    {"command-substitution", PatternCategory::kInjection, D,
     R"re(\$\()re", false, 0, SpanExtension::kNone, {}},
    {"backtick-substitution", PatternCategory::kInjection, D,
     R"re(`[^`\r\n]{1,256}`)re", false, 0, SpanExtension::kNone, {}},

    // -- script -----------------------------------------------------------
    {"script-scheme", PatternCategory::kScript, D,
     R"re((?:java|vb)script:)re", true, 0, SpanExtension::kNone, {}},
    {"script-tag", PatternCategory::kScript, D,
     R"re(<script[\s>/])re", true, 0, SpanExtension::kNone, {}},

    // -- code-eval --------------------------------------------------------
    {"eval-call", PatternCategory::kCodeEval, D,
     R"re(\beval\s{0,16}\()re", true, 0, SpanExtension::kNone, {}},
    {"exec-call", PatternCategory::kCodeEval, D,
     R"re(\bexec\s{0,16}\()re", true, 0, SpanExtension::kNone, {}},
    {"system-call", PatternCategory::kCodeEval, D,
     R"re(\bsystem\s{0,16}\()re", true, 0, SpanExtension::kNone, {}},

    // -- dynamic-import ---------------------------------------------------
    {"dunder-import", PatternCategory::kDynamicImport, D,
     R"re(__import__)re", false, 0, SpanExtension::kNone, {}},
    {"import-os", PatternCategory::kDynamicImport, D,
     R"re(\bimport[ \t]{1,16}os\b)re", false, 0, SpanExtension::kNone, {}},
    {"subprocess-module", PatternCategory::kDynamicImport, D,
     R"re(\bsubprocess\.)re", false, 0, SpanExtension::kNone, {}},
    {"os-system", PatternCategory::kDynamicImport, D,
     R"re(\bos\.system\b)re", false, 0, SpanExtension::kNone, {}},
    {"child-process-require", PatternCategory::kDynamicImport, D,
     R"re(require\s{0,16}\(\s{0,16}['"]child_process)re", true, 0, SpanExtension::kNone, {}},

    // -- secrets ----------------------------------------------------------
    {"github-token", PatternCategory::kSecretToken, S,
     R"re(gh[pousr]_[A-Za-z0-9_]{36,255})re", false, 0, SpanExtension::kTokenChars, {}},
    {"github-fine-grained-token", PatternCategory::kSecretToken, S,
     R"re(github_pat_[A-Za-z0-9_]{22,255})re", false, 0, SpanExtension::kTokenChars, {}},
    {"bearer-token", PatternCategory::kBearer, S,
     R"re(\bBearer[ \t]{1,16}([A-Za-z0-9._~+/=-]{1,512}))re", true, 1, SpanExtension::kTokenChars, {}},
    {"authorization-header", PatternCategory::kBearer, S,
     R"re(\bAuthorization["']?[ \t]{0,16}[:=][ \t]{0,16}(?!\[REDACTED\][ \t]*(?:[\r\n]|$))(\S[^\r\n]{0,1023}))re",
     true, 1, SpanExtension::kLine, {}},
    {"private-key-block", PatternCategory::kPrivateKey, S,
     R"re(-----BEGIN[A-Z0-9 ]{0,64}PRIVATE KEY-----)re", false, 0, SpanExtension::kPemBlock,
     R"re(-----END[A-Z0-9 ]{0,64}PRIVATE KEY-----)re"},
    {"aws-access-key-id", PatternCategory::kCloudCredential, S,
     R"re((?:AKIA|ASIA)[0-9A-Z]{16})re", false, 0, SpanExtension::kTokenChars, {}},
    {"url-credential", PatternCategory::kUrlCredential, S,
     R"re(\b[A-Za-z][A-Za-z0-9+.-]{0,31}://(?!\[REDACTED\]@)([^/\s@]{1,256})@)re",
     false, 1, SpanExtension::kNone, {}},
    {"generic-secret-assignment", PatternCategory::kGenericSecretAssignment, S,
     R"re([A-Za-z0-9_.-]{0,64}(?:password|passwd|secret|token|api[_-]?key)[A-Za-z0-9_.-]{0,64}["']?[ \t]{0,16}[:=][ \t]{0,16}(?!\[REDACTED\](?:[\s"',;&]|$))("[^"\r\n]{0,1024}"?|'[^'\r\n]{0,1024}'?|[^\s"',;&]{1,1024}))re",
     true, 1, SpanExtension::kValueChars, {}},
    {"private-key-field", PatternCategory::kPrivateKey, S,
     R"re(\bprivate[_-]?key["']?[ \t]{0,16}[:=][ \t]{0,16}(?!\[REDACTED\](?:[\s"',;&]|$))([^\s"',;&]{1,1024}))re",
     true, 1, SpanExtension::kValueChars, {}},
}};

[[nodiscard]] bool is_token_char(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    if ((u >= 'A' && u <= 'Z') || (u >= 'a' && u <= 'z') || (u >= '0' && u <= '9')) {
        return true;
    }
    switch (c) {
        case '.': case '_': case '~': case '+': case '/': case '=': case '-':
            return true;
        default:
            return false;
    }
}

[[nodiscard]] bool is_value_terminator(char c) noexcept {
    switch (c) {
        case ' ': case '\t': case '\r': case '\n': case '\f': case '\v':
        case '"': case '\'': case ',': case ';': case '&':
            return true;
        default:
            return false;
    }
}

std::regex::flag_type flags_for(const PatternDef& def) {
    auto flags = std::regex_constants::ECMAScript;
    if (def.icase) {
        flags |= std::regex_constants::icase;
    }
    return flags;
}

}  // namespace

// ---------------------------------------------------------------------------
// CompiledPattern
//   regex 를 shared_ptr 로 보관하여 헤더에서 불완전 타입인 채로
//   vector<CompiledPattern> 을 선언할 수 있게 한다.
// ---------------------------------------------------------------------------
struct PatternLibrary::CompiledPattern {
    const PatternDef*           def{nullptr};
    std::shared_ptr<std::regex> compiled;
    std::shared_ptr<std::regex> block_end;   // kPemBlock 전용, 그 외 nullptr
};

PatternLibrary::~PatternLibrary() = default;

const PatternLibrary& PatternLibrary::instance() {
    static const PatternLibrary library;
    return library;
}

PatternLibrary::PatternLibrary() {
    compiled_patterns_.reserve(kPatternTable.size());

    for (const auto& def : kPatternTable) {
        try {
            CompiledPattern cp;
            cp.def      = &def;
            cp.compiled = std::make_shared<std::regex>(
                std::string(def.expression), flags_for(def));
            if (!def.block_end.empty()) {
                cp.block_end = std::make_shared<std::regex>(
                    std::string(def.block_end), flags_for(def));
            }
            compiled_patterns_.push_back(std::move(cp));
        } catch (const std::regex_error&) {
            // [Fail-close] 패턴 하나라도 빠지면 탐지 범위가 조용히 줄어든다.
            // 부분 동작 대신 전체 거부/전체 가림으로 전환한다.
            fail_close_active_ = true;
        }
    }
}

std::size_t PatternLibrary::size() const noexcept {
    return kPatternTable.size();
}

std::vector<PatternInfo> PatternLibrary::describe() const {
    std::vector<PatternInfo> out;
    out.reserve(kPatternTable.size());
    for (const auto& def : kPatternTable) {
        out.push_back(PatternInfo{def.name, def.category, def.kind});
    }
    return out;
}

std::optional<PatternMatch> PatternLibrary::first_dangerous(std::string_view text) const {
    if (fail_close_active_) {
        return PatternMatch{0, text.size(), PatternCategory::kInjection, "fail-closed"};
    }

    const char* first = text.data();
    const char* last  = text.data() + text.size();

    for (const auto& cp : compiled_patterns_) {
        if (cp.def->kind != PatternKind::kDangerous) {
            continue;
        }
        try {
            std::cmatch m;
            if (std::regex_search(first, last, m, *cp.compiled)) {
                const auto begin = static_cast<std::size_t>(m.position(0));
                return PatternMatch{begin, begin + static_cast<std::size_t>(m.length(0)),
                                    cp.def->category, cp.def->name};
            }
        } catch (const std::regex_error&) {
            // 실행 한도 초과: 판정 불가 입력은 매칭으로 간주한다.
            return PatternMatch{0, text.size(), cp.def->category, cp.def->name};
        }
    }
    return std::nullopt;
}

std::vector<PatternMatch> PatternLibrary::find_dangerous(std::string_view text) const {
    std::vector<PatternMatch> matches;
    if (fail_close_active_) {
        matches.push_back(PatternMatch{0, text.size(), PatternCategory::kInjection, "fail-closed"});
        return matches;
    }

    const char* first = text.data();
    const char* last  = text.data() + text.size();

    for (const auto& cp : compiled_patterns_) {
        if (cp.def->kind != PatternKind::kDangerous) {
            continue;
        }
        try {
            for (std::cregex_iterator it(first, last, *cp.compiled), end; it != end; ++it) {
                const auto begin = static_cast<std::size_t>(it->position(0));
                matches.push_back(PatternMatch{
                    begin, begin + static_cast<std::size_t>(it->length(0)),
                    cp.def->category, cp.def->name});
            }
        } catch (const std::regex_error&) {
            matches.push_back(PatternMatch{0, text.size(), cp.def->category, cp.def->name});
        }
    }
    return matches;
}

// ---------------------------------------------------------------------------
// find_secrets
//   각 매치에서 가림 그룹 구간을 얻은 뒤 SpanExtension 에 따라 끝을 연장한다.
//   정규식 실행 오류 시 텍스트 전체를 하나의 구간으로 반환한다 (fail-close).
// ---------------------------------------------------------------------------
std::vector<PatternMatch> PatternLibrary::find_secrets(std::string_view text) const {
    std::vector<PatternMatch> spans;
    if (text.empty()) {
        return spans;
    }
    if (fail_close_active_) {
        spans.push_back(PatternMatch{0, text.size(), PatternCategory::kSecretToken, "fail-closed"});
        return spans;
    }

    const char* first = text.data();
    const char* last  = text.data() + text.size();

    for (const auto& cp : compiled_patterns_) {
        if (cp.def->kind != PatternKind::kSecret) {
            continue;
        }
        try {
            for (std::cregex_iterator it(first, last, *cp.compiled), end; it != end; ++it) {
                const auto& m   = *it;
                const int group = (cp.def->redact_group > 0 &&
                                   m[cp.def->redact_group].matched)
                                      ? cp.def->redact_group : 0;

                std::size_t begin = static_cast<std::size_t>(m.position(group));
                std::size_t stop  = begin + static_cast<std::size_t>(m.length(group));

                switch (cp.def->extension) {
                    case SpanExtension::kNone:
                        break;

                    case SpanExtension::kTokenChars:
                        while (stop < text.size() && is_token_char(text[stop])) {
                            ++stop;
                        }
                        break;

                    case SpanExtension::kValueChars: {
                        const char open = text[begin];
                        if (open == '"' || open == '\'') {
                            // 따옴표 값: 닫는 따옴표가 이미 포함되었으면 그대로 둔다
                            const bool closed = (stop - begin) >= 2 && text[stop - 1] == open;
                            if (!closed) {
                                while (stop < text.size() && text[stop] != open &&
                                       text[stop] != '\n' && text[stop] != '\r') {
                                    ++stop;
                                }
                                if (stop < text.size() && text[stop] == open) {
                                    ++stop;
                                }
                            }
                        } else {
                            while (stop < text.size() && !is_value_terminator(text[stop])) {
                                ++stop;
                            }
                        }
                        break;
                    }

                    case SpanExtension::kLine:
                        while (stop < text.size() && text[stop] != '\n' && text[stop] != '\r') {
                            ++stop;
                        }
                        break;

                    case SpanExtension::kPemBlock: {
                        std::cmatch tail;
                        if (cp.block_end &&
                            std::regex_search(first + stop, last, tail, *cp.block_end)) {
                            stop += static_cast<std::size_t>(tail.position(0) + tail.length(0));
                        } else {
                            // END 마커 없음: 잘린 키로 보고 텍스트 끝까지 가린다
                            stop = text.size();
                        }
                        break;
                    }
                }

                spans.push_back(PatternMatch{begin, stop, cp.def->category, cp.def->name});
            }
        } catch (const std::regex_error&) {
            spans.clear();
            spans.push_back(PatternMatch{0, text.size(), cp.def->category, cp.def->name});
            return spans;
        }
    }
    return spans;
}

std::string_view to_string(PatternCategory category) noexcept {
    switch (category) {
        case PatternCategory::kTraversal:               return "traversal";
        case PatternCategory::kInjection:               return "injection";
        case PatternCategory::kScript:                  return "script";
        case PatternCategory::kCodeEval:                return "code-eval";
        case PatternCategory::kDynamicImport:           return "dynamic-import";
        case PatternCategory::kSecretToken:             return "secret-token";
        case PatternCategory::kBearer:                  return "bearer";
        case PatternCategory::kPrivateKey:              return "private-key";
        case PatternCategory::kCloudCredential:         return "cloud-credential";
        case PatternCategory::kGenericSecretAssignment: return "generic-secret-assignment";
        case PatternCategory::kUrlCredential:           return "url-credential";
    }
    return "unknown";
}

std::string_view to_string(PatternKind kind) noexcept {
    switch (kind) {
        case PatternKind::kDangerous: return "dangerous";
        case PatternKind::kSecret:    return "secret";
    }
    return "unknown";
}
