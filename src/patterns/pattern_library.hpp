#pragma once

// ---------------------------------------------------------------------------
// pattern_library.hpp
//
// 위험 입력 패턴과 시크릿 출력 패턴을 하나의 정적 테이블로 보관하는
// 정규식 패턴 라이브러리. Validator 와 Sanitizer 가 공유하는 최하위 모듈.
//
// [패턴 종류]
// - Dangerous (입력 거부용): traversal, injection, script, code-eval,
//   dynamic-import
// - Secret (출력 가림용): secret-token, bearer, private-key,
//   cloud-credential, generic-secret-assignment, url-credential
//
// [설계 원칙]
// - 테이블 순서가 곧 first-match 보고 순서다. 단, 스캔은 항상 전체 패턴에
//   대해 수행된다 (한 문자열이 여러 카테고리에 걸릴 수 있음).
// - 키워드 패턴은 case-insensitive, 구조적 토큰(ghp_, AKIA 등)은
//   case-sensitive 로 컴파일한다.
// - 새 패턴 추가는 pattern_library.cpp 의 kPatternTable 에 행을 추가하는
//   것으로 끝나야 한다. 새 코드 경로를 만들지 말 것.
// - 매칭 함수는 예외를 던지지 않는다. 정규식 실행 오류는 fail-close 로
//   처리한다 (Dangerous: 매칭으로 간주, Secret: 전체 가림).
//
// [성능 고려사항]
// - std::regex 실행기는 반복 횟수만큼 재귀하므로 모든 수량자는 상한을
//   둔다. 상한을 넘는 긴 시크릿은 SpanExtension 으로 구간을 이어서
//   확장한다 (정규식 작업량은 제한하되 가림 구간은 끝까지).
// - 입력 길이 상한은 호출자(Validator 크기 제한)가 사전에 적용한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

enum class PatternCategory : std::uint8_t {
    kTraversal               = 0,
    kInjection               = 1,
    kScript                  = 2,
    kCodeEval                = 3,
    kDynamicImport           = 4,
    kSecretToken             = 5,
    kBearer                  = 6,
    kPrivateKey              = 7,
    kCloudCredential         = 8,
    kGenericSecretAssignment = 9,
    kUrlCredential           = 10,
};

enum class PatternKind : std::uint8_t {
    kDangerous = 0,  // 입력에서 발견되면 거부
    kSecret    = 1,  // 출력에서 발견되면 가림
};

// ---------------------------------------------------------------------------
// SpanExtension
//   정규식 매치 이후 가림 구간을 어디까지 연장할지 결정한다.
//   정규식 수량자 상한 때문에 잘린 시크릿의 잔여 조각이 출력에 남지
//   않도록 하기 위한 것. 연장은 항상 과다 가림 방향이다.
// ---------------------------------------------------------------------------
enum class SpanExtension : std::uint8_t {
    kNone       = 0,
    kTokenChars = 1,  // [A-Za-z0-9._~+/=-] 가 이어지는 동안
    kValueChars = 2,  // 공백/따옴표/구분자(,;&) 전까지. 따옴표 값은 닫는 따옴표까지
    kLine       = 3,  // 줄 끝까지
    kPemBlock   = 4,  // 대응하는 END 마커까지. 없으면 텍스트 끝까지
};

// ---------------------------------------------------------------------------
// PatternMatch
//   [begin, end) 바이트 구간. Secret 패턴의 경우 가림 대상 구간이다
//   (예: "token: <값>" 에서 <값> 부분만).
//   name 은 정적 테이블을 가리키므로 수명 문제가 없다.
// ---------------------------------------------------------------------------
struct PatternMatch {
    std::size_t      begin{0};
    std::size_t      end{0};
    PatternCategory  category{PatternCategory::kInjection};
    std::string_view name{};
};

// 패턴 테이블 자기 기술 (테스트, --list-patterns 출력용)
struct PatternInfo {
    std::string_view name{};
    PatternCategory  category{PatternCategory::kInjection};
    PatternKind      kind{PatternKind::kDangerous};
};

// ---------------------------------------------------------------------------
// PatternLibrary
//   프로세스 전역 build-once / read-many 싱글턴.
//
//   [스레드 안전성]
//   - instance() 는 함수 지역 static 초기화로 스레드 안전하다.
//   - 생성 이후 상태 변경이 없으므로 모든 조회는 동기화 없이 동시 호출 가능.
// ---------------------------------------------------------------------------
class PatternLibrary {
public:
    [[nodiscard]] static const PatternLibrary& instance();

    ~PatternLibrary();

    PatternLibrary(const PatternLibrary&)            = delete;
    PatternLibrary& operator=(const PatternLibrary&) = delete;

    // first_dangerous
    //   테이블 순서상 처음으로 매칭되는 Dangerous 패턴을 반환한다.
    //   매칭 없음: std::nullopt
    [[nodiscard]] std::optional<PatternMatch> first_dangerous(std::string_view text) const;

    // find_dangerous
    //   모든 Dangerous 패턴의 모든 매칭 (테이블 순서, 패턴 내 위치 순).
    [[nodiscard]] std::vector<PatternMatch> find_dangerous(std::string_view text) const;

    // find_secrets
    //   모든 Secret 패턴의 가림 구간 (SpanExtension 적용 후).
    //   구간은 서로 겹칠 수 있으며, 병합은 호출자(Sanitizer) 책임이다.
    [[nodiscard]] std::vector<PatternMatch> find_secrets(std::string_view text) const;

    [[nodiscard]] std::vector<PatternInfo> describe() const;

    [[nodiscard]] std::size_t size() const noexcept;

    // 컴파일 실패한 패턴이 하나라도 있으면 true.
    // 이 상태에서는 모든 입력이 거부되고 모든 출력이 전부 가려진다.
    [[nodiscard]] bool fail_closed() const noexcept { return fail_close_active_; }

private:
    PatternLibrary();

    struct CompiledPattern;
    std::vector<CompiledPattern> compiled_patterns_;
    bool                         fail_close_active_{false};
};

[[nodiscard]] std::string_view to_string(PatternCategory category) noexcept;
[[nodiscard]] std::string_view to_string(PatternKind kind) noexcept;
