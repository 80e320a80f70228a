#include "audit/secret_references.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace {

[[nodiscard]] std::string to_upper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

}  // namespace

bool is_allowed_secret_reference(std::string_view name) {
    const auto upper = to_upper(name);
    return std::find(kAllowedSecretReferences.begin(), kAllowedSecretReferences.end(), upper) !=
           kAllowedSecretReferences.end();
}

std::vector<SecretReference> find_direct_secret_references(std::string_view content) {
    static const std::regex kSecretRef(
        R"(\$\{\{\s{0,16}secrets\.([A-Za-z_][A-Za-z0-9_]{0,127})\s{0,16}\}\})",
        std::regex_constants::ECMAScript);

    std::vector<SecretReference> refs;
    const char* first = content.data();
    const char* last  = content.data() + content.size();

    std::size_t line      = 1;
    std::size_t line_scan = 0;  // 줄 번호를 센 위치

    for (std::cregex_iterator it(first, last, kSecretRef), end; it != end; ++it) {
        const auto pos = static_cast<std::size_t>(it->position(0));
        line += static_cast<std::size_t>(
            std::count(content.begin() + static_cast<std::ptrdiff_t>(line_scan),
                       content.begin() + static_cast<std::ptrdiff_t>(pos), '\n'));
        line_scan = pos;

        auto name = it->str(1);
        if (is_allowed_secret_reference(name)) {
            continue;
        }
        refs.push_back(SecretReference{std::move(name), line});
    }
    return refs;
}
