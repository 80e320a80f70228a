#include "common/types.hpp"

std::string_view to_string(InputCategory category) noexcept {
    switch (category) {
        case InputCategory::kRepository:    return "repository";
        case InputCategory::kFilePath:      return "file-path";
        case InputCategory::kFilename:      return "filename";
        case InputCategory::kYamlDocument:  return "yaml-document";
        case InputCategory::kUrl:           return "url";
        case InputCategory::kEnvName:       return "env-name";
        case InputCategory::kEnvValue:      return "env-value";
        case InputCategory::kBoundedString: return "bounded-string";
        case InputCategory::kGitRef:        return "git-ref";
        case InputCategory::kCommitSha:     return "commit-sha";
        case InputCategory::kShellArgument: return "shell-argument";
    }
    return "unknown";
}

std::string_view to_string(ValidationErrorCode code) noexcept {
    switch (code) {
        case ValidationErrorCode::kInvalidFormat:     return "InvalidFormat";
        case ValidationErrorCode::kTooLong:           return "TooLong";
        case ValidationErrorCode::kDangerousPattern:  return "DangerousPattern";
        case ValidationErrorCode::kDisallowedScheme:  return "DisallowedScheme";
        case ValidationErrorCode::kPathTraversal:     return "PathTraversal";
        case ValidationErrorCode::kNullOrControlChar: return "NullOrControlChar";
        case ValidationErrorCode::kNotAMapping:       return "NotAMapping";
        case ValidationErrorCode::kParseFailure:      return "ParseFailure";
    }
    return "Unknown";
}
