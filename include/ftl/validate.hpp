#pragma once

#include <ftl/lang/ast.hpp>

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ftl {

// Syntax problem that made an entry unusable
struct ValidationError {
    std::string code;           // "parse-error"
    std::string message;
    std::string content;        // the junk text
    Span span;
};

// Semantic problem in otherwise well-formed entries
struct ValidationWarning {
    std::string code;           // "duplicate-id", "undefined-reference", "circular-reference"
    std::string message;
    std::string context;        // id of the entry the warning is about
};

struct ValidationResult {
    std::vector<ValidationError> errors;
    std::vector<ValidationWarning> warnings;

    bool is_valid() const { return errors.empty(); }
    size_t error_count() const { return errors.size(); }
    size_t warning_count() const { return warnings.size(); }
};

// Ids of messages and terms already available elsewhere (e.g. in a bundle),
// so references to them are not reported as undefined. Term ids are given
// without the leading '-'.
struct KnownIds {
    std::set<std::string> messages;
    std::set<std::string> terms;
};

ValidationResult validate_resource(const Resource& resource, const KnownIds& known = {});

// Parse then validate
ValidationResult validate_source(std::string_view source, const KnownIds& known = {});

} // namespace ftl
