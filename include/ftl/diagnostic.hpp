#pragma once

#include <ftl/lang/ast.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ftl {

enum class DiagnosticCode {
    // Reference errors
    MessageNotFound = 1001,
    AttributeNotFound = 1002,
    TermNotFound = 1003,
    TermAttributeNotFound = 1004,
    VariableNotProvided = 1005,
    MessageNoValue = 1006,

    // Resolution errors
    CyclicReference = 2001,
    NoVariants = 2002,
    FunctionNotFound = 2003,
    FunctionFailed = 2004,
};

// Non-fatal problem found while formatting a message
struct Diagnostic {
    DiagnosticCode code = DiagnosticCode::MessageNotFound;
    std::string message;
    std::optional<Span> span;
    std::optional<std::string> hint;
    std::optional<std::string> help_url;

    // error[CODE]: message
    //   --> line L, column C      (span and source both available)
    //   = help: hint
    //   = note: see help_url
    std::string format(std::string_view source = {}) const;

    bool is_reference_error() const { return static_cast<int>(code) < 2000; }

    bool operator==(const Diagnostic& o) const;
    bool operator!=(const Diagnostic& o) const { return !(*this == o); }

    static const char* code_name(DiagnosticCode c);
};

using Diagnostics = std::vector<Diagnostic>;

// ---------------------------------------------------------------------------
// Standard diagnostics
// ---------------------------------------------------------------------------

namespace diag {

Diagnostic message_not_found(const std::string& id);
Diagnostic attribute_not_found(const std::string& attribute, const std::string& message_id);
Diagnostic term_not_found(const std::string& id);
Diagnostic term_attribute_not_found(const std::string& attribute, const std::string& term_id);
Diagnostic variable_not_provided(const std::string& name);
Diagnostic message_no_value(const std::string& id);
Diagnostic cyclic_reference(const std::vector<std::string>& path);
Diagnostic no_variants();
Diagnostic function_not_found(const std::string& name);
Diagnostic function_failed(const std::string& name, const std::string& reason);

} // namespace diag

} // namespace ftl
