#include <ftl/diagnostic.hpp>
#include <ftl/graph.hpp>
#include <ftl/lang/cursor.hpp>

namespace ftl {

static const char* kDocsBase = "https://projectfluent.org/fluent/guide";

const char* Diagnostic::code_name(DiagnosticCode c) {
    switch (c) {
    case DiagnosticCode::MessageNotFound:       return "MESSAGE_NOT_FOUND";
    case DiagnosticCode::AttributeNotFound:     return "ATTRIBUTE_NOT_FOUND";
    case DiagnosticCode::TermNotFound:          return "TERM_NOT_FOUND";
    case DiagnosticCode::TermAttributeNotFound: return "TERM_ATTRIBUTE_NOT_FOUND";
    case DiagnosticCode::VariableNotProvided:   return "VARIABLE_NOT_PROVIDED";
    case DiagnosticCode::MessageNoValue:        return "MESSAGE_NO_VALUE";
    case DiagnosticCode::CyclicReference:       return "CYCLIC_REFERENCE";
    case DiagnosticCode::NoVariants:            return "NO_VARIANTS";
    case DiagnosticCode::FunctionNotFound:      return "FUNCTION_NOT_FOUND";
    case DiagnosticCode::FunctionFailed:        return "FUNCTION_FAILED";
    }
    return "UNKNOWN";
}

std::string Diagnostic::format(std::string_view source) const {
    std::string out = "error[";
    out += code_name(code);
    out += "]: ";
    out += message;

    if (span && !source.empty() && span->start <= source.size()) {
        auto [line, col] = Cursor(source, span->start).line_col();
        out += "\n  --> line " + std::to_string(line) +
               ", column " + std::to_string(col);
    }
    if (hint) {
        out += "\n  = help: ";
        out += *hint;
    }
    if (help_url) {
        out += "\n  = note: see ";
        out += *help_url;
    }
    return out;
}

bool Diagnostic::operator==(const Diagnostic& o) const {
    return code == o.code && message == o.message && span == o.span &&
           hint == o.hint && help_url == o.help_url;
}

namespace diag {

static Diagnostic make(DiagnosticCode code, std::string message,
                       std::string hint, const char* page) {
    Diagnostic d;
    d.code = code;
    d.message = std::move(message);
    if (!hint.empty()) d.hint = std::move(hint);
    if (page) d.help_url = std::string(kDocsBase) + "/" + page;
    return d;
}

Diagnostic message_not_found(const std::string& id) {
    return make(DiagnosticCode::MessageNotFound,
                "Message '" + id + "' not found",
                "Check the message id for typos, or add the message to a loaded resource",
                "hello.html");
}

Diagnostic attribute_not_found(const std::string& attribute, const std::string& message_id) {
    return make(DiagnosticCode::AttributeNotFound,
                "Attribute '" + attribute + "' not found in message '" + message_id + "'",
                "Attributes are declared on indented lines starting with '.'",
                "attributes.html");
}

Diagnostic term_not_found(const std::string& id) {
    return make(DiagnosticCode::TermNotFound,
                "Term '-" + id + "' not found",
                "Terms are declared with a leading '-', e.g. -" + id + " = ...",
                "terms.html");
}

Diagnostic term_attribute_not_found(const std::string& attribute, const std::string& term_id) {
    return make(DiagnosticCode::TermAttributeNotFound,
                "Attribute '" + attribute + "' not found in term '-" + term_id + "'",
                "",
                "terms.html");
}

Diagnostic variable_not_provided(const std::string& name) {
    return make(DiagnosticCode::VariableNotProvided,
                "Variable '$" + name + "' not provided",
                "Pass '" + name + "' in the arguments when formatting this message",
                "variables.html");
}

Diagnostic message_no_value(const std::string& id) {
    return make(DiagnosticCode::MessageNoValue,
                "Message '" + id + "' has no value",
                "The message only has attributes; format one of them instead",
                "attributes.html");
}

Diagnostic cyclic_reference(const std::vector<std::string>& path) {
    return make(DiagnosticCode::CyclicReference,
                "Circular reference detected: " + ReferenceGraph::chain(path),
                "Break the cycle so that no message refers back to itself",
                "references.html");
}

Diagnostic no_variants() {
    return make(DiagnosticCode::NoVariants,
                "No variants in select expression", "", "selectors.html");
}

Diagnostic function_not_found(const std::string& name) {
    return make(DiagnosticCode::FunctionNotFound,
                "Function '" + name + "' not found",
                "Built-in functions are NUMBER, DATETIME and CURRENCY; custom ones "
                "must be registered before formatting",
                "functions.html");
}

Diagnostic function_failed(const std::string& name, const std::string& reason) {
    return make(DiagnosticCode::FunctionFailed,
                "Function '" + name + "' failed: " + reason, "", "functions.html");
}

} // namespace diag

} // namespace ftl
