#include <ftl/fs.hpp>
#include <ftl/graph.hpp>
#include <ftl/introspect.hpp>
#include <ftl/lang/parser.hpp>
#include <ftl/lang/serializer.hpp>
#include <ftl/lang/visitor.hpp>
#include <ftl/validate.hpp>
#include <iostream>

using namespace ftl;

static const char* comment_kind_str(CommentKind k) {
    switch (k) {
    case CommentKind::Line:     return "comment";
    case CommentKind::Group:    return "group comment";
    case CommentKind::Resource: return "resource comment";
    }
    return "?";
}

static std::string line_of(std::string_view source, const Span& span) {
    auto [line, col] = Cursor(source, span.start).line_col();
    return std::to_string(line) + ":" + std::to_string(col);
}

static void print_info(const MessageInfo& info) {
    for (const auto& v : info.variables) {
        std::cout << "    $" << v.name << "  (" << context_name(v.context) << ")\n";
    }
    for (const auto& f : info.functions) {
        std::cout << "    " << f.name << "(";
        for (size_t i = 0; i < f.positional_variables.size(); ++i) {
            if (i > 0) std::cout << ", ";
            std::cout << "$" << f.positional_variables[i];
        }
        for (const auto& key : f.named_keys) std::cout << ", " << key << ":";
        std::cout << ")\n";
    }
    for (const auto& r : info.references) {
        std::cout << "    -> " << (r.kind == ReferenceKind::Term ? "-" : "") << r.id;
        if (r.attribute) std::cout << "." << *r.attribute;
        std::cout << "\n";
    }
}

// Message/term reference tree, one root per entry
class TreeBuilder : public Visitor {
public:
    ReferenceGraph graph;
    std::vector<std::string> roots;

    void visit_message(const Message& msg) override {
        current_ = msg.id;
        roots.push_back(current_);
        graph.add_entry(current_);
        Visitor::visit_message(msg);
    }

    void visit_term(const Term& term) override {
        current_ = "-" + term.id;
        roots.push_back(current_);
        graph.add_entry(current_);
        Visitor::visit_term(term);
    }

    void visit_message_reference(const MessageReference& ref) override {
        graph.add_reference(current_, ref.id);
    }

    void visit_term_reference(const TermReference& ref) override {
        graph.add_reference(current_, "-" + ref.id);
        Visitor::visit_term_reference(ref);
    }

private:
    std::string current_;
};

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: ftl-dump <file.ftl> [--canonical] [--tree]\n";
        return 1;
    }

    std::string path = argv[1];
    bool show_canonical = false;
    bool show_tree = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--canonical") show_canonical = true;
        else if (arg == "--tree") show_tree = true;
    }

    auto text = read_text_file(path, "FTL file");
    if (text.is_err()) {
        std::cerr << text.error().format() << "\n";
        return 1;
    }
    const std::string& source = text.value();

    Resource resource = parse(source);

    std::cout << "--- " << path << " ---\n";
    std::cout << "Messages: " << resource.count<Message>()
              << "  Terms: " << resource.count<Term>()
              << "  Comments: " << resource.count<Comment>()
              << "  Junk: " << resource.count<Junk>() << "\n\n";

    for (const auto& entry : resource.entries) {
        std::visit(overloaded{
            [&](const Message& m) {
                std::cout << line_of(source, m.span) << "  message " << m.id;
                if (!m.value) std::cout << " (no value)";
                std::cout << "\n";
                for (const auto& a : m.attributes) {
                    std::cout << "    ." << a.id << "\n";
                }
                print_info(introspect(m));
            },
            [&](const Term& t) {
                std::cout << line_of(source, t.span) << "  term -" << t.id << "\n";
                for (const auto& a : t.attributes) {
                    std::cout << "    ." << a.id << "\n";
                }
                print_info(introspect(t));
            },
            [&](const Comment& c) {
                std::cout << line_of(source, c.span) << "  " << comment_kind_str(c.kind) << "\n";
            },
            [&](const Junk& j) {
                std::cout << line_of(source, j.span) << "  junk\n";
                for (const auto& a : j.annotations) {
                    std::cout << "    " << a.code << " at " << line_of(source, a.span)
                              << ": " << a.message << "\n";
                }
            },
        }, entry);
    }

    auto report = validate_resource(resource);
    if (!report.warnings.empty()) {
        std::cout << "\n-- Warnings --\n";
        for (const auto& w : report.warnings) {
            std::cout << "  [" << w.code << "] " << w.message << "\n";
        }
    }

    if (show_tree) {
        TreeBuilder builder;
        builder.visit(resource);
        std::cout << "\n-- References --\n";
        for (const auto& root : builder.roots) {
            std::cout << builder.graph.tree_display(root);
        }
    }

    if (show_canonical) {
        std::cout << "\n-- Canonical --\n" << serialize(resource);
    }

    return report.is_valid() ? 0 : 2;
}
