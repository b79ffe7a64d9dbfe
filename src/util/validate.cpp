#include <ftl/validate.hpp>
#include <ftl/graph.hpp>
#include <ftl/lang/parser.hpp>
#include <ftl/lang/visitor.hpp>
#include <ftl/log.hpp>

#include <map>

namespace ftl {

namespace {

struct Reference {
    bool is_term = false;
    std::string id;
    std::optional<std::string> attribute;

    std::string key() const {
        std::string k = is_term ? "-" + id : id;
        if (attribute) k += "." + *attribute;
        return k;
    }
};

// Gathers message and term references of one pattern
class ReferenceCollector : public Visitor {
public:
    std::vector<Reference> refs;

    void visit_message_reference(const MessageReference& ref) override {
        refs.push_back({false, ref.id, ref.attribute});
    }

    void visit_term_reference(const TermReference& ref) override {
        refs.push_back({true, ref.id, ref.attribute});
        Visitor::visit_term_reference(ref);
    }
};

std::vector<Reference> collect(const Pattern& pattern) {
    ReferenceCollector collector;
    collector.visit_pattern(pattern);
    return std::move(collector.refs);
}

// One resolvable pattern: a value or an attribute of an entry
struct Node {
    std::string entry;          // "id" or "-id"
    std::string key;            // "id", "id.attr", "-id", "-id.attr"
    const Pattern* pattern;
};

template<typename E>
void add_nodes(std::vector<Node>& nodes, const E& entry, const std::string& prefix,
               const Pattern* value) {
    std::string name = prefix + entry.id;
    if (value) nodes.push_back({name, name, value});
    for (const auto& attr : entry.attributes) {
        nodes.push_back({name, name + "." + attr.id, &attr.value});
    }
}

} // namespace

ValidationResult validate_resource(const Resource& resource, const KnownIds& known) {
    ValidationResult result;

    std::map<std::string, const Message*> messages;
    std::map<std::string, const Term*> terms;
    std::vector<Node> nodes;

    for (const auto& entry : resource.entries) {
        if (const auto* junk = std::get_if<Junk>(&entry)) {
            if (junk->annotations.empty()) {
                result.errors.push_back({"parse-error", "Unparseable entry",
                                         junk->content, junk->span});
            }
            for (const auto& ann : junk->annotations) {
                result.errors.push_back({"parse-error", ann.message, junk->content, ann.span});
            }
        } else if (const auto* msg = std::get_if<Message>(&entry)) {
            if (messages.count(msg->id)) {
                result.warnings.push_back({"duplicate-id",
                    "Duplicate message id '" + msg->id + "'; the later definition wins",
                    msg->id});
            }
            messages[msg->id] = msg;
        } else if (const auto* term = std::get_if<Term>(&entry)) {
            if (terms.count(term->id)) {
                result.warnings.push_back({"duplicate-id",
                    "Duplicate term id '-" + term->id + "'; the later definition wins",
                    "-" + term->id});
            }
            terms[term->id] = term;
        }
    }

    // Only the definition that wins is checked
    for (const auto& [id, msg] : messages) {
        add_nodes(nodes, *msg, "", msg->value ? &*msg->value : nullptr);
    }
    for (const auto& [id, term] : terms) {
        add_nodes(nodes, *term, "-", &term->value);
    }

    ReferenceGraph graph;
    for (const auto& node : nodes) graph.add_entry(node.key);

    for (const auto& node : nodes) {
        for (const auto& ref : collect(*node.pattern)) {
            bool defined = ref.is_term
                ? terms.count(ref.id) > 0 || known.terms.count(ref.id) > 0
                : messages.count(ref.id) > 0 || known.messages.count(ref.id) > 0;
            if (!defined) {
                std::string what = ref.is_term ? "term '-" + ref.id + "'"
                                               : "message '" + ref.id + "'";
                result.warnings.push_back({"undefined-reference",
                    "'" + node.key + "' references undefined " + what, node.entry});
                continue;
            }
            // Edges only between patterns of this resource
            if (graph.has_entry(ref.key())) graph.add_reference(node.key, ref.key());
        }
    }

    for (const auto& cycle : graph.cycles()) {
        result.warnings.push_back({"circular-reference",
            "Circular reference: " + ReferenceGraph::chain(cycle), cycle.front()});
    }

    log::debug("validated %zu entries: %zu errors, %zu warnings",
               resource.entries.size(), result.errors.size(), result.warnings.size());
    return result;
}

ValidationResult validate_source(std::string_view source, const KnownIds& known) {
    return validate_resource(parse(source), known);
}

} // namespace ftl
