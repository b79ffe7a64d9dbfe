#include <ftl/lang/ast.hpp>

namespace ftl {

static const Attribute* find_attribute(const std::vector<Attribute>& attrs,
                                       const std::string& name) {
    // Later duplicates win, matching entry override order
    for (auto it = attrs.rbegin(); it != attrs.rend(); ++it) {
        if (it->id == name) return &*it;
    }
    return nullptr;
}

const Attribute* Message::attribute(const std::string& name) const {
    return find_attribute(attributes, name);
}

const Attribute* Term::attribute(const std::string& name) const {
    return find_attribute(attributes, name);
}

const char* comment_prefix(CommentKind kind) {
    switch (kind) {
    case CommentKind::Line:     return "#";
    case CommentKind::Group:    return "##";
    case CommentKind::Resource: return "###";
    }
    return "#";
}

} // namespace ftl
