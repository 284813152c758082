// Expansion of <%= ... %> tags inside prompt and message text
#pragma once

#include <map>
#include <optional>
#include <string>

#include "parley/parley_types.hpp"

namespace parley {

// Read-only values visible to a template. Scalars render as text, null
// renders as "", sequences are accepted by list().
class PARLEY_API TemplateContext {
public:
    void Set(const std::string& name, const YAML::Node& value) { vars_[name] = value; }
    void Set(const std::string& name, const std::string& value) { vars_[name] = YAML::Node(value); }
    const YAML::Node* Find(const std::string& name) const;

    std::optional<size_t> wrap_at;
    bool use_color = true;

private:
    std::map<std::string, YAML::Node> vars_;
};

// Supported tags:
//   <%= expr %>   replaced by the value of expr
//   <%# text %>   removed
//   <%%           literal "<%"
// expr is a variable, a quoted string, a number, a style name (its escape
// sequence), or one of color(text, style...), list(items[, mode[, option]]),
// upcase(x), downcase(x). Text without tags is returned unchanged.
// Malformed tags and unknown names throw ParleyError(Template).
PARLEY_API std::string ExpandTemplate(const std::string& text, const TemplateContext& context);

// Make text print literally when expanded: every "<%" becomes "<%%".
// Use it before passing user-typed text to Session::Say.
PARLEY_API std::string EscapeTags(const std::string& text);

} // namespace parley
