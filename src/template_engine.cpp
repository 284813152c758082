#include "parley/template_engine.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

#include "parley/style.hpp"
#include "parley/text_layout.hpp"

namespace parley {

const YAML::Node* TemplateContext::Find(const std::string& name) const {
    auto it = vars_.find(name);
    return it == vars_.end() ? nullptr : &it->second;
}

namespace {

struct Expr {
    enum class Kind { Literal, Name, Call };
    Kind kind = Kind::Literal;
    std::string text;
    std::vector<Expr> args;
};

[[noreturn]] void Fail(const std::string& msg, const std::string& source) {
    throw ParleyError(ParleyErrc::Template, msg + " in '<%=" + source + "%>'");
}

class ExpressionParser {
public:
    explicit ExpressionParser(const std::string& src) : src_(src) {}

    Expr ParseAll() {
        Expr e = ParseExpr();
        SkipSpace();
        if (pos_ != src_.size()) Fail("Unexpected trailing text", src_);
        return e;
    }

private:
    void SkipSpace() {
        while (pos_ < src_.size() && std::isspace(static_cast<unsigned char>(src_[pos_]))) ++pos_;
    }

    static bool IsIdentStart(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
    static bool IsIdentChar(char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

    Expr ParseExpr() {
        SkipSpace();
        if (pos_ >= src_.size()) Fail("Missing expression", src_);
        char c = src_[pos_];
        if (c == '"' || c == '\'') return ParseString(c);
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '-') return ParseNumber();
        if (IsIdentStart(c)) return ParseName();
        Fail(std::string("Unexpected character '") + c + "'", src_);
    }

    Expr ParseString(char quote) {
        Expr e;
        ++pos_;
        while (pos_ < src_.size() && src_[pos_] != quote) {
            char c = src_[pos_++];
            if (c == '\\' && pos_ < src_.size()) {
                char n = src_[pos_++];
                switch (n) {
                    case 'n': e.text += '\n'; break;
                    case 't': e.text += '\t'; break;
                    case 'e': e.text += '\x1B'; break;
                    default: e.text += n; break;
                }
            } else {
                e.text += c;
            }
        }
        if (pos_ >= src_.size()) Fail("Unterminated string", src_);
        ++pos_;
        return e;
    }

    Expr ParseNumber() {
        Expr e;
        size_t start = pos_;
        if (src_[pos_] == '-') ++pos_;
        while (pos_ < src_.size() && (std::isdigit(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '.')) ++pos_;
        e.text = src_.substr(start, pos_ - start);
        if (e.text == "-") Fail("Malformed number", src_);
        return e;
    }

    Expr ParseName() {
        Expr e;
        size_t start = pos_;
        while (pos_ < src_.size() && IsIdentChar(src_[pos_])) ++pos_;
        e.text = src_.substr(start, pos_ - start);
        e.kind = Expr::Kind::Name;
        SkipSpace();
        if (pos_ < src_.size() && src_[pos_] == '(') {
            ++pos_;
            e.kind = Expr::Kind::Call;
            SkipSpace();
            if (pos_ < src_.size() && src_[pos_] == ')') { ++pos_; return e; }
            while (true) {
                e.args.push_back(ParseExpr());
                SkipSpace();
                if (pos_ >= src_.size()) Fail("Unterminated call", src_);
                if (src_[pos_] == ',') { ++pos_; continue; }
                if (src_[pos_] == ')') { ++pos_; break; }
                Fail("Expected ',' or ')'", src_);
            }
        }
        return e;
    }

    const std::string& src_;
    size_t pos_ = 0;
};

std::string NodeText(const YAML::Node& node, const std::string& source) {
    if (!node.IsDefined() || node.IsNull()) return "";
    if (node.IsScalar()) return node.as<std::string>();
    if (node.IsSequence()) {
        std::string out;
        for (size_t i = 0; i < node.size(); ++i) {
            if (i) out += ", ";
            out += NodeText(node[i], source);
        }
        return out;
    }
    Fail("Cannot render a mapping", source);
}

std::string ChangeCase(std::string s, bool upper) {
    std::transform(s.begin(), s.end(), s.begin(), [upper](unsigned char c) {
        return static_cast<char>(upper ? std::toupper(c) : std::tolower(c));
    });
    return s;
}

class Evaluator {
public:
    Evaluator(const TemplateContext& ctx, const std::string& source) : ctx_(ctx), source_(source) {}

    // symbol_ok: an unknown bare name evaluates to its own spelling
    // (style and list-mode arguments).
    YAML::Node Eval(const Expr& e, bool symbol_ok = false) {
        switch (e.kind) {
            case Expr::Kind::Literal:
                return YAML::Node(e.text);
            case Expr::Kind::Name: {
                if (const YAML::Node* v = ctx_.Find(e.text)) return *v;
                if (symbol_ok) return YAML::Node(e.text);
                if (auto style = StyleFromName(e.text)) {
                    return YAML::Node(std::string(ctx_.use_color ? StyleCode(*style) : ""));
                }
                Fail("Unknown name '" + e.text + "'", source_);
            }
            case Expr::Kind::Call:
                return Call(e);
        }
        Fail("Unsupported expression", source_);
    }

private:
    YAML::Node Call(const Expr& e) {
        if (e.text == "color") {
            if (e.args.empty()) Fail("color() needs text", source_);
            std::string text = NodeText(Eval(e.args[0]), source_);
            if (!ctx_.use_color) return YAML::Node(text);
            std::vector<std::string> styles;
            for (size_t i = 1; i < e.args.size(); ++i) {
                styles.push_back(NodeText(Eval(e.args[i], true), source_));
            }
            try {
                return YAML::Node(Color(text, styles));
            } catch (const ParleyError& err) {
                Fail(err.what(), source_);
            }
        }
        if (e.text == "list") {
            if (e.args.empty() || e.args.size() > 3) Fail("list() takes 1 to 3 arguments", source_);
            YAML::Node items_node = Eval(e.args[0]);
            std::vector<std::string> items;
            if (items_node.IsSequence()) {
                for (const auto& item : items_node) items.push_back(NodeText(item, source_));
            } else if (items_node.IsDefined() && !items_node.IsNull()) {
                items.push_back(NodeText(items_node, source_));
            }
            ListMode mode = ListMode::Rows;
            if (e.args.size() > 1) {
                std::string name = NodeText(Eval(e.args[1], true), source_);
                auto parsed = ListModeFromName(name);
                if (!parsed) Fail("Unknown list mode '" + name + "'", source_);
                mode = *parsed;
            }
            std::optional<std::string> option;
            if (e.args.size() > 2) {
                YAML::Node opt = Eval(e.args[2]);
                if (opt.IsDefined() && !opt.IsNull()) option = NodeText(opt, source_);
            }
            return YAML::Node(List(items, mode, option, ctx_.wrap_at));
        }
        if (e.text == "upcase" || e.text == "downcase") {
            if (e.args.size() != 1) Fail(e.text + "() takes one argument", source_);
            return YAML::Node(ChangeCase(NodeText(Eval(e.args[0]), source_), e.text == "upcase"));
        }
        Fail("Unknown function '" + e.text + "'", source_);
    }

    const TemplateContext& ctx_;
    const std::string& source_;
};

} // namespace

std::string ExpandTemplate(const std::string& text, const TemplateContext& context) {
    if (text.find("<%") == std::string::npos) return text;

    std::string out;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t open = text.find("<%", pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            break;
        }
        out.append(text, pos, open - pos);
        if (open + 2 < text.size() && text[open + 2] == '%') {
            out += "<%";
            pos = open + 3;
            continue;
        }
        size_t close = text.find("%>", open + 2);
        if (close == std::string::npos) {
            throw ParleyError(ParleyErrc::Template, "Unterminated template tag");
        }
        char marker = open + 2 < close ? text[open + 2] : '\0';
        if (marker == '#') {
            pos = close + 2;
            continue;
        }
        if (marker != '=') {
            throw ParleyError(ParleyErrc::Template,
                              "Only <%= %> and <%# %> tags are supported: '" +
                                  text.substr(open, close + 2 - open) + "'");
        }
        const std::string source = text.substr(open + 3, close - open - 3);
        ExpressionParser parser(source);
        Expr expr = parser.ParseAll();
        Evaluator eval(context, source);
        out += NodeText(eval.Eval(expr), source);
        pos = close + 2;
    }
    return out;
}

std::string EscapeTags(const std::string& text) {
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t open = text.find("<%", pos);
        if (open == std::string::npos) {
            out.append(text, pos, std::string::npos);
            return out;
        }
        out.append(text, pos, open - pos);
        out += "<%%";
        pos = open + 2;
    }
}

} // namespace parley
