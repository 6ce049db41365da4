#include "ui/element_metadata.hpp"

#include <cctype>

namespace uisync {

namespace {

bool IsIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool IsIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool IsQuote(char c) {
    return c == '\'' || c == '"' || c == '`';
}

char ClosingFor(char open) {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default:  return '}';
    }
}

// Forward-only scanner over TypeScript/JavaScript source. It knows about
// comments, string and template literals and bracket nesting, nothing else.
class Scanner {
public:
    explicit Scanner(std::string_view s) : s_(s) {}

    bool AtEnd() const { return pos_ >= s_.size(); }
    char Peek() const { return AtEnd() ? '\0' : s_[pos_]; }
    size_t Pos() const { return pos_; }
    void Advance() { if (!AtEnd()) ++pos_; }
    void Seek(size_t pos) { pos_ = pos < s_.size() ? pos : s_.size(); }

    bool Consume(char c) {
        SkipTrivia();
        if (Peek() != c) return false;
        ++pos_;
        return true;
    }

    void SkipTrivia() {
        while (!AtEnd()) {
            const char c = s_[pos_];
            if (std::isspace(static_cast<unsigned char>(c))) {
                ++pos_;
            } else if (s_.compare(pos_, 2, "//") == 0) {
                const size_t nl = s_.find('\n', pos_);
                pos_ = nl == std::string_view::npos ? s_.size() : nl + 1;
            } else if (s_.compare(pos_, 2, "/*") == 0) {
                const size_t end = s_.find("*/", pos_ + 2);
                pos_ = end == std::string_view::npos ? s_.size() : end + 2;
            } else {
                return;
            }
        }
    }

    // Identifier, optionally dotted ("Decorators.Element").
    std::string_view ReadIdentifier(bool dotted = false) {
        const size_t start = pos_;
        if (AtEnd() || !IsIdentStart(s_[pos_])) return {};
        while (!AtEnd() && (IsIdentChar(s_[pos_]) || (dotted && s_[pos_] == '.'))) ++pos_;
        return s_.substr(start, pos_ - start);
    }

    // Reads a string literal at the current position. Returns false on an
    // unterminated literal. `literal` is false for template literals with
    // substitutions.
    bool ReadString(std::string& out, bool& literal) {
        const char quote = Peek();
        out.clear();
        literal = true;
        ++pos_;
        while (!AtEnd()) {
            const char c = s_[pos_++];
            if (c == quote) return true;
            if (c == '\\') {
                if (AtEnd()) return false;
                const char e = s_[pos_++];
                switch (e) {
                    case 'n': out.push_back('\n'); break;
                    case 't': out.push_back('\t'); break;
                    case 'r': out.push_back('\r'); break;
                    case '0': out.push_back('\0'); break;
                    case '\n': break;
                    default: out.push_back(e); break;
                }
                continue;
            }
            if (quote == '`' && c == '$' && Peek() == '{') {
                literal = false;
                if (!SkipBalanced()) return false;
                continue;
            }
            if (quote != '`' && c == '\n') return false;
            out.push_back(c);
        }
        return false;
    }

    bool SkipString() {
        std::string ignored;
        bool literal = true;
        return ReadString(ignored, literal);
    }

    // At an opening bracket: moves past its matching closing bracket.
    bool SkipBalanced() {
        const char open = Peek();
        const char close = ClosingFor(open);
        ++pos_;
        while (true) {
            SkipTrivia();
            if (AtEnd()) return false;
            const char c = Peek();
            if (c == close) {
                ++pos_;
                return true;
            }
            if (IsQuote(c)) {
                if (!SkipString()) return false;
            } else if (c == '(' || c == '[' || c == '{') {
                if (!SkipBalanced()) return false;
            } else {
                ++pos_;
            }
        }
    }

    // Moves past the next comma at the current nesting level, or to the end.
    void SkipToNextProperty() {
        while (true) {
            SkipTrivia();
            if (AtEnd()) return;
            const char c = Peek();
            if (c == ',') {
                ++pos_;
                return;
            }
            if (IsQuote(c)) {
                if (!SkipString()) return;
            } else if (c == '(' || c == '[' || c == '{') {
                if (!SkipBalanced()) return;
            } else {
                ++pos_;
            }
        }
    }

    std::string_view Slice(size_t from, size_t to) const { return s_.substr(from, to - from); }

private:
    std::string_view s_;
    size_t pos_ = 0;
};

bool IsPropertyEnd(Scanner& sc) {
    sc.SkipTrivia();
    return sc.AtEnd() || sc.Peek() == ',';
}

// Literal `key: value` pairs at the top level of an object literal body.
std::map<std::string, std::string> ReadLiteralProperties(std::string_view body) {
    std::map<std::string, std::string> props;
    Scanner sc(body);
    while (true) {
        sc.SkipTrivia();
        if (sc.AtEnd()) break;

        std::string key;
        if (IsQuote(sc.Peek())) {
            bool literal = true;
            if (!sc.ReadString(key, literal) || !literal) break;
        } else {
            key = std::string(sc.ReadIdentifier());
            if (key.empty()) {
                // spread, computed key or something else we do not read
                sc.SkipToNextProperty();
                continue;
            }
        }

        if (!sc.Consume(':')) {
            sc.SkipToNextProperty();
            continue;
        }
        sc.SkipTrivia();

        std::string value;
        bool have_value = false;
        if (IsQuote(sc.Peek())) {
            bool literal = true;
            if (!sc.ReadString(value, literal)) break;
            have_value = literal && IsPropertyEnd(sc);
        } else {
            const size_t start = sc.Pos();
            if (sc.Peek() == '-') sc.Advance();
            while (!sc.AtEnd() && (IsIdentChar(sc.Peek()) || sc.Peek() == '.')) sc.Advance();
            const std::string_view token = sc.Slice(start, sc.Pos());
            const size_t digits_from = (!token.empty() && token[0] == '-') ? 1 : 0;
            const bool numeric = token.size() > digits_from &&
                                 std::isdigit(static_cast<unsigned char>(token[digits_from])) &&
                                 std::isdigit(static_cast<unsigned char>(token.back()));
            if ((numeric || token == "true" || token == "false") && IsPropertyEnd(sc)) {
                value = std::string(token);
                have_value = true;
            }
        }

        if (have_value) props.emplace(std::move(key), std::move(value));
        sc.SkipToNextProperty();
    }
    return props;
}

// After a decorator's closing parenthesis: further decorators and modifiers may
// appear before the class keyword.
bool FollowedByClass(Scanner& sc) {
    while (true) {
        sc.SkipTrivia();
        if (sc.Peek() == '@') {
            sc.Advance();
            if (sc.ReadIdentifier(true).empty()) return false;
            sc.SkipTrivia();
            if (sc.Peek() == '(' && !sc.SkipBalanced()) return false;
            continue;
        }
        const std::string_view word = sc.ReadIdentifier();
        if (word == "class") return true;
        if (word != "export" && word != "default" && word != "abstract" && word != "declare") {
            return false;
        }
    }
}

// Scanner positioned on '@'. Returns metadata when the decorator has an object
// literal argument, precedes a class and declares a non-empty name.
std::optional<ElementMetadata> TryDecorator(Scanner& sc) {
    sc.Advance();
    ElementMetadata meta;
    meta.decorator = std::string(sc.ReadIdentifier(true));
    if (meta.decorator.empty() || !sc.Consume('(')) return std::nullopt;

    sc.SkipTrivia();
    if (sc.Peek() != '{') return std::nullopt;
    const size_t body_start = sc.Pos() + 1;
    if (!sc.SkipBalanced()) return std::nullopt;
    const size_t body_end = sc.Pos() - 1;
    if (!sc.Consume(')')) return std::nullopt;
    if (!FollowedByClass(sc)) return std::nullopt;

    meta.properties = ReadLiteralProperties(sc.Slice(body_start, body_end));
    auto it = meta.properties.find("name");
    if (it == meta.properties.end() || it->second.empty()) return std::nullopt;
    meta.name = it->second;
    meta.properties.erase(it);
    return meta;
}

} // namespace

std::optional<ElementMetadata> ExtractElementMetadata(std::string_view script) {
    Scanner sc(script);
    while (true) {
        sc.SkipTrivia();
        if (sc.AtEnd()) return std::nullopt;

        const char c = sc.Peek();
        if (IsQuote(c)) {
            if (!sc.SkipString()) return std::nullopt;
            continue;
        }
        if (c != '@') {
            sc.Advance();
            continue;
        }

        // A failed candidate resumes the search right after its '@'.
        Scanner probe = sc;
        if (auto meta = TryDecorator(probe)) return meta;
        sc.Seek(sc.Pos() + 1);
    }
}

std::optional<std::string> ExtractElementName(std::string_view script) {
    auto meta = ExtractElementMetadata(script);
    if (!meta) return std::nullopt;
    return meta->name;
}

} // namespace uisync
