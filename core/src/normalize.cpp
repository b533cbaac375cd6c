#include "mender/normalize.h"
#include "mender/json_mini.h"

#include <cctype>
#include <climits>
#include <cstring>

namespace mender {

namespace {

const char* const kLineStarters[] = {
    "def", "class", "import", "from", "if", "elif", "else", "for", "while", "try",
    "except", "finally", "with", "return", "pass", "break", "continue", "raise",
    "async", "await", "lambda", "global", "nonlocal", "assert", "del", "yield",
    "match", "case", "print", "input", "len", "range", "open", "True", "False", "None",
};

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }
bool is_ident_start(char c) { return std::isalpha((unsigned char)c) || c == '_'; }
bool is_ident(char c) { return std::isalnum((unsigned char)c) || c == '_'; }

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return s.substr(b, e - b);
}

// Leading blank lines and trailing whitespace go; the first line's indent stays.
std::string trim_code(const std::string& s) {
    size_t b = 0;
    size_t line_start = 0;
    while (b < s.size() && is_space(s[b])) {
        if (s[b] == '\n') line_start = b + 1;
        ++b;
    }
    size_t e = s.size();
    while (e > b && is_space(s[e - 1])) --e;
    if (b >= e) return "";
    return s.substr(line_start, e - line_start);
}

bool line_looks_like_code(const std::string& raw_line) {
    std::string l = trim(raw_line);
    if (l.empty()) return false;
    if (l[0] == '#' || l[0] == '@') return true;
    if (!is_ident_start(l[0])) return false;

    size_t i = 0;
    while (i < l.size() && is_ident(l[i])) ++i;
    const std::string word = l.substr(0, i);
    const bool at_word_end = i == l.size() || !is_ident(l[i]);
    if (at_word_end) {
        for (const char* k : kLineStarters) {
            if (word == k) {
                if (i == l.size()) return true;
                char next = l[i];
                // "print something" is prose; "print(x)", "return x", "if x:" are code
                if (word == "print" || word == "input" || word == "len" || word == "range" || word == "open") {
                    return next == '(';
                }
                return true;
            }
        }
    }

    // dotted name followed by a call, subscript or assignment
    while (i < l.size() && (is_ident(l[i]) || l[i] == '.')) ++i;
    size_t j = i;
    while (j < l.size() && (l[j] == ' ' || l[j] == '\t')) ++j;
    if (j >= l.size()) return false;
    char c = l[j];
    if (j == i && (c == '(' || c == '[')) return true;
    if (c == '=' && (j + 1 >= l.size() || l[j + 1] != '=')) return true;
    if (c == ',') {
        // tuple unpacking: "a, b = ..."
        return l.find('=') != std::string::npos && l.find("==") == std::string::npos;
    }
    if (std::strchr("+-*/%&|^", c) && j + 1 < l.size() && l[j + 1] == '=') return true;
    if (c == ':' && j + 1 < l.size()) {
        // annotated assignment "x: int = 0"
        return l.find('=', j) != std::string::npos;
    }
    return false;
}

// Content of the first fenced block, or the input when there is none.
std::string strip_code_fence(const std::string& s) {
    size_t open = s.find("```");
    if (open == std::string::npos) return s;
    size_t body = s.find('\n', open);
    if (body == std::string::npos) {
        // single-line fence: "```print(1)```"
        size_t close = s.find("```", open + 3);
        std::string inner = s.substr(open + 3, close == std::string::npos ? std::string::npos : close - open - 3);
        size_t k = 0;
        while (k < inner.size() && std::isalpha((unsigned char)inner[k])) ++k;
        return (k > 0 && k < inner.size() && inner[k] == ' ') ? inner.substr(k + 1) : inner;
    }
    ++body;
    size_t close = s.find("```", body);
    if (close == std::string::npos) return s.substr(body);
    return s.substr(body, close - body);
}

void parse_line_edits(json_object* arr, std::vector<LineEdit>* out) {
    if (!arr || !json_object_is_type(arr, json_type_array)) return;
    const size_t n = json_object_array_length(arr);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, i);
        if (!el || !json_object_is_type(el, json_type_object)) continue;
        auto line = json_mini::get_int(el, "line_number");
        if (!line || *line < 1 || *line > INT_MAX) continue;

        json_object* old_v = json_mini::get_field(el, "old_text");
        json_object* new_v = json_mini::get_field(el, "new_text");
        if (old_v && !json_object_is_type(old_v, json_type_string)) continue;
        if (new_v && !json_object_is_type(new_v, json_type_string)) continue;
        if (!old_v && !new_v) continue;

        LineEdit e;
        e.line_number = (int)*line;
        e.old_text = json_mini::get_string(el, "old_text").value_or("");
        e.new_text = json_mini::get_string(el, "new_text").value_or("");
        if (auto kind_s = json_mini::get_string(el, "kind")) {
            auto k = parse_edit_kind(*kind_s);
            if (!k) continue;
            e.kind = *k;
        } else if (!old_v) {
            e.kind = EditKind::INSERT;
        } else if (!new_v) {
            e.kind = EditKind::DELETE;
        } else {
            e.kind = EditKind::REPLACE;
        }
        if (e.kind == EditKind::INSERT && !e.old_text.empty()) continue;
        if (e.kind == EditKind::DELETE && !e.new_text.empty()) continue;
        out->push_back(std::move(e));
    }
}


// Keys a reply may carry the corrected program under, in order of preference.
const char* const kCodeKeys[] = {"fixed_code", "code", "fix"};

// Escapes raw line breaks and tabs inside JSON string literals from the first '{' on.
std::string escape_raw_controls(const std::string& s) {
    size_t start = s.find('{');
    if (start == std::string::npos) return s;
    std::string out(s, 0, start);
    out.reserve(s.size() + 16);
    bool in_str = false, esc = false;
    for (size_t i = start; i < s.size(); ++i) {
        char c = s[i];
        if (!in_str) {
            if (c == '"') in_str = true;
            out.push_back(c);
            continue;
        }
        if (esc) {
            esc = false;
            out.push_back(c);
            continue;
        }
        switch (c) {
            case '\\': esc = true; out.push_back(c); break;
            case '"': in_str = false; out.push_back(c); break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

json_mini::Doc find_reply_object(const std::string& text, const char** key) {
    for (const char* k : kCodeKeys) {
        json_mini::Doc d = json_mini::extract_object_with_key(text, k);
        if (d) {
            *key = k;
            return d;
        }
    }
    return json_mini::Doc{};
}

} // namespace

std::string unescape_sequences(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c != '\\' || i + 1 >= s.size()) {
            out.push_back(c);
            continue;
        }
        char n = s[i + 1];
        switch (n) {
            case 'n': out.push_back('\n'); ++i; break;
            case 'r': out.push_back('\r'); ++i; break;
            case 't': out.push_back('\t'); ++i; break;
            case '"': out.push_back('"'); ++i; break;
            case '\'': out.push_back('\''); ++i; break;
            case '\\': out.push_back('\\'); ++i; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

bool looks_like_code(const std::string& text) {
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        if (line_looks_like_code(text.substr(start, end - start))) return true;
        start = end + 1;
    }
    return false;
}

std::optional<std::string> normalize_code(const std::string& raw, std::string* why) {
    std::string code = raw;

    // double-escaped payload: one physical line holding literal "\n" sequences
    if (code.find('\n') == std::string::npos && code.find('\r') == std::string::npos &&
        code.find("\\n") != std::string::npos) {
        code = unescape_sequences(code);
    }

    code = strip_code_fence(code);
    code = trim_code(code);

    if (code.empty()) {
        if (why) *why = "fixed_code is empty";
        return std::nullopt;
    }
    if (!looks_like_code(code)) {
        if (why) *why = "fixed_code does not look like code";
        return std::nullopt;
    }
    code.push_back('\n');
    return code;
}

ParsedReply parse_inference_output(const std::string& raw) {
    ParsedReply r;
    if (trim(raw).empty()) {
        r.detail = "empty response";
        return r;
    }

    const char* key = nullptr;
    json_mini::Doc d = find_reply_object(raw, &key);
    if (!d) {
        // multi-line code sent without escaping its line breaks
        const std::string repaired = escape_raw_controls(raw);
        if (repaired != raw) d = find_reply_object(repaired, &key);
    }
    if (!d) {
        json_mini::Doc any = json_mini::extract_object_with_key(raw, nullptr);
        r.detail = any ? "response object has no fixed_code" : "no JSON object in response";
        return r;
    }

    auto fixed = json_mini::get_string(d.root, key);
    if (!fixed) {
        r.detail = std::string(key) + " is not a string";
        return r;
    }

    std::string why;
    auto code = normalize_code(*fixed, &why);
    if (!code) {
        r.detail = why;
        return r;
    }

    r.patch.fixed_code = *code;
    r.patch.explanation = trim(json_mini::get_string(d.root, "explanation").value_or(""));
    r.patch.reasoning = trim(json_mini::get_string(d.root, "reasoning").value_or(""));
    if (r.patch.explanation.empty()) {
        r.patch.explanation = "The model proposed a fix without an explanation.";
    }
    if (r.patch.reasoning.empty()) {
        r.patch.reasoning = "No reasoning was provided by the model.";
    }
    parse_line_edits(json_mini::get_field(d.root, "line_edits"), &r.patch.line_edits);

    r.kind = ParsedReply::Kind::OK;
    return r;
}

} // namespace mender
