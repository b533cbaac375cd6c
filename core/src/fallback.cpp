#include "mender/fallback.h"
#include "mender/diff.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace mender {

const char* const kZeroDivisionMessage = "Error: Division by zero";

namespace {

bool is_ident(char c) { return std::isalnum((unsigned char)c) || c == '_'; }

std::string ltrim(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && (s[b] == ' ' || s[b] == '\t' || s[b] == '\f')) ++b;
    return s.substr(b);
}

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

bool starts_with_word(const std::string& s, const char* word) {
    const size_t n = std::char_traits<char>::length(word);
    if (s.compare(0, n, word) != 0) return false;
    return s.size() == n || !is_ident(s[n]);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') {
            out.push_back(text.substr(start, i - start));
            start = i + 1;
        }
    }
    out.push_back(text.substr(start));
    return out;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out.push_back('\n');
        out += lines[i];
    }
    return out;
}

int indent_width(const std::string& s) {
    int w = 0;
    for (char c : s) {
        if (c == ' ') {
            ++w;
        } else if (c == '\t') {
            w = (w / 8 + 1) * 8;
        } else if (c == '\f') {
            w = 0;
        } else {
            break;
        }
    }
    return w;
}

std::string leading_ws(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && (s[b] == ' ' || s[b] == '\t')) ++b;
    return s.substr(0, b);
}

// Per-physical-line view of a Python source file.
struct PyLine {
    std::string text;
    std::string code;          // string bodies as 'S', comment dropped; same offsets as text
    bool in_string{false};     // starts inside a triple-quoted string
    bool stmt_start{false};    // first line of a logical line
    bool stmt_end{false};      // logical line closes here
    bool blank{false};
    bool comment_only{false};
    int width{0};

    bool is_statement_start() const { return stmt_start && !blank && !comment_only; }
};

std::vector<PyLine> scan_source(const std::vector<std::string>& lines) {
    std::vector<PyLine> out;
    out.reserve(lines.size());
    char triple = 0;
    int depth = 0;
    bool continued = false;

    for (const auto& raw : lines) {
        PyLine p;
        p.text = raw;
        p.in_string = triple != 0;
        p.stmt_start = !continued;
        p.width = indent_width(raw);

        std::string code;
        code.reserve(raw.size());
        size_t i = 0;
        while (i < raw.size()) {
            char c = raw[i];
            if (triple) {
                if (c == '\\' && i + 1 < raw.size()) {
                    code += "SS";
                    i += 2;
                } else if (raw.compare(i, 3, std::string(3, triple)) == 0) {
                    code += std::string(3, triple);
                    triple = 0;
                    i += 3;
                } else {
                    code.push_back('S');
                    ++i;
                }
                continue;
            }
            if (c == '#') break;
            if (c == '"' || c == '\'') {
                if (raw.compare(i, 3, std::string(3, c)) == 0) {
                    triple = c;
                    code += std::string(3, c);
                    i += 3;
                    continue;
                }
                code.push_back(c);
                ++i;
                while (i < raw.size() && raw[i] != c) {
                    if (raw[i] == '\\' && i + 1 < raw.size()) {
                        code.push_back('S');
                        ++i;
                    }
                    code.push_back('S');
                    ++i;
                }
                if (i < raw.size()) {
                    code.push_back(c);
                    ++i;
                }
                continue;
            }
            if (c == '(' || c == '[' || c == '{') {
                ++depth;
            } else if (c == ')' || c == ']' || c == '}') {
                depth = std::max(0, depth - 1);
            }
            code.push_back(c);
            ++i;
        }

        std::string tail = trim(code);
        bool backslash = !triple && !tail.empty() && tail.back() == '\\';

        const std::string body = trim(raw);
        p.blank = !p.in_string && body.empty();
        p.comment_only = !p.in_string && !continued && !body.empty() && body[0] == '#';
        p.code = code;

        continued = triple != 0 || depth > 0 || backslash;
        p.stmt_end = !continued;
        out.push_back(std::move(p));
    }
    return out;
}

// Index of the last physical line of the logical line starting at k.
size_t statement_end(const std::vector<PyLine>& info, size_t k) {
    size_t e = k;
    while (e + 1 < info.size() && !info[e].stmt_end) ++e;
    return e;
}

bool ends_with_colon(const std::string& code) {
    std::string t = trim(code);
    return !t.empty() && t.back() == ':';
}

bool is_header_at(const std::vector<PyLine>& info, size_t k) {
    return ends_with_colon(info[statement_end(info, k)].code);
}

// Valid assignment target text: name, dotted name, optional subscripts.
bool is_simple_target(const std::string& code_seg) {
    std::string t = trim(code_seg);
    if (!t.empty() && t[0] == '*') t = trim(t.substr(1));
    if (t.empty() || !(std::isalpha((unsigned char)t[0]) || t[0] == '_')) return false;
    size_t i = 0;
    while (i < t.size() && (is_ident(t[i]) || t[i] == '.')) ++i;
    int depth = 0;
    for (; i < t.size(); ++i) {
        char c = t[i];
        if (c == '[') {
            ++depth;
        } else if (c == ']') {
            if (--depth < 0) return false;
        } else if (depth == 0) {
            return false;
        }
    }
    return depth == 0 && t.back() != '.';
}

// Names bound by a plain assignment statement (empty for anything else).
std::vector<std::string> assignment_targets(const std::string& text, const std::string& code) {
    std::vector<size_t> eqs;
    int depth = 0;
    for (size_t i = 0; i < code.size(); ++i) {
        char c = code[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
        } else if (c == ')' || c == ']' || c == '}') {
            depth = std::max(0, depth - 1);
        } else if (c == '=' && depth == 0) {
            char prev = i > 0 ? code[i - 1] : ' ';
            char next = i + 1 < code.size() ? code[i + 1] : ' ';
            if (next == '=' || prev == '=' || prev == '!' || prev == '<' || prev == '>') continue;
            if (std::string("+-*/%&|^@:").find(prev) != std::string::npos) return {};
            eqs.push_back(i);
        }
    }

    std::vector<std::string> targets;
    size_t seg_start = 0;
    for (size_t pos : eqs) {
        std::string seg_code = code.substr(seg_start, pos - seg_start);
        std::string seg_text = text.substr(seg_start, pos - seg_start);

        // "x: int = ..." annotates a single target
        size_t colon = seg_code.find(':');
        if (colon != std::string::npos && seg_code.find('[') == std::string::npos) {
            seg_code = seg_code.substr(0, colon);
            seg_text = seg_text.substr(0, colon);
        }
        std::string tc = trim(seg_code);
        std::string tt = trim(seg_text);
        if (tc.size() >= 2 && tc.front() == '(' && tc.back() == ')') {
            tc = tc.substr(1, tc.size() - 2);
            tt = tt.substr(1, tt.size() - 2);
        }

        // tuple targets are split at top-level commas
        std::vector<std::pair<std::string, std::string>> parts;
        int d = 0;
        size_t ps = 0;
        for (size_t i = 0; i <= tc.size(); ++i) {
            if (i < tc.size()) {
                if (tc[i] == '[' || tc[i] == '(') ++d;
                if (tc[i] == ']' || tc[i] == ')') --d;
                if (!(tc[i] == ',' && d == 0)) continue;
            }
            parts.emplace_back(tc.substr(ps, i - ps), tt.substr(ps, i - ps));
            ps = i + 1;
        }
        for (const auto& part : parts) {
            if (trim(part.first).empty()) continue;
            if (!is_simple_target(part.first)) return targets;
            std::string name = trim(part.second);
            if (!name.empty() && name[0] == '*') name = trim(name.substr(1));
            targets.push_back(name);
        }
        seg_start = pos + 1;
    }
    return targets;
}

// Lines wrapped together by one try/except guard.
struct GuardSpan {
    size_t first{0};
    size_t last{0};
    bool simple{true};  // a single simple statement, not a compound block
};

std::string first_word(const std::string& code) {
    std::string t = ltrim(code);
    size_t i = 0;
    while (i < t.size() && is_ident(t[i])) ++i;
    return t.substr(0, i);
}

bool is_decorator(const PyLine& p) {
    std::string t = ltrim(p.code);
    return !t.empty() && t[0] == '@';
}

bool is_clause_word(const std::string& w) {
    return w == "elif" || w == "else" || w == "except" || w == "finally";
}

bool is_code_start(const PyLine& p) { return !p.in_string && p.is_statement_start(); }

// match and case are soft keywords: they open a block only as headers.
bool opens_block(const std::vector<PyLine>& info, size_t k) {
    if (is_decorator(info[k])) return true;
    const std::string w = first_word(info[k].code);
    if (w == "match" || w == "case") return is_header_at(info, k);
    static const char* const words[] = {
        "if", "for", "while", "try", "with", "def", "class", "async", "elif", "else", "except", "finally",
    };
    for (const char* kw : words) {
        if (w == kw) return true;
    }
    return false;
}

size_t statement_start(const std::vector<PyLine>& info, size_t k) {
    while (k > 0 && !info[k].stmt_start) --k;
    return k;
}

// Closest earlier statement at exactly `width`; npos when a shallower one comes first.
size_t previous_at_width(const std::vector<PyLine>& info, size_t k, int width) {
    while (k > 0) {
        --k;
        if (!is_code_start(info[k])) continue;
        if (info[k].width == width) return k;
        if (info[k].width < width) return std::string::npos;
    }
    return std::string::npos;
}

bool has_division(const std::vector<PyLine>& info, size_t s) {
    const size_t e = statement_end(info, s);
    for (size_t k = s; k <= e; ++k) {
        if (info[k].code.find('/') != std::string::npos || info[k].code.find('%') != std::string::npos) return true;
    }
    return false;
}

// Whole compound statement around the block statement at s: the clause
// chain (if/elif/else, try/except/finally, decorators) and every deeper line.
std::optional<GuardSpan> block_span(const std::vector<PyLine>& info, size_t s) {
    const int width = info[s].width;
    size_t head = s;
    const std::string w = first_word(info[s].code);
    if (is_clause_word(w)) {
        while (is_clause_word(first_word(info[head].code))) {
            head = previous_at_width(info, head, width);
            if (head == std::string::npos) return std::nullopt;
        }
    } else if (w == "case") {
        size_t j = s;
        while (j > 0 && !(is_code_start(info[j - 1]) && info[j - 1].width < width)) --j;
        if (j == 0 || first_word(info[j - 1].code) != "match") return std::nullopt;
        head = j - 1;
    }
    for (;;) {
        size_t j = previous_at_width(info, head, info[head].width);
        if (j == std::string::npos || !is_decorator(info[j])) break;
        head = j;
    }

    const int hw = info[head].width;
    size_t end = statement_end(info, head);
    bool after_decorator = is_decorator(info[head]);
    for (size_t k = end + 1; k < info.size(); ++k) {
        const PyLine& p = info[k];
        if (!is_code_start(p)) continue;
        bool joins = p.width > hw;
        if (p.width == hw) {
            const std::string pw = first_word(p.code);
            joins = is_clause_word(pw) ||
                    (after_decorator && (is_decorator(p) || pw == "def" || pw == "class" || pw == "async"));
        }
        if (!joins) break;
        if (p.width == hw) after_decorator = is_decorator(p);
        end = statement_end(info, k);
        k = end;
    }
    return GuardSpan{head, end, false};
}

std::optional<GuardSpan> guard_span(const std::vector<PyLine>& info, size_t s) {
    if (opens_block(info, s)) return block_span(info, s);
    return GuardSpan{s, statement_end(info, s), true};
}

// Joined text and code of lines [first, last]; code lines padded so offsets match.
std::pair<std::string, std::string> span_text(const std::vector<std::string>& lines,
                                              const std::vector<PyLine>& info, size_t first, size_t last) {
    std::string text, code;
    for (size_t k = first; k <= last; ++k) {
        if (k > first) {
            text.push_back('\n');
            code.push_back('\n');
        }
        text += lines[k];
        std::string c = info[k].code;
        c.resize(lines[k].size(), ' ');
        code += c;
    }
    return {text, code};
}

bool is_coding_comment(const std::string& line) {
    std::string t = ltrim(line);
    return !t.empty() && t[0] == '#' && (t.find("coding:") != std::string::npos || t.find("coding=") != std::string::npos);
}

// Split "a.b as c, d" style lists at top-level commas.
std::vector<std::string> split_names(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == '(' || c == ')' || c == '\\') continue;
        if (c == ',') {
            if (!trim(cur).empty()) out.push_back(trim(cur));
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    if (!trim(cur).empty()) out.push_back(trim(cur));
    return out;
}

std::string first_token(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && !std::isspace((unsigned char)s[i])) ++i;
    return s.substr(0, i);
}

bool module_matches(const std::string& imported, const std::string& missing) {
    return imported == missing || imported.compare(0, missing.size() + 1, missing + ".") == 0;
}

std::string extract_quoted_after(const std::string& s, const std::string& marker, size_t* pos) {
    size_t p = s.rfind(marker);
    if (p == std::string::npos) return "";
    size_t b = p + marker.size();
    size_t e = s.find('\'', b);
    if (e == std::string::npos) return "";
    if (pos) *pos = e + 1;
    return s.substr(b, e - b);
}

// Indent step inside a guard, following the file's tabs or spaces.
std::string indent_unit(const std::string& indent) {
    return indent.find('\t') != std::string::npos ? "\t" : "    ";
}

} // namespace

std::optional<int> traceback_line(const std::string& trace, const std::string& script_name) {
    const std::string marker = script_name + "\", line ";
    std::optional<int> found;
    size_t pos = trace.find(marker);
    while (pos != std::string::npos) {
        size_t b = pos + marker.size();
        size_t e = b;
        while (e < trace.size() && std::isdigit((unsigned char)trace[e])) ++e;
        if (e > b && e - b < 9) found = std::atoi(trace.substr(b, e - b).c_str());
        pos = trace.find(marker, pos + 1);
    }
    return found;
}

std::optional<std::string> undefined_name(const std::string& trace) {
    const std::string marker = "name '";
    const std::string suffix = "' is not defined";
    size_t pos = trace.rfind(marker);
    while (pos != std::string::npos) {
        size_t b = pos + marker.size();
        size_t e = b;
        while (e < trace.size() && is_ident(trace[e])) ++e;
        if (e > b && trace.compare(e, suffix.size(), suffix) == 0) {
            if (!std::isdigit((unsigned char)trace[b])) return trace.substr(b, e - b);
        }
        if (pos == 0) break;
        pos = trace.rfind(marker, pos - 1);
    }
    return std::nullopt;
}

std::optional<MissingImport> missing_import(const std::string& trace) {
    MissingImport mi;
    size_t after = 0;
    std::string mod = extract_quoted_after(trace, "No module named '", &after);
    if (!mod.empty()) {
        mi.module = mod;
        return mi;
    }
    std::string name = extract_quoted_after(trace, "cannot import name '", &after);
    if (!name.empty()) {
        size_t from = trace.find("from '", after);
        if (from != std::string::npos) {
            size_t b = from + 6;
            size_t e = trace.find('\'', b);
            if (e != std::string::npos && e > b) {
                mi.module = trace.substr(b, e - b);
                mi.name = name;
                return mi;
            }
        }
    }
    return std::nullopt;
}

std::string guard_zero_division(const std::string& code, std::optional<int> line, int* wrapped) {
    if (wrapped) *wrapped = 0;
    const auto lines = split_lines(normalize_newlines(code));
    const auto info = scan_source(lines);

    std::vector<GuardSpan> spans;
    if (line && *line >= 1 && (size_t)*line <= lines.size()) {
        const size_t s = statement_start(info, (size_t)*line - 1);
        if (is_code_start(info[s])) {
            if (auto sp = guard_span(info, s)) spans.push_back(*sp);
        }
    }
    if (spans.empty()) {
        for (size_t k = 0; k < info.size(); ++k) {
            if (!is_code_start(info[k]) || !has_division(info, k)) continue;
            auto sp = guard_span(info, k);
            if (!sp) continue;
            // nested spans: the outer one wins
            bool inside = false;
            for (const auto& have : spans) {
                if (have.first <= sp->first && sp->last <= have.last) inside = true;
            }
            if (inside) continue;
            spans.erase(std::remove_if(spans.begin(), spans.end(),
                                       [&](const GuardSpan& have) {
                                           return sp->first <= have.first && have.last <= sp->last;
                                       }),
                        spans.end());
            spans.push_back(*sp);
        }
    }
    if (spans.empty()) return code;
    std::sort(spans.begin(), spans.end(), [](const GuardSpan& a, const GuardSpan& b) { return a.first < b.first; });

    std::vector<std::string> out;
    size_t next = 0;
    for (size_t k = 0; k < lines.size(); ++k) {
        if (next >= spans.size() || k != spans[next].first) {
            out.push_back(lines[k]);
            continue;
        }
        const GuardSpan& sp = spans[next++];
        const std::string indent = leading_ws(lines[k]);
        const std::string unit = indent_unit(indent);

        out.push_back(indent + "try:");
        for (size_t j = sp.first; j <= sp.last; ++j) {
            const std::string& l = lines[j];
            if (info[j].in_string || info[j].blank) {
                out.push_back(l);
            } else if (l.compare(0, indent.size(), indent) == 0) {
                out.push_back(indent + unit + l.substr(indent.size()));
            } else {
                out.push_back(unit + l);
            }
        }
        out.push_back(indent + "except ZeroDivisionError:");
        out.push_back(indent + unit + "print(\"" + kZeroDivisionMessage + "\")");

        if (sp.simple) {
            auto joined = span_text(lines, info, sp.first, sp.last);
            const std::string stmt = joined.first.substr(indent.size());
            const std::string stmt_code = joined.second.substr(indent.size());
            auto names = assignment_targets(stmt, stmt_code);
            if (!names.empty()) {
                std::string bind;
                for (const auto& n : names) bind += n + " = ";
                out.push_back(indent + unit + bind + "None");
            }
            if (starts_with_word(trim(stmt_code), "return")) {
                out.push_back(indent + unit + "return None");
            }
        }
        if (wrapped) ++*wrapped;
        k = sp.last;
    }
    return join_lines(out);
}

std::string define_missing_name(const std::string& code, const std::string& name) {
    auto lines = split_lines(normalize_newlines(code));
    const auto info = scan_source(lines);
    const size_t n = lines.size();

    size_t head = 0;
    if (head < n && lines[head].compare(0, 2, "#!") == 0) ++head;
    while (head < n && head < 2 && is_coding_comment(lines[head])) ++head;

    size_t insert_at = head;
    size_t k = head;
    auto skip_trivia = [&](size_t i) {
        while (i < n && (info[i].blank || info[i].comment_only)) ++i;
        return i;
    };

    k = skip_trivia(k);
    if (k < n && info[k].is_statement_start()) {
        std::string c = ltrim(info[k].code);
        size_t q = 0;
        while (q < c.size() && q < 2 && std::isalpha((unsigned char)c[q])) ++q;
        if (q < c.size() && (c[q] == '"' || c[q] == '\'')) {
            size_t e = statement_end(info, k);
            // a bare string statement: the module docstring
            const std::string last = trim(info[e].code);
            if (!last.empty() && last.back() == c[q]) {
                insert_at = e + 1;
                k = skip_trivia(e + 1);
            }
        }
    }
    while (k < n && info[k].is_statement_start() && starts_with_word(ltrim(info[k].code), "from") &&
           ltrim(info[k].code).find("__future__") != std::string::npos) {
        size_t e = statement_end(info, k);
        insert_at = e + 1;
        k = skip_trivia(e + 1);
    }

    lines.insert(lines.begin() + (std::ptrdiff_t)insert_at,
                 name + " = None  # was undefined (NameError); bound to None so the program can run");
    return join_lines(lines);
}

std::string reindent(const std::string& code) {
    const auto lines = split_lines(normalize_newlines(code));
    const auto info = scan_source(lines);

    std::vector<int> stack{0};
    bool pending_header = false;
    int stmt_new = 0;
    int stmt_orig = 0;

    std::vector<std::string> out;
    out.reserve(lines.size());
    for (const auto& p : info) {
        if (p.in_string) {
            out.push_back(p.text);
        } else if (p.blank) {
            out.push_back("");
        } else if (p.comment_only) {
            size_t level = pending_header ? stack.size() : stack.size() - 1;
            out.push_back(std::string(level * 4, ' ') + ltrim(p.text));
        } else if (p.stmt_start) {
            const int w = p.width;
            if (pending_header) {
                // the line after a block header always opens a deeper level
                stack.push_back(w > stack.back() ? w : stack.back() + 1);
                pending_header = false;
            } else if (w < stack.back()) {
                while (stack.size() > 1 && stack.back() > w) stack.pop_back();
            }
            stmt_new = (int)(stack.size() - 1) * 4;
            stmt_orig = w;
            out.push_back(std::string((size_t)stmt_new, ' ') + ltrim(p.text));
        } else {
            int rel = std::max(0, p.width - stmt_orig);
            out.push_back(std::string((size_t)(stmt_new + rel), ' ') + ltrim(p.text));
        }

        if (!p.blank && !p.comment_only && p.stmt_end && ends_with_colon(p.code)) {
            pending_header = true;
        }
    }
    return join_lines(out);
}

std::string disable_import(const std::string& code, const MissingImport& missing, int* removed) {
    if (removed) *removed = 0;
    if (missing.module.empty()) return code;

    const auto lines = split_lines(normalize_newlines(code));
    const auto info = scan_source(lines);
    const size_t n = lines.size();

    std::vector<size_t> starts;
    for (size_t k = 0; k < n; ++k) {
        if (!info[k].in_string && info[k].is_statement_start()) starts.push_back(k);
    }

    // statement start -> surviving "import" names (empty: disable entirely)
    std::vector<std::pair<size_t, std::vector<std::string>>> hits;
    for (size_t k : starts) {
        const size_t e = statement_end(info, k);
        std::string stmt;
        for (size_t i = k; i <= e; ++i) stmt += info[i].code + " ";
        stmt = trim(stmt);

        if (missing.name.empty() && starts_with_word(stmt, "import")) {
            std::vector<std::string> keep;
            bool hit = false;
            for (const auto& item : split_names(stmt.substr(6))) {
                if (module_matches(first_token(item), missing.module)) {
                    hit = true;
                } else {
                    keep.push_back(item);
                }
            }
            if (hit) hits.emplace_back(k, keep);
        } else if (starts_with_word(stmt, "from")) {
            std::string rest = trim(stmt.substr(4));
            std::string mod = first_token(rest);
            size_t imp = rest.find(" import ");
            if (imp == std::string::npos) continue;
            if (missing.name.empty()) {
                if (module_matches(mod, missing.module)) hits.emplace_back(k, std::vector<std::string>{});
            } else if (mod == missing.module) {
                for (const auto& item : split_names(rest.substr(imp + 8))) {
                    std::string nm = first_token(item);
                    if (nm == missing.name || nm == "*") {
                        hits.emplace_back(k, std::vector<std::string>{});
                        break;
                    }
                }
            }
        }
    }
    if (hits.empty()) return code;

    std::set<size_t> disabled;
    for (const auto& h : hits) {
        if (h.second.empty()) disabled.insert(h.first);
    }

    auto only_statement_in_block = [&](size_t k) {
        const int w = info[k].width;
        auto it = std::find(starts.begin(), starts.end(), k);
        size_t idx = (size_t)(it - starts.begin());

        for (size_t j = idx + 1; j < starts.size(); ++j) {
            size_t s = starts[j];
            if (info[s].width < w) break;
            if (disabled.count(s)) {
                // a later disabled import in the same block adds the pass
                if (info[s].width == w) return false;
                continue;
            }
            return false;
        }
        for (size_t j = idx; j-- > 0;) {
            size_t s = starts[j];
            if (disabled.count(s) && info[s].width >= w) continue;
            if (info[s].width >= w) return false;
            return is_header_at(info, s);
        }
        return false;
    };

    const std::string note = "# disabled: module '" + missing.module + "' is not available in the sandbox";
    std::vector<std::string> out;
    size_t k = 0;
    size_t hit_idx = 0;
    while (k < n) {
        if (hit_idx >= hits.size() || hits[hit_idx].first != k) {
            out.push_back(lines[k]);
            ++k;
            continue;
        }
        const auto& keep = hits[hit_idx].second;
        ++hit_idx;
        const size_t e = statement_end(info, k);
        const std::string indent = leading_ws(lines[k]);

        out.push_back(indent + note);
        for (size_t i = k; i <= e; ++i) {
            const std::string lead = leading_ws(lines[i]);
            out.push_back(lead + "# " + lines[i].substr(lead.size()));
        }
        if (!keep.empty()) {
            std::string rest;
            for (size_t i = 0; i < keep.size(); ++i) {
                if (i) rest += ", ";
                rest += keep[i];
            }
            out.push_back(indent + "import " + rest);
        } else if (only_statement_in_block(k)) {
            out.push_back(indent + "pass");
        }
        if (removed) ++*removed;
        k = e + 1;
    }
    return join_lines(out);
}

FallbackFix apply_fallback(const std::string& code, const ExecutionResult& result) {
    FallbackFix f;
    f.fixed_code = code;
    if (result.success || !result.error_type) {
        f.explanation = "The program ran without an error; no change is needed.";
        f.reasoning = "No failure was reported by the sandbox.";
        return f;
    }

    const ErrorType et = *result.error_type;
    const std::string trace = result.stack_trace.value_or("");
    const std::string et_name = error_type_name(et);
    std::string fixed = code;

    switch (et) {
        case ErrorType::ZeroDivisionError: {
            int wrapped = 0;
            auto line = traceback_line(trace);
            fixed = guard_zero_division(code, line, &wrapped);
            if (wrapped > 0) {
                f.explanation = "Guarded " + std::to_string(wrapped) + " division statement" + (wrapped == 1 ? "" : "s") +
                                " with try/except ZeroDivisionError.";
                f.reasoning = line ? "The traceback points at line " + std::to_string(*line) +
                                         "; the guard prints a message and binds assigned names to None instead of crashing."
                                   : "The failing line could not be located, so every statement that divides was guarded.";
            } else {
                f.explanation = "No division statement could be guarded automatically.";
                f.reasoning = "No statement with a division or modulo operator was found; review the program manually.";
            }
            break;
        }
        case ErrorType::NameError: {
            auto name = undefined_name(trace);
            if (name) {
                fixed = define_missing_name(code, *name);
                f.explanation = "Defined the missing name '" + *name + "' as None at the top of the module.";
                f.reasoning = "The program referenced '" + *name + "' before any assignment; binding it lets execution continue. "
                              "Replace None with the intended value.";
            } else {
                f.explanation = "The undefined name could not be determined from the traceback.";
                f.reasoning = "NameError message did not match \"name '...' is not defined\".";
            }
            break;
        }
        case ErrorType::IndentationError: {
            fixed = reindent(code);
            f.explanation = "Re-indented the program to a consistent 4-space style.";
            f.reasoning = "Block levels were rebuilt from the block headers. Tabs were expanded and unexpected "
                          "indents flattened; continuation lines and string contents keep their layout.";
            break;
        }
        case ErrorType::ImportError:
        case ErrorType::ModuleNotFoundError: {
            auto mi = missing_import(trace);
            int removed = 0;
            if (mi) fixed = disable_import(code, *mi, &removed);
            if (removed > 0) {
                f.explanation = "Commented out " + std::to_string(removed) + " import" + (removed == 1 ? "" : "s") +
                                " of '" + mi->module + "', which is not available in the sandbox.";
                f.reasoning = "Only the Python standard library is installed and packages cannot be added. "
                              "Code that uses the module still needs a standard-library replacement.";
            } else {
                f.explanation = "The failing import could not be located in the program.";
                f.reasoning = "The import error did not name a module imported directly by this file.";
            }
            break;
        }
        case ErrorType::SyntaxError: {
            auto line = traceback_line(trace);
            f.explanation = "The program has a syntax error" +
                            (line ? " at line " + std::to_string(*line) : std::string()) +
                            "; syntax errors are not rewritten automatically.";
            f.reasoning = "Guessing the intended syntax could change the program's meaning. Manual review is recommended.";
            break;
        }
        case ErrorType::TimeoutError:
            f.explanation = "The program exceeded its time limit (likely an infinite loop or blocking call).";
            f.reasoning = "No automatic rule can decide how a loop should terminate. Manual review is recommended.";
            break;
        case ErrorType::MemoryError:
            f.explanation = "The program exceeded its memory limit.";
            f.reasoning = "Reducing memory use requires changing the algorithm or data sizes. Manual review is recommended.";
            break;
        case ErrorType::TypeError:
        case ErrorType::UnknownError:
        default:
            f.explanation = "No automatic fix is available for " + et_name + ".";
            f.reasoning = "The fallback rules cover ZeroDivisionError, NameError, IndentationError and import failures.";
            break;
    }

    if (normalize_newlines(fixed) != normalize_newlines(code)) {
        f.fixed_code = fixed;
        f.changed = true;
    }
    return f;
}

} // namespace mender
