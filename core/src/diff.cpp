#include "mender/diff.h"

#include <algorithm>
#include <map>
#include <sstream>

namespace mender {

namespace {

// Above this many DP cells the changed middle is reported as one block.
constexpr size_t kMaxLcsCells = 4u * 1024u * 1024u;

// Lines with their terminators kept; a final unterminated line is its own unit.
std::vector<std::string> split_keepends(const std::string& text) {
    std::vector<std::string> out;
    size_t start = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n') {
            out.push_back(text.substr(start, i + 1 - start));
            start = i + 1;
        }
    }
    if (start < text.size()) out.push_back(text.substr(start));
    return out;
}

// Split on '\n' keeping every piece, so joining with '\n' restores the text.
std::vector<std::string> split_all(const std::string& text) {
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

void push_op(std::vector<DiffOp>* ops, DiffOp::Tag tag, size_t i1, size_t i2, size_t j1, size_t j2) {
    if (i1 == i2 && j1 == j2) return;
    ops->push_back(DiffOp{tag, i1, i2, j1, j2});
}

DiffOp::Tag change_tag(size_t i1, size_t i2, size_t j1, size_t j2) {
    if (i1 == i2) return DiffOp::Tag::INSERT;
    if (j1 == j2) return DiffOp::Tag::DELETE;
    return DiffOp::Tag::REPLACE;
}

std::string format_range(size_t start, size_t stop) {
    size_t beginning = start + 1;
    size_t length = stop - start;
    if (length == 1) return std::to_string(beginning);
    if (length == 0) beginning -= 1;
    return std::to_string(beginning) + "," + std::to_string(length);
}

void emit_line(std::ostringstream& os, char prefix, const std::string& unit) {
    os << prefix << unit;
    if (unit.empty() || unit.back() != '\n') os << "\n\\ No newline at end of file\n";
}

std::vector<std::vector<DiffOp>> group_opcodes(std::vector<DiffOp> codes, size_t n) {
    std::vector<std::vector<DiffOp>> groups;
    if (codes.empty()) return groups;
    if (codes.front().tag == DiffOp::Tag::EQUAL) {
        DiffOp& c = codes.front();
        c.i1 = std::max(c.i1, c.i2 > n ? c.i2 - n : 0);
        c.j1 = std::max(c.j1, c.j2 > n ? c.j2 - n : 0);
    }
    if (codes.back().tag == DiffOp::Tag::EQUAL) {
        DiffOp& c = codes.back();
        c.i2 = std::min(c.i2, c.i1 + n);
        c.j2 = std::min(c.j2, c.j1 + n);
    }
    const size_t nn = n + n;
    std::vector<DiffOp> group;
    for (DiffOp c : codes) {
        if (c.tag == DiffOp::Tag::EQUAL && c.i2 - c.i1 > nn) {
            group.push_back(DiffOp{c.tag, c.i1, std::min(c.i2, c.i1 + n), c.j1, std::min(c.j2, c.j1 + n)});
            groups.push_back(group);
            group.clear();
            c.i1 = std::max(c.i1, c.i2 - n);
            c.j1 = std::max(c.j1, c.j2 - n);
        }
        group.push_back(c);
    }
    if (!group.empty() && !(group.size() == 1 && group[0].tag == DiffOp::Tag::EQUAL)) {
        groups.push_back(group);
    }
    return groups;
}

} // namespace

std::string normalize_newlines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (c == '\r') {
            out.push_back('\n');
            if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<DiffOp> diff_opcodes(const std::vector<std::string>& a,
                                 const std::vector<std::string>& b) {
    std::vector<DiffOp> ops;
    const size_t n = a.size();
    const size_t m = b.size();

    size_t pre = 0;
    while (pre < n && pre < m && a[pre] == b[pre]) ++pre;
    size_t suf = 0;
    while (suf < n - pre && suf < m - pre && a[n - 1 - suf] == b[m - 1 - suf]) ++suf;

    push_op(&ops, DiffOp::Tag::EQUAL, 0, pre, 0, pre);

    const size_t an = n - pre - suf;
    const size_t bm = m - pre - suf;
    if (an == 0 || bm == 0 || (an + 1) * (bm + 1) > kMaxLcsCells) {
        push_op(&ops, change_tag(pre, pre + an, pre, pre + bm), pre, pre + an, pre, pre + bm);
    } else {
        // lcs[i][j] = LCS length of a[pre+i..] and b[pre+j..] within the middle
        const size_t w = bm + 1;
        std::vector<int> lcs((an + 1) * w, 0);
        for (size_t i = an; i-- > 0;) {
            for (size_t j = bm; j-- > 0;) {
                if (a[pre + i] == b[pre + j]) {
                    lcs[i * w + j] = lcs[(i + 1) * w + j + 1] + 1;
                } else {
                    lcs[i * w + j] = std::max(lcs[(i + 1) * w + j], lcs[i * w + j + 1]);
                }
            }
        }

        size_t i = 0, j = 0;
        size_t ci = 0, cj = 0;  // start of the pending change run
        size_t ei = 0, ej = 0;  // start of the pending equal run
        bool in_equal = false;
        auto flush_change = [&]() {
            push_op(&ops, change_tag(pre + ci, pre + i, pre + cj, pre + j), pre + ci, pre + i, pre + cj, pre + j);
        };
        while (i < an || j < bm) {
            if (i < an && j < bm && a[pre + i] == b[pre + j]) {
                if (!in_equal) {
                    flush_change();
                    ei = i;
                    ej = j;
                    in_equal = true;
                }
                ++i;
                ++j;
                continue;
            }
            if (in_equal) {
                push_op(&ops, DiffOp::Tag::EQUAL, pre + ei, pre + i, pre + ej, pre + j);
                in_equal = false;
                ci = i;
                cj = j;
            }
            // deletions first so a changed line reads as '-' then '+'
            if (i < an && (j == bm || lcs[(i + 1) * w + j] >= lcs[i * w + j + 1])) {
                ++i;
            } else {
                ++j;
            }
        }
        if (in_equal) {
            push_op(&ops, DiffOp::Tag::EQUAL, pre + ei, pre + i, pre + ej, pre + j);
        } else {
            flush_change();
        }
    }

    push_op(&ops, DiffOp::Tag::EQUAL, n - suf, n, m - suf, m);
    return ops;
}

std::string unified_diff(const std::string& original, const std::string& fixed,
                         const std::string& from_name, const std::string& to_name,
                         size_t context) {
    const auto a = split_keepends(original);
    const auto b = split_keepends(fixed);
    if (a == b) return "";

    std::ostringstream os;
    bool started = false;
    for (const auto& group : group_opcodes(diff_opcodes(a, b), context)) {
        if (!started) {
            os << "--- " << from_name << "\n";
            os << "+++ " << to_name << "\n";
            started = true;
        }
        const DiffOp& first = group.front();
        const DiffOp& last = group.back();
        os << "@@ -" << format_range(first.i1, last.i2) << " +" << format_range(first.j1, last.j2) << " @@\n";
        for (const auto& op : group) {
            if (op.tag == DiffOp::Tag::EQUAL) {
                for (size_t k = op.i1; k < op.i2; ++k) emit_line(os, ' ', a[k]);
                continue;
            }
            for (size_t k = op.i1; k < op.i2; ++k) emit_line(os, '-', a[k]);
            for (size_t k = op.j1; k < op.j2; ++k) emit_line(os, '+', b[k]);
        }
    }
    return os.str();
}

DiffResult diff(const std::string& original, const std::string& fixed) {
    DiffResult out;
    const std::string a_text = normalize_newlines(original);
    const std::string b_text = normalize_newlines(fixed);
    if (a_text == b_text) return out;

    out.unified_diff = unified_diff(a_text, b_text, "original.py", "fixed.py", 3);

    const auto a = split_all(a_text);
    const auto b = split_all(b_text);
    for (const auto& op : diff_opcodes(a, b)) {
        if (op.tag == DiffOp::Tag::EQUAL) continue;
        const size_t d = op.i2 - op.i1;
        const size_t ins = op.j2 - op.j1;
        const size_t k = std::min(d, ins);
        for (size_t t = 0; t < k; ++t) {
            out.line_edits.push_back(LineEdit{EditKind::REPLACE, (int)(op.i1 + t + 1), a[op.i1 + t], b[op.j1 + t]});
        }
        for (size_t t = k; t < d; ++t) {
            out.line_edits.push_back(LineEdit{EditKind::DELETE, (int)(op.i1 + t + 1), a[op.i1 + t], ""});
        }
        for (size_t t = k; t < ins; ++t) {
            out.line_edits.push_back(LineEdit{EditKind::INSERT, (int)(op.i2 + 1), "", b[op.j1 + t]});
        }
    }
    return out;
}

std::optional<std::string> apply_line_edits(const std::string& original,
                                            const std::vector<LineEdit>& edits) {
    const auto a = split_all(normalize_newlines(original));
    const int n = (int)a.size();

    std::map<int, std::vector<const LineEdit*>> inserts;
    std::map<int, const LineEdit*> changes;
    for (const auto& e : edits) {
        if (e.kind == EditKind::INSERT) {
            if (e.line_number < 1 || e.line_number > n + 1) return std::nullopt;
            inserts[e.line_number].push_back(&e);
            continue;
        }
        if (e.line_number < 1 || e.line_number > n) return std::nullopt;
        if (a[(size_t)e.line_number - 1] != e.old_text) return std::nullopt;
        if (!changes.emplace(e.line_number, &e).second) return std::nullopt;
    }

    std::vector<std::string> out;
    out.reserve(a.size() + inserts.size());
    for (int line = 1; line <= n + 1; ++line) {
        auto ins = inserts.find(line);
        if (ins != inserts.end()) {
            for (const LineEdit* e : ins->second) out.push_back(e->new_text);
        }
        if (line > n) break;
        auto ch = changes.find(line);
        if (ch == changes.end()) {
            out.push_back(a[(size_t)line - 1]);
        } else if (ch->second->kind == EditKind::REPLACE) {
            out.push_back(ch->second->new_text);
        }
    }
    return join_lines(out);
}

} // namespace mender
