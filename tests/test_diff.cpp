#include "test_common.h"
#include "mender/diff.h"

using namespace mender;

static void check_roundtrip(const std::string& a, const std::string& b, const std::string& what) {
    DiffResult d = diff(a, b);
    auto applied = apply_line_edits(a, d.line_edits);
    expect_true(applied.has_value(), what + ": edits should apply");
    expect_eq_str(*applied, normalize_newlines(b), what + ": apply(diff) should reproduce fixed");
}

int main() {
    // Identical inputs: nothing to report
    {
        DiffResult d = diff("print(1)\n", "print(1)\n");
        expect_true(d.unified_diff.empty(), "equal inputs give empty diff");
        expect_eq_ll((long long)d.line_edits.size(), 0, "equal inputs give no edits");
        DiffResult e = diff("a\r\nb\r\n", "a\nb\n");
        expect_true(e.unified_diff.empty(), "line endings alone are not a change");
    }

    // Single replaced line
    {
        DiffResult d = diff("x = 1\ny = x / 0\nprint(y)\n", "x = 1\ny = x / 1\nprint(y)\n");
        expect_eq_str(d.unified_diff,
                      "--- original.py\n"
                      "+++ fixed.py\n"
                      "@@ -1,3 +1,3 @@\n"
                      " x = 1\n"
                      "-y = x / 0\n"
                      "+y = x / 1\n"
                      " print(y)\n",
                      "unified diff of one replacement");
        expect_eq_ll((long long)d.line_edits.size(), 1, "one edit");
        const LineEdit& e = d.line_edits[0];
        expect_true(e.kind == EditKind::REPLACE, "kind replace");
        expect_eq_ll(e.line_number, 2, "line number is 1-based in the original");
        expect_eq_str(e.old_text, "y = x / 0", "old text");
        expect_eq_str(e.new_text, "y = x / 1", "new text");
    }

    // Pure insertion at the top and append at the end
    {
        DiffResult d = diff("print(a)\n", "a = None\nprint(a)\n");
        expect_eq_ll((long long)d.line_edits.size(), 1, "one insert");
        expect_true(d.line_edits[0].kind == EditKind::INSERT, "insert kind");
        expect_eq_ll(d.line_edits[0].line_number, 1, "insert precedes line 1");
        expect_true(d.line_edits[0].old_text.empty(), "insert has empty old_text");

        DiffResult d2 = diff("a\nb", "a\nb\nc");
        check_roundtrip("a\nb", "a\nb\nc", "append");
        expect_true(contains(d2.unified_diff, "\\ No newline at end of file"), "missing newline marker");
    }

    // Deletion
    {
        DiffResult d = diff("import numpy\nprint(1)\n", "print(1)\n");
        expect_eq_ll((long long)d.line_edits.size(), 1, "one delete");
        expect_true(d.line_edits[0].kind == EditKind::DELETE, "delete kind");
        expect_eq_ll(d.line_edits[0].line_number, 1, "delete line");
        expect_true(d.line_edits[0].new_text.empty(), "delete has empty new_text");
        expect_true(contains(d.unified_diff, "@@ -1,2 +1 @@"), "single-line range has no count");
    }

    // Replacing with an empty line is still a REPLACE, not a DELETE
    {
        DiffResult d = diff("a\nb\nc\n", "a\n\nc\n");
        expect_eq_ll((long long)d.line_edits.size(), 1, "one edit");
        expect_true(d.line_edits[0].kind == EditKind::REPLACE, "empty replacement stays replace");
        check_roundtrip("a\nb\nc\n", "a\n\nc\n", "empty replacement");
    }

    // Hunks far apart are reported separately with 3 lines of context
    {
        std::string a, b;
        for (int i = 1; i <= 20; ++i) {
            a += "line" + std::to_string(i) + "\n";
            b += (i == 2 || i == 18 ? "LINE" : "line") + std::to_string(i) + "\n";
        }
        DiffResult d = diff(a, b);
        size_t hunks = 0;
        for (size_t p = d.unified_diff.find("@@ -"); p != std::string::npos; p = d.unified_diff.find("@@ -", p + 1)) ++hunks;
        expect_eq_ll((long long)hunks, 2, "two hunks");
        expect_true(contains(d.unified_diff, "@@ -1,5 +1,5 @@"), "first hunk clipped at file start");
        expect_true(contains(d.unified_diff, "@@ -15,6 +15,6 @@"), "second hunk runs to end");
        check_roundtrip(a, b, "two hunks");
    }

    // Mixed edits, CRLF input, and whole-file rewrites
    {
        check_roundtrip("def f():\nreturn 1\nprint(f())\n", "def f():\n    return 1\n\nprint(f())\n", "reindent");
        check_roundtrip("a\r\nb\r\nc\r\n", "a\nx\ny\nc\n", "crlf");
        check_roundtrip("", "print(1)\n", "from empty");
        check_roundtrip("print(1)\n", "", "to empty");
        check_roundtrip("a\nb\nc\nd\n", "d\nc\nb\na\n", "reversed");
    }

    // Edits that do not match the original are rejected
    {
        std::vector<LineEdit> bad{LineEdit{EditKind::REPLACE, 2, "nope", "x"}};
        expect_true(!apply_line_edits("a\nb\n", bad).has_value(), "old_text mismatch rejected");
        std::vector<LineEdit> oob{LineEdit{EditKind::DELETE, 9, "a", ""}};
        expect_true(!apply_line_edits("a\nb\n", oob).has_value(), "out of range rejected");
        std::vector<LineEdit> dup{LineEdit{EditKind::DELETE, 1, "a", ""}, LineEdit{EditKind::REPLACE, 1, "a", "b"}};
        expect_true(!apply_line_edits("a\nb\n", dup).has_value(), "two changes to one line rejected");
    }

    // Opcodes: common prefix and suffix are equal blocks
    {
        std::vector<std::string> a{"p", "x", "s"};
        std::vector<std::string> b{"p", "y", "z", "s"};
        auto ops = diff_opcodes(a, b);
        expect_eq_ll((long long)ops.size(), 3, "prefix, change, suffix");
        expect_true(ops[0].tag == DiffOp::Tag::EQUAL && ops[2].tag == DiffOp::Tag::EQUAL, "equal ends");
        expect_true(ops[1].tag == DiffOp::Tag::REPLACE, "replace middle");
        expect_eq_ll((long long)ops[1].j2 - (long long)ops[1].j1, 2, "two new lines");
    }

    std::cerr << "test_diff: ALL PASSED" << std::endl;
    return 0;
}
