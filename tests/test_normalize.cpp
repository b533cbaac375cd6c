#include "test_common.h"
#include "mender/normalize.h"

using namespace mender;

int main() {
    // Plain JSON reply
    {
        ParsedReply r = parse_inference_output(
            R"JS({"explanation":"Guard the division.","fixed_code":"x = 0\nprint(1 if x == 0 else 1/x)","reasoning":"x is zero"})JS");
        expect_true(r.kind == ParsedReply::Kind::OK, "plain reply accepted");
        expect_eq_str(r.patch.fixed_code, "x = 0\nprint(1 if x == 0 else 1/x)\n", "code ends with one newline");
        expect_eq_str(r.patch.explanation, "Guard the division.", "explanation kept");
        expect_eq_str(r.patch.reasoning, "x is zero", "reasoning kept");
    }

    // JSON wrapped in prose and a fence, code itself fenced and double-escaped
    {
        std::string raw = "Sure! Here is the fix:\n```json\n"
                          R"JS({"fixed_code": "```python\\nprint(\"hi\")\\n```"})JS"
                          "\n```\nHope this helps.";
        ParsedReply r = parse_inference_output(raw);
        expect_true(r.kind == ParsedReply::Kind::OK, "noisy reply accepted: " + r.detail);
        expect_eq_str(r.patch.fixed_code, "print(\"hi\")\n", "fence and escaping removed");
        expect_true(!r.patch.explanation.empty(), "default explanation filled");
        expect_true(!r.patch.reasoning.empty(), "default reasoning filled");
    }

    // An earlier unrelated object is skipped
    {
        ParsedReply r = parse_inference_output(R"JS(log {"level":"info"} then {"fixed_code":"print(4)"})JS");
        expect_true(r.kind == ParsedReply::Kind::OK, "object with fixed_code found after another object");
        expect_eq_str(r.patch.fixed_code, "print(4)\n", "second object used");
    }

    // Alternate keys for the corrected program
    {
        ParsedReply r = parse_inference_output(R"JS({"code":"x = 1\nprint(x)","explanation":"defined x"})JS");
        expect_true(r.kind == ParsedReply::Kind::OK, "code key accepted: " + r.detail);
        expect_eq_str(r.patch.fixed_code, "x = 1\nprint(x)\n", "code key value");
        expect_eq_str(r.patch.explanation, "defined x", "explanation kept with code key");

        ParsedReply f = parse_inference_output(R"JS({"fix":"print(2)"})JS");
        expect_true(f.kind == ParsedReply::Kind::OK, "fix key accepted");
        expect_eq_str(f.patch.fixed_code, "print(2)\n", "fix key value");

        ParsedReply both = parse_inference_output(R"JS({"code":"print(0)","fixed_code":"print(1)"})JS");
        expect_eq_str(both.patch.fixed_code, "print(1)\n", "fixed_code preferred over code");

        expect_eq_str(parse_inference_output(R"JS({"code":7})JS").detail, "code is not a string", "code key wrong type");
    }

    // Raw line breaks inside a JSON string
    {
        const std::string raw = "Sure:\n{\"fixed_code\": \"def f():\n\treturn 1\nprint(f())\",\n \"explanation\": \"ok\"}";
        ParsedReply r = parse_inference_output(raw);
        expect_true(r.kind == ParsedReply::Kind::OK, "unescaped newlines repaired: " + r.detail);
        expect_eq_str(r.patch.fixed_code, "def f():\n\treturn 1\nprint(f())\n", "line breaks and tab preserved");
        expect_eq_str(r.patch.explanation, "ok", "fields after the repaired string read");

        const std::string quoted = "{\"fixed_code\": \"s = \\\"a\nb\\\"\"}";
        ParsedReply q = parse_inference_output(quoted);
        expect_true(q.kind == ParsedReply::Kind::OK, "escaped quote does not end the string early: " + q.detail);
        expect_eq_str(q.patch.fixed_code, "s = \"a\nb\"\n", "escaped quotes kept around the repaired break");
    }

    // Malformed replies
    {
        expect_true(parse_inference_output("").kind == ParsedReply::Kind::MALFORMED, "empty");
        expect_eq_str(parse_inference_output("   \n").detail, "empty response", "blank detail");
        expect_eq_str(parse_inference_output("I could not fix this.").detail, "no JSON object in response", "prose");
        expect_eq_str(parse_inference_output(R"JS({"explanation":"x"})JS").detail, "response object has no fixed_code",
                      "missing field");
        expect_eq_str(parse_inference_output(R"JS({"fixed_code":42})JS").detail, "fixed_code is not a string", "wrong type");
        expect_eq_str(parse_inference_output(R"JS({"fixed_code":"  \n "})JS").detail, "fixed_code is empty", "blank code");
        expect_eq_str(parse_inference_output(R"JS({"fixed_code":"I am sorry, I cannot help with that."})JS").detail,
                      "fixed_code does not look like code", "noise");
        expect_true(parse_inference_output(R"JS({"fixed_code": "print(1)")JS").kind == ParsedReply::Kind::MALFORMED,
                    "truncated JSON");
    }

    // Line edits: well-formed entries kept, malformed dropped, kind inferred
    {
        ParsedReply r = parse_inference_output(R"JS({
            "fixed_code": "a = None\nprint(a)",
            "line_edits": [
                {"line_number": 1, "new_text": "a = None"},
                {"line_number": 2, "old_text": "junk"},
                {"line_number": 0, "old_text": "x", "new_text": "y"},
                {"line_number": "3", "old_text": "x", "new_text": "y"},
                {"line_number": 4, "old_text": "x", "new_text": "y", "kind": "teleport"},
                "not an object",
                {"line_number": 5, "old_text": "p", "new_text": "q"}
            ]})JS");
        expect_true(r.kind == ParsedReply::Kind::OK, "reply with edits accepted");
        expect_eq_ll((long long)r.patch.line_edits.size(), 3, "three usable edits");
        expect_true(r.patch.line_edits[0].kind == EditKind::INSERT, "no old_text means insert");
        expect_true(r.patch.line_edits[1].kind == EditKind::DELETE, "no new_text means delete");
        expect_true(r.patch.line_edits[2].kind == EditKind::REPLACE, "both means replace");
        expect_eq_ll(r.patch.line_edits[2].line_number, 5, "line number kept");
    }

    // normalize_code on its own
    {
        std::string why;
        auto c = normalize_code("\n\n    x = 1\n\n", &why);
        expect_true(c.has_value(), "indented snippet accepted");
        expect_eq_str(*c, "    x = 1\n", "first-line indent kept, surrounding blank lines dropped");

        auto crlf = normalize_code("import math\\r\\nprint(math.pi)");
        expect_true(crlf.has_value(), "escaped CRLF accepted");
        expect_true(contains(*crlf, "import math\r\nprint(math.pi)"), "escaped CRLF unescaped");

        expect_true(!normalize_code("```\n```", &why).has_value(), "empty fence rejected");
        expect_eq_str(why, "fixed_code is empty", "empty fence reason");
    }

    // Heuristic line classification
    {
        expect_true(looks_like_code("def f():\n    pass"), "def");
        expect_true(looks_like_code("x = 1"), "assignment");
        expect_true(looks_like_code("a, b = 1, 2"), "tuple unpack");
        expect_true(looks_like_code("total += 1"), "augmented");
        expect_true(looks_like_code("n: int = 3"), "annotated");
        expect_true(looks_like_code("obj.method(1)"), "call");
        expect_true(looks_like_code("@decorator"), "decorator");
        expect_true(looks_like_code("print(2 + 2)"), "print call");
        expect_true(!looks_like_code("print the result for me"), "prose starting with print");
        expect_true(!looks_like_code("Here is your fixed program."), "prose");
        expect_true(!looks_like_code("a == b"), "comparison alone");
    }

    expect_eq_str(unescape_sequences("a\\tb\\\\n\\q"), "a\tb\\n\\q", "one level of unescaping");

    std::cerr << "test_normalize: ALL PASSED" << std::endl;
    return 0;
}
