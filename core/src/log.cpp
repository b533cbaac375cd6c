#include "mender/log.h"
#include "mender/hash.h"
#include "mender/json_mini.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <sstream>
#include <vector>

namespace mender {

namespace {

const std::string kGenesis(64, '0');

std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[40];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03dZ", (int)ms);
    return buf;
}

void write_canonical(json_object* obj, std::string& out) {
    if (!obj) {
        out += "null";
        return;
    }
    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());
        out += "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out += ",";
            json_mini::Doc key(json_mini::new_string(keys[i]));
            out += json_mini::to_string(key.root);
            out += ":";
            write_canonical(json_mini::get_field(obj, keys[i].c_str()), out);
        }
        out += "}";
        break;
    }
    case json_type_array: {
        out += "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out += ",";
            write_canonical(json_object_array_get_idx(obj, i), out);
        }
        out += "]";
        break;
    }
    default:
        out += json_mini::to_string(obj);
        break;
    }
}

} // namespace

std::string canonical_json(json_object* obj) {
    std::string out;
    write_canonical(obj, out);
    return out;
}

SessionJournal::SessionJournal(const std::string& session_id, const std::string& path)
    : session_id_(session_id), path_(path), out_(path, std::ios::out | std::ios::trunc), chain_prev_(kGenesis) {
    if (!out_) {
        ok_ = false;
        error_ = "cannot open journal " + path_;
    }
}

bool SessionJournal::event(const std::string& name, json_object* payload) {
    json_mini::Doc rec(json_object_new_object());
    json_object_object_add(rec.root, "event", json_mini::new_string(name));
    json_object_object_add(rec.root, "payload", payload);
    json_object_object_add(rec.root, "seq", json_object_new_int(seq_));
    json_object_object_add(rec.root, "session_id", json_mini::new_string(session_id_));
    json_object_object_add(rec.root, "ts", json_mini::new_string(iso_now()));
    if (!ok_) return false;

    const std::string chain_hash = hash::sha256_hex(chain_prev_ + canonical_json(rec.root));
    json_object_object_add(rec.root, "chain_prev", json_mini::new_string(chain_prev_));
    json_object_object_add(rec.root, "chain_hash", json_mini::new_string(chain_hash));

    out_ << canonical_json(rec.root) << "\n";
    out_.flush();
    if (!out_) {
        ok_ = false;
        error_ = "write failed: " + path_;
        return false;
    }
    chain_prev_ = chain_hash;
    ++seq_;
    return true;
}

bool verify_journal(const std::string& path, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    std::string prev = kGenesis;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (line.empty()) continue;
        auto fail = [&](const std::string& why) {
            if (err) *err = "line " + std::to_string(lineno) + ": " + why;
            return false;
        };
        json_mini::Doc d = json_mini::parse(line);
        if (!d || !json_object_is_type(d.root, json_type_object)) return fail("not a JSON object");
        auto chain_prev = json_mini::get_string(d.root, "chain_prev");
        auto chain_hash = json_mini::get_string(d.root, "chain_hash");
        if (!chain_prev || !chain_hash) return fail("missing chain fields");
        if (*chain_prev != prev) return fail("chain_prev does not match previous record");
        json_object_object_del(d.root, "chain_prev");
        json_object_object_del(d.root, "chain_hash");
        if (hash::sha256_hex(prev + canonical_json(d.root)) != *chain_hash) return fail("chain_hash mismatch");
        prev = *chain_hash;
    }
    return true;
}

} // namespace mender
