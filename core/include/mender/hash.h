#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace mender::hash {

// ---------- SHA-256 ----------
// Used for the journal hash chain and content fingerprints.
class Sha256 {
public:
    Sha256();
    void update(const void* data, size_t n);
    void update(const std::string& s) { update(s.data(), s.size()); }
    std::array<uint8_t, 32> finish();

private:
    void compress(const uint8_t block[64]);

    uint32_t h_[8];
    uint8_t buf_[64];
    size_t buf_len_{0};
    uint64_t total_{0};
    bool done_{false};
};

std::string to_hex(const uint8_t* data, size_t n);
std::string sha256_hex(const std::string& s);

// Short stable fingerprint (first 12 hex chars of SHA-256), for log lines.
std::string fingerprint(const std::string& s);

} // namespace mender::hash
