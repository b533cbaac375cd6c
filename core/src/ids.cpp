#include "mender/ids.h"
#include "mender/hash.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <vector>

#ifdef __linux__
  #include <sys/random.h>
#endif
#ifndef _WIN32
  #include <unistd.h>
#endif

namespace mender {

std::string random_hex(size_t nbytes) {
    std::vector<uint8_t> buf(nbytes);
    if (nbytes == 0) return "";
#ifdef __linux__
    if (::getrandom(buf.data(), buf.size(), 0) == (ssize_t)buf.size()) {
        return hash::to_hex(buf.data(), buf.size());
    }
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (f) {
        size_t got = std::fread(buf.data(), 1, buf.size(), f);
        std::fclose(f);
        if (got == buf.size()) return hash::to_hex(buf.data(), buf.size());
    }
    return "";
}

std::string new_session_id() {
    static std::atomic<unsigned long> counter{0};

    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%S", &tm);

    std::string suffix = random_hex(6);
    if (suffix.empty()) {
        // no entropy source: unique within this process is still guaranteed
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
        std::string seed = std::to_string(ns) + ":" + std::to_string(counter.fetch_add(1));
#ifndef _WIN32
        seed += ":" + std::to_string((long)::getpid());
#endif
        suffix = hash::sha256_hex(seed).substr(0, 12);
    }
    return std::string("rs-") + stamp + "-" + suffix;
}

} // namespace mender
