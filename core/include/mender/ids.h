#pragma once
#include <string>

namespace mender {

// Unique repair session id: "rs-<utc yyyymmddThhmmss>-<12 hex>".
std::string new_session_id();

// n random bytes as lowercase hex (getrandom, then /dev/urandom).
// Returns empty when no entropy source is available.
std::string random_hex(size_t nbytes);

} // namespace mender
