#pragma once

#include <stdexcept>
#include <string>

namespace jsonnice {

// =============================================================================
// Error taxonomy
// =============================================================================

// Reported by the evaluation engine: bad breakpoint location, unknown
// variable, unreadable source. Never fatal to a session.
class engine_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Malformed or unknown inbound message. The byte stream may be out of sync,
// so the session must end.
class protocol_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Connection reset or failed write. Ends the session like end-of-stream.
class transport_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class config_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace jsonnice
