#pragma once

#include "cordon/capability.h"

#include <string>

namespace cordon::script {

struct Denial {
    std::string name;
    int line{0};
};

// Parse `source` with the runtime's own `ast` module and find the first
// reference, in source order, to something the policy does not permit:
// an unreachable import, a privileged builtin name the program never binds,
// a dunder attribute outside the special-method set (including str.format
// fields such as "{0.__class__}").
//
// Returns false with `err` ("Type: message") when the scan cannot run. On
// success `out->name` is empty when nothing is denied. Source that does not
// parse scans clean; compiling it reports the error.
bool prescan(const std::string& source, const CapabilityPolicy& policy, Denial* out, std::string* err);

} // namespace cordon::script
