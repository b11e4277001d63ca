#pragma once

// Cordon Capability Filter: allow-list of what a sandboxed program may reach.
//
// Every builtin name and importable module is mapped to exactly one
// Capability by a static table. A policy is a set of permitted
// capabilities; anything not in the table, or mapped to a capability the
// policy does not permit, is absent from the program's namespace.

#include <cstdint>
#include <string>
#include <vector>

namespace cordon {

enum class Capability {
    // pure
    ARITHMETIC,
    TEXT,
    COLLECTIONS,
    CONSOLE,
    MATH,
    STRING_CONSTANTS,
    // privileged
    FILESYSTEM,
    PROCESS,
    NETWORK,
    ENVIRONMENT,
    DYNAMIC_CODE,
    INTROSPECTION,
    NATIVE_CODE,
    THREADS,
    INTERPRETER_CONTROL,
};

const char* capability_to_str(Capability c);
bool capability_is_pure(Capability c);

// Table lookups. Return false when the name is not in the table at all.
bool builtin_capability(const std::string& name, Capability* out);
bool module_capability(const std::string& name, Capability* out);

// Every name in the builtin and module tables.
std::vector<std::string> builtin_names();
std::vector<std::string> module_names();

// Names starting with "__" reach interpreter internals.
bool is_dunder(const std::string& name);

class CapabilityPolicy {
public:
    CapabilityPolicy() = default;

    // Exactly the pure capabilities.
    static CapabilityPolicy pure_default();

    void permit(Capability c);
    void revoke(Capability c);
    bool is_permitted(Capability c) const;

    // Builtin name is in the table and its capability is permitted.
    bool permits_builtin(const std::string& name) const;
    // Module (possibly dotted) is importable. Unknown modules are denied.
    bool permits_module(const std::string& name) const;
    // Attribute access by name: anything but a dunder outside the special
    // method set (`__init__`, `__str__`, ...).
    bool permits_attribute(const std::string& name) const;

    // Name reported in a denial for an import of `module`: the top-level
    // package when that is denied, the full dotted name otherwise.
    static std::string denied_module_name(const std::string& module, const CapabilityPolicy& p);

private:
    uint32_t mask_{0};
};

} // namespace cordon
