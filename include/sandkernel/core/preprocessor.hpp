/*
 * sandkernel C++ - Code Preprocessor
 *
 * Rewrites import statements into loader calls on the __sandbox__ hook
 * object and redirects chart show()/savefig() calls to the capture hooks.
 * Disallowed imports become annotated no-ops so the rest of the script
 * still runs.
 *
 * Line count and indentation are preserved, so tracebacks point at the
 * caller's own line numbers. Text inside string literals and comments is
 * never rewritten, and the rewrite is idempotent.
 */
#ifndef sandkernel_CORE_PREPROCESSOR_HPP
#define sandkernel_CORE_PREPROCESSOR_HPP

#include "capability_loader.hpp"
#include <string>
#include <vector>
#include <set>

namespace sandkernel {

enum class AuditAction {
    Rewritten,      // import bound through the loader
    Shadowed,       // from-import that temporarily rebinds its container
    Blocked,        // disallowed import turned into a no-op
    Intercepted     // chart call redirected to a capture hook
};

const char* audit_action_name(AuditAction action);

struct AuditEntry {
    int line;                   // 1-based
    AuditAction action;
    std::string statement;      // original statement text
    std::string capability;     // capability or alias involved

    AuditEntry() : line(0), action(AuditAction::Rewritten) {}
    AuditEntry(int l, AuditAction a, const std::string& stmt, const std::string& cap)
        : line(l), action(a), statement(stmt), capability(cap) {}
};

struct PreprocessResult {
    std::string code;
    std::vector<AuditEntry> audit;

    // One line per blocked import, for the caller
    std::vector<std::string> notices() const;

    bool has_blocked() const;
};

class Preprocessor {
public:
    explicit Preprocessor(const CapabilityLoader& capabilities);

    PreprocessResult preprocess(const std::string& script) const;

    static const char* hook_object() { return "__sandbox__"; }

private:
    const CapabilityLoader& capabilities_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_PREPROCESSOR_HPP
