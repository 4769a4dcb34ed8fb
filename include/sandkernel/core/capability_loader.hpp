/*
 * sandkernel C++ - Capability Loader
 *
 * The allowlist of importable capabilities. Each entry is materialized at
 * most once per process by its factory and cached; eager entries are
 * loaded at engine start and bound into every new namespace, lazy ones on
 * first reference.
 *
 * The entry table is frozen by seal(). After that lookups take no global
 * lock; concurrent first use of one key serializes on that key's mutex
 * only.
 */
#ifndef sandkernel_CORE_CAPABILITY_LOADER_HPP
#define sandkernel_CORE_CAPABILITY_LOADER_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <functional>

namespace sandkernel {

enum class CapabilityTier {
    Eager,
    Lazy
};

enum class CapabilityKind {
    Module,     // a real module, imported by the host
    Chart,      // a module that draws on the process-wide chart state
    Facade      // a guarded stand-in built by the host (io, os)
};

// A library function whose path-like argument goes through the Path Guard
struct GuardedCall {
    std::string attribute;      // dotted, relative to the module ("DataFrame.to_csv")
    int index;                  // positional index, counting self for methods
    std::string keyword;        // keyword spelling of the same argument
    bool write;

    GuardedCall() : index(0), write(false) {}
    GuardedCall(const std::string& attr, int idx, const std::string& kw, bool w)
        : attribute(attr), index(idx), keyword(kw), write(w) {}
};

struct CapabilitySpec {
    std::string name;           // dotted import name
    std::string binding;        // name bound by "import <name>"
    CapabilityTier tier;
    CapabilityKind kind;
    bool submodules;            // "name.x" may be imported through this entry
    std::vector<GuardedCall> guarded_calls;
    std::vector<std::string> removed;   // attributes replaced by a PermissionError stub

    CapabilitySpec() : tier(CapabilityTier::Lazy), kind(CapabilityKind::Module), submodules(false) {}
};

// Opaque payload produced by a factory (a Python module reference in
// production, plain values in tests)
class Capability {
public:
    virtual ~Capability() {}
};

struct LoadOutcome {
    std::shared_ptr<Capability> value;
    std::string error;

    static LoadOutcome ok(std::shared_ptr<Capability> v) {
        LoadOutcome o;
        o.value = v;
        return o;
    }

    static LoadOutcome fail(const std::string& err) {
        LoadOutcome o;
        o.error = err;
        return o;
    }
};

typedef std::function<LoadOutcome(const CapabilitySpec&)> CapabilityFactory;

enum class ResolveStatus {
    Ok,
    Blocked,    // not on the allowlist
    Failed      // on the allowlist, but its factory failed (cached)
};

struct ResolveResult {
    ResolveStatus status;
    const CapabilitySpec* spec;
    std::shared_ptr<Capability> value;
    std::string error;

    ResolveResult() : status(ResolveStatus::Blocked), spec(nullptr) {}

    bool ok() const { return status == ResolveStatus::Ok; }
};

class CapabilityLoader {
public:
    CapabilityLoader();
    ~CapabilityLoader();

    // Fails for denylisted names, duplicates, and after seal()
    bool register_capability(const CapabilitySpec& spec, CapabilityFactory factory);

    // Registers the built-in catalog; the factory is shared by all entries
    void register_defaults(CapabilityFactory factory);

    // Adds config-supplied lazy modules, refusing denylisted names
    int register_extra(const std::vector<std::string>& names, CapabilityFactory factory);

    void seal();
    bool sealed() const { return sealed_; }

    ResolveResult resolve(const std::string& name);

    // Loads every eager entry; returns the number that failed
    int preload_eager();

    // Entry that governs "name": an exact match, or the nearest ancestor
    // that admits submodules. nullptr means blocked.
    const CapabilitySpec* owner_of(const std::string& name) const;

    bool is_allowed(const std::string& name) const { return owner_of(name) != nullptr; }

    std::vector<const CapabilitySpec*> entries(CapabilityTier tier) const;

    // Number of factory invocations for a key
    int load_count(const std::string& name) const;

    static bool is_denied(const std::string& name);

    static std::vector<CapabilitySpec> default_catalog();

private:
    enum class State {
        Unloaded,
        Loaded,
        Failed
    };

    struct Entry {
        CapabilitySpec spec;
        CapabilityFactory factory;
        std::mutex mutex;
        State state;
        std::shared_ptr<Capability> value;
        std::string error;
        int loads;

        Entry() : state(State::Unloaded), loads(0) {}
    };

    CapabilityLoader(const CapabilityLoader&);
    CapabilityLoader& operator=(const CapabilityLoader&);

    std::map<std::string, std::unique_ptr<Entry>> entries_;
    bool sealed_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_CAPABILITY_LOADER_HPP
