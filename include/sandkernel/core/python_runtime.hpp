/*
 * sandkernel C++ - Python Runtime
 *
 * The interpreter embedded in a kernel process, through pybind11: its
 * lifecycle, the _sandbox module behind the __sandbox__ hooks object,
 * module proxies and facades, and the compile step that refuses
 * introspection names.
 *
 * Scripts only ever hold proxies of the modules they import: fresh
 * module objects carrying the public attributes of the real one, minus
 * modules outside the catalog and the real builtins. Everything the host
 * hands a script (hooks, facades, guarded builtins) is a C function, so
 * no Python globals are reachable from it.
 *
 * One kernel process serves one session. Its main thread holds the GIL
 * except while it waits for the next request.
 */
#ifndef sandkernel_CORE_PYTHON_RUNTIME_HPP
#define sandkernel_CORE_PYTHON_RUNTIME_HPP

#include <pybind11/embed.h>

#include "artifact_sweep.hpp"
#include "capability_loader.hpp"
#include "memory_ceiling.hpp"
#include "path_guard.hpp"
#include "types.hpp"
#include <string>
#include <vector>
#include <set>
#include <map>
#include <atomic>
#include <cstdint>

namespace sandkernel {

namespace py = pybind11;

// Loaded module (or facade) proxy and the object "import a.b" binds to "a"
class PyCapability : public Capability {
public:
    PyCapability(py::object module, py::object root);
    ~PyCapability();

    const py::object& module() const { return module_; }
    const py::object& root() const { return root_; }

private:
    PyCapability(const PyCapability&);
    PyCapability& operator=(const PyCapability&);

    py::object module_;
    py::object root_;
};

// Container binding replaced by "from X import X"; restored after the run
struct ShadowRecord {
    std::string target;
    py::object container;
    py::object member;
};

// State of the run executing on the kernel's main thread
struct RunContext {
    std::string session_id;
    std::string session_dir;
    const PathGuard* guard;
    CapabilityLoader* capabilities;
    py::dict ns;

    size_t max_output;
    std::string out;
    std::string err;
    bool truncated;

    std::vector<ChartImage> charts;
    std::set<int> captured_figures;
    bool charts_claimed;

    std::vector<ShadowRecord> shadows;

    bool path_rejected;
    std::string path_message;

    unsigned long thread_id;
    int64_t deadline_ms;            // monotonic_ms(); 0 while compiling
    MemoryCeiling* memory;
    std::atomic<int> host_call_depth;
    bool done;                      // written with the GIL held

    RunContext()
        : guard(nullptr), capabilities(nullptr), max_output(0), truncated(false), charts_claimed(false),
          path_rejected(false), thread_id(0), deadline_ms(0), memory(nullptr), host_call_depth(0),
          done(false) {}
};

RunContext* current_run();
void set_current_run(RunContext* ctx);

// Host work inside a run: exempt from the memory ceiling and from the
// watchdog. GIL held.
class HostCallScope {
public:
    explicit HostCallScope(RunContext* ctx);
    ~HostCallScope();

private:
    HostCallScope(const HostCallScope&);
    HostCallScope& operator=(const HostCallScope&);

    RunContext* ctx_;
};

// Figures left open after a run. GIL held.
class PyChartSurface : public ChartSurface {
public:
    explicit PyChartSurface(const RunContext& ctx) : ctx_(ctx) {}

    void flush_pending_renders(std::vector<ChartImage>& out) override;
    void close_all() override;

private:
    const RunContext& ctx_;
};

// Pending Python exception of the given type, ready to throw
py::error_already_set python_error(PyObject* type, const std::string& message);

// Session-confined absolute path for a str/bytes/PathLike argument.
// Raises PermissionError when the guard refuses it, TypeError for
// anything else.
std::string confine_path(py::handle path, bool write);

// As confine_path() for path-like values; file objects pass through
py::object confine_argument(py::handle value, bool write);

// Host-built stand-ins for modules scripts get no raw access to
py::module_ build_facade(const std::string& name);

// open() resolving its path through the guard
py::cpp_function guarded_open();

// Replacements for the attribute builtins; introspection names are refused
py::dict guarded_attribute_builtins();

// Library function wrapped so its path argument goes through the guard
py::cpp_function guard_call(py::object target, const GuardedCall& call, py::handle holder);

// Stand-in for a removed library attribute
py::cpp_function removed_stub(const std::string& qualified_name);

// Attribute and name spellings scripts may not use
const std::set<std::string>& blocked_names();

class PythonRuntime {
public:
    static PythonRuntime& instance();

    // Starts the interpreter; the calling thread keeps the GIL
    bool initialize();
    void finalize();

    // Factory for every entry of the given loader: imports modules,
    // installs guarded calls, builds facades and proxies
    CapabilityFactory capability_factory(CapabilityLoader& capabilities);

    // Fresh namespace with restricted builtins and the eager bindings
    py::dict new_namespace(const std::string& session_id, const std::string& session_dir);

    // Parses the script and refuses blocked names before compiling it.
    // Raises SyntaxError or PermissionError.
    py::object compile_script(const std::string& code) const;

    // RESULT as JSON text (empty when unset) and the user variables
    void collect(const py::dict& ns, std::string& result_json,
                 std::vector<std::pair<std::string, std::string>>& variables) const;

    std::string format_exception(const py::error_already_set& e) const;

    // Proxy of a real module reached from a script; memoized by name
    py::object proxy_for(const py::module_& real, const CapabilitySpec& owner);

    const py::object& timeout_exception() const { return timeout_exc_; }

private:
    PythonRuntime();
    ~PythonRuntime();
    PythonRuntime(const PythonRuntime&);
    PythonRuntime& operator=(const PythonRuntime&);

    LoadOutcome load_capability(const CapabilitySpec& spec);
    bool admit(const std::string& module_name, const CapabilitySpec& owner, const std::string& key,
               py::handle value, py::object& out);
    void install_substitutes();

    bool initialized_;
    CapabilityLoader* capabilities_;
    py::object timeout_exc_;
    py::object hooks_;
    py::object builtins_template_;  // dict
    py::object proxies_;            // dict: module name -> proxy

    // Real objects scripts must not see, by identity: a null replacement
    // drops the attribute. Originals are kept alive alongside.
    std::map<PyObject*, py::object> substitutes_;
    std::vector<py::object> originals_;
};

} // namespace sandkernel

#endif // sandkernel_CORE_PYTHON_RUNTIME_HPP
