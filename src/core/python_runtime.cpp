#include <sandkernel/core/python_runtime.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

#include <cstdlib>

namespace sandkernel {

// ============================================================================
// Run state
// ============================================================================

namespace {

thread_local RunContext* tl_run = nullptr;

const char* const kTruncationMarker = "\n... [output truncated]\n";

std::string top_level(const std::string& name) {
    size_t dot = name.find('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

RunContext& require_run() {
    RunContext* ctx = tl_run;
    if (!ctx || !ctx->capabilities) {
        throw python_error(PyExc_RuntimeError, "[sandbox] no script is running");
    }
    return *ctx;
}

void append_capped(RunContext& ctx, std::string& buf, const std::string& chunk) {
    if (buf.size() >= ctx.max_output) return;
    size_t room = ctx.max_output - buf.size();
    if (chunk.size() <= room) {
        buf += chunk;
        return;
    }
    buf += truncate_safe(chunk, room);
    buf += kTruncationMarker;
    ctx.truncated = true;
}

// "Type: message" for a caught exception
std::string error_text(const py::error_already_set& e) {
    std::string out = "Exception";
    try {
        out = py::str(e.type().attr("__name__"));
        std::string detail = py::str(e.value());
        if (!detail.empty()) out += ": " + detail;
    } catch (const py::error_already_set&) {
        PyErr_Clear();
    }
    return out;
}

// The import machinery itself, not __import__: the calling frame may be a
// script whose builtins have none
py::module_ import_real(const std::string& name) {
    py::str key(name);
    py::object top = py::reinterpret_steal<py::object>(
        PyImport_ImportModuleLevelObject(key.ptr(), nullptr, nullptr, nullptr, 0));
    if (!top) throw py::error_already_set();
    PyObject* module = PyImport_GetModule(key.ptr());
    if (!module) {
        if (PyErr_Occurred()) throw py::error_already_set();
        throw python_error(PyExc_ImportError, "'" + name + "' is missing from sys.modules after import");
    }
    return py::reinterpret_steal<py::module_>(module);
}

// Holder object and leaf name of a dotted attribute path
bool lookup(const py::module_& module, const std::string& attribute, py::object& holder, std::string& leaf) {
    std::vector<std::string> parts = split(attribute, '.');
    holder = module;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        py::object child = py::getattr(holder, parts[i].c_str(), py::none());
        if (child.is_none() && py::isinstance<py::module_>(holder)) {
            std::string sub = py::str(holder.attr("__name__")).cast<std::string>() + "." + parts[i];
            try {
                child = import_real(sub);
            } catch (const py::error_already_set& e) {
                if (!e.matches(PyExc_ImportError)) throw;
            }
        }
        if (child.is_none()) return false;
        holder = child;
    }
    leaf = parts.back();
    return true;
}

py::object pyplot() {
    py::dict modules = py::module_::import("sys").attr("modules");
    if (!modules.contains("matplotlib.pyplot")) return py::none();
    return modules["matplotlib.pyplot"];
}

std::string render_png(py::handle figure) {
    py::object buf = py::module_::import("io").attr("BytesIO")();
    figure.attr("savefig")(buf, py::arg("format") = "png", py::arg("bbox_inches") = "tight");
    return buf.attr("getvalue")().cast<std::string>();
}

void add_chart(RunContext& ctx, const std::string& png, int figure, const char* source) {
    ChartImage image;
    image.png = png;
    image.index = static_cast<int>(ctx.charts.size());
    image.figure = figure;
    image.source = source;
    ctx.charts.push_back(image);
    ctx.captured_figures.insert(figure);
}

} // anonymous namespace

RunContext* current_run() {
    return tl_run;
}

void set_current_run(RunContext* ctx) {
    tl_run = ctx;
}

py::error_already_set python_error(PyObject* type, const std::string& message) {
    PyErr_SetString(type, message.c_str());
    return py::error_already_set();
}

HostCallScope::HostCallScope(RunContext* ctx)
    : ctx_(ctx)
{
    if (!ctx_) return;
    ++ctx_->host_call_depth;
    // A timeout queued just before we got here would fire inside the
    // import; the watchdog raises it again once we are back
    PyThreadState_SetAsyncExc(ctx_->thread_id, nullptr);
    if (ctx_->memory) ctx_->memory->suspend();
}

HostCallScope::~HostCallScope() {
    if (!ctx_) return;
    if (ctx_->memory) ctx_->memory->resume();
    --ctx_->host_call_depth;
}

// ============================================================================
// _sandbox module
// ============================================================================

// Module behind an allowed import name, as the script sees it
py::object load_named(const std::string& name) {
    RunContext& ctx = require_run();
    CapabilityLoader& caps = *ctx.capabilities;

    const CapabilitySpec* owner = caps.owner_of(name);
    if (!owner) {
        throw python_error(PyExc_ImportError, "[sandbox] import of '" + name + "' is not allowed");
    }
    ResolveResult resolved = caps.resolve(name);
    if (!resolved.ok()) {
        throw python_error(PyExc_ImportError, "[sandbox] '" + name + "' could not be loaded: " + resolved.error);
    }
    if (owner->kind == CapabilityKind::Chart) {
        ctx.charts_claimed = true;
    }

    PyCapability* cap = dynamic_cast<PyCapability*>(resolved.value.get());
    if (!cap) {
        throw python_error(PyExc_ImportError, "[sandbox] '" + name + "' has no module");
    }
    if (name == owner->name) {
        return cap->module();
    }

    // Submodule of an entry that admits them
    py::module_ real;
    {
        HostCallScope scope(&ctx);
        real = import_real(name);
    }
    return PythonRuntime::instance().proxy_for(real, *owner);
}

// Object bound to the top-level name by "import a.b"
py::object load_root(const std::string& name) {
    py::object module = load_named(name);
    std::string top = top_level(name);
    if (top == name) return module;

    RunContext& ctx = require_run();
    const CapabilitySpec* top_owner = ctx.capabilities->owner_of(top);
    if (top_owner && top_owner->name == top) {
        return load_named(top);
    }
    ResolveResult resolved = ctx.capabilities->resolve(name);
    PyCapability* cap = dynamic_cast<PyCapability*>(resolved.value.get());
    if (!cap || !cap->root()) {
        throw python_error(PyExc_ImportError, "[sandbox] no root module for '" + name + "'");
    }
    return cap->root();
}

// sys.stdout / sys.stderr of the interpreter
struct ScriptOutput {
    int channel;
    std::string name;

    ScriptOutput(int c, const std::string& n) : channel(c), name(n) {}

    size_t write(py::object text) {
        if (!py::isinstance<py::str>(text)) {
            throw python_error(PyExc_TypeError, "write() argument must be str, not " +
                               py::str(py::type::of(text).attr("__name__")).cast<std::string>());
        }
        size_t length = py::len(text);
        RunContext* ctx = tl_run;
        if (!ctx) {
            LOG_DEBUG("[Python] Output outside a run dropped");
            return length;
        }
        std::string chunk = text.attr("encode")("utf-8", "replace").cast<std::string>();
        append_capped(*ctx, channel == 2 ? ctx->err : ctx->out, chunk);
        return length;
    }
};

// Type of the __sandbox__ object the preprocessor rewrites imports into
struct ScriptHooks {
    py::object load(const std::string& name) const {
        return load_named(name);
    }

    py::object root(const std::string& name) const {
        return load_root(name);
    }

    py::object member(const std::string& name, const std::string& attr) const {
        if (blocked_names().count(attr)) {
            throw python_error(PyExc_PermissionError, "[sandbox] access to '" + attr + "' is not allowed");
        }
        py::object module = load_named(name);
        if (py::hasattr(module, attr.c_str())) {
            return module.attr(attr.c_str());
        }
        try {
            return load_named(name + "." + attr);
        } catch (const py::error_already_set& e) {
            if (!e.matches(PyExc_ImportError)) throw;
        }
        throw python_error(PyExc_ImportError, "cannot import name '" + attr + "' from '" + name + "'");
    }

    py::object shadow_member(const std::string& name, const std::string& attr, const std::string& target) const {
        py::object value = member(name, attr);
        ShadowRecord record;
        record.target = target;
        record.container = load_root(name);
        record.member = value;
        require_run().shadows.push_back(record);
        return value;
    }

    void import_all(const std::string& name) const {
        py::object module = load_named(name);
        py::object names = py::getattr(module, "__all__", py::none());
        if (names.is_none()) {
            py::list publics;
            for (py::handle n : py::module_::import("builtins").attr("dir")(module)) {
                std::string s = py::str(n);
                if (!s.empty() && s[0] != '_') publics.append(n);
            }
            names = publics;
        }
        py::dict ns = require_run().ns;
        for (py::handle n : names) {
            std::string key = py::str(n);
            if (key.empty() || key[0] == '_') continue;
            if (py::hasattr(module, key.c_str())) {
                ns[py::str(key)] = module.attr(key.c_str());
            }
        }
    }

    py::object render_charts(py::args, py::kwargs) const {
        RunContext& ctx = require_run();
        py::object plt = pyplot();
        if (plt.is_none()) return py::none();
        ctx.charts_claimed = true;
        for (py::handle num : plt.attr("get_fignums")()) {
            add_chart(ctx, render_png(plt.attr("figure")(num)), num.cast<int>(), "show");
        }
        plt.attr("close")("all");
        return py::none();
    }

    py::object save_figure(py::args args, py::kwargs kwargs) const {
        RunContext& ctx = require_run();
        load_named("matplotlib.pyplot");
        py::object plt = pyplot();
        py::object figure = plt.attr("gcf")();
        py::object result = plt.attr("savefig")(*args, **kwargs);
        add_chart(ctx, render_png(figure), figure.attr("number").cast<int>(), "savefig");
        return result;
    }
};

} // namespace sandkernel

namespace py = pybind11;

PYBIND11_EMBEDDED_MODULE(_sandbox, m) {
    using sandkernel::ScriptHooks;
    using sandkernel::ScriptOutput;

    m.doc() = "Host side of the script sandbox.";

    py::class_<ScriptOutput>(m, "ScriptOutput")
        .def(py::init<int, const std::string&>())
        .def("write", &ScriptOutput::write)
        .def("writelines", [](ScriptOutput& self, py::iterable lines) {
            for (py::handle line : lines) self.write(py::reinterpret_borrow<py::object>(line));
        })
        .def("flush", [](ScriptOutput&) {})
        .def("isatty", [](ScriptOutput&) { return false; })
        .def("readable", [](ScriptOutput&) { return false; })
        .def("writable", [](ScriptOutput&) { return true; })
        .def("seekable", [](ScriptOutput&) { return false; })
        .def("fileno", [](ScriptOutput&) -> int {
            throw sandkernel::python_error(py::module_::import("io").attr("UnsupportedOperation").ptr(), "fileno");
        })
        .def_readonly("name", &ScriptOutput::name)
        .def_property_readonly("encoding", [](ScriptOutput&) { return "utf-8"; })
        .def_property_readonly("errors", [](ScriptOutput&) { return "replace"; })
        .def_property_readonly("closed", [](ScriptOutput&) { return false; });

    py::class_<ScriptHooks>(m, "ScriptHooks")
        .def(py::init<>())
        .def("load", &ScriptHooks::load)
        .def("load_root", &ScriptHooks::root)
        .def("member", &ScriptHooks::member)
        .def("shadow_member", &ScriptHooks::shadow_member)
        .def("import_all", &ScriptHooks::import_all)
        .def("render_charts", &ScriptHooks::render_charts)
        .def("save_figure", &ScriptHooks::save_figure);

    m.attr("SandboxTimeout") = py::reinterpret_steal<py::object>(
        PyErr_NewException("_sandbox.SandboxTimeout", PyExc_BaseException, nullptr));
}

namespace sandkernel {

// ============================================================================
// PyCapability / PyChartSurface
// ============================================================================

PyCapability::PyCapability(py::object module, py::object root)
    : module_(module)
    , root_(root)
{}

PyCapability::~PyCapability() {
    // Outliving the interpreter: nothing left to release
    if (!Py_IsInitialized()) {
        module_.release();
        root_.release();
    }
}

void PyChartSurface::flush_pending_renders(std::vector<ChartImage>& out) {
    py::object plt = pyplot();
    if (plt.is_none()) return;

    for (py::handle num : plt.attr("get_fignums")()) {
        int figure = num.cast<int>();
        if (ctx_.captured_figures.count(figure)) continue;
        try {
            ChartImage image;
            image.png = render_png(plt.attr("figure")(num));
            image.figure = figure;
            image.source = "sweep";
            out.push_back(image);
        } catch (const py::error_already_set& e) {
            LOG_WARN("[Charts] Figure %d could not be rendered: %s", figure, error_text(e).c_str());
        }
    }
}

void PyChartSurface::close_all() {
    py::object plt = pyplot();
    if (plt.is_none()) return;
    try {
        plt.attr("close")("all");
    } catch (const py::error_already_set& e) {
        LOG_WARN("[Charts] Closing figures failed: %s", error_text(e).c_str());
    }
}

// ============================================================================
// PythonRuntime Implementation
// ============================================================================

PythonRuntime& PythonRuntime::instance() {
    static PythonRuntime runtime;
    return runtime;
}

PythonRuntime::PythonRuntime()
    : initialized_(false)
    , capabilities_(nullptr)
{}

PythonRuntime::~PythonRuntime() {
    // Never finalized: the references die with the process
    if (initialized_) {
        timeout_exc_.release();
        hooks_.release();
        builtins_template_.release();
        proxies_.release();
        for (auto& kv : substitutes_) kv.second.release();
        for (auto& o : originals_) o.release();
    }
}

bool PythonRuntime::initialize() {
    if (initialized_) return true;
    if (Py_IsInitialized()) {
        LOG_ERROR("[Python] Interpreter was initialized outside the runtime");
        return false;
    }

    // Charts render off-screen; must be set before matplotlib is imported
    setenv("MPLBACKEND", "Agg", 1);

    PyPreConfig preconfig;
    PyPreConfig_InitPythonConfig(&preconfig);
    preconfig.utf8_mode = 1;
    PyStatus status = Py_PreInitialize(&preconfig);
    if (PyStatus_Exception(status)) {
        LOG_ERROR("[Python] Pre-initialization failed: %s", status.err_msg ? status.err_msg : "unknown error");
        return false;
    }

    try {
        py::initialize_interpreter(false);
    } catch (const std::exception& e) {
        LOG_ERROR("[Python] Initialization failed: %s", e.what());
        return false;
    }

    try {
        py::module_ sandbox = py::module_::import("_sandbox");
        timeout_exc_ = sandbox.attr("SandboxTimeout");
        hooks_ = sandbox.attr("ScriptHooks")();

        py::module_ sys = py::module_::import("sys");
        sys.attr("stdout") = sandbox.attr("ScriptOutput")(1, "<stdout>");
        sys.attr("stderr") = sandbox.attr("ScriptOutput")(2, "<stderr>");
        sys.attr("stdin") = py::module_::import("io").attr("StringIO")("");

        proxies_ = py::dict();
        install_substitutes();

        static const char* const removed[] = {
            "eval", "exec", "compile", "__import__", "globals", "locals", "vars",
            "exit", "quit", "breakpoint", "input", "help", "memoryview"
        };
        py::dict restricted = py::module_::import("builtins").attr("__dict__").attr("copy")();
        for (const char* name : removed) {
            restricted.attr("pop")(name, py::none());
        }
        restricted["open"] = guarded_open();
        for (auto item : guarded_attribute_builtins()) {
            restricted[item.first] = item.second;
        }
        builtins_template_ = restricted;
    } catch (const py::error_already_set& e) {
        LOG_ERROR("[Python] Sandbox setup failed: %s", error_text(e).c_str());
        timeout_exc_ = py::object();
        hooks_ = py::object();
        proxies_ = py::object();
        substitutes_.clear();
        originals_.clear();
        py::finalize_interpreter();
        return false;
    }

    initialized_ = true;
    LOG_INFO("[Python] Interpreter %s ready", PY_VERSION);
    return true;
}

void PythonRuntime::finalize() {
    if (!initialized_) return;

    timeout_exc_ = py::object();
    hooks_ = py::object();
    builtins_template_ = py::object();
    proxies_ = py::object();
    substitutes_.clear();
    originals_.clear();
    capabilities_ = nullptr;
    py::finalize_interpreter();
    initialized_ = false;
    LOG_INFO("[Python] Interpreter finalized");
}

// Real objects a proxy must never expose, by identity
void PythonRuntime::install_substitutes() {
    py::module_ builtins = py::module_::import("builtins");
    static const char* const dropped[] = {
        "eval", "exec", "compile", "__import__", "globals", "locals", "vars",
        "exit", "quit", "breakpoint", "input", "help"
    };
    for (const char* name : dropped) {
        py::object original = py::getattr(builtins, name, py::none());
        if (original.is_none()) continue;
        substitutes_[original.ptr()] = py::object();
        originals_.push_back(original);
    }

    py::object open = builtins.attr("open");
    substitutes_[open.ptr()] = guarded_open();
    originals_.push_back(open);
    for (auto item : guarded_attribute_builtins()) {
        py::object original = builtins.attr(item.first);
        substitutes_[original.ptr()] = py::reinterpret_borrow<py::object>(item.second);
        originals_.push_back(original);
    }

    py::module_ importlib = py::module_::import("importlib");
    static const char* const importers[] = { "import_module", "__import__", "reload" };
    for (const char* name : importers) {
        py::object original = py::getattr(importlib, name, py::none());
        if (original.is_none()) continue;
        substitutes_[original.ptr()] = py::object();
        originals_.push_back(original);
    }
}

std::string PythonRuntime::format_exception(const py::error_already_set& e) const {
    try {
        py::object lines = py::module_::import("traceback").attr("format_exception")(e.type(), e.value(), e.trace());
        return py::str("").attr("join")(lines).cast<std::string>();
    } catch (const py::error_already_set& inner) {
        LOG_DEBUG("[Python] Traceback formatting failed: %s", error_text(inner).c_str());
    }
    return error_text(e) + "\n";
}

py::object PythonRuntime::compile_script(const std::string& code) const {
    py::module_ ast = py::module_::import("ast");
    py::object tree = ast.attr("parse")(code, "<sandbox>", "exec");

    py::object attribute = ast.attr("Attribute");
    py::object name = ast.attr("Name");
    py::object match_class = ast.attr("MatchClass");
    const std::set<std::string>& blocked = blocked_names();

    for (py::handle node : ast.attr("walk")(tree)) {
        std::vector<std::string> spelled;
        if (py::isinstance(node, attribute)) {
            spelled.push_back(node.attr("attr").cast<std::string>());
        } else if (py::isinstance(node, name)) {
            spelled.push_back(node.attr("id").cast<std::string>());
        } else if (py::isinstance(node, match_class)) {
            for (py::handle kwd : node.attr("kwd_attrs")) {
                spelled.push_back(kwd.cast<std::string>());
            }
        }
        for (const auto& s : spelled) {
            if (!blocked.count(s)) continue;
            int line = node.attr("lineno").cast<int>();
            throw python_error(PyExc_PermissionError, "[sandbox] access to '" + s + "' is not allowed (line " +
                               std::to_string(line) + ")");
        }
    }
    return py::module_::import("builtins").attr("compile")(tree, "<sandbox>", "exec");
}

void PythonRuntime::collect(const py::dict& ns, std::string& result_json,
                            std::vector<std::pair<std::string, std::string>>& variables) const {
    py::object result = ns.contains("RESULT") ? py::object(ns["RESULT"]) : py::object(py::none());
    if (!result.is_none()) {
        py::module_ json = py::module_::import("json");
        try {
            result_json = json.attr("dumps")(result, py::arg("default") = py::module_::import("builtins").attr("str"))
                              .cast<std::string>();
        } catch (const py::error_already_set& e) {
            if (!e.matches(PyExc_TypeError) && !e.matches(PyExc_ValueError) && !e.matches(PyExc_OverflowError) &&
                !e.matches(PyExc_RecursionError)) {
                throw;
            }
            result_json = json.attr("dumps")(py::str(result)).cast<std::string>();
        }
    }

    for (auto item : ns) {
        if (!py::isinstance<py::str>(item.first)) continue;
        std::string key = item.first.cast<std::string>();
        if (key.empty() || key[0] == '_' || key == "RESULT" || key == "SANDBOX_DIR") continue;
        if (py::isinstance<py::module_>(item.second)) continue;
        variables.push_back(std::make_pair(key, py::str(py::type::of(item.second).attr("__name__")).cast<std::string>()));
    }
}

// ============================================================================
// Capabilities and proxies
// ============================================================================

CapabilityFactory PythonRuntime::capability_factory(CapabilityLoader& capabilities) {
    capabilities_ = &capabilities;
    return [this](const CapabilitySpec& spec) { return load_capability(spec); };
}

LoadOutcome PythonRuntime::load_capability(const CapabilitySpec& spec) {
    if (!initialized_ || !capabilities_) {
        return LoadOutcome::fail("interpreter is not running");
    }

    HostCallScope scope(current_run());
    try {
        if (spec.kind == CapabilityKind::Facade) {
            py::module_ facade = build_facade(spec.name);
            return LoadOutcome::ok(std::make_shared<PyCapability>(facade, facade));
        }

        py::module_ real = import_real(spec.name);

        for (const auto& call : spec.guarded_calls) {
            py::object holder;
            std::string leaf;
            py::object target = lookup(real, call.attribute, holder, leaf)
                                    ? py::getattr(holder, leaf.c_str(), py::none())
                                    : py::object(py::none());
            if (target.is_none()) {
                LOG_WARN("[Python] %s: %s not found, not guarded", spec.name.c_str(), call.attribute.c_str());
                continue;
            }
            py::cpp_function wrapper = guard_call(target, call, holder);
            try {
                holder.attr(leaf.c_str()) = wrapper;
            } catch (const py::error_already_set& e) {
                LOG_WARN("[Python] %s: guarding %s failed: %s", spec.name.c_str(), call.attribute.c_str(),
                         error_text(e).c_str());
                continue;
            }
            substitutes_[target.ptr()] = wrapper;
            originals_.push_back(target);
        }

        for (const auto& attr : spec.removed) {
            py::object holder;
            std::string leaf;
            if (!lookup(real, attr, holder, leaf) || !py::hasattr(holder, leaf.c_str())) continue;
            py::object original = holder.attr(leaf.c_str());
            py::cpp_function stub = removed_stub(spec.name + "." + attr);
            if (attr.find('.') == std::string::npos) {
                // Top-level names only disappear from the proxies
                if (!py::isinstance<py::module_>(original)) {
                    substitutes_[original.ptr()] = stub;
                    originals_.push_back(original);
                }
                continue;
            }
            try {
                holder.attr(leaf.c_str()) = stub;
            } catch (const py::error_already_set& e) {
                LOG_WARN("[Python] %s: removing %s failed: %s", spec.name.c_str(), attr.c_str(), error_text(e).c_str());
            }
        }

        py::object proxy = proxy_for(real, spec);
        py::object root;
        std::string top = top_level(spec.name);
        if (top == spec.name) {
            root = proxy;
        } else if (!capabilities_->owner_of(top)) {
            root = proxy_for(import_real(top), spec);
        }
        return LoadOutcome::ok(std::make_shared<PyCapability>(proxy, root));
    } catch (const py::error_already_set& e) {
        return LoadOutcome::fail(error_text(e));
    }
}

bool PythonRuntime::admit(const std::string& module_name, const CapabilitySpec& owner, const std::string& key,
                          py::handle value, py::object& out) {
    std::string relative = key;
    if (starts_with(module_name, owner.name + ".")) {
        relative = module_name.substr(owner.name.size() + 1) + "." + key;
    }
    for (const auto& removed : owner.removed) {
        if (removed == relative) {
            out = removed_stub(module_name + "." + key);
            return true;
        }
    }

    auto sub = substitutes_.find(value.ptr());
    if (sub != substitutes_.end()) {
        if (!sub->second) return false;
        out = sub->second;
        return true;
    }

    if (py::isinstance<py::module_>(value)) {
        py::object target_name = py::getattr(value, "__name__", py::none());
        if (!py::isinstance<py::str>(target_name)) return false;
        std::string target = target_name.cast<std::string>();

        const CapabilitySpec* target_owner = capabilities_->owner_of(target);
        if (!target_owner) return false;
        ResolveResult resolved = capabilities_->resolve(target_owner->name);
        PyCapability* cap = dynamic_cast<PyCapability*>(resolved.value.get());
        if (!resolved.ok() || !cap) return false;
        if (target_owner->kind == CapabilityKind::Facade || target_owner->name == target) {
            out = cap->module();
            return true;
        }
        out = proxy_for(py::reinterpret_borrow<py::module_>(value), *target_owner);
        return true;
    }

    out = py::reinterpret_borrow<py::object>(value);
    return true;
}

py::object PythonRuntime::proxy_for(const py::module_& real, const CapabilitySpec& owner) {
    std::string name = py::str(real.attr("__name__"));
    py::dict proxies = proxies_;
    if (proxies.contains(name)) {
        return proxies[py::str(name)];
    }

    py::module_ proxy = py::reinterpret_steal<py::module_>(PyModule_New(name.c_str()));
    if (!proxy) throw py::error_already_set();

    static const char* const kept[] = { "__doc__", "__version__", "__all__" };
    for (const char* attr : kept) {
        if (py::hasattr(real, attr)) proxy.attr(attr) = real.attr(attr);
    }

    py::dict contents = real.attr("__dict__");
    for (auto item : contents) {
        if (!py::isinstance<py::str>(item.first)) continue;
        std::string key = item.first.cast<std::string>();
        if (key.empty() || key[0] == '_') continue;
        // Modules are resolved on first access
        if (py::isinstance<py::module_>(item.second)) continue;
        py::object value;
        if (admit(name, owner, key, item.second, value)) {
            proxy.attr(key.c_str()) = value;
        }
    }

    const CapabilitySpec* owner_spec = &owner;
    py::module_ source = real;
    proxy.attr("__getattr__") = py::cpp_function(
        [this, source, name, owner_spec](const std::string& key) -> py::object {
            std::string missing = "module '" + name + "' has no attribute '" + key + "'";
            if (key.empty() || key[0] == '_') {
                throw python_error(PyExc_AttributeError, missing);
            }
            py::object value;
            {
                HostCallScope scope(current_run());
                if (!py::hasattr(source, key.c_str())) {
                    throw python_error(PyExc_AttributeError, missing);
                }
                value = source.attr(key.c_str());
            }
            py::object out;
            if (!admit(name, *owner_spec, key, value, out)) {
                throw python_error(PyExc_AttributeError, missing);
            }
            py::dict memo = proxies_;
            memo[py::str(name)].attr(key.c_str()) = out;
            return out;
        },
        py::name("__getattr__"));

    proxies[py::str(name)] = proxy;
    return proxy;
}

py::dict PythonRuntime::new_namespace(const std::string& session_id, const std::string& session_dir) {
    py::dict ns;
    ns["__builtins__"] = builtins_template_.attr("copy")();
    ns["__name__"] = "__sandbox__";
    ns["__doc__"] = py::none();
    ns["__sandbox__"] = hooks_;
    ns["SANDBOX_DIR"] = session_dir;
    ns["RESULT"] = py::none();

    size_t bound = 0;
    for (const CapabilitySpec* spec : capabilities_->entries(CapabilityTier::Eager)) {
        if (spec->name != spec->binding) continue;
        ResolveResult r = capabilities_->resolve(spec->name);
        PyCapability* cap = dynamic_cast<PyCapability*>(r.value.get());
        if (!r.ok() || !cap) {
            LOG_WARN("[Python] %s: eager capability %s unavailable: %s", session_id.c_str(), spec->name.c_str(),
                     r.error.c_str());
            continue;
        }
        ns[py::str(spec->binding)] = cap->module();
        ++bound;
    }
    LOG_DEBUG("[Python] Namespace for %s created with %zu bindings", session_id.c_str(), bound);
    return ns;
}

} // namespace sandkernel
