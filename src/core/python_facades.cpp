#include <sandkernel/core/python_runtime.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

#include <chrono>
#include <cmath>
#include <thread>

namespace sandkernel {

namespace {

std::string type_name(py::handle value) {
    return py::str(py::type::of(value).attr("__name__")).cast<std::string>();
}

// Text of a str/bytes/PathLike value; false for anything else
bool path_text(py::handle value, std::string& out) {
    if (!py::isinstance<py::str>(value) && !py::isinstance<py::bytes>(value) && !py::hasattr(value, "__fspath__")) {
        return false;
    }
    py::object path = py::module_::import("os").attr("fspath")(value);
    if (py::isinstance<py::bytes>(path)) {
        path = path.attr("decode")("utf-8", "surrogateescape");
    }
    out = path.attr("encode")("utf-8", "surrogateescape").cast<std::string>();
    return true;
}

// Host function exposed as a C function, so it carries no Python globals
py::cpp_function forward(py::object target, const char* name) {
    return py::cpp_function(
        [target](py::args args, py::kwargs kwargs) -> py::object { return target(*args, **kwargs); },
        py::name(name));
}

py::module_ new_module(const char* name, const char* doc) {
    py::module_ m = py::reinterpret_steal<py::module_>(PyModule_New(name));
    if (!m) throw py::error_already_set();
    m.doc() = doc;
    return m;
}

std::string read_path(py::handle path) {
    return confine_path(path, false);
}

std::string write_path(py::handle path) {
    return confine_path(path, true);
}

// True/False checks never report a refused path as an error
void def_check(py::module_& m, const char* name) {
    py::object real = py::module_::import("posixpath").attr(name);
    m.def(name, [real](py::object path) -> bool {
        RunContext* ctx = current_run();
        bool rejected = ctx && ctx->path_rejected;
        std::string message = ctx ? ctx->path_message : std::string();
        try {
            return real(read_path(path)).cast<bool>();
        } catch (const py::error_already_set& e) {
            if (!e.matches(PyExc_PermissionError)) throw;
        }
        if (ctx) {
            ctx->path_rejected = rejected;
            ctx->path_message = message;
        }
        return false;
    });
}

void def_query(py::module_& m, const char* name) {
    py::object real = py::module_::import("posixpath").attr(name);
    m.def(name, [real](py::object path) { return real(read_path(path)); });
}

py::module_ path_facade() {
    py::module_ posixpath = py::module_::import("posixpath");
    py::module_ m = new_module("os.path", "Path helpers confined to the session directory.");

    static const char* const constants[] = { "sep", "extsep", "curdir", "pardir" };
    for (const char* name : constants) {
        m.attr(name) = posixpath.attr(name);
    }
    static const char* const lexical[] = {
        "join", "basename", "dirname", "split", "splitext", "normpath", "isabs", "commonpath", "commonprefix"
    };
    for (const char* name : lexical) {
        m.attr(name) = forward(posixpath.attr(name), name);
    }

    m.def("expanduser", [](py::object path) { return path; });
    def_check(m, "exists");
    def_check(m, "lexists");
    def_check(m, "isfile");
    def_check(m, "isdir");
    def_query(m, "getsize");
    def_query(m, "getmtime");
    def_query(m, "getctime");
    m.def("abspath", &read_path);
    m.def("realpath", &read_path);

    py::object relpath = posixpath.attr("relpath");
    m.def("relpath", [relpath](py::object path, py::object start) {
        return relpath(read_path(path), read_path(start.is_none() ? py::str(".") : start));
    }, py::arg("path"), py::arg("start") = py::none());
    return m;
}

py::module_ os_facade() {
    py::module_ os = py::module_::import("os");
    py::module_ m = new_module("os", "File operations confined to the session directory.");

    m.attr("path") = path_facade();
    static const char* const constants[] = { "name", "sep", "linesep", "curdir", "pardir", "extsep" };
    for (const char* name : constants) {
        m.attr(name) = os.attr(name);
    }
    m.attr("environ") = py::dict();
    m.attr("fspath") = forward(os.attr("fspath"), "fspath");
    m.attr("PathLike") = os.attr("PathLike");

    m.def("getcwd", []() {
        RunContext* ctx = current_run();
        if (!ctx) throw python_error(PyExc_PermissionError, "[sandbox] no script is running");
        return ctx->session_dir;
    });
    m.def("getenv", [](py::object, py::object fallback) { return fallback; },
          py::arg("key"), py::arg("default") = py::none());

    py::object listdir = os.attr("listdir");
    m.def("listdir", [listdir](py::object path) { return listdir(read_path(path)); }, py::arg("path") = ".");
    py::object scandir = os.attr("scandir");
    m.def("scandir", [scandir](py::object path) { return scandir(read_path(path)); }, py::arg("path") = ".");
    py::object walk = os.attr("walk");
    m.def("walk", [walk](py::object top, bool topdown, py::object onerror, bool) {
        // Symlinks are never followed out of the session
        return walk(read_path(top), topdown, onerror, false);
    }, py::arg("top") = ".", py::arg("topdown") = true, py::arg("onerror") = py::none(),
       py::arg("followlinks") = false);

    py::object makedirs = os.attr("makedirs");
    m.def("makedirs", [makedirs](py::object name, int mode, bool exist_ok) {
        return makedirs(write_path(name), mode, exist_ok);
    }, py::arg("name"), py::arg("mode") = 0777, py::arg("exist_ok") = false);
    py::object mkdir = os.attr("mkdir");
    m.def("mkdir", [mkdir](py::object path, int mode) { return mkdir(write_path(path), mode); },
          py::arg("path"), py::arg("mode") = 0777);

    py::object remove = os.attr("remove");
    m.def("remove", [remove](py::object path) { return remove(write_path(path)); });
    m.attr("unlink") = m.attr("remove");
    py::object rmdir = os.attr("rmdir");
    m.def("rmdir", [rmdir](py::object path) { return rmdir(write_path(path)); });
    py::object rename = os.attr("rename");
    m.def("rename", [rename](py::object src, py::object dst) { return rename(write_path(src), write_path(dst)); });
    py::object replace = os.attr("replace");
    m.def("replace", [replace](py::object src, py::object dst) { return replace(write_path(src), write_path(dst)); });
    py::object stat = os.attr("stat");
    m.def("stat", [stat](py::object path) { return stat(read_path(path)); });
    return m;
}

// Sleeps in short slices with the GIL released so the deadline is honored
void sliced_sleep(double seconds) {
    if (std::isnan(seconds) || seconds < 0) {
        throw python_error(PyExc_ValueError, "sleep length must be non-negative");
    }
    if (seconds > 86400.0 * 365) seconds = 86400.0 * 365;

    int64_t end = monotonic_ms() + static_cast<int64_t>(seconds * 1000.0);
    for (;;) {
        int64_t now = monotonic_ms();
        RunContext* ctx = current_run();
        if (ctx && ctx->deadline_ms > 0 && now >= ctx->deadline_ms) {
            PyErr_SetNone(PythonRuntime::instance().timeout_exception().ptr());
            throw py::error_already_set();
        }
        if (now >= end) return;
        int64_t slice = end - now < 100 ? end - now : 100;
        {
            py::gil_scoped_release release;
            std::this_thread::sleep_for(std::chrono::milliseconds(slice));
        }
        if (PyErr_CheckSignals() != 0) throw py::error_already_set();
    }
}

py::module_ time_facade() {
    py::module_ time = py::module_::import("time");
    py::module_ m = new_module("time", "Clock functions; sleep() honors the run deadline.");
    for (py::handle name : py::module_::import("builtins").attr("dir")(time)) {
        std::string key = py::str(name);
        if (key.empty() || key[0] == '_') continue;
        m.attr(key.c_str()) = time.attr(key.c_str());
    }
    m.def("sleep", &sliced_sleep, py::arg("seconds"));
    return m;
}

py::module_ io_facade() {
    py::module_ io = py::module_::import("io");
    py::module_ m = new_module("io", "In-memory streams and a guarded open().");
    static const char* const kept[] = {
        "StringIO", "BytesIO", "TextIOWrapper", "IOBase", "RawIOBase", "BufferedIOBase", "TextIOBase",
        "UnsupportedOperation", "DEFAULT_BUFFER_SIZE", "SEEK_SET", "SEEK_CUR", "SEEK_END"
    };
    for (const char* name : kept) {
        m.attr(name) = io.attr(name);
    }
    m.attr("open") = guarded_open();
    return m;
}

} // anonymous namespace

// ============================================================================
// Path confinement
// ============================================================================

std::string confine_path(py::handle path, bool write) {
    RunContext* ctx = current_run();
    if (!ctx || !ctx->guard) {
        throw python_error(PyExc_PermissionError, "[sandbox] file access outside a run is not allowed");
    }
    std::string raw;
    if (!path_text(path, raw)) {
        throw python_error(PyExc_TypeError, "expected str, bytes or os.PathLike object, not " + type_name(path));
    }

    PathDecision d = ctx->guard->resolve(raw, ctx->session_id, write ? AccessMode::Write : AccessMode::Read);
    if (!d.ok()) {
        ctx->path_rejected = true;
        ctx->path_message = d.message;
        LOG_DEBUG("[Python] %s: path refused (%s): %s", ctx->session_id.c_str(), path_rejection_name(d.reason),
                  raw.c_str());
        throw python_error(PyExc_PermissionError,
                           "[sandbox] " + d.message + " (" + path_rejection_name(d.reason) + ")");
    }
    return d.path;
}

py::object confine_argument(py::handle value, bool write) {
    std::string raw;
    if (!path_text(value, raw)) {
        return py::reinterpret_borrow<py::object>(value);
    }
    return py::str(confine_path(value, write));
}

py::cpp_function guarded_open() {
    py::object real = py::module_::import("io").attr("open");
    return py::cpp_function(
        [real](py::object file, py::object mode, py::args args, py::kwargs kwargs) -> py::object {
            if (py::isinstance<py::int_>(file)) {
                throw python_error(PyExc_PermissionError, "[sandbox] opening file descriptors is not allowed");
            }
            std::string flags = py::str(mode);
            bool write = flags.find_first_of("wax+") != std::string::npos;
            std::string resolved = confine_path(file, write);
            return real(resolved, mode, *args, **kwargs);
        },
        py::name("open"), py::arg("file"), py::arg("mode") = "r");
}

// ============================================================================
// Facades, attribute builtins and library guards
// ============================================================================

py::module_ build_facade(const std::string& name) {
    if (name == "os") return os_facade();
    if (name == "os.path") return path_facade();
    if (name == "time") return time_facade();
    if (name == "io") return io_facade();
    throw python_error(PyExc_ImportError, "no facade named '" + name + "'");
}

const std::set<std::string>& blocked_names() {
    static const std::set<std::string> names = {
        "__globals__", "__builtins__", "__code__", "__closure__", "__func__", "__self__", "__wrapped__",
        "__subclasses__", "__bases__", "__base__", "__mro__", "__dict__", "__getattribute__", "__loader__",
        "__spec__", "__import__", "__traceback__", "__module__",
        "f_globals", "f_locals", "f_builtins", "f_back", "f_code", "tb_frame", "tb_next",
        "gi_frame", "gi_code", "cr_frame", "cr_code", "ag_frame", "ag_code", "ctypes"
    };
    return names;
}

namespace {

void refuse_blocked(py::handle name) {
    if (!py::isinstance<py::str>(name)) return;
    std::string key = py::str(name);
    if (blocked_names().count(key)) {
        throw python_error(PyExc_PermissionError, "[sandbox] access to '" + key + "' is not allowed");
    }
}

py::cpp_function guarded_attribute(const char* name) {
    py::object real = py::module_::import("builtins").attr(name);
    return py::cpp_function(
        [real](py::args args) -> py::object {
            if (args.size() > 1) refuse_blocked(args[1]);
            return real(*args);
        },
        py::name(name));
}

} // anonymous namespace

py::dict guarded_attribute_builtins() {
    py::dict out;
    static const char* const names[] = { "getattr", "hasattr", "setattr", "delattr" };
    for (const char* name : names) {
        out[name] = guarded_attribute(name);
    }
    return out;
}

py::cpp_function guard_call(py::object target, const GuardedCall& call, py::handle holder) {
    int index = call.index;
    std::string keyword = call.keyword;
    bool write = call.write;
    auto wrapper = [target, index, keyword, write](py::args args, py::kwargs kwargs) -> py::object {
        if (!keyword.empty() && kwargs.contains(keyword)) {
            kwargs[py::str(keyword)] = confine_argument(kwargs[py::str(keyword)], write);
            return target(*args, **kwargs);
        }
        if (static_cast<int>(args.size()) <= index) {
            return target(*args, **kwargs);
        }
        py::list confined(args);
        confined[index] = confine_argument(args[index], write);
        return target(*py::tuple(confined), **kwargs);
    };

    std::string name = py::str(py::getattr(target, "__name__", py::str("guarded")));
    if (PyType_Check(holder.ptr())) {
        return py::cpp_function(wrapper, py::name(name.c_str()), py::is_method(holder));
    }
    return py::cpp_function(wrapper, py::name(name.c_str()));
}

py::cpp_function removed_stub(const std::string& qualified_name) {
    std::string leaf = qualified_name.substr(qualified_name.rfind('.') + 1);
    return py::cpp_function(
        [qualified_name](py::args, py::kwargs) -> py::object {
            throw python_error(PyExc_PermissionError, "[sandbox] " + qualified_name + " is disabled");
        },
        py::name(leaf.c_str()));
}

} // namespace sandkernel
