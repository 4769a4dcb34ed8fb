#include <sandkernel/core/capability_loader.hpp>
#include <sandkernel/core/logger.hpp>
#include <sandkernel/core/utils.hpp>

#include <set>

namespace sandkernel {

namespace {

// Top-level modules that hand out process, interpreter or raw filesystem
// access. Never registrable, not even from configuration.
const std::set<std::string>& denylist() {
    static const std::set<std::string> names = {
        "sys", "os", "posix", "subprocess", "_posixsubprocess", "builtins",
        "importlib", "socket", "ctypes", "code", "codeop", "pty", "signal",
        "threading", "_thread", "multiprocessing", "asyncio", "shutil",
        "pickle", "marshal", "runpy", "gc", "inspect", "io", "_io",
        "pathlib", "glob", "tempfile", "mmap", "fcntl", "select", "resource"
    };
    return names;
}

std::string top_level(const std::string& name) {
    size_t dot = name.find('.');
    return dot == std::string::npos ? name : name.substr(0, dot);
}

CapabilitySpec make_spec(const std::string& name, CapabilityTier tier,
                         CapabilityKind kind = CapabilityKind::Module,
                         bool submodules = false) {
    CapabilitySpec spec;
    spec.name = name;
    spec.binding = top_level(name);
    spec.tier = tier;
    spec.kind = kind;
    spec.submodules = submodules;
    return spec;
}

GuardedCall reads(const std::string& attr, int index, const std::string& keyword) {
    return GuardedCall(attr, index, keyword, false);
}

GuardedCall writes(const std::string& attr, int index, const std::string& keyword) {
    return GuardedCall(attr, index, keyword, true);
}

} // anonymous namespace

// ============================================================================
// Catalog
// ============================================================================

std::vector<CapabilitySpec> CapabilityLoader::default_catalog() {
    std::vector<CapabilitySpec> out;

    static const char* const eager_modules[] = {
        "math", "statistics", "json", "csv", "re", "datetime", "collections",
        "itertools", "functools", "copy", "hashlib", "base64", "random",
        "string", "textwrap", "decimal", "fractions", "operator", "typing",
        "dataclasses", "enum", "pprint", "calendar", "struct"
    };
    for (const char* name : eager_modules) {
        out.push_back(make_spec(name, CapabilityTier::Eager, CapabilityKind::Module,
                                std::string(name) == "collections"));
    }

    // Helpers that look attributes or annotations up by name
    for (auto& s : out) {
        if (s.name == "operator") {
            s.removed = { "attrgetter", "methodcaller" };
        } else if (s.name == "string") {
            s.removed = { "Formatter" };
        } else if (s.name == "typing") {
            s.removed = { "get_type_hints", "ForwardRef" };
        } else if (s.name == "functools") {
            s.removed = { "singledispatch", "singledispatchmethod" };
        }
    }

    // time.sleep is replaced by an interruptible version, so time is a facade
    out.push_back(make_spec("time", CapabilityTier::Eager, CapabilityKind::Facade));
    out.push_back(make_spec("io", CapabilityTier::Eager, CapabilityKind::Facade));
    out.push_back(make_spec("os", CapabilityTier::Eager, CapabilityKind::Facade));
    out.push_back(make_spec("os.path", CapabilityTier::Eager, CapabilityKind::Facade));

    {
        CapabilitySpec s = make_spec("numpy", CapabilityTier::Lazy, CapabilityKind::Module, true);
        s.guarded_calls = {
            reads("load", 0, "file"), writes("save", 0, "file"),
            writes("savez", 0, "file"), writes("savez_compressed", 0, "file"),
            reads("loadtxt", 0, "fname"), writes("savetxt", 0, "fname"),
            reads("genfromtxt", 0, "fname"), reads("fromfile", 0, "file")
        };
        s.removed = { "ctypeslib", "testing", "f2py", "distutils", "DataSource" };
        out.push_back(s);
    }
    {
        CapabilitySpec s = make_spec("pandas", CapabilityTier::Lazy, CapabilityKind::Module, true);
        s.guarded_calls = {
            reads("read_csv", 0, "filepath_or_buffer"), reads("read_table", 0, "filepath_or_buffer"),
            reads("read_excel", 0, "io"), reads("read_json", 0, "path_or_buf"),
            reads("read_parquet", 0, "path"), reads("read_feather", 0, "path"),
            reads("read_html", 0, "io"), reads("read_xml", 0, "path_or_buffer"),
            writes("DataFrame.to_csv", 1, "path_or_buf"), writes("DataFrame.to_excel", 1, "excel_writer"),
            writes("DataFrame.to_json", 1, "path_or_buf"), writes("DataFrame.to_parquet", 1, "path"),
            writes("DataFrame.to_html", 1, "buf"), writes("DataFrame.to_feather", 1, "path"),
            writes("Series.to_csv", 1, "path_or_buf"), writes("Series.to_json", 1, "path_or_buf"),
            writes("Series.to_excel", 1, "excel_writer")
        };
        s.removed = { "read_pickle", "DataFrame.to_pickle", "Series.to_pickle" };
        out.push_back(s);
    }
    {
        CapabilitySpec s = make_spec("matplotlib", CapabilityTier::Lazy, CapabilityKind::Chart, true);
        s.guarded_calls = { writes("figure.Figure.savefig", 1, "fname") };
        out.push_back(s);
    }
    {
        CapabilitySpec s = make_spec("matplotlib.pyplot", CapabilityTier::Lazy, CapabilityKind::Chart);
        s.guarded_calls = { writes("savefig", 0, "fname"), reads("imread", 0, "fname") };
        out.push_back(s);
    }
    out.push_back(make_spec("seaborn", CapabilityTier::Lazy, CapabilityKind::Chart, true));
    out.push_back(make_spec("plotly", CapabilityTier::Lazy, CapabilityKind::Module, true));
    out.push_back(make_spec("plotly.express", CapabilityTier::Lazy));
    {
        CapabilitySpec s = make_spec("plotly.graph_objects", CapabilityTier::Lazy);
        s.guarded_calls = {
            writes("Figure.write_html", 1, "file"), writes("Figure.write_image", 1, "file"),
            writes("Figure.write_json", 1, "file")
        };
        out.push_back(s);
    }
    out.push_back(make_spec("scipy", CapabilityTier::Lazy, CapabilityKind::Module, true));
    out.push_back(make_spec("scipy.stats", CapabilityTier::Lazy));
    out.push_back(make_spec("sklearn", CapabilityTier::Lazy, CapabilityKind::Module, true));
    out.push_back(make_spec("statsmodels", CapabilityTier::Lazy, CapabilityKind::Module, true));
    out.push_back(make_spec("statsmodels.api", CapabilityTier::Lazy));
    {
        CapabilitySpec s = make_spec("openpyxl", CapabilityTier::Lazy, CapabilityKind::Module, true);
        s.guarded_calls = { reads("load_workbook", 0, "filename"), writes("Workbook.save", 1, "filename") };
        out.push_back(s);
    }
    {
        CapabilitySpec s = make_spec("xlsxwriter", CapabilityTier::Lazy);
        s.guarded_calls = { writes("Workbook.__init__", 1, "filename") };
        out.push_back(s);
    }
    {
        CapabilitySpec s = make_spec("pdfplumber", CapabilityTier::Lazy);
        s.guarded_calls = { reads("open", 0, "path_or_fp") };
        out.push_back(s);
    }
    out.push_back(make_spec("tabulate", CapabilityTier::Lazy));
    out.push_back(make_spec("requests", CapabilityTier::Lazy));

    return out;
}

// ============================================================================
// CapabilityLoader Implementation
// ============================================================================

CapabilityLoader::CapabilityLoader() : sealed_(false) {}

CapabilityLoader::~CapabilityLoader() {}

bool CapabilityLoader::is_denied(const std::string& name) {
    return denylist().count(top_level(name)) > 0;
}

bool CapabilityLoader::register_capability(const CapabilitySpec& spec, CapabilityFactory factory) {
    if (sealed_) {
        LOG_WARN("[Capabilities] Cannot register '%s' after the table is sealed", spec.name.c_str());
        return false;
    }
    if (spec.name.empty() || !factory) {
        LOG_WARN("[Capabilities] Refusing an unnamed capability or one without a factory");
        return false;
    }
    // Facades are host-built stand-ins for denied modules; everything else
    // under a denied top-level name is refused
    if (spec.kind != CapabilityKind::Facade && is_denied(spec.name)) {
        LOG_WARN("[Capabilities] '%s' is on the denylist and cannot be registered", spec.name.c_str());
        return false;
    }
    if (entries_.count(spec.name)) {
        LOG_WARN("[Capabilities] '%s' is already registered", spec.name.c_str());
        return false;
    }

    std::unique_ptr<Entry> entry(new Entry());
    entry->spec = spec;
    if (entry->spec.binding.empty()) {
        entry->spec.binding = top_level(spec.name);
    }
    entry->factory = factory;
    entries_[spec.name] = std::move(entry);
    return true;
}

void CapabilityLoader::register_defaults(CapabilityFactory factory) {
    for (const auto& spec : default_catalog()) {
        register_capability(spec, factory);
    }
}

int CapabilityLoader::register_extra(const std::vector<std::string>& names, CapabilityFactory factory) {
    int added = 0;
    for (const auto& raw : names) {
        std::string name = trim(raw);
        if (name.empty()) continue;
        if (is_denied(name)) {
            LOG_WARN("[Capabilities] capabilities.extra entry '%s' is denylisted, ignored", name.c_str());
            continue;
        }
        if (entries_.count(name)) continue;
        if (register_capability(make_spec(name, CapabilityTier::Lazy, CapabilityKind::Module, true), factory)) {
            LOG_INFO("[Capabilities] Added extra capability '%s'", name.c_str());
            ++added;
        }
    }
    return added;
}

void CapabilityLoader::seal() {
    sealed_ = true;
    LOG_DEBUG("[Capabilities] Sealed with %zu entries", entries_.size());
}

const CapabilitySpec* CapabilityLoader::owner_of(const std::string& name) const {
    if (name.empty()) return nullptr;

    auto it = entries_.find(name);
    if (it != entries_.end()) {
        return &it->second->spec;
    }

    std::string prefix = name;
    for (;;) {
        size_t dot = prefix.rfind('.');
        if (dot == std::string::npos) return nullptr;
        prefix = prefix.substr(0, dot);
        auto parent = entries_.find(prefix);
        if (parent == entries_.end()) continue;

        const CapabilitySpec& spec = parent->second->spec;
        if (!spec.submodules) return nullptr;
        // Removed attributes cannot come back as submodule imports
        std::string relative = name.substr(prefix.size() + 1);
        for (const auto& removed : spec.removed) {
            if (relative == removed || starts_with(relative, removed + ".")) return nullptr;
        }
        return &spec;
    }
}

ResolveResult CapabilityLoader::resolve(const std::string& name) {
    ResolveResult result;

    const CapabilitySpec* owner = owner_of(name);
    if (!owner) {
        result.status = ResolveStatus::Blocked;
        result.error = "'" + name + "' is not an allowed capability";
        return result;
    }

    Entry& entry = *entries_.find(owner->name)->second;
    result.spec = &entry.spec;

    std::lock_guard<std::mutex> lock(entry.mutex);
    if (entry.state == State::Unloaded) {
        ++entry.loads;
        int64_t started = monotonic_ms();
        LoadOutcome outcome = entry.factory(entry.spec);
        if (outcome.value) {
            entry.value = outcome.value;
            entry.state = State::Loaded;
            LOG_DEBUG("[Capabilities] Loaded '%s' in %lld ms", entry.spec.name.c_str(),
                      static_cast<long long>(monotonic_ms() - started));
        } else {
            entry.error = outcome.error.empty() ? "load failed" : outcome.error;
            entry.state = State::Failed;
            LOG_WARN("[Capabilities] Loading '%s' failed: %s", entry.spec.name.c_str(), entry.error.c_str());
        }
    }

    if (entry.state == State::Loaded) {
        result.status = ResolveStatus::Ok;
        result.value = entry.value;
    } else {
        result.status = ResolveStatus::Failed;
        result.error = entry.error;
    }
    return result;
}

int CapabilityLoader::preload_eager() {
    int failed = 0;
    for (const auto& kv : entries_) {
        if (kv.second->spec.tier != CapabilityTier::Eager) continue;
        if (!resolve(kv.first).ok()) {
            ++failed;
        }
    }
    return failed;
}

std::vector<const CapabilitySpec*> CapabilityLoader::entries(CapabilityTier tier) const {
    std::vector<const CapabilitySpec*> out;
    for (const auto& kv : entries_) {
        if (kv.second->spec.tier == tier) {
            out.push_back(&kv.second->spec);
        }
    }
    return out;
}

int CapabilityLoader::load_count(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) return 0;
    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->loads;
}

} // namespace sandkernel
