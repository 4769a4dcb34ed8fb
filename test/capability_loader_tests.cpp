#include <gtest/gtest.h>

#include <sandkernel/core/capability_loader.hpp>
#include <sandkernel/core/utils.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace sandkernel;

namespace {

class Token : public Capability {
public:
    explicit Token(const std::string& n) : name(n) {}
    std::string name;
};

CapabilitySpec lazy_spec(const std::string& name, bool submodules = false) {
    CapabilitySpec spec;
    spec.name = name;
    spec.tier = CapabilityTier::Lazy;
    spec.submodules = submodules;
    return spec;
}

CapabilityFactory token_factory() {
    return [](const CapabilitySpec& spec) {
        return LoadOutcome::ok(std::make_shared<Token>(spec.name));
    };
}

} // anonymous namespace

TEST(CapabilityLoader, ResolveLoadsOnceAndCaches)
{
    CapabilityLoader loader;
    ASSERT_TRUE (loader.register_capability(lazy_spec("pandas"), token_factory()));
    loader.seal();

    ResolveResult first = loader.resolve("pandas");
    ASSERT_TRUE (first.ok());
    ResolveResult second = loader.resolve("pandas");
    ASSERT_TRUE (second.ok());
    ASSERT_EQ (first.value.get(), second.value.get());
    ASSERT_EQ (1, loader.load_count("pandas"));
    ASSERT_EQ ("pandas", dynamic_cast<Token*>(first.value.get())->name);
}

TEST(CapabilityLoader, ConcurrentFirstUseLoadsOnce)
{
    CapabilityLoader loader;
    std::atomic<int> calls(0);
    ASSERT_TRUE (loader.register_capability(lazy_spec("numpy"), [&calls](const CapabilitySpec& spec) {
        ++calls;
        sleep_ms(50);
        return LoadOutcome::ok(std::make_shared<Token>(spec.name));
    }));
    loader.seal();

    std::vector<std::thread> threads;
    std::vector<Capability*> seen(8, nullptr);
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&loader, &seen, i]() {
            ResolveResult r = loader.resolve("numpy");
            seen[i] = r.value.get();
        });
    }
    for (auto& t : threads) t.join();

    ASSERT_EQ (1, calls.load());
    ASSERT_EQ (1, loader.load_count("numpy"));
    for (Capability* value : seen) {
        ASSERT_NE (nullptr, value);
        ASSERT_EQ (seen[0], value);
    }
}

TEST(CapabilityLoader, UnrelatedKeysDoNotSerialize)
{
    CapabilityLoader loader;
    std::atomic<bool> slow_started(false);
    std::atomic<bool> release_slow(false);

    ASSERT_TRUE (loader.register_capability(lazy_spec("scipy"), [&](const CapabilitySpec& spec) {
        slow_started = true;
        while (!release_slow.load()) sleep_ms(5);
        return LoadOutcome::ok(std::make_shared<Token>(spec.name));
    }));
    ASSERT_TRUE (loader.register_capability(lazy_spec("tabulate"), token_factory()));
    loader.seal();

    std::thread slow([&loader]() { loader.resolve("scipy"); });
    while (!slow_started.load()) sleep_ms(1);

    // Completes while scipy's factory is still blocked
    ResolveResult fast = loader.resolve("tabulate");
    ASSERT_TRUE (fast.ok());

    release_slow = true;
    slow.join();
    ASSERT_TRUE (loader.resolve("scipy").ok());
}

TEST(CapabilityLoader, FailureIsCached)
{
    CapabilityLoader loader;
    int calls = 0;
    ASSERT_TRUE (loader.register_capability(lazy_spec("sklearn"), [&calls](const CapabilitySpec&) {
        ++calls;
        return LoadOutcome::fail("No module named 'sklearn'");
    }));
    loader.seal();

    ResolveResult r = loader.resolve("sklearn");
    ASSERT_EQ (ResolveStatus::Failed, r.status);
    ASSERT_EQ ("No module named 'sklearn'", r.error);

    r = loader.resolve("sklearn");
    ASSERT_EQ (ResolveStatus::Failed, r.status);
    ASSERT_EQ (1, calls);
}

TEST(CapabilityLoader, UnknownNameIsBlocked)
{
    CapabilityLoader loader;
    loader.register_defaults(token_factory());
    loader.seal();

    ResolveResult r = loader.resolve("socket");
    ASSERT_EQ (ResolveStatus::Blocked, r.status);
    ASSERT_EQ (nullptr, r.spec);

    ASSERT_EQ (ResolveStatus::Blocked, loader.resolve("definitely_not_a_module").status);
}

TEST(CapabilityLoader, DenylistCannotBeRegistered)
{
    CapabilityLoader loader;
    ASSERT_FALSE (loader.register_capability(lazy_spec("subprocess"), token_factory()));
    ASSERT_FALSE (loader.register_capability(lazy_spec("os.path"), token_factory()));
    ASSERT_FALSE (loader.register_capability(lazy_spec("importlib.util"), token_factory()));

    CapabilitySpec facade = lazy_spec("os");
    facade.kind = CapabilityKind::Facade;
    ASSERT_TRUE (loader.register_capability(facade, token_factory()));

    ASSERT_EQ (0, loader.register_extra({"ctypes", "socket", " sys "}, token_factory()));
    ASSERT_EQ (1, loader.register_extra({"polars", "os"}, token_factory()));
    ASSERT_TRUE (loader.is_allowed("polars"));
    ASSERT_TRUE (loader.is_allowed("polars.io"));

    ASSERT_TRUE (CapabilityLoader::is_denied("socket"));
    ASSERT_TRUE (CapabilityLoader::is_denied("os.path"));
    ASSERT_FALSE (CapabilityLoader::is_denied("pandas"));
}

TEST(CapabilityLoader, RegistrationRules)
{
    CapabilityLoader loader;
    ASSERT_TRUE (loader.register_capability(lazy_spec("tabulate"), token_factory()));
    ASSERT_FALSE (loader.register_capability(lazy_spec("tabulate"), token_factory()));
    ASSERT_FALSE (loader.register_capability(lazy_spec(""), token_factory()));
    ASSERT_FALSE (loader.register_capability(lazy_spec("requests"), CapabilityFactory()));

    loader.seal();
    ASSERT_TRUE (loader.sealed());
    ASSERT_FALSE (loader.register_capability(lazy_spec("requests"), token_factory()));
}

TEST(CapabilityLoader, SubmoduleOwnership)
{
    CapabilityLoader loader;
    loader.register_defaults(token_factory());
    loader.seal();

    const CapabilitySpec* spec = loader.owner_of("pandas.api.types");
    ASSERT_NE (nullptr, spec);
    ASSERT_EQ ("pandas", spec->name);

    spec = loader.owner_of("matplotlib.pyplot");
    ASSERT_NE (nullptr, spec);
    ASSERT_EQ ("matplotlib.pyplot", spec->name);
    ASSERT_EQ (CapabilityKind::Chart, spec->kind);
    ASSERT_EQ ("matplotlib", spec->binding);

    ASSERT_EQ ("collections", loader.owner_of("collections.abc")->name);

    // entries without submodules only admit their exact name
    ASSERT_EQ (nullptr, loader.owner_of("json.decoder"));
    ASSERT_EQ (nullptr, loader.owner_of("os.system"));
    ASSERT_EQ ("os.path", loader.owner_of("os.path")->name);
    ASSERT_EQ (nullptr, loader.owner_of(""));
}

TEST(CapabilityLoader, RemovedAttributesAreNotImportable)
{
    CapabilityLoader loader;
    loader.register_defaults(token_factory());
    loader.seal();

    ASSERT_EQ (nullptr, loader.owner_of("numpy.ctypeslib"));
    ASSERT_EQ (nullptr, loader.owner_of("numpy.testing.overrides"));
    ASSERT_NE (nullptr, loader.owner_of("numpy.linalg"));
    ASSERT_NE (nullptr, loader.owner_of("numpy.testing_helpers"));
    ASSERT_EQ (ResolveStatus::Blocked, loader.resolve("numpy.f2py").status);

    const CapabilitySpec* spec = loader.owner_of("operator");
    ASSERT_NE (nullptr, spec);
    ASSERT_EQ (2u, spec->removed.size());
}

TEST(CapabilityLoader, DefaultCatalogTiers)
{
    CapabilityLoader loader;
    loader.register_defaults(token_factory());
    loader.seal();

    bool has_math = false;
    for (const CapabilitySpec* spec : loader.entries(CapabilityTier::Eager)) {
        if (spec->name == "math") has_math = true;
        ASSERT_NE ("numpy", spec->name);
    }
    ASSERT_TRUE (has_math);

    ASSERT_EQ (CapabilityTier::Lazy, loader.owner_of("numpy")->tier);
    ASSERT_EQ (CapabilityKind::Facade, loader.owner_of("io")->kind);
    ASSERT_FALSE (loader.owner_of("pandas")->guarded_calls.empty());

    ASSERT_EQ (0, loader.preload_eager());
    ASSERT_EQ (1, loader.load_count("math"));
    ASSERT_EQ (0, loader.load_count("numpy"));
}
