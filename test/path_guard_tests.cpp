#include <gtest/gtest.h>

#include <sandkernel/core/path_guard.hpp>

using namespace sandkernel;

namespace {

const char* const kOwn = "/srv/sandbox/sessions/s1";

SandboxSettings guard_settings() {
    SandboxSettings s;
    s.sessions_root = "/srv/sandbox/sessions";
    s.upload_dir = "/srv/sandbox/uploads";
    s.shared_dirs.push_back("/data/shared");
    return s;
}

PathDecision write_path(const PathGuard& guard, const std::string& path) {
    return guard.resolve(path, "s1", AccessMode::Write);
}

PathDecision read_path(const PathGuard& guard, const std::string& path) {
    return guard.resolve(path, "s1", AccessMode::Read);
}

} // anonymous namespace

TEST(PathGuard, RelativePathLandsInSessionDir)
{
    PathGuard guard(guard_settings());

    auto d = write_path(guard, "out.csv");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/out.csv", d.path);

    d = write_path(guard, "reports/q1/summary.json");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/reports/q1/summary.json", d.path);

    d = read_path(guard, ".");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (kOwn, d.path);

    d = read_path(guard, "~/notes.txt");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/notes.txt", d.path);
}

TEST(PathGuard, TempPrefixesAreStripped)
{
    PathGuard guard(guard_settings());

    auto d = write_path(guard, "/tmp/out.csv");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/out.csv", d.path);

    d = write_path(guard, "/var/tmp/a/b.txt");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/a/b.txt", d.path);

    SandboxSettings s = guard_settings();
    s.temp_dir = "/scratch";
    PathGuard custom(s);
    d = write_path(custom, "/scratch/x.json");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/x.json", d.path);
}

TEST(PathGuard, ForeignDrivePaths)
{
    PathGuard guard(guard_settings());

    auto d = write_path(guard, "C:\\Users\\bob\\AppData\\Local\\Temp\\report.xlsx");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/report.xlsx", d.path);

    d = write_path(guard, "D:\\data\\exports\\file.csv");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/file.csv", d.path);

    d = write_path(guard, "C:\\tmp\\sub\\chart.png");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/sub/chart.png", d.path);

    d = write_path(guard, "C:\\");
    ASSERT_FALSE (d.ok());
    ASSERT_EQ (PathRejection::Invalid, d.reason);
}

TEST(PathGuard, DoubledSessionPrefixCollapses)
{
    PathGuard guard(guard_settings());

    auto d = write_path(guard, "srv/sandbox/sessions/s1/out.csv");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/out.csv", d.path);

    d = write_path(guard, "srv/sandbox/sessions/s1/srv/sandbox/sessions/s1/x.csv");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/x.csv", d.path);

    d = write_path(guard, std::string(kOwn) + "/out.csv");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/out.csv", d.path);
}

TEST(PathGuard, TraversalIsRejected)
{
    PathGuard guard(guard_settings());

    const char* const escapes[] = {
        "../other/x.csv",
        "a/../../x.csv",
        "../../../../etc/passwd",
        "/tmp/../etc/passwd",
        "/etc/../etc/passwd",
        "/srv/sandbox/sessions/s1/../s2/data.csv",
        "..\\..\\secret.txt",
    };
    for (const char* path : escapes) {
        auto d = read_path(guard, path);
        ASSERT_FALSE (d.ok()) << path;
        ASSERT_EQ (PathRejection::Traversal, d.reason) << path;
        ASSERT_FALSE (d.message.empty()) << path;
    }

    auto d = read_path(guard, "a/../b.txt");
    ASSERT_EQ (PathDecision::Confined, d.kind);
    ASSERT_EQ (std::string(kOwn) + "/b.txt", d.path);
}

TEST(PathGuard, OtherSessionsAndForeignRootsAreRejected)
{
    PathGuard guard(guard_settings());

    auto d = read_path(guard, "/srv/sandbox/sessions/s2/secret.txt");
    ASSERT_FALSE (d.ok());
    ASSERT_EQ (PathRejection::OutsideRoots, d.reason);

    d = read_path(guard, "/srv/sandbox/sessions/s10/x");
    ASSERT_FALSE (d.ok());

    d = read_path(guard, "/etc/passwd");
    ASSERT_FALSE (d.ok());
    ASSERT_EQ (PathRejection::OutsideRoots, d.reason);

    d = write_path(guard, "/home/user/.bashrc");
    ASSERT_FALSE (d.ok());
    ASSERT_EQ (PathRejection::OutsideRoots, d.reason);
}

TEST(PathGuard, SharedRootsAreReadOnly)
{
    PathGuard guard(guard_settings());

    auto d = read_path(guard, "/srv/sandbox/uploads/data.csv");
    ASSERT_EQ (PathDecision::SharedReadOnly, d.kind);
    ASSERT_EQ ("/srv/sandbox/uploads/data.csv", d.path);

    d = write_path(guard, "/srv/sandbox/uploads/data.csv");
    ASSERT_FALSE (d.ok());
    ASSERT_EQ (PathRejection::ReadOnly, d.reason);

    d = read_path(guard, "/data/shared/ref/table.json");
    ASSERT_EQ (PathDecision::SharedReadOnly, d.kind);

    d = write_path(guard, "/data/shared/ref/table.json");
    ASSERT_EQ (PathRejection::ReadOnly, d.reason);

    // a sibling with a common name prefix is not the upload root
    d = read_path(guard, "/srv/sandbox/uploads2/data.csv");
    ASSERT_FALSE (d.ok());
}

TEST(PathGuard, InvalidInputs)
{
    PathGuard guard(guard_settings());

    ASSERT_EQ (PathRejection::Invalid, guard.resolve("", "s1", AccessMode::Read).reason);
    ASSERT_EQ (PathRejection::Invalid, guard.resolve(std::string("a\0b", 3), "s1", AccessMode::Read).reason);
    ASSERT_EQ (PathRejection::Invalid, guard.resolve("x.csv", "..", AccessMode::Read).reason);
    ASSERT_EQ (PathRejection::Invalid, guard.resolve("x.csv", "a/b", AccessMode::Read).reason);
    ASSERT_EQ (PathRejection::Invalid, guard.resolve("x.csv", "", AccessMode::Read).reason);
}

TEST(PathGuard, ResolveIsIdempotent)
{
    PathGuard guard(guard_settings());

    const char* const inputs[] = {
        "out.csv", "/tmp/out.csv", "C:\\Temp\\r.xlsx", "srv/sandbox/sessions/s1/a/b.txt", "./x/./y.txt"
    };
    for (const char* input : inputs) {
        auto first = write_path(guard, input);
        ASSERT_EQ (PathDecision::Confined, first.kind) << input;
        auto second = write_path(guard, first.path);
        ASSERT_EQ (PathDecision::Confined, second.kind) << input;
        ASSERT_EQ (first.path, second.path) << input;
    }
}

TEST(PathGuard, SessionIdRules)
{
    ASSERT_TRUE (PathGuard::is_valid_session_id("abc"));
    ASSERT_TRUE (PathGuard::is_valid_session_id("user_42.run-7"));
    ASSERT_TRUE (PathGuard::is_valid_session_id(std::string(128, 'a')));

    ASSERT_FALSE (PathGuard::is_valid_session_id(""));
    ASSERT_FALSE (PathGuard::is_valid_session_id("."));
    ASSERT_FALSE (PathGuard::is_valid_session_id(".."));
    ASSERT_FALSE (PathGuard::is_valid_session_id("a/b"));
    ASSERT_FALSE (PathGuard::is_valid_session_id("a b"));
    ASSERT_FALSE (PathGuard::is_valid_session_id(std::string(129, 'a')));
}
