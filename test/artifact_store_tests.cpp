#include <gtest/gtest.h>

#include <sandkernel/storage/artifact_store.hpp>
#include <sandkernel/core/utils.hpp>

#include "test_util.hpp"

using namespace sandkernel;

TEST(SqliteArtifactStore, StoreAndFetch)
{
    test::TempDir tmp;
    SqliteArtifactStore store;
    ASSERT_TRUE (store.open(tmp.sub("db/artifacts.db")));
    ASSERT_TRUE (store.is_open());

    std::string bytes("a,b\n1,2\n\0tail", 13);
    std::string handle = store.store(bytes, "out.csv", "s1", 2);
    ASSERT_FALSE (handle.empty());

    StoredArtifact a;
    ASSERT_TRUE (store.fetch(handle, a));
    ASSERT_EQ (handle, a.id);
    ASSERT_EQ ("s1", a.session_id);
    ASSERT_EQ ("out.csv", a.filename);
    ASSERT_EQ ("text/csv", a.mime);
    ASSERT_EQ (13, a.size);
    ASSERT_EQ (bytes, a.content);
    ASSERT_EQ (sha256_hex(bytes), a.sha256);
    ASSERT_EQ (a.created_at + 2 * 3600, a.expires_at);

    ASSERT_FALSE (store.fetch("no-such-handle", a));
}

TEST(SqliteArtifactStore, ExpiredArtifactsAreHiddenAndCleanedUp)
{
    test::TempDir tmp;
    SqliteArtifactStore store;
    ASSERT_TRUE (store.open(tmp.sub("artifacts.db")));

    std::string short_lived = store.store("x", "a.txt", "s1", 1);
    std::string long_lived = store.store("y", "b.txt", "s1", 48);
    ASSERT_FALSE (short_lived.empty());
    ASSERT_FALSE (long_lived.empty());

    int64_t later = current_timestamp() + 2 * 3600;
    StoredArtifact a;
    ASSERT_FALSE (store.fetch_at(short_lived, later, a));
    ASSERT_TRUE (store.fetch_at(long_lived, later, a));

    ASSERT_EQ (1, store.cleanup_expired_at(later));
    ASSERT_EQ (0, store.cleanup_expired_at(later));
    ASSERT_FALSE (store.fetch(short_lived, a));
    ASSERT_TRUE (store.fetch(long_lived, a));
}

TEST(SqliteArtifactStore, ListForSession)
{
    test::TempDir tmp;
    SqliteArtifactStore store;
    ASSERT_TRUE (store.open(tmp.sub("artifacts.db")));

    store.store("1", "b.json", "s1", 1);
    store.store("2", "a.json", "s1", 1);
    store.store("3", "c.json", "s2", 1);

    std::vector<StoredArtifact> list = store.list_for_session("s1");
    ASSERT_EQ (2u, list.size());
    for (const auto& a : list) {
        ASSERT_EQ ("s1", a.session_id);
        ASSERT_TRUE (a.content.empty());
    }
    ASSERT_TRUE (store.list_for_session("s3").empty());
}

TEST(SqliteArtifactStore, ClosedStoreFailsQuietly)
{
    SqliteArtifactStore store;
    ASSERT_FALSE (store.is_open());
    ASSERT_TRUE (store.store("x", "a.txt", "s1", 1).empty());
    StoredArtifact a;
    ASSERT_FALSE (store.fetch("h", a));
    ASSERT_EQ (0, store.cleanup_expired());
}

TEST(SqliteArtifactStore, GuessMime)
{
    ASSERT_EQ ("image/png", SqliteArtifactStore::guess_mime("chart.PNG"));
    ASSERT_EQ ("application/vnd.openxmlformats-officedocument.spreadsheetml.sheet",
               SqliteArtifactStore::guess_mime("report.xlsx"));
    ASSERT_EQ ("application/octet-stream", SqliteArtifactStore::guess_mime("blob.bin"));
    ASSERT_EQ ("application/octet-stream", SqliteArtifactStore::guess_mime("README"));
}
