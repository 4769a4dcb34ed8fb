#include <gtest/gtest.h>

#include <sandkernel/core/utils.hpp>

#include "test_util.hpp"

using namespace sandkernel;

TEST(Utils, NormalizePath)
{
    ASSERT_EQ ("/a/c", normalize_path("/a/b/../c"));
    ASSERT_EQ ("/a/b", normalize_path("//a/./b/"));
    ASSERT_EQ ("/", normalize_path("/.."));
    ASSERT_EQ ("../x", normalize_path("a/../../x"));
    ASSERT_EQ (".", normalize_path("a/.."));
}

TEST(Utils, PathPieces)
{
    ASSERT_EQ ("c.csv", base_name("a/b/c.csv"));
    ASSERT_EQ ("c.csv", base_name("c.csv"));
    ASSERT_EQ ("xlsx", file_extension("Report.XLSX"));
    ASSERT_EQ ("", file_extension(".bashrc"));
    ASSERT_EQ ("", file_extension("dir.d/file"));
    ASSERT_EQ ("a/b", join_path("a/", "/b"));
}

TEST(Utils, Strings)
{
    ASSERT_EQ ("x y", trim("  x y \t\n"));
    ASSERT_TRUE (starts_with("sandbox", "sand"));
    ASSERT_EQ ("a|b|c", join(split("a,b,c", ','), "|"));

    // 3-byte sequence is dropped whole rather than split
    ASSERT_EQ ("ab", truncate_safe("ab\xe2\x82\xac", 4));
}

TEST(Utils, Encoding)
{
    ASSERT_EQ ("", base64_encode(""));
    ASSERT_EQ ("aGVsbG8=", base64_encode("hello"));
    ASSERT_EQ ("e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", sha256_hex(""));
    ASSERT_EQ ("2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824", sha256_hex("hello"));

    std::string decoded;
    ASSERT_TRUE (base64_decode("aGVsbG8=", decoded));
    ASSERT_EQ ("hello", decoded);
    ASSERT_TRUE (base64_decode("aGk=", decoded));
    ASSERT_EQ ("hi", decoded);

    std::string png("\x89PNG\r\n\x1a\n\0\0", 10);
    ASSERT_TRUE (base64_decode(base64_encode(png), decoded));
    ASSERT_EQ (png, decoded);

    ASSERT_FALSE (base64_decode("abc", decoded));
    ASSERT_FALSE (base64_decode("a$c=", decoded));
}

TEST(Utils, Uuid)
{
    std::string a = generate_uuid();
    std::string b = generate_uuid();
    ASSERT_EQ (36u, a.size());
    ASSERT_EQ ('4', a[14]);
    ASSERT_EQ ('-', a[8]);
    ASSERT_NE (a, b);
}

TEST(Utils, Timestamps)
{
    ASSERT_EQ ("1970-01-01T00:00:00Z", format_timestamp(0));
    ASSERT_EQ ("2024-02-29T12:00:00Z", format_timestamp(1709208000));

    int64_t start = monotonic_ms();
    sleep_ms(10);
    ASSERT_GE (monotonic_ms() - start, 10);
}

TEST(Utils, FileHelpers)
{
    test::TempDir tmp;
    ASSERT_TRUE (ensure_directory(tmp.sub("a/b/c")));
    test::write_text(tmp.sub("a/b/c/f.txt"), "data");

    std::string content;
    ASSERT_TRUE (read_file(tmp.sub("a/b/c/f.txt"), content));
    ASSERT_EQ ("data", content);
    ASSERT_FALSE (read_file(tmp.sub("missing.txt"), content));

    ASSERT_TRUE (remove_tree(tmp.sub("a")));
    ASSERT_FALSE (read_file(tmp.sub("a/b/c/f.txt"), content));
}
