#include <gtest/gtest.h>

#include <sandkernel/core/url_fetcher.hpp>

#include "test_util.hpp"

using namespace sandkernel;

TEST(UrlFetcher, Scheme)
{
    ASSERT_EQ ("https", UrlFetcher::url_scheme("HTTPS://example.com/a.csv"));
    ASSERT_EQ ("http", UrlFetcher::url_scheme("http://example.com"));
    ASSERT_EQ ("file", UrlFetcher::url_scheme("file:///etc/passwd"));
    ASSERT_EQ ("", UrlFetcher::url_scheme("example.com/a.csv"));
}

TEST(UrlFetcher, InferFilename)
{
    ASSERT_EQ ("report 2024.xlsx",
               UrlFetcher::infer_filename("https://x.example/dl?id=3", "attachment; filename=\"report 2024.xlsx\""));
    ASSERT_EQ ("data.csv", UrlFetcher::infer_filename("https://x.example/dl", "attachment; filename=data.csv"));
    ASSERT_EQ ("sales.csv", UrlFetcher::infer_filename("https://x.example/files/sales.csv?token=abc#top", ""));
    ASSERT_EQ ("downloaded_file", UrlFetcher::infer_filename("https://x.example/api/export", ""));
    ASSERT_EQ ("downloaded_file", UrlFetcher::infer_filename("https://x.example", ""));
}

TEST(UrlFetcher, SanitizeFilename)
{
    ASSERT_EQ ("report_2024.xlsx", UrlFetcher::sanitize_filename("report 2024.xlsx"));
    ASSERT_EQ ("passwd", UrlFetcher::sanitize_filename("../../etc/passwd"));
    ASSERT_EQ ("evil.csv", UrlFetcher::sanitize_filename("C:\\temp\\evil.csv"));
    ASSERT_EQ ("a_b.json", UrlFetcher::sanitize_filename("a  &&  b.json"));
    ASSERT_EQ ("file", UrlFetcher::sanitize_filename(".."));
    ASSERT_EQ ("file", UrlFetcher::sanitize_filename("dir/"));
}

TEST(UrlFetcher, ExtensionAllowlist)
{
    ASSERT_TRUE (UrlFetcher::is_allowed_extension("data.CSV"));
    ASSERT_TRUE (UrlFetcher::is_allowed_extension("archive.tar.gz"));
    ASSERT_TRUE (UrlFetcher::is_allowed_extension("book.xlsx"));
    ASSERT_FALSE (UrlFetcher::is_allowed_extension("payload.exe"));
    ASSERT_FALSE (UrlFetcher::is_allowed_extension("script.py"));
    ASSERT_FALSE (UrlFetcher::is_allowed_extension("noextension"));
}

TEST(UrlFetcher, RejectsBeforeAnyTransfer)
{
    test::TempDir tmp;
    SandboxSettings settings = test::make_settings(tmp.path());
    PathGuard guard(settings);
    UrlFetcher fetcher(settings, guard);

    FetchResult r = fetcher.fetch("ftp://x.example/a.csv", "", "s1");
    ASSERT_FALSE (r.success);
    ASSERT_EQ ("Only http/https URLs are supported. Got: 'ftp'", r.error);

    r = fetcher.fetch("file:///etc/passwd", "", "s1");
    ASSERT_FALSE (r.success);

    r = fetcher.fetch("https://x.example/a.csv", "", "../s1");
    ASSERT_FALSE (r.success);

    r = fetcher.fetch("https://x.example/tool", "tool.exe", "s1");
    ASSERT_FALSE (r.success);
    ASSERT_EQ (0u, r.error.find("File extension '.exe' not allowed"));

    ASSERT_EQ (60, UrlFetcher::timeout_seconds());
    ASSERT_STREQ ("sandkernel/1.0", UrlFetcher::user_agent());
}
