#include <gtest/gtest.h>

#include <sandkernel/core/artifact_sweep.hpp>
#include <sandkernel/core/utils.hpp>

#include "test_util.hpp"

using namespace sandkernel;

namespace {

class FakeChartSurface : public ChartSurface {
public:
    FakeChartSurface() : pending(0), closed(0) {}

    void flush_pending_renders(std::vector<ChartImage>& out) override {
        for (int i = 0; i < pending; ++i) {
            ChartImage img;
            img.png = "\x89PNG fake";
            img.figure = 10 + i;
            img.source = "sweep";
            out.push_back(img);
        }
        pending = 0;
    }

    void close_all() override { ++closed; }

    int pending;
    int closed;
};

} // anonymous namespace

TEST(ArtifactSweep, ReportsNewAndModifiedFiles)
{
    test::TempDir tmp;
    test::write_text(tmp.sub("existing.csv"), "a\n");
    test::write_text(tmp.sub("untouched.csv"), "b\n");
    DirSnapshot before = DirSnapshot::take(tmp.path());
    ASSERT_EQ (2u, before.size());

    test::write_text(tmp.sub("existing.csv"), "a,b,c\n1,2,3\n");
    test::write_text(tmp.sub("out/result.json"), "{\"ok\": true}");

    ArtifactSweep sweep(1024 * 1024);
    std::vector<ArtifactFile> files = sweep.collect_files(tmp.path(), before);
    ASSERT_EQ (2u, files.size());

    ASSERT_EQ ("existing.csv", files[0].filename);
    ASSERT_FALSE (files[0].created);
    ASSERT_EQ ("a,b,c\n1,2,3\n", files[0].content);
    ASSERT_EQ (sha256_hex(files[0].content), files[0].sha256);

    ASSERT_EQ ("out/result.json", files[1].filename);
    ASSERT_TRUE (files[1].created);
    ASSERT_EQ (tmp.sub("out/result.json"), files[1].path);
    ASSERT_EQ (12, files[1].size);
}

TEST(ArtifactSweep, SkipsHiddenAndUnstorableFiles)
{
    test::TempDir tmp;
    DirSnapshot before = DirSnapshot::take(tmp.path());

    test::write_text(tmp.sub(".fetch-123.part"), "partial");
    test::write_text(tmp.sub("script.py"), "print(1)");
    test::write_text(tmp.sub("chart.PNG"), "png");

    ArtifactSweep sweep(1024);
    std::vector<ArtifactFile> files = sweep.collect_files(tmp.path(), before);
    ASSERT_EQ (1u, files.size());
    ASSERT_EQ ("chart.PNG", files[0].filename);

    ASSERT_TRUE (ArtifactSweep::is_storable("report.xlsx"));
    ASSERT_FALSE (ArtifactSweep::is_storable("run.sh"));
    ASSERT_FALSE (ArtifactSweep::is_storable("noext"));
}

TEST(ArtifactSweep, OversizedFilesAreListedWithoutContent)
{
    test::TempDir tmp;
    DirSnapshot before = DirSnapshot::take(tmp.path());
    test::write_text(tmp.sub("big.csv"), std::string(64, 'x'));

    ArtifactSweep sweep(16);
    std::vector<ArtifactFile> files = sweep.collect_files(tmp.path(), before);
    ASSERT_EQ (1u, files.size());
    ASSERT_TRUE (files[0].oversized);
    ASSERT_TRUE (files[0].content.empty());
    ASSERT_EQ (64, files[0].size);
}

TEST(ArtifactSweep, DrainsChartSurface)
{
    std::vector<ChartImage> charts(1);
    charts[0].source = "show";
    FakeChartSurface surface;
    surface.pending = 2;

    ArtifactSweep::drain_charts(surface, charts);

    ASSERT_EQ (3u, charts.size());
    ASSERT_EQ ("show", charts[0].source);
    ASSERT_EQ (1, charts[1].index);
    ASSERT_EQ (2, charts[2].index);
    ASSERT_EQ ("sweep", charts[2].source);
    ASSERT_EQ (1, surface.closed);
}

TEST(ArtifactSweep, EmptySurfaceStillCloses)
{
    std::vector<ChartImage> charts;
    FakeChartSurface surface;
    ArtifactSweep::drain_charts(surface, charts);
    ASSERT_TRUE (charts.empty());
    ASSERT_EQ (1, surface.closed);
}
