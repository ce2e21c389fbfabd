#include "test_support.hpp"

#include "spotmap/io/PointsFile.hpp"

using namespace spotmap;

using PointsFileTest = TempDirTest;

static const char* kHeader = "Name,label,x,y,diameter,scale,colour,mount_name,material,notes\n";

TEST_F(PointsFileTest, WriteUsesNativeLayout)
{
    Point p;
    p.id = 3;
    p.label = Label::Spot;
    p.x = 120;
    p.y = 45;
    p.sample_name = "S1";
    p.notes = "rim, inner";
    writePointsCsv(path("out.csv"), {p});
    EXPECT_EQ(read("out.csv"),
              "Name,label,x,y,diameter,scale,colour,mount_name,material,notes\r\n"
              "S1_#003,Spot,120,45,10,1.0,#ffff00,None,None,\"rim, inner\"\r\n");
}

TEST_F(PointsFileTest, SaveThenLoadRebuildsRegistry)
{
    PointRegistry a;
    PointSettings s;
    for (int i = 0; i < 4; ++i) {
        Point p = s.makePoint(10 * i, 5 * i);
        p.sample_name = "Sample, \"quoted\"";
        p.label = i < 3 ? Label::RefMark : Label::Spot;
        a.add(p);
    }
    a.remove(2);
    writePointsCsv(path("s.csv"), a.points());

    PointRegistry b;
    const ImportReport rep = loadPointsCsv(path("s.csv"), s, b);
    EXPECT_EQ(rep.rows, 3u);
    EXPECT_EQ(rep.skipped, 0u);
    EXPECT_EQ(b.points(), a.points());
    EXPECT_EQ(b.nextId(), 5);
}

TEST_F(PointsFileTest, BadRowsAreSkippedAndReported)
{
    const auto f = write("in.csv", std::string(kHeader) +
        "S_#001,RefMark,1,1,10,1.0,#ffff00,M,Z,n\n"
        "S_#002,RefMark,oops,1,10,1.0,#ffff00,M,Z,n\n"
        "S_#003,Crater,1,1,10,1.0,#ffff00,M,Z,n\n"
        "S_#004,Spot,4,4,10,1.0,#ffff00,M,Z,n\n");
    const ImportReport rep = readPointsCsv(f, PointSettings{});
    EXPECT_EQ(rep.rows, 4u);
    EXPECT_EQ(rep.skipped, 2u);
    ASSERT_EQ(rep.points.size(), 2u);
    EXPECT_EQ(rep.points[1].id, 4);
    ASSERT_EQ(rep.messages.size(), 2u);
    EXPECT_NE(rep.messages[0].find("line 3"), std::string::npos);
    EXPECT_NE(rep.messages[1].find("line 4"), std::string::npos);
}

TEST_F(PointsFileTest, AllRowsBadIsMalformed)
{
    const auto f = write("in.csv", std::string(kHeader) + "S_#001,RefMark,a,b,10,1.0,,,,\n");
    PointRegistry r;
    EXPECT_SPOTMAP_ERROR(loadPointsCsv(f, PointSettings{}, r), MalformedRow);
    EXPECT_TRUE(r.empty());
}

TEST_F(PointsFileTest, HeaderOnlyFileIsEmptyImport)
{
    const auto f = write("in.csv", kHeader);
    PointRegistry r;
    const ImportReport rep = loadPointsCsv(f, PointSettings{}, r);
    EXPECT_EQ(rep.rows, 0u);
    EXPECT_TRUE(r.empty());
}

TEST_F(PointsFileTest, DuplicateIdsAreSkippedOnLoad)
{
    PointRegistry r;
    r.add(PointSettings{}.makePoint(0, 0));   // id 1
    const auto f = write("in.csv", std::string(kHeader) +
        "S_#001,Spot,5,5,10,1.0,,,,\n"
        "S_#002,Spot,6,6,10,1.0,,,,\n");
    const ImportReport rep = loadPointsCsv(f, PointSettings{}, r);
    EXPECT_EQ(rep.skipped, 1u);
    ASSERT_EQ(rep.points.size(), 1u);
    EXPECT_EQ(rep.points[0].id, 2);
    EXPECT_EQ(r.size(), 2u);
    EXPECT_EQ(r.lookup(1).x, 0);
}

TEST_F(PointsFileTest, RowsWithoutIdGetFreshIds)
{
    const auto f = write("in.csv", "Type,X,Y,Z\nSpot,10,20,0\nRefMark,30,40,0\n");
    PointRegistry r;
    loadPointsCsv(f, PointSettings{}, r);
    ASSERT_EQ(r.size(), 2u);
    EXPECT_EQ(r.points()[0].id, 1);
    EXPECT_EQ(r.points()[1].id, 2);
    EXPECT_EQ(r.points()[1].label, Label::RefMark);
}

TEST_F(PointsFileTest, MissingFileAndColumns)
{
    PointRegistry r;
    EXPECT_SPOTMAP_ERROR(loadPointsCsv(path("none.csv"), PointSettings{}, r), FileAccessError);
    const auto f = write("in.csv", "Name,label\nS_#001,Spot\n");
    EXPECT_SPOTMAP_ERROR(loadPointsCsv(f, PointSettings{}, r), MissingColumn);
}
