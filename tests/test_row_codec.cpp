#include "test_support.hpp"

#include "spotmap/io/RowCodec.hpp"

using namespace spotmap;

static const std::vector<std::string> kNative = {
    "Name", "label", "x", "y", "diameter", "scale", "colour", "mount_name", "material", "notes"};

// --- names -------------------------------------------------------------------

TEST(Name, JoinPadsId)
{
    EXPECT_EQ(joinName("S1", 7), "S1_#007");
    EXPECT_EQ(joinName("S1", 1234), "S1_#1234");
}

TEST(Name, SplitUsesLastMarker)
{
    std::string sample, id;
    splitName("rock_#a_#012", sample, id);
    EXPECT_EQ(sample, "rock_#a");
    EXPECT_EQ(id, "012");

    splitName("15", sample, id);
    EXPECT_EQ(sample, "");
    EXPECT_EQ(id, "15");
}

TEST(Name, InvertXIsInvolutive)
{
    EXPECT_DOUBLE_EQ(invertX(invertX(37.5, 640), 640), 37.5);
    static_assert(invertX(10, 100) == 90);
}

// --- native dialect ----------------------------------------------------------

TEST(NativeCodec, HeaderIsFixed)
{
    RowCodec c(NativeDialect{}, PointSettings{});
    EXPECT_EQ(c.exportHeader(), kNative);
}

TEST(NativeCodec, DecodesFullRow)
{
    RowCodec c(NativeDialect{}, PointSettings{});
    c.bind(kNative);
    const auto row = std::vector<std::string>{
        "S1_#004", "Spot", "120", "45", "20", "2.5", "#ff0000", "M1", "zircon", "rim"};
    const Point p = std::get<Point>(c.decode(row));
    EXPECT_EQ(p.id, 4);
    EXPECT_EQ(p.sample_name, "S1");
    EXPECT_EQ(p.label, Label::Spot);
    EXPECT_EQ(p.x, 120);
    EXPECT_EQ(p.y, 45);
    EXPECT_EQ(p.diameter, 20);
    EXPECT_DOUBLE_EQ(p.scale, 2.5);
    EXPECT_EQ(p.colour, "#ff0000");
    EXPECT_EQ(p.mount_name, "M1");
    EXPECT_EQ(p.material, "zircon");
    EXPECT_EQ(p.notes, "rim");
}

TEST(NativeCodec, EncodeThenDecodeKeepsPoint)
{
    RowCodec c(NativeDialect{}, PointSettings{});
    c.bind(kNative);
    Point p;
    p.id = 12;
    p.label = Label::Spot;
    p.x = -3;
    p.y = 800;
    p.diameter = 25;
    p.scale = 1.75;
    p.sample_name = "Sample A";
    p.notes = "";
    EXPECT_EQ(std::get<Point>(c.decode(c.encode(p))), p);
}

TEST(NativeCodec, AcceptsInstrumentSpellingAndIgnoresZ)
{
    RowCodec c(NativeDialect{}, PointSettings{});
    c.bind({"Name", "Type", "X", "Y", "Z"});
    const Point p = std::get<Point>(c.decode({"S_#2", "RefMark", "10", "20", "999"}));
    EXPECT_EQ(p.id, 2);
    EXPECT_EQ(p.label, Label::RefMark);
    EXPECT_EQ(p.x, 10);
    EXPECT_EQ(p.y, 20);
}

TEST(NativeCodec, MissingFieldsTakeSettings)
{
    PointSettings s;
    s.material = "apatite";
    s.diameter = 30;
    s.label = Label::Spot;
    RowCodec c(NativeDialect{}, s);
    c.bind({"x", "y", "diameter"});
    const Point p = std::get<Point>(c.decode({"1", "2", ""}));
    EXPECT_EQ(p.id, 0);
    EXPECT_EQ(p.material, "apatite");
    EXPECT_EQ(p.diameter, 30);
    EXPECT_EQ(p.label, Label::Spot);
}

TEST(NativeCodec, RealCoordinatesAreRounded)
{
    RowCodec c(NativeDialect{}, PointSettings{});
    c.bind({"x", "y"});
    const Point p = std::get<Point>(c.decode({"10.5", "-2.5"}));
    EXPECT_EQ(p.x, 11);
    EXPECT_EQ(p.y, -3);
}

TEST(NativeCodec, RejectsBadRows)
{
    RowCodec c(NativeDialect{}, PointSettings{});
    c.bind(kNative);
    EXPECT_SPOTMAP_ERROR(c.decode({"S_#1", "Spot", "abc", "1", "", "", "", "", "", ""}), MalformedRow);
    EXPECT_SPOTMAP_ERROR(c.decode({"S_#x", "Spot", "1", "1", "", "", "", "", "", ""}), MalformedRow);
    EXPECT_SPOTMAP_ERROR(c.decode({"S_#1", "Crater", "1", "1", "", "", "", "", "", ""}), InvalidLabel);
    EXPECT_SPOTMAP_ERROR(c.decode({"S_#1", "Spot", "1", "1", "-5", "", "", "", "", ""}), MalformedRow);
}

TEST(NativeCodec, BindNeedsCoordinates)
{
    RowCodec c(NativeDialect{}, PointSettings{});
    EXPECT_SPOTMAP_ERROR(c.bind({"Name", "label"}), MissingColumn);
}

// --- instrument dialect ------------------------------------------------------

static const std::vector<std::string> kInstrument = {
    "Particle ID", "Mineral Classification", "Area", "Laser Ablation Centre X", "Laser Ablation Centre Y"};

TEST(InstrumentCodec, DecodesAndInvertsX)
{
    RowCodec c(InstrumentDialect{InstrumentColumns{}, 1000}, PointSettings{});
    c.bind(kInstrument);

    const auto ref = std::get<InstrumentRow>(c.decode({"", "Fiducial", "", "900", "40"}));
    EXPECT_TRUE(ref.reference);
    EXPECT_FALSE(ref.id.has_value());
    EXPECT_DOUBLE_EQ(ref.position.x, 100.0);
    EXPECT_DOUBLE_EQ(ref.position.y, 40.0);

    const auto tgt = std::get<InstrumentRow>(c.decode({"17", "Zircon", "3.2", "250.5", "60"}));
    EXPECT_FALSE(tgt.reference);
    ASSERT_TRUE(tgt.id.has_value());
    EXPECT_EQ(*tgt.id, 17);
    EXPECT_DOUBLE_EQ(tgt.position.x, 749.5);
}

TEST(InstrumentCodec, TargetNeedsId)
{
    RowCodec c(InstrumentDialect{InstrumentColumns{}, 1000}, PointSettings{});
    c.bind(kInstrument);
    EXPECT_SPOTMAP_ERROR(c.decode({"", "Zircon", "", "1", "1"}), MalformedRow);
    EXPECT_SPOTMAP_ERROR(c.decode({"0", "Zircon", "", "1", "1"}), MalformedRow);
    EXPECT_SPOTMAP_ERROR(c.decode({"4", "Zircon", "", "n/a", "1"}), MalformedRow);
}

TEST(InstrumentCodec, MissingColumnsAreNamed)
{
    RowCodec c(InstrumentDialect{InstrumentColumns{}, 1000}, PointSettings{});
    try {
        c.bind({"Particle ID", "Laser Ablation Centre X"});
        FAIL() << "bind accepted an incomplete header";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::MissingColumn);
        EXPECT_NE(std::string(e.what()).find("Mineral Classification"), std::string::npos);
    }
}

TEST(InstrumentCodec, CustomColumnNames)
{
    InstrumentColumns cols;
    cols.id = "ID";
    cols.x = "PX";
    cols.y = "PY";
    cols.label = "Class";
    cols.reference_value = "REF";
    RowCodec c(InstrumentDialect{cols, 200}, PointSettings{});
    c.bind({"ID", "Class", "PX", "PY"});
    const auto r = std::get<InstrumentRow>(c.decode({"", "REF", "50", "5"}));
    EXPECT_TRUE(r.reference);
    EXPECT_DOUBLE_EQ(r.position.x, 150.0);
}

TEST(InstrumentCodec, EncodeCopiesRowAndRestoresConvention)
{
    RowCodec c(InstrumentDialect{InstrumentColumns{}, 1000}, PointSettings{});
    c.bind(kInstrument);
    const std::vector<std::string> src = {"17", "Zircon", "3.2", "250.5", "60"};
    Point p;
    p.x = 300;
    p.y = 70;
    const auto out = c.encode(p, src);
    EXPECT_EQ(c.exportHeader(kInstrument), kInstrument);
    EXPECT_EQ(out, (std::vector<std::string>{"17", "Zircon", "3.2", "700", "70"}));
}

TEST(NativeCodec, CoordinateOutsideIntRangeIsMalformed)
{
    RowCodec c(NativeDialect{}, PointSettings{});
    c.bind({"Name", "label", "x", "y"});
    EXPECT_SPOTMAP_ERROR(c.decode({"S_#001", "Spot", "1e10", "5"}), MalformedRow);
    EXPECT_SPOTMAP_ERROR(c.decode({"S_#001", "Spot", "5", "-3e9"}), MalformedRow);
    EXPECT_EQ(std::get<Point>(c.decode({"S_#001", "Spot", "2147483647", "-2147483648"})).x, 2147483647);
}
