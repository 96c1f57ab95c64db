#include <cmath>

#include "geometry.hpp"
#include "path_data.hpp"
#include "test_helpers.hpp"

TEST(PathDataTest, ParsesCommands)
{
	const path_data d("M26,34 L74 50 L26 66 Z");
	ASSERT_EQ(4u, d.commands().size());
	EXPECT_EQ('M', d.commands()[0].op);
	EXPECT_EQ('Z', d.commands()[3].op);
	EXPECT_TRUE(d.commands()[3].args.empty());
	EXPECT_EQ("M26 34 L74 50 L26 66 Z", d.to_string());
}

TEST(PathDataTest, ExpandsImplicitRepeats)
{
	EXPECT_EQ("M0 0 L10 10 L20 0", path_data("M0 0 10 10 20 0").to_string());
	EXPECT_EQ("M5 5 l1 1 l2 2", path_data("m5 5 1 1 2 2").to_string());
	EXPECT_EQ("M0 0 C1 2 3 4 5 6 C7 8 9 10 11 12", path_data("M0 0C1 2 3 4 5 6 7 8 9 10 11 12").to_string());
}

TEST(PathDataTest, ReadsCompactNumbersAndArcFlags)
{
	EXPECT_EQ("M10 -5 L0.5 0.5", path_data("M10-5L.5.5").to_string());
	EXPECT_EQ("M0 0 A5 5 0 1 0 10 0", path_data("M0 0A5 5 0 1010 0").to_string());
}

TEST(PathDataTest, RejectsMalformedData)
{
	EXPECT_THROW(path_data("L0 0"), validation_failure_exception);
	EXPECT_THROW(path_data("M0 0 L10"), validation_failure_exception);
	EXPECT_THROW(path_data("M0 0 X1 1"), validation_failure_exception);
	EXPECT_THROW(path_data("10 10"), validation_failure_exception);
	EXPECT_THROW(path_data("M0 0 A5 5 0 2 0 10 0"), validation_failure_exception);
	EXPECT_THROW(path_data("M0 0 Lfoo"), validation_failure_exception);
	EXPECT_THROW(path_data("M0x10 0"), validation_failure_exception);
	EXPECT_THROW(path_data("M0 0 Linf 0"), validation_failure_exception);
	EXPECT_THROW(path_data("M0 0 L-"), validation_failure_exception);
	EXPECT_THROW(path_data("M0 0 \xc3\xa9 1"), validation_failure_exception);
}

TEST(PathDataTest, ReadsExponents)
{
	EXPECT_EQ("M0.001 -250 L2 3", path_data("M1e-3-2.5E2L2e0 3").to_string());
}

TEST(PathDataTest, BoundingBoxOfLines)
{
	const bounds b = path_data("M10 20 h30 v-15 L5 50 z").bounding_box();
	EXPECT_DOUBLE_EQ(5.0, b.x1());
	EXPECT_DOUBLE_EQ(5.0, b.y1());
	EXPECT_DOUBLE_EQ(40.0, b.x2());
	EXPECT_DOUBLE_EQ(50.0, b.y2());
}

TEST(PathDataTest, BoundingBoxIncludesControlPoints)
{
	const bounds b = path_data("M0 0 C0 -10 20 -10 20 0").bounding_box();
	EXPECT_DOUBLE_EQ(-10.0, b.y1());
	EXPECT_DOUBLE_EQ(20.0, b.x2());
}

TEST(PathDataTest, BoundingBoxOfArcIsExact)
{
	//upper half of the circle of radius 10 around (50,50).
	const bounds upper = path_data("M40 50 A10 10 0 0 1 60 50").bounding_box();
	EXPECT_NEAR(40.0, upper.x1(), 1e-9);
	EXPECT_NEAR(40.0, upper.y1(), 1e-9);
	EXPECT_NEAR(60.0, upper.x2(), 1e-9);
	EXPECT_NEAR(50.0, upper.y2(), 1e-9);

	//the other sweep direction covers the lower half.
	const bounds lower = path_data("M40 50 A10 10 0 0 0 60 50").bounding_box();
	EXPECT_NEAR(50.0, lower.y1(), 1e-9);
	EXPECT_NEAR(60.0, lower.y2(), 1e-9);

	//quarter arc from east to north.
	const bounds quarter = path_data("M60 50 A10 10 0 0 0 50 40").bounding_box();
	EXPECT_NEAR(50.0, quarter.x1(), 1e-9);
	EXPECT_NEAR(40.0, quarter.y1(), 1e-9);
	EXPECT_NEAR(60.0, quarter.x2(), 1e-9);
	EXPECT_NEAR(50.0, quarter.y2(), 1e-9);
}

TEST(PathDataTest, TransformsAbsoluteAndRelativeCoordinates)
{
	const scale_transform t(2.0, 3.0, 10.0, 20.0);
	EXPECT_EQ("M10 20 l2 3 H30 v6", path_data("M0 0 l1 1 H10 v2").transformed(t).to_string());
	EXPECT_EQ("M10 20 A4 6 0 0 1 30 20", path_data("M0 0 A2 2 0 0 1 10 0").transformed(t).to_string());
}

TEST(PathDataTest, UnevenScaleOfRotatedArcs)
{
	//a quarter turn swaps the axes the radii lie on.
	const scale_transform wide(2.0, 1.0);
	EXPECT_EQ("M20 0 A20 20 90 0 1 20 40", path_data("M10 0 A20 10 90 0 1 10 40").transformed(wide).to_string());
	EXPECT_EQ("M0 0 A40 10 180 0 1 20 0", path_data("M0 0 A20 10 180 0 1 10 0").transformed(wide).to_string());

	//a rotated circle becomes an axis aligned ellipse.
	const path_data circle = path_data("M0 0 A10 10 45 0 1 10 0").transformed(wide);
	EXPECT_NEAR(20.0, circle.commands()[1].args[0], 1e-9);
	EXPECT_NEAR(10.0, circle.commands()[1].args[1], 1e-9);
	EXPECT_NEAR(0.0, circle.commands()[1].args[2], 1e-9);

	//any other rotation: the scaled path covers the scaled box.
	const char* const Arcs[] = {
		"M0 0 A20 10 45 1 1 10 10",
		"M5 5 A30 8 -30 1 0 20 -4",
		"M0 0 a12 4 120 1 1 6 2",
	};

	for(int n = 0; n != sizeof(Arcs)/sizeof(*Arcs); ++n) {
		const bounds before = path_data(Arcs[n]).bounding_box();
		const bounds after = path_data(Arcs[n]).transformed(scale_transform(2.0, 0.5, 3.0, 1.0)).bounding_box();
		EXPECT_NEAR(before.x1()*2.0 + 3.0, after.x1(), 1e-6) << Arcs[n];
		EXPECT_NEAR(before.y1()*0.5 + 1.0, after.y1(), 1e-6) << Arcs[n];
		EXPECT_NEAR(before.x2()*2.0 + 3.0, after.x2(), 1e-6) << Arcs[n];
		EXPECT_NEAR(before.y2()*0.5 + 1.0, after.y2(), 1e-6) << Arcs[n];
	}
}

TEST(PathDataTest, RejectsMirroringTransforms)
{
	EXPECT_THROW(path_data("M0 0 L1 1").transformed(scale_transform(-1.0, 1.0)), validation_failure_exception);
}

TEST(PathDataTest, BuildsFromCommands)
{
	path_data d;
	std::vector<double> args;
	args.push_back(1.0);
	args.push_back(2.0);
	EXPECT_THROW(d.add_command('L', args), validation_failure_exception);

	d.add_command('M', args);
	d.add_command('L', args);
	EXPECT_EQ(path_data("M1 2 L1 2"), d);
	EXPECT_THROW(d.add_command('C', args), validation_failure_exception);
}
