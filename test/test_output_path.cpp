#include "output_path.hpp"

#include <gtest/gtest.h>

using namespace placelist;

TEST(OutputPathTest, SanitizesFileNames) {
	EXPECT_EQ(SanitizeFileName("My List"), "My List");
	EXPECT_EQ(SanitizeFileName("Rome: Day 1/2"), "Rome_ Day 1_2");
	EXPECT_EQ(SanitizeFileName("a<b>c\"d\\e|f?g*h"), "a_b_c_d_e_f_g_h");
	EXPECT_EQ(SanitizeFileName("tab\there"), "tab_here");
	EXPECT_EQ(SanitizeFileName("  ?Trip?  "), "Trip");
	EXPECT_EQ(SanitizeFileName("Caf\xC3\xA9"), "Caf\xC3\xA9");
}

TEST(OutputPathTest, SanitizeFallsBackToDefaultName) {
	EXPECT_EQ(SanitizeFileName(""), "GoogleMapsList");
	EXPECT_EQ(SanitizeFileName("   "), "GoogleMapsList");
	EXPECT_EQ(SanitizeFileName("???"), "GoogleMapsList");
}

TEST(OutputPathTest, DerivesPathFromListName) {
	EXPECT_EQ(ResolveOutputPath("", "My List", "/work"), "/work/My List.kml");
	EXPECT_EQ(ResolveOutputPath("", "Paris/Food", "/work/"), "/work/Paris_Food.kml");
	EXPECT_EQ(ResolveOutputPath("", "Saved.KML", "/work"), "/work/Saved.KML");
	EXPECT_EQ(ResolveOutputPath("   ", "", "/work"), "/work/GoogleMapsList.kml");
}

TEST(OutputPathTest, RequestedPathWins) {
	EXPECT_EQ(ResolveOutputPath("/tmp/out.kml", "My List", "/work"), "/tmp/out.kml");
	EXPECT_EQ(ResolveOutputPath("exports/out.kml", "My List", "/work"), "/work/exports/out.kml");
	EXPECT_EQ(ResolveOutputPath("./out.kml", "My List", "/work"), "/work/out.kml");
	EXPECT_EQ(ResolveOutputPath("C:\\maps\\out.kml", "My List", "/work"), "C:\\maps\\out.kml");
	EXPECT_EQ(ResolveOutputPath("out.kml", "My List", ""), "out.kml");
}

TEST(OutputPathTest, ParentDirectory) {
	EXPECT_EQ(ParentDirectory("/work/exports/out.kml"), "/work/exports");
	EXPECT_EQ(ParentDirectory("out.kml"), "");
	EXPECT_EQ(ParentDirectory("/out.kml"), "");
}
