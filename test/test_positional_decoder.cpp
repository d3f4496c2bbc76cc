#include "positional_decoder.hpp"
#include "placelist_error.hpp"

#include <gtest/gtest.h>

using namespace placelist;

static GoogleMapsListData Decode(const std::string &json, DecodeDiagnostics *diagnostics = nullptr) {
	auto root = ParsePayload(json, 64);
	return DecodePlaceList(*root, diagnostics);
}

static PlaceListErrorType DecodeErrorType(const std::string &json) {
	try {
		Decode(json);
	} catch (PlaceListException &ex) {
		return ex.GetType();
	}
	return PlaceListErrorType::NONE;
}

TEST(PositionalDecoderTest, DecodesCompleteList) {
	auto list = Decode(R"([null,null,[0,0,"https://www.google.com/maps/placelists/list/abc"],["Jane"],"My List","A description",0,0,
		[[null,[0,0,0,0,"123 Main St",[0,0,40.1,-3.7]],"Cafe","Nice coffee"]]])");

	EXPECT_EQ(list.Name(), "My List");
	EXPECT_EQ(list.Description(), "A description");
	EXPECT_EQ(list.Creator(), "Jane");
	ASSERT_EQ(list.Places().size(), 1u);

	const GoogleMapsPlace &place = list.Places()[0];
	EXPECT_EQ(place.name, "Cafe");
	EXPECT_EQ(place.address, "123 Main St");
	EXPECT_EQ(place.notes, "Nice coffee");
	ASSERT_TRUE(place.has_coordinates);
	EXPECT_DOUBLE_EQ(place.latitude, 40.1);
	EXPECT_DOUBLE_EQ(place.longitude, -3.7);
}

TEST(PositionalDecoderTest, KeepsPlaceOrderAndDropsNamelessEntries) {
	DecodeDiagnostics diagnostics;
	auto list = Decode(R"([0,0,0,0,"Trip",null,0,0,[
		[null,null,"First"],
		["x","x"],
		[null,null,null,"notes without a name"],
		[null,null,"   "],
		"not an entry",
		[null,null,"Second",null]
	]])",
	                   &diagnostics);

	ASSERT_EQ(list.Places().size(), 2u);
	EXPECT_EQ(list.Places()[0].name, "First");
	EXPECT_EQ(list.Places()[1].name, "Second");
	EXPECT_EQ(diagnostics.dropped_places, 4u);
	EXPECT_EQ(diagnostics.places_without_coordinates, 2u);
	bool reported_type = false;
	for (const auto &message : diagnostics.messages) {
		if (message.find("expected array, got string") != std::string::npos) {
			reported_type = true;
		}
	}
	EXPECT_TRUE(reported_type);
}

TEST(PositionalDecoderTest, CoordinatesNeedBothNumbers) {
	auto list = Decode(R"([0,0,0,0,"Coords",0,0,0,[
		[null,[0,0,0,0,"a",[0,0,40.1]],"LatitudeOnly"],
		[null,[0,0,0,0,"b",[0,0,"40.1",-3.7]],"StringLatitude"],
		[null,[0,0,0,0,"c",null],"NullBlock"],
		[null,[0,0,0,0,"d",[0,0,0,0]],"Origin"]
	]])");

	ASSERT_EQ(list.Places().size(), 4u);
	EXPECT_FALSE(list.Places()[0].has_coordinates);
	EXPECT_FALSE(list.Places()[1].has_coordinates);
	EXPECT_FALSE(list.Places()[2].has_coordinates);
	EXPECT_EQ(list.Places()[2].address, "c");

	// Zero is a real coordinate, not an absent one
	ASSERT_TRUE(list.Places()[3].has_coordinates);
	EXPECT_DOUBLE_EQ(list.Places()[3].latitude, 0.0);
	EXPECT_DOUBLE_EQ(list.Places()[3].longitude, 0.0);
}

TEST(PositionalDecoderTest, MissingOrBlankNameIsRequiredFieldMissing) {
	EXPECT_EQ(DecodeErrorType(R"([0,0,0,["Jane"]])"), PlaceListErrorType::REQUIRED_FIELD_MISSING);
	EXPECT_EQ(DecodeErrorType(R"([0,0,0,["Jane"],null])"), PlaceListErrorType::REQUIRED_FIELD_MISSING);
	EXPECT_EQ(DecodeErrorType(R"([0,0,0,["Jane"],""])"), PlaceListErrorType::REQUIRED_FIELD_MISSING);
	EXPECT_EQ(DecodeErrorType(R"([0,0,0,["Jane"],"  \t\n"])"), PlaceListErrorType::REQUIRED_FIELD_MISSING);
	EXPECT_EQ(DecodeErrorType(R"([0,0,0,["Jane"],["Trip"]])"), PlaceListErrorType::REQUIRED_FIELD_MISSING);
}

TEST(PositionalDecoderTest, OptionalListFieldsMayBeAbsent) {
	auto list = Decode(R"([0,0,0,"not a creator block","Bare",42])");
	EXPECT_EQ(list.Name(), "Bare");
	EXPECT_EQ(list.Description(), "");
	EXPECT_EQ(list.Creator(), "");
	EXPECT_TRUE(list.Places().empty());

	auto with_empty_places = Decode(R"([0,0,0,[],"Empty",null,0,0,[]])");
	EXPECT_EQ(with_empty_places.Creator(), "");
	EXPECT_TRUE(with_empty_places.Places().empty());
}

TEST(PositionalDecoderTest, OptionalPlaceFieldsWithWrongTypesAreEmpty) {
	auto list = Decode(R"([0,0,0,0,"Trip",0,0,0,[[7,"no location block","Name",false]]])");
	ASSERT_EQ(list.Places().size(), 1u);
	const GoogleMapsPlace &place = list.Places()[0];
	EXPECT_EQ(place.name, "Name");
	EXPECT_EQ(place.address, "");
	EXPECT_EQ(place.notes, "");
	EXPECT_FALSE(place.has_coordinates);
}

TEST(PositionalDecoderTest, DecodingIsDeterministic) {
	const std::string json = R"([0,0,0,["Jane"],"Trip","d",0,0,[[null,[0,0,0,0,"a",[0,0,1.5,2.5]],"A","n"],[null,null,"B"]]])";
	auto root = ParsePayload(json, 64);
	EXPECT_EQ(DecodePlaceList(*root), DecodePlaceList(*root));
	EXPECT_EQ(DecodePlaceList(*root), Decode(json));
}

TEST(PositionalDecoderTest, DecodePlaceResetsOutput) {
	auto entry = ParsePayload(R"([null,null,"Plain"])", 8);
	GoogleMapsPlace place;
	place.notes = "stale";
	place.SetCoordinates(1, 2);
	ASSERT_TRUE(DecodePlace(*entry, place));
	EXPECT_EQ(place.name, "Plain");
	EXPECT_EQ(place.notes, "");
	EXPECT_FALSE(place.has_coordinates);
}

TEST(PositionalDecoderTest, TryGetAccessors) {
	auto array = ParsePayload(R"(["s",1.25,[1],null])", 8);
	std::string text;
	double number = 0;

	EXPECT_TRUE(TryGetString(*array, 0, text));
	EXPECT_EQ(text, "s");
	EXPECT_FALSE(TryGetString(*array, 1, text));
	EXPECT_FALSE(TryGetString(*array, 9, text));

	EXPECT_TRUE(TryGetNumber(*array, 1, number));
	EXPECT_DOUBLE_EQ(number, 1.25);
	EXPECT_FALSE(TryGetNumber(*array, 3, number));

	EXPECT_NE(TryGetArray(*array, 2), nullptr);
	EXPECT_EQ(TryGetArray(*array, 0), nullptr);
	EXPECT_EQ(TryGetArray(*array, 4), nullptr);
}
