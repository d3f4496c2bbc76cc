#include "signature_search.hpp"
#include "placelist_error.hpp"

#include <gtest/gtest.h>

using namespace placelist;

static const std::string MARKER = PLACELIST_SHARE_URL_MARKER;

TEST(SignatureSearchTest, RootCanBeTheMatch) {
	auto root = ParsePayload(R"([null,null,[0,0,"https://www.google.com/maps/placelists/list/abc"],["Jane"],"My List"])", 64);
	EXPECT_EQ(FindSignatureMatch(*root, MARKER, 64), root.get());
}

TEST(SignatureSearchTest, FindsMatchBelowDecoys) {
	// The list sits five levels below the root. The levels above carry decoys with the
	// right shape but a different URL, or the marker at the wrong offset.
	auto root = ParsePayload(R"([
		[0,0,[0,0,"https://example.com/not-a-list"]],
		[null, [
			["https://www.google.com/maps/placelists/list/wrong-offset"],
			[0,[1,2,"https://www.google.com/maps/placelists/list/wrong-depth"]],
			["x", [
				[0,0,[0,"https://www.google.com/maps/placelists/list/offset-one"]],
				[null,null,[0,0,"https://www.google.com/maps/placelists/list/deep"],["Jane"],"Deep List"]
			]]
		]]
	])", 64);

	const PayloadNode *match = FindSignatureMatch(*root, MARKER, 64);
	ASSERT_NE(match, nullptr);
	EXPECT_EQ(match->At(4)->GetString(), "Deep List");

	// root -> [1] -> [1] -> [2] -> [1] -> [1]
	const PayloadNode *expected = root->At(1)->At(1)->At(2)->At(1)->At(1);
	EXPECT_EQ(match, expected);
}

TEST(SignatureSearchTest, NotFoundWhenNothingMatches) {
	auto root = ParsePayload(R"([[0,0,[0,0,"https://www.google.com/maps/place/abc"]],{"a":[1,2,3]},"https://www.google.com/maps/placelists/list/abc"])", 64);
	EXPECT_EQ(FindSignatureMatch(*root, MARKER, 64), nullptr);

	auto scalar = ParsePayload(R"("https://www.google.com/maps/placelists/list/abc")", 64);
	EXPECT_EQ(FindSignatureMatch(*scalar, MARKER, 64), nullptr);
}

TEST(SignatureSearchTest, FirstMatchWinsDepthFirst) {
	// The first child subtree matches deep, the second matches shallow: pre-order wins
	auto root = ParsePayload(R"([
		[[[null,null,[0,0,"https://www.google.com/maps/placelists/list/first"],null,"First"]]],
		[null,null,[0,0,"https://www.google.com/maps/placelists/list/second"],null,"Second"]
	])", 64);
	const PayloadNode *match = FindSignatureMatch(*root, MARKER, 64);
	ASSERT_NE(match, nullptr);
	EXPECT_EQ(match->At(4)->GetString(), "First");
}

TEST(SignatureSearchTest, ParentMatchIsCheckedBeforeChildren) {
	auto root = ParsePayload(R"([
		[null,null,[0,0,"https://www.google.com/maps/placelists/list/outer"],null,"Outer",
			[null,null,[0,0,"https://www.google.com/maps/placelists/list/inner"],null,"Inner"]]
	])", 64);
	const PayloadNode *match = FindSignatureMatch(*root, MARKER, 64);
	ASSERT_NE(match, nullptr);
	EXPECT_EQ(match->At(4)->GetString(), "Outer");
}

TEST(SignatureSearchTest, SearchesInsideObjects) {
	auto root = ParsePayload(R"({"meta":{"v":1},"data":[{"list":[null,null,[0,0,"https://www.google.com/maps/placelists/list/obj"],null,"Object List"]}]})", 64);
	const PayloadNode *match = FindSignatureMatch(*root, MARKER, 64);
	ASSERT_NE(match, nullptr);
	EXPECT_EQ(match->At(4)->GetString(), "Object List");
}

TEST(SignatureSearchTest, MatchesSignatureNeedsStringAtOffset) {
	EXPECT_FALSE(MatchesSignature(*ParsePayload("[0,0,[0,0,42]]", 8), MARKER));
	EXPECT_FALSE(MatchesSignature(*ParsePayload("[0,0,[0,0]]", 8), MARKER));
	EXPECT_FALSE(MatchesSignature(*ParsePayload(R"([0,0,"https://www.google.com/maps/placelists/list/"])", 8), MARKER));
	EXPECT_TRUE(MatchesSignature(*ParsePayload(R"([0,0,[0,0,"see https://www.google.com/maps/placelists/list/q?x=1"]])", 8), MARKER));
}

TEST(SignatureSearchTest, DepthLimitIsEnforced) {
	std::vector<PayloadNodePtr> inner;
	inner.push_back(PayloadNode::Number(1));
	PayloadNodePtr node = PayloadNode::Array(std::move(inner));
	for (int i = 0; i < 20; i++) {
		std::vector<PayloadNodePtr> wrapper;
		wrapper.push_back(std::move(node));
		node = PayloadNode::Array(std::move(wrapper));
	}
	// 21 nested arrays
	EXPECT_EQ(FindSignatureMatch(*node, MARKER, 21), nullptr);
	try {
		FindSignatureMatch(*node, MARKER, 20);
		FAIL() << "expected STRUCTURE_TOO_DEEP";
	} catch (PlaceListException &ex) {
		EXPECT_EQ(ex.GetType(), PlaceListErrorType::STRUCTURE_TOO_DEEP);
	}
}

TEST(SignatureSearchTest, CollectsMarkerStringsInTraversalOrder) {
	auto root = ParsePayload(R"([
		"https://www.google.com/maps/placelists/list/a",
		[1, {"k": "prefix https://www.google.com/maps/placelists/list/b"}],
		"https://www.google.com/maps/place/c",
		["https://www.google.com/maps/placelists/list/d"]
	])", 64);
	std::vector<const PayloadNode *> found;
	CollectMarkerStrings(*root, MARKER, 64, found);
	ASSERT_EQ(found.size(), 3u);
	EXPECT_EQ(found[0]->GetString(), "https://www.google.com/maps/placelists/list/a");
	EXPECT_EQ(found[1]->GetString(), "prefix https://www.google.com/maps/placelists/list/b");
	EXPECT_EQ(found[2]->GetString(), "https://www.google.com/maps/placelists/list/d");
}
