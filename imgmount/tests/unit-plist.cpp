#include "doctest_compatibility.h"

#include "imgmount/plist.hpp"

#include <string_view>

using namespace std::string_view_literals;

static constexpr auto PLIST_DOCUMENT_TEST = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE plist PUBLIC "-//Apple//DTD PLIST 1.0//EN" "http://www.apple.com/DTDs/PropertyList-1.0.dtd">
<plist version="1.0">
<dict>
	<!-- produced by hand -->
	<key>Checksum Type</key>
	<string>CRC32</string>
	<key>Size Information</key>
	<dict>
		<key>Total Bytes</key>
		<integer>104857600</integer>
		<key>Compressed Ratio</key>
		<real>1</real>
	</dict>
	<key>Resize limits</key>
	<array>
		<integer>0</integer>
		<integer>-1</integer>
	</array>
	<key>Software License Agreement</key>
	<false/>
	<key>Encrypted</key>
	<true/>
	<key>Empty</key>
	<string/>
	<key>Escaped</key>
	<string>Tom &amp; Jerry &lt;3</string>
</dict>
</plist>
)"sv;

TEST_CASE("plist parser test")
{
    SECTION("full document")
    {
        const auto& root = imgmount::plist::parse(PLIST_DOCUMENT_TEST);
        REQUIRE(root.has_value());
        REQUIRE_EQ(root->type, imgmount::plist::NodeType::Dict);
        REQUIRE_EQ(root->keys.size(), 7);

        const auto* checksum = root->find("Checksum Type"sv);
        REQUIRE(checksum != nullptr);
        REQUIRE_EQ(checksum->as_string(), "CRC32"sv);

        const auto* size_info = root->find("Size Information"sv);
        REQUIRE(size_info != nullptr);
        REQUIRE_EQ(size_info->find("Total Bytes"sv)->as_integer(), 104857600);
        REQUIRE_EQ(size_info->find("Compressed Ratio"sv)->type, imgmount::plist::NodeType::Real);
        REQUIRE_FALSE(size_info->find("Compressed Ratio"sv)->as_integer().has_value());

        const auto* limits = root->find("Resize limits"sv);
        REQUIRE(limits != nullptr);
        REQUIRE_EQ(limits->type, imgmount::plist::NodeType::Array);
        REQUIRE_EQ(limits->children.size(), 2);
        REQUIRE_EQ(limits->children[1].as_integer(), -1);

        REQUIRE_EQ(root->find("Software License Agreement"sv)->value, "false");
        REQUIRE_EQ(root->find("Encrypted"sv)->value, "true");
        REQUIRE_EQ(root->find("Empty"sv)->as_string(), ""sv);
        REQUIRE_EQ(root->find("Escaped"sv)->as_string(), "Tom & Jerry <3"sv);
        REQUIRE(root->find("Missing"sv) == nullptr);
    }
    SECTION("leading noise is skipped")
    {
        const auto& root = imgmount::plist::parse("hdiutil: attach: WARNING: ignoring IDME options (obsolete)\n<plist version=\"1.0\"><array><string>a</string></array></plist>"sv);
        REQUIRE(root.has_value());
        REQUIRE_EQ(root->children.size(), 1);
        REQUIRE(root->find("a"sv) == nullptr);
    }
    SECTION("malformed documents")
    {
        REQUIRE_FALSE(imgmount::plist::parse(""sv).has_value());
        REQUIRE_FALSE(imgmount::plist::parse("hdiutil: imageinfo failed - not recognized"sv).has_value());
        REQUIRE_FALSE(imgmount::plist::parse("<plist version=\"1.0\"><dict><key>a</key><string>b</string>"sv).has_value());
        REQUIRE_FALSE(imgmount::plist::parse("<plist version=\"1.0\"><dict><string>b</string></dict></plist>"sv).has_value());
        REQUIRE_FALSE(imgmount::plist::parse("<plist version=\"1.0\"><dict><key>a</key><blob/></dict></plist>"sv).has_value());
        REQUIRE_FALSE(imgmount::plist::parse("<plist version=\"1.0\"><string>unterminated</plist>"sv).has_value());
    }
}
