#include "doctest_compatibility.h"

#include "fake_host.hpp"

#include "imgmount/hdiutil.hpp"
#include "imgmount/logger.hpp"

#include <string_view>

using namespace std::string_view_literals;

static constexpr auto IMAGEINFO_GPT_TEST = R"(<?xml version="1.0" encoding="UTF-8"?>
<!DOCTYPE plist PUBLIC "-//Apple//DTD PLIST 1.0//EN" "http://www.apple.com/DTDs/PropertyList-1.0.dtd">
<plist version="1.0">
<dict>
	<key>Format</key>
	<string>RAW*</string>
	<key>partitions</key>
	<dict>
		<key>block-size</key>
		<integer>512</integer>
		<key>partition-scheme</key>
		<string>GUID</string>
		<key>partitions</key>
		<array>
			<dict>
				<key>partition-hint</key>
				<string>MBR</string>
				<key>partition-length</key>
				<integer>1</integer>
				<key>partition-name</key>
				<string>Protective Master Boot Record</string>
				<key>partition-start</key>
				<integer>0</integer>
			</dict>
			<dict>
				<key>partition-hint</key>
				<string>Apple_HFS</string>
				<key>partition-length</key>
				<integer>102400</integer>
				<key>partition-name</key>
				<string>Recovered</string>
				<key>partition-number</key>
				<integer>2</integer>
				<key>partition-start</key>
				<integer>409640</integer>
			</dict>
			<dict>
				<key>partition-hint</key>
				<string>C12A7328-F81F-11D2-BA4B-00A0C93EC93B</string>
				<key>partition-length</key>
				<integer>409600</integer>
				<key>partition-name</key>
				<string>EFI System Partition</string>
				<key>partition-number</key>
				<integer>1</integer>
				<key>partition-start</key>
				<integer>40</integer>
			</dict>
		</array>
		<key>burnable</key>
		<false/>
	</dict>
</dict>
</plist>
)"sv;

static constexpr auto ATTACH_GPT_TEST = R"(<?xml version="1.0" encoding="UTF-8"?>
<plist version="1.0">
<dict>
	<key>system-entities</key>
	<array>
		<dict>
			<key>content-hint</key>
			<string>GUID_partition_scheme</string>
			<key>dev-entry</key>
			<string>/dev/disk4</string>
			<key>potentially-mountable</key>
			<false/>
		</dict>
		<dict>
			<key>content-hint</key>
			<string>C12A7328-F81F-11D2-BA4B-00A0C93EC93B</string>
			<key>dev-entry</key>
			<string>/dev/disk4s1</string>
			<key>potentially-mountable</key>
			<true/>
		</dict>
		<dict>
			<key>content-hint</key>
			<string>Apple_HFS</string>
			<key>dev-entry</key>
			<string>/dev/disk4s2</string>
			<key>mount-point</key>
			<string>/Volumes/Recovered</string>
			<key>potentially-mountable</key>
			<true/>
		</dict>
	</array>
</dict>
</plist>
)"sv;

static constexpr auto DISKUTIL_LIST_TEST = R"(/dev/disk0 (internal, physical):
   #:                       TYPE NAME                    SIZE       IDENTIFIER
   0:      GUID_partition_scheme                        *500.3 GB   disk0
   1:                        EFI EFI                     314.6 MB   disk0s1
   2:                 Apple_APFS Container disk1         500.0 GB   disk0s2

/dev/disk4 (disk image):
   #:                       TYPE NAME                    SIZE       IDENTIFIER
   0:      GUID_partition_scheme                        +262.1 MB   disk4
)"sv;

TEST_CASE("hdiutil output test")
{
    imgmount::logger::set_null_logger();

    SECTION("partition map")
    {
        REQUIRE_FALSE(imgmount::hdiutil::is_whole_disk(IMAGEINFO_GPT_TEST));

        const auto& choices = imgmount::hdiutil::parse_image_partitions(IMAGEINFO_GPT_TEST);
        REQUIRE(choices.has_value());
        REQUIRE_EQ(choices->size(), 2);
        REQUIRE_EQ((*choices)[0].label, "Partition 2, with size 52 MB");
        REQUIRE_EQ((*choices)[0].device_or_name, "2");
        REQUIRE_EQ((*choices)[0].size, "52 MB");
        REQUIRE_EQ((*choices)[0].filesystem, "Apple_HFS");
        REQUIRE_EQ((*choices)[1].label, "Partition 1, with size 209 MB");
        REQUIRE_EQ((*choices)[1].device_or_name, "1");
    }
    SECTION("malformed partition map")
    {
        REQUIRE_FALSE(imgmount::hdiutil::parse_image_partitions("hdiutil: imageinfo failed - Resource temporarily unavailable"sv).has_value());
        REQUIRE_FALSE(imgmount::hdiutil::parse_image_partitions("<plist version=\"1.0\"><dict/></plist>"sv).has_value());
        REQUIRE_FALSE(imgmount::hdiutil::parse_image_partitions("<plist version=\"1.0\"><dict><key>partitions</key><dict><key>partitions</key><array/></dict></dict></plist>"sv).has_value());
    }
    SECTION("system entities")
    {
        const auto& entities = imgmount::hdiutil::parse_system_entities(ATTACH_GPT_TEST);
        REQUIRE(entities.has_value());
        REQUIRE_EQ(entities->size(), 3);
        REQUIRE_EQ((*entities)[0].dev_entry, "/dev/disk4");
        REQUIRE_FALSE((*entities)[0].mount_point.has_value());
        REQUIRE_EQ((*entities)[2].mount_point, "/Volumes/Recovered");

        const auto& selected = imgmount::hdiutil::select_mounted_entity(*entities);
        REQUIRE(selected.has_value());
        REQUIRE_EQ(selected->dev_entry, "/dev/disk4s1");

        const auto& partition = imgmount::hdiutil::find_partition_entity(*entities, "2"sv);
        REQUIRE(partition.has_value());
        REQUIRE_EQ(partition->dev_entry, "/dev/disk4s2");
        REQUIRE_EQ(partition->mount_point, "/Volumes/Recovered");

        // attached, but macOS couldn't mount it
        REQUIRE_FALSE(imgmount::hdiutil::find_partition_entity(*entities, "1"sv).has_value());
        REQUIRE_FALSE(imgmount::hdiutil::find_partition_entity(*entities, "3"sv).has_value());
    }
    SECTION("single entity")
    {
        const std::vector<imgmount::hdiutil::SystemEntity> entities{{.dev_entry = "/dev/disk5", .mount_point = "/Volumes/Untitled"}};
        const auto& selected = imgmount::hdiutil::select_mounted_entity(entities);
        REQUIRE(selected.has_value());
        REQUIRE_EQ(selected->dev_entry, "/dev/disk5");
        REQUIRE_FALSE(imgmount::hdiutil::select_mounted_entity({}).has_value());
    }
    SECTION("diskutil list")
    {
        const auto& disks = imgmount::hdiutil::parse_diskutil_disks(DISKUTIL_LIST_TEST);
        REQUIRE_EQ(disks.size(), 2);
        REQUIRE_EQ(disks[0], "/dev/disk0");
        REQUIRE_EQ(disks[1], "/dev/disk4");
    }
}

TEST_CASE("hdiutil recovery test")
{
    imgmount::logger::set_null_logger();

    imgmount::test::FakeHost host{};
    host.respond("diskutil list", 0, std::string{DISKUTIL_LIST_TEST});

    SECTION("no recovery when hdiutil works")
    {
        host.respond("hdiutil attach", 0, std::string{ATTACH_GPT_TEST});

        const auto& result = imgmount::hdiutil::run(host, "attach /Users/recovery/disk.dmg -readonly -plist"sv);
        REQUIRE(result.success());
        REQUIRE_EQ(host.commands.size(), 1);
        REQUIRE_EQ(host.commands[0], "hdiutil attach /Users/recovery/disk.dmg -readonly -plist");
        REQUIRE(host.elevated_commands[0]);
    }
    SECTION("busy resource is released and retried")
    {
        host.respond("hdiutil attach", 0, std::string{ATTACH_GPT_TEST});
        host.respond("hdiutil attach", 1, "hdiutil: attach failed - Resource temporarily unavailable\n", 1);
        host.respond("hdiutil detach /dev/disk0", 16, "hdiutil: couldn't unmount \"disk0\" - Resource busy\n");

        const auto& result = imgmount::hdiutil::run(host, "attach /Users/recovery/disk.dmg -readonly -plist"sv);
        REQUIRE(result.success());
        REQUIRE_EQ(result.output, ATTACH_GPT_TEST);

        const std::vector<std::string> expected{
            "hdiutil attach /Users/recovery/disk.dmg -readonly -plist",
            "diskutil list",
            "hdiutil detach /dev/disk0",
            "hdiutil detach /dev/disk4",
            "hdiutil attach /Users/recovery/disk.dmg -readonly -plist",
        };
        REQUIRE_EQ(host.commands, expected);
    }
    SECTION("retried only once")
    {
        host.respond("hdiutil attach", 1, "hdiutil: attach failed - no mountable file systems\n");

        const auto& result = imgmount::hdiutil::run(host, "attach /Users/recovery/disk.dmg -readonly -plist"sv);
        REQUIRE_FALSE(result.success());
        REQUIRE_EQ(host.commands_starting_with("hdiutil attach").size(), 2);
    }
}
