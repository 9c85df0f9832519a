#include "doctest_compatibility.h"

#include "fake_host.hpp"

#include "imgmount/classifier.hpp"
#include "imgmount/logger.hpp"

#include <string_view>

using namespace std::string_view_literals;

static constexpr auto PARTED_FILESYSTEM_TEST = R"(BYT;
/srv/recovery/part.img:104857600B:file:512:512:loop:Loopback device:;
1:0B:104857599B:104857600B:ext4::;
)"sv;

static constexpr auto PARTED_MSDOS_TEST = R"(BYT;
/srv/recovery/disk.img:1073741824B:file:512:512:msdos::;
1:1048576B:537919487B:536870912B:ext4::;
2:537919488B:1073741823B:535822336B:ext4::;
)"sv;

static constexpr auto PARTED_GPT_NOISY_TEST = R"(Warning: Not all of the space available to /srv/recovery/disk.img appears to be used, you can fix the GPT to use all of the space.
BYT;
/srv/recovery/disk.img:2147483648B:file:512:512:gpt::;
1:1048576B:2146435071B:2145386496B:btrfs:root:;
)"sv;

static constexpr auto PARTED_UNKNOWN_TEST = R"(BYT;
/srv/recovery/pv.img:1073741824B:file:512:512:unknown::;
)"sv;

TEST_CASE("parted output test")
{
    SECTION("filesystem image")
    {
        REQUIRE_EQ(imgmount::classifier::parse_parted_output(PARTED_FILESYSTEM_TEST), imgmount::ContainerKind::Partition);
    }
    SECTION("partition tables")
    {
        REQUIRE_EQ(imgmount::classifier::parse_parted_output(PARTED_MSDOS_TEST), imgmount::ContainerKind::Device);
        REQUIRE_EQ(imgmount::classifier::parse_parted_output(PARTED_GPT_NOISY_TEST), imgmount::ContainerKind::Device);
        REQUIRE_EQ(imgmount::classifier::parse_parted_output("BYT;\n/dev/sdb:8GB:scsi:512:512:mac:Disk:;\n"sv), imgmount::ContainerKind::Device);
        REQUIRE_EQ(imgmount::classifier::parse_parted_output("BYT;\n/dev/sdb:8GB:scsi:512:512:atari:Disk:;\n"sv), imgmount::ContainerKind::Device);
    }
    SECTION("inconclusive")
    {
        REQUIRE_FALSE(imgmount::classifier::parse_parted_output(PARTED_UNKNOWN_TEST).has_value());
        REQUIRE_FALSE(imgmount::classifier::parse_parted_output("BYT;\n"sv).has_value());
        REQUIRE_FALSE(imgmount::classifier::parse_parted_output("/srv/short:1B:file;\n"sv).has_value());
        REQUIRE_FALSE(imgmount::classifier::parse_parted_output(""sv).has_value());
    }
}

TEST_CASE("classify test")
{
    imgmount::logger::set_null_logger();

    imgmount::test::FakeHost host{};
    imgmount::test::FakeSelector selector{};

    SECTION("parted decides")
    {
        host.respond("parted -m /srv/recovery/disk.img print", 0, std::string{PARTED_MSDOS_TEST});

        const auto& kind = imgmount::classifier::classify_linux(host, selector, "/srv/recovery/disk.img"sv);
        REQUIRE(kind.has_value());
        REQUIRE_EQ(*kind, imgmount::ContainerKind::Device);
        REQUIRE_EQ(host.commands.size(), 1);
        REQUIRE(selector.prompts.empty());
    }
    SECTION("parted fails")
    {
        host.respond("parted", 1, "Error: Could not stat device /srv/missing.img - No such file or directory.\n");

        const auto& kind = imgmount::classifier::classify_linux(host, selector, "/srv/missing.img"sv);
        REQUIRE_FALSE(kind.has_value());
        REQUIRE_EQ(kind.error(), imgmount::MountError::ClassificationFailure);
        REQUIRE_EQ(host.commands.size(), 1);
    }
    SECTION("luks container")
    {
        host.respond("parted", 0, std::string{PARTED_UNKNOWN_TEST});
        host.respond("cryptsetup isLuks /srv/recovery/pv.img", 0);

        const auto& kind = imgmount::classifier::classify_linux(host, selector, "/srv/recovery/pv.img"sv);
        REQUIRE(kind.has_value());
        REQUIRE_EQ(*kind, imgmount::ContainerKind::LUKS);
    }
    SECTION("lvm container")
    {
        host.respond("parted", 0, std::string{PARTED_UNKNOWN_TEST});
        host.respond("cryptsetup isLuks", 1);
        host.respond("file -s /srv/recovery/pv.img", 0, "/srv/recovery/pv.img: LVM2 PV (Linux Logical Volume Manager), UUID: 9yLbvj-bFgT-RNYo-0SNi-yFrg-ZVHg-0mj8bX, size: 1073741824\n");

        const auto& kind = imgmount::classifier::classify_linux(host, selector, "/srv/recovery/pv.img"sv);
        REQUIRE(kind.has_value());
        REQUIRE_EQ(*kind, imgmount::ContainerKind::LVM);
        REQUIRE(selector.prompts.empty());
    }
    SECTION("user names the type")
    {
        host.respond("parted", 0, std::string{PARTED_UNKNOWN_TEST});
        host.respond("cryptsetup isLuks", 1);
        host.respond("file -s", 0, "/srv/recovery/pv.img: data\n");
        selector.answers.emplace_back("LVM Container");

        const auto& kind = imgmount::classifier::classify_linux(host, selector, "/srv/recovery/pv.img"sv);
        REQUIRE(kind.has_value());
        REQUIRE_EQ(*kind, imgmount::ContainerKind::LVM);
        REQUIRE_EQ(selector.prompts.size(), 1);
        REQUIRE_EQ(selector.prompts[0], imgmount::classifier::CONTAINER_KIND_PROMPT);
        REQUIRE_EQ(selector.offered[0].size(), 4);
        REQUIRE_EQ(selector.offered[0][0], "Partition (single file system or CD/DVD image)");
        REQUIRE_EQ(selector.offered[0][1], "Device (multiple partitions)");
        REQUIRE_EQ(selector.offered[0][2], "LUKS (encrypted storage) Container");
        REQUIRE_EQ(selector.offered[0][3], "LVM Container");
    }
    SECTION("user declines")
    {
        host.respond("parted", 0, std::string{PARTED_UNKNOWN_TEST});
        host.respond("cryptsetup isLuks", 1);
        host.respond("file -s", 0, "/srv/recovery/pv.img: data\n");

        const auto& kind = imgmount::classifier::classify_linux(host, selector, "/srv/recovery/pv.img"sv);
        REQUIRE_FALSE(kind.has_value());
        REQUIRE_EQ(kind.error(), imgmount::MountError::ClassificationFailure);
    }
    SECTION("dry run leaves the decision to the user")
    {
        imgmount::test::DryRun dry_run{};
        selector.answers.emplace_back("Partition (single file system or CD/DVD image)");

        // every command of a dry run succeeds without output
        const auto& kind = imgmount::classifier::classify_linux(host, selector, "/srv/recovery/disk.img"sv);
        REQUIRE(kind.has_value());
        REQUIRE_EQ(*kind, imgmount::ContainerKind::Partition);
        REQUIRE_EQ(host.commands.size(), 1);
        REQUIRE(host.commands_starting_with("cryptsetup").empty());
        REQUIRE_EQ(selector.prompts.size(), 1);
    }
    SECTION("answers map back to kinds")
    {
        REQUIRE_EQ(imgmount::classifier::container_kind_from_choice("Partition (single file system or CD/DVD image)"sv), imgmount::ContainerKind::Partition);
        REQUIRE_EQ(imgmount::classifier::container_kind_from_choice("Device (multiple partitions)"sv), imgmount::ContainerKind::Device);
        REQUIRE_EQ(imgmount::classifier::container_kind_from_choice("LUKS (encrypted storage) Container"sv), imgmount::ContainerKind::LUKS);
        REQUIRE_EQ(imgmount::classifier::container_kind_from_choice("LVM Container"sv), imgmount::ContainerKind::LVM);
        REQUIRE_FALSE(imgmount::classifier::container_kind_from_choice("Floppy"sv).has_value());
    }
    SECTION("macos whole disk")
    {
        host.respond("hdiutil imageinfo /Users/recovery/part.dmg -plist", 0,
            "<plist version=\"1.0\"><dict><key>partitions</key><dict><key>partitions</key><array><dict>"
            "<key>partition-name</key><string>whole disk</string></dict></array></dict></dict></plist>\n");

        const auto& kind = imgmount::classifier::classify_macos(host, "/Users/recovery/part.dmg"sv);
        REQUIRE(kind.has_value());
        REQUIRE_EQ(*kind, imgmount::ContainerKind::Partition);
    }
    SECTION("macos device")
    {
        host.respond("hdiutil imageinfo", 0, "<plist version=\"1.0\"><dict><key>partitions</key><dict/></dict></plist>\n");

        const auto& kind = imgmount::classifier::classify_macos(host, "/Users/recovery/disk.dmg"sv);
        REQUIRE(kind.has_value());
        REQUIRE_EQ(*kind, imgmount::ContainerKind::Device);
    }
    SECTION("macos hdiutil fails")
    {
        host.respond("hdiutil imageinfo", 1, "hdiutil: imageinfo failed - image not recognized\n");
        host.respond("diskutil list", 0, "/dev/disk0 (internal, physical):\n");

        const auto& kind = imgmount::classifier::classify_macos(host, "/Users/recovery/garbage.dmg"sv);
        REQUIRE_FALSE(kind.has_value());
        REQUIRE_EQ(kind.error(), imgmount::MountError::ClassificationFailure);
        // one retry after detaching every disk
        REQUIRE_EQ(host.commands_starting_with("hdiutil imageinfo").size(), 2);
    }
}
