#include "doctest_compatibility.h"

#include "fake_host.hpp"

#include "imgmount/logger.hpp"
#include "imgmount/loop.hpp"

#include <string_view>

using namespace std::string_view_literals;

static constexpr auto KPARTX_TEST = R"(add map loop12p1 (254:3): 0 1048576 linear 7:12 2048
add map loop12p2 (254:4): 0 1046528 linear 7:12 1050624
)"sv;

TEST_CASE("loop device test")
{
    imgmount::logger::set_null_logger();

    SECTION("kpartx output")
    {
        REQUIRE_EQ(imgmount::loop::parse_kpartx_loop_device(KPARTX_TEST), "loop12");
        REQUIRE_EQ(imgmount::loop::parse_kpartx_loop_device("add map loop0p10 (254:0): 0 2048 linear 7:0 2048\n"sv), "loop0");
        REQUIRE_FALSE(imgmount::loop::parse_kpartx_loop_device(""sv).has_value());
        REQUIRE_FALSE(imgmount::loop::parse_kpartx_loop_device("device-mapper: reload ioctl on loop0p1 failed: Device or resource busy\n"sv).has_value());
        REQUIRE_FALSE(imgmount::loop::parse_kpartx_loop_device("add map loop0 (254:0): 0 2048 linear 7:0 2048\n"sv).has_value());
    }
    SECTION("mapping partitions")
    {
        imgmount::test::FakeHost host{};
        host.respond("kpartx -av", 0, std::string{KPARTX_TEST});
        host.respond("partprobe", 1, "Error: Partition(s) 1 on /dev/sda have been written, but we have been unable to inform the kernel\n");

        const auto& loop_device = imgmount::loop::map_partitions(host, "/srv/recovery/disk.img"sv);
        REQUIRE_EQ(loop_device, "loop12");
        REQUIRE(imgmount::loop::unmap_partitions(host, "/srv/recovery/disk.img"sv));

        const std::vector<std::string> expected{
            "kpartx -av /srv/recovery/disk.img",
            "partprobe",
            "kpartx -d /srv/recovery/disk.img",
        };
        REQUIRE_EQ(host.commands, expected);
    }
    SECTION("nothing mapped")
    {
        imgmount::test::FakeHost host{};
        REQUIRE_FALSE(imgmount::loop::map_partitions(host, "/srv/recovery/empty.img"sv).has_value());

        host.respond("kpartx -av", 1, "failed to stat() /srv/recovery/missing.img\n");
        REQUIRE_FALSE(imgmount::loop::map_partitions(host, "/srv/recovery/missing.img"sv).has_value());
    }
    SECTION("binding files")
    {
        imgmount::test::FakeHost host{};
        host.respond("losetup -f --show", 0, "/dev/loop7\n");

        REQUIRE_EQ(imgmount::loop::attach(host, "/srv/recovery/pv.img"sv), "/dev/loop7");
        REQUIRE(imgmount::loop::detach(host, "/dev/loop7"sv));
        REQUIRE_EQ(host.commands.back(), "losetup -d /dev/loop7");

        host.respond("losetup -f --show", 1, "losetup: /srv/recovery/pv.img: failed to set up loop device: Permission denied\n");
        REQUIRE_FALSE(imgmount::loop::attach(host, "/srv/recovery/pv.img"sv).has_value());
    }
}
