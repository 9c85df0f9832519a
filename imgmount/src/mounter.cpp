#include "imgmount/mounter.hpp"
#include "imgmount/linux_mounter.hpp"
#include "imgmount/mac_mounter.hpp"

#include <utility>  // for move

namespace imgmount {

auto make_mounter(Platform platform, Executor& executor, Selector& selector, std::string mount_root) noexcept -> std::unique_ptr<Mounter> {
    switch (platform) {
    case Platform::MacOS:
        return std::make_unique<MacMounter>(executor);
    case Platform::Linux:
        break;
    }
    return std::make_unique<LinuxMounter>(executor, selector, std::move(mount_root));
}

}  // namespace imgmount
