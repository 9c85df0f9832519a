#include "imgmount/errors.hpp"

using namespace std::string_view_literals;

namespace imgmount {

auto mount_error_to_string(MountError error) noexcept -> std::string_view {
    switch (error) {
    case MountError::ClassificationFailure:
        return "ClassificationFailure"sv;
    case MountError::EnumerationFailure:
        return "EnumerationFailure"sv;
    case MountError::MountCommandFailure:
        return "MountCommandFailure"sv;
    case MountError::TeardownFailure:
        return "TeardownFailure"sv;
    case MountError::UserCancelled:
        return "UserCancelled"sv;
    case MountError::Busy:
        return "Busy"sv;
    }
    return "unknown"sv;
}

auto describe_mount_error(MountError error) noexcept -> std::string_view {
    switch (error) {
    case MountError::ClassificationFailure:
        return "Couldn't mount your output file. The hard disk image utility failed to run. "
               "This could mean your disk image is damaged, and you need to use a different tool to read it."sv;
    case MountError::EnumerationFailure:
        return "Couldn't find any partitions to mount! This could indicate a problem with your recovered image. "
               "It's possible the data you recovered is partially corrupted, and you need to use another tool "
               "to extract meaningful data from it."sv;
    case MountError::MountCommandFailure:
        return "Couldn't mount your output file. Most probably, the filesystem is damaged or unsupported and "
               "you'll need to use another tool to read it from here. It could also be that the recovery is "
               "incomplete, as that can sometimes cause this problem."sv;
    case MountError::TeardownFailure:
        return "Couldn't finish unmounting your output file! Please close all applications that could be "
               "using it and try again."sv;
    case MountError::UserCancelled:
        return "Mounting was cancelled."sv;
    case MountError::Busy:
        return "Another output file is still mounted. Unmount it first."sv;
    }
    return "Unknown error."sv;
}

}  // namespace imgmount
