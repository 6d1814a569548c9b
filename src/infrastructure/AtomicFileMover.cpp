/**
 * @file AtomicFileMover.cpp
 * @brief Implementation of AtomicFileMover.
 */

#include "infrastructure/AtomicFileMover.hpp"
#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <system_error>

namespace dropkeeper::infrastructure {

namespace fs = std::filesystem;

namespace {

bool LinkUnsupported(const std::error_code& ec) {
    return ec == std::errc::cross_device_link ||
           ec == std::errc::operation_not_supported ||
           ec == std::errc::operation_not_permitted ||
           ec == std::errc::too_many_links;
}

void RemoveQuietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) {
        std::cerr << "[AtomicFileMover] Could not clean up " << p << ": " << ec.message() << std::endl;
    }
}

} // namespace

fs::path AtomicFileMover::TempPathFor(const fs::path& destination) {
    static std::atomic<unsigned long> counter{0};
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string name = "." + destination.filename().string() + "." + std::to_string(timestamp) + "." +
                       std::to_string(counter++) + ".tmp";
    return destination.parent_path() / name;
}

void AtomicFileMover::PublishNoClobber(const fs::path& temp, const fs::path& destination) {
    std::error_code ec;
    fs::create_hard_link(temp, destination, ec);
    if (!ec) {
        RemoveQuietly(temp);
        return;
    }
    if (ec == std::errc::file_exists || !LinkUnsupported(ec)) {
        RemoveQuietly(temp);
        throw fs::filesystem_error("cannot publish file", temp, destination, ec);
    }

    // Filesystem without hard links: check then rename. Single writer per run keeps this safe.
    if (fs::exists(destination)) {
        RemoveQuietly(temp);
        throw fs::filesystem_error("destination already exists", temp, destination,
                                   std::make_error_code(std::errc::file_exists));
    }
    fs::rename(temp, destination, ec);
    if (ec) {
        RemoveQuietly(temp);
        throw fs::filesystem_error("rename failed", temp, destination, ec);
    }
}

void AtomicFileMover::MoveNoClobber(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::create_hard_link(source, destination, ec);
    if (ec && (ec == std::errc::file_exists || !LinkUnsupported(ec))) {
        throw fs::filesystem_error("cannot move file", source, destination, ec);
    }

    if (ec) {
        // 1. Copy next to the destination
        fs::path temp = TempPathFor(destination);
        try {
            fs::copy_file(source, temp, fs::copy_options::none);
        } catch (const fs::filesystem_error&) {
            RemoveQuietly(temp);
            throw;
        }
        // 2. Publish without clobbering
        PublishNoClobber(temp, destination);
    }

    // 3. Drop the source; undo the publish if that is impossible
    std::error_code removeEc;
    fs::remove(source, removeEc);
    if (removeEc) {
        RemoveQuietly(destination);
        throw fs::filesystem_error("cannot remove source after move", source, destination, removeEc);
    }
}

void AtomicFileMover::CopyReplace(const fs::path& source, const fs::path& destination) {
    if (destination.has_parent_path() && !fs::exists(destination.parent_path())) {
        fs::create_directories(destination.parent_path());
    }

    fs::path temp = TempPathFor(destination);
    try {
        fs::copy_file(source, temp, fs::copy_options::overwrite_existing);
        fs::rename(temp, destination);
    } catch (const fs::filesystem_error&) {
        RemoveQuietly(temp);
        throw;
    }
}

} // namespace dropkeeper::infrastructure
