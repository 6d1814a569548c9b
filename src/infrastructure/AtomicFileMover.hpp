/**
 * @file AtomicFileMover.hpp
 * @brief All-or-nothing file relocation (temp file -> rename discipline).
 */

#pragma once
#include <filesystem>

namespace dropkeeper::infrastructure {

/**
 * @class AtomicFileMover
 * @brief Moves and copies files so that readers never see a truncated destination.
 *
 * Every operation either completes or leaves the source where it was and no
 * file at the destination. Errors surface as std::filesystem::filesystem_error.
 */
class AtomicFileMover {
public:
    /**
     * @brief Moves @p source to @p destination without ever overwriting.
     *
     * Uses a hard link when both paths share a filesystem, otherwise copies to a
     * hidden temp file next to the destination and publishes it in one step.
     * @throws std::filesystem::filesystem_error (file_exists if the destination is taken).
     */
    static void MoveNoClobber(const std::filesystem::path& source, const std::filesystem::path& destination);

    /**
     * @brief Copies @p source over @p destination, replacing it atomically.
     */
    static void CopyReplace(const std::filesystem::path& source, const std::filesystem::path& destination);

    /** @brief Hidden temp path in the destination's directory. */
    static std::filesystem::path TempPathFor(const std::filesystem::path& destination);

private:
    static void PublishNoClobber(const std::filesystem::path& temp, const std::filesystem::path& destination);
};

} // namespace dropkeeper::infrastructure
