/**
 * @file artifact.hpp
 * @brief Naming and sizing helpers for backup artifacts.
 *
 * Artifact names embed the site identifier and a second-granularity timestamp.
 * Existing files on the destination are never reused: when a name is already
 * taken, a numeric suffix is appended to the stem.
 */

#ifndef ARTIFACT_HPP
#define ARTIFACT_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include "backup_types.hpp"

/**
 * @brief Formats a time point as "%d-%m-%Y_%H-%M-%S" in local time.
 *
 * @param timePoint Time to format.
 * @return std::string Timestamp such as "08-06-2025_14-03-59".
 */
std::string formatTimestamp(std::chrono::system_clock::time_point timePoint);

/**
 * @brief Builds a collision-free artifact path on the destination.
 *
 * Names follow the kind:
 * - Archive: `<site>_<timestamp>.tar.gz`
 * - DatabaseDump: `db_<site>_<timestamp>.sql` (the stage appends `.gz` after compression)
 * - ConfigSnapshot: `nginx_<site>_<timestamp>.txt`
 *
 * If the name, or for dumps its `.sql.gz` sibling, already exists, `-1`, `-2`, ...
 * is appended to the stem until a free name is found.
 *
 * @param destination Backup destination directory.
 * @param kind Artifact kind.
 * @param siteId Site identifier.
 * @param timestamp Timestamp from formatTimestamp().
 * @return fs::path A path that does not exist yet.
 */
fs::path artifactPath(const fs::path& destination,
                      ArtifactKind kind,
                      const std::string& siteId,
                      const std::string& timestamp);

/**
 * @brief Renders a byte count like `du -h` ("512B", "4.0K", "12M").
 */
std::string humanReadableSize(std::uintmax_t bytes);

#endif // ARTIFACT_HPP
