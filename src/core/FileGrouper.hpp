/**
 * @file FileGrouper.hpp
 * @brief Detects multi-file datasets that must be downloaded as a whole
 *
 * A shapefile is only usable when its .shp, .shx, .dbf (and friends) are
 * all present. Files sharing a base name and carrying one of the composite
 * extensions are grouped; a group of two or more members is atomic.
 */

#pragma once

#include "extent_engine.hpp"
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace gex {

/**
 * @brief a + b, clamped to the largest representable size
 */
inline std::uint64_t add_bytes(std::uint64_t a, std::uint64_t b) {
    return a > std::numeric_limits<std::uint64_t>::max() - b
        ? std::numeric_limits<std::uint64_t>::max()
        : a + b;
}

/**
 * @brief Atomic set of files forming one dataset
 */
struct FileGroup {
    std::string base_name;
    std::vector<CandidateFile> members;     ///< Sorted by name
    size_t position = 0;                    ///< Input index of the first member

    /// Sum of member sizes, saturating
    std::uint64_t total_bytes() const;
};

/**
 * @brief File selected or skipped on its own
 */
struct StandaloneFile {
    CandidateFile file;
    size_t position = 0;                    ///< Input index
};

struct GroupingResult {
    std::vector<FileGroup> groups;          ///< Ordered by position
    std::vector<StandaloneFile> standalones; ///< Ordered by position
};

/**
 * @brief Split a file list into atomic groups and standalone files
 *
 * Extensions are matched case-insensitively, the longest match winning
 * (a.shp.xml belongs to base "a" via ".shp.xml"). Base names compare
 * exactly. A base name with a single member degrades to a standalone file.
 *
 * @param files Candidate files in input order
 * @param extensions Composite extensions, each starting with '.'
 */
GroupingResult group_files(const std::vector<CandidateFile>& files,
                           const std::vector<std::string>& extensions);

/**
 * @brief Composite extension of a file name, lowercased, or "" if none matches
 */
std::string composite_extension(const std::string& name,
                                const std::vector<std::string>& extensions);

} // namespace gex
