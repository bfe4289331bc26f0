/**
 * @file FileGrouper.cpp
 * @brief Composite-format grouping of candidate files
 */

#include "FileGrouper.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <map>

namespace gex {

namespace {

std::string to_lower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

std::uint64_t FileGroup::total_bytes() const {
    std::uint64_t total = 0;
    for (const auto& member : members) {
        total = add_bytes(total, member.size);
    }
    return total;
}

std::string composite_extension(const std::string& name,
                                const std::vector<std::string>& extensions) {
    const std::string lower = to_lower(name);
    std::string best;
    for (const auto& extension : extensions) {
        const std::string ext = to_lower(extension);
        if (ext.empty() || ext.size() >= lower.size() || ext.size() <= best.size()) {
            continue;
        }
        if (lower.compare(lower.size() - ext.size(), ext.size(), ext) == 0) {
            best = ext;
        }
    }
    return best;
}

GroupingResult group_files(const std::vector<CandidateFile>& files,
                           const std::vector<std::string>& extensions) {
    Logger logger("FileGrouper");
    GroupingResult result;

    // base name -> input indices of its members
    std::map<std::string, std::vector<size_t>> by_base;
    std::vector<std::string> base_order;

    for (size_t i = 0; i < files.size(); ++i) {
        const std::string ext = composite_extension(files[i].name, extensions);
        if (ext.empty()) {
            result.standalones.push_back({files[i], i});
            continue;
        }
        std::string base = files[i].name.substr(0, files[i].name.size() - ext.size());
        auto& indices = by_base[base];
        if (indices.empty()) {
            base_order.push_back(base);
        }
        indices.push_back(i);
    }

    for (const auto& base : base_order) {
        const auto& indices = by_base[base];
        if (indices.size() == 1) {
            result.standalones.push_back({files[indices.front()], indices.front()});
            continue;
        }

        FileGroup group;
        group.base_name = base;
        group.position = indices.front();
        for (size_t index : indices) {
            group.members.push_back(files[index]);
        }
        std::stable_sort(group.members.begin(), group.members.end(),
                         [](const CandidateFile& a, const CandidateFile& b) {
                             return a.name < b.name;
                         });

        logger.debug("Atomic group '" + base + "' with " +
                     std::to_string(group.members.size()) + " files, " +
                     std::to_string(group.total_bytes()) + " bytes");
        result.groups.push_back(std::move(group));
    }

    std::sort(result.standalones.begin(), result.standalones.end(),
              [](const StandaloneFile& a, const StandaloneFile& b) {
                  return a.position < b.position;
              });
    return result;
}

} // namespace gex
