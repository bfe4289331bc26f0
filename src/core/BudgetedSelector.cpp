/**
 * @file BudgetedSelector.cpp
 * @brief Budgeted download selection with atomic file groups
 */

#include "BudgetedSelector.hpp"
#include "ByteSizeParser.hpp"
#include <algorithm>
#include <random>
#include <utility>

namespace gex {

BudgetedSelector::BudgetedSelector(std::vector<std::string> composite_extensions)
    : composite_extensions_(std::move(composite_extensions)), logger_("BudgetedSelector") {}

SelectionResult BudgetedSelector::select(const std::vector<CandidateFile>& files,
                                         const ExtentConfig& config) const {
    return select(files, config.max_download_bytes, config.selection_policy, config.seed,
                  config.hard_limit, config.source_name);
}

SelectionResult BudgetedSelector::select(const std::vector<CandidateFile>& files,
                                         std::optional<std::uint64_t> budget_bytes,
                                         SelectionPolicy policy,
                                         std::uint32_t seed,
                                         bool hard_limit,
                                         const std::string& source_name) const {
    SelectionResult result;

    if (!budget_bytes) {
        result.selected = files;
        for (const auto& file : files) {
            result.total_bytes = add_bytes(result.total_bytes, file.size);
        }
        logger_.detailed("No download limit, selecting all " + std::to_string(files.size()) +
                         " files from " + source_name);
        return result;
    }

    std::vector<CandidateFile> sized;
    std::vector<CandidateFile> unsized;
    for (const auto& file : files) {
        (file.size > 0 ? sized : unsized).push_back(file);
    }

    std::vector<SelectionUnit> units = order_units(sized, policy, seed);

    std::uint64_t running_total = 0;
    std::uint64_t estimated_total = 0;
    bool stopped = false;
    for (const auto& unit : units) {
        estimated_total = add_bytes(estimated_total, unit.size);
        // running_total never exceeds the budget
        if (!stopped && unit.size <= *budget_bytes - running_total) {
            running_total += unit.size;
            result.selected.insert(result.selected.end(), unit.files.begin(), unit.files.end());
            continue;
        }
        if (!stopped) {
            logger_.debug("Unit of " + std::to_string(unit.files.size()) + " file(s) starting at " +
                          unit.files.front().name + " (" + std::to_string(unit.size) +
                          " bytes) exceeds the remaining budget, stopping");
            stopped = true;
        }
        result.skipped.insert(result.skipped.end(), unit.files.begin(), unit.files.end());
    }

    result.total_bytes = running_total;
    result.selected.insert(result.selected.end(), unsized.begin(), unsized.end());

    if (!unsized.empty()) {
        logger_.detailed(std::to_string(unsized.size()) +
                         " files of unknown size selected without budget check");
    }

    if (!result.skipped.empty()) {
        if (hard_limit) {
            logger_.error(source_name + ": estimated download size " +
                          format_byte_size(estimated_total) + " exceeds limit of " +
                          format_byte_size(*budget_bytes));
            throw DownloadSizeExceeded(estimated_total, *budget_bytes, source_name);
        }
        logger_.info(source_name + ": selected " + std::to_string(result.selected.size()) +
                     " of " + std::to_string(files.size()) + " files (" +
                     format_byte_size(result.total_bytes) + " of " +
                     format_byte_size(estimated_total) + ", limit " +
                     format_byte_size(*budget_bytes) + ", method " +
                     selection_policy_name(policy) + "), skipped " +
                     std::to_string(result.skipped.size()));
    } else {
        logger_.detailed(source_name + ": all " + std::to_string(files.size()) +
                         " files fit within " + format_byte_size(*budget_bytes));
    }
    return result;
}

std::vector<SelectionUnit> BudgetedSelector::order_units(const std::vector<CandidateFile>& sized_files,
                                                         SelectionPolicy policy,
                                                         std::uint32_t seed) const {
    GroupingResult grouping = group_files(sized_files, composite_extensions_);

    std::vector<SelectionUnit> units;
    units.reserve(grouping.groups.size() + grouping.standalones.size());
    for (auto& group : grouping.groups) {
        SelectionUnit unit;
        unit.size = group.total_bytes();
        unit.position = group.position;
        unit.files = std::move(group.members);
        units.push_back(std::move(unit));
    }
    for (auto& standalone : grouping.standalones) {
        SelectionUnit unit;
        unit.size = standalone.file.size;
        unit.position = standalone.position;
        unit.files.push_back(std::move(standalone.file));
        units.push_back(std::move(unit));
    }

    // Input order first; the sorts below are stable on top of it
    std::sort(units.begin(), units.end(), [](const SelectionUnit& a, const SelectionUnit& b) {
        return a.position < b.position;
    });

    switch (policy) {
        case SelectionPolicy::ORDERED:
            break;
        case SelectionPolicy::RANDOM: {
            // Fisher-Yates: for i = n..2, swap units[i - 1] with units[rng() % i]
            std::mt19937 rng(seed);
            for (size_t i = units.size(); i > 1; --i) {
                size_t j = static_cast<size_t>(rng() % i);
                std::swap(units[i - 1], units[j]);
            }
            break;
        }
        case SelectionPolicy::SMALLEST:
            std::stable_sort(units.begin(), units.end(),
                             [](const SelectionUnit& a, const SelectionUnit& b) {
                                 return a.size < b.size;
                             });
            break;
        case SelectionPolicy::LARGEST:
            std::stable_sort(units.begin(), units.end(),
                             [](const SelectionUnit& a, const SelectionUnit& b) {
                                 return a.size > b.size;
                             });
            break;
    }

    logger_.trace("Ordered " + std::to_string(units.size()) + " units by " +
                  selection_policy_name(policy));
    return units;
}

} // namespace gex
