/**
 * @file BudgetedSelector.hpp
 * @brief Chooses which candidate files to download under a byte budget
 */

#pragma once

#include "extent_engine.hpp"
#include "FileGrouper.hpp"
#include "Logger.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gex {

/**
 * @brief One file or one atomic group, accepted or rejected as a whole
 */
struct SelectionUnit {
    std::vector<CandidateFile> files;
    std::uint64_t size = 0;
    size_t position = 0;    ///< Input index of the first file
};

/**
 * @brief Greedy budget walk over policy-ordered selection units
 *
 * Files with unknown size (0) are always selected and never counted.
 * The walk stops at the first unit that does not fit; every later unit is
 * skipped even if it would fit on its own.
 */
class BudgetedSelector {
public:
    static constexpr std::uint32_t DEFAULT_SEED = 42;

    explicit BudgetedSelector(std::vector<std::string> composite_extensions =
                                  ExtentConfig::default_composite_extensions());

    /**
     * @brief Select files within a budget
     * @param files Candidates in input order
     * @param budget_bytes Byte budget, nullopt for unlimited
     * @param policy Unit ordering applied before the walk
     * @param seed Shuffle seed, used only by RANDOM
     * @param hard_limit Throw instead of truncating
     * @param source_name Label carried by DownloadSizeExceeded
     * @throws DownloadSizeExceeded when hard_limit is set and a unit was skipped
     */
    SelectionResult select(const std::vector<CandidateFile>& files,
                           std::optional<std::uint64_t> budget_bytes,
                           SelectionPolicy policy = SelectionPolicy::ORDERED,
                           std::uint32_t seed = DEFAULT_SEED,
                           bool hard_limit = false,
                           const std::string& source_name = "remote") const;

    /**
     * @brief Select with budget, policy, seed, limit mode and label from a config
     */
    SelectionResult select(const std::vector<CandidateFile>& files,
                           const ExtentConfig& config) const;

    /**
     * @brief Build the selection units of the sized files, ordered by policy
     */
    std::vector<SelectionUnit> order_units(const std::vector<CandidateFile>& sized_files,
                                           SelectionPolicy policy,
                                           std::uint32_t seed) const;

private:
    std::vector<std::string> composite_extensions_;
    Logger logger_;
};

} // namespace gex
