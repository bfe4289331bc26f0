/**
 * @file TemporalMerger.hpp
 * @brief Combines per-record date ranges into one overall range
 */

#pragma once

#include "extent_engine.hpp"
#include "Logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace gex {

/**
 * @brief True for a strict YYYY-MM-DD calendar date (leap years honored)
 */
bool is_calendar_date(const std::string& text);

class TemporalMerger {
public:
    TemporalMerger();

    /**
     * @brief Earliest and latest date over all records with a usable tbox
     *
     * A tbox contributes only when both of its entries are calendar dates.
     * Dates from all contributing records are pooled, so the result has
     * start <= end even if a record carries a reversed range.
     *
     * @param contributors Optional out parameter receiving the number of
     *        contributing records
     * @return nullopt when no record contributes
     */
    std::optional<TemporalExtent> merge(const std::vector<ExtentRecord>& records,
                                        size_t* contributors = nullptr) const;

private:
    Logger logger_;
};

} // namespace gex
