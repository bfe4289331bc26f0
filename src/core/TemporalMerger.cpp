/**
 * @file TemporalMerger.cpp
 * @brief Calendar-date range merge
 */

#include "TemporalMerger.hpp"
#include <cctype>

namespace gex {

namespace {

int digits_value(const std::string& text, size_t pos, size_t count) {
    int value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        value = value * 10 + (text[i] - '0');
    }
    return value;
}

int days_in_month(int year, int month) {
    static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return DAYS[month - 1];
}

} // namespace

bool is_calendar_date(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }

    int year = digits_value(text, 0, 4);
    int month = digits_value(text, 5, 2);
    int day = digits_value(text, 8, 2);
    if (month < 1 || month > 12) {
        return false;
    }
    return day >= 1 && day <= days_in_month(year, month);
}

TemporalMerger::TemporalMerger() : logger_("TemporalMerger") {}

std::optional<TemporalExtent> TemporalMerger::merge(const std::vector<ExtentRecord>& records,
                                                    size_t* contributors) const {
    std::optional<TemporalExtent> result;
    size_t count = 0;

    for (const auto& record : records) {
        if (!record.tbox) {
            continue;
        }
        const TemporalExtent& tbox = *record.tbox;
        if (!is_calendar_date(tbox.start) || !is_calendar_date(tbox.end)) {
            logger_.debug("Ignoring unparsable time range of " +
                          (record.name.empty() ? std::string("record") : record.name) +
                          ": [" + tbox.start + ", " + tbox.end + "]");
            continue;
        }

        // YYYY-MM-DD sorts lexicographically
        const std::string& low = tbox.start < tbox.end ? tbox.start : tbox.end;
        const std::string& high = tbox.start < tbox.end ? tbox.end : tbox.start;
        if (!result) {
            result = TemporalExtent{low, high};
        } else {
            if (low < result->start) result->start = low;
            if (high > result->end) result->end = high;
        }
        ++count;
    }

    if (contributors) {
        *contributors = count;
    }

    if (result) {
        logger_.detailed("Merged time range of " + std::to_string(count) + " records: [" +
                         result->start + ", " + result->end + "]");
    } else {
        logger_.info("No temporal extent found");
    }
    return result;
}

} // namespace gex
