#include "ByteSizeParser.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace gex {

// ============================================================================
// UNITS
// ============================================================================

std::uint64_t ByteSizeParser::unit_factor(ByteUnit unit) {
    switch (unit) {
        case ByteUnit::BYTES:     return 1ULL;
        case ByteUnit::KILOBYTES: return 1000ULL;
        case ByteUnit::MEGABYTES: return 1000ULL * 1000;
        case ByteUnit::GIGABYTES: return 1000ULL * 1000 * 1000;
        case ByteUnit::TERABYTES: return 1000ULL * 1000 * 1000 * 1000;
        case ByteUnit::PETABYTES: return 1000ULL * 1000 * 1000 * 1000 * 1000;
        case ByteUnit::KIBIBYTES: return 1ULL << 10;
        case ByteUnit::MEBIBYTES: return 1ULL << 20;
        case ByteUnit::GIBIBYTES: return 1ULL << 30;
        case ByteUnit::TEBIBYTES: return 1ULL << 40;
        case ByteUnit::PEBIBYTES: return 1ULL << 50;
    }
    throw ByteSizeParseError("Unknown byte unit in unit_factor");
}

ByteUnit ByteSizeParser::parse_unit_string(const std::string& unit_str) {
    std::string lower_unit = unit_str;
    std::transform(lower_unit.begin(), lower_unit.end(), lower_unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower_unit == "b" || lower_unit == "bytes" || lower_unit == "byte") {
        return ByteUnit::BYTES;
    } else if (lower_unit == "kb" || lower_unit == "k") {
        return ByteUnit::KILOBYTES;
    } else if (lower_unit == "mb" || lower_unit == "m") {
        return ByteUnit::MEGABYTES;
    } else if (lower_unit == "gb" || lower_unit == "g") {
        return ByteUnit::GIGABYTES;
    } else if (lower_unit == "tb" || lower_unit == "t") {
        return ByteUnit::TERABYTES;
    } else if (lower_unit == "pb" || lower_unit == "p") {
        return ByteUnit::PETABYTES;
    } else if (lower_unit == "kib") {
        return ByteUnit::KIBIBYTES;
    } else if (lower_unit == "mib") {
        return ByteUnit::MEBIBYTES;
    } else if (lower_unit == "gib") {
        return ByteUnit::GIBIBYTES;
    } else if (lower_unit == "tib") {
        return ByteUnit::TEBIBYTES;
    } else if (lower_unit == "pib") {
        return ByteUnit::PEBIBYTES;
    }

    throw ByteSizeParseError("Unrecognized unit: '" + unit_str + "'. " +
                             "Supported units: B, KB, MB, GB, TB, PB, KiB, MiB, GiB, TiB, PiB");
}

std::string ByteSizeParser::unit_to_string(ByteUnit unit) {
    switch (unit) {
        case ByteUnit::BYTES:     return "B";
        case ByteUnit::KILOBYTES: return "KB";
        case ByteUnit::MEGABYTES: return "MB";
        case ByteUnit::GIGABYTES: return "GB";
        case ByteUnit::TERABYTES: return "TB";
        case ByteUnit::PETABYTES: return "PB";
        case ByteUnit::KIBIBYTES: return "KiB";
        case ByteUnit::MEBIBYTES: return "MiB";
        case ByteUnit::GIBIBYTES: return "GiB";
        case ByteUnit::TEBIBYTES: return "TiB";
        case ByteUnit::PEBIBYTES: return "PiB";
    }
    return "unknown";
}

// ============================================================================
// VALUE AND UNIT SPLITTING
// ============================================================================

std::pair<std::string, std::string> ByteSizeParser::split_value_and_unit(const std::string& input) {
    std::string trimmed = input;
    trimmed.erase(0, trimmed.find_first_not_of(" \t\n\r"));
    trimmed.erase(trimmed.find_last_not_of(" \t\n\r") + 1);

    if (trimmed.empty()) {
        throw ByteSizeParseError("Empty input string");
    }
    if (trimmed[0] == '-') {
        throw ByteSizeParseError("Size must not be negative: '" + input + "'");
    }

    size_t num_end = 0;
    bool found_decimal = false;
    bool found_digit = false;

    for (size_t i = 0; i < trimmed.size(); ++i) {
        char c = trimmed[i];

        if (std::isdigit(static_cast<unsigned char>(c))) {
            found_digit = true;
            num_end = i + 1;
        } else if (c == '.' && !found_decimal && found_digit) {
            found_decimal = true;
            num_end = i + 1;
        } else if (c == '+' && i == 0) {
            num_end = i + 1;
        } else {
            // Start of unit suffix (possibly after a space)
            break;
        }
    }

    if (!found_digit) {
        throw ByteSizeParseError("No numeric value found in: '" + input + "'");
    }

    std::string value_str = trimmed.substr(0, num_end);
    std::string unit_str = trimmed.substr(num_end);

    unit_str.erase(0, unit_str.find_first_not_of(" \t"));
    unit_str.erase(unit_str.find_last_not_of(" \t") + 1);

    return {value_str, unit_str};
}

// ============================================================================
// PARSING
// ============================================================================

std::uint64_t ByteSizeParser::parse(const std::string& input) {
    auto [value_str, unit_str] = split_value_and_unit(input);

    ByteUnit unit = ByteUnit::BYTES;
    if (!unit_str.empty()) {
        unit = parse_unit_string(unit_str);
    }

    // Integral values are converted exactly
    if (value_str.find('.') == std::string::npos) {
        std::uint64_t value;
        try {
            value = std::stoull(value_str);
        } catch (const std::exception&) {
            throw ByteSizeParseError("Invalid numeric value: '" + value_str + "'");
        }
        std::uint64_t factor = unit_factor(unit);
        if (value > std::numeric_limits<std::uint64_t>::max() / factor) {
            throw ByteSizeParseError("Size too large: '" + input + "'");
        }
        return value * factor;
    }

    double value;
    try {
        value = std::stod(value_str);
    } catch (const std::exception&) {
        throw ByteSizeParseError("Invalid numeric value: '" + value_str + "'");
    }

    double bytes = std::floor(value * static_cast<double>(unit_factor(unit)));
    if (!std::isfinite(bytes) ||
        bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
        throw ByteSizeParseError("Size too large: '" + input + "'");
    }
    return static_cast<std::uint64_t>(bytes);
}

// ============================================================================
// FORMATTING
// ============================================================================

std::string format_byte_size(std::uint64_t bytes) {
    static const ByteUnit UNITS[] = {
        ByteUnit::PETABYTES, ByteUnit::TERABYTES, ByteUnit::GIGABYTES,
        ByteUnit::MEGABYTES, ByteUnit::KILOBYTES
    };

    for (ByteUnit unit : UNITS) {
        std::uint64_t factor = ByteSizeParser::unit_factor(unit);
        if (bytes >= factor) {
            std::ostringstream oss;
            oss << std::fixed << std::setprecision(1)
                << static_cast<double>(bytes) / static_cast<double>(factor)
                << " " << ByteSizeParser::unit_to_string(unit);
            return oss.str();
        }
    }
    return std::to_string(bytes) + " bytes";
}

} // namespace gex
