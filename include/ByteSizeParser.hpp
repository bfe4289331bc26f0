#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace gex {

/**
 * @brief Exception thrown when a byte size string cannot be parsed
 */
class ByteSizeParseError : public std::runtime_error {
public:
    explicit ByteSizeParseError(const std::string& message)
        : std::runtime_error("Byte size parsing error: " + message) {}
};

/**
 * @brief Byte size units
 */
enum class ByteUnit {
    BYTES,      // B
    KILOBYTES,  // KB  (1000)
    MEGABYTES,  // MB
    GIGABYTES,  // GB
    TERABYTES,  // TB
    PETABYTES,  // PB
    KIBIBYTES,  // KiB (1024)
    MEBIBYTES,  // MiB
    GIBIBYTES,  // GiB
    TEBIBYTES,  // TiB
    PEBIBYTES   // PiB
};

/**
 * @brief Parses download size limits with optional unit suffixes
 *
 * Examples:
 *   --max-download-size 100MB
 *   --max-download-size "2.5 GiB"
 *   max_download_size=500000
 */
class ByteSizeParser {
public:
    /**
     * @brief Parse a size string into bytes
     *
     * @param input String to parse (e.g., "100MB", "1.5GB", "512 KiB", "2048")
     * @return Size in bytes, rounded down
     * @throws ByteSizeParseError on empty, negative or unrecognized input
     *
     * Examples:
     *   parse("100MB") -> 100000000
     *   parse("1KiB") -> 1024
     *   parse("2048") -> 2048
     */
    static std::uint64_t parse(const std::string& input);

    /**
     * @brief Bytes per unit (1 for BYTES, 1000^n or 1024^n otherwise)
     */
    static std::uint64_t unit_factor(ByteUnit unit);

    /**
     * @brief Parse unit string to ByteUnit (case-insensitive)
     * @throws ByteSizeParseError if unit string is not recognized
     */
    static ByteUnit parse_unit_string(const std::string& unit_str);

    static std::string unit_to_string(ByteUnit unit);

private:
    /**
     * @brief Split numeric value and unit suffix
     *
     * Examples:
     *   "200" -> ("200", "")
     *   "5MB" -> ("5", "MB")
     *   "1.5 GiB" -> ("1.5", "GiB")
     */
    static std::pair<std::string, std::string> split_value_and_unit(const std::string& input);
};

/**
 * @brief Shorthand for ByteSizeParser::parse()
 */
inline std::uint64_t parse_byte_size(const std::string& input) {
    return ByteSizeParser::parse(input);
}

/**
 * @brief Human readable size for log messages ("1.5 MB", "980 bytes")
 */
std::string format_byte_size(std::uint64_t bytes);

} // namespace gex
