/**
 * @file ExtentJson.hpp
 * @brief JSON documents exchanged with extractors, protocol clients and callers
 *
 * Records document:    {"records": [{"name", "bbox", "crs", "tbox", "hull"}]}
 * Candidates document: {"files": [{"name", "url", "size"}]}
 * A bare array is accepted for either document.
 */

#pragma once

#include "extent_engine.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace gex {

/**
 * @brief A document does not have the expected structure
 */
class InputFormatError : public std::runtime_error {
public:
    explicit InputFormatError(const std::string& message)
        : std::runtime_error("Input format error: " + message) {}
};

/**
 * @brief Read and parse a JSON file
 * @throws InputFormatError if the file cannot be read or parsed
 */
nlohmann::json load_json_file(const std::string& path);

/**
 * @brief Extent records of a records document
 *
 * A bbox that is not four numbers, or a hull vertex that is not two
 * numbers, is kept as non-finite values so the merger rejects that record
 * alone. A tbox that is not two strings is dropped.
 *
 * @throws InputFormatError if the document is not a records list
 */
std::vector<ExtentRecord> records_from_json(const nlohmann::json& document);

/**
 * @brief Candidate files of a candidates document; missing or invalid size means unknown (0)
 * @throws InputFormatError if the document is not a file list or a file has no name
 */
std::vector<CandidateFile> candidates_from_json(const nlohmann::json& document);

nlohmann::json to_json(const BoundingBox& bbox);
nlohmann::json to_json(const AggregateExtent& extent);
nlohmann::json to_json(const SelectionResult& selection);
nlohmann::json to_json(const CandidateFile& file);

} // namespace gex
