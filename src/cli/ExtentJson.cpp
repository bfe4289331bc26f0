/**
 * @file ExtentJson.cpp
 * @brief nlohmann::json conversion of records, candidates and results
 */

#include "ExtentJson.hpp"
#include "../core/Logger.hpp"
#include <cmath>
#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace gex {

namespace {

constexpr double NOT_A_NUMBER = std::numeric_limits<double>::quiet_NaN();

const json& list_member(const json& document, const char* key) {
    if (document.is_array()) {
        return document;
    }
    if (document.is_object() && document.contains(key) && document[key].is_array()) {
        return document[key];
    }
    throw InputFormatError(std::string("expected an array or an object with a \"") + key +
                           "\" array");
}

double number_or_nan(const json& value) {
    return value.is_number() ? value.get<double>() : NOT_A_NUMBER;
}

BoundingBox parse_bbox(const json& value) {
    if (!value.is_array() || value.size() != 4) {
        return BoundingBox(NOT_A_NUMBER, NOT_A_NUMBER, NOT_A_NUMBER, NOT_A_NUMBER);
    }
    return BoundingBox(number_or_nan(value[0]), number_or_nan(value[1]),
                       number_or_nan(value[2]), number_or_nan(value[3]));
}

Ring parse_hull(const json& value) {
    Ring hull;
    if (!value.is_array()) {
        hull.emplace_back(NOT_A_NUMBER, NOT_A_NUMBER);
        return hull;
    }
    for (const auto& vertex : value) {
        if (vertex.is_array() && vertex.size() == 2) {
            hull.emplace_back(number_or_nan(vertex[0]), number_or_nan(vertex[1]));
        } else {
            hull.emplace_back(NOT_A_NUMBER, NOT_A_NUMBER);
        }
    }
    return hull;
}

json point_json(const Point2D& p) {
    return json::array({p.x(), p.y()});
}

} // namespace

json load_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw InputFormatError("could not open " + path);
    }
    try {
        json document;
        file >> document;
        return document;
    } catch (const json::exception& e) {
        throw InputFormatError(path + ": " + e.what());
    }
}

std::vector<ExtentRecord> records_from_json(const json& document) {
    Logger logger("ExtentJson");
    const json& list = list_member(document, "records");

    std::vector<ExtentRecord> records;
    records.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        const json& item = list[i];
        if (!item.is_object()) {
            throw InputFormatError("record " + std::to_string(i + 1) + " is not an object");
        }

        ExtentRecord record;
        if (item.contains("name") && item["name"].is_string()) {
            record.name = item["name"].get<std::string>();
        }
        if (item.contains("bbox") && !item["bbox"].is_null()) {
            record.bbox = parse_bbox(item["bbox"]);
        }
        if (item.contains("crs") && !item["crs"].is_null()) {
            const json& crs = item["crs"];
            if (crs.is_string()) {
                record.crs = crs.get<std::string>();
            } else if (crs.is_number_integer()) {
                record.crs = std::to_string(crs.get<long long>());
            }
        }
        if (item.contains("tbox") && !item["tbox"].is_null()) {
            const json& tbox = item["tbox"];
            if (tbox.is_array() && tbox.size() == 2 && tbox[0].is_string() && tbox[1].is_string()) {
                record.tbox = TemporalExtent{tbox[0].get<std::string>(), tbox[1].get<std::string>()};
            } else {
                logger.debug("Dropping malformed tbox of record " + std::to_string(i + 1));
            }
        }
        if (item.contains("hull") && !item["hull"].is_null()) {
            record.hull = parse_hull(item["hull"]);
        }
        records.push_back(std::move(record));
    }

    logger.detailed("Read " + std::to_string(records.size()) + " extent records");
    return records;
}

std::vector<CandidateFile> candidates_from_json(const json& document) {
    Logger logger("ExtentJson");
    const json& list = list_member(document, "files");

    std::vector<CandidateFile> files;
    files.reserve(list.size());
    for (size_t i = 0; i < list.size(); ++i) {
        const json& item = list[i];
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) {
            throw InputFormatError("file " + std::to_string(i + 1) + " has no name");
        }

        CandidateFile file;
        file.name = item["name"].get<std::string>();
        if (item.contains("url") && item["url"].is_string()) {
            file.url = item["url"].get<std::string>();
        }
        if (item.contains("size") && !item["size"].is_null()) {
            const json& size = item["size"];
            if (size.is_number_unsigned()) {
                file.size = size.get<std::uint64_t>();
            } else if (size.is_number_integer() && size.get<long long>() >= 0) {
                file.size = static_cast<std::uint64_t>(size.get<long long>());
            } else {
                logger.warning("Invalid size for " + file.name + ", treating as unknown");
            }
        }
        files.push_back(std::move(file));
    }

    logger.detailed("Read " + std::to_string(files.size()) + " candidate files");
    return files;
}

json to_json(const BoundingBox& bbox) {
    return json::array({bbox.min_x, bbox.min_y, bbox.max_x, bbox.max_y});
}

json to_json(const AggregateExtent& extent) {
    json out;
    const MergedExtent& spatial = extent.spatial;

    out["bbox"] = spatial.bbox ? to_json(*spatial.bbox) : json(nullptr);
    out["crs"] = spatial.crs ? json(*spatial.crs) : json(nullptr);
    out["convex_hull"] = spatial.convex_hull;
    if (spatial.hull) {
        json hull = json::array();
        for (const auto& p : *spatial.hull) {
            hull.push_back(point_json(p));
        }
        out["hull"] = hull;
    }
    out["is_point"] = spatial.is_point;
    out["point"] = spatial.point ? point_json(*spatial.point) : json(nullptr);

    if (extent.temporal) {
        out["tbox"] = json::array({extent.temporal->start, extent.temporal->end});
    } else {
        out["tbox"] = nullptr;
    }

    out["records_total"] = extent.records_total;
    out["records_with_spatial"] = extent.records_with_spatial;
    out["records_with_temporal"] = extent.records_with_temporal;
    return out;
}

json to_json(const CandidateFile& file) {
    return json{{"name", file.name}, {"url", file.url}, {"size", file.size}};
}

json to_json(const SelectionResult& selection) {
    json selected = json::array();
    for (const auto& file : selection.selected) {
        selected.push_back(to_json(file));
    }
    json skipped = json::array();
    for (const auto& file : selection.skipped) {
        skipped.push_back(to_json(file));
    }
    return json{{"selected", selected}, {"total_bytes", selection.total_bytes}, {"skipped", skipped}};
}

} // namespace gex
