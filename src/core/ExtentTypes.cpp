/**
 * @file ExtentTypes.cpp
 * @brief Out-of-line members of the shared value types
 */

#include "extent_engine.hpp"
#include "Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace gex {

bool BoundingBox::is_valid() const {
    return std::isfinite(min_x) && std::isfinite(min_y) &&
           std::isfinite(max_x) && std::isfinite(max_y) &&
           min_x <= max_x && min_y <= max_y;
}

void BoundingBox::expand(const BoundingBox& other) {
    min_x = std::min(min_x, other.min_x);
    min_y = std::min(min_y, other.min_y);
    max_x = std::max(max_x, other.max_x);
    max_y = std::max(max_y, other.max_y);
}

std::optional<BoundingBox> envelope_of(const Ring& points) {
    if (points.empty()) {
        return std::nullopt;
    }
    BoundingBox box(points.front().x(), points.front().y(),
                    points.front().x(), points.front().y());
    for (const auto& p : points) {
        box.expand(BoundingBox(p.x(), p.y(), p.x(), p.y()));
    }
    return box;
}

DownloadSizeExceeded::DownloadSizeExceeded(std::uint64_t estimated_bytes,
                                           std::uint64_t limit_bytes,
                                           const std::string& source_name)
    : std::runtime_error([&] {
          std::ostringstream oss;
          oss << source_name << ": estimated download size " << estimated_bytes
              << " bytes exceeds limit of " << limit_bytes << " bytes";
          return oss.str();
      }()),
      estimated_bytes_(estimated_bytes),
      limit_bytes_(limit_bytes),
      source_name_(source_name) {}

SelectionPolicy parse_selection_policy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "ordered") return SelectionPolicy::ORDERED;
    if (lower == "random") return SelectionPolicy::RANDOM;
    if (lower == "smallest") return SelectionPolicy::SMALLEST;
    if (lower == "largest") return SelectionPolicy::LARGEST;

    Logger logger("BudgetedSelector");
    logger.warning("Unknown download method '" + name + "', falling back to 'ordered'");
    return SelectionPolicy::ORDERED;
}

std::string selection_policy_name(SelectionPolicy policy) {
    switch (policy) {
        case SelectionPolicy::ORDERED:  return "ordered";
        case SelectionPolicy::RANDOM:   return "random";
        case SelectionPolicy::SMALLEST: return "smallest";
        case SelectionPolicy::LARGEST:  return "largest";
    }
    return "ordered";
}

} // namespace gex
