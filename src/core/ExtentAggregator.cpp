/**
 * @file ExtentAggregator.cpp
 * @brief Facade tying the mergers and the selector to one configuration
 */

#include "extent_engine.hpp"
#include "BudgetedSelector.hpp"
#include "Logger.hpp"
#include "OgrPlanarGeometry.hpp"
#include "SpatialMerger.hpp"
#include "TemporalMerger.hpp"

namespace gex {

// ============================================================================
// ExtentAggregator::Impl - Private implementation
// ============================================================================

class ExtentAggregator::Impl {
public:
    explicit Impl(const ExtentConfig& config)
        : config_(config),
          owned_geometry_(std::make_unique<OgrPlanarGeometry>()),
          geometry_(*owned_geometry_),
          logger_("ExtentAggregator") {}

    Impl(const ExtentConfig& config, const PlanarGeometry& geometry)
        : config_(config),
          geometry_(geometry),
          logger_("ExtentAggregator") {}

    AggregateExtent aggregate(const std::vector<ExtentRecord>& records,
                              const std::string& origin) const {
        AggregateExtent result;
        result.records_total = records.size();

        if (config_.spatial) {
            SpatialMerger merger(geometry_, SpatialMergeOptions::from_config(config_));
            MergeMode mode = config_.convex_hull ? MergeMode::CONVEX_HULL : MergeMode::BOUNDING_BOX;
            result.spatial = merger.merge(records, mode, origin);
            result.records_with_spatial = result.spatial.contributors;
        }

        if (config_.temporal) {
            TemporalMerger merger;
            result.temporal = merger.merge(records, &result.records_with_temporal);
        }

        logger_.info(origin + ": " + std::to_string(result.records_with_spatial) + " of " +
                     std::to_string(records.size()) + " records with identifiable spatial extent, " +
                     std::to_string(result.records_with_temporal) + " with temporal extent");
        if (result.spatial.is_point) {
            logger_.detailed(origin + ": merged extent is a single point");
        }
        return result;
    }

    SelectionResult select_downloads(const std::vector<CandidateFile>& files) const {
        BudgetedSelector selector(config_.composite_extensions);
        return selector.select(files, config_);
    }

    void update_config(const ExtentConfig& config) { config_ = config; }
    const ExtentConfig& get_config() const { return config_; }

private:
    ExtentConfig config_;
    std::unique_ptr<PlanarGeometry> owned_geometry_;
    const PlanarGeometry& geometry_;
    Logger logger_;
};

// ============================================================================
// ExtentAggregator Public Interface
// ============================================================================

ExtentAggregator::ExtentAggregator(const ExtentConfig& config)
    : impl_(std::make_unique<Impl>(config)) {
}

ExtentAggregator::ExtentAggregator(const ExtentConfig& config, const PlanarGeometry& geometry)
    : impl_(std::make_unique<Impl>(config, geometry)) {
}

ExtentAggregator::~ExtentAggregator() = default;

AggregateExtent ExtentAggregator::aggregate(const std::vector<ExtentRecord>& records,
                                            const std::string& origin) const {
    return impl_->aggregate(records, origin);
}

SelectionResult ExtentAggregator::select_downloads(const std::vector<CandidateFile>& files) const {
    return impl_->select_downloads(files);
}

void ExtentAggregator::update_config(const ExtentConfig& config) {
    impl_->update_config(config);
}

const ExtentConfig& ExtentAggregator::get_config() const {
    return impl_->get_config();
}

} // namespace gex
