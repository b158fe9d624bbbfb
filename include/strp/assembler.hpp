#pragma once

/// @file include/strp/assembler.hpp
/// @brief Feature Assembler: merge engine outputs into one feature matrix.
///
/// # Module: Feature Assembler
///
/// ## Responsibility
/// Own the ordered list of feature engines, check that their declared
/// columns never collide, run them over a listing batch and concatenate
/// their blocks into a `FeatureMatrix` keyed by listing id.
///
/// ## Guarantees
/// - Column collisions are reported at construction, before any data is seen
/// - Exactly one output row per input listing, in input order
/// - Per-record problems (bad coordinates, malformed amenities, engine
///   failures) never abort a batch; they are counted in diagnostics
///
/// ## NOT Responsible For
/// - Target selection or train/test splitting (see strp/orchestrator.hpp)

#include "strp/config.hpp"
#include "strp/errors.hpp"
#include "strp/feature_engine.hpp"
#include "strp/feature_matrix.hpp"
#include "strp/types.hpp"

#include <memory>
#include <span>
#include <vector>

namespace strp::features {

/// Listing attributes used directly as features.
///
/// Columns: price, accommodates, bedrooms, bathrooms, beds,
/// room_entire_place, room_private_room, room_shared_room, total_rooms,
/// bedroom_bathroom_ratio.
class BaseListingEngine final : public PerListingEngine {
public:
    BaseListingEngine();

    [[nodiscard]] std::string_view name() const noexcept override { return "base"; }
    [[nodiscard]] const std::vector<ColumnSpec>& columns() const noexcept override { return columns_; }

protected:
    [[nodiscard]] RowStatus compute_row(const Listing& listing,
                                        std::span<double> row) const override;

private:
    std::vector<ColumnSpec> columns_;
};

class FeatureAssembler {
public:
    using EnginePtr = std::shared_ptr<const FeatureEngine>;

    /// Assemble from an explicit engine list.
    ///
    /// # Returns
    /// `ConfigurationError` if the configuration is invalid, an engine is
    /// null, or two engines declare the same column name.
    [[nodiscard]] static Result<FeatureAssembler> create(std::vector<EnginePtr> engines,
                                                         FeatureConfig config);

    /// Standard engine set: base, distance, grid, temporal, trust, amenity.
    [[nodiscard]] static Result<FeatureAssembler> from_config(std::span<const Poi> pois,
                                                              const FeatureConfig& config);

    /// Run every engine over `listings`.
    [[nodiscard]] FeatureMatrix assemble(std::span<const Listing> listings) const;

    [[nodiscard]] const std::vector<ColumnSpec>& columns() const noexcept { return columns_; }
    [[nodiscard]] const std::vector<EnginePtr>&  engines() const noexcept { return engines_; }
    [[nodiscard]] const FeatureConfig&           config() const noexcept { return config_; }

private:
    FeatureAssembler(std::vector<EnginePtr> engines, std::vector<ColumnSpec> columns,
                     FeatureConfig config);

    std::vector<EnginePtr>  engines_;
    std::vector<ColumnSpec> columns_;
    FeatureConfig           config_;
    std::size_t             skipped_pois_ = 0;
};

}  // namespace strp::features
