#pragma once

#include <memory>
#include <string>
#include <vector>

#include "angle_folding.hpp"
#include "coefficient_types.hpp"
#include "measurement_table.hpp"
#include "surface_fit_base.hpp"

/**
 * @file coefficient_scheme_base.hpp
 * @brief Strategy interface for interpolating/extrapolating coefficient channels.
 *
 * A scheme receives the folded query (canonical yaws, unchanged thetas, and
 * per-point signs) and returns sign-corrected structural-frame values for
 * all six channels. Schemes hold no per-call state and are safe to share
 * between threads.
 */

namespace deckcoef
{

class CoefficientSchemeBase
{
public:
    /**
     * @brief Virtual destructor for polymorphic cleanup.
     */
    virtual ~CoefficientSchemeBase() = default;

    /**
     * @brief Returns the scheme identifier.
     */
    virtual std::string name() const = 0;

    /**
     * @brief Returns the strategy this scheme implements.
     */
    virtual StrategyKind kind() const = 0;

    /**
     * @brief Evaluates all channels at the folded query points.
     * @param query Folded query angles and signs.
     * @param table Measurement table, read only.
     * @param fits Per-channel fit configuration.
     * @return Structural-frame values with quadrant signs applied.
     */
    virtual CoefficientSet evaluate(const FoldedQuery& query,
                                    const MeasurementTable& table,
                                    const ChannelFitTable& fits) const = 0;
};

/**
 * @brief Creates the scheme implementing a strategy.
 */
std::unique_ptr<CoefficientSchemeBase> create_coefficient_scheme(StrategyKind kind);

/**
 * @brief Creates a scheme by token.
 * @throws UnsupportedConfigurationError for unknown tokens.
 */
std::unique_ptr<CoefficientSchemeBase> create_coefficient_scheme(const std::string& scheme_name);

/**
 * @brief Lists the canonical strategy tokens.
 */
std::vector<std::string> get_available_coefficient_schemes();

} // namespace deckcoef
