#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @file coefficient_types.hpp
 * @brief Channel layout, result containers, and strategy/frame selectors.
 *
 * Six coefficient channels are carried in a fixed order (C1..C6) through
 * every strategy and both frames. In the structural frame the channels are
 * the three force coefficients along the deck axes (x along the deck,
 * y across, z vertical) followed by the three moment coefficients about
 * the same axes.
 */

namespace deckcoef
{

inline constexpr std::size_t kNumChannels = 6;

enum class Channel : std::size_t
{
    C1 = 0,
    C2 = 1,
    C3 = 2,
    C4 = 3,
    C5 = 4,
    C6 = 5
};

inline constexpr std::array<const char*, kNumChannels> kChannelNames = {"C1", "C2", "C3", "C4", "C5", "C6"};

/**
 * @brief Per-channel sign multipliers (+1 or -1) for one query point.
 */
using ChannelSigns = std::array<double, kNumChannels>;

/**
 * @brief Six channel vectors, one value per query point.
 */
struct CoefficientSet
{
    std::array<std::vector<double>, kNumChannels> channels;

    /**
     * @brief Allocates every channel with n zero values.
     */
    void resize(std::size_t n)
    {
        for (auto& channel : channels)
        {
            channel.assign(n, 0.0);
        }
    }

    /**
     * @brief Returns the number of query points.
     */
    std::size_t size() const { return channels[0].size(); }

    std::vector<double>& operator[](Channel c) { return channels[static_cast<std::size_t>(c)]; }
    const std::vector<double>& operator[](Channel c) const { return channels[static_cast<std::size_t>(c)]; }
};

enum class StrategyKind
{
    FreeFit,
    ConstrainedFit,
    CosineRule,
    CosineRule2D,
    Hybrid
};

enum class Frame
{
    Structural,
    WindNormal,
    Both
};

/**
 * @brief Orchestrator output. Only the requested frames are populated.
 */
struct CoefficientResult
{
    std::optional<CoefficientSet> structural;
    std::optional<CoefficientSet> wind_normal;
};

/**
 * @brief Parses a strategy token (e.g. "2D_fit_free", "cos_rule").
 * @throws UnsupportedConfigurationError for unknown tokens.
 */
StrategyKind parse_strategy_kind(const std::string& token);

/**
 * @brief Parses a frame token ("Ls", "Lnw", "Lnw&Ls" and long aliases).
 * @throws UnsupportedConfigurationError for unknown tokens.
 */
Frame parse_frame(const std::string& token);

/**
 * @brief Returns the canonical token for a strategy.
 */
const char* to_string(StrategyKind kind);

/**
 * @brief Returns the canonical token for a frame.
 */
const char* to_string(Frame frame);

} // namespace deckcoef
