#pragma once
/**
 * @file presets.hpp
 * @brief Configurations prêtes à l'emploi du constructeur de grilles.
 *
 * Chaque surface n'est qu'une SurfaceRequest (axe + métrique + tolérance)
 * passée à build_surface ; aucune ne refait son propre appariement.
 *
 * | preset     | axe                            | tolérance       | métrique        |
 * |------------|--------------------------------|-----------------|-----------------|
 * | price      | strikes distincts              | 0.5 $ absolue   | last            |
 * | iv         | strikes distincts              | 0.5 $ absolue   | IV              |
 * | moneyness  | moneyness distinctes [-10%,10%]| 0.005           | last            |
 * | spot       | [0.95 min S, 1.05 max S], 50 pts| illimitée      | S + last        |
 * | offset     | K - S de -200 à 200 $, 41 pts  | illimitée       | last            |
 * | liquidity  | moneyness [-5%, 5%], 41 pts    | 0.005           | coût effectif   |
 */

#include <cw/surface/grid.hpp>

#include <optional>
#include <string>

namespace cw::surface {

enum class SurfaceKind { Price, ImpliedVol, Moneyness, SpotLevel, StrikeOffset, LiquidityCost };

const char* to_string(SurfaceKind k) noexcept;
std::optional<SurfaceKind> parse_surface_kind(const std::string& s);

constexpr double kStrikeTolerance    = 0.5;
constexpr double kMoneynessTolerance = 0.005;
constexpr double kMoneynessBound     = 0.10;
constexpr double kLiquidityBound     = 0.05;
constexpr std::size_t kSpotPoints    = 50;
constexpr std::size_t kOffsetPoints  = 41;

SurfaceRequest price_surface(const std::vector<metrics::DerivedQuote>& derived,
                             market::OptionSide side, std::size_t sample_every = 1);
SurfaceRequest iv_surface(const std::vector<metrics::DerivedQuote>& derived,
                          market::OptionSide side, std::size_t sample_every = 1);
SurfaceRequest moneyness_surface(const std::vector<metrics::DerivedQuote>& derived,
                                 market::OptionSide side, std::size_t sample_every = 1);
SurfaceRequest spot_level_surface(const std::vector<metrics::DerivedQuote>& derived,
                                  market::OptionSide side, std::size_t sample_every = 1);
SurfaceRequest strike_offset_surface(market::OptionSide side, std::size_t sample_every = 1);
SurfaceRequest liquidity_cost_surface(market::OptionSide side, std::size_t sample_every = 1);

// aiguillage utilisé par surface_export
SurfaceRequest preset_request(SurfaceKind kind,
                              const std::vector<metrics::DerivedQuote>& derived,
                              market::OptionSide side, std::size_t sample_every = 1);

} // namespace cw::surface
