#pragma once
#include <cw/ingest/dataset.hpp>
#include <cw/metrics/aggregate.hpp>
#include <cw/metrics/derived.hpp>
#include <cw/surface/grid.hpp>

#include <iosfwd>
#include <string>
#include <vector>

namespace cw::io {

// Écritures CSV des sorties d'étape. NaN / valeur absente -> cellule vide.
// Les variantes "path" créent le répertoire parent si besoin et lèvent
// std::runtime_error si le fichier ne peut pas être ouvert.

// Colonnes source (union) + trade_date, option_side, source_id
void write_normalized_csv(std::ostream& out, const ingest::NormalizedDataset& ds);
void write_normalized_csv(const std::string& path, const ingest::NormalizedDataset& ds);

// Table normalisée (ligne d'origine via OptionQuote::row) + champs dérivés
void write_derived_csv(std::ostream& out,
                       const ingest::NormalizedDataset& ds,
                       const std::vector<metrics::DerivedQuote>& derived);
void write_derived_csv(const std::string& path,
                       const ingest::NormalizedDataset& ds,
                       const std::vector<metrics::DerivedQuote>& derived);

// Format long : trade_date,<axe>,<métrique>,baseline (une ligne par cellule)
void write_surface_csv(std::ostream& out, const surface::SurfaceGrid& grid);
void write_surface_csv(const std::string& path, const surface::SurfaceGrid& grid);

void write_liquidity_summary_csv(std::ostream& out,
                                 const std::vector<metrics::LiquiditySummary>& rows);
void write_liquidity_summary_csv(const std::string& path,
                                 const std::vector<metrics::LiquiditySummary>& rows);

// Nombre formaté pour CSV (précision 10 chiffres), "" si non fini
std::string format_number(double x);

} // namespace cw::io
