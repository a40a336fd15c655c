#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cw::io {

// Table CSV brute : en-tête tel quel (trim uniquement), cellules en texte.
// Aucun renommage de colonne, aucune conversion de type.
struct CsvTable {
  std::vector<std::string> header;
  std::vector<std::vector<std::string>> rows; // chaque ligne a header.size() cellules

  // index de colonne (comparaison exacte), -1 si absente
  int column(const std::string& name) const;
};

// Lit un CSV avec en-tête. Champs "..." gérés (y compris sauts de ligne internes),
// \r final toléré, lignes vides ignorées.
// Guillemet jamais refermé -> fichier rejeté (nullopt).
// Ligne plus courte que l'en-tête -> complétée par des cellules vides.
// Ligne plus longue -> fichier rejeté (nullopt).
// Fichier introuvable ou sans en-tête -> nullopt.
// warnings est optionnel pour diagnostic.
std::optional<CsvTable>
read_csv_table(const std::string& path,
               std::vector<std::string>* warnings = nullptr);

// Découpe une ligne CSV (guillemets doublés "" -> ").
std::vector<std::string> split_csv_line(const std::string& line);

// Échappe un champ pour l'écriture (guillemets si , " ou saut de ligne).
std::string escape_csv_field(const std::string& field);

// parse double tolérant ("" ou non numérique -> NaN)
double parse_double(const std::string& s);

// entier de comptage : "12", "12.0" acceptés ; "" ou non entier -> nullopt
std::optional<long long> parse_count(const std::string& s);

// booléen : True/False/true/false/1/0/t/f ; autre -> nullopt
std::optional<bool> parse_flag(const std::string& s);

} // namespace cw::io
