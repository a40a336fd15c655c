#include "cw/io/chain_csv.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](int ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}
// nombre impair de " : un champ entre guillemets reste ouvert ("" compte pour 2)
static inline bool open_quote(const std::string& s) {
  return std::count(s.begin(), s.end(), '"') % 2 == 1;
}

} // namespace

namespace cw::io {

int CsvTable::column(const std::string& name) const {
  for (int i=0;i<(int)header.size();++i) {
    if (header[i] == name) return i;
  }
  return -1;
}

// CSV splitter minimal qui gère les champs entre "..."
std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

std::string escape_csv_field(const std::string& field) {
  if (field.find_first_of(",\"\n\r") == std::string::npos) return field;
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

double parse_double(const std::string& s) {
  if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
  char* end=nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end==s.c_str()) return std::numeric_limits<double>::quiet_NaN();
  return v;
}

std::optional<long long> parse_count(const std::string& s) {
  double v = parse_double(trim(s));
  if (!std::isfinite(v)) return std::nullopt;
  // pandas écrit "123.0" dès qu'une colonne entière contient un NaN
  if (std::floor(v) != v) return std::nullopt;
  return static_cast<long long>(std::llround(v));
}

std::optional<bool> parse_flag(const std::string& s) {
  auto l = lower(trim(s));
  if (l=="true"  || l=="t" || l=="1" || l=="1.0") return true;
  if (l=="false" || l=="f" || l=="0" || l=="0.0") return false;
  return std::nullopt;
}

std::optional<CsvTable>
read_csv_table(const std::string& path,
               std::vector<std::string>* warnings)
{
  std::ifstream f(path);
  if (!f) {
    if (warnings) warnings->push_back("Impossible d'ouvrir le fichier: " + path);
    return std::nullopt;
  }

  CsvTable table;
  std::string line;
  std::string record;
  bool header_seen = false;
  std::size_t line_no = 0;
  std::size_t record_start = 0;

  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back()=='\r') line.pop_back();

    // enregistrement multi-lignes : saut de ligne dans un champ "..."
    if (!record.empty()) {
      record += '\n';
      record += line;
    } else {
      if (trim(line).empty()) continue;
      record = line;
      record_start = line_no;
    }
    if (open_quote(record)) continue;

    auto cells = split_csv_line(record);
    record.clear();

    if (!header_seen) {
      table.header = std::move(cells);
      header_seen = true;
      continue;
    }

    if (cells.size() > table.header.size()) {
      if (warnings) {
        warnings->push_back("Ligne " + std::to_string(record_start) + ": "
                            + std::to_string(cells.size()) + " champs pour "
                            + std::to_string(table.header.size()) + " colonnes");
      }
      return std::nullopt;
    }
    cells.resize(table.header.size());
    table.rows.push_back(std::move(cells));
  }

  if (!record.empty()) {
    if (warnings) {
      warnings->push_back("Ligne " + std::to_string(record_start)
                          + ": guillemet non fermé en fin de fichier");
    }
    return std::nullopt;
  }

  if (!header_seen) {
    if (warnings) warnings->push_back("Fichier vide (pas d'en-tête): " + path);
    return std::nullopt;
  }
  return table;
}

} // namespace cw::io
