#include "cw/ingest/dataset.hpp"
#include "cw/io/chain_csv.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <unordered_map>

namespace fs = std::filesystem;

namespace {

const std::string kEmpty;

std::string join_warnings(const std::vector<std::string>& w) {
  std::string out;
  for (const auto& s : w) {
    if (!out.empty()) out += "; ";
    out += s;
  }
  return out;
}

std::string lower_ext(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

// Noms répétés dans un même en-tête : x.1, x.2, ... sans jamais reprendre un nom
// présent tel quel dans l'en-tête (la première occurrence garde son nom)
void suffix_repeated_columns(std::vector<std::string>& header) {
  const std::set<std::string> verbatim(header.begin(), header.end());
  std::set<std::string> assigned;
  std::unordered_map<std::string, int> seen;
  for (auto& name : header) {
    if (assigned.insert(name).second) continue;
    int& n = seen[name];
    std::string candidate;
    do {
      candidate = name + "." + std::to_string(++n);
    } while (verbatim.count(candidate) != 0 || assigned.count(candidate) != 0);
    name = candidate;
    assigned.insert(name);
  }
}

} // namespace

namespace cw {
namespace ingest {

const std::vector<std::string>& required_columns() {
  static const std::vector<std::string> kCols = {
    "strike", "bid", "ask", "lastPrice", "volume", "openInterest",
    "impliedVolatility", "inTheMoney", "spx_close", "vix_close", "lastTradeDate"
  };
  return kCols;
}

// ===== NormalizedDataset =====

int NormalizedDataset::column(const std::string& name) const {
  for (int i=0;i<(int)columns.size();++i) {
    if (columns[i] == name) return i;
  }
  return -1;
}

const std::string& NormalizedDataset::cell(std::size_t row, const std::string& name) const {
  const int c = column(name);
  if (c < 0) return kEmpty;
  return rows[row].cells[static_cast<std::size_t>(c)];
}

std::vector<std::string> NormalizedDataset::output_columns() const {
  std::vector<std::string> out = columns;
  out.push_back(kTradeDateColumn);
  out.push_back(kOptionSideColumn);
  out.push_back(kSourceIdColumn);
  return out;
}

std::vector<core::Date> NormalizedDataset::distinct_dates() const {
  std::set<core::Date> s;
  for (const auto& r : rows) s.insert(r.trade_date);
  return std::vector<core::Date>(s.begin(), s.end());
}

std::size_t IngestResult::sources_ok() const {
  return static_cast<std::size_t>(std::count_if(log.begin(), log.end(),
    [](const SourceStatus& s){ return s.ok; }));
}

std::size_t IngestResult::sources_failed() const {
  return log.size() - sources_ok();
}

// ===== identifiants source =====

std::optional<core::Date> extract_trade_date(const std::string& source_id) {
  const std::string name = fs::path(source_id).filename().string();
  std::size_t run = 0;
  for (std::size_t i=0;i<name.size();++i) {
    if (std::isdigit(static_cast<unsigned char>(name[i]))) {
      if (++run == 8) {
        // premier bloc de 8 chiffres : seul candidat (pas de repli sur un bloc suivant)
        return core::Date::from_compact(name.substr(i + 1 - 8, 8));
      }
    } else {
      run = 0;
    }
  }
  return std::nullopt;
}

market::OptionSide extract_option_side(const std::string& source_id) {
  const std::string name = fs::path(source_id).filename().string();
  if (name.find("calls") != std::string::npos) return market::OptionSide::Call;
  if (name.find("puts")  != std::string::npos) return market::OptionSide::Put;
  return market::OptionSide::Unknown;
}

std::vector<fs::path> discover_sources(const fs::path& dir, const std::string& extension) {
  std::vector<fs::path> out;
  for (const auto& entry : fs::directory_iterator(dir)) {
    if (!entry.is_regular_file()) continue;
    if (lower_ext(entry.path().extension().string()) != lower_ext(extension)) continue;
    out.push_back(entry.path());
  }
  std::sort(out.begin(), out.end(), [](const fs::path& a, const fs::path& b){
    return a.filename().string() < b.filename().string();
  });
  return out;
}

// ===== ingestion =====

IngestResult ingest_sources(const std::vector<fs::path>& paths) {
  if (paths.empty()) {
    throw EmptyDatasetError("ingest_sources: aucune source fournie");
  }

  IngestResult res;
  NormalizedDataset& ds = res.dataset;
  std::unordered_map<std::string, std::size_t> col_index;

  for (const auto& p : paths) {
    SourceStatus st;
    st.path = p.string();
    st.source_id = p.filename().string();
    st.side = extract_option_side(st.source_id);
    st.trade_date = extract_trade_date(st.source_id);

    if (!st.trade_date) {
      st.error = "aucune date YYYYMMDD valide dans l'identifiant";
      res.warnings.push_back({DiagnosticCode::SourceParseError, st.source_id, st.error});
      res.log.push_back(std::move(st));
      continue;
    }

    std::vector<std::string> csv_warns;
    auto table = io::read_csv_table(st.path, &csv_warns);
    if (!table) {
      st.error = csv_warns.empty() ? "contenu illisible" : join_warnings(csv_warns);
      res.warnings.push_back({DiagnosticCode::SourceParseError, st.source_id, st.error});
      res.log.push_back(std::move(st));
      continue;
    }

    if (st.side == market::OptionSide::Unknown) {
      res.warnings.push_back({DiagnosticCode::UnknownSide, st.source_id,
                              "ni 'calls' ni 'puts' dans l'identifiant ; côté inconnu"});
    }

    suffix_repeated_columns(table->header);

    // union des colonnes (ordre de première apparition)
    std::vector<std::size_t> mapping(table->header.size());
    for (std::size_t c=0;c<table->header.size();++c) {
      const auto& name = table->header[c];
      auto it = col_index.find(name);
      if (it == col_index.end()) {
        it = col_index.emplace(name, ds.columns.size()).first;
        ds.columns.push_back(name);
        for (auto& r : ds.rows) r.cells.emplace_back();
      }
      mapping[c] = it->second;
    }

    const std::size_t source_idx = ds.sources.size();
    ds.sources.push_back(st.source_id);
    ds.source_columns.push_back(table->header);

    for (auto& cells : table->rows) {
      NormalizedRow row;
      row.cells.assign(ds.columns.size(), std::string());
      for (std::size_t c=0;c<cells.size();++c) row.cells[mapping[c]] = std::move(cells[c]);
      row.trade_date = *st.trade_date;
      row.side = st.side;
      row.source = source_idx;
      ds.rows.push_back(std::move(row));
    }

    st.ok = true;
    st.rows = table->rows.size();
    res.log.push_back(std::move(st));
  }

  if (res.sources_ok() == 0) {
    throw EmptyDatasetError("ingest_sources: aucune des "
                            + std::to_string(paths.size()) + " sources n'a pu être ingérée");
  }
  return res;
}

IngestResult ingest_directory(const fs::path& dir, const std::string& extension) {
  return ingest_sources(discover_sources(dir, extension));
}

// ===== quotes typées =====

std::vector<market::OptionQuote>
extract_quotes(const NormalizedDataset& ds, std::vector<Diagnostic>* warnings) {
  std::vector<market::OptionQuote> out;
  out.reserve(ds.rows.size());

  std::vector<int> req_idx;
  for (const auto& name : required_columns()) req_idx.push_back(ds.column(name));

  std::vector<bool> excluded(ds.sources.size(), false);
  for (std::size_t s=0;s<ds.sources.size();++s) {
    const auto& own = ds.source_columns[s];
    std::string missing;
    for (const auto& name : required_columns()) {
      if (std::find(own.begin(), own.end(), name) == own.end()) {
        missing += (missing.empty() ? "" : ", ") + name;
      }
    }
    if (!missing.empty()) {
      excluded[s] = true;
      if (warnings) {
        warnings->push_back({DiagnosticCode::MissingFieldError, ds.sources[s],
                             "colonnes requises absentes (" + missing
                             + ") ; lignes exclues des métriques"});
      }
    }
  }

  auto get = [&](const NormalizedRow& r, int c) -> const std::string& {
    return c >= 0 ? r.cells[static_cast<std::size_t>(c)] : kEmpty;
  };

  for (std::size_t i=0;i<ds.rows.size();++i) {
    const auto& r = ds.rows[i];
    if (excluded[r.source]) continue;

    market::OptionQuote q;
    q.trade_date = r.trade_date;
    q.side       = r.side;
    q.strike             = io::parse_double(get(r, req_idx[0]));
    q.bid                = io::parse_double(get(r, req_idx[1]));
    q.ask                = io::parse_double(get(r, req_idx[2]));
    q.last_price         = io::parse_double(get(r, req_idx[3]));
    q.volume             = io::parse_count(get(r, req_idx[4]));
    q.open_interest      = io::parse_count(get(r, req_idx[5]));
    q.implied_volatility = io::parse_double(get(r, req_idx[6]));
    q.in_the_money       = io::parse_flag(get(r, req_idx[7]));
    q.underlying_close   = io::parse_double(get(r, req_idx[8]));
    q.vol_index_close    = io::parse_double(get(r, req_idx[9]));
    q.last_trade_date    = get(r, req_idx[10]);
    q.source_id          = ds.sources[r.source];
    q.row                = i;

    if (!std::isfinite(q.strike) || !std::isfinite(q.underlying_close)) {
      if (warnings) {
        warnings->push_back({DiagnosticCode::InvalidRow, q.source_id,
                             "ligne " + std::to_string(i) + " : strike ou spx_close non numérique"});
      }
      continue;
    }
    out.push_back(std::move(q));
  }
  return out;
}

} // namespace ingest
} // namespace cw
