// app/cli/coverage_info/main.cpp
#include "cw/calendar/coverage.hpp"
#include "cw/config/pipeline_config.hpp"
#include "cw/ingest/dataset.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdlib>

static void usage(const char* argv0){
  std::cerr <<
    "Usage: " << argv0 << " -d <dir> [--gap-days 4] [--expected 22] [--missing]\n"
    "Options:\n"
    "  -d / --dir     repertoire des fichiers de chaine (def: dataset)\n"
    "  --gap-days     seuil des trous en jours calendaires (def: 4)\n"
    "  --expected     jours de negociation attendus par mois (def: 22)\n"
    "  --missing      liste les jours ouvres absents\n";
}

int main(int argc, char** argv){
  cw::config::PipelineConfig cfg;
  bool list_missing = false;

  for (int i=1;i<argc;++i){
    std::string a = argv[i];
    if ((a=="-d" || a=="--dir") && i+1<argc) cfg.data_dir = argv[++i];
    else if (a=="--gap-days" && i+1<argc) cfg.gap_threshold_days = std::atol(argv[++i]);
    else if (a=="--expected" && i+1<argc) {
      const long n = std::atol(argv[++i]);
      if (n < 0) { std::cerr << "error: --expected doit etre >= 0\n"; return 1; }
      cfg.expected_per_month = static_cast<std::size_t>(n);
    }
    else if (a=="--missing") list_missing = true;
    else if (a=="-h" || a=="--help") { usage(argv[0]); return 0; }
    else { usage(argv[0]); return 1; }
  }

  cw::ingest::IngestResult res;
  try {
    cfg.validate();
    res = cw::ingest::ingest_directory(cfg.data_dir, cfg.extension);
  } catch (const std::invalid_argument& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }

  const auto dates = res.dataset.distinct_dates();
  std::cout << "Trading days: " << dates.size();
  if (!dates.empty()) std::cout << " (" << dates.front().to_iso() << " .. " << dates.back().to_iso() << ")";
  std::cout << "\n";

  // 1) Trous
  const auto gaps = cw::calendar::find_gaps(dates, cfg.gap_threshold_days);
  std::cout << "Data gaps > " << cfg.gap_threshold_days << " days: " << gaps.size() << "\n";
  for (const auto& g : gaps) {
    std::cout << "  " << g.gap_days << " days between " << g.before.to_iso()
              << " and " << g.after.to_iso() << "\n";
  }

  // 2) Couverture mensuelle
  std::cout << "Monthly coverage (expected ~" << cfg.expected_per_month << "):\n";
  for (const auto& m : cw::calendar::monthly_coverage(dates, cfg.expected_per_month)) {
    std::cout << "  " << m.year << "-" << std::setw(2) << std::setfill('0') << m.month
              << std::setfill(' ') << "  " << std::setw(3) << m.observed << " / " << m.expected
              << "  (" << std::fixed << std::setprecision(1) << 100.0 * m.ratio() << "%)\n"
              << std::defaultfloat;
  }

  // 3) Jours ouvrés absents
  const auto missing = cw::calendar::missing_weekdays(dates);
  std::cout << "Missing weekdays: " << missing.size() << "\n";
  if (list_missing) {
    for (const auto& d : missing) std::cout << "  " << d.to_iso() << "\n";
  }
  return 0;
}
