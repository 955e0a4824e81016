#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "chessdb/v1.hpp"
#include "internal/analytics/analytics_engine.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/ingest/import_pipeline.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using chessdb::observability::StringField;

namespace {

constexpr int kExitOk       = 0;
constexpr int kExitUsage    = 1;
constexpr int kExitFatal    = 2;
constexpr int kExitMismatch = 3;

volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
  g_interrupted = 1;
}

void Usage(std::ostream& out) {
  out << "Usage:\n"
      << "  chessdb [--config <file>] setup\n"
      << "  chessdb [--config <file>] import <file.pgn> [max-games]\n"
      << "  chessdb [--config <file>] opening-stats [min-games] [bullet|blitz|rapid|classical|unknown]\n"
      << "  chessdb [--config <file>] time-control-stats\n"
      << "  chessdb [--config <file>] player <name>\n"
      << "  chessdb [--config <file>] volatility [min-points]\n"
      << "  chessdb [--config <file>] verify\n"
      << "  chessdb [--config <file>] status\n"
      << "  chessdb help\n";
}

std::optional<uint64_t> ParseCount(const std::string& value) {
  if (value.empty() || value.size() > 18) return std::nullopt;
  uint64_t out = 0;
  for (char c : value) {
    if (c < '0' || c > '9') return std::nullopt;
    out = out * 10 + static_cast<uint64_t>(c - '0');
  }
  return out;
}

std::string Percent(double rate) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << rate * 100.0 << "%";
  return out.str();
}

std::string Rating(const std::optional<double>& rating) {
  if (!rating) return "-";
  std::ostringstream out;
  out << std::fixed << std::setprecision(0) << *rating;
  return out.str();
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

int RunImport(chessdb::factory::Application& app, const std::string& path, std::optional<uint64_t> max_games) {
  auto options      = app.import_options;
  options.max_games = max_games;

  chessdb::ingest::ImportPipeline pipeline(app.repository, options);

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  std::atomic<bool> done{false};
  std::thread       watcher([&] {
    while (!done.load()) {
      if (g_interrupted) {
        CHESSDB_LOG_WARN("Interrupt received, cancelling import");
        pipeline.Cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  chessdb::ingest::ImportSummary summary;
  try {
    summary = pipeline.ImportFile(path);
  } catch (const std::exception&) {
    done = true;
    watcher.join();
    throw;
  }
  done = true;
  watcher.join();

  std::cout << "Import " << (summary.cancelled ? "cancelled" : "complete") << ": " << summary.source << "\n"
            << "  processed:        " << summary.processed << "\n"
            << "  accepted:         " << summary.accepted << "\n"
            << "  rejected:         " << summary.rejected << " (parse " << summary.parse_errors << ", validation "
            << summary.validation_errors << ")\n"
            << "  games committed:  " << summary.games_committed << "\n"
            << "  duplicates:       " << summary.duplicates << "\n"
            << "  new players:      " << summary.new_players << "\n"
            << "  new openings:     " << summary.new_openings << "\n"
            << "  name conflicts:   " << summary.name_conflicts << "\n"
            << "  failed batches:   " << summary.failed_batches.size() << "\n";
  if (summary.discarded_records > 0) {
    std::cout << "  discarded:        " << summary.discarded_records << "\n";
  }
  for (const auto& [reason, count] : summary.rejects_by_reason) {
    std::cout << "    " << std::left << std::setw(24) << reason << count << "\n";
  }
  for (const auto& failed : summary.failed_batches) {
    std::cout << "  batch " << failed.seq << " failed (" << failed.records.size() << " records): " << failed.error << "\n";
  }
  return kExitOk;
}

int RunOpeningStats(chessdb::factory::Application& app, const chessdb::analytics::QueryOptions& options) {
  auto stats = app.analytics->OpeningSuccessRates(options);
  if (stats.empty()) {
    std::cout << "No openings match.\n";
    return kExitOk;
  }

  std::cout << std::left << std::setw(5) << "ECO" << std::setw(36) << "Opening" << std::right << std::setw(8) << "Games" << std::setw(8)
            << "White" << std::setw(8) << "Black" << std::setw(8) << "Draw" << std::setw(8) << "Adv" << std::setw(8) << "Rating"
            << "\n";
  for (const auto& s : stats) {
    std::cout << std::left << std::setw(5) << s.eco_code << std::setw(36) << s.opening_name.substr(0, 35) << std::right << std::setw(8)
              << s.games << std::setw(8) << Percent(s.white_win_rate) << std::setw(8) << Percent(s.black_win_rate) << std::setw(8)
              << Percent(s.draw_rate) << std::setw(8) << Percent(s.white_advantage) << std::setw(8) << Rating(s.avg_rating) << "\n";
  }
  return kExitOk;
}

int RunTimeControlStats(chessdb::factory::Application& app) {
  auto stats = app.analytics->TimeControlComparison();
  if (stats.empty()) {
    std::cout << "No games.\n";
    return kExitOk;
  }

  std::cout << std::left << std::setw(11) << "Control" << std::right << std::setw(8) << "Games" << std::setw(8) << "White" << std::setw(8)
            << "Black" << std::setw(8) << "Draw" << std::setw(8) << "Rating"
            << "\n";
  for (const auto& s : stats) {
    std::cout << std::left << std::setw(11) << chessdb::v1::TimeControlLabel(s.time_control) << std::right << std::setw(8) << s.games
              << std::setw(8) << Percent(s.white_win_rate) << std::setw(8) << Percent(s.black_win_rate) << std::setw(8)
              << Percent(s.draw_rate) << std::setw(8) << Rating(s.avg_rating) << "\n";
  }
  return kExitOk;
}

int RunPlayer(chessdb::factory::Application& app, const std::string& name) {
  auto profile = app.analytics->FindPlayer(name);
  if (!profile) {
    std::cout << "No player named '" << name << "'.\n";
    return kExitOk;
  }

  const auto& p = profile->player;
  std::cout << p.display_name;
  if (!p.title.empty()) std::cout << " (" << p.title << ")";
  std::cout << "\n"
            << "  rating:        " << p.current_rating << " (peak " << p.peak_rating << ")\n"
            << "  games:         " << p.games_played << "\n"
            << "  rating points: " << profile->rating_points << "\n"
            << "  first seen:    " << chessdb::util::FormatUtc(p.first_seen_ms) << "\n";

  if (!profile->recent.empty()) {
    std::cout << "  recent ratings:\n";
    for (const auto& point : profile->recent) {
      std::cout << "    " << chessdb::util::FormatUtc(point.timestamp_ms) << "  " << point.rating << "  "
                << chessdb::v1::TimeControlLabel(point.time_control) << "\n";
    }
  }

  for (auto color : {chessdb::v1::COLOR_WHITE, chessdb::v1::COLOR_BLACK}) {
    auto repertoire = app.analytics->PlayerRepertoire(name, color);
    if (repertoire.empty()) continue;
    std::cout << "  repertoire as " << chessdb::v1::ColorLabel(color) << ":\n";
    for (const auto& e : repertoire) {
      std::cout << "    " << std::left << std::setw(5) << e.eco_code << std::setw(32) << e.opening_name.substr(0, 31) << std::right
                << std::setw(6) << e.games << "  +" << e.wins << " =" << e.draws << " -" << e.losses << "  score " << Percent(e.score_rate)
                << "\n";
    }
  }
  return kExitOk;
}

int RunVolatility(chessdb::factory::Application& app, const chessdb::analytics::QueryOptions& options) {
  auto entries = app.analytics->RatingVolatility(options);
  if (entries.empty()) {
    std::cout << "No players with enough rating points.\n";
    return kExitOk;
  }

  std::cout << std::left << std::setw(28) << "Player" << std::right << std::setw(8) << "Points" << std::setw(10) << "StdDev" << std::setw(8)
            << "Avg" << std::setw(8) << "Min" << std::setw(8) << "Max"
            << "\n";
  for (const auto& e : entries) {
    std::cout << std::left << std::setw(28) << e.display_name.substr(0, 27) << std::right << std::setw(8) << e.points << std::setw(10)
              << std::fixed << std::setprecision(2) << e.rating_stddev << std::setw(8) << std::setprecision(0) << e.avg_rating
              << std::setw(8) << e.min_rating << std::setw(8) << e.max_rating << "\n";
  }
  return kExitOk;
}

int RunVerify(chessdb::factory::Application& app) {
  auto report = app.analytics->VerifyOpeningCounters();
  std::cout << "Checked " << report.openings_checked << " openings, " << report.mismatches.size() << " mismatches.\n";
  for (const auto& m : report.mismatches) {
    std::cout << "  " << m.eco_code << ": stored games=" << m.stored.games << " w=" << m.stored.white_wins << " b=" << m.stored.black_wins
              << " d=" << m.stored.draws << ", recomputed games=" << m.recomputed.games << " w=" << m.recomputed.white_wins
              << " b=" << m.recomputed.black_wins << " d=" << m.recomputed.draws << "\n";
  }
  return report.Ok() ? kExitOk : kExitMismatch;
}

int RunStatus(chessdb::factory::Application& app) {
  auto report = app.analytics->Status();
  std::cout << "players:        " << report.counts.players << "\n"
            << "openings:       " << report.counts.openings << "\n"
            << "games:          " << report.counts.games << "\n"
            << "rating points:  " << report.counts.rating_points << "\n"
            << "import runs:    " << report.counts.import_runs << "\n";
  if (report.last_import) {
    const auto& run = *report.last_import;
    std::cout << "last import:    " << run.source << " at " << chessdb::util::FormatUtc(run.finished_ms) << ", " << run.games_committed
              << " committed, " << run.records_rejected << " rejected" << (run.cancelled ? " (cancelled)" : "") << "\n";
  }
  return kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::string config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage(std::cerr);
    return kExitUsage;
  }

  const std::string cmd = args[0];
  if (cmd == "help" || cmd == "--help" || cmd == "-h") {
    Usage(std::cout);
    return kExitOk;
  }

  // ------------------------------------------------------------
  // Argument validation before touching the store
  // ------------------------------------------------------------
  chessdb::analytics::QueryOptions query;
  std::optional<uint64_t>          max_games;

  if (cmd == "import") {
    if (args.size() < 2 || args.size() > 3) {
      Usage(std::cerr);
      return kExitUsage;
    }
    if (args.size() == 3) {
      max_games = ParseCount(args[2]);
      if (!max_games || *max_games == 0) {
        std::cerr << "invalid max-games: " << args[2] << "\n";
        return kExitUsage;
      }
    }
  } else if (cmd == "opening-stats" || cmd == "volatility") {
    if (args.size() > (cmd == "opening-stats" ? 3u : 2u)) {
      Usage(std::cerr);
      return kExitUsage;
    }
    if (args.size() >= 2) {
      query.min_games = ParseCount(args[1]);
      if (!query.min_games) {
        std::cerr << "invalid minimum: " << args[1] << "\n";
        return kExitUsage;
      }
    }
    if (args.size() == 3) {
      chessdb::v1::TimeControlClass tc;
      if (!chessdb::v1::ParseTimeControlLabel(args[2], &tc)) {
        std::cerr << "unsupported time control: " << args[2] << "\n";
        return kExitUsage;
      }
      query.time_control = tc;
    }
  } else if (cmd == "player") {
    if (args.size() != 2) {
      Usage(std::cerr);
      return kExitUsage;
    }
  } else if (cmd == "setup" || cmd == "time-control-stats" || cmd == "verify" || cmd == "status") {
    if (args.size() != 1) {
      Usage(std::cerr);
      return kExitUsage;
    }
  } else {
    std::cerr << "unknown command: " << cmd << "\n";
    Usage(std::cerr);
    return kExitUsage;
  }

  chessdb::observability::InitializeLogging(chessdb::config::ConfigLoader::Defaults());

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? chessdb::config::ConfigLoader::Defaults() : chessdb::config::ConfigLoader::LoadFromYaml(config_path);

    chessdb::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = chessdb::factory::Build(config);

    int rc = kExitOk;
    if (cmd == "setup") {
      std::cout << "Store ready.\n";
    } else if (cmd == "import") {
      rc = RunImport(app, args[1], max_games);
    } else if (cmd == "opening-stats") {
      rc = RunOpeningStats(app, query);
    } else if (cmd == "time-control-stats") {
      rc = RunTimeControlStats(app);
    } else if (cmd == "player") {
      rc = RunPlayer(app, args[1]);
    } else if (cmd == "volatility") {
      rc = RunVolatility(app, query);
    } else if (cmd == "verify") {
      rc = RunVerify(app);
    } else if (cmd == "status") {
      rc = RunStatus(app);
    }

    chessdb::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    CHESSDB_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    chessdb::observability::ShutdownLogging();
    return kExitFatal;
  }
}
