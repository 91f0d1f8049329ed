#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <pitwall/config.hpp>
#include <pitwall/csv.hpp>
#include <pitwall/csv_provider.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/logging.hpp>
#include <pitwall/planner.hpp>
#include <pitwall/report.hpp>
#include <pitwall/track.hpp>

using namespace pitwall;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitPlanningError = 1;
constexpr int kExitUsage = 2;

void print_usage(const char* argv0) {
  std::cerr
    << "usage: " << argv0 << " --data-dir <dir> --year <int> --gp <name> --driver <code>\n"
    << "       --team <name> --race-laps <int> [--condition auto|dry|wet|mixed]\n"
    << "       [--pit-loss-sec <float>] [--output-json <path>] [--config <yaml>]\n"
    << "       [--track-catalog <csv>] [--verbose]\n";
}

struct CliOptions {
  std::string data_dir;
  PlanRequest request;
  std::string output_json;
  std::string config_path;
  std::string track_catalog_path;
  bool verbose = false;
};

// Returns nullopt (after printing why) on any usage error.
std::optional<CliOptions> parse_args(int argc, char* argv[], LogSink* sink) {
  CliOptions opt;
  bool have_year = false, have_laps = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;
    if (arg == "--help" || arg == "-h") {
      return std::nullopt;
    } else if (arg == "--verbose") {
      opt.verbose = true;
    } else if (!has_value) {
      log(sink, LogLevel::Error, "missing value for " + arg);
      return std::nullopt;
    } else if (arg == "--data-dir") {
      opt.data_dir = argv[++i];
    } else if (arg == "--year") {
      const auto v = parse_int(argv[++i]);
      if (!v) { log(sink, LogLevel::Error, "--year expects an integer"); return std::nullopt; }
      opt.request.year = *v;
      have_year = true;
    } else if (arg == "--gp") {
      opt.request.grand_prix = argv[++i];
    } else if (arg == "--driver") {
      opt.request.driver = argv[++i];
    } else if (arg == "--team") {
      opt.request.team = argv[++i];
    } else if (arg == "--race-laps") {
      const auto v = parse_int(argv[++i]);
      if (!v || *v <= 0) { log(sink, LogLevel::Error, "--race-laps expects a positive integer"); return std::nullopt; }
      opt.request.race_laps = *v;
      have_laps = true;
    } else if (arg == "--condition") {
      const auto c = parse_race_condition(argv[++i]);
      if (!c) { log(sink, LogLevel::Error, "--condition expects auto, dry, wet or mixed"); return std::nullopt; }
      opt.request.condition = *c;
    } else if (arg == "--pit-loss-sec") {
      const auto v = parse_double(argv[++i]);
      if (!v || *v < 0.0) { log(sink, LogLevel::Error, "--pit-loss-sec expects a non-negative number"); return std::nullopt; }
      opt.request.pit_loss_sec = *v;
    } else if (arg == "--output-json") {
      opt.output_json = argv[++i];
    } else if (arg == "--config") {
      opt.config_path = argv[++i];
    } else if (arg == "--track-catalog") {
      opt.track_catalog_path = argv[++i];
    } else {
      log(sink, LogLevel::Error, "unknown argument: " + arg);
      return std::nullopt;
    }
  }

  if (opt.data_dir.empty() || !have_year || opt.request.grand_prix.empty() ||
      opt.request.driver.empty() || opt.request.team.empty() || !have_laps) {
    log(sink, LogLevel::Error, "--data-dir, --year, --gp, --driver, --team and --race-laps are required");
    return std::nullopt;
  }
  return opt;
}

} // namespace

int main(int argc, char* argv[]) {
  auto console = std::make_shared<OstreamLogSink>(std::cerr, LogLevel::Info);

  const auto opt = parse_args(argc, argv, console.get());
  if (!opt) {
    print_usage(argv[0]);
    return kExitUsage;
  }
  if (opt->verbose) console->set_min_level(LogLevel::Debug);

  PlannerConfig cfg;
  std::vector<Track> catalog = track_catalog();
  try {
    if (!opt->config_path.empty()) cfg = load_planner_config(opt->config_path);
    if (!opt->track_catalog_path.empty()) {
      auto loaded = load_track_catalog_csv(opt->track_catalog_path);
      if (!loaded) throw ConfigError("cannot open track catalog: " + opt->track_catalog_path);
      catalog = std::move(*loaded);
    }
  } catch (const ConfigError& e) {
    log(console.get(), LogLevel::Error, e.what());
    return kExitUsage;
  }

  CsvDataProvider provider(opt->data_dir);
  try {
    const StrategyPlan plan = plan_strategy(provider, opt->request, cfg, console.get(), catalog);
    std::cout << plan_to_json(plan).dump(2) << std::endl;
    if (!opt->output_json.empty()) {
      write_plan_json(plan, opt->output_json);
      log(console.get(), LogLevel::Info, "wrote " + opt->output_json);
    }
  } catch (const PitwallError& e) {
    log(console.get(), LogLevel::Error, e.what());
    return kExitPlanningError;
  }
  return kExitOk;
}
