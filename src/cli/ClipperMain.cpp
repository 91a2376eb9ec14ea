// Repository: Clipper
// Component: clipper CLI
// Purpose: Plans one job (or a batch manifest of jobs) and hands each
//          CompositionPlan to the configured render sinks.
// Copyright (c) 2026 Clipper
//
// EXIT CODES:
//   0  every job completed (possibly degraded)
//   1  at least one job failed
//   2  usage, input or configuration error before any job ran

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "clipper/cache/ClipCache.hpp"
#include "clipper/cache/LocalClipLibrary.hpp"
#include "clipper/config/EngineConfig.hpp"
#include "clipper/io/BatchManifestReader.hpp"
#include "clipper/io/BrollPlanReader.hpp"
#include "clipper/io/WordTimingReader.hpp"
#include "clipper/media/MediaProbe.hpp"
#include "clipper/pipeline/BatchRunner.hpp"
#include "clipper/pipeline/JobOrchestrator.hpp"
#include "clipper/render/GrpcRenderClient.hpp"
#include "clipper/render/PlanDumpSink.hpp"
#include "clipper/util/CancelToken.hpp"
#include "clipper/util/Logger.hpp"

namespace {

using clipper::util::Logger;

constexpr int kExitOk = 0;
constexpr int kExitJobFailed = 1;
constexpr int kExitUsage = 2;

// =============================================================================
// Global state for signal handling
// =============================================================================
clipper::util::CancelToken g_cancel;

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_cancel.Cancel();
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  // Single-job mode
  std::string video_path;
  std::string words_path;
  std::string broll_plan_path;
  std::string job_id;
  double duration_seconds = 0.0;  // 0 = probe the video

  // Batch mode
  std::string manifest_path;

  std::string config_path;
  std::string output_dir = "output";
  std::vector<std::string> platforms;  // Empty = every configured profile
  std::string dump_dir;
  std::optional<clipper::util::LogLevel> log_level;

  bool help = false;
  bool valid = false;
  std::string error;

  bool IsBatchMode() const { return !manifest_path.empty(); }
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Plans a talking-head short: B-roll cutaways, transitions and\n"
            << "word-synced captions, then submits the plan for rendering.\n"
            << "\n"
            << "SINGLE-JOB MODE:\n"
            << "  --video PATH         Avatar (talking-head) video\n"
            << "  --words PATH         Word timings JSON\n"
            << "  --broll-plan PATH    B-roll plan CSV (optional)\n"
            << "  --job-id ID          Job id (default: video file stem)\n"
            << "  --duration SECONDS   Avatar duration (default: probe the video)\n"
            << "\n"
            << "BATCH MODE:\n"
            << "  --batch PATH         Manifest CSV: job_id,video,words,broll_plan,output_dir\n"
            << "\n"
            << "COMMON OPTIONS:\n"
            << "  --config PATH        Engine configuration JSON\n"
            << "  --output-dir DIR     Default output directory (default: output)\n"
            << "  --platform NAME      Restrict to a platform profile (repeatable)\n"
            << "  --dump-plan DIR      Write <job>.plan.json and <job>.srt to DIR\n"
            << "  --log-level LEVEL    debug, info, warn or error (default: info)\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --video talk.mp4 --words talk.words.json \\\n"
            << "      --broll-plan talk.broll.csv --dump-plan /tmp/plans\n"
            << "  " << program_name << " --batch jobs.csv --config clipper.json\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--video" && i + 1 < argc) {
      args.video_path = argv[++i];
    } else if (arg == "--words" && i + 1 < argc) {
      args.words_path = argv[++i];
    } else if (arg == "--broll-plan" && i + 1 < argc) {
      args.broll_plan_path = argv[++i];
    } else if (arg == "--job-id" && i + 1 < argc) {
      args.job_id = argv[++i];
    } else if (arg == "--duration" && i + 1 < argc) {
      const std::string value = argv[++i];
      char* end = nullptr;
      args.duration_seconds = std::strtod(value.c_str(), &end);
      if (end == value.c_str() || *end != '\0' || args.duration_seconds <= 0.0) {
        args.error = "--duration must be a positive number of seconds";
        return args;
      }
    } else if (arg == "--batch" && i + 1 < argc) {
      args.manifest_path = argv[++i];
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--output-dir" && i + 1 < argc) {
      args.output_dir = argv[++i];
    } else if (arg == "--platform" && i + 1 < argc) {
      args.platforms.push_back(argv[++i]);
    } else if (arg == "--dump-plan" && i + 1 < argc) {
      args.dump_dir = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      const std::string value = argv[++i];
      args.log_level = clipper::util::LogLevelFromName(value);
      if (!args.log_level) {
        args.error = "Unknown log level: " + value;
        return args;
      }
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }

  if (args.IsBatchMode()) {
    if (!args.video_path.empty() || !args.words_path.empty()) {
      args.error = "Cannot use --batch together with --video/--words";
      return args;
    }
  } else if (args.video_path.empty() || args.words_path.empty()) {
    args.error = "Must specify --video and --words, or --batch";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Job loading
// =============================================================================

bool LoadJob(const clipper::io::ManifestRow& row, double duration_seconds,
             clipper::pipeline::JobSpec& out, std::string& error) {
  out.job_id = row.job_id;
  out.avatar_path = row.video_path;
  out.total_duration_seconds = duration_seconds;
  out.output_dir = row.output_dir;

  auto words = clipper::io::WordTimingReader::ReadFile(row.words_path);
  if (!words.ok) {
    error = row.words_path + ": " + words.detail;
    return false;
  }
  out.words = std::move(words.words);

  if (!row.broll_plan_path.empty()) {
    auto broll = clipper::io::BrollPlanReader::ReadFile(row.broll_plan_path);
    if (!broll.ok) {
      error = row.broll_plan_path + ": " + broll.detail;
      return false;
    }
    out.broll = std::move(broll.requests);
  }
  return true;
}

bool SelectPlatforms(const std::vector<std::string>& names,
                     clipper::config::EngineConfig& config, std::string& error) {
  if (names.empty()) return true;
  std::vector<clipper::config::PlatformProfile> selected;
  for (const auto& name : names) {
    bool found = false;
    for (const auto& profile : config.platforms) {
      if (profile.name == name) {
        selected.push_back(profile);
        found = true;
        break;
      }
    }
    if (!found) {
      error = "unknown platform '" + name + "'";
      return false;
    }
  }
  config.platforms = std::move(selected);
  return true;
}

void PrintReport(const clipper::pipeline::JobReport& report) {
  std::ostringstream oss;
  if (report.ok) {
    oss << "[clipper] " << report.job_id << (report.degraded() ? " DEGRADED" : " OK")
        << " segments=" << report.plan->segments.size()
        << " skipped=" << report.skipped_cutaways
        << " substituted=" << report.substituted_cutaways
        << " elapsed_ms=" << report.elapsed_ms;
    for (const auto& out : report.outputs) {
      oss << "\n  " << out.platform << ": " << out.path;
    }
  } else {
    oss << "[clipper] " << report.job_id << " FAILED ("
        << clipper::timeline::PlanErrorToString(report.error) << "): " << report.detail;
  }
  std::cout << oss.str() << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  if (args.log_level) Logger::SetLevel(*args.log_level);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  // ---------------------------------------------------------------------------
  // Configuration
  // ---------------------------------------------------------------------------
  clipper::config::EngineConfig config;
  if (!args.config_path.empty()) {
    auto loaded = clipper::config::EngineConfig::LoadFile(args.config_path);
    if (!loaded.ok) {
      Logger::Error("[clipper] config " + args.config_path + ": " + loaded.detail);
      return kExitUsage;
    }
    config = std::move(loaded.config);
  }
  {
    std::string error;
    if (!SelectPlatforms(args.platforms, config, error)) {
      Logger::Error("[clipper] " + error);
      return kExitUsage;
    }
  }
  if (!args.dump_dir.empty()) config.render.dump_dir = args.dump_dir;

  // ---------------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------------
  std::vector<clipper::io::ManifestRow> rows;
  if (args.IsBatchMode()) {
    auto manifest = clipper::io::BatchManifestReader::ReadFile(args.manifest_path);
    if (!manifest.ok) {
      Logger::Error("[clipper] manifest " + args.manifest_path + ": " + manifest.detail);
      return kExitUsage;
    }
    rows = std::move(manifest.rows);
  } else {
    clipper::io::ManifestRow row;
    row.job_id = args.job_id.empty()
                     ? std::filesystem::path(args.video_path).stem().string()
                     : args.job_id;
    row.video_path = args.video_path;
    row.words_path = args.words_path;
    row.broll_plan_path = args.broll_plan_path;
    rows.push_back(std::move(row));
  }

  std::vector<clipper::pipeline::JobSpec> jobs;
  for (auto& row : rows) {
    if (row.output_dir.empty()) {
      row.output_dir = (std::filesystem::path(args.output_dir) / row.job_id).string();
    }
    clipper::pipeline::JobSpec job;
    std::string error;
    if (!LoadJob(row, args.IsBatchMode() ? 0.0 : args.duration_seconds, job, error)) {
      Logger::Error("[clipper] job " + row.job_id + ": " + error);
      return kExitUsage;
    }
    jobs.push_back(std::move(job));
  }

  // ---------------------------------------------------------------------------
  // Engine
  // ---------------------------------------------------------------------------
  clipper::cache::LocalClipLibrary library(config.broll.library_dir);
  clipper::cache::ClipCache::Options cache_options;
  cache_options.root = config.cache.root;
  cache_options.fetch_fn = library.AsFetchFn();
  cache_options.probe_fn = clipper::media::MediaProbe::AsProbeFn();
  cache_options.fetch_workers = config.cache.fetch_workers;

  std::unique_ptr<clipper::cache::ClipCache> cache;
  try {
    cache = std::make_unique<clipper::cache::ClipCache>(std::move(cache_options));
  } catch (const std::exception& e) {
    Logger::Error(std::string("[clipper] cannot open clip cache: ") + e.what());
    return kExitUsage;
  }

  std::vector<std::unique_ptr<clipper::render::IRenderSink>> owned_sinks;
  if (!config.render.dump_dir.empty()) {
    owned_sinks.push_back(
        std::make_unique<clipper::render::PlanDumpSink>(config.render.dump_dir));
  }
  if (!config.render.endpoint.empty()) {
    owned_sinks.push_back(std::make_unique<clipper::render::GrpcRenderClient>(
        config.render.endpoint, std::chrono::milliseconds(config.render.deadline_ms)));
  }
  std::vector<clipper::render::IRenderSink*> sinks;
  for (const auto& sink : owned_sinks) sinks.push_back(sink.get());
  if (sinks.empty()) {
    Logger::Warn("[clipper] no render endpoint or dump directory configured; "
                 "plans are validated only");
  }

  clipper::pipeline::JobOrchestrator orchestrator(
      config, *cache, clipper::media::MediaProbe::AsProbeFn(), sinks);
  clipper::pipeline::BatchRunner runner(
      orchestrator, config.batch.workers,
      std::chrono::milliseconds(config.batch.job_timeout_ms));

  std::vector<clipper::pipeline::JobReport> reports = runner.RunAll(jobs, &g_cancel);
  cache->Close();

  for (const auto& report : reports) PrintReport(report);

  const auto summary = clipper::pipeline::BatchRunner::Summarize(reports);
  return summary.failed == 0 ? kExitOk : kExitJobFailed;
}
