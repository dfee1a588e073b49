/*
 * Licensed to the Apache Software Foundation (ASF) under one
 * or more contributor license agreements.  See the NOTICE file
 * distributed with this work for additional information
 * regarding copyright ownership.  The ASF licenses this file
 * to you under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in compliance
 * with the License.  You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing,
 * software distributed under the License is distributed on an
 * "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY
 * KIND, either express or implied.  See the License for the
 * specific language governing permissions and limitations
 * under the License.
 *
 */

#include <fmt/format.h>
#include <glog/logging.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "config/config.h"
#include "config/config_util.h"
#include "parse_util.h"
#include "search/geo_search.h"
#include "status.h"
#include "storage/geo_index.h"
#include "string_util.h"
#include "types/geo_bounds.h"
#include "types/geo_distance.h"
#include "types/geo_precision.h"
#include "types/geohash.h"

struct CLICommand {
  std::string name;
  std::vector<std::string> args;
};

struct NewOpt {
  friend auto &operator<<(std::ostream &os, NewOpt) { return os << std::string(4, ' ') << std::setw(48); }
} new_opt;

static void PrintUsage(const char *program) {
  std::cout << program << " encodes geohashes and runs radius searches over a point file" << std::endl
            << "Usage: " << program << " [options] <command> [args...]" << std::endl
            << "Options:" << std::endl
            << std::left << new_opt << "-c, --config <filename>"
            << "set config file to <filename>, or `-` for stdin" << std::endl
            << new_opt << "-h, --help"
            << "print this help message" << std::endl
            << new_opt << "--<config-key> <config-value>"
            << "overwrite specific config option <config-key> to <config-value>" << std::endl
            << "Commands:" << std::endl
            << new_opt << "encode <lat> <lng> [precision]"
            << "print the geohash of a point" << std::endl
            << new_opt << "decode <geohash>"
            << "print the center and bounds of a cell" << std::endl
            << new_opt << "neighbors <geohash>"
            << "print the adjacent cells" << std::endl
            << new_opt << "plan <lat> <lng> <radius> [m|km|mi|ft]"
            << "print the key ranges a search would scan" << std::endl
            << new_opt << "distance <lat1> <lng1> <lat2> <lng2> [unit]"
            << "print the great-circle distance" << std::endl
            << new_opt << "search <file> <lat> <lng> [radius-mi] [start-time]"
            << "search the 'id lat lng [start_time]' lines of <file>" << std::endl
            << new_opt << "discover <file> <start-time> [days]"
            << "list the records of <file> starting in a date window, soonest first" << std::endl
            << new_opt << "config [key]"
            << "print the effective configuration" << std::endl;
}

static CLIOptions ParseCommandLineOptions(int argc, char **argv, CLICommand *cmd) {
  using namespace std::string_view_literals;
  CLIOptions opts;

  int i = 1;
  for (; i < argc; ++i) {
    if ((argv[i] == "-c"sv || argv[i] == "--config"sv) && i + 1 < argc) {
      opts.conf_file = argv[++i];
    } else if (argv[i] == "-h"sv || argv[i] == "--help"sv) {
      PrintUsage(*argv);
      std::exit(0);
    } else if (std::string_view(argv[i]).substr(0, 2) == "--" && std::string_view(argv[i]).size() > 2 &&
               i + 1 < argc) {
      auto key = std::string_view(argv[i] + 2);
      opts.cli_options.emplace_back(key, argv[++i]);
    } else if (argv[i][0] == '-') {
      PrintUsage(*argv);
      std::exit(1);
    } else {
      break;
    }
  }

  if (i == argc) {
    PrintUsage(*argv);
    std::exit(1);
  }
  cmd->name = util::ToLower(argv[i++]);
  for (; i < argc; ++i) cmd->args.emplace_back(argv[i]);

  return opts;
}

static void InitGoogleLog(const Config *config) {
  FLAGS_minloglevel = config->log_level;
  FLAGS_max_log_size = 100;
  FLAGS_logbufsecs = 0;

  if (util::EqualICase(config->log_dir, "stdout")) {
    for (int level = google::INFO; level <= google::FATAL; level++) {
      google::SetLogDestination(level, "");
    }
    FLAGS_stderrthreshold = google::ERROR;
    FLAGS_logtostdout = true;
    std::setbuf(stdout, nullptr);
  } else {
    FLAGS_log_dir = config->log_dir + "/";
  }
}

static Status CheckArgs(const CLICommand &cmd, size_t min, size_t max) {
  if (cmd.args.size() < min || cmd.args.size() > max) {
    return {Status::InvalidArgument, fmt::format("wrong number of arguments for '{}'", cmd.name)};
  }
  return Status::OK();
}

static StatusOr<geo::GeoPoint> ParsePoint(const std::string &lat, const std::string &lng) {
  auto latitude = GET_OR_RET(ParseFloat<double>(lat).Prefixed("latitude"));
  auto longitude = GET_OR_RET(ParseFloat<double>(lng).Prefixed("longitude"));
  return geo::GeoPoint{latitude, longitude};
}

static Status Encode(const CLICommand &cmd, const Config &config) {
  GET_OR_RET(CheckArgs(cmd, 2, 3));
  auto point = GET_OR_RET(ParsePoint(cmd.args[0], cmd.args[1]));
  int precision = config.storage_precision;
  if (cmd.args.size() == 3) {
    precision = GET_OR_RET(ParseInt<int>(cmd.args[2], {geo::GEO_PRECISION_MIN, geo::GEO_PRECISION_MAX}, 10)
                               .Prefixed("precision"));
  }
  std::cout << GET_OR_RET(geo::Encode(point, precision)) << std::endl;
  return Status::OK();
}

static Status Decode(const CLICommand &cmd) {
  GET_OR_RET(CheckArgs(cmd, 1, 1));
  auto area = GET_OR_RET(geo::DecodeArea(cmd.args[0]));
  auto center = area.Center();
  std::cout << fmt::format("center: {} {}", util::Float2String(center.latitude), util::Float2String(center.longitude))
            << std::endl
            << fmt::format("latitude: [{}, {}]", area.latitude.min, area.latitude.max) << std::endl
            << fmt::format("longitude: [{}, {}]", area.longitude.min, area.longitude.max) << std::endl;
  return Status::OK();
}

static Status Neighbors(const CLICommand &cmd) {
  GET_OR_RET(CheckArgs(cmd, 1, 1));
  if (!geo::IsValidHash(cmd.args[0])) {
    return {Status::InvalidArgument, fmt::format("invalid geohash '{}'", cmd.args[0])};
  }
  for (const auto &hash : geo::Neighbors(cmd.args[0])) {
    std::cout << hash << std::endl;
  }
  return Status::OK();
}

static Status Plan(const CLICommand &cmd) {
  GET_OR_RET(CheckArgs(cmd, 3, 4));
  auto center = GET_OR_RET(ParsePoint(cmd.args[0], cmd.args[1]));
  auto radius = GET_OR_RET(ParseFloat<double>(cmd.args[2]).Prefixed("radius"));
  auto unit = geo::kDistanceMiles;
  if (cmd.args.size() == 4) unit = GET_OR_RET(geo::ParseDistanceUnit(cmd.args[3]));

  int precision = geo::QueryPrecisionForMeters(radius * geo::GetUnitConversion(unit));
  auto ranges = GET_OR_RET(geo::QueryBounds(center, precision));
  auto cell = geo::ApproximateCellSizeMiles(precision);
  std::cout << fmt::format("precision: {} (cell ~{}x{}mi)", precision, cell.width, cell.height) << std::endl;
  for (const auto &range : ranges) {
    std::cout << fmt::format("[{}, {})", range.start, range.end) << std::endl;
  }
  return Status::OK();
}

static Status Distance(const CLICommand &cmd) {
  GET_OR_RET(CheckArgs(cmd, 4, 5));
  auto a = GET_OR_RET(ParsePoint(cmd.args[0], cmd.args[1]));
  auto b = GET_OR_RET(ParsePoint(cmd.args[2], cmd.args[3]));
  if (!a.IsValid() || !b.IsValid()) return {Status::InvalidCoordinates, "point out of range"};
  auto unit = geo::kDistanceMiles;
  if (cmd.args.size() == 5) unit = GET_OR_RET(geo::ParseDistanceUnit(cmd.args[4]));
  std::cout << fmt::format("{:.4f} {}", geo::Haversine(a, b, unit), geo::DistanceUnitName(unit)) << std::endl;
  return Status::OK();
}

static Status Search(const CLICommand &cmd, const Config &config) {
  GET_OR_RET(CheckArgs(cmd, 3, 5));

  std::ifstream file(cmd.args[0]);
  if (!file.is_open()) return Status::FromErrno(fmt::format("failed to open '{}'", cmd.args[0]));

  geo::MemoryIndex index(config.storage_precision);
  auto loaded = GET_OR_RET(geo::LoadFromStream(file, &index).Prefixed(cmd.args[0]));
  LOG(INFO) << "Loaded " << loaded << " records from " << cmd.args[0];

  geo::SearchRequest req;
  req.center = GET_OR_RET(ParsePoint(cmd.args[1], cmd.args[2]));
  req.radius_miles = config.default_radius_miles;
  if (cmd.args.size() >= 4) req.radius_miles = GET_OR_RET(ParseFloat<double>(cmd.args[3]).Prefixed("radius"));
  if (cmd.args.size() == 5) {
    req.start_time_min = GET_OR_RET(ParseInt<int64_t>(cmd.args[4], 10).Prefixed("start time"));
    req.date_window_days = config.default_date_window_days;
  }
  req.page_size = static_cast<size_t>(config.page_size);

  geo::Searcher searcher(&index, config.Limits(), static_cast<size_t>(config.workers));
  GET_OR_RET(searcher.Start());

  for (int page = 1;; page++) {
    auto result = GET_OR_RET(searcher.Search(req));
    std::cout << fmt::format("# page {}: {} results", page, result.items.size())
              << (result.truncated ? " (truncated)" : "") << std::endl;
    for (const auto &hit : result.items) {
      std::cout << fmt::format("{} {:.3f}", hit.record.id, hit.distance_miles) << std::endl;
    }
    if (!result.next_cursor) break;
    req.cursor = std::move(result.next_cursor);
  }

  return searcher.Stop();
}

static Status Discover(const CLICommand &cmd, const Config &config) {
  GET_OR_RET(CheckArgs(cmd, 2, 3));

  std::ifstream file(cmd.args[0]);
  if (!file.is_open()) return Status::FromErrno(fmt::format("failed to open '{}'", cmd.args[0]));

  geo::MemoryIndex index(config.storage_precision);
  auto loaded = GET_OR_RET(geo::LoadFromStream(file, &index).Prefixed(cmd.args[0]));
  LOG(INFO) << "Loaded " << loaded << " records from " << cmd.args[0];

  geo::SearchRequest req;
  req.mode = geo::kSearchDiscovery;
  req.start_time_min = GET_OR_RET(ParseInt<int64_t>(cmd.args[1], 10).Prefixed("start time"));
  req.date_window_days = config.default_date_window_days;
  if (cmd.args.size() == 3) req.date_window_days = GET_OR_RET(ParseInt<int>(cmd.args[2], 10).Prefixed("days"));
  req.page_size = static_cast<size_t>(config.page_size);

  geo::Searcher searcher(&index, config.Limits(), 1);
  GET_OR_RET(searcher.Start());

  for (int page = 1;; page++) {
    auto result = GET_OR_RET(searcher.Search(req));
    std::cout << fmt::format("# page {}: {} results", page, result.items.size())
              << (result.truncated ? " (truncated)" : "") << std::endl;
    for (const auto &hit : result.items) {
      std::cout << fmt::format("{} {}", hit.record.id, hit.record.start_time) << std::endl;
    }
    if (!result.next_cursor) break;
    req.cursor = std::move(result.next_cursor);
  }

  return searcher.Stop();
}

static Status DumpConfig(const CLICommand &cmd, const Config &config) {
  GET_OR_RET(CheckArgs(cmd, 0, 1));
  std::vector<std::string> values;
  config.Get(cmd.args.empty() ? "*" : cmd.args[0], &values);
  if (values.empty()) return {Status::NotFound, fmt::format("no such config key '{}'", cmd.args[0])};
  for (size_t i = 0; i + 1 < values.size(); i += 2) {
    std::cout << DumpConfigLine({values[i], values[i + 1]}) << std::endl;
  }
  return Status::OK();
}

static Status RunCommand(const CLICommand &cmd, const Config &config) {
  if (cmd.name == "encode") return Encode(cmd, config);
  if (cmd.name == "decode") return Decode(cmd);
  if (cmd.name == "neighbors") return Neighbors(cmd);
  if (cmd.name == "plan") return Plan(cmd);
  if (cmd.name == "distance") return Distance(cmd);
  if (cmd.name == "search") return Search(cmd, config);
  if (cmd.name == "discover") return Discover(cmd, config);
  if (cmd.name == "config") return DumpConfig(cmd, config);
  return {Status::InvalidArgument, fmt::format("unknown command '{}'", cmd.name)};
}

int main(int argc, char *argv[]) {
  google::InitGoogleLogging("geosearch");

  CLICommand cmd;
  auto opts = ParseCommandLineOptions(argc, argv, &cmd);

  Config config;
  Status s = config.Load(opts);
  if (!s.IsOK()) {
    std::cout << "Failed to load config. Error: " << s.Msg() << std::endl;
    google::ShutdownGoogleLogging();
    return 1;
  }

  InitGoogleLog(&config);
  s = RunCommand(cmd, config);
  if (!s.IsOK()) {
    LOG(ERROR) << "Failed to run '" << cmd.name << "': " << s.Msg();
  }

  google::ShutdownGoogleLogging();
  return s.IsOK() ? 0 : 1;
}
