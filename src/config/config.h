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

#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "config_type.h"
#include "status.h"
#include "types/geo_precision.h"

constexpr const char *kDefaultLogDir = "stdout";

struct CLIOptions {
  std::string conf_file;
  std::vector<std::pair<std::string, std::string>> cli_options;

  CLIOptions() = default;
  explicit CLIOptions(std::string_view file) : conf_file(file) {}
};

struct Config {
 public:
  Config();
  ~Config() = default;

  int log_level = 0;
  std::string log_dir;
  int workers = 0;
  int storage_precision = 0;

  int max_candidates_total = 0;
  int per_range_limit = 0;
  double max_radius_miles = 0;
  int max_date_window_days = 0;

  double default_radius_miles = 0;
  int default_date_window_days = 0;
  int page_size = 0;

  Status Load(const CLIOptions &opts);
  void Get(const std::string &key, std::vector<std::string> *values) const;
  Status Set(std::string key, const std::string &value);

  geo::SearchLimits Limits() const;

  const std::string &ConfigFilePath() const { return path_; }
  bool HasConfigFile() const { return !path_.empty(); }

 private:
  std::string path_;
  std::map<std::string, std::unique_ptr<ConfigField>> fields_;

  void initFieldValidator();
  Status parseConfigFromPair(const std::pair<std::string, std::string> &input, int line_number);
  Status parseConfigFromString(const std::string &input, int line_number);
  Status finish();
};
