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

#include "config.h"

#include <fmt/format.h>
#include <glog/logging.h>

#include <climits>
#include <cstring>
#include <fstream>
#include <iostream>

#include "config_util.h"
#include "string_util.h"

const std::vector<ConfigEnum<int>> log_levels{
    {"info", google::INFO},
    {"warning", google::WARNING},
    {"error", google::ERROR},
    {"fatal", google::FATAL},
};

struct FieldWrapper {
  std::string name;
  bool readonly;
  std::unique_ptr<ConfigField> field;

  template <typename T>
  FieldWrapper(std::string name, bool readonly, T *field)
      : name(std::move(name)), readonly(readonly), field(field) {}
};

Config::Config() {
  FieldWrapper fields[] = {
      {"log-level", false, new EnumField<int>(&log_level, log_levels, google::INFO)},
      {"log-dir", true, new StringField(&log_dir, kDefaultLogDir)},
      {"workers", true, new IntField(&workers, 4, 1, 256)},
      {"storage-precision", true, new IntField(&storage_precision, geo::kStoragePrecision, 7, 12)},

      /* search limits */
      {"max-candidates-total", false,
       new IntField(&max_candidates_total, static_cast<int>(geo::kMaxCandidatesTotal), 1, INT_MAX)},
      {"per-range-limit", false, new IntField(&per_range_limit, static_cast<int>(geo::kPerRangeLimit), 1, INT_MAX)},
      {"max-radius-miles", false, new DoubleField(&max_radius_miles, geo::kMaxRadiusMiles, 0.001, 12500)},
      {"max-date-window-days", false, new IntField(&max_date_window_days, geo::kMaxDateWindowDays, 0, 3650)},

      /* request defaults */
      {"default-radius-miles", false, new DoubleField(&default_radius_miles, geo::kDefaultRadiusMiles, 0.001, 12500)},
      {"default-date-window-days", false,
       new IntField(&default_date_window_days, geo::kDefaultDateWindowDays, 0, 3650)},
      {"page-size", false, new IntField(&page_size, 30, 1, 1000)},
  };
  for (auto &wrapper : fields) {
    auto &field = wrapper.field;
    field->readonly = wrapper.readonly;
    fields_.emplace(std::move(wrapper.name), std::move(field));
  }
  initFieldValidator();
}

// The validate function would be invoked before the field was set,
// to make sure that new value is valid.
void Config::initFieldValidator() {
  std::map<std::string, ValidateFn> validators = {
      {"per-range-limit",
       [this](const std::string &k, const std::string &v) -> Status {
         auto n = GET_OR_RET(ParseInt<int>(v, 10));
         if (n > max_candidates_total) {
           return {Status::NotOK, fmt::format("{} must not exceed max-candidates-total ({})", k, max_candidates_total)};
         }
         return Status::OK();
       }},
      {"max-candidates-total",
       [this](const std::string &k, const std::string &v) -> Status {
         auto n = GET_OR_RET(ParseInt<int>(v, 10));
         if (n < per_range_limit) {
           return {Status::NotOK, fmt::format("{} must not be less than per-range-limit ({})", k, per_range_limit)};
         }
         return Status::OK();
       }},
      {"default-radius-miles",
       [this](const std::string &k, const std::string &v) -> Status {
         auto radius = GET_OR_RET(ParseFloat<double>(v));
         if (radius > max_radius_miles) {
           return {Status::NotOK, fmt::format("{} must not exceed max-radius-miles ({})", k, max_radius_miles)};
         }
         return Status::OK();
       }},
      {"default-date-window-days",
       [this](const std::string &k, const std::string &v) -> Status {
         auto days = GET_OR_RET(ParseInt<int>(v, 10));
         if (days > max_date_window_days) {
           return {Status::NotOK,
                   fmt::format("{} must not exceed max-date-window-days ({})", k, max_date_window_days)};
         }
         return Status::OK();
       }},
  };
  for (const auto &iter : validators) {
    auto field_iter = fields_.find(iter.first);
    if (field_iter != fields_.end()) {
      field_iter->second->validate = iter.second;
    }
  }
}

Status Config::parseConfigFromPair(const std::pair<std::string, std::string> &input, int line_number) {
  std::string field_key = util::ToLower(input.first);
  auto iter = fields_.find(field_key);
  if (iter == fields_.end()) {
    LOG(WARNING) << fmt::format("'{}' at line {} is not a valid configuration key", field_key, line_number);
    return Status::OK();
  }

  auto &field = iter->second;
  field->line_number = line_number;
  auto s = field->Set(input.second);
  if (!s.IsOK()) return s.Prefixed(fmt::format("failed to set value of field '{}'", field_key));
  return Status::OK();
}

Status Config::parseConfigFromString(const std::string &input, int line_number) {
  auto parsed = ParseConfigLine(input);
  if (!parsed) return parsed.ToStatus().Prefixed("malformed line");

  auto kv = std::move(*parsed);

  if (kv.first.empty() || kv.second.empty()) return Status::OK();

  return parseConfigFromPair(kv, line_number);
}

Status Config::finish() {
  if (per_range_limit > max_candidates_total) {
    return {Status::NotOK, "per-range-limit must not exceed max-candidates-total"};
  }
  if (default_radius_miles > max_radius_miles) {
    return {Status::NotOK, "default-radius-miles must not exceed max-radius-miles"};
  }
  if (default_date_window_days > max_date_window_days) {
    return {Status::NotOK, "default-date-window-days must not exceed max-date-window-days"};
  }
  if (log_dir.empty()) log_dir = kDefaultLogDir;
  return Status::OK();
}

Status Config::Load(const CLIOptions &opts) {
  if (!opts.conf_file.empty()) {
    std::ifstream file;
    std::istream *in = nullptr;
    if (opts.conf_file == "-") {
      in = &std::cin;
    } else {
      path_ = opts.conf_file;
      file.open(path_);
      if (!file.is_open()) {
        return {Status::NotOK, fmt::format("failed to open file '{}': {}", path_, strerror(errno))};
      }

      in = &file;
    }

    std::string line;
    int line_num = 1;
    while (in->good() && std::getline(*in, line)) {
      if (auto s = parseConfigFromString(line, line_num); !s.IsOK()) {
        return s.Prefixed(fmt::format("at line #L{}", line_num));
      }

      line_num++;
    }
  }

  for (const auto &opt : opts.cli_options) {
    GET_OR_RET(parseConfigFromPair(opt, -1).Prefixed("CLI config option error"));
  }

  for (const auto &iter : fields_) {
    // line_number = 0 means the value was never given, so the default is kept
    // and there is nothing to validate.
    if (iter.second->line_number != 0 && iter.second->validate) {
      auto s = iter.second->validate(iter.first, iter.second->ToString());
      if (!s.IsOK()) {
        return s.Prefixed(fmt::format("at line #L{}: {} is invalid", iter.second->line_number, iter.first));
      }
    }
  }

  return finish();
}

void Config::Get(const std::string &key, std::vector<std::string> *values) const {
  values->clear();
  for (const auto &iter : fields_) {
    if (key == "*" || util::ToLower(key) == iter.first) {
      values->emplace_back(iter.first);
      values->emplace_back(iter.second->ToString());
    }
  }
}

Status Config::Set(std::string key, const std::string &value) {
  key = util::ToLower(key);
  auto iter = fields_.find(key);
  if (iter == fields_.end() || iter->second->readonly) {
    return {Status::NotOK, "Unsupported CONFIG parameter: " + key};
  }

  auto &field = iter->second;
  if (field->validate) {
    auto s = field->validate(key, value);
    if (!s.IsOK()) return s.Prefixed("invalid value");
  }

  auto s = field->Set(value);
  if (!s.IsOK()) return s.Prefixed("failed to set new value");

  return Status::OK();
}

geo::SearchLimits Config::Limits() const {
  geo::SearchLimits limits;
  limits.max_candidates_total = static_cast<uint32_t>(max_candidates_total);
  limits.per_range_limit = static_cast<uint32_t>(per_range_limit);
  limits.max_radius_miles = max_radius_miles;
  limits.max_date_window_days = max_date_window_days;
  return limits;
}
