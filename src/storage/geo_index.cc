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

#include "geo_index.h"

#include <fmt/format.h>
#include <glog/logging.h>

#include <mutex>

#include "parse_util.h"
#include "string_util.h"

namespace geo {

MemoryIndex::MemoryIndex(int storage_precision) : storage_precision_(storage_precision) {
  CHECK(storage_precision_ > kMaxQueryPrecision && storage_precision_ <= GEO_PRECISION_MAX);
}

// The id is appended after a NUL so records sharing a geohash stay grouped
// and still sort before any longer hash.
std::string MemoryIndex::makeKey(const std::string &geohash, const std::string &id) {
  std::string key;
  key.reserve(geohash.size() + 1 + id.size());
  key.append(geohash);
  key.push_back('\0');
  key.append(id);
  return key;
}

Status MemoryIndex::Put(const std::string &id, const GeoPoint &point, int64_t start_time) {
  if (id.empty()) {
    return {Status::InvalidArgument, "record id must not be empty"};
  }

  auto hash = GET_OR_RET(Encode(point, storage_precision_).Prefixed(fmt::format("record '{}'", id)));
  auto key = makeKey(hash, id);

  std::unique_lock<std::shared_mutex> lock(mu_);
  if (auto iter = keys_.find(id); iter != keys_.end()) {
    auto old = records_.find(iter->second);
    by_time_.erase({old->second.start_time, id});
    records_.erase(old);
    iter->second = key;
  } else {
    keys_.emplace(id, key);
  }
  records_[key] = GeoRecord{id, point, std::move(hash), start_time};
  by_time_.emplace(start_time, id);
  return Status::OK();
}

Status MemoryIndex::Delete(const std::string &id) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  auto iter = keys_.find(id);
  if (iter == keys_.end()) {
    return {Status::NotFound, fmt::format("record '{}' not found", id)};
  }
  auto record = records_.find(iter->second);
  by_time_.erase({record->second.start_time, id});
  records_.erase(record);
  keys_.erase(iter);
  return Status::OK();
}

StatusOr<GeoRecord> MemoryIndex::Get(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto iter = keys_.find(id);
  if (iter == keys_.end()) {
    return {Status::NotFound, fmt::format("record '{}' not found", id)};
  }
  return records_.at(iter->second);
}

size_t MemoryIndex::Size() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return records_.size();
}

StatusOr<std::vector<GeoRecord>> MemoryIndex::Scan(const GeoRange &range, size_t limit) {
  std::vector<GeoRecord> records;
  if (limit == 0 || range.start >= range.end) return records;

  std::shared_lock<std::shared_mutex> lock(mu_);
  for (auto iter = records_.lower_bound(range.start); iter != records_.end(); ++iter) {
    if (iter->second.geohash >= range.end) break;
    records.emplace_back(iter->second);
    if (records.size() >= limit) break;
  }
  return records;
}

StatusOr<std::vector<GeoRecord>> MemoryIndex::ScanByTime(int64_t min_time, int64_t max_time,
                                                          const std::optional<TimeKey> &after, size_t limit) {
  std::vector<GeoRecord> records;
  if (limit == 0 || min_time >= max_time) return records;

  std::pair<int64_t, std::string> from{min_time, ""};
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto iter = by_time_.lower_bound(from);
  if (after) {
    std::pair<int64_t, std::string> resume{after->start_time, after->id};
    if (resume >= from) iter = by_time_.upper_bound(resume);
  }
  for (; iter != by_time_.end() && iter->first < max_time; ++iter) {
    records.emplace_back(records_.at(keys_.at(iter->second)));
    if (records.size() >= limit) break;
  }
  return records;
}

StatusOr<size_t> LoadFromStream(std::istream &in, MemoryIndex *index) {
  std::string line;
  size_t line_num = 0, loaded = 0;
  while (std::getline(in, line)) {
    line_num++;
    line = util::Trim(std::move(line), " \t\r\n");
    if (line.empty() || line[0] == '#') continue;

    auto fields = util::Split(line, " \t");
    if (fields.size() != 3 && fields.size() != 4) {
      return {Status::InvalidArgument,
              fmt::format("at line #L{}: expect 'id lat lng [start_time]', got {} fields", line_num, fields.size())};
    }

    auto lat = GET_OR_RET(ParseFloat<double>(fields[1]).Prefixed(fmt::format("at line #L{}: latitude", line_num)));
    auto lng = GET_OR_RET(ParseFloat<double>(fields[2]).Prefixed(fmt::format("at line #L{}: longitude", line_num)));
    int64_t start_time = 0;
    if (fields.size() == 4) {
      start_time =
          GET_OR_RET(ParseInt<int64_t>(fields[3], 10).Prefixed(fmt::format("at line #L{}: start time", line_num)));
    }

    auto s = index->Put(fields[0], GeoPoint{lat, lng}, start_time);
    if (!s.IsOK()) return s.Prefixed(fmt::format("at line #L{}", line_num));
    loaded++;
  }
  VLOG(1) << "Loaded " << loaded << " records from " << line_num << " lines";
  return loaded;
}

}  // namespace geo
