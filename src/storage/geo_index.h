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

#include <cstddef>
#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "status.h"
#include "types/geo_bounds.h"
#include "types/geo_precision.h"
#include "types/geohash.h"

namespace geo {

struct GeoRecord {
  std::string id;
  GeoPoint point;
  std::string geohash;  // at storage precision
  int64_t start_time = 0;
};

// TimeKey is a position in (start_time, id) order.
struct TimeKey {
  int64_t start_time = 0;
  std::string id;
};

// RangeSource answers the range queries a search plans. Implementations must
// allow concurrent Scan calls.
class RangeSource {
 public:
  virtual ~RangeSource() = default;

  // Scan returns the records with range.start <= geohash < range.end in key
  // order, at most `limit` of them.
  virtual StatusOr<std::vector<GeoRecord>> Scan(const GeoRange &range, size_t limit) = 0;

  // ScanByTime returns the records with min_time <= start_time < max_time
  // ordered by (start_time, id), at most `limit` of them. When `after` is set
  // the scan resumes strictly after that position.
  virtual StatusOr<std::vector<GeoRecord>> ScanByTime(int64_t min_time, int64_t max_time,
                                                      const std::optional<TimeKey> &after, size_t limit) {
    return {Status::NotOK, "time ordered scan is not supported by this source"};
  }
};

// MemoryIndex keeps records ordered by (geohash, id).
class MemoryIndex : public RangeSource {
 public:
  explicit MemoryIndex(int storage_precision = kStoragePrecision);

  Status Put(const std::string &id, const GeoPoint &point, int64_t start_time);
  Status Delete(const std::string &id);
  StatusOr<GeoRecord> Get(const std::string &id) const;
  size_t Size() const;
  int StoragePrecision() const { return storage_precision_; }

  StatusOr<std::vector<GeoRecord>> Scan(const GeoRange &range, size_t limit) override;
  StatusOr<std::vector<GeoRecord>> ScanByTime(int64_t min_time, int64_t max_time, const std::optional<TimeKey> &after,
                                              size_t limit) override;

 private:
  static std::string makeKey(const std::string &geohash, const std::string &id);

  int storage_precision_;
  mutable std::shared_mutex mu_;
  std::map<std::string, GeoRecord> records_;
  std::unordered_map<std::string, std::string> keys_;  // id -> key in records_
  std::set<std::pair<int64_t, std::string>> by_time_;  // (start_time, id)
};

// LoadFromStream reads "id lat lng [start_time]" lines into the index.
// Blank lines and lines starting with '#' are skipped. Returns the number of
// records loaded.
StatusOr<size_t> LoadFromStream(std::istream &in, MemoryIndex *index);

}  // namespace geo
