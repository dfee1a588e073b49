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

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "status.h"
#include "storage/geo_index.h"
#include "task_runner.h"
#include "types/geo_precision.h"
#include "types/geohash.h"

namespace geo {

constexpr size_t kDefaultPageSize = 30;
constexpr int64_t kSecondsPerDay = 86400;

enum SearchMode {
  kSearchNearby,     // radius around a center, nearest first
  kSearchDiscovery,  // date window only, soonest first
};

// SearchCursor marks the last hit of a page; the next page starts strictly
// after it in (distance, id) order, or (start_time, id) order for discovery.
struct SearchCursor {
  double distance_miles = 0;
  int64_t start_time = 0;
  std::string id;
};

using RecordFilter = std::function<bool(const GeoRecord &)>;

struct SearchRequest {
  SearchMode mode = kSearchNearby;
  GeoPoint center;
  double radius_miles = kDefaultRadiusMiles;

  // Records must start within [start_time_min, start_time_min + days).
  // Zero days disables the date filter of a nearby search. Discovery
  // requires a window.
  int64_t start_time_min = 0;
  int date_window_days = 0;

  size_t page_size = kDefaultPageSize;
  std::optional<SearchCursor> cursor;

  // Extra predicate applied after the distance and date filters
  RecordFilter filter;
};

struct SearchHit {
  GeoRecord record;
  double distance_miles = 0;
};

struct SearchStats {
  int precision = 0;
  size_t ranges = 0;
  size_t fetched = 0;
  size_t unique = 0;
  size_t after_distance = 0;
  size_t after_date = 0;
  size_t after_filter = 0;
  size_t results = 0;
  int64_t duration_ms = 0;
};

struct SearchResult {
  std::vector<SearchHit> items;
  std::optional<SearchCursor> next_cursor;
  bool truncated = false;  // a fetch limit was reached, results may be incomplete
  SearchStats stats;
};

/*
 * Searcher runs radius searches against a RangeSource.
 *
 * The center cell and its neighbors at QueryPrecision(radius) are planned
 * into key ranges, each range is scanned as its own task on the worker pool,
 * and every scan is joined before candidates are merged. The merged
 * candidates are deduplicated by id, capped at max_candidates_total, filtered
 * by exact distance, date window and the request filter, then sorted by
 * (distance, id) and paginated.
 *
 * The candidate budget is split across the ranges before dispatch, so a
 * search never fetches more than max_candidates_total records in total.
 *
 * A discovery request skips the geo planning: it scans the date window in
 * (start_time, id) order up to per_range_limit records and pages through it.
 */
class Searcher {
 public:
  Searcher(RangeSource *source, SearchLimits limits, size_t workers = 4,
           size_t max_queue_size = TaskRunner::default_max_queue_size);
  ~Searcher();

  Searcher(const Searcher &) = delete;
  Searcher &operator=(const Searcher &) = delete;

  Status Start();
  Status Stop();

  Status Validate(const SearchRequest &req) const;
  StatusOr<SearchResult> Search(const SearchRequest &req);

  // Cancel makes every search in flight return Status::Cancelled.
  void Cancel() { epoch_++; }

  const SearchLimits &Limits() const { return limits_; }

 private:
  StatusOr<std::vector<std::vector<GeoRecord>>> scanAll(const std::vector<GeoRange> &ranges,
                                                        const std::vector<size_t> &budgets, uint64_t epoch);
  StatusOr<SearchResult> searchNearby(const SearchRequest &req, uint64_t epoch);
  StatusOr<SearchResult> searchDiscovery(const SearchRequest &req, uint64_t epoch);

  RangeSource *source_;
  SearchLimits limits_;
  TaskRunner runner_;
  // Held shared while a search dispatches scans and exclusively while Stop
  // flips started_, so no scan is queued on a runner that is being joined.
  std::shared_mutex lifecycle_mu_;
  std::atomic<bool> started_ = false;
  std::atomic<uint64_t> epoch_ = 0;
};

}  // namespace geo
