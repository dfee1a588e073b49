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

#include "geo_search.h"

#include <fmt/format.h>
#include <glog/logging.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <future>
#include <iterator>
#include <mutex>
#include <tuple>
#include <unordered_set>
#include <utility>

#include "types/geo_bounds.h"
#include "types/geo_distance.h"

namespace geo {

namespace {

bool hitBefore(double distance, const std::string &id, const SearchCursor &cursor) {
  return std::tie(distance, id) <= std::tie(cursor.distance_miles, cursor.id);
}

// Splits the candidate budget across the ranges, earlier ranges taking the
// remainder, with every share capped at the per-range limit.
std::vector<size_t> splitBudget(size_t total, size_t per_range, size_t ranges) {
  std::vector<size_t> budgets(ranges);
  for (size_t i = 0; i < ranges; i++) {
    size_t share = total / ranges + (i < total % ranges ? 1 : 0);
    budgets[i] = std::min(share, per_range);
  }
  return budgets;
}

bool inWindow(const GeoRecord &record, int64_t start, int64_t end) {
  return record.start_time >= start && record.start_time < end;
}

}  // namespace

Searcher::Searcher(RangeSource *source, SearchLimits limits, size_t workers, size_t max_queue_size)
    : source_(source), limits_(limits), runner_(workers, static_cast<ptrdiff_t>(max_queue_size), "geo-scan") {
  CHECK(source_ != nullptr);
  CHECK(limits_.per_range_limit > 0 && limits_.max_candidates_total > 0);
}

Searcher::~Searcher() {
  if (started_) {
    auto s = Stop();
    if (!s.IsOK()) LOG(WARNING) << "Failed to stop the searcher: " << s.Msg();
  }
}

Status Searcher::Start() {
  std::unique_lock<std::shared_mutex> lock(lifecycle_mu_);
  if (started_) return {Status::NotOK, "searcher is already started"};
  GET_OR_RET(runner_.Start().Prefixed("failed to start search workers"));
  started_ = true;
  return Status::OK();
}

Status Searcher::Stop() {
  {
    std::unique_lock<std::shared_mutex> lock(lifecycle_mu_);
    if (!started_) return {Status::NotOK, "searcher is not started"};
    started_ = false;
  }
  Cancel();
  runner_.Cancel();
  return runner_.Join();
}

Status Searcher::Validate(const SearchRequest &req) const {
  if (req.mode == kSearchNearby) {
    if (!req.center.IsValid()) {
      return {Status::InvalidCoordinates,
              fmt::format("invalid center ({}, {})", req.center.latitude, req.center.longitude)};
    }
    if (!std::isfinite(req.radius_miles) || req.radius_miles <= 0) {
      return {Status::InvalidArgument, fmt::format("radius must be positive, got {}", req.radius_miles)};
    }
    if (req.radius_miles > limits_.max_radius_miles) {
      return {Status::RadiusTooLarge,
              fmt::format("radius {} exceeds the maximum of {} miles", req.radius_miles, limits_.max_radius_miles)};
    }
  }
  if (req.date_window_days < 0) {
    return {Status::DateWindowInvalid, fmt::format("date window must not be negative, got {}", req.date_window_days)};
  }
  if (req.mode == kSearchDiscovery && req.date_window_days == 0) {
    return {Status::DateWindowInvalid, "discovery needs a date window of at least one day"};
  }
  if (req.date_window_days > limits_.max_date_window_days) {
    return {Status::DateWindowTooLarge, fmt::format("date window {} exceeds the maximum of {} days",
                                                    req.date_window_days, limits_.max_date_window_days)};
  }
  if (req.page_size == 0) {
    return {Status::InvalidArgument, "page size must be positive"};
  }
  return Status::OK();
}

StatusOr<std::vector<std::vector<GeoRecord>>> Searcher::scanAll(const std::vector<GeoRange> &ranges,
                                                                const std::vector<size_t> &budgets, uint64_t epoch) {
  using ScanResult = StatusOr<std::vector<GeoRecord>>;

  // A range with no budget left is not scanned and keeps an invalid future.
  std::vector<std::future<ScanResult>> futures(ranges.size());
  Status dispatched = Status::OK();
  {
    std::shared_lock<std::shared_mutex> lock(lifecycle_mu_);
    if (!started_) return {Status::NotOK, "searcher is not started"};
    for (size_t i = 0; i < ranges.size(); i++) {
      if (budgets[i] == 0) continue;
      auto future = runner_.Submit([this, range = ranges[i], limit = budgets[i], epoch]() -> ScanResult {
        if (epoch_ != epoch) return {Status::Cancelled, "search was cancelled"};
        return source_->Scan(range, limit);
      });
      if (!future) {
        dispatched = std::move(future).ToStatus().Prefixed("failed to dispatch range scan");
        break;
      }
      futures[i] = std::move(*future);
    }
  }

  // Every queued scan is joined before looking at any result, so that a
  // failing range never leaves a task running against the source.
  if (!dispatched) {
    for (auto &future : futures) {
      if (future.valid()) future.wait();
    }
    return dispatched;
  }

  std::vector<ScanResult> results;
  results.reserve(futures.size());
  for (auto &future : futures) {
    if (!future.valid()) {
      results.emplace_back(std::vector<GeoRecord>{});
      continue;
    }
    try {
      results.emplace_back(future.get());
    } catch (const std::future_error &e) {
      results.emplace_back(Status::QueryErr, fmt::format("range scan was dropped: {}", e.what()));
    }
  }

  if (epoch_ != epoch) return {Status::Cancelled, "search was cancelled"};

  std::vector<std::vector<GeoRecord>> records;
  records.reserve(results.size());
  for (size_t i = 0; i < results.size(); i++) {
    if (!results[i]) {
      if (results[i].Is<Status::Cancelled>()) return std::move(results[i]).ToStatus();
      return std::move(results[i]).ToStatus().Prefixed(
          fmt::format("scan of range [{}, {})", ranges[i].start, ranges[i].end));
    }
    records.emplace_back(std::move(*results[i]));
  }
  return records;
}

StatusOr<SearchResult> Searcher::Search(const SearchRequest &req) {
  auto begin = std::chrono::steady_clock::now();
  GET_OR_RET(Validate(req));
  if (!started_) return {Status::NotOK, "searcher is not started"};

  uint64_t epoch = epoch_;
  auto result = GET_OR_RET(req.mode == kSearchDiscovery ? searchDiscovery(req, epoch) : searchNearby(req, epoch));

  auto &stats = result.stats;
  stats.duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin).count();
  std::string what = req.mode == kSearchDiscovery
                         ? fmt::format("Discovery [{}, +{}d)", req.start_time_min, req.date_window_days)
                         : fmt::format("Search ({}, {}) r={}mi", req.center.latitude, req.center.longitude,
                                       req.radius_miles);
  VLOG(1) << fmt::format(
      "{} precision={} ranges={} fetched={} unique={} after_distance={} after_date={} after_filter={} results={} "
      "took {}ms",
      what, stats.precision, stats.ranges, stats.fetched, stats.unique, stats.after_distance, stats.after_date,
      stats.after_filter, stats.results, stats.duration_ms);
  if (result.truncated) {
    LOG(WARNING) << fmt::format("{} hit its fetch limit after {} records, results may be incomplete", what,
                                stats.fetched);
  }
  return result;
}

StatusOr<SearchResult> Searcher::searchNearby(const SearchRequest &req, uint64_t epoch) {
  SearchResult result;
  auto &stats = result.stats;

  stats.precision = QueryPrecision(req.radius_miles);
  auto ranges = GET_OR_RET(QueryBounds(req.center, stats.precision));
  stats.ranges = ranges.size();
  if (ranges.empty()) return result;

  auto budgets = splitBudget(limits_.max_candidates_total, limits_.per_range_limit, ranges.size());
  auto scanned = GET_OR_RET(scanAll(ranges, budgets, epoch));

  // A range that used up a budget smaller than the per-range limit was cut
  // short by the candidate cap.
  for (size_t i = 0; i < scanned.size(); i++) {
    stats.fetched += scanned[i].size();
    if (budgets[i] < limits_.per_range_limit && scanned[i].size() >= budgets[i]) result.truncated = true;
  }

  std::vector<GeoRecord> candidates;
  std::unordered_set<std::string> seen;
  for (auto &records : scanned) {
    for (auto &record : records) {
      if (seen.count(record.id)) continue;
      if (candidates.size() >= limits_.max_candidates_total) {
        result.truncated = true;
        break;
      }
      seen.emplace(record.id);
      candidates.emplace_back(std::move(record));
    }
  }
  stats.unique = candidates.size();

  std::vector<SearchHit> hits;
  for (auto &record : candidates) {
    double distance = 0;
    if (!GetDistanceIfInRadius(req.center, record.point, req.radius_miles, kDistanceMiles, &distance)) continue;
    hits.push_back(SearchHit{std::move(record), distance});
  }
  stats.after_distance = hits.size();

  if (req.date_window_days > 0) {
    int64_t window_end = req.start_time_min + req.date_window_days * kSecondsPerDay;
    hits.erase(std::remove_if(hits.begin(), hits.end(),
                              [&](const SearchHit &hit) { return !inWindow(hit.record, req.start_time_min, window_end); }),
               hits.end());
  }
  stats.after_date = hits.size();

  if (req.filter) {
    hits.erase(std::remove_if(hits.begin(), hits.end(), [&](const SearchHit &hit) { return !req.filter(hit.record); }),
               hits.end());
  }
  stats.after_filter = hits.size();

  std::sort(hits.begin(), hits.end(), [](const SearchHit &a, const SearchHit &b) {
    return std::tie(a.distance_miles, a.record.id) < std::tie(b.distance_miles, b.record.id);
  });

  auto first = hits.begin();
  if (req.cursor) {
    first = std::find_if(hits.begin(), hits.end(), [&](const SearchHit &hit) {
      return !hitBefore(hit.distance_miles, hit.record.id, *req.cursor);
    });
  }
  size_t remaining = std::distance(first, hits.end());
  size_t take = std::min(remaining, req.page_size);
  result.items.assign(std::make_move_iterator(first), std::make_move_iterator(first + take));
  if (remaining > take) {
    const auto &last = result.items.back();
    result.next_cursor = SearchCursor{last.distance_miles, last.record.start_time, last.record.id};
  }
  stats.results = result.items.size();
  return result;
}

StatusOr<SearchResult> Searcher::searchDiscovery(const SearchRequest &req, uint64_t epoch) {
  SearchResult result;
  auto &stats = result.stats;

  size_t fetch_limit = limits_.per_range_limit;
  int64_t window_end = req.start_time_min + req.date_window_days * kSecondsPerDay;
  std::optional<TimeKey> after;
  if (req.cursor) after = TimeKey{req.cursor->start_time, req.cursor->id};

  auto records = GET_OR_RET(
      source_->ScanByTime(req.start_time_min, window_end, after, fetch_limit).Prefixed("scan of the date window"));
  if (epoch_ != epoch) return {Status::Cancelled, "search was cancelled"};

  std::sort(records.begin(), records.end(), [](const GeoRecord &a, const GeoRecord &b) {
    return std::tie(a.start_time, a.id) < std::tie(b.start_time, b.id);
  });
  stats.fetched = records.size();
  stats.unique = records.size();
  stats.after_distance = records.size();
  result.truncated = records.size() >= fetch_limit;

  std::optional<SearchCursor> last_scanned;
  if (!records.empty()) last_scanned = SearchCursor{0, records.back().start_time, records.back().id};

  std::vector<SearchHit> hits;
  for (auto &record : records) {
    if (!inWindow(record, req.start_time_min, window_end)) continue;
    hits.push_back(SearchHit{std::move(record), 0});
  }
  stats.after_date = hits.size();

  if (req.filter) {
    hits.erase(std::remove_if(hits.begin(), hits.end(), [&](const SearchHit &hit) { return !req.filter(hit.record); }),
               hits.end());
  }
  stats.after_filter = hits.size();

  size_t take = std::min(hits.size(), req.page_size);
  result.items.assign(std::make_move_iterator(hits.begin()), std::make_move_iterator(hits.begin() + take));
  if (hits.size() > take) {
    const auto &last = result.items.back();
    result.next_cursor = SearchCursor{0, last.record.start_time, last.record.id};
  } else if (result.truncated) {
    // the page is short only because of the fetch limit, resume after it
    result.next_cursor = last_scanned;
  }
  stats.results = result.items.size();
  return result;
}

}  // namespace geo
