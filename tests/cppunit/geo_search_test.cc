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

#include "search/geo_search.h"

#include <fmt/format.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

// Returns the same records for every range it is asked about
class RepeatingSource : public geo::RangeSource {
 public:
  explicit RepeatingSource(std::vector<geo::GeoRecord> records) : records_(std::move(records)) {}

  StatusOr<std::vector<geo::GeoRecord>> Scan(const geo::GeoRange &, size_t limit) override {
    scans++;
    std::vector<geo::GeoRecord> out(records_.begin(), records_.begin() + std::min(limit, records_.size()));
    return out;
  }

  std::atomic<int> scans = 0;

 private:
  std::vector<geo::GeoRecord> records_;
};

class FailingSource : public geo::RangeSource {
 public:
  StatusOr<std::vector<geo::GeoRecord>> Scan(const geo::GeoRange &, size_t) override {
    if (++calls == 2) return {Status::NotOK, "connection reset"};
    return std::vector<geo::GeoRecord>{};
  }

  std::atomic<int> calls = 0;
};

// Blocks every scan until Release is called
class BlockingSource : public geo::RangeSource {
 public:
  StatusOr<std::vector<geo::GeoRecord>> Scan(const geo::GeoRange &, size_t) override {
    std::unique_lock<std::mutex> lock(mu_);
    entered_++;
    active_++;
    entered_cv_.notify_all();
    release_cv_.wait(lock, [this] { return released_; });
    active_--;
    return std::vector<geo::GeoRecord>{};
  }

  int Active() {
    std::lock_guard<std::mutex> guard(mu_);
    return active_;
  }

  void WaitEntered() {
    std::unique_lock<std::mutex> lock(mu_);
    entered_cv_.wait(lock, [this] { return entered_ > 0; });
  }

  void Release() {
    std::lock_guard<std::mutex> guard(mu_);
    released_ = true;
    release_cv_.notify_all();
  }

 private:
  std::mutex mu_;
  std::condition_variable entered_cv_;
  std::condition_variable release_cv_;
  int entered_ = 0;
  int active_ = 0;
  bool released_ = false;
};

// Hands out `limit` fresh records for every range
class GeneratingSource : public geo::RangeSource {
 public:
  StatusOr<std::vector<geo::GeoRecord>> Scan(const geo::GeoRange &, size_t limit) override {
    int call = ++calls;
    std::vector<geo::GeoRecord> out;
    for (size_t i = 0; i < limit; i++) {
      out.push_back({fmt::format("c{}-{}", call, i), {37.775, -122.419}, "9q8yyk", 0});
    }
    returned += out.size();
    return out;
  }

  std::atomic<int> calls = 0;
  std::atomic<size_t> returned = 0;
};

geo::GeoRecord MakeRecord(const std::string &id, double lat, double lng, int64_t start_time = 0) {
  return {id, {lat, lng}, *geo::Encode(lat, lng, geo::kStoragePrecision), start_time};
}

std::vector<std::string> Ids(const geo::SearchResult &result) {
  std::vector<std::string> ids;
  for (const auto &hit : result.items) ids.emplace_back(hit.record.id);
  return ids;
}

constexpr int64_t kDay = geo::kSecondsPerDay;

}  // namespace

class GeoSearchTest : public testing::Test {
 protected:
  void SetUp() override {
    searcher_ = std::make_unique<geo::Searcher>(&index_, geo::SearchLimits{}, 4);
    ASSERT_TRUE(searcher_->Start().IsOK());
  }

  void TearDown() override { ASSERT_TRUE(searcher_->Stop().IsOK()); }

  geo::SearchRequest Request(double radius_miles) const {
    geo::SearchRequest req;
    req.center = center_;
    req.radius_miles = radius_miles;
    return req;
  }

  geo::GeoPoint center_{37.7749, -122.4194};
  geo::MemoryIndex index_;
  std::unique_ptr<geo::Searcher> searcher_;
};

TEST_F(GeoSearchTest, SanFranciscoScenario) {
  ASSERT_TRUE(index_.Put("far", {37.9, -122.0}, 0).IsOK());
  ASSERT_TRUE(index_.Put("near", {37.78, -122.42}, 0).IsOK());
  ASSERT_TRUE(index_.Put("london", {51.5074, -0.1278}, 0).IsOK());

  auto result = searcher_->Search(Request(5));
  ASSERT_TRUE(result) << result.Msg();
  EXPECT_EQ(result->stats.precision, 4);
  EXPECT_GE(result->stats.ranges, 1);
  EXPECT_LE(result->stats.ranges, 9);
  EXPECT_EQ(result->stats.unique, 2);
  EXPECT_EQ(result->stats.after_distance, 1);
  EXPECT_EQ(Ids(*result), std::vector<std::string>{"near"});
  EXPECT_LT(result->items[0].distance_miles, 1);
  EXPECT_FALSE(result->truncated);
  EXPECT_FALSE(result->next_cursor);

  // both are within 30 miles and come back nearest first
  auto wide = searcher_->Search(Request(30));
  ASSERT_TRUE(wide);
  EXPECT_EQ(Ids(*wide), (std::vector<std::string>{"near", "far"}));
  EXPECT_LT(wide->items[0].distance_miles, wide->items[1].distance_miles);
  EXPECT_LE(wide->items[1].distance_miles, 30);
}

TEST_F(GeoSearchTest, PrecisionFollowsRadius) {
  auto result = searcher_->Search(Request(4.99));
  ASSERT_TRUE(result);
  EXPECT_EQ(result->stats.precision, 5);
  EXPECT_LE(result->stats.ranges, 9);
  EXPECT_TRUE(result->items.empty());

  auto fine = searcher_->Search(Request(0.5));
  ASSERT_TRUE(fine);
  EXPECT_EQ(fine->stats.precision, 6);

  auto coarse = searcher_->Search(Request(100));
  ASSERT_TRUE(coarse);
  EXPECT_EQ(coarse->stats.precision, 3);
}

TEST_F(GeoSearchTest, Validate) {
  auto req = Request(10);
  req.center = {91, 0};
  EXPECT_TRUE(searcher_->Search(req).Is<Status::InvalidCoordinates>());
  req.center = {0, -180.5};
  EXPECT_TRUE(searcher_->Search(req).Is<Status::InvalidCoordinates>());

  EXPECT_TRUE(searcher_->Search(Request(0)).Is<Status::InvalidArgument>());
  EXPECT_TRUE(searcher_->Search(Request(-1)).Is<Status::InvalidArgument>());
  EXPECT_TRUE(searcher_->Search(Request(std::nan(""))).Is<Status::InvalidArgument>());
  EXPECT_TRUE(searcher_->Search(Request(100.01)).Is<Status::RadiusTooLarge>());
  EXPECT_TRUE(searcher_->Search(Request(100)).IsOK());

  req = Request(10);
  req.date_window_days = -1;
  EXPECT_TRUE(searcher_->Search(req).Is<Status::DateWindowInvalid>());
  req.date_window_days = 31;
  EXPECT_TRUE(searcher_->Search(req).Is<Status::DateWindowTooLarge>());
  req.date_window_days = 30;
  EXPECT_TRUE(searcher_->Validate(req).IsOK());

  req.page_size = 0;
  EXPECT_TRUE(searcher_->Validate(req).Is<Status::InvalidArgument>());
}

TEST_F(GeoSearchTest, DateWindow) {
  const int64_t now = 1700000000;
  ASSERT_TRUE(index_.Put("yesterday", {37.775, -122.419}, now - kDay).IsOK());
  ASSERT_TRUE(index_.Put("today", {37.776, -122.419}, now).IsOK());
  ASSERT_TRUE(index_.Put("next-week", {37.777, -122.419}, now + 7 * kDay).IsOK());
  ASSERT_TRUE(index_.Put("next-month", {37.778, -122.419}, now + 30 * kDay).IsOK());

  auto req = Request(1);
  req.start_time_min = now;
  req.date_window_days = 30;
  auto result = searcher_->Search(req);
  ASSERT_TRUE(result);
  EXPECT_EQ(Ids(*result), (std::vector<std::string>{"today", "next-week"}));
  EXPECT_EQ(result->stats.after_distance, 4);
  EXPECT_EQ(result->stats.after_date, 2);

  req.date_window_days = 0;
  auto unbounded = searcher_->Search(req);
  ASSERT_TRUE(unbounded);
  EXPECT_EQ(unbounded->items.size(), 4);
}

TEST_F(GeoSearchTest, CallerFilter) {
  ASSERT_TRUE(index_.Put("course-1", {37.775, -122.419}, 0).IsOK());
  ASSERT_TRUE(index_.Put("course-2", {37.776, -122.419}, 0).IsOK());
  ASSERT_TRUE(index_.Put("range-1", {37.777, -122.419}, 0).IsOK());

  auto req = Request(1);
  req.filter = [](const geo::GeoRecord &record) { return record.id.rfind("course-", 0) == 0; };
  auto result = searcher_->Search(req);
  ASSERT_TRUE(result);
  EXPECT_EQ(Ids(*result), (std::vector<std::string>{"course-1", "course-2"}));
  EXPECT_EQ(result->stats.after_date, 3);
  EXPECT_EQ(result->stats.after_filter, 2);
}

TEST_F(GeoSearchTest, Pagination) {
  for (int i = 0; i < 7; i++) {
    ASSERT_TRUE(index_.Put("p" + std::to_string(i), {center_.latitude + i * 0.001, center_.longitude}, 0).IsOK());
  }
  // two records at the same distance are ordered by id
  ASSERT_TRUE(index_.Put("tie-b", {center_.latitude + 0.01, center_.longitude}, 0).IsOK());
  ASSERT_TRUE(index_.Put("tie-a", {center_.latitude + 0.01, center_.longitude}, 0).IsOK());

  auto req = Request(2);
  req.page_size = 3;

  std::vector<std::string> seen;
  double last_distance = 0;
  int pages = 0;
  while (true) {
    auto result = searcher_->Search(req);
    ASSERT_TRUE(result);
    ASSERT_LE(result->items.size(), 3);
    pages++;
    for (const auto &hit : result->items) {
      EXPECT_GE(hit.distance_miles, last_distance);
      last_distance = hit.distance_miles;
      seen.emplace_back(hit.record.id);
    }
    if (!result->next_cursor) break;
    EXPECT_EQ(result->next_cursor->id, result->items.back().record.id);
    req.cursor = result->next_cursor;
  }

  EXPECT_EQ(pages, 3);
  std::vector<std::string> expected = {"p0", "p1", "p2", "p3", "p4", "p5", "p6", "tie-a", "tie-b"};
  EXPECT_EQ(seen, expected);
}

TEST_F(GeoSearchTest, NotStarted) {
  geo::Searcher idle(&index_, geo::SearchLimits{}, 1);
  EXPECT_FALSE(idle.Search(Request(1)).IsOK());
  EXPECT_FALSE(idle.Stop().IsOK());
  EXPECT_FALSE(searcher_->Start().IsOK());
}

TEST(GeoSearch, Dedupe) {
  RepeatingSource source({MakeRecord("a", 37.775, -122.419), MakeRecord("b", 37.776, -122.419)});
  geo::Searcher searcher(&source, geo::SearchLimits{}, 2);
  ASSERT_TRUE(searcher.Start().IsOK());

  geo::SearchRequest req;
  req.center = {37.7749, -122.4194};
  req.radius_miles = 2;
  auto result = searcher.Search(req);
  ASSERT_TRUE(result);
  EXPECT_EQ(source.scans.load(), static_cast<int>(result->stats.ranges));
  EXPECT_EQ(result->stats.fetched, 2 * result->stats.ranges);
  EXPECT_EQ(result->stats.unique, 2);
  EXPECT_EQ(Ids(*result), (std::vector<std::string>{"a", "b"}));
  ASSERT_TRUE(searcher.Stop().IsOK());
}

TEST(GeoSearch, Truncation) {
  std::vector<geo::GeoRecord> records;
  for (int i = 0; i < 10; i++) {
    records.emplace_back(MakeRecord("r" + std::to_string(i), 37.775 + i * 0.0001, -122.419));
  }

  geo::SearchRequest req;
  req.center = {37.7749, -122.4194};
  req.radius_miles = 2;

  // the budget leaves every range its full per-range limit
  RepeatingSource source(records);
  geo::SearchLimits limits;
  limits.max_candidates_total = 100;
  limits.per_range_limit = 3;
  geo::Searcher searcher(&source, limits, 2);
  ASSERT_TRUE(searcher.Start().IsOK());
  auto result = searcher.Search(req);
  ASSERT_TRUE(result);
  ASSERT_EQ(result->stats.ranges, 9);
  EXPECT_EQ(result->stats.fetched, 27);
  EXPECT_EQ(result->stats.unique, 3);
  EXPECT_FALSE(result->truncated);
  ASSERT_TRUE(searcher.Stop().IsOK());

  // a cap smaller than the range count leaves later ranges unscanned
  RepeatingSource small(records);
  limits.max_candidates_total = 4;
  limits.per_range_limit = 10;
  geo::Searcher capped_searcher(&small, limits, 2);
  ASSERT_TRUE(capped_searcher.Start().IsOK());
  auto capped = capped_searcher.Search(req);
  ASSERT_TRUE(capped);
  EXPECT_EQ(small.scans.load(), 4);
  EXPECT_EQ(capped->stats.fetched, 4);
  EXPECT_EQ(capped->stats.unique, 1);
  EXPECT_TRUE(capped->truncated);
  EXPECT_EQ(Ids(*capped), std::vector<std::string>{"r0"});
  ASSERT_TRUE(capped_searcher.Stop().IsOK());
}

TEST(GeoSearch, FetchBudget) {
  GeneratingSource source;
  geo::SearchLimits limits;
  limits.max_candidates_total = 2000;
  limits.per_range_limit = 2000;
  geo::Searcher searcher(&source, limits, 4);
  ASSERT_TRUE(searcher.Start().IsOK());

  geo::SearchRequest req;
  req.center = {37.7749, -122.4194};
  req.radius_miles = 2;
  auto result = searcher.Search(req);
  ASSERT_TRUE(result) << result.Msg();
  EXPECT_EQ(result->stats.ranges, 9);
  EXPECT_EQ(source.calls.load(), 9);
  EXPECT_EQ(source.returned.load(), 2000);
  EXPECT_EQ(result->stats.fetched, source.returned.load());
  EXPECT_EQ(result->stats.unique, 2000);
  EXPECT_TRUE(result->truncated);
  EXPECT_EQ(result->items.size(), geo::kDefaultPageSize);
  ASSERT_TRUE(searcher.Stop().IsOK());
}

TEST(GeoSearch, ScanFailure) {
  FailingSource source;
  geo::Searcher searcher(&source, geo::SearchLimits{}, 2);
  ASSERT_TRUE(searcher.Start().IsOK());

  geo::SearchRequest req;
  req.center = {37.7749, -122.4194};
  req.radius_miles = 2;
  auto result = searcher.Search(req);
  ASSERT_FALSE(result);
  EXPECT_EQ(result.GetCode(), Status::NotOK);
  EXPECT_NE(result.Msg().find("scan of range"), std::string::npos);
  EXPECT_NE(result.Msg().find("connection reset"), std::string::npos);
  ASSERT_TRUE(searcher.Stop().IsOK());
}

TEST(GeoSearch, Cancel) {
  BlockingSource source;
  geo::Searcher searcher(&source, geo::SearchLimits{}, 2);
  ASSERT_TRUE(searcher.Start().IsOK());

  geo::SearchRequest req;
  req.center = {37.7749, -122.4194};
  req.radius_miles = 2;
  auto pending = std::async(std::launch::async, [&searcher, &req] { return searcher.Search(req); });

  source.WaitEntered();
  searcher.Cancel();
  source.Release();

  auto result = pending.get();
  EXPECT_TRUE(result.Is<Status::Cancelled>());

  // later searches are not affected
  auto next = searcher.Search(req);
  EXPECT_TRUE(next.IsOK()) << next.Msg();
  ASSERT_TRUE(searcher.Stop().IsOK());
}

TEST(GeoSearch, DispatchFailureWaitsForQueuedScans) {
  BlockingSource source;
  // one worker and a single queue slot cannot take all nine ranges
  geo::Searcher searcher(&source, geo::SearchLimits{}, 1, 1);
  ASSERT_TRUE(searcher.Start().IsOK());

  geo::SearchRequest req;
  req.center = {37.7749, -122.4194};
  req.radius_miles = 2;
  auto pending = std::async(std::launch::async, [&searcher, &req] { return searcher.Search(req); });

  source.WaitEntered();
  EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
  source.Release();

  auto result = pending.get();
  ASSERT_FALSE(result);
  EXPECT_NE(result.Msg().find("failed to dispatch range scan"), std::string::npos);
  EXPECT_EQ(source.Active(), 0);
  ASSERT_TRUE(searcher.Stop().IsOK());
}

TEST(GeoSearch, StopDuringSearch) {
  geo::MemoryIndex index;
  ASSERT_TRUE(index.Put("near", {37.78, -122.42}, 0).IsOK());

  geo::SearchRequest req;
  req.center = {37.7749, -122.4194};
  req.radius_miles = 5;

  for (int round = 0; round < 50; round++) {
    geo::Searcher searcher(&index, geo::SearchLimits{}, 2);
    ASSERT_TRUE(searcher.Start().IsOK());

    auto pending = std::async(std::launch::async, [&searcher, &req] {
      std::vector<Status> statuses;
      for (int i = 0; i < 20; i++) {
        auto result = searcher.Search(req);
        statuses.emplace_back(result ? Status::OK() : std::move(result).ToStatus());
      }
      return statuses;
    });
    ASSERT_TRUE(searcher.Stop().IsOK());

    // every search returns, either with results or with an error
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(10)), std::future_status::ready);
    for (const auto &s : pending.get()) {
      EXPECT_TRUE(s.IsOK() || s.Is<Status::NotOK>() || s.Is<Status::Cancelled>() || s.Is<Status::QueryErr>())
          << s.Msg();
    }
  }
}

class GeoDiscoveryTest : public testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(index_.Put("past", {37.775, -122.419}, kNow - kDay).IsOK());
    ASSERT_TRUE(index_.Put("a", {51.5074, -0.1278}, kNow + 3600).IsOK());
    ASSERT_TRUE(index_.Put("c", {37.776, -122.419}, kNow + 7200).IsOK());
    ASSERT_TRUE(index_.Put("b", {-33.8688, 151.2093}, kNow + 7200).IsOK());
    ASSERT_TRUE(index_.Put("d", {37.777, -122.419}, kNow + 3 * kDay).IsOK());
    ASSERT_TRUE(index_.Put("late", {37.778, -122.419}, kNow + 40 * kDay).IsOK());
  }

  static geo::SearchRequest Request(int days) {
    geo::SearchRequest req;
    req.mode = geo::kSearchDiscovery;
    req.start_time_min = kNow;
    req.date_window_days = days;
    return req;
  }

  static constexpr int64_t kNow = 1700000000;
  geo::MemoryIndex index_;
};

TEST_F(GeoDiscoveryTest, SoonestFirstAcrossPages) {
  geo::Searcher searcher(&index_, geo::SearchLimits{}, 1);
  ASSERT_TRUE(searcher.Start().IsOK());

  auto req = Request(30);
  req.page_size = 2;
  auto first = searcher.Search(req);
  ASSERT_TRUE(first) << first.Msg();
  EXPECT_EQ(Ids(*first), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(first->stats.precision, 0);
  EXPECT_EQ(first->stats.ranges, 0);
  EXPECT_EQ(first->stats.fetched, 4);
  EXPECT_FALSE(first->truncated);
  ASSERT_TRUE(first->next_cursor);
  EXPECT_EQ(first->next_cursor->id, "b");
  EXPECT_EQ(first->next_cursor->start_time, kNow + 7200);

  req.cursor = first->next_cursor;
  auto second = searcher.Search(req);
  ASSERT_TRUE(second);
  EXPECT_EQ(Ids(*second), (std::vector<std::string>{"c", "d"}));
  EXPECT_FALSE(second->next_cursor);
  ASSERT_TRUE(searcher.Stop().IsOK());
}

TEST_F(GeoDiscoveryTest, Validate) {
  geo::Searcher searcher(&index_, geo::SearchLimits{}, 1);
  ASSERT_TRUE(searcher.Start().IsOK());

  // no center or radius is needed
  auto req = Request(1);
  req.center = {91, 0};
  req.radius_miles = -1;
  auto result = searcher.Search(req);
  ASSERT_TRUE(result) << result.Msg();
  EXPECT_EQ(Ids(*result), (std::vector<std::string>{"a", "b", "c"}));

  EXPECT_TRUE(searcher.Search(Request(0)).Is<Status::DateWindowInvalid>());
  EXPECT_TRUE(searcher.Search(Request(-1)).Is<Status::DateWindowInvalid>());
  EXPECT_TRUE(searcher.Search(Request(31)).Is<Status::DateWindowTooLarge>());
  ASSERT_TRUE(searcher.Stop().IsOK());
}

TEST_F(GeoDiscoveryTest, FetchLimit) {
  geo::SearchLimits limits;
  limits.per_range_limit = 3;
  geo::Searcher searcher(&index_, limits, 1);
  ASSERT_TRUE(searcher.Start().IsOK());

  auto req = Request(30);
  req.filter = [](const geo::GeoRecord &record) { return record.id != "c"; };
  auto first = searcher.Search(req);
  ASSERT_TRUE(first);
  EXPECT_EQ(Ids(*first), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(first->stats.fetched, 3);
  EXPECT_EQ(first->stats.after_filter, 2);
  EXPECT_TRUE(first->truncated);
  // the page is short only because of the fetch limit
  ASSERT_TRUE(first->next_cursor);
  EXPECT_EQ(first->next_cursor->id, "c");

  req.cursor = first->next_cursor;
  auto second = searcher.Search(req);
  ASSERT_TRUE(second);
  EXPECT_EQ(Ids(*second), std::vector<std::string>{"d"});
  EXPECT_FALSE(second->truncated);
  EXPECT_FALSE(second->next_cursor);
  ASSERT_TRUE(searcher.Stop().IsOK());
}

TEST(GeoSearch, DiscoveryNeedsTimeOrderedSource) {
  RepeatingSource source({MakeRecord("a", 37.775, -122.419)});
  geo::Searcher searcher(&source, geo::SearchLimits{}, 1);
  ASSERT_TRUE(searcher.Start().IsOK());

  geo::SearchRequest req;
  req.mode = geo::kSearchDiscovery;
  req.date_window_days = 7;
  auto result = searcher.Search(req);
  ASSERT_FALSE(result);
  EXPECT_NE(result.Msg().find("scan of the date window"), std::string::npos);
  ASSERT_TRUE(searcher.Stop().IsOK());
}
