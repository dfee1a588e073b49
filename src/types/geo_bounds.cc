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

#include "geo_bounds.h"

#include <algorithm>

namespace geo {

GeoRange GeoRange::ForPrefix(std::string_view prefix) {
  std::string start(prefix);
  std::string end = start + GEO_RANGE_SENTINEL;
  return {std::move(start), std::move(end)};
}

std::vector<GeoRange> MergeRanges(std::vector<GeoRange> ranges) {
  if (ranges.empty()) return {};

  std::sort(ranges.begin(), ranges.end(), [](const GeoRange &a, const GeoRange &b) { return a.start < b.start; });

  std::vector<GeoRange> merged;
  GeoRange current = std::move(ranges[0]);
  for (size_t i = 1; i < ranges.size(); i++) {
    auto &next = ranges[i];
    if (current.end >= next.start) {
      if (next.end > current.end) current.end = std::move(next.end);
    } else {
      merged.emplace_back(std::move(current));
      current = std::move(next);
    }
  }
  merged.emplace_back(std::move(current));
  return merged;
}

std::vector<GeoRange> PlanRanges(const std::vector<std::string> &hashes) {
  std::vector<GeoRange> ranges;
  ranges.reserve(hashes.size());
  for (const auto &hash : hashes) {
    ranges.emplace_back(GeoRange::ForPrefix(hash));
  }
  return MergeRanges(std::move(ranges));
}

StatusOr<std::vector<GeoRange>> QueryBounds(const GeoPoint &center, int precision) {
  auto center_hash = GET_OR_RET(Encode(center, precision));
  return PlanRanges(NeighborsWithCenter(center_hash));
}

}  // namespace geo
