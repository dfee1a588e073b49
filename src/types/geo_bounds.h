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

#include <string>
#include <string_view>
#include <vector>

#include "geohash.h"
#include "status.h"

namespace geo {

// GeoRange is the half-open interval [start, end) over the lexicographic
// order of geohash strings.
struct GeoRange {
  std::string start;
  std::string end;

  GeoRange() = default;
  GeoRange(std::string start, std::string end) : start(std::move(start)), end(std::move(end)) {}

  // The range holding every hash that has `prefix` as a prefix
  static GeoRange ForPrefix(std::string_view prefix);

  bool Contains(std::string_view key) const { return start <= key && key < end; }

  bool operator==(const GeoRange &other) const { return start == other.start && end == other.end; }
  bool operator!=(const GeoRange &other) const { return !(*this == other); }
};

/*
 * PlanRanges turns a set of cells into the smallest ordered list of
 * non-overlapping ranges covering all of them. Ranges are sorted by start and
 * folded into the running range while its end reaches the next start.
 * An empty input gives an empty plan.
 */
std::vector<GeoRange> PlanRanges(const std::vector<std::string> &hashes);

// MergeRanges is the folding step of PlanRanges, for arbitrary ranges
std::vector<GeoRange> MergeRanges(std::vector<GeoRange> ranges);

// QueryBounds plans the ranges covering the cell of `center` at `precision`
// together with its neighbors.
StatusOr<std::vector<GeoRange>> QueryBounds(const GeoPoint &center, int precision);

}  // namespace geo
