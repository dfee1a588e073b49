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

#include "geo_precision.h"

#include <limits>

#include "geo_distance.h"

namespace geo {

int QueryPrecision(double radius_miles) {
  for (const auto &tier : PrecisionTiers()) {
    if (radius_miles < tier.max_radius_miles) return tier.precision;
  }
  return PrecisionTiers().back().precision;
}

int QueryPrecisionForMeters(double radius_meters) { return QueryPrecision(MetersToMiles(radius_meters)); }

CellSizeMiles ApproximateCellSizeMiles(int precision) {
  switch (precision) {
    case 1:
      return {2500, 2500};
    case 2:
      return {625, 312};
    case 3:
      return {156, 156};
    case 4:
      return {39, 19.5};
    case 5:
      return {4.9, 4.9};
    case 6:
      return {1.2, 0.6};
    case 7:
      return {0.15, 0.15};
    case 8:
      return {0.038, 0.019};
    case 9:
      return {0.005, 0.005};
    default:
      return {0.001, 0.001};
  }
}

const std::vector<PrecisionTier> &PrecisionTiers() {
  static const std::vector<PrecisionTier> tiers = {
      {1, 6, ApproximateCellSizeMiles(6)},
      {5, 5, ApproximateCellSizeMiles(5)},
      {50, 4, ApproximateCellSizeMiles(4)},
      {150, 3, ApproximateCellSizeMiles(3)},
      {std::numeric_limits<double>::infinity(), 2, ApproximateCellSizeMiles(2)},
  };
  return tiers;
}

}  // namespace geo
