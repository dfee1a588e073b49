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
#include <utility>

#include "status.h"

using ConfigKV = std::pair<std::string, std::string>;

// ParseConfigLine splits one line of a config file into its key and value.
// Comments start with '#'; values may be single or double quoted with
// backslash escapes. An empty pair is returned for blank or comment lines.
StatusOr<ConfigKV> ParseConfigLine(const std::string &line);

// DumpConfigLine is the inverse of ParseConfigLine, quoting the value
// whenever it contains whitespace, quotes or '#'.
std::string DumpConfigLine(const ConfigKV &config);
