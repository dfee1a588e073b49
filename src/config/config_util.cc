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

#include "config_util.h"

#include <algorithm>
#include <cctype>

#include "string_util.h"

namespace {

constexpr std::string_view kValueTrimChars = " \t\r\n\v\f\b";

char unescape(char c) {
  switch (c) {
    case 't':
      return '\t';
    case 'r':
      return '\r';
    case 'n':
      return '\n';
    case 'v':
      return '\v';
    case 'f':
      return '\f';
    case 'b':
      return '\b';
    default:
      return c;
  }
}

}  // namespace

StatusOr<ConfigKV> ParseConfigLine(const std::string &line) {
  enum {
    PRE_KEY_SPACE,    // whitespace before the key
    KEY,              // inside the key
    AFTER_KEY_SPACE,  // whitespace between key and value
    NORMAL,           // inside an unquoted value
    QUOTED,           // inside a quoted value
    ESCAPE,           // right after a backslash in a quoted value
    AFTER_VAL_SPACE,  // after a closing quote
  } state = PRE_KEY_SPACE;

  char quote = '"';
  std::string current;
  ConfigKV res;

  for (auto i = line.begin(); i != line.end(); ++i) {
    const char c = *i;
    bool comment = false;

    switch (state) {
      case PRE_KEY_SPACE:
        if (c == '#') {
          comment = true;
        } else if (!std::isspace(c)) {
          current.push_back(c);
          state = KEY;
        }
        break;
      case KEY:
        if (c == '#' || std::isspace(c)) {
          res.first = std::move(current);
          current.clear();
          comment = c == '#';
          state = AFTER_KEY_SPACE;
        } else {
          current.push_back(c);
        }
        break;
      case AFTER_KEY_SPACE:
        if (c == '#') {
          comment = true;
        } else if (c == '"' || c == '\'') {
          quote = c;
          state = QUOTED;
        } else if (!std::isspace(c)) {
          current.push_back(c);
          state = NORMAL;
        }
        break;
      case NORMAL:
        if (c == '#') {
          comment = true;
        } else {
          current.push_back(c);
        }
        break;
      case QUOTED:
        if (c == '\\') {
          state = ESCAPE;
        } else if (c == quote) {
          res.second = std::move(current);
          current.clear();
          state = AFTER_VAL_SPACE;
        } else {
          current.push_back(c);
        }
        break;
      case ESCAPE:
        current.push_back(unescape(c));
        state = QUOTED;
        break;
      case AFTER_VAL_SPACE:
        if (c == '#') {
          comment = true;
        } else if (!std::isspace(c)) {
          return {Status::NotOK, "more than 2 items in config line"};
        }
        break;
    }

    if (comment) break;
  }

  if (state == KEY) {
    res.first = std::move(current);
  } else if (state == NORMAL) {
    res.second = util::Trim(std::move(current), kValueTrimChars);
  } else if (state == QUOTED || state == ESCAPE) {
    return {Status::NotOK, "config line ends unexpectedly in quoted string"};
  }

  return res;
}

std::string DumpConfigLine(const ConfigKV &config) {
  std::string res = config.first;
  res += " ";

  bool need_quote = config.second.empty() || std::any_of(config.second.begin(), config.second.end(), [](char c) {
                      return std::isspace(c) || c == '"' || c == '\'' || c == '#';
                    });
  if (!need_quote) {
    res += config.second;
    return res;
  }

  res += '"';
  for (char c : config.second) {
    switch (c) {
      case '\t':
        res += "\\t";
        break;
      case '\r':
        res += "\\r";
        break;
      case '\n':
        res += "\\n";
        break;
      case '\v':
        res += "\\v";
        break;
      case '\f':
        res += "\\f";
        break;
      case '\b':
        res += "\\b";
        break;
      case '"':
      case '\'':
      case '\\':
        res += '\\';
        res += c;
        break;
      default:
        res += c;
    }
  }
  res += '"';
  return res;
}
