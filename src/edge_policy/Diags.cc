/** @file

  Run-time diagnostics implementation.

  @section license License

  Licensed to the Apache Software Foundation (ASF) under one
  or more contributor license agreements.  See the NOTICE file
  distributed with this work for additional information
  regarding copyright ownership.  The ASF licenses this file
  to you under the Apache License, Version 2.0 (the
  "License"); you may not use this file except in compliance
  with the License.  You may obtain a copy of the License at

      http://www.apache.org/licenses/LICENSE-2.0

  Unless required by applicable law or agreed to in writing, software
  distributed under the License is distributed on an "AS IS" BASIS,
  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
  See the License for the specific language governing permissions and
  limitations under the License.
 */

#include <array>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <sys/time.h>

#include "swoc/bwf_base.h"

#include "edge_policy/Diags.h"

using namespace swoc::literals;

namespace edge_policy
{
namespace
{
  // This is treated as an array so must numerically match with @c DiagsLevel
  constexpr std::array<char const *, EDGE_POLICY_DIAGS_LEVEL_COUNT> LEVEL_NAMES{
    {"DIAG", "DEBUG", "STATUS", "NOTE", "WARNING", "ERROR", "FATAL", "ALERT", "EMERGENCY"}
  };

  struct LevelName {
    swoc::TextView name;
    DiagsLevel level;
  };

  constexpr std::array<LevelName, 5> CONFIG_LEVEL_NAMES{
    {{"trace"_tv, DL_Diag}, {"debug"_tv, DL_Debug}, {"info"_tv, DL_Note}, {"warn"_tv, DL_Warning}, {"error"_tv, DL_Error}}
  };

  void
  stderr_sink(DiagsLevel level, swoc::TextView tag, swoc::TextView msg)
  {
    struct timeval tv;
    struct tm      tm;
    char           timestamp[32];

    gettimeofday(&tv, nullptr);
    localtime_r(&tv.tv_sec, &tm);
    size_t n = strftime(timestamp, sizeof(timestamp), "%b %e %H:%M:%S", &tm);
    snprintf(timestamp + n, sizeof(timestamp) - n, ".%03d", static_cast<int>(tv.tv_usec / 1000));

    std::string line;
    if (tag.empty()) {
      swoc::bwprint(line, "[{}] {}: {}\n", std::string_view{timestamp}, diags_level_name(level), msg);
    } else {
      swoc::bwprint(line, "[{}] {}: ({}) {}\n", std::string_view{timestamp}, diags_level_name(level), tag, msg);
    }
    fwrite(line.data(), 1, line.size(), stderr);
  }
} // namespace

char const *
diags_level_name(DiagsLevel level)
{
  if (level < DL_Diag || level >= DL_Undefined) {
    return "UNDEFINED";
  }
  return LEVEL_NAMES[level];
}

std::optional<DiagsLevel>
diags_level_from_name(swoc::TextView name)
{
  for (auto const &entry : CONFIG_LEVEL_NAMES) {
    if (0 == strcasecmp(entry.name, name)) {
      return entry.level;
    }
  }
  return std::nullopt;
}

Diags::Diags() : _sink(stderr_sink) {}

void
Diags::set_level(DiagsLevel level)
{
  _level = level;
}

void
Diags::set_tags(std::string_view tags)
{
  swoc::TextView text{tags};

  _tags.clear();
  while (text) {
    auto tag = text.take_prefix_at('|').trim_if(&isspace);
    if (!tag.empty()) {
      _tags.emplace_back(tag);
    }
  }
}

bool
Diags::tag_activated(std::string_view tag) const
{
  if (_tags.empty()) {
    return true;
  }
  for (auto const &prefix : _tags) {
    if (tag.starts_with(prefix)) {
      return true;
    }
  }
  return false;
}

void
Diags::set_sink(Sink sink)
{
  std::lock_guard<std::mutex> lock(_sink_mutex);
  _sink = sink ? std::move(sink) : Sink{stderr_sink};
}

void
Diags::print(DiagsLevel level, char const *tag, char const *fmt, ...) const
{
  va_list ap;
  va_start(ap, fmt);
  this->print_va(level, tag, fmt, ap);
  va_end(ap);
}

void
Diags::print_va(DiagsLevel level, char const *tag, char const *fmt, va_list ap) const
{
  std::string msg;
  va_list     ap2;

  va_copy(ap2, ap);
  int n = vsnprintf(nullptr, 0, fmt, ap2);
  va_end(ap2);
  if (n < 0) {
    return;
  }
  msg.resize(n + 1);
  vsnprintf(msg.data(), msg.size(), fmt, ap);
  msg.resize(n);

  std::lock_guard<std::mutex> lock(_sink_mutex);
  _sink(level, tag ? swoc::TextView{tag, strlen(tag)} : swoc::TextView{}, msg);
}

Diags *
diags()
{
  static Diags instance;
  return &instance;
}

} // namespace edge_policy
