/** @file

  Run-time diagnostics: leveled messages and tag controlled debug output.

  The macros follow the usual layout. @c Status, @c Note, @c Warning and @c Error take a printf
  style format and are emitted when the level is at or above the configured threshold. Debug
  output goes through a @c DbgCtl instance,

  @code
  static DbgCtl dbg_ctl{"edge_policy.route"};
  ...
  Dbg(dbg_ctl, "rule %s matched", name.c_str());
  @endcode

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

#pragma once

#include <cstdarg>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "swoc/TextView.h"

#include "edge_policy/DiagsLevel.h"

namespace edge_policy
{
/// Printable name of @a level, e.g. "WARNING".
char const *diags_level_name(DiagsLevel level);

/** Map a configuration log level name to a diagnostic level.

    Accepted names are @c trace, @c debug, @c info, @c warn and @c error, compared
    case-insensitively.

    @return The level, or nothing if @a name is not recognized.
 */
std::optional<DiagsLevel> diags_level_from_name(swoc::TextView name);

class Diags
{
public:
  /// Destination for formatted messages. @a tag is empty for non-debug output.
  using Sink = std::function<void(DiagsLevel level, swoc::TextView tag, swoc::TextView msg)>;

  Diags();

  // No copying.
  Diags(Diags const &)            = delete;
  Diags &operator=(Diags const &) = delete;

  /// Messages below @a level are discarded.
  void set_level(DiagsLevel level);

  DiagsLevel
  level() const
  {
    return _level;
  }

  bool
  on(DiagsLevel level) const
  {
    return level >= _level;
  }

  /** Restrict debug output to tags with one of the given prefixes.

      @a tags is a list separated by '|', e.g. "edge_policy.route|edge_policy.config". An
      empty list enables every tag.
   */
  void set_tags(std::string_view tags);

  /// @return @c true if debug output for @a tag is enabled.
  bool tag_activated(std::string_view tag) const;

  /// Replace the output sink. An empty sink restores the default (stderr).
  void set_sink(Sink sink);

  void print(DiagsLevel level, char const *tag, char const *fmt, ...) const __attribute__((format(printf, 4, 5)));
  void print_va(DiagsLevel level, char const *tag, char const *fmt, va_list ap) const;

private:
  DiagsLevel _level = DL_Note;
  std::vector<std::string> _tags;
  Sink _sink;
  mutable std::mutex _sink_mutex;
};

/// The process wide diagnostics instance.
Diags *diags();

// Debug output control. Cheap to test, intended to be a static or namespace scope object.
//
class DbgCtl
{
public:
  explicit DbgCtl(char const *tag) : _tag(tag) {}

  char const *
  tag() const
  {
    return _tag;
  }

  bool
  on() const
  {
    return diags()->on(DL_Debug) && diags()->tag_activated(_tag);
  }

private:
  char const *const _tag;
};

} // namespace edge_policy

#define EdgePolicyDiagsError(LEVEL, ...)                                \
  do {                                                                  \
    if (::edge_policy::diags()->on(LEVEL)) {                            \
      ::edge_policy::diags()->print(LEVEL, nullptr, __VA_ARGS__);       \
    }                                                                   \
  } while (false)

#define Status(...)  EdgePolicyDiagsError(::edge_policy::DL_Status, __VA_ARGS__)  // Log information
#define Note(...)    EdgePolicyDiagsError(::edge_policy::DL_Note, __VA_ARGS__)    // Log significant information
#define Warning(...) EdgePolicyDiagsError(::edge_policy::DL_Warning, __VA_ARGS__) // Log concerning information
#define Error(...)   EdgePolicyDiagsError(::edge_policy::DL_Error, __VA_ARGS__)   // Log operational failure

// printf-like debug output. First parameter must be an instance of DbgCtl.
//
#define Dbg(CTL, ...)                                                                \
  do {                                                                               \
    if ((CTL).on()) {                                                                \
      ::edge_policy::diags()->print(::edge_policy::DL_Debug, (CTL).tag(), __VA_ARGS__); \
    }                                                                                \
  } while (false)

// Trace level output, below Debug.
//
#define Diag(CTL, ...)                                                                                           \
  do {                                                                                                           \
    if (::edge_policy::diags()->on(::edge_policy::DL_Diag) && ::edge_policy::diags()->tag_activated((CTL).tag())) { \
      ::edge_policy::diags()->print(::edge_policy::DL_Diag, (CTL).tag(), __VA_ARGS__);                           \
    }                                                                                                            \
  } while (false)
