/** @file

  Policy configuration as read from JSON.

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

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "swoc/TextView.h"
#include "swoc/Errata.h"
#include "swoc/swoc_file.h"

#include "edge_policy/DiagsLevel.h"
#include "edge_policy/Headers.h"

namespace edge_policy
{
struct CustomPatternConfig {
  std::string name;
  std::string regex;
  std::string replacement;
  bool        enabled = true;
  int         line    = 0; ///< Source line, 0 if not loaded from text.
};

/// Configuration of the response body filter.
struct RedactionConfig {
  static constexpr uint64_t DEFAULT_MAX_BODY_SIZE = 1048576;

  DiagsLevel log_level = DL_Note;
  /// Built-in pattern switches, keyed by pattern name.
  std::map<std::string, bool, std::less<>> patterns{
    {"credit_card", true},
    {"ssn",         true},
    {"email",       true},
    {"phone_us",    false}
  };
  std::vector<CustomPatternConfig> custom_patterns;
  std::vector<std::string>         bypass_paths{"/health", "/metrics"};
  uint64_t                         max_body_size_bytes = DEFAULT_MAX_BODY_SIZE;
};

struct ConditionConfig {
  std::string                type;
  std::string                key;
  std::string                op;
  std::optional<std::string> value;
  bool                       nocase = false;
  int                        line   = 0;
};

struct RoutingRuleConfig {
  std::string                  name;
  int                          priority = 0;
  std::vector<ConditionConfig> conditions;
  std::string                  target;
  HeaderList                   add_headers;
  std::vector<std::string>     remove_headers;
  int                          line = 0;
};

/// Configuration of the request router.
struct RoutingConfig {
  DiagsLevel                     log_level = DL_Note;
  std::string                    default_target{"v1"};
  bool                           debug = false;
  std::vector<RoutingRuleConfig> rules;
  /// Path prefix to apply to requests sent to a target, keyed by target.
  std::map<std::string, std::string, std::less<>> target_path_prefixes;
};

/** Decode a redaction configuration from JSON (or YAML) @a text.

    Keys not present keep their defaults. Unknown keys are logged and ignored.

    @return Errors found, with their source line.
 */
swoc::Errata parse_redaction_config(swoc::TextView text, RedactionConfig &config);

/// Decode a routing configuration from JSON (or YAML) @a text.
swoc::Errata parse_routing_config(swoc::TextView text, RoutingConfig &config);

/** Read the file at @a path.

    @return Errata on failure, the file content is in @a content.
 */
swoc::Errata load_config_file(swoc::file::path const &path, std::string &content);

} // namespace edge_policy
