/** @file

  Policy configuration decoding.

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

#include <algorithm>
#include <cinttypes>
#include <initializer_list>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "swoc/bwf_base.h"
#include "swoc/MemSpan.h"

#include "edge_policy/PolicyConfig.h"
#include "edge_policy/Errata.h"
#include "edge_policy/Diags.h"

namespace
{
using namespace edge_policy;

// Redaction keys.
constexpr char PATTERNS[]            = "patterns";
constexpr char CUSTOM_PATTERNS[]     = "custom_patterns";
constexpr char BYPASS_PATHS[]        = "bypass_paths";
constexpr char MAX_BODY_SIZE_BYTES[] = "max_body_size_bytes";
constexpr char REGEX[]               = "regex";
constexpr char REPLACEMENT[]         = "replacement";
constexpr char ENABLED[]             = "enabled";

// Routing keys.
constexpr char DEFAULT_TARGET[]       = "default_target";
constexpr char DEBUG_FLAG[]           = "debug";
constexpr char RULES[]                = "rules";
constexpr char TARGET_PATH_PREFIXES[] = "target_path_prefixes";
constexpr char PRIORITY[]             = "priority";
constexpr char CONDITIONS[]           = "conditions";
constexpr char TARGET[]               = "target";
constexpr char ADD_HEADERS[]          = "add_headers";
constexpr char REMOVE_HEADERS[]       = "remove_headers";
constexpr char TYPE[]                 = "type";
constexpr char KEY[]                  = "key";
constexpr char OPERATOR[]             = "operator";
constexpr char VALUE[]                = "value";
constexpr char NOCASE[]               = "nocase";

// Shared keys.
constexpr char LOG_LEVEL[] = "log_level";
constexpr char NAME[]      = "name";

DbgCtl dbg_ctl{"edge_policy.config"};

// Align errata severities with the diagnostic levels. Every policy loader goes through this file,
// so this runs before any configuration errata is checked.
struct ErrataSeverityInit {
  ErrataSeverityInit()
  {
    swoc::Errata::FAILURE_SEVERITY = ERRATA_WARN;
    swoc::Errata::SEVERITY_NAMES   = swoc::MemSpan<swoc::TextView const>(Severity_Names.data(), Severity_Names.size());
  }
} errata_severity_init;

inline int
line_of(YAML::Node const &node)
{
  return node.Mark().line + 1;
}

void
warn_unknown_keys(YAML::Node const &node, std::initializer_list<std::string_view> keys, char const *what)
{
  for (auto const &elem : node) {
    auto key = elem.first.as<std::string>();
    if (std::none_of(keys.begin(), keys.end(), [&key](std::string_view k) { return k == key; })) {
      Warning("unsupported key '%s' in %s at line %d", key.c_str(), what, line_of(elem.first));
    }
  }
}

YAML::Node
required(YAML::Node const &node, char const *key, char const *what)
{
  YAML::Node value = node[key];
  if (!value || value.IsNull()) {
    throw YAML::ParserException(node.Mark(), std::string(what) + " is missing '" + key + "'");
  }
  return value;
}

void
expect_map(YAML::Node const &node, char const *what)
{
  if (!node.IsMap()) {
    throw YAML::ParserException(node.Mark(), std::string(what) + " must be an object");
  }
}

void
expect_sequence(YAML::Node const &node, char const *what)
{
  if (!node.IsSequence()) {
    throw YAML::ParserException(node.Mark(), std::string(what) + " must be an array");
  }
}

DiagsLevel
decode_log_level(YAML::Node const &node)
{
  auto name = node.as<std::string>();
  if (auto level = diags_level_from_name(name); level) {
    return *level;
  }
  Warning("unknown log_level '%s' at line %d, using 'info'", name.c_str(), line_of(node));
  return DL_Note;
}

std::vector<std::string>
decode_string_list(YAML::Node const &node, char const *what)
{
  std::vector<std::string> zret;
  expect_sequence(node, what);
  for (auto const &item : node) {
    zret.push_back(item.as<std::string>());
  }
  return zret;
}

} // namespace

namespace YAML
{
template <> struct convert<edge_policy::CustomPatternConfig> {
  static bool
  decode(Node const &node, edge_policy::CustomPatternConfig &item)
  {
    expect_map(node, "custom pattern");
    warn_unknown_keys(node, {NAME, REGEX, REPLACEMENT, ENABLED}, "custom pattern");

    item.name        = required(node, NAME, "custom pattern").as<std::string>();
    item.regex       = required(node, REGEX, "custom pattern").as<std::string>();
    item.replacement = required(node, REPLACEMENT, "custom pattern").as<std::string>();
    if (node[ENABLED]) {
      item.enabled = node[ENABLED].as<bool>();
    }
    if (item.name.empty()) {
      throw YAML::ParserException(node.Mark(), "custom pattern name must not be empty");
    }
    if (item.regex.empty()) {
      throw YAML::ParserException(node.Mark(), "custom pattern '" + item.name + "' has an empty regex");
    }
    item.line = line_of(node);
    return true;
  }
};

template <> struct convert<edge_policy::ConditionConfig> {
  static bool
  decode(Node const &node, edge_policy::ConditionConfig &item)
  {
    expect_map(node, "condition");
    warn_unknown_keys(node, {TYPE, KEY, OPERATOR, VALUE, NOCASE}, "condition");

    item.type = required(node, TYPE, "condition").as<std::string>();
    item.op   = required(node, OPERATOR, "condition").as<std::string>();
    if (node[KEY] && !node[KEY].IsNull()) {
      item.key = node[KEY].as<std::string>();
    }
    if (node[VALUE] && !node[VALUE].IsNull()) {
      item.value = node[VALUE].as<std::string>();
    }
    if (node[NOCASE]) {
      item.nocase = node[NOCASE].as<bool>();
    }
    item.line = line_of(node);
    return true;
  }
};

template <> struct convert<edge_policy::RoutingRuleConfig> {
  static bool
  decode(Node const &node, edge_policy::RoutingRuleConfig &item)
  {
    expect_map(node, "rule");
    warn_unknown_keys(node, {NAME, PRIORITY, CONDITIONS, TARGET, ADD_HEADERS, REMOVE_HEADERS}, "rule");

    item.name   = required(node, NAME, "rule").as<std::string>();
    item.target = required(node, TARGET, "rule").as<std::string>();
    if (item.name.empty()) {
      throw YAML::ParserException(node.Mark(), "rule name must not be empty");
    }
    if (item.target.empty()) {
      throw YAML::ParserException(node.Mark(), "rule '" + item.name + "' has an empty target");
    }
    if (node[PRIORITY]) {
      item.priority = node[PRIORITY].as<int>();
    }

    if (auto conditions = node[CONDITIONS]; conditions) {
      expect_sequence(conditions, "conditions");
      for (auto const &condition : conditions) {
        item.conditions.push_back(condition.as<edge_policy::ConditionConfig>());
      }
    }

    if (auto fields = node[ADD_HEADERS]; fields) {
      expect_map(fields, "add_headers");
      for (auto const &field : fields) {
        item.add_headers.emplace_back(field.first.as<std::string>(), field.second.as<std::string>());
      }
    }

    if (auto fields = node[REMOVE_HEADERS]; fields) {
      item.remove_headers = decode_string_list(fields, "remove_headers");
    }

    item.line = line_of(node);
    return true;
  }
};
} // namespace YAML

namespace edge_policy
{
swoc::Errata
parse_redaction_config(swoc::TextView text, RedactionConfig &config)
{
  try {
    YAML::Node root = YAML::Load(std::string{text});
    if (root.IsNull()) {
      Dbg(dbg_ctl, "empty redaction configuration, using defaults");
      return {};
    }
    expect_map(root, "redaction configuration");
    warn_unknown_keys(root, {LOG_LEVEL, PATTERNS, CUSTOM_PATTERNS, BYPASS_PATHS, MAX_BODY_SIZE_BYTES}, "redaction configuration");

    if (auto node = root[LOG_LEVEL]; node) {
      config.log_level = decode_log_level(node);
    }

    if (auto node = root[PATTERNS]; node) {
      expect_map(node, PATTERNS);
      for (auto const &elem : node) {
        auto name = elem.first.as<std::string>();
        if (auto spot = config.patterns.find(name); spot != config.patterns.end()) {
          spot->second = elem.second.as<bool>();
        } else {
          Warning("unknown built-in pattern '%s' at line %d", name.c_str(), line_of(elem.first));
        }
      }
    }

    if (auto node = root[CUSTOM_PATTERNS]; node) {
      expect_sequence(node, CUSTOM_PATTERNS);
      config.custom_patterns.clear();
      for (auto const &item : node) {
        config.custom_patterns.push_back(item.as<CustomPatternConfig>());
      }
    }

    if (auto node = root[BYPASS_PATHS]; node) {
      config.bypass_paths = decode_string_list(node, BYPASS_PATHS);
    }

    if (auto node = root[MAX_BODY_SIZE_BYTES]; node) {
      auto size = node.as<int64_t>();
      if (size < 0) {
        throw YAML::ParserException(node.Mark(), "max_body_size_bytes must not be negative");
      }
      config.max_body_size_bytes = static_cast<uint64_t>(size);
    }
  } catch (std::exception const &ex) {
    return make_errata(ERRATA_ERROR, "Failed to parse redaction configuration: {}", ex.what());
  }

  Dbg(dbg_ctl, "redaction configuration: %zu custom patterns, %zu bypass paths, max body %" PRIu64 " bytes",
      config.custom_patterns.size(), config.bypass_paths.size(), config.max_body_size_bytes);
  return {};
}

swoc::Errata
parse_routing_config(swoc::TextView text, RoutingConfig &config)
{
  try {
    YAML::Node root = YAML::Load(std::string{text});
    if (root.IsNull()) {
      Dbg(dbg_ctl, "empty routing configuration, using defaults");
      return {};
    }
    expect_map(root, "routing configuration");
    warn_unknown_keys(root, {LOG_LEVEL, DEFAULT_TARGET, DEBUG_FLAG, RULES, TARGET_PATH_PREFIXES}, "routing configuration");

    if (auto node = root[LOG_LEVEL]; node) {
      config.log_level = decode_log_level(node);
    }

    if (auto node = root[DEFAULT_TARGET]; node) {
      config.default_target = node.as<std::string>();
      if (config.default_target.empty()) {
        throw YAML::ParserException(node.Mark(), "default_target must not be empty");
      }
    }

    if (auto node = root[DEBUG_FLAG]; node) {
      config.debug = node.as<bool>();
    }

    if (auto node = root[RULES]; node) {
      expect_sequence(node, RULES);
      config.rules.clear();
      for (auto const &item : node) {
        config.rules.push_back(item.as<RoutingRuleConfig>());
      }
    }

    if (auto node = root[TARGET_PATH_PREFIXES]; node) {
      expect_map(node, TARGET_PATH_PREFIXES);
      for (auto const &elem : node) {
        auto prefix = elem.second.as<std::string>();
        if (prefix.empty() || prefix[0] != '/') {
          throw YAML::ParserException(elem.second.Mark(), "path prefix '" + prefix + "' must start with '/'");
        }
        config.target_path_prefixes[elem.first.as<std::string>()] = prefix;
      }
    }
  } catch (std::exception const &ex) {
    return make_errata(ERRATA_ERROR, "Failed to parse routing configuration: {}", ex.what());
  }

  Dbg(dbg_ctl, "routing configuration: %zu rules, default target '%s'", config.rules.size(), config.default_target.c_str());
  return {};
}

swoc::Errata
load_config_file(swoc::file::path const &path, std::string &content)
{
  std::error_code ec;

  content = swoc::file::load(path, ec);
  if (ec) {
    return make_errata(ERRATA_ERROR, "Unable to read configuration file '{}': {}", path.c_str(), ec.message());
  }
  return {};
}

} // namespace edge_policy
