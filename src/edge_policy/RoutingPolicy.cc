/** @file

  Request router policy.

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

#include <utility>

#include "swoc/bwf_base.h"

#include "edge_policy/RoutingPolicy.h"
#include "edge_policy/Errata.h"
#include "edge_policy/Diags.h"

namespace edge_policy
{
namespace
{
  DbgCtl dbg_ctl{"edge_policy.route"};

  swoc::Rv<Condition>
  make_condition(ConditionConfig const &cfg)
  {
    auto type = condition_type_from_name(cfg.type);
    if (!type) {
      return make_errata(ERRATA_ERROR, "Line {}: unknown condition type '{}'", cfg.line, cfg.type);
    }
    auto op = condition_op_from_name(cfg.op);
    if (!op) {
      return make_errata(ERRATA_ERROR, "Line {}: unknown condition operator '{}'", cfg.line, cfg.op);
    }

    std::optional<swoc::TextView> value;
    if (cfg.value) {
      value = swoc::TextView{*cfg.value};
    }
    auto rv = Condition::make(*type, cfg.key, *op, value, cfg.nocase);
    if (!rv.is_ok()) {
      rv.errata().note(ERRATA_ERROR, "Line {}: invalid {} condition", cfg.line, condition_type_name(*type));
    }
    return rv;
  }
} // namespace

RoutingPolicy::RoutingPolicy(RoutingConfig const &config, RoutingRuleSet::container &&rules)
  : _config(config),
    _rules(std::move(rules)),
    _engine(_rules, _config.default_target, _config.target_path_prefixes)
{
}

swoc::Rv<RoutingPolicy::Handle>
RoutingPolicy::make(RoutingConfig const &config)
{
  swoc::Errata              errata;
  RoutingRuleSet::container rules;

  for (auto const &rule_cfg : config.rules) {
    RoutingRule rule;
    bool        valid = true;

    rule.name     = rule_cfg.name;
    rule.priority = rule_cfg.priority;
    rule.target   = rule_cfg.target;
    for (auto const &cond_cfg : rule_cfg.conditions) {
      auto rv = make_condition(cond_cfg);
      if (!rv.is_ok()) {
        rv.errata().note(ERRATA_ERROR, "In rule '{}'", rule_cfg.name);
        errata.note(std::move(rv.errata()));
        valid = false;
        continue;
      }
      rule.conditions.push_back(std::move(rv.result()));
    }
    rule.add_headers = rule_cfg.add_headers;
    rule.remove_headers.insert(rule_cfg.remove_headers.begin(), rule_cfg.remove_headers.end());

    if (valid) {
      Dbg(dbg_ctl, "rule '%s' priority %d, %zu conditions, target '%s'", rule.name.c_str(), rule.priority, rule.conditions.size(),
          rule.target.c_str());
      rules.push_back(std::move(rule));
    }
  }

  if (!errata.is_ok()) {
    return std::move(errata);
  }

  Handle policy{new RoutingPolicy(config, std::move(rules))};
  Dbg(dbg_ctl, "routing policy ready: %zu rules, default target '%s'", policy->_rules.size(), config.default_target.c_str());
  return policy;
}

swoc::Rv<RoutingPolicy::Handle>
RoutingPolicy::load(swoc::TextView text)
{
  RoutingConfig config;
  if (auto errata = parse_routing_config(text, config); !errata.is_ok()) {
    return std::move(errata);
  }
  return make(config);
}

swoc::Rv<RoutingPolicy::Handle>
RoutingPolicy::load_file(swoc::file::path const &path)
{
  std::string content;
  if (auto errata = load_config_file(path, content); !errata.is_ok()) {
    return std::move(errata);
  }
  auto rv = load(content);
  if (!rv.is_ok()) {
    rv.errata().note(ERRATA_ERROR, "While loading '{}'", path.c_str());
  }
  return rv;
}

RoutingDecision
RoutingPolicy::decide(AttributeSource const &attributes) const
{
  auto decision = _engine.decide(attributes);
  // The debug switch reports every decision, independent of the debug tags.
  if (_config.debug) {
    auto path   = attributes.path();
    auto reason = decision.reason();
    Note("route %.*s -> %s (%.*s)", static_cast<int>(path.size()), path.data(), decision.target.c_str(),
         static_cast<int>(reason.size()), reason.data());
  }
  return decision;
}

} // namespace edge_policy
