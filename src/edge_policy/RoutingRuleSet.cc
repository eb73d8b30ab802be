/** @file

  Routing rules and the decision engine.

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
#include <exception>

#include "edge_policy/RoutingRuleSet.h"
#include "edge_policy/Diags.h"

namespace edge_policy
{
namespace
{
  DbgCtl dbg_ctl{"edge_policy.route"};
} // namespace

swoc::TextView
RoutingDecision::reason() const
{
  return matched_rule ? swoc::TextView{*matched_rule} : VALUE_ROUTE_DEFAULT;
}

HeaderList
RoutingDecision::request_headers() const
{
  HeaderList fields;

  fields.emplace_back(FIELD_ROUTED_BY, VALUE_ROUTED_BY);
  fields.emplace_back(FIELD_ROUTE_REASON, this->reason());
  fields.insert(fields.end(), add_headers.begin(), add_headers.end());
  return fields;
}

HeaderList
RoutingDecision::response_headers()
{
  return {
    {std::string{FIELD_SMART_ROUTER}, "active"}
  };
}

//----------------------------------------------------------------------------
RoutingRuleSet::RoutingRuleSet(container &&rules) : _rules(std::move(rules))
{
  std::stable_sort(_rules.begin(), _rules.end(), [](RoutingRule const &lhs, RoutingRule const &rhs) { return lhs.priority < rhs.priority; });
}

RoutingRule const *
RoutingRuleSet::match(ConditionEvaluator const &evaluator) const
{
  for (auto const &rule : _rules) {
    if (std::all_of(rule.conditions.begin(), rule.conditions.end(),
                    [&evaluator](Condition const &c) { return evaluator.evaluate(c); })) {
      return &rule;
    }
  }
  return nullptr;
}

//----------------------------------------------------------------------------
RoutingDecisionEngine::RoutingDecisionEngine(RoutingRuleSet const &rules, std::string default_target, PrefixMap target_path_prefixes)
  : _rules(rules), _default_target(std::move(default_target)), _target_path_prefixes(std::move(target_path_prefixes))
{
}

void
RoutingDecisionEngine::apply_path_prefix(RoutingDecision &decision, swoc::TextView path) const
{
  auto spot = _target_path_prefixes.find(decision.target);
  if (spot == _target_path_prefixes.end()) {
    return;
  }
  swoc::TextView prefix{spot->second};
  if (path.starts_with(prefix)) {
    return;
  }
  std::string rewritten{prefix};
  rewritten.append(path.data(), path.size());
  decision.rewritten_path = std::move(rewritten);
}

RoutingDecision
RoutingDecisionEngine::decide(AttributeSource const &attributes) const
{
  RoutingDecision decision;

  try {
    ConditionEvaluator evaluator(attributes);
    if (auto rule = _rules.match(evaluator); rule != nullptr) {
      decision.target         = rule->target;
      decision.matched_rule   = rule->name;
      decision.add_headers    = rule->add_headers;
      decision.remove_headers = rule->remove_headers;
      Dbg(dbg_ctl, "rule '%s' matched, target '%s'", rule->name.c_str(), rule->target.c_str());
    } else {
      decision.target = _default_target;
      Dbg(dbg_ctl, "no rule matched, target '%s'", _default_target.c_str());
    }
    this->apply_path_prefix(decision, attributes.path());
  } catch (std::exception const &e) {
    Warning("routing evaluation failed, using default target '%s': %s", _default_target.c_str(), e.what());
    decision        = RoutingDecision{};
    decision.target = _default_target;
  }

  return decision;
}

RoutingDecision
decide(RoutingRuleSet const &rules, AttributeSource const &attributes, std::string const &default_target)
{
  return RoutingDecisionEngine{rules, default_target}.decide(attributes);
}

} // namespace edge_policy
