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

#pragma once

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "swoc/TextView.h"

#include "edge_policy/AttributeSource.h"
#include "edge_policy/Condition.h"
#include "edge_policy/Headers.h"

namespace edge_policy
{
/// A named set of conditions, all of which must hold, and what to do when they do.
struct RoutingRule {
  std::string            name;
  int                    priority = 0;
  std::vector<Condition> conditions;
  std::string            target;
  HeaderList             add_headers;
  std::set<std::string>  remove_headers;
};

/// Where a request goes and how its headers change.
struct RoutingDecision {
  std::string                target;
  std::optional<std::string> matched_rule;
  HeaderList                 add_headers;
  std::set<std::string>      remove_headers;
  std::optional<std::string> rewritten_path; ///< New request path, if the target requires a prefix.

  /// @return The matched rule name, or "default".
  swoc::TextView reason() const;

  /** Headers to add to the upstream request.

      "X-Routed-By: smart-router" and "X-Route-Reason: <reason>" followed by the rule's headers in
      configuration order.
   */
  HeaderList request_headers() const;

  /// Headers to add to the response, "X-Smart-Router: active".
  static HeaderList response_headers();
};

/** Rules in evaluation order.

    The rules are sorted by ascending priority when the set is constructed. The sort is stable, so
    rules with equal priority keep their configuration order.
 */
class RoutingRuleSet
{
public:
  using container      = std::vector<RoutingRule>;
  using const_iterator = container::const_iterator;

  RoutingRuleSet() = default;
  explicit RoutingRuleSet(container &&rules);

  const_iterator
  begin() const
  {
    return _rules.begin();
  }

  const_iterator
  end() const
  {
    return _rules.end();
  }

  size_t
  size() const
  {
    return _rules.size();
  }

  bool
  empty() const
  {
    return _rules.empty();
  }

  /// @return The first rule whose conditions all hold, or @c nullptr.
  RoutingRule const *match(ConditionEvaluator const &evaluator) const;

private:
  container _rules;
};

/** Turn request attributes into a routing decision.

    If no rule matches, or evaluation fails, the decision is the default target with no header
    changes.
 */
class RoutingDecisionEngine
{
public:
  using PrefixMap = std::map<std::string, std::string, std::less<>>;

  RoutingDecisionEngine(RoutingRuleSet const &rules, std::string default_target, PrefixMap target_path_prefixes = {});

  RoutingDecision decide(AttributeSource const &attributes) const;

  std::string const &
  default_target() const
  {
    return _default_target;
  }

private:
  void apply_path_prefix(RoutingDecision &decision, swoc::TextView path) const;

  RoutingRuleSet const &_rules;
  std::string           _default_target;
  PrefixMap             _target_path_prefixes;
};

/// Decide without path prefixes.
RoutingDecision decide(RoutingRuleSet const &rules, AttributeSource const &attributes, std::string const &default_target);

} // namespace edge_policy
