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

#pragma once

#include <memory>

#include "swoc/TextView.h"
#include "swoc/Errata.h"
#include "swoc/swoc_file.h"

#include "edge_policy/PolicyConfig.h"
#include "edge_policy/RoutingRuleSet.h"

namespace edge_policy
{
/// Immutable routing policy, shared read-only across requests.
class RoutingPolicy
{
public:
  using Handle = std::shared_ptr<RoutingPolicy const>;

  // No copying.
  RoutingPolicy(RoutingPolicy const &)            = delete;
  RoutingPolicy &operator=(RoutingPolicy const &) = delete;

  /** Build a policy from decoded configuration.

      Every invalid rule is reported, not just the first.
   */
  static swoc::Rv<Handle> make(RoutingConfig const &config);

  /// Build a policy from JSON text.
  static swoc::Rv<Handle> load(swoc::TextView text);

  /// Build a policy from a JSON file.
  static swoc::Rv<Handle> load_file(swoc::file::path const &path);

  RoutingConfig const &
  config() const
  {
    return _config;
  }

  RoutingRuleSet const &
  rules() const
  {
    return _rules;
  }

  RoutingDecision decide(AttributeSource const &attributes) const;

private:
  RoutingPolicy(RoutingConfig const &config, RoutingRuleSet::container &&rules);

  RoutingConfig         _config;
  RoutingRuleSet        _rules;
  RoutingDecisionEngine _engine;
};

} // namespace edge_policy
