/** @file

  Header field names and lists produced by the policy engines.

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

#include <string>
#include <utility>
#include <vector>

#include "swoc/TextView.h"

namespace edge_policy
{
/// Ordered header fields, name then value.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Request side, set on routed requests.
static constexpr swoc::TextView FIELD_ROUTED_BY{"X-Routed-By"};
static constexpr swoc::TextView FIELD_ROUTE_REASON{"X-Route-Reason"};
static constexpr swoc::TextView VALUE_ROUTED_BY{"smart-router"};
static constexpr swoc::TextView VALUE_ROUTE_DEFAULT{"default"};

// Response side, set on filtered responses.
static constexpr swoc::TextView FIELD_WASM_ACTIVE{"X-WASM-Active"};
static constexpr swoc::TextView FIELD_WASM_SCRUB{"X-WASM-Scrub"};
static constexpr swoc::TextView FIELD_PII_REDACTED{"X-PII-Redacted"};
static constexpr swoc::TextView FIELD_REDACTION_COUNT{"X-Redaction-Count"};
static constexpr swoc::TextView FIELD_SMART_ROUTER{"X-Smart-Router"};

static constexpr swoc::TextView FIELD_COOKIE{"Cookie"};

} // namespace edge_policy
