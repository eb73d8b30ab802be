/** @file

  Errata logging.

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

#include <string>

#include "swoc/bwf_base.h"

#include "edge_policy/Errata.h"
#include "edge_policy/Diags.h"

namespace edge_policy
{
void
log_errata(swoc::Errata const &errata, swoc::TextView prefix)
{
  if (errata.empty()) {
    return;
  }

  DiagsLevel  level = diags_level_of(errata.severity());
  std::string msg;
  for (auto const &annotation : errata) {
    if (prefix.empty()) {
      swoc::bwprint(msg, "{}", annotation.text());
    } else {
      swoc::bwprint(msg, "{}: {}", prefix, annotation.text());
    }
    EdgePolicyDiagsError(level, "%s", msg.c_str());
  }
}

} // namespace edge_policy
