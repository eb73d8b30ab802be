/** @file

  Body scanning and masking.

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
#include <vector>

#include "swoc/TextView.h"

#include "edge_policy/Headers.h"
#include "edge_policy/PatternTable.h"

namespace edge_policy
{
/// Whether a response body is scanned, and if not, why.
enum class ScrubStatus {
  WILL_SCRUB, ///< Body is scanned.
  BYPASSED,   ///< Request path is on the bypass list.
  NON_TEXT,   ///< Content type is neither text nor JSON.
  TOO_LARGE,  ///< Body is larger than the configured maximum.
};

/// @return The header value for @a status, e.g. "will-scrub".
swoc::TextView scrub_status_name(ScrubStatus status);

/// Outcome of scanning one body.
struct RedactionResult {
  bool                     redacted    = false; ///< At least one replacement was made.
  unsigned                 match_count = 0;
  std::vector<std::string> matched_pattern_names; ///< Distinct names, in table order.
  std::string              content;
  ScrubStatus              status = ScrubStatus::WILL_SCRUB;
  bool                     error  = false; ///< Scan failed, @a content is the unmodified input.
};

/** Apply a pattern table to body text.

    Enabled patterns are applied one after another in table order, each over the output of the
    previous one. Valid UTF-8 input is scanned as text, anything else byte by byte. If a matcher
    fails the input is returned unchanged with @c RedactionResult::error set.
 */
class RedactionEngine
{
public:
  explicit RedactionEngine(PatternTable const &table) : _table(table) {}

  /// Scan @a body. The size and content type gates are not applied here.
  RedactionResult redact(swoc::TextView body) const;

private:
  PatternTable const &_table;
};

/** Response header fields describing a filtered response.

    Always "X-WASM-Active: true" and "X-WASM-Scrub: <status>". If content was redacted, also
    "X-PII-Redacted" with the comma separated pattern names and "X-Redaction-Count".
 */
HeaderList response_annotations(RedactionResult const &result);

} // namespace edge_policy
