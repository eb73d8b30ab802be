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

#include <algorithm>
#include <exception>

#include "swoc/bwf_base.h"

#include "edge_policy/RedactionEngine.h"
#include "edge_policy/Diags.h"

namespace edge_policy
{
namespace
{
  DbgCtl dbg_ctl{"edge_policy.redact"};

  /** Replace every match of @a pattern in @a subject.

      @return The number of replacements, @a out is only written if it is not zero.
   */
  unsigned
  apply_pattern(PiiPattern const &pattern, swoc::TextView subject, ScanMode mode, std::string &out)
  {
    PatternMatch match;
    unsigned     count  = 0;
    size_t       cursor = 0;

    while (cursor < subject.size() && pattern.matcher->find(subject, cursor, mode, match)) {
      if (match.start < cursor || match.end <= match.start || match.end > subject.size()) {
        throw ScanError("matcher for '" + pattern.name + "' returned an invalid range");
      }
      if (count == 0) {
        out.clear();
        out.reserve(subject.size());
      }
      out.append(subject.data() + cursor, match.start - cursor);
      pattern.replacement.expand(match, out);
      cursor = match.end;
      ++count;
    }

    if (count > 0) {
      out.append(subject.data() + cursor, subject.size() - cursor);
    }
    return count;
  }
} // namespace

swoc::TextView
scrub_status_name(ScrubStatus status)
{
  switch (status) {
  case ScrubStatus::WILL_SCRUB:
    return "will-scrub";
  case ScrubStatus::BYPASSED:
    return "bypassed";
  case ScrubStatus::NON_TEXT:
    return "non-text";
  case ScrubStatus::TOO_LARGE:
    return "too-large";
  }
  return "unknown";
}

RedactionResult
RedactionEngine::redact(swoc::TextView body) const
{
  RedactionResult result;
  ScanMode        mode = is_valid_utf8(body) ? ScanMode::TEXT : ScanMode::BYTES;

  result.content.assign(body.data(), body.size());
  if (mode == ScanMode::BYTES) {
    Dbg(dbg_ctl, "body of %zu bytes is not valid UTF-8, scanning bytes", body.size());
  }

  try {
    std::string scratch;
    for (auto const &pattern : _table) {
      if (!pattern.enabled) {
        continue;
      }
      unsigned count = apply_pattern(pattern, result.content, mode, scratch);
      if (count == 0) {
        continue;
      }
      result.content.swap(scratch);
      result.match_count += count;
      auto &names = result.matched_pattern_names;
      if (std::find(names.begin(), names.end(), pattern.name) == names.end()) {
        names.push_back(pattern.name);
      }
      Dbg(dbg_ctl, "pattern %s replaced %u matches", pattern.name.c_str(), count);
    }
  } catch (std::exception const &e) {
    Warning("redaction failed, passing body through unmodified: %s", e.what());
    result.content.assign(body.data(), body.size());
    result.match_count = 0;
    result.matched_pattern_names.clear();
    result.error = true;
  }

  result.redacted = result.match_count > 0;
  return result;
}

HeaderList
response_annotations(RedactionResult const &result)
{
  HeaderList fields;

  fields.emplace_back(FIELD_WASM_ACTIVE, "true");
  fields.emplace_back(FIELD_WASM_SCRUB, scrub_status_name(result.status));
  if (result.redacted) {
    std::string names;
    for (auto const &name : result.matched_pattern_names) {
      if (!names.empty()) {
        names += ',';
      }
      names += name;
    }
    fields.emplace_back(FIELD_PII_REDACTED, std::move(names));
    fields.emplace_back(FIELD_REDACTION_COUNT, std::to_string(result.match_count));
  }
  return fields;
}

} // namespace edge_policy
