/** @file

  Response body filter policy.

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
#include <optional>
#include <string>

#include "swoc/TextView.h"
#include "swoc/Errata.h"
#include "swoc/swoc_file.h"

#include "edge_policy/PolicyConfig.h"
#include "edge_policy/PatternTable.h"
#include "edge_policy/RedactionEngine.h"

namespace edge_policy
{
/** Immutable redaction policy.

    Instances are created only by the loaders and shared read-only across requests.
 */
class RedactionPolicy
{
public:
  using Handle = std::shared_ptr<RedactionPolicy const>;

  // No copying.
  RedactionPolicy(RedactionPolicy const &)            = delete;
  RedactionPolicy &operator=(RedactionPolicy const &) = delete;

  /// Build a policy from decoded configuration.
  static swoc::Rv<Handle> make(RedactionConfig config);

  /// Build a policy from JSON text.
  static swoc::Rv<Handle> load(swoc::TextView text);

  /// Build a policy from a JSON file.
  static swoc::Rv<Handle> load_file(swoc::file::path const &path);

  RedactionConfig const &
  config() const
  {
    return _config;
  }

  PatternTable const &
  patterns() const
  {
    return _patterns;
  }

  /** Check @a path against the bypass list.

      An entry ending in '*' matches any path starting with the text before the '*', every other
      entry must match the whole path.
   */
  bool is_bypass_path(swoc::TextView path) const;

  /// @return @c true if @a content_type is text or JSON. An empty type is treated as text.
  static bool is_text_content(swoc::TextView content_type);

  /** Decide whether a response will be scanned, before the body arrives.

      @param path Request path, without query.
      @param content_type Response content type, empty if not present.
      @param content_length Response body size if known.
   */
  ScrubStatus classify(swoc::TextView path, swoc::TextView content_type, std::optional<uint64_t> content_length) const;

  /// Scan a complete @a body with every gate applied.
  RedactionResult scrub(swoc::TextView path, swoc::TextView content_type, swoc::TextView body) const;

  /// Scan @a body with no gates.
  RedactionResult redact(swoc::TextView body) const;

private:
  explicit RedactionPolicy(RedactionConfig &&config);

  RedactionConfig _config;
  PatternTable    _patterns;
  RedactionEngine _engine{_patterns};
};

/** Incremental body buffering in front of a policy.

    Chunks are held until the final one arrives, then the whole body is scanned. If the buffered
    size would exceed the policy's maximum the held bytes are released unmodified and the rest of
    the body passes straight through.

    @code
    RedactionStream stream(policy, policy->classify(path, content_type, length));
    for (auto chunk : chunks) {
      out.append(stream.write(chunk.data, chunk.last));
    }
    @endcode
 */
class RedactionStream
{
public:
  RedactionStream(RedactionPolicy::Handle policy, ScrubStatus status);

  /** Add a chunk of body.

      @param chunk Body bytes.
      @param end_of_stream @c true if this is the final chunk.
      @return Bytes to forward now, possibly empty.
   */
  std::string write(swoc::TextView chunk, bool end_of_stream);

  /// @return The current status, which changes to @c TOO_LARGE if the cap is exceeded.
  ScrubStatus
  status() const
  {
    return _result.status;
  }

  /// @return @c true once the final chunk has been written.
  bool
  is_complete() const
  {
    return _complete;
  }

  /** Scan outcome, valid after the final chunk.

      For a stream that was not scanned only the status is set.
   */
  RedactionResult const &
  result() const
  {
    return _result;
  }

private:
  RedactionPolicy::Handle _policy;
  std::string             _buffer;
  RedactionResult         _result;
  bool                    _complete = false;
};

} // namespace edge_policy
