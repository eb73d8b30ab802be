/** @file

  Request attributes visible to routing conditions.

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

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "swoc/TextView.h"

namespace edge_policy
{
/** Read access to the request being routed.

    The host adapter implements this on top of its own header structures. Returned views must
    remain valid for the lifetime of the source.
 */
class AttributeSource
{
public:
  virtual ~AttributeSource() = default;

  /// @return The value of header @a name, compared case-insensitively, or nothing if absent.
  virtual std::optional<swoc::TextView> header(swoc::TextView name) const = 0;

  /// @return The request path, without the query string.
  virtual swoc::TextView path() const = 0;

  /// @return The query string, without the leading '?'.
  virtual swoc::TextView query() const = 0;
};

/// Attribute source holding its own copies of the request data.
class RequestAttributes : public AttributeSource
{
public:
  RequestAttributes() = default;

  /** Construct from a request target.

      @a target is split at the first '?' into path and query.
   */
  explicit RequestAttributes(swoc::TextView target);

  /** Add a header field.

      Repeated fields are folded into one value, joined with ", " or, for @c Cookie, with "; ".
   */
  RequestAttributes &add_header(swoc::TextView name, swoc::TextView value);

  /** Add a header field given as a single "Name: value" line.

      @return @c false if @a line has no ':' or an empty name.
   */
  bool add_header_line(swoc::TextView line);

  RequestAttributes &set_path(swoc::TextView path);
  RequestAttributes &set_query(swoc::TextView query);

  std::optional<swoc::TextView> header(swoc::TextView name) const override;
  swoc::TextView path() const override;
  swoc::TextView query() const override;

private:
  std::vector<std::pair<std::string, std::string>> _headers;
  std::string                                      _path{"/"};
  std::string                                      _query;
};

} // namespace edge_policy
