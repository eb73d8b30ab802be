/** @file

  Lazy parsers for the Cookie header and the query string.

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
#include <string>

#include "swoc/TextView.h"

namespace edge_policy
{
/** Name to value pairs split out of a delimited list.

    Pairs are separated by a single delimiter character and surrounding whitespace is trimmed from
    each pair and from its name and value. A pair is split on its first '='. Pairs without a '='
    or with an empty name are skipped, and for a repeated name the first occurrence is kept.
    Values are not decoded.

    Parsing happens on first access, so a request whose rules never look at the values does not
    pay for it.
 */
class KeyValueList
{
public:
  using map_type = std::map<std::string, std::string, std::less<>>;

  KeyValueList(swoc::TextView raw, char delimiter) : _raw(raw), _delimiter(delimiter) {}

  /// Parse @a raw immediately.
  static map_type parse(swoc::TextView raw, char delimiter);

  /// @return The value for @a name, or nothing if not present.
  std::optional<swoc::TextView> get(swoc::TextView name) const;

  /// @return All pairs.
  map_type const &values() const;

  /// @return @c true if the list has been parsed.
  bool
  is_parsed() const
  {
    return _values.has_value();
  }

private:
  std::string              _raw;
  char                     _delimiter;
  mutable std::optional<map_type> _values;
};

/// Cookies from a @c Cookie header value, separated by ';'.
class CookieJar : public KeyValueList
{
public:
  explicit CookieJar(swoc::TextView raw) : KeyValueList(raw, ';') {}

  static map_type
  parse(swoc::TextView raw)
  {
    return KeyValueList::parse(raw, ';');
  }
};

/// Parameters from a query string, separated by '&'.
class QueryParams : public KeyValueList
{
public:
  explicit QueryParams(swoc::TextView raw) : KeyValueList(raw, '&') {}

  static map_type
  parse(swoc::TextView raw)
  {
    return KeyValueList::parse(raw, '&');
  }
};

} // namespace edge_policy
