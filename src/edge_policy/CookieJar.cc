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

#include <cctype>

#include "edge_policy/CookieJar.h"

namespace edge_policy
{
KeyValueList::map_type
KeyValueList::parse(swoc::TextView raw, char delimiter)
{
  map_type zret;

  while (raw) {
    auto pair = raw.take_prefix_at(delimiter).trim_if(&isspace);
    if (pair.find('=') == swoc::TextView::npos) {
      continue;
    }
    auto name = pair.take_prefix_at('=').trim_if(&isspace);
    if (name.empty()) {
      continue;
    }
    // emplace does not replace an existing entry, so the first occurrence wins.
    zret.emplace(std::string{name}, std::string{pair.trim_if(&isspace)});
  }

  return zret;
}

std::optional<swoc::TextView>
KeyValueList::get(swoc::TextView name) const
{
  auto const &map = this->values();
  if (auto spot = map.find(std::string_view{name}); spot != map.end()) {
    return swoc::TextView{spot->second};
  }
  return std::nullopt;
}

KeyValueList::map_type const &
KeyValueList::values() const
{
  if (!_values) {
    _values = parse(_raw, _delimiter);
  }
  return *_values;
}

} // namespace edge_policy
