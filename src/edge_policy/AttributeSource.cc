/** @file

  Request attributes.

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

#include "edge_policy/AttributeSource.h"
#include "edge_policy/Headers.h"

namespace edge_policy
{
RequestAttributes::RequestAttributes(swoc::TextView target)
{
  auto path = target.take_prefix_at('?');
  this->set_path(path);
  this->set_query(target);
}

RequestAttributes &
RequestAttributes::add_header(swoc::TextView name, swoc::TextView value)
{
  for (auto &[field, field_value] : _headers) {
    if (0 == strcasecmp(swoc::TextView{field}, name)) {
      field_value.append(0 == strcasecmp(name, FIELD_COOKIE) ? "; " : ", ");
      field_value.append(value.data(), value.size());
      return *this;
    }
  }
  _headers.emplace_back(std::string{name}, std::string{value});
  return *this;
}

bool
RequestAttributes::add_header_line(swoc::TextView line)
{
  if (line.find(':') == swoc::TextView::npos) {
    return false;
  }
  auto name = line.take_prefix_at(':').trim_if(&isspace);
  if (name.empty()) {
    return false;
  }
  this->add_header(name, line.trim_if(&isspace));
  return true;
}

RequestAttributes &
RequestAttributes::set_path(swoc::TextView path)
{
  _path.assign(path.data(), path.size());
  return *this;
}

RequestAttributes &
RequestAttributes::set_query(swoc::TextView query)
{
  _query.assign(query.data(), query.size());
  return *this;
}

std::optional<swoc::TextView>
RequestAttributes::header(swoc::TextView name) const
{
  for (auto const &[field, value] : _headers) {
    if (0 == strcasecmp(swoc::TextView{field}, name)) {
      return swoc::TextView{value};
    }
  }
  return std::nullopt;
}

swoc::TextView
RequestAttributes::path() const
{
  return _path;
}

swoc::TextView
RequestAttributes::query() const
{
  return _query;
}

} // namespace edge_policy
