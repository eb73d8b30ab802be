/** @file

  Routing conditions.

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
#include <array>
#include <cctype>

#include "swoc/bwf_base.h"

#include "edge_policy/Condition.h"
#include "edge_policy/Errata.h"
#include "edge_policy/Headers.h"
#include "edge_policy/Diags.h"

using namespace swoc::literals;

namespace edge_policy
{
namespace
{
  DbgCtl dbg_ctl{"edge_policy.condition"};

  constexpr std::array<std::pair<swoc::TextView, ConditionType>, 4> TYPE_NAMES{
    {{"header"_tv, ConditionType::HEADER},
     {"cookie"_tv, ConditionType::COOKIE},
     {"path"_tv, ConditionType::PATH},
     {"query"_tv, ConditionType::QUERY}}
  };

  constexpr std::array<std::pair<swoc::TextView, ConditionOp>, 7> OP_NAMES{
    {{"equals"_tv, ConditionOp::EQUALS},
     {"contains"_tv, ConditionOp::CONTAINS},
     {"prefix"_tv, ConditionOp::PREFIX},
     {"suffix"_tv, ConditionOp::SUFFIX},
     {"regex"_tv, ConditionOp::REGEX},
     {"exists"_tv, ConditionOp::EXISTS},
     {"not_exists"_tv, ConditionOp::NOT_EXISTS}}
  };

  bool
  contains(swoc::TextView text, swoc::TextView token, bool nocase)
  {
    if (!nocase) {
      return text.find(token) != swoc::TextView::npos;
    }
    auto spot = std::search(text.begin(), text.end(), token.begin(), token.end(),
                            [](char lhs, char rhs) { return tolower(static_cast<unsigned char>(lhs)) == tolower(static_cast<unsigned char>(rhs)); });
    return spot != text.end() || token.empty();
  }
} // namespace

std::optional<ConditionType>
condition_type_from_name(swoc::TextView name)
{
  for (auto const &[text, type] : TYPE_NAMES) {
    if (0 == strcasecmp(text, name)) {
      return type;
    }
  }
  return std::nullopt;
}

std::optional<ConditionOp>
condition_op_from_name(swoc::TextView name)
{
  for (auto const &[text, op] : OP_NAMES) {
    if (0 == strcasecmp(text, name)) {
      return op;
    }
  }
  return std::nullopt;
}

swoc::TextView
condition_type_name(ConditionType type)
{
  for (auto const &[text, value] : TYPE_NAMES) {
    if (value == type) {
      return text;
    }
  }
  return "unknown";
}

swoc::TextView
condition_op_name(ConditionOp op)
{
  for (auto const &[text, value] : OP_NAMES) {
    if (value == op) {
      return text;
    }
  }
  return "unknown";
}

swoc::Rv<Condition>
Condition::make(ConditionType type, swoc::TextView key, ConditionOp op, std::optional<swoc::TextView> value, bool nocase)
{
  Condition zret;

  if (type != ConditionType::PATH && key.empty()) {
    return make_errata(ERRATA_ERROR, "A {} condition requires a key", condition_type_name(type));
  }
  if (op != ConditionOp::EXISTS && op != ConditionOp::NOT_EXISTS && !value) {
    return make_errata(ERRATA_ERROR, "Operator '{}' requires a value", condition_op_name(op));
  }

  zret._type   = type;
  zret._op     = op;
  zret._nocase = nocase;
  if (type != ConditionType::PATH) {
    zret._key.assign(key.data(), key.size());
  }
  if (value) {
    zret._value.emplace(value->data(), value->size());
  }

  if (op == ConditionOp::REGEX) {
    std::string error;
    int         erroffset = 0;
    if (!zret._regex.compile(*value, error, erroffset, nocase ? RE_CASE_INSENSITIVE : 0)) {
      return make_errata(ERRATA_ERROR, "Invalid regular expression '{}' at offset {}: {}", *value, erroffset, error);
    }
  }

  return zret;
}

bool
Condition::test(swoc::TextView subject) const
{
  swoc::TextView value{_value ? swoc::TextView{*_value} : swoc::TextView{}};

  switch (_op) {
  case ConditionOp::EQUALS:
    return _nocase ? 0 == strcasecmp(subject, value) : subject == value;
  case ConditionOp::CONTAINS:
    return contains(subject, value, _nocase);
  case ConditionOp::PREFIX:
    return _nocase ? subject.starts_with_nocase(value) : subject.starts_with(value);
  case ConditionOp::SUFFIX:
    return _nocase ? subject.ends_with_nocase(value) : subject.ends_with(value);
  case ConditionOp::REGEX:
    return _regex.exec(subject);
  case ConditionOp::EXISTS:
    return true;
  case ConditionOp::NOT_EXISTS:
    return false;
  }
  return false;
}

//----------------------------------------------------------------------------
std::optional<swoc::TextView>
ConditionEvaluator::lookup(Condition const &condition) const
{
  switch (condition.type()) {
  case ConditionType::HEADER:
    return _source.header(condition.key());
  case ConditionType::COOKIE:
    if (!_cookies) {
      _cookies.emplace(_source.header(FIELD_COOKIE).value_or(swoc::TextView{}));
    }
    return _cookies->get(condition.key());
  case ConditionType::PATH:
    return _source.path();
  case ConditionType::QUERY:
    if (!_query) {
      _query.emplace(_source.query());
    }
    return _query->get(condition.key());
  }
  return std::nullopt;
}

bool
ConditionEvaluator::evaluate(Condition const &condition) const
{
  auto value  = this->lookup(condition);
  bool result = value ? condition.test(*value) : condition.op() == ConditionOp::NOT_EXISTS;

  auto type = condition_type_name(condition.type());
  auto op   = condition_op_name(condition.op());
  Diag(dbg_ctl, "%.*s '%s' %.*s: %s", static_cast<int>(type.size()), type.data(), condition.key().c_str(), static_cast<int>(op.size()),
       op.data(), result ? "true" : "false");
  return result;
}

bool
evaluate(Condition const &condition, AttributeSource const &source)
{
  return ConditionEvaluator{source}.evaluate(condition);
}

} // namespace edge_policy
