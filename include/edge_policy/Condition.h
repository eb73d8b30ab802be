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

#pragma once

#include <optional>
#include <string>

#include "swoc/TextView.h"
#include "swoc/Errata.h"

#include "edge_policy/AttributeSource.h"
#include "edge_policy/CookieJar.h"
#include "edge_policy/Regex.h"

namespace edge_policy
{
/// Request attribute a condition looks at.
enum class ConditionType { HEADER, COOKIE, PATH, QUERY };

/// Comparison applied to the attribute value.
enum class ConditionOp {
  EQUALS,
  CONTAINS,
  PREFIX,
  SUFFIX,
  REGEX,
  EXISTS,     ///< Attribute present, value ignored.
  NOT_EXISTS, ///< Attribute absent.
};

/// Case-insensitive lookup of a type name.
std::optional<ConditionType> condition_type_from_name(swoc::TextView name);
/// Case-insensitive lookup of an operator name.
std::optional<ConditionOp> condition_op_from_name(swoc::TextView name);

swoc::TextView condition_type_name(ConditionType type);
swoc::TextView condition_op_name(ConditionOp op);

/** A single predicate on a request attribute.

    Regular expressions are compiled once, when the condition is made. Values are compared case
    sensitively unless @a nocase is set, which then applies to every operator.
 */
class Condition
{
public:
  Condition()                             = default;
  Condition(Condition &&)                 = default;
  Condition &operator=(Condition &&)      = default;
  Condition(Condition const &)            = delete;
  Condition &operator=(Condition const &) = delete;

  /** Create and validate a condition.

      @a key is required except for @c PATH, @a value is required except for @c EXISTS and
      @c NOT_EXISTS.
   */
  static swoc::Rv<Condition> make(ConditionType type, swoc::TextView key, ConditionOp op, std::optional<swoc::TextView> value,
                                  bool nocase);

  ConditionType
  type() const
  {
    return _type;
  }

  std::string const &
  key() const
  {
    return _key;
  }

  ConditionOp
  op() const
  {
    return _op;
  }

  std::optional<std::string> const &
  value() const
  {
    return _value;
  }

  bool
  nocase() const
  {
    return _nocase;
  }

  /// Apply the operator to the value of a present attribute.
  bool test(swoc::TextView subject) const;

private:
  ConditionType              _type = ConditionType::HEADER;
  std::string                _key;
  ConditionOp                _op = ConditionOp::EQUALS;
  std::optional<std::string> _value;
  bool                       _nocase = false;
  Regex                      _regex;
};

/** Evaluate conditions against one request.

    Cookies and query parameters are parsed the first time a condition asks for them, and at most
    once per evaluator.
 */
class ConditionEvaluator
{
public:
  explicit ConditionEvaluator(AttributeSource const &source) : _source(source) {}

  /// @return @c true if @a condition holds for the request.
  bool evaluate(Condition const &condition) const;

  /// @return The attribute value @a condition refers to, or nothing if absent.
  std::optional<swoc::TextView> lookup(Condition const &condition) const;

private:
  AttributeSource const             &_source;
  mutable std::optional<CookieJar>   _cookies;
  mutable std::optional<QueryParams> _query;
};

/// Evaluate a single @a condition against @a source.
bool evaluate(Condition const &condition, AttributeSource const &source);

} // namespace edge_policy
