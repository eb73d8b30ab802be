/** @file

  Unit tests for Condition.h.

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

#include "catch.hpp"

#include <optional>
#include <string>

#include "edge_policy/Condition.h"

using namespace edge_policy;

namespace
{
Condition
make_condition(ConditionType type, swoc::TextView key, ConditionOp op, std::optional<swoc::TextView> value = std::nullopt,
               bool nocase = false)
{
  auto rv = Condition::make(type, key, op, value, nocase);
  REQUIRE(rv.is_ok());
  return std::move(rv.result());
}

RequestAttributes
sample_request()
{
  RequestAttributes attrs("/api/v1/items?canary=1&sort=desc");
  attrs.add_header("User-Agent", "Mozilla/5.0 (iPhone; CPU iPhone OS 17_0)")
    .add_header("X-Geo-Country", "DE")
    .add_header("Cookie", "session=abc123; beta-tester=true");
  return attrs;
}
} // namespace

TEST_CASE("Condition names", "[edge_policy][condition]")
{
  CHECK(condition_type_from_name("header") == ConditionType::HEADER);
  CHECK(condition_type_from_name("Cookie") == ConditionType::COOKIE);
  CHECK(condition_type_from_name("PATH") == ConditionType::PATH);
  CHECK(condition_type_from_name("query") == ConditionType::QUERY);
  CHECK_FALSE(condition_type_from_name("body"));

  CHECK(condition_op_from_name("equals") == ConditionOp::EQUALS);
  CHECK(condition_op_from_name("Contains") == ConditionOp::CONTAINS);
  CHECK(condition_op_from_name("prefix") == ConditionOp::PREFIX);
  CHECK(condition_op_from_name("suffix") == ConditionOp::SUFFIX);
  CHECK(condition_op_from_name("REGEX") == ConditionOp::REGEX);
  CHECK(condition_op_from_name("exists") == ConditionOp::EXISTS);
  CHECK(condition_op_from_name("not_exists") == ConditionOp::NOT_EXISTS);
  CHECK_FALSE(condition_op_from_name("matches"));

  CHECK(condition_type_name(ConditionType::COOKIE) == "cookie");
  CHECK(condition_op_name(ConditionOp::NOT_EXISTS) == "not_exists");
}

TEST_CASE("Condition validation", "[edge_policy][condition]")
{
  CHECK_FALSE(Condition::make(ConditionType::HEADER, "", ConditionOp::EXISTS, std::nullopt, false).is_ok());
  CHECK_FALSE(Condition::make(ConditionType::COOKIE, "", ConditionOp::EQUALS, "x", false).is_ok());
  CHECK_FALSE(Condition::make(ConditionType::HEADER, "Host", ConditionOp::EQUALS, std::nullopt, false).is_ok());
  CHECK_FALSE(Condition::make(ConditionType::HEADER, "Host", ConditionOp::REGEX, "([a-z", false).is_ok());

  CHECK(Condition::make(ConditionType::PATH, "", ConditionOp::PREFIX, "/api", false).is_ok());
  CHECK(Condition::make(ConditionType::HEADER, "Host", ConditionOp::EXISTS, std::nullopt, false).is_ok());
  CHECK(Condition::make(ConditionType::HEADER, "Host", ConditionOp::NOT_EXISTS, std::nullopt, false).is_ok());
  // An empty value is a value.
  CHECK(Condition::make(ConditionType::QUERY, "q", ConditionOp::EQUALS, "", false).is_ok());

  auto path = make_condition(ConditionType::PATH, "ignored", ConditionOp::PREFIX, "/api");
  CHECK(path.key().empty());
}

TEST_CASE("Condition operators", "[edge_policy][condition]")
{
  auto attrs = sample_request();

  SECTION("equals")
  {
    CHECK(evaluate(make_condition(ConditionType::HEADER, "X-Geo-Country", ConditionOp::EQUALS, "DE"), attrs));
    CHECK_FALSE(evaluate(make_condition(ConditionType::HEADER, "X-Geo-Country", ConditionOp::EQUALS, "de"), attrs));
    CHECK(evaluate(make_condition(ConditionType::HEADER, "X-Geo-Country", ConditionOp::EQUALS, "de", true), attrs));
  }

  SECTION("contains")
  {
    CHECK(evaluate(make_condition(ConditionType::HEADER, "User-Agent", ConditionOp::CONTAINS, "iPhone"), attrs));
    CHECK_FALSE(evaluate(make_condition(ConditionType::HEADER, "User-Agent", ConditionOp::CONTAINS, "iphone"), attrs));
    CHECK(evaluate(make_condition(ConditionType::HEADER, "User-Agent", ConditionOp::CONTAINS, "IPHONE", true), attrs));
    CHECK(evaluate(make_condition(ConditionType::HEADER, "User-Agent", ConditionOp::CONTAINS, ""), attrs));
  }

  SECTION("prefix and suffix")
  {
    CHECK(evaluate(make_condition(ConditionType::PATH, "", ConditionOp::PREFIX, "/api/"), attrs));
    CHECK_FALSE(evaluate(make_condition(ConditionType::PATH, "", ConditionOp::PREFIX, "/API/"), attrs));
    CHECK(evaluate(make_condition(ConditionType::PATH, "", ConditionOp::PREFIX, "/API/", true), attrs));
    CHECK(evaluate(make_condition(ConditionType::PATH, "", ConditionOp::SUFFIX, "/items"), attrs));
    CHECK(evaluate(make_condition(ConditionType::PATH, "", ConditionOp::SUFFIX, "/ITEMS", true), attrs));
    CHECK_FALSE(evaluate(make_condition(ConditionType::PATH, "", ConditionOp::SUFFIX, "/item"), attrs));
  }

  SECTION("regex")
  {
    CHECK(evaluate(make_condition(ConditionType::HEADER, "User-Agent", ConditionOp::REGEX, "(Android|iPhone)"), attrs));
    CHECK_FALSE(evaluate(make_condition(ConditionType::HEADER, "User-Agent", ConditionOp::REGEX, "android|iphone"), attrs));
    CHECK(evaluate(make_condition(ConditionType::HEADER, "User-Agent", ConditionOp::REGEX, "android|iphone", true), attrs));
    CHECK(evaluate(make_condition(ConditionType::PATH, "", ConditionOp::REGEX, "^/api/v[0-9]+/"), attrs));
  }

  SECTION("exists and not_exists")
  {
    CHECK(evaluate(make_condition(ConditionType::HEADER, "x-geo-country", ConditionOp::EXISTS), attrs));
    CHECK_FALSE(evaluate(make_condition(ConditionType::HEADER, "X-Internal", ConditionOp::EXISTS), attrs));
    CHECK(evaluate(make_condition(ConditionType::HEADER, "X-Internal", ConditionOp::NOT_EXISTS), attrs));
    CHECK_FALSE(evaluate(make_condition(ConditionType::HEADER, "X-Geo-Country", ConditionOp::NOT_EXISTS), attrs));
    CHECK(evaluate(make_condition(ConditionType::COOKIE, "session", ConditionOp::EXISTS), attrs));
    CHECK(evaluate(make_condition(ConditionType::QUERY, "debug", ConditionOp::NOT_EXISTS), attrs));
  }
}

TEST_CASE("Condition attribute sources", "[edge_policy][condition]")
{
  auto attrs = sample_request();

  SECTION("header names are case-insensitive")
  {
    CHECK(evaluate(make_condition(ConditionType::HEADER, "x-geo-country", ConditionOp::EQUALS, "DE"), attrs));
  }

  SECTION("cookies are case-sensitive")
  {
    CHECK(evaluate(make_condition(ConditionType::COOKIE, "beta-tester", ConditionOp::EQUALS, "true"), attrs));
    CHECK_FALSE(evaluate(make_condition(ConditionType::COOKIE, "Beta-Tester", ConditionOp::EQUALS, "true"), attrs));
    CHECK_FALSE(evaluate(make_condition(ConditionType::COOKIE, "beta-tester", ConditionOp::EQUALS, "TRUE"), attrs));
    CHECK(evaluate(make_condition(ConditionType::COOKIE, "beta-tester", ConditionOp::EQUALS, "TRUE", true), attrs));
  }

  SECTION("query parameters")
  {
    CHECK(evaluate(make_condition(ConditionType::QUERY, "canary", ConditionOp::EQUALS, "1"), attrs));
    CHECK(evaluate(make_condition(ConditionType::QUERY, "sort", ConditionOp::PREFIX, "de"), attrs));
    CHECK_FALSE(evaluate(make_condition(ConditionType::QUERY, "Canary", ConditionOp::EQUALS, "1"), attrs));
  }

  SECTION("absent attributes fail every positive operator")
  {
    RequestAttributes empty;
    for (auto op : {ConditionOp::EQUALS, ConditionOp::CONTAINS, ConditionOp::PREFIX, ConditionOp::SUFFIX, ConditionOp::REGEX}) {
      CHECK_FALSE(evaluate(make_condition(ConditionType::HEADER, "X-Missing", op, ".*"), empty));
      CHECK_FALSE(evaluate(make_condition(ConditionType::COOKIE, "missing", op, ".*"), empty));
      CHECK_FALSE(evaluate(make_condition(ConditionType::QUERY, "missing", op, ".*"), empty));
    }
    CHECK_FALSE(evaluate(make_condition(ConditionType::COOKIE, "missing", ConditionOp::EXISTS), empty));
    CHECK(evaluate(make_condition(ConditionType::COOKIE, "missing", ConditionOp::NOT_EXISTS), empty));
  }

  SECTION("empty header value is present")
  {
    RequestAttributes request;
    request.add_header("X-Empty", "");
    CHECK(evaluate(make_condition(ConditionType::HEADER, "X-Empty", ConditionOp::EXISTS), request));
    CHECK(evaluate(make_condition(ConditionType::HEADER, "X-Empty", ConditionOp::EQUALS, ""), request));
  }
}

TEST_CASE("ConditionEvaluator parses cookies once", "[edge_policy][condition]")
{
  auto               attrs = sample_request();
  ConditionEvaluator evaluator(attrs);

  auto session = make_condition(ConditionType::COOKIE, "session", ConditionOp::EQUALS, "abc123");
  auto beta    = make_condition(ConditionType::COOKIE, "beta-tester", ConditionOp::EXISTS);

  CHECK(evaluator.evaluate(session));
  CHECK(evaluator.evaluate(beta));
  REQUIRE(evaluator.lookup(session));
  CHECK(*evaluator.lookup(session) == "abc123");
}
