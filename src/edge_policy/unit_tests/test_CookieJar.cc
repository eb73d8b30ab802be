/** @file

  Unit tests for CookieJar.h.

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

#include "edge_policy/CookieJar.h"

using namespace edge_policy;

TEST_CASE("CookieJar parsing", "[edge_policy][cookie]")
{
  SECTION("simple pairs")
  {
    CookieJar jar("session=abc123; beta=true");
    REQUIRE(jar.get("beta"));
    CHECK(*jar.get("beta") == "true");
    CHECK(*jar.get("session") == "abc123");
    CHECK_FALSE(jar.get("other"));
  }

  SECTION("whitespace is trimmed")
  {
    CookieJar jar("  a = 1 ;b=2  ;   c =3");
    CHECK(*jar.get("a") == "1");
    CHECK(*jar.get("b") == "2");
    CHECK(*jar.get("c") == "3");
  }

  SECTION("value keeps everything after the first '='")
  {
    CookieJar jar("token=a=b=c");
    CHECK(*jar.get("token") == "a=b=c");
  }

  SECTION("malformed pairs are skipped")
  {
    CookieJar jar("novalue; =orphan; ok=1;;");
    CHECK(jar.values().size() == 1);
    CHECK(*jar.get("ok") == "1");
    CHECK_FALSE(jar.get("novalue"));
  }

  SECTION("empty value is present")
  {
    CookieJar jar("flag=");
    REQUIRE(jar.get("flag"));
    CHECK(jar.get("flag")->empty());
  }

  SECTION("first duplicate wins")
  {
    CookieJar jar("beta=false; beta=true");
    CHECK(*jar.get("beta") == "false");
  }

  SECTION("names are case sensitive")
  {
    CookieJar jar("Beta=true");
    CHECK_FALSE(jar.get("beta"));
  }
}

TEST_CASE("CookieJar parses lazily", "[edge_policy][cookie]")
{
  CookieJar jar("a=1");
  CHECK_FALSE(jar.is_parsed());
  jar.get("a");
  CHECK(jar.is_parsed());
}

TEST_CASE("QueryParams", "[edge_policy][cookie]")
{
  QueryParams params("canary=1&user=bob&empty=&canary=2");
  CHECK(*params.get("canary") == "1");
  CHECK(*params.get("user") == "bob");
  CHECK(params.get("empty")->empty());
  CHECK_FALSE(params.get("missing"));

  auto map = QueryParams::parse("x=1;y=2");
  REQUIRE(map.size() == 1);
  CHECK(map.begin()->second == "1;y=2");
}
