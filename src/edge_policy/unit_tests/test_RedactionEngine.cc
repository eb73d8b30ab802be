/** @file

  Unit tests for RedactionEngine.h.

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

#include <memory>
#include <string>

#include "edge_policy/RedactionEngine.h"

using namespace edge_policy;
using namespace swoc::literals;

namespace
{
PatternTable
builtin_table(bool phone = false)
{
  PatternTable table;
  REQUIRE(table.add_builtin("credit_card", true).is_ok());
  REQUIRE(table.add_builtin("ssn", true).is_ok());
  REQUIRE(table.add_builtin("email", true).is_ok());
  REQUIRE(table.add_builtin("phone_us", phone).is_ok());
  return table;
}

// Reports a match that ends before it starts.
class BrokenMatcher : public PatternMatcher
{
public:
  bool
  find(swoc::TextView subject, size_t offset, ScanMode, PatternMatch &match) const override
  {
    if (offset >= subject.size()) {
      return false;
    }
    match.start = offset + 1;
    match.end   = offset;
    return true;
  }

  int
  group_count() const override
  {
    return 0;
  }
};

PiiPattern
make_pattern(std::string name, std::shared_ptr<PatternMatcher const> matcher, swoc::TextView replacement)
{
  auto rv = ReplacementTemplate::parse(replacement, matcher->group_count());
  REQUIRE(rv.is_ok());
  return PiiPattern{std::move(name), std::move(matcher), std::move(rv.result()), true};
}
} // namespace

TEST_CASE("Redaction of built-in patterns", "[edge_policy][redact]")
{
  auto            table = builtin_table();
  RedactionEngine engine(table);

  SECTION("credit card keeps the last four digits")
  {
    auto result = engine.redact("card 4111-1111-1111-1111 on file");
    CHECK(result.content == "card XXXX-XXXX-XXXX-1111 on file");
    CHECK(result.redacted);
    CHECK(result.match_count == 1);
    REQUIRE(result.matched_pattern_names.size() == 1);
    CHECK(result.matched_pattern_names[0] == "credit_card");
  }

  SECTION("contiguous credit card")
  {
    auto result = engine.redact("4111111111111111");
    CHECK(result.content == "XXXXXXXXXXXX1111");
  }

  SECTION("ssn")
  {
    CHECK(engine.redact("ssn 123-45-6789").content == "ssn XXX-XX-XXXX");
  }

  SECTION("email")
  {
    CHECK(engine.redact("Contact: user@example.com").content == "Contact: [EMAIL REDACTED]");
  }

  SECTION("phone is off unless enabled")
  {
    CHECK(engine.redact("call 555-123-4567").content == "call 555-123-4567");

    auto            phone_table = builtin_table(true);
    RedactionEngine phone_engine(phone_table);
    CHECK(phone_engine.redact("call 555-123-4567").content == "call (XXX) XXX-4567");
    CHECK(phone_engine.redact("call 555.123.4567").content == "call (XXX) XXX-4567");
  }

  SECTION("nothing to redact")
  {
    auto result = engine.redact("{\"order\": 42, \"status\": \"shipped\"}");
    CHECK(result.content == "{\"order\": 42, \"status\": \"shipped\"}");
    CHECK_FALSE(result.redacted);
    CHECK(result.match_count == 0);
    CHECK(result.matched_pattern_names.empty());
    CHECK_FALSE(result.error);
  }

  SECTION("empty body")
  {
    auto result = engine.redact("");
    CHECK(result.content.empty());
    CHECK_FALSE(result.redacted);
  }
}

TEST_CASE("Redaction metadata", "[edge_policy][redact]")
{
  auto            table = builtin_table(true);
  RedactionEngine engine(table);

  auto result = engine.redact("a@example.com 123-45-6789 b@example.com 4111111111111111 4111-1111-1111-2222 555-123-4567");

  CHECK(result.content == "[EMAIL REDACTED] XXX-XX-XXXX [EMAIL REDACTED] XXXXXXXXXXXX1111 XXXX-XXXX-XXXX-2222 (XXX) XXX-4567");
  CHECK(result.match_count == 6);
  // Distinct names, in table order, not in text order.
  REQUIRE(result.matched_pattern_names.size() == 4);
  CHECK(result.matched_pattern_names[0] == "credit_card");
  CHECK(result.matched_pattern_names[1] == "ssn");
  CHECK(result.matched_pattern_names[2] == "email");
  CHECK(result.matched_pattern_names[3] == "phone_us");
}

TEST_CASE("Redaction is idempotent", "[edge_policy][redact]")
{
  auto            table = builtin_table(true);
  RedactionEngine engine(table);

  for (auto text : {"4111-1111-1111-1111"_tv, "4111111111111111"_tv, "123-45-6789"_tv, "x.y@example.com"_tv, "555-123-4567"_tv,
                    "{\"ssn\":\"123-45-6789\",\"mail\":\"jane@example.com\",\"card\":\"4111 1111\"}"_tv,
                    "4111111111111111-1111-1111-1111"_tv, "1111-1111-1111-4111111111111111"_tv, "4111111111111111.555.123.4567"_tv,
                    "123-45-6789-1111-1111-1111"_tv}) {
    auto once  = engine.redact(text);
    auto twice = engine.redact(once.content);
    CHECK(twice.content == once.content);
    CHECK_FALSE(twice.redacted);
  }
}

TEST_CASE("Masked output blocks adjacent matches", "[edge_policy][redact]")
{
  auto            table = builtin_table();
  RedactionEngine engine(table);

  CHECK(engine.redact("4111111111111111-1111-1111-1111").content == "XXXXXXXXXXXX1111-1111-1111-1111");
  CHECK(engine.redact("x4111-1111-1111-1111").content == "x4111-1111-1111-1111");
  CHECK(engine.redact("card:4111-1111-1111-1111;").content == "card:XXXX-XXXX-XXXX-1111;");
}

TEST_CASE("Redaction next to non-ASCII punctuation", "[edge_policy][redact]")
{
  auto            table = builtin_table();
  RedactionEngine engine(table);

  CHECK(engine.redact("SSN:\xC2\xA0" "123-45-6789").content == "SSN:\xC2\xA0" "XXX-XX-XXXX");
  CHECK(engine.redact("\xE2\x80\x94" "123-45-6789").content == "\xE2\x80\x94" "XXX-XX-XXXX");
  CHECK(engine.redact("card\xE2\x80\xA6" "4111-1111-1111-1111").content == "card\xE2\x80\xA6" "XXXX-XXXX-XXXX-1111");
  CHECK(engine.redact("\xE2\x80\x9C" "jane@example.com" "\xE2\x80\x9D").content ==
        "\xE2\x80\x9C" "[EMAIL REDACTED]" "\xE2\x80\x9D");

  // A non-ASCII letter is still part of the word.
  CHECK(engine.redact("\xC3\xA9" "123-45-6789").content == "\xC3\xA9" "123-45-6789");
}

TEST_CASE("Redaction is deterministic", "[edge_policy][redact]")
{
  auto            table = builtin_table();
  RedactionEngine engine(table);
  swoc::TextView  body{"jane@example.com paid with 4111-1111-1111-1111"};

  CHECK(engine.redact(body).content == engine.redact(body).content);
}

TEST_CASE("Redaction of invalid UTF-8", "[edge_policy][redact]")
{
  auto            table = builtin_table();
  RedactionEngine engine(table);

  std::string body{"\xFF\xFE ssn 123-45-6789 \xC3"};
  auto        result = engine.redact(body);

  CHECK_FALSE(result.error);
  CHECK(result.content == "\xFF\xFE ssn XXX-XX-XXXX \xC3");

  // Bytes are not word characters when the body is not text.
  CHECK(engine.redact("\xFF" "123-45-6789").content == "\xFF" "XXX-XX-XXXX");
  CHECK(engine.redact("\xC3\xA9" "123-45-6789").content == "\xC3\xA9" "123-45-6789");
}

TEST_CASE("Redaction fails open", "[edge_policy][redact]")
{
  swoc::TextView body{"ssn 123-45-6789 aaaaaaaaaaaaaaaaaaaaaaaaaaaab"};

  SECTION("matcher failure")
  {
    auto slow = std::make_shared<RegexMatcher>();
    REQUIRE(slow->compile("(a+)+$").is_ok());
    slow->set_match_limit(10);

    auto table = builtin_table();
    table.add(make_pattern("slow", slow, "x"));
    RedactionEngine engine(table);

    auto result = engine.redact(body);
    CHECK(result.error);
    CHECK(result.content == body);
    CHECK_FALSE(result.redacted);
    CHECK(result.match_count == 0);
    CHECK(result.matched_pattern_names.empty());
  }

  SECTION("invalid match range")
  {
    PatternTable table;
    table.add(make_pattern("broken", std::make_shared<BrokenMatcher>(), "x"));
    RedactionEngine engine(table);

    auto result = engine.redact(body);
    CHECK(result.error);
    CHECK(result.content == body);
  }
}

TEST_CASE("Custom patterns run after built-ins", "[edge_policy][redact]")
{
  auto table = builtin_table();
  REQUIRE(table.add_custom("api_key", "\\bsk_live_[A-Za-z0-9]{4}([A-Za-z0-9]{4,})\\b", "sk_live_[REDACTED]").is_ok());
  REQUIRE(table.add_custom("order", "order-(\\d+)", "order-#$1", false).is_ok());
  RedactionEngine engine(table);

  auto result = engine.redact("key sk_live_abcdEFGH1234 for order-77 by ops@example.com");
  CHECK(result.content == "key sk_live_[REDACTED] for order-77 by [EMAIL REDACTED]");
  REQUIRE(result.matched_pattern_names.size() == 2);
  CHECK(result.matched_pattern_names[0] == "email");
  CHECK(result.matched_pattern_names[1] == "api_key");
}

TEST_CASE("Response annotations", "[edge_policy][redact]")
{
  RedactionResult result;

  SECTION("nothing redacted")
  {
    auto fields = response_annotations(result);
    REQUIRE(fields.size() == 2);
    CHECK(fields[0] == HeaderList::value_type{"X-WASM-Active", "true"});
    CHECK(fields[1] == HeaderList::value_type{"X-WASM-Scrub", "will-scrub"});
  }

  SECTION("redacted")
  {
    result.redacted              = true;
    result.match_count           = 3;
    result.matched_pattern_names = {"credit_card", "email"};

    auto fields = response_annotations(result);
    REQUIRE(fields.size() == 4);
    CHECK(fields[2] == HeaderList::value_type{"X-PII-Redacted", "credit_card,email"});
    CHECK(fields[3] == HeaderList::value_type{"X-Redaction-Count", "3"});
  }

  SECTION("status names")
  {
    CHECK(scrub_status_name(ScrubStatus::WILL_SCRUB) == "will-scrub");
    CHECK(scrub_status_name(ScrubStatus::BYPASSED) == "bypassed");
    CHECK(scrub_status_name(ScrubStatus::NON_TEXT) == "non-text");
    CHECK(scrub_status_name(ScrubStatus::TOO_LARGE) == "too-large");

    result.status = ScrubStatus::TOO_LARGE;
    CHECK(response_annotations(result)[1].second == "too-large");
  }
}
