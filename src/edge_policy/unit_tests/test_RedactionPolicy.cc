/** @file

  Unit tests for RedactionPolicy.h.

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

#include <string>

#include "edge_policy/RedactionPolicy.h"

using namespace edge_policy;

namespace
{
RedactionPolicy::Handle
make_policy(RedactionConfig config = {})
{
  auto rv = RedactionPolicy::make(std::move(config));
  REQUIRE(rv.is_ok());
  return rv.result();
}

std::string
errata_text(swoc::Errata const &errata)
{
  std::string zret;
  for (auto const &annotation : errata) {
    zret.append(annotation.text().data(), annotation.text().size());
    zret += '\n';
  }
  return zret;
}
} // namespace

TEST_CASE("RedactionPolicy defaults", "[edge_policy][policy]")
{
  auto policy = make_policy();

  CHECK(policy->config().max_body_size_bytes == 1048576);
  CHECK(policy->patterns().size() == 5);
  CHECK(policy->patterns().enabled_count() == 4);
  CHECK(policy->is_bypass_path("/health"));
  CHECK(policy->is_bypass_path("/metrics"));
  CHECK_FALSE(policy->is_bypass_path("/healthz"));
  CHECK_FALSE(policy->is_bypass_path("/api/health"));
}

TEST_CASE("RedactionPolicy bypass paths", "[edge_policy][policy]")
{
  RedactionConfig config;
  config.bypass_paths = {"/health", "/static/*"};
  auto policy = make_policy(config);

  CHECK(policy->is_bypass_path("/health"));
  CHECK(policy->is_bypass_path("/static/"));
  CHECK(policy->is_bypass_path("/static/app.js"));
  CHECK_FALSE(policy->is_bypass_path("/static"));
  CHECK_FALSE(policy->is_bypass_path("/api"));

  config.bypass_paths = {"*"};
  auto all = make_policy(config);
  CHECK(all->is_bypass_path("/anything"));
}

TEST_CASE("RedactionPolicy content types", "[edge_policy][policy]")
{
  CHECK(RedactionPolicy::is_text_content(""));
  CHECK(RedactionPolicy::is_text_content("application/json"));
  CHECK(RedactionPolicy::is_text_content("application/problem+json; charset=utf-8"));
  CHECK(RedactionPolicy::is_text_content("text/html"));
  CHECK(RedactionPolicy::is_text_content("Text/Plain"));
  CHECK(RedactionPolicy::is_text_content("APPLICATION/JSON"));
  CHECK_FALSE(RedactionPolicy::is_text_content("image/png"));
  CHECK_FALSE(RedactionPolicy::is_text_content("application/octet-stream"));
}

TEST_CASE("RedactionPolicy classify", "[edge_policy][policy]")
{
  RedactionConfig config;
  config.max_body_size_bytes = 64;
  auto policy                = make_policy(config);

  CHECK(policy->classify("/api", "application/json", 10) == ScrubStatus::WILL_SCRUB);
  CHECK(policy->classify("/api", "application/json", std::nullopt) == ScrubStatus::WILL_SCRUB);
  CHECK(policy->classify("/api", "application/json", 64) == ScrubStatus::WILL_SCRUB);
  CHECK(policy->classify("/api", "application/json", 65) == ScrubStatus::TOO_LARGE);
  CHECK(policy->classify("/api", "image/png", 10) == ScrubStatus::NON_TEXT);
  // Bypass is checked first, then content type, then size.
  CHECK(policy->classify("/health", "image/png", 1000) == ScrubStatus::BYPASSED);
  CHECK(policy->classify("/api", "image/png", 1000) == ScrubStatus::NON_TEXT);
}

TEST_CASE("RedactionPolicy scrub", "[edge_policy][policy]")
{
  RedactionConfig config;
  config.max_body_size_bytes = 32;
  auto policy                = make_policy(config);

  auto result = policy->scrub("/api", "application/json", "{\"ssn\":\"123-45-6789\"}");
  CHECK(result.status == ScrubStatus::WILL_SCRUB);
  CHECK(result.content == "{\"ssn\":\"XXX-XX-XXXX\"}");

  result = policy->scrub("/health", "application/json", "{\"ssn\":\"123-45-6789\"}");
  CHECK(result.status == ScrubStatus::BYPASSED);
  CHECK(result.content == "{\"ssn\":\"123-45-6789\"}");
  CHECK_FALSE(result.redacted);

  std::string large{"ssn 123-45-6789 "};
  large.append(32, '.');
  result = policy->scrub("/api", "text/plain", large);
  CHECK(result.status == ScrubStatus::TOO_LARGE);
  CHECK(result.content == large);
  CHECK(response_annotations(result)[1].second == "too-large");
}

TEST_CASE("RedactionStream", "[edge_policy][policy]")
{
  RedactionConfig config;
  config.max_body_size_bytes = 40;
  auto policy                = make_policy(config);

  SECTION("chunks are held until the end of the body")
  {
    RedactionStream stream(policy, ScrubStatus::WILL_SCRUB);

    CHECK(stream.write("mail jane@exa", false).empty());
    CHECK_FALSE(stream.is_complete());
    CHECK(stream.write("mple.com ssn 123-4", false).empty());
    CHECK(stream.write("5-6789", true) == "mail [EMAIL REDACTED] ssn XXX-XX-XXXX");
    CHECK(stream.is_complete());
    CHECK(stream.status() == ScrubStatus::WILL_SCRUB);
    CHECK(stream.result().match_count == 2);
    CHECK(stream.result().redacted);
  }

  SECTION("empty final chunk")
  {
    RedactionStream stream(policy, ScrubStatus::WILL_SCRUB);

    CHECK(stream.write("ssn 123-45-6789", false).empty());
    CHECK(stream.write("", true) == "ssn XXX-XX-XXXX");
  }

  SECTION("cap exceeded mid-stream")
  {
    RedactionStream stream(policy, ScrubStatus::WILL_SCRUB);
    std::string     first{"ssn 123-45-6789 and more "};
    std::string     second{"ssn 987-65-4321 and even more"};

    CHECK(stream.write(first, false).empty());
    CHECK(stream.write(second, false) == first + second);
    CHECK(stream.status() == ScrubStatus::TOO_LARGE);
    CHECK(stream.write("tail 111-22-3333", true) == "tail 111-22-3333");
    CHECK(stream.is_complete());
    CHECK_FALSE(stream.result().redacted);
    CHECK(response_annotations(stream.result())[1].second == "too-large");
  }

  SECTION("body exactly at the cap is scanned")
  {
    RedactionStream stream(policy, ScrubStatus::WILL_SCRUB);
    std::string     body{"ssn 123-45-6789"};
    body.append(40 - body.size(), ' ');

    CHECK(stream.write(body, true).substr(0, 15) == "ssn XXX-XX-XXXX");
    CHECK(stream.status() == ScrubStatus::WILL_SCRUB);
  }

  SECTION("unscanned streams pass through")
  {
    RedactionStream stream(policy, ScrubStatus::BYPASSED);

    CHECK(stream.write("ssn 123-45-6789", false) == "ssn 123-45-6789");
    CHECK(stream.write("", true).empty());
    CHECK(stream.status() == ScrubStatus::BYPASSED);
    CHECK(stream.is_complete());
  }

  SECTION("writes after completion pass through")
  {
    RedactionStream stream(policy, ScrubStatus::WILL_SCRUB);

    CHECK(stream.write("ssn 123-45-6789", true) == "ssn XXX-XX-XXXX");
    CHECK(stream.write("ssn 123-45-6789", true) == "ssn 123-45-6789");
  }
}

TEST_CASE("RedactionPolicy load", "[edge_policy][policy]")
{
  SECTION("full configuration")
  {
    auto rv = RedactionPolicy::load(R"({
  "log_level": "debug",
  "patterns": { "credit_card": true, "ssn": false, "email": true, "phone_us": true },
  "custom_patterns": [
    { "name": "api_key", "regex": "sk_live_\\w+", "replacement": "sk_live_[REDACTED]" },
    { "name": "ticket", "regex": "TCK-(\\d+)", "replacement": "TCK-$1", "enabled": false }
  ],
  "bypass_paths": ["/static/*"],
  "max_body_size_bytes": 2048
})");
    REQUIRE(rv.is_ok());
    auto policy = rv.result();

    CHECK(policy->config().log_level == DL_Debug);
    CHECK(policy->config().max_body_size_bytes == 2048);
    CHECK(policy->patterns().size() == 7);
    CHECK(policy->patterns().enabled_count() == 5);
    CHECK(policy->is_bypass_path("/static/a.css"));
    CHECK_FALSE(policy->is_bypass_path("/health"));

    auto result = policy->redact("ssn 123-45-6789 key sk_live_abc123 call 555-123-4567");
    CHECK(result.content == "ssn 123-45-6789 key sk_live_[REDACTED] call (XXX) XXX-4567");
  }

  SECTION("empty document uses defaults")
  {
    auto rv = RedactionPolicy::load("");
    REQUIRE(rv.is_ok());
    CHECK(rv.result()->patterns().enabled_count() == 4);
  }

  SECTION("every invalid custom pattern is reported")
  {
    auto rv = RedactionPolicy::load(R"({
  "custom_patterns": [
    { "name": "first", "regex": "(", "replacement": "x" },
    { "name": "second", "regex": "a", "replacement": "$1" }
  ]
})");
    REQUIRE_FALSE(rv.is_ok());
    auto text = errata_text(rv.errata());
    CHECK_THAT(text, Catch::Contains("first"));
    CHECK_THAT(text, Catch::Contains("second"));
    CHECK_THAT(text, Catch::Contains("line 3"));
    CHECK_THAT(text, Catch::Contains("line 4"));
  }

  SECTION("missing file")
  {
    auto rv = RedactionPolicy::load_file(swoc::file::path{"/nonexistent/pii_scrub.json"});
    REQUIRE_FALSE(rv.is_ok());
    CHECK_THAT(errata_text(rv.errata()), Catch::Contains("/nonexistent/pii_scrub.json"));
  }
}
