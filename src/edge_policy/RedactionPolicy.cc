/** @file

  Response body filter policy.

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

#include <cinttypes>
#include <utility>

#include "swoc/bwf_base.h"

#include "edge_policy/RedactionPolicy.h"
#include "edge_policy/Errata.h"
#include "edge_policy/Diags.h"

using namespace swoc::literals;

namespace edge_policy
{
namespace
{
  DbgCtl dbg_ctl{"edge_policy.redact"};

  bool
  contains_nocase(swoc::TextView text, swoc::TextView token)
  {
    for (; text.size() >= token.size(); ++text) {
      if (text.starts_with_nocase(token)) {
        return true;
      }
    }
    return false;
  }
} // namespace

RedactionPolicy::RedactionPolicy(RedactionConfig &&config) : _config(std::move(config)) {}

swoc::Rv<RedactionPolicy::Handle>
RedactionPolicy::make(RedactionConfig config)
{
  swoc::Errata errata;
  std::shared_ptr<RedactionPolicy> policy{new RedactionPolicy(std::move(config))};

  for (auto name : PatternTable::BUILTIN_NAMES) {
    auto spot    = policy->_config.patterns.find(std::string_view{name});
    bool enabled = spot != policy->_config.patterns.end() && spot->second;
    if (auto e = policy->_patterns.add_builtin(name, enabled); !e.is_ok()) {
      errata.note(std::move(e));
    }
  }

  for (auto const &custom : policy->_config.custom_patterns) {
    if (auto e = policy->_patterns.add_custom(custom.name, custom.regex, custom.replacement, custom.enabled); !e.is_ok()) {
      if (custom.line > 0) {
        e.note(ERRATA_ERROR, "Custom pattern defined at line {}", custom.line);
      }
      errata.note(std::move(e));
    }
  }

  if (!errata.is_ok()) {
    return std::move(errata);
  }

  Dbg(dbg_ctl, "redaction policy ready: %zu of %zu patterns enabled", policy->_patterns.enabled_count(),
      policy->_patterns.size());
  return Handle{std::move(policy)};
}

swoc::Rv<RedactionPolicy::Handle>
RedactionPolicy::load(swoc::TextView text)
{
  RedactionConfig config;
  if (auto errata = parse_redaction_config(text, config); !errata.is_ok()) {
    return std::move(errata);
  }
  return make(std::move(config));
}

swoc::Rv<RedactionPolicy::Handle>
RedactionPolicy::load_file(swoc::file::path const &path)
{
  std::string content;
  if (auto errata = load_config_file(path, content); !errata.is_ok()) {
    return std::move(errata);
  }
  auto rv = load(content);
  if (!rv.is_ok()) {
    rv.errata().note(ERRATA_ERROR, "While loading '{}'", path.c_str());
  }
  return rv;
}

bool
RedactionPolicy::is_bypass_path(swoc::TextView path) const
{
  for (auto const &entry : _config.bypass_paths) {
    swoc::TextView pattern{entry};
    if (pattern.ends_with("*"_tv)) {
      if (path.starts_with(pattern.substr(0, pattern.size() - 1))) {
        return true;
      }
    } else if (path == pattern) {
      return true;
    }
  }
  return false;
}

bool
RedactionPolicy::is_text_content(swoc::TextView content_type)
{
  return content_type.empty() || contains_nocase(content_type, "json"_tv) || contains_nocase(content_type, "text"_tv);
}

ScrubStatus
RedactionPolicy::classify(swoc::TextView path, swoc::TextView content_type, std::optional<uint64_t> content_length) const
{
  if (this->is_bypass_path(path)) {
    Dbg(dbg_ctl, "bypass path %.*s", static_cast<int>(path.size()), path.data());
    return ScrubStatus::BYPASSED;
  }
  if (!is_text_content(content_type)) {
    Dbg(dbg_ctl, "content type %.*s is not text", static_cast<int>(content_type.size()), content_type.data());
    return ScrubStatus::NON_TEXT;
  }
  if (content_length && *content_length > _config.max_body_size_bytes) {
    Dbg(dbg_ctl, "content length %" PRIu64 " exceeds %" PRIu64, *content_length, _config.max_body_size_bytes);
    return ScrubStatus::TOO_LARGE;
  }
  return ScrubStatus::WILL_SCRUB;
}

RedactionResult
RedactionPolicy::scrub(swoc::TextView path, swoc::TextView content_type, swoc::TextView body) const
{
  auto status = this->classify(path, content_type, body.size());
  if (status != ScrubStatus::WILL_SCRUB) {
    RedactionResult result;
    result.content.assign(body.data(), body.size());
    result.status = status;
    return result;
  }
  return _engine.redact(body);
}

RedactionResult
RedactionPolicy::redact(swoc::TextView body) const
{
  return _engine.redact(body);
}

//----------------------------------------------------------------------------
RedactionStream::RedactionStream(RedactionPolicy::Handle policy, ScrubStatus status) : _policy(std::move(policy))
{
  _result.status = status;
}

std::string
RedactionStream::write(swoc::TextView chunk, bool end_of_stream)
{
  std::string out;

  if (_complete) {
    out.assign(chunk.data(), chunk.size());
    return out;
  }
  _complete = end_of_stream;

  if (_result.status != ScrubStatus::WILL_SCRUB) {
    out.assign(chunk.data(), chunk.size());
    return out;
  }

  if (_buffer.size() + chunk.size() > _policy->config().max_body_size_bytes) {
    Dbg(dbg_ctl, "body exceeded %" PRIu64 " bytes after %zu buffered, passing through", _policy->config().max_body_size_bytes,
        _buffer.size());
    _result.status = ScrubStatus::TOO_LARGE;
    out.swap(_buffer);
    out.append(chunk.data(), chunk.size());
    return out;
  }

  _buffer.append(chunk.data(), chunk.size());
  if (_complete) {
    _result = _policy->redact(_buffer);
    _buffer.clear();
    out = _result.content;
  }
  return out;
}

} // namespace edge_policy
