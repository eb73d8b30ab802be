/** @file

  PCRE2 regular expression wrapper.

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

#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>

#include <array>
#include <utility>

#include "edge_policy/Regex.h"

namespace edge_policy
{
static_assert(RE_CASE_INSENSITIVE == PCRE2_CASELESS, "Update RE_CASE_INSENSITIVE for current PCRE2 version.");
static_assert(RE_NOTEMPTY == PCRE2_NOTEMPTY, "Update RE_NOTEMPTY for current PCRE2 version.");
static_assert(RE_ERROR_NOMATCH == PCRE2_ERROR_NOMATCH, "Update RE_ERROR_NOMATCH for current PCRE2 version.");

namespace
{
  inline pcre2_code *
  as_code(void *p)
  {
    return static_cast<pcre2_code *>(p);
  }

  inline pcre2_match_data *
  as_match_data(void *p)
  {
    return static_cast<pcre2_match_data *>(p);
  }

  inline pcre2_match_context *
  as_match_context(void *p)
  {
    return static_cast<pcre2_match_context *>(p);
  }
} // namespace

//----------------------------------------------------------------------------
RegexMatches::RegexMatches(uint32_t size) : _match_data(pcre2_match_data_create(size, nullptr)) {}

RegexMatches::~RegexMatches()
{
  if (_match_data != nullptr) {
    pcre2_match_data_free(as_match_data(_match_data));
  }
}

std::string_view
RegexMatches::operator[](size_t index) const
{
  if (_match_data == nullptr || index >= static_cast<size_t>(_size)) {
    return {};
  }
  PCRE2_SIZE *ovector = pcre2_get_ovector_pointer(as_match_data(_match_data));
  if (ovector[2 * index] == PCRE2_UNSET) {
    return {};
  }
  return _subject.substr(ovector[2 * index], ovector[2 * index + 1] - ovector[2 * index]);
}

size_t
RegexMatches::start(size_t index) const
{
  PCRE2_SIZE *ovector = pcre2_get_ovector_pointer(as_match_data(_match_data));
  return ovector[2 * index];
}

size_t
RegexMatches::end(size_t index) const
{
  PCRE2_SIZE *ovector = pcre2_get_ovector_pointer(as_match_data(_match_data));
  return ovector[2 * index + 1];
}

int32_t
RegexMatches::size() const
{
  return _size;
}

//----------------------------------------------------------------------------
Regex::Regex(Regex &&that) noexcept
  : _code(std::exchange(that._code, nullptr)),
    _match_context(std::exchange(that._match_context, nullptr)),
    _pattern(std::move(that._pattern))
{
}

Regex &
Regex::operator=(Regex &&that) noexcept
{
  if (this != &that) {
    if (_code != nullptr) {
      pcre2_code_free(as_code(_code));
    }
    if (_match_context != nullptr) {
      pcre2_match_context_free(as_match_context(_match_context));
    }
    _code          = std::exchange(that._code, nullptr);
    _match_context = std::exchange(that._match_context, nullptr);
    _pattern       = std::move(that._pattern);
  }
  return *this;
}

Regex::~Regex()
{
  if (_code != nullptr) {
    pcre2_code_free(as_code(_code));
  }
  if (_match_context != nullptr) {
    pcre2_match_context_free(as_match_context(_match_context));
  }
}

bool
Regex::compile(std::string_view pattern, std::string &error, int &erroffset, uint32_t flags)
{
  uint32_t options = 0;
  int      error_code;
  PCRE2_SIZE error_offset;

  if (_code != nullptr) {
    error     = "regular expression already compiled";
    erroffset = 0;
    return false;
  }

  if (flags & RE_CASE_INSENSITIVE) {
    options |= PCRE2_CASELESS;
  }

  pcre2_code *code = pcre2_compile(reinterpret_cast<PCRE2_SPTR>(pattern.data()), pattern.size(), options, &error_code,
                                   &error_offset, nullptr);
  if (code == nullptr) {
    error     = error_message(error_code);
    erroffset = static_cast<int>(error_offset);
    return false;
  }

  // JIT is an optimization only, the interpreter is used if it is not available.
  pcre2_jit_compile(code, PCRE2_JIT_COMPLETE);

  _code          = code;
  _match_context = pcre2_match_context_create(nullptr);
  _pattern.assign(pattern.data(), pattern.size());
  this->set_match_limit(DEFAULT_MATCH_LIMIT);
  return true;
}

bool
Regex::exec(std::string_view subject) const
{
  if (_code == nullptr) {
    return false;
  }
  RegexMatches matches(1);
  return this->exec(subject, matches) >= 0;
}

int
Regex::exec(std::string_view subject, RegexMatches &matches, size_t offset, uint32_t flags) const
{
  if (_code == nullptr || matches._match_data == nullptr) {
    return PCRE2_ERROR_NULL;
  }

  matches._subject = subject;
  int count = pcre2_match(as_code(_code), reinterpret_cast<PCRE2_SPTR>(subject.data()), subject.size(), offset, flags,
                          as_match_data(matches._match_data), as_match_context(_match_context));
  // A zero return means the match data was too small, every available slot was filled.
  matches._size = count == 0 ? static_cast<int32_t>(pcre2_get_ovector_count(as_match_data(matches._match_data))) : count;
  if (count < 0) {
    matches._size = 0;
  }
  return count;
}

void
Regex::set_match_limit(uint32_t limit)
{
  if (_match_context != nullptr) {
    pcre2_set_match_limit(as_match_context(_match_context), limit);
  }
}

int
Regex::capture_count() const
{
  uint32_t captures = 0;
  if (_code == nullptr || pcre2_pattern_info(as_code(_code), PCRE2_INFO_CAPTURECOUNT, &captures) != 0) {
    return -1;
  }
  return static_cast<int>(captures);
}

bool
Regex::empty() const
{
  return _code == nullptr;
}

std::string
Regex::error_message(int code)
{
  std::array<PCRE2_UCHAR, 256> buffer;
  int                          n = pcre2_get_error_message(code, buffer.data(), buffer.size());
  if (n < 0) {
    return "unknown PCRE2 error " + std::to_string(code);
  }
  return {reinterpret_cast<char const *>(buffer.data()), static_cast<size_t>(n)};
}

} // namespace edge_policy
