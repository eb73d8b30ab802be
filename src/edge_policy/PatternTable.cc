/** @file

  Redaction patterns.

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
#include <cstring>
#include <iterator>
#include <utility>

#include "swoc/bwf_base.h"

#include "edge_policy/PatternTable.h"
#include "edge_policy/Errata.h"
#include "edge_policy/Diags.h"

using namespace swoc::literals;

namespace edge_policy
{
namespace
{
  DbgCtl dbg_ctl{"edge_policy.pattern"};

  inline bool
  is_digit(uint32_t c)
  {
    return c >= '0' && c <= '9';
  }

  // Non-ASCII code points that are not letters or digits, sorted and disjoint.
  constexpr std::array<std::pair<uint32_t, uint32_t>, 60> NON_WORD_RANGES{
    {
     {0x0080, 0x00A9},   {0x00AB, 0x00B1},   {0x00B4, 0x00B4},   {0x00B6, 0x00B8},   {0x00BB, 0x00BB},   {0x00BF, 0x00BF},
     {0x00D7, 0x00D7},   {0x00F7, 0x00F7},   {0x02C2, 0x02C5},   {0x02D2, 0x02DF},   {0x02E5, 0x02EB},   {0x02ED, 0x02ED},
     {0x02EF, 0x036F},   {0x037E, 0x037E},   {0x0387, 0x0387},   {0x055A, 0x055F},   {0x0589, 0x058A},   {0x05BE, 0x05BE},
     {0x05C0, 0x05C0},   {0x05C3, 0x05C3},   {0x05C6, 0x05C6},   {0x05F3, 0x05F4},   {0x060C, 0x060D},   {0x061B, 0x061B},
     {0x061F, 0x061F},   {0x066A, 0x066D},   {0x06D4, 0x06D4},   {0x0964, 0x0965},   {0x0970, 0x0970},   {0x0E3F, 0x0E3F},
     {0x0E4F, 0x0E4F},   {0x0E5A, 0x0E5B},   {0x1680, 0x1680},   {0x2000, 0x206F},   {0x207A, 0x207E},   {0x208A, 0x208E},
     {0x20A0, 0x20FF},   {0x2190, 0x245F},   {0x2500, 0x2775},   {0x2794, 0x2BFF},   {0x2E00, 0x2E7F},   {0x3000, 0x3004},
     {0x3008, 0x3020},   {0x302A, 0x3030},   {0x3036, 0x3037},   {0x303D, 0x303F},   {0xFE00, 0xFE0F},   {0xFE10, 0xFE19},
     {0xFE20, 0xFE2F},   {0xFE30, 0xFE4F},   {0xFE50, 0xFE6B},   {0xFEFF, 0xFEFF},   {0xFF01, 0xFF0F},   {0xFF1A, 0xFF20},
     {0xFF3B, 0xFF40},   {0xFF5B, 0xFF65},   {0xFFE0, 0xFFEE},   {0xFFF9, 0xFFFD},   {0x1F000, 0x1FAFF}, {0xE0000, 0xE007F},
     }
  };

  /// A decoded code point and the number of bytes it occupies, a zero length for none.
  struct CodePoint {
    uint32_t value  = 0;
    size_t   length = 0;
  };

  CodePoint
  code_point_at(swoc::TextView subject, size_t pos, ScanMode mode)
  {
    if (pos >= subject.size()) {
      return {};
    }

    uint8_t c = subject[pos];
    if (mode == ScanMode::BYTES || c < 0x80) {
      return {c, 1};
    }

    size_t len = (c & 0xE0) == 0xC0 ? 2 : (c & 0xF0) == 0xE0 ? 3 : 4;
    if (pos + len > subject.size()) {
      return {c, 1};
    }
    uint32_t cp = c & (0x7F >> len);
    for (size_t k = 1; k < len; ++k) {
      cp = (cp << 6) | (static_cast<uint8_t>(subject[pos + k]) & 0x3F);
    }
    return {cp, len};
  }

  CodePoint
  code_point_before(swoc::TextView subject, size_t pos, ScanMode mode)
  {
    if (pos == 0) {
      return {};
    }

    size_t start = pos - 1;
    if (mode == ScanMode::TEXT) {
      while (start > 0 && pos - start < 4 && (static_cast<uint8_t>(subject[start]) & 0xC0) == 0x80) {
        --start;
      }
    }
    auto cp = code_point_at(subject, start, mode);
    if (start + cp.length != pos) {
      return {static_cast<uint8_t>(subject[pos - 1]), 1};
    }
    return cp;
  }

  inline bool
  is_local_part(uint32_t cp, ScanMode mode)
  {
    return is_word_code_point(cp, mode) || (cp > 0 && cp < 0x80 && strchr("._%+-", static_cast<int>(cp)) != nullptr);
  }

  inline bool
  is_domain(uint32_t cp, ScanMode mode)
  {
    return is_word_code_point(cp, mode) || cp == '.' || cp == '-';
  }

  swoc::Errata
  add_entry(PatternTable &table, swoc::TextView name, std::shared_ptr<PatternMatcher const> matcher, swoc::TextView replacement,
            bool enabled)
  {
    auto rv = ReplacementTemplate::parse(replacement, matcher->group_count());
    if (!rv.is_ok()) {
      rv.errata().note(ERRATA_ERROR, "Pattern '{}' has an invalid replacement", name);
      return std::move(rv.errata());
    }
    table.add(PiiPattern{std::string{name}, std::move(matcher), std::move(rv.result()), enabled});
    return {};
  }
} // namespace

bool
is_valid_utf8(swoc::TextView text)
{
  auto const *p = reinterpret_cast<uint8_t const *>(text.data());
  size_t      n = text.size();

  for (size_t i = 0; i < n;) {
    uint8_t c = p[i];
    if (c < 0x80) {
      ++i;
      continue;
    }

    size_t   len;
    uint32_t cp;
    if ((c & 0xE0) == 0xC0) {
      len = 2;
      cp  = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3;
      cp  = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4;
      cp  = c & 0x07;
    } else {
      return false;
    }

    if (i + len > n) {
      return false; // truncated sequence
    }
    for (size_t k = 1; k < len; ++k) {
      if ((p[i + k] & 0xC0) != 0x80) {
        return false;
      }
      cp = (cp << 6) | (p[i + k] & 0x3F);
    }
    // Overlong encodings, surrogates and values past the Unicode range.
    if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) || cp > 0x10FFFF ||
        (cp >= 0xD800 && cp <= 0xDFFF)) {
      return false;
    }
    i += len;
  }
  return true;
}

bool
is_word_code_point(uint32_t cp, ScanMode mode)
{
  if (cp < 0x80) {
    return is_digit(cp) || (cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z');
  }
  if (mode == ScanMode::BYTES) {
    return false;
  }

  auto spot = std::upper_bound(NON_WORD_RANGES.begin(), NON_WORD_RANGES.end(), cp,
                               [](uint32_t value, std::pair<uint32_t, uint32_t> const &range) { return value < range.first; });
  return spot == NON_WORD_RANGES.begin() || cp > std::prev(spot)->second;
}

//----------------------------------------------------------------------------
DigitGroupMatcher::DigitGroupMatcher(std::vector<unsigned> groups, swoc::TextView separators, Boundary boundary)
  : _groups(std::move(groups)), _separators(separators), _boundary(boundary)
{
  if (_groups.empty() || _groups.size() >= PatternMatch::MAX_GROUPS) {
    throw std::invalid_argument("digit group matcher needs between 1 and 9 groups");
  }
}

int
DigitGroupMatcher::group_count() const
{
  return static_cast<int>(_groups.size());
}

bool
DigitGroupMatcher::blocks(uint32_t cp, ScanMode mode) const
{
  return _boundary == Boundary::DIGIT ? is_digit(cp) : is_word_code_point(cp, mode);
}

bool
DigitGroupMatcher::match_at(swoc::TextView subject, size_t pos, ScanMode mode, PatternMatch &match) const
{
  if (pos > 0 && this->blocks(code_point_before(subject, pos, mode).value, mode)) {
    return false;
  }

  size_t i   = pos;
  char   sep = 0;
  for (size_t k = 0; k < _groups.size(); ++k) {
    if (k > 0 && !_separators.empty()) {
      if (i >= subject.size()) {
        return false;
      }
      char c = subject[i];
      if (sep == 0) {
        if (_separators.find(c) == std::string::npos) {
          return false;
        }
        sep = c;
      } else if (c != sep) {
        return false;
      }
      ++i;
    }

    size_t group_start = i;
    for (unsigned n = 0; n < _groups[k]; ++n, ++i) {
      if (i >= subject.size() || !is_digit(subject[i])) {
        return false;
      }
    }
    match.groups[k + 1] = subject.substr(group_start, _groups[k]);
  }

  if (i < subject.size() && this->blocks(code_point_at(subject, i, mode).value, mode)) {
    return false;
  }

  match.start     = pos;
  match.end       = i;
  match.groups[0] = subject.substr(pos, i - pos);
  return true;
}

bool
DigitGroupMatcher::find(swoc::TextView subject, size_t offset, ScanMode mode, PatternMatch &match) const
{
  match.groups.fill({});
  for (size_t pos = offset; pos < subject.size(); ++pos) {
    if (is_digit(subject[pos]) && this->match_at(subject, pos, mode, match)) {
      return true;
    }
  }
  return false;
}

//----------------------------------------------------------------------------
int
EmailMatcher::group_count() const
{
  return 0;
}

bool
EmailMatcher::find(swoc::TextView subject, size_t offset, ScanMode mode, PatternMatch &match) const
{
  match.groups.fill({});
  for (size_t at = subject.find('@', offset); at != swoc::TextView::npos; at = subject.find('@', at + 1)) {
    size_t start = at;
    while (start > offset) {
      auto cp = code_point_before(subject, start, mode);
      if (cp.length > start - offset || !is_local_part(cp.value, mode)) {
        break;
      }
      start -= cp.length;
    }
    if (start == at) {
      continue;
    }

    size_t end = at + 1;
    while (end < subject.size()) {
      auto cp = code_point_at(subject, end, mode);
      if (!is_domain(cp.value, mode)) {
        break;
      }
      end += cp.length;
    }
    while (end > at + 1 && (subject[end - 1] == '.' || subject[end - 1] == '-')) {
      --end;
    }

    auto domain = subject.substr(at + 1, end - at - 1);
    if (domain.empty() || domain.front() == '.' || domain.find('.') == swoc::TextView::npos) {
      continue;
    }

    match.start     = start;
    match.end       = end;
    match.groups[0] = subject.substr(start, end - start);
    return true;
  }
  return false;
}

//----------------------------------------------------------------------------
swoc::Errata
RegexMatcher::compile(swoc::TextView pattern)
{
  std::string error;
  int         erroffset = 0;

  if (!_regex.compile(pattern, error, erroffset)) {
    return make_errata(ERRATA_ERROR, "Invalid regular expression '{}' at offset {}: {}", pattern, erroffset, error);
  }
  if (_regex.capture_count() >= static_cast<int>(PatternMatch::MAX_GROUPS)) {
    Dbg(dbg_ctl, "'%.*s' has more than %zu groups, only $0 to $9 are usable", static_cast<int>(pattern.size()), pattern.data(),
        PatternMatch::MAX_GROUPS - 1);
  }
  return {};
}

void
RegexMatcher::set_match_limit(uint32_t limit)
{
  _regex.set_match_limit(limit);
}

int
RegexMatcher::group_count() const
{
  return std::min(_regex.capture_count(), static_cast<int>(PatternMatch::MAX_GROUPS) - 1);
}

bool
RegexMatcher::find(swoc::TextView subject, size_t offset, ScanMode, PatternMatch &match) const
{
  RegexMatches matches(PatternMatch::MAX_GROUPS);

  int count = _regex.exec(subject, matches, offset, RE_NOTEMPTY);
  if (count == RE_ERROR_NOMATCH) {
    return false;
  }
  if (count < 0) {
    std::string msg;
    swoc::bwprint(msg, "match of '{}' failed: {}", _regex.pattern(), Regex::error_message(count));
    throw ScanError(msg);
  }

  match.groups.fill({});
  match.start = matches.start(0);
  match.end   = matches.end(0);
  for (int i = 0; i < matches.size() && i < static_cast<int>(PatternMatch::MAX_GROUPS); ++i) {
    match.groups[i] = matches[i];
  }
  return true;
}

//----------------------------------------------------------------------------
swoc::Rv<ReplacementTemplate>
ReplacementTemplate::parse(swoc::TextView text, int group_count)
{
  ReplacementTemplate zret;
  Segment             segment;

  zret._text.assign(text.data(), text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '$' && i + 1 < text.size() && is_digit(text[i + 1])) {
      int group = text[i + 1] - '0';
      if (group > group_count) {
        return make_errata(ERRATA_ERROR, "Replacement '{}' refers to ${} but only {} groups are available", text, group,
                           group_count);
      }
      segment.group = group;
      zret._segments.push_back(std::move(segment));
      segment = Segment{};
      ++i;
    } else {
      segment.literal.push_back(c);
    }
  }
  if (!segment.literal.empty()) {
    zret._segments.push_back(std::move(segment));
  }

  return zret;
}

void
ReplacementTemplate::expand(PatternMatch const &match, std::string &out) const
{
  for (auto const &segment : _segments) {
    out.append(segment.literal);
    if (segment.group >= 0) {
      auto const &group = match.groups[segment.group];
      out.append(group.data(), group.size());
    }
  }
}

//----------------------------------------------------------------------------
bool
PatternTable::is_builtin(swoc::TextView name)
{
  return std::find(BUILTIN_NAMES.begin(), BUILTIN_NAMES.end(), name) != BUILTIN_NAMES.end();
}

swoc::Errata
PatternTable::add_builtin(swoc::TextView name, bool enabled)
{
  using Boundary = DigitGroupMatcher::Boundary;

  if (name == "credit_card"_tv) {
    auto errata = add_entry(*this, name, std::make_shared<DigitGroupMatcher>(std::vector<unsigned>{4, 4, 4, 4}, "-", Boundary::WORD),
                            "XXXX-XXXX-XXXX-$4", enabled);
    if (!errata.is_ok()) {
      return errata;
    }
    return add_entry(*this, name, std::make_shared<DigitGroupMatcher>(std::vector<unsigned>{12, 4}, "", Boundary::WORD),
                     "XXXXXXXXXXXX$2", enabled);
  } else if (name == "ssn"_tv) {
    return add_entry(*this, name, std::make_shared<DigitGroupMatcher>(std::vector<unsigned>{3, 2, 4}, "-", Boundary::WORD),
                     "XXX-XX-XXXX", enabled);
  } else if (name == "email"_tv) {
    return add_entry(*this, name, std::make_shared<EmailMatcher>(), "[EMAIL REDACTED]", enabled);
  } else if (name == "phone_us"_tv) {
    return add_entry(*this, name, std::make_shared<DigitGroupMatcher>(std::vector<unsigned>{3, 3, 4}, "-.", Boundary::WORD),
                     "(XXX) XXX-$3", enabled);
  }
  return make_errata(ERRATA_ERROR, "Unknown built-in pattern '{}'", name);
}

swoc::Errata
PatternTable::add_custom(swoc::TextView name, swoc::TextView regex, swoc::TextView replacement, bool enabled)
{
  auto matcher = std::make_shared<RegexMatcher>();
  auto errata  = matcher->compile(regex);
  if (!errata.is_ok()) {
    errata.note(ERRATA_ERROR, "Custom pattern '{}' could not be compiled", name);
    return errata;
  }
  Dbg(dbg_ctl, "custom pattern '%.*s' with %d groups", static_cast<int>(name.size()), name.data(), matcher->group_count());
  return add_entry(*this, name, std::move(matcher), replacement, enabled);
}

PatternTable &
PatternTable::add(PiiPattern &&pattern)
{
  _patterns.push_back(std::move(pattern));
  return *this;
}

size_t
PatternTable::enabled_count() const
{
  return std::count_if(_patterns.begin(), _patterns.end(), [](PiiPattern const &p) { return p.enabled; });
}

} // namespace edge_policy
