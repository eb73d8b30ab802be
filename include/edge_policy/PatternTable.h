/** @file

  Redaction patterns: matchers, replacement templates and the ordered pattern table.

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

#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "swoc/TextView.h"
#include "swoc/Errata.h"

#include "edge_policy/Regex.h"

namespace edge_policy
{
/** How the subject text is interpreted while scanning.

    In @c TEXT mode the subject is valid UTF-8 and is scanned by code point, non-ASCII letters and
    digits count as word characters. In @c BYTES mode only ASCII letters and digits are word
    characters.
 */
enum class ScanMode { TEXT, BYTES };

/// @return @c true if @a text is well formed UTF-8.
bool is_valid_utf8(swoc::TextView text);

/** Word character test.

    Non-ASCII code points are letters or digits unless they are spaces, punctuation, symbols or
    combining marks. In @c BYTES mode @a cp is a single byte and nothing past ASCII is a word
    character.

    @return @c true if @a cp is a letter or digit in @a mode.
 */
bool is_word_code_point(uint32_t cp, ScanMode mode);

/// Thrown by a matcher that cannot complete a scan.
class ScanError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// Location and capture groups of one match.
struct PatternMatch {
  static constexpr size_t MAX_GROUPS = 10; ///< Groups $0 through $9.

  size_t start = 0; ///< Offset of the first matched byte.
  size_t end   = 0; ///< Offset one past the last matched byte.
  std::array<swoc::TextView, MAX_GROUPS> groups; ///< Group 0 is the whole match.
};

/// Interface for a pattern recognizer.
class PatternMatcher
{
public:
  virtual ~PatternMatcher() = default;

  /** Find the first match in @a subject at or after @a offset.

      @return @c true if a non-empty match was found and stored in @a match.
      @throw ScanError if the scan could not be completed.
   */
  virtual bool find(swoc::TextView subject, size_t offset, ScanMode mode, PatternMatch &match) const = 0;

  /// @return The number of capture groups, not counting group 0.
  virtual int group_count() const = 0;
};

/** Runs of digits separated by a delimiter, e.g. "123-45-6789".

    Each digit run is a capture group. If there are several separator characters, the first one
    seen in a candidate must be used for every break.
 */
class DigitGroupMatcher : public PatternMatcher
{
public:
  /// What may not be adjacent to a match.
  enum class Boundary {
    DIGIT, ///< No digit immediately before or after.
    WORD,  ///< No letter or digit immediately before or after.
  };

  /** Constructor.

      @param groups Lengths of the digit runs.
      @param separators Characters allowed between runs, empty for contiguous digits.
      @param boundary Adjacency restriction.
   */
  DigitGroupMatcher(std::vector<unsigned> groups, swoc::TextView separators, Boundary boundary);

  bool find(swoc::TextView subject, size_t offset, ScanMode mode, PatternMatch &match) const override;
  int group_count() const override;

private:
  bool match_at(swoc::TextView subject, size_t pos, ScanMode mode, PatternMatch &match) const;
  bool blocks(uint32_t cp, ScanMode mode) const;

  std::vector<unsigned> _groups;
  std::string           _separators;
  Boundary              _boundary;
};

/** Email shaped tokens.

    A local part of letters, digits and "._%+-", an '@', and a domain of letters, digits, '.'
    and '-' which contains a '.' and does not start with one. Trailing '.' and '-' are treated as
    punctuation after the token, not as part of the domain.
 */
class EmailMatcher : public PatternMatcher
{
public:
  bool find(swoc::TextView subject, size_t offset, ScanMode mode, PatternMatch &match) const override;
  int group_count() const override;
};

/// PCRE2 expression. The subject is always treated as bytes.
class RegexMatcher : public PatternMatcher
{
public:
  /** Compile @a pattern.

      @return An errata with the PCRE2 message and offset on failure.
   */
  swoc::Errata compile(swoc::TextView pattern);

  bool find(swoc::TextView subject, size_t offset, ScanMode mode, PatternMatch &match) const override;
  int group_count() const override;

  /// Adjust the backtracking limit, exceeding it fails the scan.
  void set_match_limit(uint32_t limit);

private:
  Regex _regex;
};

/** Replacement text with group references.

    "$0" through "$9" are replaced by the corresponding capture group, every other character is
    copied literally.
 */
class ReplacementTemplate
{
public:
  ReplacementTemplate() = default;

  /** Parse @a text.

      @param group_count Number of capture groups available to the template.
      @return An errata if @a text references a group beyond @a group_count.
   */
  static swoc::Rv<ReplacementTemplate> parse(swoc::TextView text, int group_count);

  /// Append the expansion for @a match to @a out.
  void expand(PatternMatch const &match, std::string &out) const;

  std::string const &
  text() const
  {
    return _text;
  }

private:
  struct Segment {
    std::string literal;
    int         group = -1; ///< Group to insert after @a literal, -1 for none.
  };

  std::vector<Segment> _segments;
  std::string          _text;
};

/// A named redaction pattern.
struct PiiPattern {
  std::string                           name;
  std::shared_ptr<PatternMatcher const> matcher;
  ReplacementTemplate                   replacement;
  bool                                  enabled = true;
};

/** Ordered set of redaction patterns.

    Built once from configuration and shared read-only afterwards. Patterns are applied in table
    order, the built-in patterns first in the order of @c BUILTIN_NAMES followed by custom patterns.
 */
class PatternTable
{
  using self_type = PatternTable;

public:
  using container      = std::vector<PiiPattern>;
  using const_iterator = container::const_iterator;

  static constexpr std::array<swoc::TextView, 4> BUILTIN_NAMES{
    {"credit_card", "ssn", "email", "phone_us"}
  };

  /// @return @c true if @a name is a built-in pattern.
  static bool is_builtin(swoc::TextView name);

  /** Append the built-in pattern @a name.

      A built-in may contribute more than one entry, all with the same name.
   */
  swoc::Errata add_builtin(swoc::TextView name, bool enabled);

  /// Append a custom PCRE2 pattern.
  swoc::Errata add_custom(swoc::TextView name, swoc::TextView regex, swoc::TextView replacement, bool enabled = true);

  self_type &add(PiiPattern &&pattern);

  const_iterator
  begin() const
  {
    return _patterns.begin();
  }

  const_iterator
  end() const
  {
    return _patterns.end();
  }

  size_t
  size() const
  {
    return _patterns.size();
  }

  /// @return The number of enabled entries.
  size_t enabled_count() const;

private:
  container _patterns;
};

} // namespace edge_policy
