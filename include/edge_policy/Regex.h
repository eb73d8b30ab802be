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

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace edge_policy
{
/// @brief Match flags for regular expression evaluation.
///
/// @internal These values are copied from pcre2.h, to avoid having to include it.  The values are checked (with
/// static_assert) in Regex.cc against PCRE2 named constants, in case they change in future PCRE2 releases.
enum REFlags {
  RE_CASE_INSENSITIVE = 0x00000008u, ///< Ignore case (by default, matches are case sensitive).
  RE_NOTEMPTY         = 0x00000004u  ///< Not empty (by default, matches may match empty string).
};

/// @brief Error codes returned by regular expression operations.
enum REErrors {
  RE_ERROR_NOMATCH = -1, ///< No match found.
};

/// @brief Wrapper for PCRE2 match data.
class RegexMatches
{
  friend class Regex;

public:
  /** Construct a new RegexMatches object.
   *
   * @param size The number of matches to allocate space for.
   */
  explicit RegexMatches(uint32_t size = DEFAULT_MATCHES);
  ~RegexMatches();

  // No copying.
  RegexMatches(RegexMatches const &)            = delete;
  RegexMatches &operator=(RegexMatches const &) = delete;

  /** Get the match at the given index.
   *
   * @return The match at the given index, empty if the group did not participate.
   */
  std::string_view operator[](size_t index) const;

  /// @return Offset in the subject of the start of group @a index.
  size_t start(size_t index) const;

  /// @return Offset in the subject one past the end of group @a index.
  size_t end(size_t index) const;

  /// @return The number of groups set by the last match.
  int32_t size() const;

private:
  constexpr static uint32_t DEFAULT_MATCHES = 10;

  std::string_view _subject;
  int32_t          _size       = 0;
  void            *_match_data = nullptr;
};

/// @brief Wrapper for PCRE2 regular expression.
class Regex
{
public:
  /// Default backtracking limit applied to every match.
  static constexpr uint32_t DEFAULT_MATCH_LIMIT = 100000;

  Regex() = default;
  Regex(Regex &&that) noexcept;
  Regex &operator=(Regex &&that) noexcept;
  ~Regex();

  // No copying.
  Regex(Regex const &)            = delete;
  Regex &operator=(Regex const &) = delete;

  /** Compile the @a pattern into a regular expression.
   *
   * @param pattern Source pattern for regular expression.
   * @param error String to receive error message.
   * @param erroffset Integer to receive error offset.
   * @param flags Compilation flags.
   * @return @a true if compiled successfully, @a false otherwise.
   *
   * @a flags should be the bitwise @c or of @c REFlags values.
   */
  bool compile(std::string_view pattern, std::string &error, int &erroffset, uint32_t flags = 0);

  /** Execute the regular expression.
   *
   * @param subject String to match against.
   * @return @c true if the pattern matched, @a false if not.
   *
   * It is safe to call this method concurrently on the same instance of @a this.
   */
  bool exec(std::string_view subject) const;

  /** Execute the regular expression.
   *
   * @param subject String to match against.
   * @param matches Place to store the capture groups.
   * @param offset Offset in @a subject where the search starts.
   * @param flags Match flags (e.g., RE_NOTEMPTY).
   * @return The number of capture groups set, @c RE_ERROR_NOMATCH if there was no match, another
   *   negative value if matching failed (e.g. the match limit was exceeded).
   *
   * It is safe to call this method concurrently on the same instance of @a this.
   */
  int exec(std::string_view subject, RegexMatches &matches, size_t offset = 0, uint32_t flags = 0) const;

  /// Set the backtracking limit for subsequent matches.
  void set_match_limit(uint32_t limit);

  /// @return The number of capture groups in the compiled pattern.
  int capture_count() const;

  /// @return Is the compiled pattern empty?
  bool empty() const;

  /// @return The source text of the compiled pattern.
  std::string const &
  pattern() const
  {
    return _pattern;
  }

  /// Describe a PCRE2 error code.
  static std::string error_message(int code);

private:
  void        *_code          = nullptr;
  void        *_match_context = nullptr;
  std::string  _pattern;
};

} // namespace edge_policy
