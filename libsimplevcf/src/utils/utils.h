/**
 * @section LICENSE
 *
 * The MIT License
 *
 * @copyright Copyright (c) 2024 TileDB, Inc.
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#ifndef SIMPLEVCF_UTILS_H
#define SIMPLEVCF_UTILS_H

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace simplevcf {
namespace vcf {

namespace utils {

/** Commit hash of SimpleVCF (#defined by CMake) */
extern const std::string SIMPLEVCF_COMMIT_HASH;

/**
 * Apply binary_op to each token in [in_begin,in_end], split by any element in
 * [d_begin, d_end]. Adapted from
 * http://tristanbrindle.com/posts/a-quicker-study-on-tokenising/
 *
 * @tparam InIter Type of input iterator
 * @tparam DelimIter Type of split iterator
 * @tparam BinOp Binary Op to apply fo each token
 * @param in_begin Input begin iterator
 * @param in_end Input end iterator
 * @param d_begin Delimiter begin iterator
 * @param d_end Delimiter end iterator
 * @param binary_op operation to apply to each token
 */
template <typename InIter, typename DelimIter, class BinOp>
void for_each_token(
    InIter in_begin,
    InIter in_end,
    DelimIter d_begin,
    DelimIter d_end,
    BinOp binary_op) {
  while (in_begin != in_end) {
    const auto pos = std::find_first_of(in_begin, in_end, d_begin, d_end);
    binary_op(in_begin, pos);
    if (pos == in_end)
      break;
    in_begin = std::next(pos);
  }
}

/**
 * @brief
 * Split a string into tokens with any delimiter in delims.
 * @param str String to split
 * @param delims List of delimiters to split by
 * @param skip_empty Skip empty elements
 * @return vector of tokens
 */
std::vector<std::string> split(
    const std::string& str,
    const std::string& delims = ",",
    bool skip_empty = true);

/**
 * @brief
 * Splits a string into a vector given some character delimiter. Empty tokens
 * are kept, so "a,,b" yields three tokens and "" yields one empty token.
 * @param s string to split
 * @param delim split string at delim, discarding the delim
 * @return vector to store results in
 */
std::vector<std::string> split(const std::string& s, char delim);

/**
 * Checks if a string starts with some substring
 *
 * @param value
 * @param prefix
 * @return True if full_string starts with prefix
 */
bool starts_with(const std::string& value, const std::string& prefix);

/** Trims leading and trailing whitespace in-place. */
void trim(std::string* s);

/**
 * Joins the given tokens with a delimiter.
 */
std::string join(const std::vector<std::string>& tokens, char delim);

/**
 * Parses a base-10 signed integer occupying the whole string.
 *
 * @param s String to parse
 * @param value Set to the parsed value on success
 * @return True if the string was a valid integer in range
 */
bool parse_int(const std::string& s, int64_t* value);

/**
 * Parses a floating point number occupying the whole string. Accepts the
 * spellings "nan", "inf" and "infinity" (any case, optional sign).
 *
 * @param s String to parse
 * @param value Set to the parsed value on success
 * @return True if the string was a valid number
 */
bool parse_float(const std::string& s, double* value);

/**
 * @tparam T
 * @param start_time
 * @return Time between start time and now.
 */
template <typename T>
double chrono_duration(const std::chrono::time_point<T>& start_time) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::duration<double>>(
             now - start_time)
      .count();
}

/**
 * Returns SimpleVCF and htslib version information in string form.
 */
const std::string& version_info();

/**
 * @brief Search for item in vec. If not found push item to the back of vec.
 *
 * @tparam T type of item
 * @param vec vector of type T
 * @param item item to add to vector
 * @return int index of item in vec
 */
template <class T>
int push_unique(std::vector<T>& vec, T item) {
  auto find_it = std::find(vec.begin(), vec.end(), item);
  if (find_it == vec.end()) {
    vec.push_back(item);
    return vec.size() - 1;
  }
  return find_it - vec.begin();
}

/**
 * @brief Search for item in vec. Return true if found, false otherwise.
 *
 * @tparam T type of item
 * @param vec vector of type T
 * @param item item to search for
 * @return true item found in vec
 * @return false item not found in vec
 */
template <class T>
bool contains(const std::vector<T>& vec, const T& item) {
  return std::find(vec.begin(), vec.end(), item) != vec.end();
}

}  // namespace utils
}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_UTILS_H
