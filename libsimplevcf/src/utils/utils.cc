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

#include <htslib/hts.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <mutex>
#include <sstream>

#include "utils/utils.h"

namespace simplevcf {
namespace vcf {
namespace utils {

#ifndef SIMPLEVCF_COMMIT_HASH_STR
#define SIMPLEVCF_COMMIT_HASH_STR "unknown"
#endif

const std::string SIMPLEVCF_COMMIT_HASH = SIMPLEVCF_COMMIT_HASH_STR;

std::vector<std::string> split(
    const std::string& str, const std::string& delims, bool skip_empty) {
  std::vector<std::string> output;
  for_each_token(
      str.cbegin(),
      str.cend(),
      delims.cbegin(),
      delims.cend(),
      [&](std::string::const_iterator first,
          std::string::const_iterator second) {
        if (first != second || !skip_empty) {
          output.emplace_back(first, second);
        }
      });
  return output;
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> output;
  size_t start = 0;
  while (true) {
    size_t pos = s.find(delim, start);
    if (pos == std::string::npos) {
      output.emplace_back(s, start);
      break;
    }
    output.emplace_back(s, start, pos - start);
    start = pos + 1;
  }
  return output;
}

bool starts_with(const std::string& value, const std::string& prefix) {
  if (prefix.size() > value.size())
    return false;
  return std::equal(prefix.begin(), prefix.end(), value.begin());
}

void trim(std::string* s) {
  while (s->size() && std::isspace(static_cast<unsigned char>(s->back())))
    s->pop_back();
  while (s->size() && std::isspace(static_cast<unsigned char>(s->front())))
    s->erase(s->begin());
}

std::string join(const std::vector<std::string>& tokens, char delim) {
  std::string result;
  for (size_t i = 0; i < tokens.size(); i++) {
    if (i > 0)
      result.push_back(delim);
    result += tokens[i];
  }
  return result;
}

bool parse_int(const std::string& s, int64_t* value) {
  if (s.empty() || std::isspace(static_cast<unsigned char>(s.front())))
    return false;
  errno = 0;
  char* end = nullptr;
  long long v = std::strtoll(s.c_str(), &end, 10);
  if (errno == ERANGE || end != s.c_str() + s.size())
    return false;
  *value = static_cast<int64_t>(v);
  return true;
}

bool parse_float(const std::string& s, double* value) {
  if (s.empty() || std::isspace(static_cast<unsigned char>(s.front())))
    return false;
  errno = 0;
  char* end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size())
    return false;
  // Underflow to a denormal or zero is accepted, overflow is not.
  if (errno == ERANGE && (v == HUGE_VAL || v == -HUGE_VAL))
    return false;
  *value = v;
  return true;
}

static std::mutex version_creation_mtx_;
const std::string& version_info() {
  static std::string version;
  std::unique_lock<std::mutex> lck(version_creation_mtx_);
  if (version.empty()) {
    std::stringstream ss;
    ss << "SimpleVCF version " << utils::SIMPLEVCF_COMMIT_HASH << std::endl;
    ss << "htslib version " << hts_version();
    version = ss.str();
  }

  return version;
}

}  // namespace utils
}  // namespace vcf
}  // namespace simplevcf
