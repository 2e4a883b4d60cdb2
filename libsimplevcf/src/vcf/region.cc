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

#include <algorithm>
#include <limits>

#include "utils/exceptions.h"
#include "utils/utils.h"
#include "vcf/region.h"

namespace simplevcf {
namespace vcf {

namespace {
/** Parses a 1-based coordinate of a region string. */
uint32_t parse_coordinate(const std::string& str, const std::string& region) {
  int64_t value = 0;
  if (!utils::parse_int(str, &value) || value < 1 ||
      value > std::numeric_limits<uint32_t>::max())
    throw RegionSyntaxError(
        "Error parsing region string '" + region + "'; '" + str +
        "' is not a positive position.");
  return static_cast<uint32_t>(value);
}
}  // namespace

Region::Region()
    : min(0)
    , max(0) {
}

Region::Region(const std::string& seq, uint32_t min, uint32_t max)
    : seq_name(seq)
    , min(min)
    , max(max) {
}

Region::Region(const std::string& str) {
  *this = parse_region(str);
}

Region Region::parse_region(const std::string& region_str) {
  // The contig name may itself contain ':' (e.g. HLA contigs), so split on
  // the last one only.
  std::string str = region_str;
  utils::trim(&str);
  if (str.empty())
    throw RegionSyntaxError("Error parsing region string; string is empty.");

  Region result;
  result.min = 0;
  result.max = std::numeric_limits<uint32_t>::max() - 1;

  auto colon = str.rfind(':');
  if (colon == std::string::npos) {
    result.seq_name = str;
    return result;
  }

  result.seq_name = str.substr(0, colon);
  if (result.seq_name.empty())
    throw RegionSyntaxError(
        "Error parsing region string '" + region_str +
        "'; contig name is empty.");

  // Strip commas
  std::string range = str.substr(colon + 1);
  range.erase(std::remove(range.begin(), range.end(), ','), range.end());

  // Range
  auto range_split = utils::split(range, '-');
  if (range_split.size() == 1) {
    result.min = parse_coordinate(range_split[0], region_str) - 1;
  } else if (range_split.size() == 2) {
    result.min = parse_coordinate(range_split[0], region_str) - 1;
    result.max = parse_coordinate(range_split[1], region_str) - 1;
  } else {
    throw RegionSyntaxError(
        "Error parsing region string; invalid region format, should be "
        "CHR:XX,XXX-YY,YYY\n\t" +
        region_str);
  }

  if (result.min > result.max)
    throw RegionSyntaxError(
        "Error parsing region string '" + region_str +
        "'; start is greater than end.");

  return result;
}

std::string Region::to_str() const {
  return seq_name + ':' + std::to_string(uint64_t(min) + 1) + '-' +
         std::to_string(uint64_t(max) + 1);
}

bool Region::contains(const std::string& chrom, int64_t pos) const {
  return chrom == seq_name && pos >= int64_t(min) + 1 &&
         pos <= int64_t(max) + 1;
}

}  // namespace vcf
}  // namespace simplevcf
