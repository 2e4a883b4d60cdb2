/**
 * @file   region.h
 *
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
 *
 * @section DESCRIPTION
 *
 * This file declares struct Region, a genomic interval used in queries.
 */

#ifndef SIMPLEVCF_VCF_REGION_H
#define SIMPLEVCF_VCF_REGION_H

#include <cstdint>
#include <string>

namespace simplevcf {
namespace vcf {

/**
 * Struct representing a parsed region string.
 *
 * Regions values of this type are always treated as 0-indexed, inclusive
 * intervals. Region strings given by users are 1-indexed, inclusive and are
 * converted by parse_region().
 */
struct Region {
  Region();

  /*
   * Create a Region object. The min and max values must be 0-indexed,
   * inclusive.
   */
  Region(const std::string& seq, uint32_t min, uint32_t max);

  /*
   * Create Region object from a 1-indexed, inclusive region string. See
   * parse_region().
   */
  explicit Region(const std::string& str);

  /**
   * Parses a 1-indexed, inclusive region string with one of the formats:
   *
   *     contig
   *     contig:start
   *     contig:start-end
   *
   * Commas in the coordinates are ignored ("chr1:1,000-2,000"). A bare
   * contig covers the whole contig; "contig:start" extends to the end of the
   * contig.
   *
   * @throws RegionSyntaxError if the string is not one of the formats above,
   *     a coordinate is not a positive integer or start > end.
   */
  static Region parse_region(const std::string& region_str);

  /** Returns a 1-indexed, inclusive string representation of the region. */
  std::string to_str() const;

  /** True if the 1-based position on the given contig lies in the region. */
  bool contains(const std::string& chrom, int64_t pos) const;

  bool operator==(const Region& other) const {
    return seq_name == other.seq_name && min == other.min && max == other.max;
  }

  /** Contig name. */
  std::string seq_name;

  /** 0-based, inclusive start. */
  uint32_t min;

  /** 0-based, inclusive end. */
  uint32_t max;
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_VCF_REGION_H
