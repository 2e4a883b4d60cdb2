/**
 * @file   region_index.h
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
 * Region lookup over a VCF file: indexed (tabix) or by linear scan.
 */

#ifndef SIMPLEVCF_VCF_REGION_INDEX_H
#define SIMPLEVCF_VCF_REGION_INDEX_H

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "vcf/line_source.h"
#include "vcf/region.h"
#include "vcf/vcf_utils.h"

namespace simplevcf {
namespace vcf {

/**
 * Abstract region lookup. Both query methods return iterators over data lines
 * only (header and blank lines are skipped), in file order.
 */
class RegionIndex {
 public:
  virtual ~RegionIndex() = default;

  /**
   * Returns the data lines of records whose POS lies within the region. An
   * unknown contig yields an empty iterator.
   */
  virtual std::unique_ptr<LineIterator> query(const Region& region) = 0;

  /** Returns all data lines of the file. */
  virtual std::unique_ptr<LineIterator> query_all() = 0;

  /** True if queries are answered from an index rather than a scan. */
  virtual bool is_indexed() const = 0;
};

/**
 * Wraps a line iterator, skipping header and blank lines and, if a region is
 * given, lines whose CHROM/POS fall outside it. Lines whose POS cannot be
 * parsed are passed through for the decoder to report.
 */
class DataLineFilter : public LineIterator {
 public:
  DataLineFilter(
      std::unique_ptr<LineIterator> lines, std::optional<Region> region);

  bool next(std::string* line, uint64_t* line_number) override;

 private:
  bool in_region(const std::string& line) const;

  std::unique_ptr<LineIterator> lines_;
  std::optional<Region> region_;
};

/** Region lookup using the tabix index of a BGZF compressed file. */
class TabixRegionIndex : public RegionIndex {
 public:
  /**
   * @param path Path of the BGZF compressed VCF file
   * @param tbx Loaded index of the file
   */
  TabixRegionIndex(const std::string& path, SafeTbx tbx);

  std::unique_ptr<LineIterator> query(const Region& region) override;

  std::unique_ptr<LineIterator> query_all() override;

  bool is_indexed() const override {
    return true;
  }

 private:
  std::string path_;
  SafeTbx tbx_;
};

/**
 * Region lookup without an index: every query re-reads the input from the
 * start and filters by CHROM/POS.
 */
class ScanRegionIndex : public RegionIndex {
 public:
  /** Callback opening a fresh iterator positioned at the start of input. */
  typedef std::function<std::unique_ptr<LineIterator>()> Opener;

  explicit ScanRegionIndex(Opener opener);

  std::unique_ptr<LineIterator> query(const Region& region) override;

  std::unique_ptr<LineIterator> query_all() override;

  bool is_indexed() const override {
    return false;
  }

 private:
  Opener opener_;
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_VCF_REGION_INDEX_H
