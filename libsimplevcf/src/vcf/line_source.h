/**
 * @file   line_source.h
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
 * Sequential sources of VCF text lines: files read through htslib and in-
 * memory text.
 */

#ifndef SIMPLEVCF_VCF_LINE_SOURCE_H
#define SIMPLEVCF_VCF_LINE_SOURCE_H

#include <htslib/kstring.h>

#include <cstdint>
#include <memory>
#include <string>

#include "vcf/region.h"
#include "vcf/vcf_utils.h"

namespace simplevcf {
namespace vcf {

/**
 * Abstract forward iterator over text lines. Implementations own whatever
 * handles they read from and release them on destruction.
 */
class LineIterator {
 public:
  virtual ~LineIterator() = default;

  /**
   * Reads the next line, without its line terminator.
   *
   * @param line Set to the line contents
   * @param line_number Set to the number reported for the line in errors
   * @return False once the source is exhausted
   * @throws IOError on a read failure
   */
  virtual bool next(std::string* line, uint64_t* line_number) = 0;
};

/** Lines of a plain, gzip or BGZF compressed file, read with hts_getline. */
class HtsLineIterator : public LineIterator {
 public:
  explicit HtsLineIterator(const std::string& path);

  ~HtsLineIterator();

  HtsLineIterator(const HtsLineIterator&) = delete;
  HtsLineIterator& operator=(const HtsLineIterator&) = delete;

  bool next(std::string* line, uint64_t* line_number) override;

 private:
  std::string path_;
  SafeHtsFile fh_;
  kstring_t buffer_;
  uint64_t line_number_;
};

/** Lines of a string held in memory. */
class MemoryLineIterator : public LineIterator {
 public:
  explicit MemoryLineIterator(std::shared_ptr<const std::string> text);

  bool next(std::string* line, uint64_t* line_number) override;

 private:
  std::shared_ptr<const std::string> text_;
  size_t offset_;
  uint64_t line_number_;
};

/**
 * Lines returned by a tabix region query. Line numbers are the ordinal of
 * the line within the query, starting at 1, since tabix does not track file
 * line numbers.
 */
class TabixLineIterator : public LineIterator {
 public:
  /**
   * @param path Path of the BGZF compressed file
   * @param tbx Index of the file. Not owned; must outlive the iterator.
   * @param region Region to query
   */
  TabixLineIterator(
      const std::string& path, tbx_t* tbx, const Region& region);

  ~TabixLineIterator();

  TabixLineIterator(const TabixLineIterator&) = delete;
  TabixLineIterator& operator=(const TabixLineIterator&) = delete;

  bool next(std::string* line, uint64_t* line_number) override;

 private:
  std::string path_;
  SafeHtsFile fh_;
  tbx_t* tbx_;
  SafeHtsItr itr_;
  kstring_t buffer_;
  uint64_t ordinal_;
};

/**
 * Reads the header from the start of a line source: all leading lines that
 * begin with '#', newline-joined. The first data line is consumed.
 *
 * @throws IOError if the source fails or contains no header lines
 */
std::string read_header_text(LineIterator* lines);

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_VCF_LINE_SOURCE_H
