/**
 * @file   vcf_reader.h
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
 * This file declares class VCFReader, which opens a VCF file or text and
 * iterates over its records, optionally restricted to a region.
 */

#ifndef SIMPLEVCF_VCF_VCF_READER_H
#define SIMPLEVCF_VCF_VCF_READER_H

#include <memory>
#include <string>

#include "vcf/header.h"
#include "vcf/line_source.h"
#include "vcf/record_decoder.h"
#include "vcf/region.h"
#include "vcf/region_index.h"
#include "vcf/variant_record.h"

namespace simplevcf {
namespace vcf {

/**
 * Class wrapping a VCF file to allow iteration over records.
 *
 * Only one iteration is active at a time: starting a new one with seek() or
 * seek_all() invalidates the previous one. A decoding error ends the active
 * iteration.
 */
class VCFReader {
 public:
  VCFReader();
  ~VCFReader();

  VCFReader(VCFReader&& other) = delete;
  VCFReader(const VCFReader&) = delete;
  VCFReader& operator=(const VCFReader&) = delete;
  VCFReader& operator=(VCFReader&&) = delete;

  /**
   * Opens the specified VCF file and loads the header. Plain, gzip and BGZF
   * compressed files are accepted. If the file is BGZF compressed and a tabix
   * index is found, region queries use the index; otherwise they scan.
   *
   * @param file Path to VCF file.
   * @param index_file Path to tabix index file. If empty, the index is looked
   *   up automatically and its absence is not an error.
   * @throws IOError, MalformedHeaderError
   */
  void open(const std::string& file, const std::string& index_file = "");

  /**
   * Opens VCF text held in memory.
   *
   * @throws IOError, MalformedHeaderError
   */
  void open_text(const std::string& vcf_text);

  /** Closes the VCF file and invalidates the iterator. */
  void close();

  /** Returns true if the file is open. */
  bool is_open() const;

  /** Returns true if region queries are answered from a tabix index. */
  bool is_indexed() const;

  /** Returns the path of the open file (empty for in-memory text). */
  const std::string& path() const;

  /**
   * Returns the parsed header.
   *
   * @throws std::runtime_error if not open
   */
  const VCFHeader& header() const;

  /** Sets the decoding options used for subsequent iterations. */
  void set_decode_options(const DecodeOptions& options);

  /**
   * Starts iteration over the records whose POS lies within the region.
   *
   * @throws std::runtime_error if not open
   */
  void seek(const Region& region);

  /**
   * Parses the 1-based region string and starts iteration over it.
   *
   * @throws RegionSyntaxError if the region string is invalid
   */
  void seek(const std::string& region_str);

  /** Starts iteration over all records of the file. */
  void seek_all();

  /**
   * Decodes the next record of the active iteration.
   *
   * @param record Set to the decoded record
   * @return False once the iteration is exhausted (or none is active)
   * @throws MalformedRecordError, IOError
   */
  bool next(VariantRecord* record);

  /** Number of records returned since the file was opened. */
  uint64_t num_records_read() const;

 private:
  /** Parses the header from the given line source and sets up decoding. */
  void load_header(LineIterator* lines);

  void check_open() const;

  bool open_;
  std::string path_;
  std::string index_path_;

  /** In-memory text, when opened with open_text(). */
  std::shared_ptr<const std::string> text_;

  std::unique_ptr<VCFHeader> header_;
  std::unique_ptr<RegionIndex> index_;
  std::unique_ptr<RecordDecoder> decoder_;
  DecodeOptions decode_options_;

  /** Active iteration. */
  std::unique_ptr<LineIterator> iter_;

  uint64_t num_records_read_;
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_VCF_VCF_READER_H
