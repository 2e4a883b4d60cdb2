/**
 * @file   reader.h
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
 * This file declares class Reader, which reads a VCF file into a Table
 * according to a set of ReadParams.
 */

#ifndef SIMPLEVCF_READER_H
#define SIMPLEVCF_READER_H

#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "read/projection.h"
#include "read/table.h"
#include "vcf/vcf_reader.h"

namespace simplevcf {
namespace vcf {

/** Arguments/params for reading a VCF file. */
struct ReadParams {
  // Input:
  std::string uri;
  std::string index_uri;

  // Logging:
  std::string log_level;
  std::string log_file;

  // 1-based region string; empty reads all records.
  std::string region;

  // Selections. Unset means every name declared in the header.
  std::optional<std::vector<std::string>> info_fields;
  std::optional<std::vector<std::string>> sample_fields;
  std::optional<std::vector<std::string>> samples;

  bool include_unspecified = false;
  bool strict_fields = false;
  bool allow_truncated_samples = false;
  uint64_t max_num_records = std::numeric_limits<uint64_t>::max();

  // TSV output path; empty writes to stdout.
  std::string output_path;
};

/**
 * The Reader class is the main interface to reading tables from a VCF file.
 */
class Reader {
 public:
  /** Constructor. */
  Reader();

  /** Destructor. */
  ~Reader();

  /**
   * Set all the params at once. Applies the log level and log file if set.
   */
  void set_all_params(const ReadParams& params);

  /** Sets the region string. */
  void set_region(const std::string& region);

  /** Sets the INFO field selection from a CSV list. */
  void set_info_fields(const std::string& fields);

  /** Sets the FORMAT field selection from a CSV list. */
  void set_sample_fields(const std::string& fields);

  /** Sets the sample selection from a CSV list. */
  void set_samples(const std::string& samples);

  void set_include_unspecified(bool include_unspecified);

  void set_strict_fields(bool strict);

  void set_max_num_records(uint64_t max_num_records);

  /**
   * Opens the VCF file given by params().uri.
   *
   * @throws IOError, MalformedHeaderError
   */
  void open();

  /** Opens VCF text held in memory. */
  void open_text(const std::string& vcf_text);

  /** Closes the file. */
  void close();

  /**
   * Reads the records selected by the region into a table, projected
   * according to the field and sample selections.
   *
   * @throws RegionSyntaxError, UnknownFieldError, MalformedRecordError,
   *     IOError
   */
  Table read();

  /** Reads and writes the table as TSV to params().output_path. */
  void export_tsv();

  /** Returns the {name, number, type, description} table of INFO fields. */
  Table read_info_schema() const;

  /** Returns the {name, number, type, description} table of FORMAT fields. */
  Table read_sample_schema() const;

  /** Header of the open file. */
  const VCFHeader& header() const;

  /** Number of records read by the last call to read(). */
  uint64_t num_records_read() const;

  const ReadParams& params() const {
    return params_;
  }

 private:
  /** Translates the params into a projection request. */
  ProjectionRequest projection_request() const;

  void check_open() const;

  ReadParams params_;
  std::unique_ptr<VCFReader> vcf_;
  uint64_t num_records_read_;
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_READER_H
