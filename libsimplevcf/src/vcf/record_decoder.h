/**
 * @file   record_decoder.h
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
 * This file declares class RecordDecoder, which turns one VCF data line into a
 * VariantRecord.
 */

#ifndef SIMPLEVCF_VCF_RECORD_DECODER_H
#define SIMPLEVCF_VCF_RECORD_DECODER_H

#include <cstdint>
#include <set>
#include <string>

#include "vcf/field_descriptor.h"
#include "vcf/field_value.h"
#include "vcf/header.h"
#include "vcf/variant_record.h"

namespace simplevcf {
namespace vcf {

/** Options controlling how strictly data lines are decoded. */
struct DecodeOptions {
  /**
   * If true, a sample column may carry fewer values than there are FORMAT
   * keys; the missing trailing values decode as absent. A sample column that
   * is a lone "." is always accepted.
   */
  bool allow_truncated_samples = false;
};

/**
 * Decodes VCF data lines against a header.
 *
 * Values are typed according to their INFO/FORMAT declaration. Keys that the
 * header does not declare decode as strings (or as a Flag when the INFO
 * entry has no value) and are reported once per key at warning level.
 */
class RecordDecoder {
 public:
  /**
   * @param header Header to decode against. Not owned; must outlive the
   *     decoder.
   * @param options Decoding options
   */
  explicit RecordDecoder(
      const VCFHeader* header, const DecodeOptions& options = DecodeOptions());

  /**
   * Decodes one tab separated data line.
   *
   * @param line Data line, without line terminator
   * @param line_number Number reported in errors and stored on the record
   * @return Decoded record
   * @throws MalformedRecordError if the line has the wrong number of columns,
   *     a non-numeric POS or QUAL, a value that does not match its declared
   *     type, or a sample column with more values than FORMAT keys.
   */
  VariantRecord decode(const std::string& line, uint64_t line_number);

  const DecodeOptions& options() const {
    return options_;
  }

 private:
  void decode_info(
      const std::string& column, uint64_t line_number, VariantRecord* rec);

  void decode_samples(
      const std::vector<std::string>& columns,
      uint64_t line_number,
      VariantRecord* rec);

  /**
   * Decodes a raw value according to its declaration. A whole-value "."
   * decodes as absent, a "." list element as a null element.
   */
  FieldValue decode_value(
      const FieldDescriptor& desc,
      const std::string& raw,
      uint64_t line_number) const;

  /** Converts one list element to the declared type. */
  Scalar decode_scalar(
      const FieldDescriptor& desc,
      const std::string& raw,
      uint64_t line_number) const;

  /**
   * Parses a GT value such as "0/1", "1|0", "./." or "2".
   *
   * @throws MalformedRecordError if an allele is not "." or a non-negative
   *     integer.
   */
  Genotype decode_genotype(const std::string& raw, uint64_t line_number) const;

  /** Returns the declaration for an INFO key, synthesizing one if needed. */
  FieldDescriptor info_descriptor(const std::string& key, bool has_value);

  /** Returns the declaration for a FORMAT key, synthesizing one if needed. */
  FieldDescriptor format_descriptor(const std::string& key);

  /** Logs an undeclared key the first time it is seen. */
  void warn_undeclared(const std::string& section, const std::string& key);

  const VCFHeader* header_;
  DecodeOptions options_;
  std::set<std::string> undeclared_;
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_VCF_RECORD_DECODER_H
