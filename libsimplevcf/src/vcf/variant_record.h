/**
 * @file   variant_record.h
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
 * This file declares class VariantRecord, one decoded VCF data line.
 */

#ifndef SIMPLEVCF_VCF_VARIANT_RECORD_H
#define SIMPLEVCF_VCF_VARIANT_RECORD_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "vcf/field_value.h"

namespace simplevcf {
namespace vcf {

class RecordDecoder;

/** Ordered (name, value) pairs as they appear on the data line. */
typedef std::vector<std::pair<std::string, FieldValue>> FieldList;

/** The FORMAT values of one sample on one record. */
class SampleCall {
 public:
  SampleCall() = default;

  /** Sample name, as declared in the column header line. */
  const std::string& name() const {
    return name_;
  }

  /**
   * FORMAT fields in the order of the record's FORMAT column. GT, when
   * present, is included as its allele index sequence.
   */
  const FieldList& fields() const {
    return fields_;
  }

  /** Returns the value of the given FORMAT field, or null if not present. */
  const FieldValue* field(const std::string& key) const;

  /** The decoded GT value, if the record carries a GT field. */
  const std::optional<Genotype>& genotype() const {
    return genotype_;
  }

 private:
  friend class RecordDecoder;

  std::string name_;
  FieldList fields_;
  std::optional<Genotype> genotype_;
};

/**
 * One decoded VCF record. Instances are produced by RecordDecoder and are not
 * modified afterwards; a record holds no references to other records.
 */
class VariantRecord {
 public:
  VariantRecord()
      : pos_(0)
      , line_number_(0) {
  }

  const std::string& chrom() const {
    return chrom_;
  }

  /** 1-based position. */
  int64_t pos() const {
    return pos_;
  }

  /** The ID column verbatim ("." if the record has no identifier). */
  const std::string& id() const {
    return id_;
  }

  const std::string& ref() const {
    return ref_;
  }

  /** Alternate alleles; empty if the ALT column is ".". */
  const std::vector<std::string>& alts() const {
    return alts_;
  }

  /** Phred quality, or nullopt if the QUAL column is ".". */
  const std::optional<double>& qual() const {
    return qual_;
  }

  /** The QUAL column as written, e.g. "30.00" or ".". */
  const std::string& qual_text() const {
    return qual_text_;
  }

  /** Filters in column order; empty if the FILTER column is ".". */
  const std::vector<std::string>& filters() const {
    return filters_;
  }

  /** INFO entries in column order. */
  const FieldList& info() const {
    return info_;
  }

  /** Returns the value of the given INFO entry, or null if not present. */
  const FieldValue* info_value(const std::string& key) const;

  /** Per-sample calls, in header sample order. */
  const std::vector<SampleCall>& samples() const {
    return samples_;
  }

  /** Returns the call of the named sample, or null. */
  const SampleCall* sample(const std::string& name) const;

  /** Line number (or query ordinal) the record was decoded from. */
  uint64_t line_number() const {
    return line_number_;
  }

  /**
   * Re-encodes the fixed fields CHROM, POS, ID, REF, ALT, QUAL and FILTER as
   * tab separated VCF text.
   */
  std::string encode_fixed_fields() const;

 private:
  friend class RecordDecoder;

  std::string chrom_;
  int64_t pos_;
  std::string id_;
  std::string ref_;
  std::vector<std::string> alts_;
  std::optional<double> qual_;
  std::string qual_text_;
  std::vector<std::string> filters_;
  FieldList info_;
  std::vector<SampleCall> samples_;
  uint64_t line_number_;
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_VCF_VARIANT_RECORD_H
