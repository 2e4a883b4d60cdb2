/**
 * @file   header.h
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
 * This file declares class VCFHeader, the parsed schema of a VCF file.
 */

#ifndef SIMPLEVCF_VCF_HEADER_H
#define SIMPLEVCF_VCF_HEADER_H

#include <map>
#include <string>
#include <vector>

#include "vcf/field_descriptor.h"

namespace simplevcf {
namespace vcf {

/**
 * Parsed VCF header: the declared INFO and FORMAT fields (in declaration
 * order), the sample names from the column header line, and the contig and
 * FILTER declarations.
 *
 * Instances are created once when a file is opened and are immutable
 * thereafter.
 */
class VCFHeader {
 public:
  /** Names of the eight mandatory columns of the column header line. */
  static const std::vector<std::string> FIXED_COLUMNS;

  VCFHeader() = default;

  /**
   * Parses the raw header text: every "##" meta-information line followed by
   * the "#CHROM" column header line, newline separated.
   *
   * @param raw_header_text Header text
   * @return Parsed header
   * @throws MalformedHeaderError if an INFO/FORMAT line lacks ID, Number or
   *     Type, declares an unknown Type or Number, or if the column header
   *     line is missing or invalid.
   */
  static VCFHeader parse(const std::string& raw_header_text);

  /** INFO declarations in header order. */
  const std::vector<FieldDescriptor>& info_fields() const {
    return info_fields_;
  }

  /** FORMAT declarations in header order. */
  const std::vector<FieldDescriptor>& format_fields() const {
    return format_fields_;
  }

  /** Sample names in column order. */
  const std::vector<std::string>& sample_names() const {
    return sample_names_;
  }

  /** Contig IDs in declaration order. */
  const std::vector<std::string>& contigs() const {
    return contigs_;
  }

  /** FILTER IDs in declaration order. */
  const std::vector<std::string>& filters() const {
    return filters_;
  }

  /** Value of the ##fileformat line, or empty if absent. */
  const std::string& file_format() const {
    return file_format_;
  }

  /** The raw header text this instance was parsed from. */
  const std::string& raw_text() const {
    return raw_text_;
  }

  /** Returns the INFO declaration with the given ID, or null. */
  const FieldDescriptor* info_field(const std::string& name) const;

  /** Returns the FORMAT declaration with the given ID, or null. */
  const FieldDescriptor* format_field(const std::string& name) const;

  /** Returns the column index of the sample, or -1 if unknown. */
  int sample_index(const std::string& name) const;

  /** True if the header declares a FORMAT GT field. */
  bool has_genotypes() const {
    return format_field("GT") != nullptr;
  }

 private:
  /**
   * Parses the attribute list of a structured meta line, e.g. the text
   * between '<' and '>' of ##INFO=<ID=DP,Number=1,...>. Values may be quoted;
   * quoted values may contain ',', '=' and backslash-escaped quotes.
   */
  static std::map<std::string, std::string> parse_structured_line(
      const std::string& body, uint64_t line_number);

  /** Builds a field descriptor from the attributes of an INFO/FORMAT line. */
  static FieldDescriptor parse_field_descriptor(
      const std::string& section,
      const std::map<std::string, std::string>& attrs,
      uint64_t line_number);

  /** Parses the "#CHROM ..." column header line. */
  void parse_column_header(const std::string& line, uint64_t line_number);

  /** Appends a declaration unless the same ID was already declared. */
  static void add_field(
      const std::string& section,
      FieldDescriptor&& field,
      std::vector<FieldDescriptor>* fields,
      std::map<std::string, size_t>* index);

  std::vector<FieldDescriptor> info_fields_;
  std::vector<FieldDescriptor> format_fields_;
  std::map<std::string, size_t> info_index_;
  std::map<std::string, size_t> format_index_;
  std::vector<std::string> sample_names_;
  std::map<std::string, int> sample_index_;
  std::vector<std::string> contigs_;
  std::vector<std::string> filters_;
  std::string file_format_;
  std::string raw_text_;
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_VCF_HEADER_H
