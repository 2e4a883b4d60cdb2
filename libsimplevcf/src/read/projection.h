/**
 * @file   projection.h
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
 * This file declares class FieldProjector, which flattens decoded records into
 * rows of named cells.
 */

#ifndef SIMPLEVCF_READ_PROJECTION_H
#define SIMPLEVCF_READ_PROJECTION_H

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "vcf/field_value.h"
#include "vcf/header.h"
#include "vcf/variant_record.h"

namespace simplevcf {
namespace vcf {

/** Names of the fixed columns, emitted first in every row. */
extern const std::vector<std::string> FIXED_FIELD_COLUMNS;

/**
 * A selection of names: either everything declared in the header, or an
 * explicit ordered list (possibly empty).
 */
class FieldSelection {
 public:
  /** Constructs a selection of everything. */
  FieldSelection()
      : all_(true) {
  }

  static FieldSelection all() {
    return FieldSelection();
  }

  static FieldSelection only(const std::vector<std::string>& names);

  bool is_all() const {
    return all_;
  }

  /** The explicit names, in request order. Empty if is_all(). */
  const std::vector<std::string>& names() const {
    return names_;
  }

  /** True if the name is selected. */
  bool contains(const std::string& name) const;

 private:
  bool all_;
  std::vector<std::string> names_;
};

/** Which INFO fields, samples and sample fields to project. */
struct ProjectionRequest {
  ProjectionRequest()
      : include_unspecified(false)
      , strict(false) {
  }

  FieldSelection info_fields;
  FieldSelection sample_fields;
  FieldSelection samples;

  /** Also emit entries that are not selected above. */
  bool include_unspecified;

  /** Throw UnknownFieldError for selected names the header does not declare. */
  bool strict;
};

/** Insertion-ordered mapping of column name to cell value. */
class Row {
 public:
  /** Sets the cell, replacing any previous value of the column. */
  void set(const std::string& column, FieldValue value);

  /** Returns the cell of the column, or null if the row lacks it. */
  const FieldValue* get(const std::string& column) const;

  bool contains(const std::string& column) const {
    return index_.count(column) > 0;
  }

  const std::vector<std::pair<std::string, FieldValue>>& cells() const {
    return cells_;
  }

  size_t size() const {
    return cells_.size();
  }

 private:
  std::vector<std::pair<std::string, FieldValue>> cells_;
  std::unordered_map<std::string, size_t> index_;
};

/**
 * Maps a VariantRecord to a flat Row according to a ProjectionRequest.
 *
 * Fixed columns are always present. INFO entries are emitted under their own
 * name, sample entries as "<sample>.<field>"; the GT of a selected sample is
 * always emitted as "<sample>.GT" together with "<sample>.phased". Entries a
 * record does not carry are left out of its row; TableAssembler fills them
 * with nulls.
 */
class FieldProjector {
 public:
  /**
   * @param header Header the records were decoded against. Not owned; must
   *     outlive the projector.
   * @param request Projection request
   * @throws UnknownFieldError in strict mode, if a selected INFO field, FORMAT
   *     field or sample is not declared in the header
   */
  FieldProjector(const VCFHeader* header, const ProjectionRequest& request);

  /** Flattens one record. */
  Row project(const VariantRecord& record) const;

  /**
   * The canonical column layout: fixed columns, INFO fields, then for each
   * sample "<s>.phased", "<s>.GT" and the sample fields. Columns that only
   * undeclared keys produce are not included.
   */
  const std::vector<std::string>& column_order() const {
    return column_order_;
  }

  /** Column name of a sample field. */
  static std::string sample_column(
      const std::string& sample, const std::string& field);

 private:
  /** Checks selected names against the header. */
  void validate() const;

  void build_column_order();

  /** Resolves a selection against the header's names, in output order. */
  std::vector<std::string> resolve(
      const FieldSelection& selection,
      const std::vector<std::string>& declared) const;

  bool info_selected(const std::string& name) const;

  bool sample_selected(const std::string& name) const;

  bool sample_field_selected(const std::string& name) const;

  const VCFHeader* header_;
  ProjectionRequest request_;
  std::vector<std::string> column_order_;
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_READ_PROJECTION_H
