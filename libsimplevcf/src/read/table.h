/**
 * @file   table.h
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
 * This file declares class Table and class TableAssembler, which pads
 * projected rows to a common, ordered column set.
 */

#ifndef SIMPLEVCF_READ_TABLE_H
#define SIMPLEVCF_READ_TABLE_H

#include <string>
#include <unordered_map>
#include <vector>

#include "read/projection.h"
#include "vcf/field_descriptor.h"
#include "vcf/field_value.h"

namespace simplevcf {
namespace vcf {

/**
 * Rows of equal width under an ordered set of unique column names. A cell
 * that no source row supplied holds FieldValue::absent().
 */
class Table {
 public:
  Table() = default;

  Table(
      std::vector<std::string> column_names,
      std::vector<std::vector<FieldValue>> rows);

  const std::vector<std::string>& column_names() const {
    return column_names_;
  }

  size_t num_columns() const {
    return column_names_.size();
  }

  size_t num_rows() const {
    return rows_.size();
  }

  /** Returns the index of the column, or -1 if there is no such column. */
  int column_index(const std::string& name) const;

  /**
   * Returns one cell.
   *
   * @throws std::out_of_range if the row or column does not exist
   */
  const FieldValue& cell(size_t row, const std::string& column) const;

  /**
   * Returns the cells of one row, in column order.
   *
   * @throws std::out_of_range if the row does not exist
   */
  const std::vector<FieldValue>& row(size_t i) const;

 private:
  std::vector<std::string> column_names_;
  std::unordered_map<std::string, size_t> column_index_;
  std::vector<std::vector<FieldValue>> rows_;
};

/**
 * Assembles rows into a Table in two phases. add_row() buffers rows and
 * collects the union of their keys; finalize() fixes the column set as the
 * given column order followed by any other key in first-seen order, and pads
 * every row with nulls. The assembler cannot be reused after finalize().
 */
class TableAssembler {
 public:
  explicit TableAssembler(const std::vector<std::string>& column_order);

  /**
   * Buffers a row.
   *
   * @throws std::logic_error if called after finalize()
   */
  void add_row(Row row);

  /** Number of rows buffered so far. */
  size_t num_rows() const {
    return rows_.size();
  }

  /**
   * Builds the table.
   *
   * @throws std::logic_error if called twice
   */
  Table finalize();

  /** Assembles the given rows in one step. */
  static Table assemble(
      const std::vector<Row>& rows,
      const std::vector<std::string>& column_order);

 private:
  std::vector<std::string> columns_;
  std::unordered_map<std::string, size_t> column_index_;
  std::vector<Row> rows_;
  bool finalized_;
};

/**
 * Builds the {name, number, type, description} schema table of a list of
 * field declarations, one row per field in declaration order.
 */
Table schema_table(const std::vector<FieldDescriptor>& fields);

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_READ_TABLE_H
