/**
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
 */

#include <stdexcept>

#include "read/table.h"

namespace simplevcf {
namespace vcf {

/* ****************************** */
/*             Table              */
/* ****************************** */

Table::Table(
    std::vector<std::string> column_names,
    std::vector<std::vector<FieldValue>> rows)
    : column_names_(std::move(column_names))
    , rows_(std::move(rows)) {
  for (size_t i = 0; i < column_names_.size(); i++) {
    if (!column_index_.emplace(column_names_[i], i).second)
      throw std::invalid_argument(
          "Cannot create table; duplicate column '" + column_names_[i] + "'");
  }
  for (const auto& r : rows_) {
    if (r.size() != column_names_.size())
      throw std::invalid_argument(
          "Cannot create table; row has " + std::to_string(r.size()) +
          " cells but there are " + std::to_string(column_names_.size()) +
          " columns.");
  }
}

int Table::column_index(const std::string& name) const {
  auto it = column_index_.find(name);
  return it == column_index_.end() ? -1 : static_cast<int>(it->second);
}

const FieldValue& Table::cell(size_t row, const std::string& column) const {
  auto it = column_index_.find(column);
  if (it == column_index_.end())
    throw std::out_of_range("Table has no column '" + column + "'");
  return rows_.at(row)[it->second];
}

const std::vector<FieldValue>& Table::row(size_t i) const {
  return rows_.at(i);
}

/* ****************************** */
/*         TableAssembler         */
/* ****************************** */

TableAssembler::TableAssembler(const std::vector<std::string>& column_order)
    : finalized_(false) {
  for (const auto& name : column_order) {
    if (column_index_.emplace(name, columns_.size()).second)
      columns_.push_back(name);
  }
}

void TableAssembler::add_row(Row row) {
  if (finalized_)
    throw std::logic_error("Cannot add row; table was already finalized.");

  for (const auto& cell : row.cells()) {
    if (column_index_.emplace(cell.first, columns_.size()).second)
      columns_.push_back(cell.first);
  }
  rows_.push_back(std::move(row));
}

Table TableAssembler::finalize() {
  if (finalized_)
    throw std::logic_error("Cannot finalize table; already finalized.");
  finalized_ = true;

  std::vector<std::vector<FieldValue>> rows;
  rows.reserve(rows_.size());
  for (const auto& row : rows_) {
    std::vector<FieldValue> cells(columns_.size());
    for (const auto& cell : row.cells())
      cells[column_index_.at(cell.first)] = cell.second;
    rows.push_back(std::move(cells));
  }
  rows_.clear();

  return Table(columns_, std::move(rows));
}

Table TableAssembler::assemble(
    const std::vector<Row>& rows,
    const std::vector<std::string>& column_order) {
  TableAssembler assembler(column_order);
  for (const auto& row : rows)
    assembler.add_row(row);
  return assembler.finalize();
}

Table schema_table(const std::vector<FieldDescriptor>& fields) {
  std::vector<std::vector<FieldValue>> rows;
  rows.reserve(fields.size());
  for (const auto& f : fields) {
    rows.push_back(
        {FieldValue::scalar(f.name),
         FieldValue::scalar(f.arity.to_str()),
         FieldValue::scalar(value_type_str(f.type)),
         FieldValue::scalar(f.description)});
  }
  return Table({"name", "number", "type", "description"}, std::move(rows));
}

}  // namespace vcf
}  // namespace simplevcf
