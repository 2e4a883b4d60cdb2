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

#include <cerrno>
#include <cstring>
#include <iostream>

#include "read/tsv_exporter.h"
#include "utils/exceptions.h"
#include "utils/logger_public.h"

namespace simplevcf {
namespace vcf {

TSVExporter::TSVExporter(const std::string& output_file)
    : output_initialized_(false)
    , output_file_(output_file)
    , custom_os_(nullptr) {
}

TSVExporter::TSVExporter(std::ostream* os)
    : output_initialized_(false)
    , custom_os_(os) {
  if (custom_os_ == nullptr)
    throw std::invalid_argument("Cannot create TSV exporter; null stream.");
}

TSVExporter::~TSVExporter() {
  close();
}

void TSVExporter::export_table(const Table& table) {
  init_output_stream();
  std::ostream& os = stream();

  const auto& columns = table.column_names();
  for (size_t i = 0; i < columns.size(); i++) {
    if (i > 0)
      os << '\t';
    os << columns[i];
  }
  os << '\n';

  for (size_t r = 0; r < table.num_rows(); r++) {
    const auto& cells = table.row(r);
    for (size_t i = 0; i < cells.size(); i++) {
      if (i > 0)
        os << '\t';
      os << cell_to_str(cells[i]);
    }
    os << '\n';
  }

  if (!os.good())
    throw IOError(
        "Error writing TSV output" +
        (output_file_.empty() ? std::string() : " '" + output_file_ + "'"));
  LOG_DEBUG(
      "Exported {} rows x {} columns",
      table.num_rows(),
      table.num_columns());
}

void TSVExporter::close() {
  if (custom_os_ != nullptr) {
    custom_os_->flush();
  } else if (output_file_.empty()) {
    std::cout.flush();
  } else if (os_.is_open()) {
    os_.flush();
    os_.close();
  }
}

std::string TSVExporter::cell_to_str(const FieldValue& value) {
  return value.to_str(',');
}

void TSVExporter::init_output_stream() {
  if (output_initialized_)
    return;

  if (custom_os_ == nullptr && !output_file_.empty()) {
    os_.open(output_file_.c_str());
    if (!os_.good() || os_.fail() || os_.bad()) {
      const char* err_c_str = strerror(errno);
      throw IOError(
          "Error opening output file '" + output_file_ + "'; " +
          std::string(err_c_str));
    }
  }
  output_initialized_ = true;
}

std::ostream& TSVExporter::stream() {
  if (custom_os_ != nullptr)
    return *custom_os_;
  return output_file_.empty() ? std::cout : os_;
}

}  // namespace vcf
}  // namespace simplevcf
