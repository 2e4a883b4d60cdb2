/**
 * @file   tsv_exporter.h
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
 * This file declares class TSVExporter, which writes tables as tab separated
 * text.
 */

#ifndef SIMPLEVCF_TSV_EXPORTER_H
#define SIMPLEVCF_TSV_EXPORTER_H

#include <fstream>
#include <ostream>
#include <string>

#include "read/table.h"

namespace simplevcf {
namespace vcf {

/**
 * Export to TSV: one header line with the column names, then one line per
 * row. Null cells are written as ".", sequences comma separated. Note this
 * class is not threadsafe.
 */
class TSVExporter {
 public:
  /**
   * @param output_file Path of the file to write. If empty, output goes to
   *     stdout.
   */
  explicit TSVExporter(const std::string& output_file);

  /** Writes to the given stream, which must outlive the exporter. */
  explicit TSVExporter(std::ostream* os);

  ~TSVExporter();

  TSVExporter(const TSVExporter&) = delete;
  TSVExporter& operator=(const TSVExporter&) = delete;

  /**
   * Writes the table.
   *
   * @throws IOError if the output file cannot be opened or written
   */
  void export_table(const Table& table);

  /** Flushes and closes the output. */
  void close();

  /** Renders one cell. */
  static std::string cell_to_str(const FieldValue& value);

 private:
  bool output_initialized_;
  std::string output_file_;
  std::ofstream os_;
  std::ostream* custom_os_;

  void init_output_stream();

  std::ostream& stream();
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_TSV_EXPORTER_H
