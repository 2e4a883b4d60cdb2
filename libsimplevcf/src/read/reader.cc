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

#include <chrono>

#include "read/reader.h"
#include "read/tsv_exporter.h"
#include "utils/logger_public.h"
#include "utils/utils.h"

namespace simplevcf {
namespace vcf {

Reader::Reader()
    : vcf_(std::make_unique<VCFReader>())
    , num_records_read_(0) {
}

Reader::~Reader() {
  close();
}

void Reader::set_all_params(const ReadParams& params) {
  params_ = params;
  if (!params_.log_level.empty())
    LOG_SET_LEVEL(params_.log_level);
  if (!params_.log_file.empty())
    LOG_SET_FILE(params_.log_file);
}

void Reader::set_region(const std::string& region) {
  params_.region = region;
}

void Reader::set_info_fields(const std::string& fields) {
  params_.info_fields = utils::split(fields, ",");
}

void Reader::set_sample_fields(const std::string& fields) {
  params_.sample_fields = utils::split(fields, ",");
}

void Reader::set_samples(const std::string& samples) {
  params_.samples = utils::split(samples, ",");
}

void Reader::set_include_unspecified(bool include_unspecified) {
  params_.include_unspecified = include_unspecified;
}

void Reader::set_strict_fields(bool strict) {
  params_.strict_fields = strict;
}

void Reader::set_max_num_records(uint64_t max_num_records) {
  params_.max_num_records = max_num_records;
}

void Reader::open() {
  vcf_->open(params_.uri, params_.index_uri);
}

void Reader::open_text(const std::string& vcf_text) {
  vcf_->open_text(vcf_text);
}

void Reader::close() {
  vcf_->close();
}

Table Reader::read() {
  check_open();
  num_records_read_ = 0;

  DecodeOptions options;
  options.allow_truncated_samples = params_.allow_truncated_samples;
  vcf_->set_decode_options(options);

  FieldProjector projector(&vcf_->header(), projection_request());
  TableAssembler assembler(projector.column_order());

  if (params_.region.empty())
    vcf_->seek_all();
  else
    vcf_->seek(params_.region);

  auto start = std::chrono::steady_clock::now();
  VariantRecord record;
  while (num_records_read_ < params_.max_num_records && vcf_->next(&record)) {
    assembler.add_row(projector.project(record));
    num_records_read_++;
  }

  Table table = assembler.finalize();
  LOG_INFO(
      "Read {} records ({} columns) in {:.3f} sec",
      num_records_read_,
      table.num_columns(),
      utils::chrono_duration(start));
  return table;
}

void Reader::export_tsv() {
  Table table = read();
  TSVExporter exporter(params_.output_path);
  exporter.export_table(table);
  exporter.close();
}

Table Reader::read_info_schema() const {
  check_open();
  return schema_table(vcf_->header().info_fields());
}

Table Reader::read_sample_schema() const {
  check_open();
  return schema_table(vcf_->header().format_fields());
}

const VCFHeader& Reader::header() const {
  check_open();
  return vcf_->header();
}

uint64_t Reader::num_records_read() const {
  return num_records_read_;
}

ProjectionRequest Reader::projection_request() const {
  ProjectionRequest request;
  if (params_.info_fields)
    request.info_fields = FieldSelection::only(*params_.info_fields);
  if (params_.sample_fields)
    request.sample_fields = FieldSelection::only(*params_.sample_fields);
  if (params_.samples)
    request.samples = FieldSelection::only(*params_.samples);
  request.include_unspecified = params_.include_unspecified;
  request.strict = params_.strict_fields;
  return request;
}

void Reader::check_open() const {
  if (!vcf_->is_open())
    throw std::runtime_error("Cannot read VCF; file is not open.");
}

}  // namespace vcf
}  // namespace simplevcf
