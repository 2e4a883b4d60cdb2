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

#include "utils/exceptions.h"
#include "utils/logger_public.h"
#include "vcf/vcf_reader.h"
#include "vcf/vcf_utils.h"

namespace simplevcf {
namespace vcf {

VCFReader::VCFReader()
    : open_(false)
    , num_records_read_(0) {
}

VCFReader::~VCFReader() {
  close();
}

void VCFReader::open(const std::string& file, const std::string& index_file) {
  if (open_)
    close();
  if (file.empty())
    throw std::invalid_argument("Cannot open VCF file; path is empty");

  LOG_DEBUG("Reading VCF header {}", file);
  try {
    SafeHtsFile fh = VCFUtils::open_vcf_file(file);
    HtsLineIterator lines(file);
    load_header(&lines);

    SafeTbx tbx(nullptr, tbx_destroy);
    if (VCFUtils::is_bgzf(fh.get())) {
      tbx = VCFUtils::load_tabix_index(file, index_file);
    } else if (!index_file.empty()) {
      throw IOError(
          "Cannot open VCF file '" + file +
          "' with an index; file is not compressed with BGZF.");
    }

    if (tbx != nullptr) {
      index_ = std::make_unique<TabixRegionIndex>(file, std::move(tbx));
    } else {
      LOG_DEBUG("No index for {}; region queries will scan the file", file);
      index_ = std::make_unique<ScanRegionIndex>([file]() {
        return std::unique_ptr<LineIterator>(
            std::make_unique<HtsLineIterator>(file));
      });
    }
  } catch (const std::exception&) {
    close();
    throw;
  }

  path_ = file;
  index_path_ = index_file;
  open_ = true;
  LOG_INFO(
      "Opened VCF {} with {} samples ({})",
      file,
      header_->sample_names().size(),
      index_->is_indexed() ? "indexed" : "not indexed");
}

void VCFReader::open_text(const std::string& vcf_text) {
  if (open_)
    close();

  auto text = std::make_shared<const std::string>(vcf_text);
  MemoryLineIterator lines(text);
  try {
    load_header(&lines);
  } catch (const std::exception&) {
    close();
    throw;
  }

  index_ = std::make_unique<ScanRegionIndex>([text]() {
    return std::unique_ptr<LineIterator>(
        std::make_unique<MemoryLineIterator>(text));
  });
  text_ = text;
  open_ = true;
}

void VCFReader::load_header(LineIterator* lines) {
  header_ =
      std::make_unique<VCFHeader>(VCFHeader::parse(read_header_text(lines)));
  decoder_ = std::make_unique<RecordDecoder>(header_.get(), decode_options_);
}

void VCFReader::close() {
  iter_.reset();
  index_.reset();
  decoder_.reset();
  header_.reset();
  text_.reset();

  open_ = false;
  num_records_read_ = 0;
  path_.clear();
  index_path_.clear();
}

bool VCFReader::is_open() const {
  return open_;
}

bool VCFReader::is_indexed() const {
  return index_ != nullptr && index_->is_indexed();
}

const std::string& VCFReader::path() const {
  return path_;
}

const VCFHeader& VCFReader::header() const {
  check_open();
  return *header_;
}

void VCFReader::set_decode_options(const DecodeOptions& options) {
  decode_options_ = options;
  if (header_ != nullptr)
    decoder_ = std::make_unique<RecordDecoder>(header_.get(), decode_options_);
}

void VCFReader::seek(const Region& region) {
  check_open();
  iter_.reset();
  iter_ = index_->query(region);
}

void VCFReader::seek(const std::string& region_str) {
  seek(Region::parse_region(region_str));
}

void VCFReader::seek_all() {
  check_open();
  iter_.reset();
  iter_ = index_->query_all();
}

bool VCFReader::next(VariantRecord* record) {
  if (!open_ || iter_ == nullptr)
    return false;

  std::string line;
  uint64_t line_number = 0;
  try {
    if (!iter_->next(&line, &line_number)) {
      iter_.reset();
      return false;
    }
    *record = decoder_->decode(line, line_number);
  } catch (const std::exception& e) {
    LOG_DEBUG("Ending iteration after error: {}", e.what());
    iter_.reset();
    throw;
  }

  num_records_read_++;
  return true;
}

uint64_t VCFReader::num_records_read() const {
  return num_records_read_;
}

void VCFReader::check_open() const {
  if (!open_)
    throw std::runtime_error("Cannot access VCF file; file is not open.");
}

}  // namespace vcf
}  // namespace simplevcf
