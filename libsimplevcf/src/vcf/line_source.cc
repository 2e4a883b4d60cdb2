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

#include <htslib/hts.h>
#include <htslib/tbx.h>

#include <cstdlib>

#include "utils/exceptions.h"
#include "utils/logger_public.h"
#include "vcf/line_source.h"

namespace simplevcf {
namespace vcf {

namespace {
void strip_cr(std::string* line) {
  if (!line->empty() && line->back() == '\r')
    line->pop_back();
}
}  // namespace

HtsLineIterator::HtsLineIterator(const std::string& path)
    : path_(path)
    , fh_(VCFUtils::open_vcf_file(path))
    , buffer_{0, 0, nullptr}
    , line_number_(0) {
}

HtsLineIterator::~HtsLineIterator() {
  free(buffer_.s);
}

bool HtsLineIterator::next(std::string* line, uint64_t* line_number) {
  int ret = hts_getline(fh_.get(), KS_SEP_LINE, &buffer_);
  if (ret == -1)
    return false;
  if (ret < -1)
    throw IOError(
        "Error reading from VCF file '" + path_ + "' after line " +
        std::to_string(line_number_) + "; hts_getline failed.");

  *line = std::string(buffer_.s, buffer_.l);
  strip_cr(line);
  *line_number = ++line_number_;
  return true;
}

MemoryLineIterator::MemoryLineIterator(std::shared_ptr<const std::string> text)
    : text_(std::move(text))
    , offset_(0)
    , line_number_(0) {
}

bool MemoryLineIterator::next(std::string* line, uint64_t* line_number) {
  const std::string& text = *text_;
  if (offset_ >= text.size())
    return false;

  size_t end = text.find('\n', offset_);
  if (end == std::string::npos)
    end = text.size();
  *line = text.substr(offset_, end - offset_);
  strip_cr(line);
  offset_ = end + 1;
  *line_number = ++line_number_;
  return true;
}

TabixLineIterator::TabixLineIterator(
    const std::string& path, tbx_t* tbx, const Region& region)
    : path_(path)
    , fh_(VCFUtils::open_vcf_file(path))
    , tbx_(tbx)
    , itr_(nullptr, hts_itr_destroy)
    , buffer_{0, 0, nullptr}
    , ordinal_(0) {
  if (!VCFUtils::is_bgzf(fh_.get()))
    throw IOError(
        "Cannot query VCF file '" + path_ +
        "' with its index; file is not compressed with BGZF.");

  int tid = tbx_name2id(tbx_, region.seq_name.c_str());
  if (tid < 0) {
    LOG_DEBUG(
        "Contig '{}' not present in index of {}; query is empty",
        region.seq_name,
        path_);
    return;
  }

  // tbx_itr_queryi takes a 0-based, half-open interval.
  itr_.reset(tbx_itr_queryi(
      tbx_,
      tid,
      static_cast<hts_pos_t>(region.min),
      static_cast<hts_pos_t>(region.max) + 1));
  if (itr_ == nullptr)
    throw IOError(
        "Error querying region " + region.to_str() + " of VCF file '" +
        path_ + "'; tbx_itr_queryi failed.");
}

TabixLineIterator::~TabixLineIterator() {
  free(buffer_.s);
}

bool TabixLineIterator::next(std::string* line, uint64_t* line_number) {
  if (itr_ == nullptr)
    return false;

  int ret = tbx_itr_next(
      fh_.get(), tbx_, itr_.get(), &buffer_);
  if (ret == -1)
    return false;
  if (ret < -1)
    throw IOError(
        "Error reading from VCF file '" + path_ + "'; tbx_itr_next failed.");

  *line = std::string(buffer_.s, buffer_.l);
  strip_cr(line);
  *line_number = ++ordinal_;
  return true;
}

std::string read_header_text(LineIterator* lines) {
  std::string header;
  std::string line;
  uint64_t line_number = 0;
  while (lines->next(&line, &line_number)) {
    if (line.empty() || line[0] != '#')
      break;
    header += line;
    header.push_back('\n');
  }
  if (header.empty())
    throw IOError("Cannot read VCF header; input has no header lines.");
  return header;
}

}  // namespace vcf
}  // namespace simplevcf
