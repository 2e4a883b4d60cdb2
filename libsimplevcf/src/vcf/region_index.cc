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

#include "utils/logger_public.h"
#include "utils/utils.h"
#include "vcf/region_index.h"

namespace simplevcf {
namespace vcf {

DataLineFilter::DataLineFilter(
    std::unique_ptr<LineIterator> lines, std::optional<Region> region)
    : lines_(std::move(lines))
    , region_(std::move(region)) {
}

bool DataLineFilter::next(std::string* line, uint64_t* line_number) {
  while (lines_->next(line, line_number)) {
    if (line->empty() || (*line)[0] == '#')
      continue;
    if (region_ && !in_region(*line))
      continue;
    return true;
  }
  return false;
}

bool DataLineFilter::in_region(const std::string& line) const {
  size_t tab1 = line.find('\t');
  if (tab1 == std::string::npos)
    return true;
  if (line.compare(0, tab1, region_->seq_name) != 0)
    return false;

  size_t tab2 = line.find('\t', tab1 + 1);
  std::string pos_str = line.substr(
      tab1 + 1, tab2 == std::string::npos ? std::string::npos : tab2 - tab1 - 1);
  int64_t pos = 0;
  if (!utils::parse_int(pos_str, &pos))
    return true;
  return region_->contains(region_->seq_name, pos);
}

TabixRegionIndex::TabixRegionIndex(const std::string& path, SafeTbx tbx)
    : path_(path)
    , tbx_(std::move(tbx)) {
}

std::unique_ptr<LineIterator> TabixRegionIndex::query(const Region& region) {
  LOG_DEBUG("Tabix query {} on {}", region.to_str(), path_);
  // Tabix returns records overlapping the region, including ones that start
  // before it; the filter keeps only those whose POS is inside.
  return std::make_unique<DataLineFilter>(
      std::make_unique<TabixLineIterator>(path_, tbx_.get(), region), region);
}

std::unique_ptr<LineIterator> TabixRegionIndex::query_all() {
  return std::make_unique<DataLineFilter>(
      std::make_unique<HtsLineIterator>(path_), std::nullopt);
}

ScanRegionIndex::ScanRegionIndex(Opener opener)
    : opener_(std::move(opener)) {
}

std::unique_ptr<LineIterator> ScanRegionIndex::query(const Region& region) {
  LOG_DEBUG("Scanning for region {}", region.to_str());
  return std::make_unique<DataLineFilter>(opener_(), region);
}

std::unique_ptr<LineIterator> ScanRegionIndex::query_all() {
  return std::make_unique<DataLineFilter>(opener_(), std::nullopt);
}

}  // namespace vcf
}  // namespace simplevcf
