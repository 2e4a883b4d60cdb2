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

#include "vcf/vcf_utils.h"
#include "utils/exceptions.h"
#include "utils/logger_public.h"

namespace simplevcf {
namespace vcf {

SafeHtsFile VCFUtils::open_vcf_file(const std::string& path) {
  if (path.empty())
    throw std::invalid_argument("Cannot open VCF file; path is empty");

  SafeHtsFile fh(hts_open(path.c_str(), "r"), hts_close);
  if (fh == nullptr)
    throw IOError("Cannot open VCF file '" + path + "'; hts_open failed.");

  const htsFormat* format = hts_get_format(fh.get());
  if (format->format == bcf)
    throw IOError(
        "Cannot open VCF file '" + path +
        "'; BCF input is not supported, convert it to VCF text first.");
  if (format->format != ::vcf && format->format != text_format &&
      format->format != unknown_format)
    throw IOError(
        "Cannot open VCF file '" + path + "'; must be VCF text format.");

  return fh;
}

bool VCFUtils::is_bgzf(const htsFile* fh) {
  return fh != nullptr && fh->format.compression == bgzf;
}

SafeTbx VCFUtils::load_tabix_index(
    const std::string& path, const std::string& index_path) {
  if (index_path.empty()) {
    SafeTbx tbx(
        tbx_index_load3(path.c_str(), nullptr, HTS_IDX_SILENT_FAIL),
        tbx_destroy);
    if (tbx == nullptr)
      LOG_DEBUG("No tabix index found for {}", path);
    return tbx;
  }

  SafeTbx tbx(
      tbx_index_load2(path.c_str(), index_path.c_str()), tbx_destroy);
  if (tbx == nullptr)
    throw IOError(
        "Cannot open VCF file; failed to load TBX index '" + index_path +
        "'.");
  return tbx;
}

bool VCFUtils::normalize_sample_name(
    const std::string& sample, std::string* normalized) {
  if (sample.empty())
    return false;

  // Check for invalid chars
  const size_t num_invalid = 3;
  const char invalid_char_list[num_invalid] = {',', '\t', '\0'};
  if (sample.find_first_of(invalid_char_list, 0, num_invalid) !=
      std::string::npos)
    return false;

  // Trim leading/trailing whitespace
  const std::string whitespace_chars = " \t\n\r\v\f";
  auto first_non_wsp = sample.find_first_not_of(whitespace_chars);
  auto last_non_wsp = sample.find_last_not_of(whitespace_chars);
  if (first_non_wsp == std::string::npos)
    return false;

  if (normalized != nullptr) {
    *normalized =
        sample.substr(first_non_wsp, last_non_wsp - first_non_wsp + 1);
  }

  return true;
}

}  // namespace vcf
}  // namespace simplevcf
