/**
 * @file   vcf_utils.h
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
 * Helper functions and RAII aliases for htslib handles.
 */

#ifndef SIMPLEVCF_VCF_VCF_UTILS_H
#define SIMPLEVCF_VCF_VCF_UTILS_H

#include <htslib/hts.h>
#include <htslib/tbx.h>

#include <memory>
#include <string>

namespace simplevcf {
namespace vcf {

/** Alias for unique_ptr to htsFile. */
typedef std::unique_ptr<htsFile, decltype(&hts_close)> SafeHtsFile;

/** Alias for unique_ptr to tbx_t. */
typedef std::unique_ptr<tbx_t, decltype(&tbx_destroy)> SafeTbx;

/** Alias for unique_ptr to hts_itr_t. */
typedef std::unique_ptr<hts_itr_t, decltype(&hts_itr_destroy)> SafeHtsItr;

class VCFUtils {
 public:
  /**
   * Opens the file at the given path for reading. Plain, gzip and BGZF
   * compressed text are accepted.
   *
   * @param path Path of VCF file
   * @return Open file handle
   * @throws IOError if the file cannot be opened or is not VCF text
   */
  static SafeHtsFile open_vcf_file(const std::string& path);

  /**
   * Returns true if the file handle refers to a BGZF compressed file, the
   * only compression tabix indexes support.
   */
  static bool is_bgzf(const htsFile* fh);

  /**
   * Loads the tabix index of the VCF file at the given path.
   *
   * If index_path is empty the index is looked up next to the data file
   * (path + ".tbi") and a missing index is not an error: null is returned.
   * If index_path is given, failure to load it throws.
   *
   * @param path Path of VCF file
   * @param index_path Optional explicit path of the index file
   * @return The index, or null if none was found
   * @throws IOError if an explicitly given index cannot be loaded
   */
  static SafeTbx load_tabix_index(
      const std::string& path, const std::string& index_path);

  /**
   * Helper function that normalizes a sample name:
   *  - Remove leading/trailing whitespace
   *  - Error on invalid chars (comma)
   *
   * @param sample Sample name to normalize
   * @param normalized Set to the normalized sample name
   * @return True if the sample name was normalized successfully
   */
  static bool normalize_sample_name(
      const std::string& sample, std::string* normalized);
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_VCF_VCF_UTILS_H
