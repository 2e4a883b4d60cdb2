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

#include "vcf/variant_record.h"
#include "utils/utils.h"

namespace simplevcf {
namespace vcf {

namespace {
const FieldValue* find_field(const FieldList& fields, const std::string& key) {
  for (const auto& f : fields) {
    if (f.first == key)
      return &f.second;
  }
  return nullptr;
}
}  // namespace

const FieldValue* SampleCall::field(const std::string& key) const {
  return find_field(fields_, key);
}

const FieldValue* VariantRecord::info_value(const std::string& key) const {
  return find_field(info_, key);
}

const SampleCall* VariantRecord::sample(const std::string& name) const {
  for (const auto& s : samples_) {
    if (s.name() == name)
      return &s;
  }
  return nullptr;
}

std::string VariantRecord::encode_fixed_fields() const {
  std::vector<std::string> cols;
  cols.reserve(7);
  cols.push_back(chrom_);
  cols.push_back(std::to_string(pos_));
  cols.push_back(id_);
  cols.push_back(ref_);
  cols.push_back(alts_.empty() ? "." : utils::join(alts_, ','));
  if (!qual_text_.empty())
    cols.push_back(qual_text_);
  else
    cols.push_back(qual_ ? scalar_to_str(Scalar(*qual_)) : ".");
  cols.push_back(filters_.empty() ? "." : utils::join(filters_, ';'));
  return utils::join(cols, '\t');
}

}  // namespace vcf
}  // namespace simplevcf
