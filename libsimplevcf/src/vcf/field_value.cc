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

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

#include "vcf/field_value.h"

namespace simplevcf {
namespace vcf {

std::string scalar_to_str(const Scalar& s) {
  switch (s.index()) {
    case 0:
      return ".";
    case 1:
      return std::get<bool>(s) ? "true" : "false";
    case 2:
      return std::to_string(std::get<int64_t>(s));
    case 3:
      // Shortest representation that round-trips.
      return fmt::format("{}", std::get<double>(s));
    case 4:
      return std::get<std::string>(s);
    default:
      throw std::runtime_error("Error converting scalar to string.");
  }
}

FieldValue FieldValue::string_sequence(const std::vector<std::string>& values) {
  std::vector<Scalar> elts;
  elts.reserve(values.size());
  for (const auto& v : values)
    elts.emplace_back(v);
  return FieldValue::sequence(std::move(elts));
}

const Scalar& FieldValue::as_scalar() const {
  if (kind_ != Kind::Scalar)
    throw std::logic_error("Cannot access field value as scalar.");
  return values_.front();
}

const std::vector<Scalar>& FieldValue::as_sequence() const {
  if (kind_ != Kind::Sequence)
    throw std::logic_error("Cannot access field value as sequence.");
  return values_;
}

std::string FieldValue::to_str(char delim) const {
  switch (kind_) {
    case Kind::Absent:
      return ".";
    case Kind::Scalar:
      return scalar_to_str(values_.front());
    case Kind::Sequence: {
      std::string result;
      for (size_t i = 0; i < values_.size(); i++) {
        if (i > 0)
          result.push_back(delim);
        result += scalar_to_str(values_[i]);
      }
      return result;
    }
  }
  throw std::runtime_error("Error converting field value to string.");
}

FieldValue Genotype::to_field_value() const {
  std::vector<Scalar> elts;
  elts.reserve(alleles.size());
  for (auto a : alleles) {
    if (a == MISSING_ALLELE)
      elts.emplace_back(std::monostate());
    else
      elts.emplace_back(static_cast<int64_t>(a));
  }
  return FieldValue::sequence(std::move(elts));
}

std::string Genotype::to_str() const {
  std::string result;
  for (size_t i = 0; i < alleles.size(); i++) {
    if (i > 0)
      result.push_back(i - 1 < separators.size() ? separators[i - 1] : '/');
    if (alleles[i] == MISSING_ALLELE)
      result.push_back('.');
    else
      result += std::to_string(alleles[i]);
  }
  return result.empty() ? "." : result;
}

}  // namespace vcf
}  // namespace simplevcf
