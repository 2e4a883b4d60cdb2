/**
 * @file   field_value.h
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
 * Tagged value union for decoded fields and table cells.
 */

#ifndef SIMPLEVCF_VCF_FIELD_VALUE_H
#define SIMPLEVCF_VCF_FIELD_VALUE_H

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace simplevcf {
namespace vcf {

/**
 * A single value. std::monostate is a missing element, i.e. a "." inside a
 * list such as "1,.,3".
 */
typedef std::variant<std::monostate, bool, int64_t, double, std::string>
    Scalar;

/** Returns true if the scalar is a missing element. */
inline bool is_null(const Scalar& s) {
  return std::holds_alternative<std::monostate>(s);
}

/** Renders a scalar as VCF text ("." for a missing element). */
std::string scalar_to_str(const Scalar& s);

/**
 * Value of one decoded field or table cell:
 *
 *   - Absent:   no value. This is the null sentinel of a table cell and the
 *               decoding of a whole-value "." in a record.
 *   - Scalar:   exactly one value (fields with Number=1, flags, fixed
 *               columns such as POS).
 *   - Sequence: an ordered list of values (every other arity, ALT, FILTER,
 *               genotype allele indices).
 */
class FieldValue {
 public:
  enum class Kind : uint8_t { Absent, Scalar, Sequence };

  /** Constructs an absent value. */
  FieldValue()
      : kind_(Kind::Absent) {
  }

  static FieldValue absent() {
    return FieldValue();
  }

  static FieldValue scalar(Scalar value) {
    FieldValue v;
    v.kind_ = Kind::Scalar;
    v.values_.push_back(std::move(value));
    return v;
  }

  static FieldValue sequence(std::vector<Scalar> values) {
    FieldValue v;
    v.kind_ = Kind::Sequence;
    v.values_ = std::move(values);
    return v;
  }

  /** Builds a sequence of strings, e.g. the ALT or FILTER column. */
  static FieldValue string_sequence(const std::vector<std::string>& values);

  Kind kind() const {
    return kind_;
  }

  bool is_absent() const {
    return kind_ == Kind::Absent;
  }

  bool is_scalar() const {
    return kind_ == Kind::Scalar;
  }

  bool is_sequence() const {
    return kind_ == Kind::Sequence;
  }

  /**
   * Returns the scalar value.
   *
   * @throws std::logic_error if the value is not a scalar.
   */
  const Scalar& as_scalar() const;

  /**
   * Returns the sequence values.
   *
   * @throws std::logic_error if the value is not a sequence.
   */
  const std::vector<Scalar>& as_sequence() const;

  /**
   * Typed accessor for a scalar value.
   *
   * @throws std::logic_error if not a scalar, or std::bad_variant_access if
   *     the scalar holds another type.
   */
  template <typename T>
  const T& get() const {
    return std::get<T>(as_scalar());
  }

  /**
   * Renders the value as VCF text: "." when absent, sequence elements joined
   * with `delim`. An empty sequence renders as an empty string, so it stays
   * distinct from an absent value or a single null element.
   */
  std::string to_str(char delim = ',') const;

  bool operator==(const FieldValue& other) const {
    return kind_ == other.kind_ && values_ == other.values_;
  }

  bool operator!=(const FieldValue& other) const {
    return !(*this == other);
  }

 private:
  Kind kind_;

  /** One element for a scalar, any number for a sequence, none if absent. */
  std::vector<Scalar> values_;
};

/**
 * Decoded GT value: allele indices in call order and the phasing of the
 * call.
 */
struct Genotype {
  /** Allele index of an uncalled allele ("."). */
  static constexpr int32_t MISSING_ALLELE = -1;

  Genotype()
      : phased(false) {
  }

  /** Returns the alleles as a sequence cell, missing alleles as nulls. */
  FieldValue to_field_value() const;

  /** Renders the call as VCF text, e.g. "0|1" or "./.". */
  std::string to_str() const;

  bool operator==(const Genotype& other) const {
    return alleles == other.alleles && phased == other.phased &&
           separators == other.separators;
  }

  std::vector<int32_t> alleles;

  /**
   * The separators between alleles as written ('/' or '|'), one fewer than
   * the number of alleles.
   */
  std::string separators;

  bool phased;
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_VCF_FIELD_VALUE_H
