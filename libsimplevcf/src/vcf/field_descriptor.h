/**
 * @file   field_descriptor.h
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
 * Declared INFO/FORMAT field definitions: arity, value type and name.
 */

#ifndef SIMPLEVCF_VCF_FIELD_DESCRIPTOR_H
#define SIMPLEVCF_VCF_FIELD_DESCRIPTOR_H

#include <cstdint>
#include <string>

namespace simplevcf {
namespace vcf {

/** Value type of a declared field ("Type" attribute). */
enum class ValueType : uint8_t { Integer, Float, String, Flag };

/**
 * Declared cardinality of a field ("Number" attribute).
 *
 *   - Fixed:       an integer literal, the exact number of values
 *   - PerAlt:      "A", one value per alternate allele
 *   - PerAllele:   "R", one value per allele including the reference
 *   - PerGenotype: "G", one value per possible genotype
 *   - Variable:    ".", unknown or unbounded
 */
struct Arity {
  enum class Kind : uint8_t { Fixed, PerAlt, PerAllele, PerGenotype, Variable };

  Arity()
      : kind(Kind::Variable)
      , count(0) {
  }

  Arity(Kind kind, uint32_t count = 0)
      : kind(kind)
      , count(kind == Kind::Fixed ? count : 0) {
  }

  static Arity fixed(uint32_t n) {
    return Arity(Kind::Fixed, n);
  }

  /**
   * Parses a "Number" attribute value.
   *
   * @param str Attribute value
   * @param arity Set to the parsed arity on success
   * @return True if the value is an integer literal or one of A, R, G, "."
   */
  static bool parse(const std::string& str, Arity* arity);

  /** Returns the "Number" spelling of this arity. */
  std::string to_str() const;

  /** True if values of this arity decode to a single scalar. */
  bool is_scalar() const {
    return kind == Kind::Fixed && count == 1;
  }

  bool operator==(const Arity& other) const {
    return kind == other.kind && count == other.count;
  }

  bool operator!=(const Arity& other) const {
    return !(*this == other);
  }

  Kind kind;

  /** Number of values, only meaningful when kind == Fixed. */
  uint32_t count;
};

/** Returns the "Type" spelling of the value type. */
std::string value_type_str(ValueType type);

/**
 * Parses a "Type" attribute value. "Character" is accepted and treated as
 * String.
 *
 * @return True if the value is a recognized type.
 */
bool parse_value_type(const std::string& str, ValueType* type);

/** One INFO or FORMAT declaration from the header. */
struct FieldDescriptor {
  FieldDescriptor()
      : type(ValueType::String) {
  }

  FieldDescriptor(
      const std::string& name,
      Arity arity,
      ValueType type,
      const std::string& description = "")
      : name(name)
      , arity(arity)
      , type(type)
      , description(description) {
  }

  std::string name;
  Arity arity;
  ValueType type;
  std::string description;
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_VCF_FIELD_DESCRIPTOR_H
