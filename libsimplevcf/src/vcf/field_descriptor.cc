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

#include <limits>
#include <stdexcept>

#include "utils/utils.h"
#include "vcf/field_descriptor.h"

namespace simplevcf {
namespace vcf {

bool Arity::parse(const std::string& str, Arity* arity) {
  if (str == "A") {
    *arity = Arity(Kind::PerAlt);
  } else if (str == "R") {
    *arity = Arity(Kind::PerAllele);
  } else if (str == "G") {
    *arity = Arity(Kind::PerGenotype);
  } else if (str == ".") {
    *arity = Arity(Kind::Variable);
  } else {
    int64_t n;
    if (!utils::parse_int(str, &n) || n < 0 ||
        n > std::numeric_limits<uint32_t>::max())
      return false;
    *arity = Arity::fixed(static_cast<uint32_t>(n));
  }
  return true;
}

std::string Arity::to_str() const {
  switch (kind) {
    case Kind::Fixed:
      return std::to_string(count);
    case Kind::PerAlt:
      return "A";
    case Kind::PerAllele:
      return "R";
    case Kind::PerGenotype:
      return "G";
    case Kind::Variable:
      return ".";
  }
  throw std::runtime_error("Error converting Arity to string.");
}

std::string value_type_str(ValueType type) {
  switch (type) {
    case ValueType::Integer:
      return "Integer";
    case ValueType::Float:
      return "Float";
    case ValueType::String:
      return "String";
    case ValueType::Flag:
      return "Flag";
  }
  throw std::runtime_error("Error converting ValueType to string.");
}

bool parse_value_type(const std::string& str, ValueType* type) {
  if (str == "Integer")
    *type = ValueType::Integer;
  else if (str == "Float")
    *type = ValueType::Float;
  else if (str == "String" || str == "Character")
    *type = ValueType::String;
  else if (str == "Flag")
    *type = ValueType::Flag;
  else
    return false;
  return true;
}

}  // namespace vcf
}  // namespace simplevcf
