/**
 * @file   exceptions.h
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
 * Exception types raised while opening, decoding and projecting VCF data.
 */

#ifndef SIMPLEVCF_EXCEPTIONS_H
#define SIMPLEVCF_EXCEPTIONS_H

#include <cstdint>
#include <stdexcept>
#include <string>

namespace simplevcf {
namespace vcf {

/**
 * Thrown when an INFO/FORMAT declaration in the header is missing a required
 * attribute (ID, Number, Type) or declares an unknown Type, or when the
 * column header line is absent or invalid. Opening the file is aborted.
 */
class MalformedHeaderError : public std::runtime_error {
 public:
  explicit MalformedHeaderError(const std::string& msg)
      : std::runtime_error("Malformed VCF header: " + msg) {
  }
};

/**
 * Thrown when a data line violates the structure of a VCF record. Carries
 * the offending line number.
 */
class MalformedRecordError : public std::runtime_error {
 public:
  MalformedRecordError(uint64_t line_number, const std::string& msg)
      : std::runtime_error(
            "Malformed VCF record at line " + std::to_string(line_number) +
            ": " + msg)
      , line_number_(line_number) {
  }

  /** Returns the line number of the offending record. */
  uint64_t line_number() const {
    return line_number_;
  }

 private:
  uint64_t line_number_;
};

/** Thrown in strict mode when a requested field is not declared. */
class UnknownFieldError : public std::invalid_argument {
 public:
  explicit UnknownFieldError(const std::string& msg)
      : std::invalid_argument(msg) {
  }
};

/** Thrown when a region query string cannot be parsed. */
class RegionSyntaxError : public std::invalid_argument {
 public:
  explicit RegionSyntaxError(const std::string& msg)
      : std::invalid_argument(msg) {
  }
};

/** Thrown on failure of the underlying file or stream. */
class IOError : public std::runtime_error {
 public:
  explicit IOError(const std::string& msg)
      : std::runtime_error(msg) {
  }
};

}  // namespace vcf
}  // namespace simplevcf

#endif  // SIMPLEVCF_EXCEPTIONS_H
