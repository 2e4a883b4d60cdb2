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

#include "utils/exceptions.h"
#include "utils/logger_public.h"
#include "utils/utils.h"
#include "vcf/record_decoder.h"

namespace simplevcf {
namespace vcf {

namespace {
/** Column indices of a VCF data line. */
enum Column : size_t {
  CHROM = 0,
  POS,
  ID,
  REF,
  ALT,
  QUAL,
  FILTER,
  INFO,
  FORMAT,
  FIRST_SAMPLE
};
}  // namespace

RecordDecoder::RecordDecoder(
    const VCFHeader* header, const DecodeOptions& options)
    : header_(header)
    , options_(options) {
  if (header_ == nullptr)
    throw std::invalid_argument("Cannot create record decoder; null header.");
}

VariantRecord RecordDecoder::decode(
    const std::string& line, uint64_t line_number) {
  auto columns = utils::split(line, '\t');
  const size_t num_samples = header_->sample_names().size();
  const size_t num_cols = columns.size();

  bool valid_count;
  if (num_samples == 0)
    valid_count = num_cols == INFO + 1 || num_cols == FORMAT + 1;
  else
    valid_count = num_cols == FIRST_SAMPLE + num_samples;
  if (!valid_count) {
    const size_t expected =
        num_samples == 0 ? INFO + 1 : FIRST_SAMPLE + num_samples;
    throw MalformedRecordError(
        line_number,
        "expected " + std::to_string(expected) + " tab separated columns, got " +
            std::to_string(num_cols) + ".");
  }

  VariantRecord rec;
  rec.line_number_ = line_number;

  rec.chrom_ = columns[CHROM];
  if (rec.chrom_.empty())
    throw MalformedRecordError(line_number, "CHROM is empty.");

  if (!utils::parse_int(columns[POS], &rec.pos_) || rec.pos_ < 1)
    throw MalformedRecordError(
        line_number,
        "POS '" + columns[POS] + "' is not a positive integer.");

  rec.id_ = columns[ID];

  rec.ref_ = columns[REF];
  if (rec.ref_.empty())
    throw MalformedRecordError(line_number, "REF is empty.");

  if (columns[ALT] != ".")
    rec.alts_ = utils::split(columns[ALT], ',');

  rec.qual_text_ = columns[QUAL];
  if (columns[QUAL] != ".") {
    double qual = 0;
    if (!utils::parse_float(columns[QUAL], &qual))
      throw MalformedRecordError(
          line_number, "QUAL '" + columns[QUAL] + "' is not a number.");
    rec.qual_ = qual;
  }

  if (columns[FILTER] != ".") {
    for (auto& filter : utils::split(columns[FILTER], ';'))
      utils::push_unique(rec.filters_, std::move(filter));
  }

  decode_info(columns[INFO], line_number, &rec);

  if (num_cols > FORMAT && num_samples > 0)
    decode_samples(columns, line_number, &rec);

  return rec;
}

void RecordDecoder::decode_info(
    const std::string& column, uint64_t line_number, VariantRecord* rec) {
  if (column == "." || column.empty())
    return;

  for (const auto& entry : utils::split(column, ';')) {
    if (entry.empty())
      continue;

    auto eq = entry.find('=');
    const bool has_value = eq != std::string::npos;
    const std::string key = has_value ? entry.substr(0, eq) : entry;
    if (key.empty())
      throw MalformedRecordError(
          line_number, "INFO entry '" + entry + "' has an empty key.");

    FieldDescriptor desc = info_descriptor(key, has_value);
    if (desc.type == ValueType::Flag) {
      if (has_value)
        throw MalformedRecordError(
            line_number,
            "INFO flag '" + key + "' must not carry a value.");
      rec->info_.emplace_back(key, FieldValue::scalar(true));
    } else if (!has_value) {
      rec->info_.emplace_back(key, FieldValue::absent());
    } else {
      rec->info_.emplace_back(
          key, decode_value(desc, entry.substr(eq + 1), line_number));
    }
  }
}

void RecordDecoder::decode_samples(
    const std::vector<std::string>& columns,
    uint64_t line_number,
    VariantRecord* rec) {
  std::vector<std::string> keys;
  if (columns[FORMAT] != ".")
    keys = utils::split(columns[FORMAT], ':');

  std::vector<FieldDescriptor> descs;
  descs.reserve(keys.size());
  for (const auto& key : keys) {
    if (key.empty())
      throw MalformedRecordError(
          line_number,
          "FORMAT column '" + columns[FORMAT] + "' has an empty key.");
    descs.push_back(format_descriptor(key));
  }

  const auto& sample_names = header_->sample_names();
  rec->samples_.reserve(sample_names.size());
  for (size_t i = 0; i < sample_names.size(); i++) {
    const std::string& column = columns[FIRST_SAMPLE + i];
    SampleCall call;
    call.name_ = sample_names[i];

    std::vector<std::string> values = utils::split(column, ':');
    const bool whole_missing = column == ".";
    if (values.size() > keys.size() && !(whole_missing && keys.empty()))
      throw MalformedRecordError(
          line_number,
          "sample '" + call.name_ + "' has " + std::to_string(values.size()) +
              " values but FORMAT declares " + std::to_string(keys.size()) +
              " keys.");
    if (values.size() < keys.size() && !whole_missing &&
        !options_.allow_truncated_samples)
      throw MalformedRecordError(
          line_number,
          "sample '" + call.name_ + "' has " + std::to_string(values.size()) +
              " values but FORMAT declares " + std::to_string(keys.size()) +
              " keys.");

    call.fields_.reserve(keys.size());
    for (size_t k = 0; k < keys.size(); k++) {
      const std::string raw = k < values.size() ? values[k] : ".";
      if (keys[k] == "GT") {
        Genotype gt = decode_genotype(raw, line_number);
        call.fields_.emplace_back(keys[k], gt.to_field_value());
        call.genotype_ = std::move(gt);
      } else {
        call.fields_.emplace_back(
            keys[k], decode_value(descs[k], raw, line_number));
      }
    }
    rec->samples_.push_back(std::move(call));
  }
}

FieldValue RecordDecoder::decode_value(
    const FieldDescriptor& desc,
    const std::string& raw,
    uint64_t line_number) const {
  if (raw == "." || raw.empty())
    return FieldValue::absent();

  if (desc.type == ValueType::Flag)
    return FieldValue::scalar(true);

  if (desc.arity.is_scalar())
    return FieldValue::scalar(decode_scalar(desc, raw, line_number));

  std::vector<Scalar> elts;
  for (const auto& elt : utils::split(raw, ',')) {
    if (elt == "." || elt.empty())
      elts.emplace_back(std::monostate());
    else
      elts.push_back(decode_scalar(desc, elt, line_number));
  }
  return FieldValue::sequence(std::move(elts));
}

Scalar RecordDecoder::decode_scalar(
    const FieldDescriptor& desc,
    const std::string& raw,
    uint64_t line_number) const {
  switch (desc.type) {
    case ValueType::Integer: {
      int64_t value = 0;
      if (!utils::parse_int(raw, &value))
        throw MalformedRecordError(
            line_number,
            "value '" + raw + "' of field '" + desc.name +
                "' is not an Integer.");
      return Scalar(value);
    }
    case ValueType::Float: {
      double value = 0;
      if (!utils::parse_float(raw, &value))
        throw MalformedRecordError(
            line_number,
            "value '" + raw + "' of field '" + desc.name +
                "' is not a Float.");
      return Scalar(value);
    }
    case ValueType::String:
      return Scalar(raw);
    case ValueType::Flag:
      return Scalar(true);
  }
  throw std::runtime_error("Error decoding value; unknown value type.");
}

Genotype RecordDecoder::decode_genotype(
    const std::string& raw, uint64_t line_number) const {
  Genotype gt;
  std::string allele;
  auto push_allele = [&]() {
    if (allele == ".") {
      gt.alleles.push_back(Genotype::MISSING_ALLELE);
      return;
    }
    int64_t index = 0;
    if (!utils::parse_int(allele, &index) || index < 0 ||
        index > std::numeric_limits<int32_t>::max())
      throw MalformedRecordError(
          line_number, "invalid allele '" + allele + "' in GT '" + raw + "'.");
    gt.alleles.push_back(static_cast<int32_t>(index));
  };

  for (char c : raw) {
    if (c == '/' || c == '|') {
      push_allele();
      gt.separators.push_back(c);
      allele.clear();
    } else {
      allele.push_back(c);
    }
  }
  push_allele();

  // A haploid call has no separator and is never phased.
  gt.phased = !gt.separators.empty() &&
              gt.separators.find('/') == std::string::npos;
  return gt;
}

FieldDescriptor RecordDecoder::info_descriptor(
    const std::string& key, bool has_value) {
  const FieldDescriptor* desc = header_->info_field(key);
  if (desc != nullptr)
    return *desc;
  warn_undeclared("INFO", key);
  return has_value ? FieldDescriptor(key, Arity::fixed(1), ValueType::String) :
                     FieldDescriptor(key, Arity::fixed(0), ValueType::Flag);
}

FieldDescriptor RecordDecoder::format_descriptor(const std::string& key) {
  const FieldDescriptor* desc = header_->format_field(key);
  if (desc != nullptr)
    return *desc;
  if (key != "GT")
    warn_undeclared("FORMAT", key);
  return FieldDescriptor(key, Arity::fixed(1), ValueType::String);
}

void RecordDecoder::warn_undeclared(
    const std::string& section, const std::string& key) {
  if (!undeclared_.insert(section + "/" + key).second)
    return;
  LOG_WARN(
      "{} field '{}' is not declared in the VCF header; decoding as {}",
      section,
      key,
      section == "INFO" ? "String or Flag" : "String");
}

}  // namespace vcf
}  // namespace simplevcf
