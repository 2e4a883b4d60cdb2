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

#include "vcf/header.h"
#include "utils/exceptions.h"
#include "utils/logger_public.h"
#include "utils/utils.h"
#include "vcf/vcf_utils.h"

namespace simplevcf {
namespace vcf {

const std::vector<std::string> VCFHeader::FIXED_COLUMNS = {
    "#CHROM", "POS", "ID", "REF", "ALT", "QUAL", "FILTER", "INFO"};

VCFHeader VCFHeader::parse(const std::string& raw_header_text) {
  VCFHeader hdr;
  hdr.raw_text_ = raw_header_text;

  bool seen_column_header = false;
  uint64_t line_number = 0;
  for (auto line : utils::split(raw_header_text, '\n')) {
    ++line_number;
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      continue;

    if (seen_column_header)
      throw MalformedHeaderError(
          "unexpected line " + std::to_string(line_number) +
          " after the #CHROM column header line.");

    if (utils::starts_with(line, "#CHROM")) {
      hdr.parse_column_header(line, line_number);
      seen_column_header = true;
      continue;
    }

    if (!utils::starts_with(line, "##"))
      throw MalformedHeaderError(
          "line " + std::to_string(line_number) +
          " is not a meta-information line: '" + line + "'");

    auto eq = line.find('=');
    if (eq == std::string::npos) {
      LOG_DEBUG("Ignoring header line {} without a value", line_number);
      continue;
    }
    std::string key = line.substr(2, eq - 2);
    std::string value = line.substr(eq + 1);

    if (key == "fileformat") {
      hdr.file_format_ = value;
      continue;
    }

    bool structured = value.size() >= 2 && value.front() == '<' &&
                      value.back() == '>';
    if (key == "INFO" || key == "FORMAT") {
      if (!structured)
        throw MalformedHeaderError(
            key + " declaration at line " + std::to_string(line_number) +
            " is not of the form <key=value,...>.");
      auto attrs = parse_structured_line(
          value.substr(1, value.size() - 2), line_number);
      auto field = parse_field_descriptor(key, attrs, line_number);
      if (key == "INFO")
        add_field(
            key, std::move(field), &hdr.info_fields_, &hdr.info_index_);
      else
        add_field(
            key, std::move(field), &hdr.format_fields_, &hdr.format_index_);
    } else if (key == "FILTER" || key == "contig") {
      if (!structured)
        continue;
      auto attrs = parse_structured_line(
          value.substr(1, value.size() - 2), line_number);
      auto it = attrs.find("ID");
      if (it == attrs.end() || it->second.empty()) {
        LOG_WARN(
            "Ignoring {} declaration without ID at header line {}",
            key,
            line_number);
        continue;
      }
      utils::push_unique(
          key == "FILTER" ? hdr.filters_ : hdr.contigs_, it->second);
    }
  }

  if (!seen_column_header)
    throw MalformedHeaderError("missing #CHROM column header line.");

  LOG_DEBUG(
      "Parsed VCF header: {} INFO fields, {} FORMAT fields, {} samples",
      hdr.info_fields_.size(),
      hdr.format_fields_.size(),
      hdr.sample_names_.size());
  return hdr;
}

const FieldDescriptor* VCFHeader::info_field(const std::string& name) const {
  auto it = info_index_.find(name);
  return it == info_index_.end() ? nullptr : &info_fields_[it->second];
}

const FieldDescriptor* VCFHeader::format_field(const std::string& name) const {
  auto it = format_index_.find(name);
  return it == format_index_.end() ? nullptr : &format_fields_[it->second];
}

int VCFHeader::sample_index(const std::string& name) const {
  auto it = sample_index_.find(name);
  return it == sample_index_.end() ? -1 : it->second;
}

std::map<std::string, std::string> VCFHeader::parse_structured_line(
    const std::string& body, uint64_t line_number) {
  std::map<std::string, std::string> attrs;
  size_t i = 0;
  const size_t n = body.size();
  while (i < n) {
    // Key
    size_t eq = body.find('=', i);
    if (eq == std::string::npos)
      throw MalformedHeaderError(
          "attribute without value at line " + std::to_string(line_number) +
          ": '" + body.substr(i) + "'");
    std::string key = body.substr(i, eq - i);
    utils::trim(&key);
    i = eq + 1;

    // Value, possibly quoted
    std::string value;
    if (i < n && body[i] == '"') {
      ++i;
      bool closed = false;
      while (i < n) {
        char c = body[i];
        if (c == '\\' && i + 1 < n) {
          value.push_back(body[i + 1]);
          i += 2;
          continue;
        }
        if (c == '"') {
          closed = true;
          ++i;
          break;
        }
        value.push_back(c);
        ++i;
      }
      if (!closed)
        throw MalformedHeaderError(
            "unterminated quoted value for '" + key + "' at line " +
            std::to_string(line_number));
      // Skip anything up to the next separator.
      while (i < n && body[i] != ',')
        ++i;
    } else {
      size_t comma = body.find(',', i);
      if (comma == std::string::npos)
        comma = n;
      value = body.substr(i, comma - i);
      i = comma;
    }
    if (i < n && body[i] == ',')
      ++i;

    attrs.emplace(key, value);
  }
  return attrs;
}

FieldDescriptor VCFHeader::parse_field_descriptor(
    const std::string& section,
    const std::map<std::string, std::string>& attrs,
    uint64_t line_number) {
  const std::string where = section + " declaration at line " +
                            std::to_string(line_number);
  for (const char* required : {"ID", "Number", "Type"}) {
    auto it = attrs.find(required);
    if (it == attrs.end() || it->second.empty())
      throw MalformedHeaderError(
          where + " is missing required key '" + required + "'.");
  }

  FieldDescriptor field;
  field.name = attrs.at("ID");

  const std::string& type_str = attrs.at("Type");
  if (!parse_value_type(type_str, &field.type))
    throw MalformedHeaderError(
        where + " has unrecognized Type '" + type_str +
        "'; expected Integer, Float, String or Flag.");

  const std::string& number_str = attrs.at("Number");
  if (!Arity::parse(number_str, &field.arity))
    throw MalformedHeaderError(
        where + " has invalid Number '" + number_str + "'.");

  if (field.type == ValueType::Flag && field.arity != Arity::fixed(0)) {
    LOG_WARN(
        "{} field '{}' is a Flag with Number={}; using Number=0",
        section,
        field.name,
        number_str);
    field.arity = Arity::fixed(0);
  } else if (field.type != ValueType::Flag && field.arity == Arity::fixed(0)) {
    throw MalformedHeaderError(
        where + " declares Number=0 for non-Flag field '" + field.name + "'.");
  }

  auto desc = attrs.find("Description");
  if (desc != attrs.end())
    field.description = desc->second;

  return field;
}

void VCFHeader::parse_column_header(
    const std::string& line, uint64_t line_number) {
  auto columns = utils::split(line, '\t');
  if (columns.size() < FIXED_COLUMNS.size())
    throw MalformedHeaderError(
        "column header line " + std::to_string(line_number) + " has " +
        std::to_string(columns.size()) + " columns; expected at least " +
        std::to_string(FIXED_COLUMNS.size()) + ".");

  for (size_t i = 0; i < FIXED_COLUMNS.size(); i++) {
    if (columns[i] != FIXED_COLUMNS[i])
      throw MalformedHeaderError(
          "column header line has '" + columns[i] + "' where '" +
          FIXED_COLUMNS[i] + "' was expected.");
  }

  if (columns.size() == FIXED_COLUMNS.size())
    return;

  if (columns[FIXED_COLUMNS.size()] != "FORMAT")
    throw MalformedHeaderError(
        "column header line has '" + columns[FIXED_COLUMNS.size()] +
        "' where 'FORMAT' was expected.");

  for (size_t i = FIXED_COLUMNS.size() + 1; i < columns.size(); i++) {
    std::string name;
    if (!VCFUtils::normalize_sample_name(columns[i], &name))
      throw MalformedHeaderError(
          "sample name has invalid characters: '" + columns[i] + "'");
    if (sample_index_.count(name))
      throw MalformedHeaderError("duplicate sample name '" + name + "'");
    sample_index_[name] = static_cast<int>(sample_names_.size());
    sample_names_.push_back(name);
  }
}

void VCFHeader::add_field(
    const std::string& section,
    FieldDescriptor&& field,
    std::vector<FieldDescriptor>* fields,
    std::map<std::string, size_t>* index) {
  if (index->count(field.name)) {
    LOG_WARN(
        "Duplicate {} declaration for '{}'; keeping the first one",
        section,
        field.name);
    return;
  }
  (*index)[field.name] = fields->size();
  fields->push_back(std::move(field));
}

}  // namespace vcf
}  // namespace simplevcf
