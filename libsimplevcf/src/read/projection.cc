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

#include "read/projection.h"
#include "utils/exceptions.h"
#include "utils/logger_public.h"
#include "utils/utils.h"

namespace simplevcf {
namespace vcf {

const std::vector<std::string> FIXED_FIELD_COLUMNS = {
    "chrom", "pos", "id", "ref", "alts", "qual", "filters"};

namespace {
std::vector<std::string> field_names(
    const std::vector<FieldDescriptor>& fields) {
  std::vector<std::string> names;
  names.reserve(fields.size());
  for (const auto& f : fields)
    names.push_back(f.name);
  return names;
}
}  // namespace

/* ****************************** */
/*        FieldSelection        */
/* ****************************** */

FieldSelection FieldSelection::only(const std::vector<std::string>& names) {
  FieldSelection sel;
  sel.all_ = false;
  for (const auto& name : names)
    utils::push_unique(sel.names_, name);
  return sel;
}

bool FieldSelection::contains(const std::string& name) const {
  return all_ || utils::contains(names_, name);
}

/* ****************************** */
/*             Row              */
/* ****************************** */

void Row::set(const std::string& column, FieldValue value) {
  auto it = index_.find(column);
  if (it != index_.end()) {
    cells_[it->second].second = std::move(value);
    return;
  }
  index_[column] = cells_.size();
  cells_.emplace_back(column, std::move(value));
}

const FieldValue* Row::get(const std::string& column) const {
  auto it = index_.find(column);
  return it == index_.end() ? nullptr : &cells_[it->second].second;
}

/* ****************************** */
/*        FieldProjector        */
/* ****************************** */

FieldProjector::FieldProjector(
    const VCFHeader* header, const ProjectionRequest& request)
    : header_(header)
    , request_(request) {
  if (header_ == nullptr)
    throw std::invalid_argument("Cannot create field projector; null header.");
  validate();
  build_column_order();
}

std::string FieldProjector::sample_column(
    const std::string& sample, const std::string& field) {
  return sample + "." + field;
}

Row FieldProjector::project(const VariantRecord& record) const {
  Row row;
  row.set("chrom", FieldValue::scalar(record.chrom()));
  row.set("pos", FieldValue::scalar(record.pos()));
  row.set(
      "id",
      record.id() == "." ? FieldValue::absent() :
                           FieldValue::scalar(record.id()));
  row.set("ref", FieldValue::scalar(record.ref()));
  row.set("alts", FieldValue::string_sequence(record.alts()));
  row.set(
      "qual",
      record.qual() ? FieldValue::scalar(*record.qual()) :
                      FieldValue::absent());
  row.set("filters", FieldValue::string_sequence(record.filters()));

  for (const auto& entry : record.info()) {
    if (info_selected(entry.first))
      row.set(entry.first, entry.second);
  }

  for (const auto& call : record.samples()) {
    if (!sample_selected(call.name()))
      continue;

    if (call.genotype()) {
      row.set(
          sample_column(call.name(), "phased"),
          FieldValue::scalar(call.genotype()->phased));
      row.set(
          sample_column(call.name(), "GT"),
          call.genotype()->to_field_value());
    }

    for (const auto& field : call.fields()) {
      if (field.first == "GT")
        continue;
      if (sample_field_selected(field.first))
        row.set(sample_column(call.name(), field.first), field.second);
    }
  }

  return row;
}

void FieldProjector::validate() const {
  auto check = [this](
                   const FieldSelection& selection,
                   const std::string& kind,
                   auto is_declared) {
    for (const auto& name : selection.names()) {
      if (is_declared(name))
        continue;
      if (request_.strict)
        throw UnknownFieldError(
            "Requested " + kind + " '" + name +
            "' is not declared in the VCF header.");
      LOG_WARN(
          "Requested {} '{}' is not declared in the VCF header; its column "
          "will be empty",
          kind,
          name);
    }
  };

  check(request_.info_fields, "INFO field", [this](const std::string& name) {
    return header_->info_field(name) != nullptr;
  });
  check(
      request_.sample_fields, "FORMAT field", [this](const std::string& name) {
        return header_->format_field(name) != nullptr;
      });
  check(request_.samples, "sample", [this](const std::string& name) {
    return header_->sample_index(name) >= 0;
  });
}

void FieldProjector::build_column_order() {
  column_order_ = FIXED_FIELD_COLUMNS;

  for (const auto& name :
       resolve(request_.info_fields, field_names(header_->info_fields())))
    utils::push_unique(column_order_, name);

  std::vector<std::string> fields;
  for (const auto& name :
       resolve(request_.sample_fields, field_names(header_->format_fields()))) {
    if (name != "GT")
      fields.push_back(name);
  }

  for (const auto& sample :
       resolve(request_.samples, header_->sample_names())) {
    if (header_->has_genotypes()) {
      utils::push_unique(column_order_, sample_column(sample, "phased"));
      utils::push_unique(column_order_, sample_column(sample, "GT"));
    }
    for (const auto& field : fields)
      utils::push_unique(column_order_, sample_column(sample, field));
  }
}

std::vector<std::string> FieldProjector::resolve(
    const FieldSelection& selection,
    const std::vector<std::string>& declared) const {
  if (selection.is_all())
    return declared;

  std::vector<std::string> result = selection.names();
  if (request_.include_unspecified) {
    for (const auto& name : declared)
      utils::push_unique(result, name);
  }
  return result;
}

bool FieldProjector::info_selected(const std::string& name) const {
  return request_.include_unspecified || request_.info_fields.contains(name);
}

bool FieldProjector::sample_selected(const std::string& name) const {
  return request_.include_unspecified || request_.samples.contains(name);
}

bool FieldProjector::sample_field_selected(const std::string& name) const {
  return request_.include_unspecified ||
         request_.sample_fields.contains(name);
}

}  // namespace vcf
}  // namespace simplevcf
