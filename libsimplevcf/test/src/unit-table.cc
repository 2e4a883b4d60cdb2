/**
 * @file   unit-table.cc
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
 * Tests for table assembly and TSV export.
 */

#include <catch2/catch.hpp>

#include <sstream>

#include "read/table.h"
#include "read/tsv_exporter.h"
#include "unit-helpers.h"

using namespace simplevcf::vcf;
using simplevcf::vcf::test::int_sequence;

namespace {

Row make_row(
    const std::vector<std::pair<std::string, FieldValue>>& cells) {
  Row row;
  for (const auto& cell : cells)
    row.set(cell.first, cell.second);
  return row;
}

}  // namespace

TEST_CASE("SimpleVCF: Test table padding", "[simplevcf][table]") {
  Row a = make_row(
      {{"chrom", FieldValue::scalar(std::string("chr1"))},
       {"DP", FieldValue::scalar(int64_t{3})}});
  Row b = make_row(
      {{"chrom", FieldValue::scalar(std::string("chr2"))},
       {"AF", FieldValue::sequence({Scalar(0.25)})}});

  Table table = TableAssembler::assemble({a, b}, {"chrom", "DP", "AF"});
  REQUIRE(table.num_rows() == 2);
  REQUIRE(
      table.column_names() == std::vector<std::string>{"chrom", "DP", "AF"});
  REQUIRE(table.cell(0, "AF").is_absent());
  REQUIRE(table.cell(1, "DP").is_absent());
  REQUIRE(table.cell(1, "AF") == FieldValue::sequence({Scalar(0.25)}));
  REQUIRE(table.column_index("DP") == 1);
  REQUIRE(table.column_index("nope") == -1);
  REQUIRE_THROWS_AS(table.cell(0, "nope"), std::out_of_range);
  REQUIRE_THROWS_AS(table.row(2), std::out_of_range);
  for (size_t i = 0; i < table.num_rows(); i++)
    REQUIRE(table.row(i).size() == table.num_columns());
}

TEST_CASE("SimpleVCF: Test table extra columns", "[simplevcf][table]") {
  SECTION("- appended in first-seen order") {
    Row a = make_row(
        {{"chrom", FieldValue::scalar(std::string("chr1"))},
         {"ZZ", FieldValue::scalar(std::string("z"))}});
    Row b = make_row(
        {{"YY", FieldValue::scalar(true)},
         {"chrom", FieldValue::scalar(std::string("chr1"))},
         {"ZZ", FieldValue::scalar(std::string("zz"))}});

    Table table = TableAssembler::assemble({a, b}, {"chrom", "DP"});
    REQUIRE(
        table.column_names() ==
        std::vector<std::string>{"chrom", "DP", "ZZ", "YY"});
    REQUIRE(table.cell(0, "YY").is_absent());
    REQUIRE(table.cell(1, "YY") == FieldValue::scalar(true));
    REQUIRE(table.cell(0, "DP").is_absent());
    REQUIRE(table.cell(1, "DP").is_absent());
  }

  SECTION("- anticipated columns do not depend on row order") {
    Row a = make_row(
        {{"chrom", FieldValue::scalar(std::string("chr1"))},
         {"AF", FieldValue::sequence({Scalar(0.5)})}});
    Row b = make_row(
        {{"DP", FieldValue::scalar(int64_t{7})},
         {"chrom", FieldValue::scalar(std::string("chr1"))}});
    const std::vector<std::string> order = {"chrom", "DP", "AF"};

    Table t1 = TableAssembler::assemble({a, b}, order);
    Table t2 = TableAssembler::assemble({b, a}, order);
    REQUIRE(t1.column_names() == order);
    REQUIRE(t2.column_names() == order);
  }

  SECTION("- no rows") {
    Table table = TableAssembler::assemble({}, {"chrom", "pos"});
    REQUIRE(table.num_rows() == 0);
    REQUIRE(table.num_columns() == 2);
  }
}

TEST_CASE("SimpleVCF: Test table assembler state", "[simplevcf][table]") {
  TableAssembler assembler({"chrom", "chrom", "pos"});
  assembler.add_row(
      make_row({{"pos", FieldValue::scalar(int64_t{1})}}));
  REQUIRE(assembler.num_rows() == 1);

  Table table = assembler.finalize();
  REQUIRE(table.column_names() == std::vector<std::string>{"chrom", "pos"});
  REQUIRE(table.cell(0, "pos") == FieldValue::scalar(int64_t{1}));

  REQUIRE_THROWS_AS(assembler.finalize(), std::logic_error);
  REQUIRE_THROWS_AS(assembler.add_row(Row()), std::logic_error);
}

TEST_CASE("SimpleVCF: Test table construction", "[simplevcf][table]") {
  REQUIRE_THROWS_AS(
      Table({"a", "a"}, std::vector<std::vector<FieldValue>>()),
      std::invalid_argument);
  REQUIRE_THROWS_AS(
      Table({"a", "b"}, {{FieldValue::absent()}}), std::invalid_argument);
}

TEST_CASE("SimpleVCF: Test schema table", "[simplevcf][table]") {
  std::vector<FieldDescriptor> fields = {
      FieldDescriptor("DP", Arity::fixed(1), ValueType::Integer),
      FieldDescriptor("AF", Arity(Arity::Kind::PerAlt), ValueType::Float)};
  fields[0].description = "Depth";

  Table table = schema_table(fields);
  REQUIRE(
      table.column_names() ==
      std::vector<std::string>{"name", "number", "type", "description"});
  REQUIRE(table.num_rows() == 2);
  REQUIRE(table.cell(0, "name") == FieldValue::scalar(std::string("DP")));
  REQUIRE(table.cell(0, "number") == FieldValue::scalar(std::string("1")));
  REQUIRE(table.cell(0, "type") == FieldValue::scalar(std::string("Integer")));
  REQUIRE(
      table.cell(0, "description") == FieldValue::scalar(std::string("Depth")));
  REQUIRE(table.cell(1, "number") == FieldValue::scalar(std::string("A")));
  REQUIRE(table.cell(1, "type") == FieldValue::scalar(std::string("Float")));
}

TEST_CASE("SimpleVCF: Test TSV export", "[simplevcf][table]") {
  Table table(
      {"chrom", "pos", "alts", "qual", "S1.GT"},
      {{FieldValue::scalar(std::string("chr1")),
        FieldValue::scalar(int64_t{100}),
        FieldValue::string_sequence({"G", "T"}),
        FieldValue::absent(),
        int_sequence({0, 0}, {false, true})}});

  std::ostringstream os;
  TSVExporter exporter(&os);
  exporter.export_table(table);
  exporter.close();

  REQUIRE(
      os.str() ==
      "chrom\tpos\talts\tqual\tS1.GT\n"
      "chr1\t100\tG,T\t.\t0,.\n");

  REQUIRE(TSVExporter::cell_to_str(FieldValue::scalar(true)) == "true");
  REQUIRE(TSVExporter::cell_to_str(FieldValue::absent()) == ".");
  REQUIRE(TSVExporter::cell_to_str(FieldValue::string_sequence({})) == "");
  const FieldValue one_null = FieldValue::sequence({Scalar(std::monostate())});
  REQUIRE(TSVExporter::cell_to_str(one_null) == ".");

  Table missing(
      {"alts", "filters", "qual", "AF"},
      {{FieldValue::string_sequence({}),
        FieldValue::string_sequence({}),
        FieldValue::absent(),
        one_null}});
  std::ostringstream missing_os;
  TSVExporter missing_exporter(&missing_os);
  missing_exporter.export_table(missing);
  REQUIRE(missing_os.str() == "alts\tfilters\tqual\tAF\n\t\t.\t.\n");
}
