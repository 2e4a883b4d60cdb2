/**
 * @file   unit-reader.cc
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
 * Tests for class Reader.
 */

#include <catch2/catch.hpp>

#include "read/reader.h"
#include "unit-helpers.h"
#include "utils/exceptions.h"

using namespace simplevcf::vcf;
using simplevcf::vcf::test::int_sequence;

static const std::string input_dir = SIMPLEVCF_TEST_INPUT_DIR;

namespace {

ReadParams small_vcf_params() {
  ReadParams params;
  params.uri = input_dir + "/small.vcf";
  return params;
}

}  // namespace

TEST_CASE("SimpleVCF: Test read all records", "[simplevcf][reader]") {
  Reader reader;
  reader.set_all_params(small_vcf_params());
  reader.open();

  Table table = reader.read();
  REQUIRE(table.num_rows() == 5);
  REQUIRE(reader.num_records_read() == 5);
  REQUIRE(
      table.column_names() == std::vector<std::string>{"chrom",
                                                       "pos",
                                                       "id",
                                                       "ref",
                                                       "alts",
                                                       "qual",
                                                       "filters",
                                                       "DP",
                                                       "AF",
                                                       "DB",
                                                       "ANN",
                                                       "S1.phased",
                                                       "S1.GT",
                                                       "S1.DP",
                                                       "S1.AD",
                                                       "S2.phased",
                                                       "S2.GT",
                                                       "S2.DP",
                                                       "S2.AD"});

  // chr1:50
  REQUIRE(table.cell(0, "id") == FieldValue::scalar(std::string("rs1")));
  REQUIRE(table.cell(0, "DB") == FieldValue::scalar(true));
  REQUIRE(table.cell(0, "S1.AD") == int_sequence({3, 2}));
  REQUIRE(table.cell(0, "S2.phased") == FieldValue::scalar(true));

  // chr1:100
  REQUIRE(table.cell(1, "id").is_absent());
  REQUIRE(table.cell(1, "qual").is_absent());
  REQUIRE(table.cell(1, "alts") == FieldValue::string_sequence({"T", "G"}));
  REQUIRE(
      table.cell(1, "filters") == FieldValue::string_sequence({"LowQual"}));
  REQUIRE(
      table.cell(1, "AF") ==
      FieldValue::sequence({Scalar(0.25), Scalar(std::monostate())}));
  REQUIRE(table.cell(1, "DB").is_absent());
  REQUIRE(table.cell(1, "S1.GT") == int_sequence({1, 2}));
  REQUIRE(table.cell(1, "S1.phased") == FieldValue::scalar(true));
  REQUIRE(table.cell(1, "S1.AD").is_absent());
  REQUIRE(table.cell(1, "S2.GT") == int_sequence({0, 0}, {true, true}));
  REQUIRE(table.cell(1, "S2.phased") == FieldValue::scalar(false));
  REQUIRE(table.cell(1, "S2.DP").is_absent());

  // chr1:150
  REQUIRE(table.cell(2, "alts") == FieldValue::string_sequence({}));
  REQUIRE(table.cell(2, "filters") == FieldValue::string_sequence({}));
  REQUIRE(table.cell(2, "qual") == FieldValue::scalar(12.5));
  REQUIRE(table.cell(2, "S2.AD") == int_sequence({0, 4}, {true, false}));

  // chr1:250
  REQUIRE(
      table.cell(3, "ANN") ==
      FieldValue::sequence({Scalar(std::string("x|y")), Scalar(std::string("z"))}));
  REQUIRE(table.cell(3, "S2.GT") == int_sequence({0}, {true}));

  // chr2:120
  REQUIRE(table.cell(4, "chrom") == FieldValue::scalar(std::string("chr2")));
  REQUIRE(table.cell(4, "pos") == FieldValue::scalar(int64_t{120}));
}

TEST_CASE("SimpleVCF: Test read region", "[simplevcf][reader]") {
  Reader reader;
  reader.set_all_params(small_vcf_params());
  reader.set_region("chr1:100-200");
  reader.set_info_fields("DP");
  reader.set_sample_fields("DP");
  reader.set_samples("S2");
  reader.open();

  Table table = reader.read();
  REQUIRE(
      table.column_names() == std::vector<std::string>{"chrom",
                                                       "pos",
                                                       "id",
                                                       "ref",
                                                       "alts",
                                                       "qual",
                                                       "filters",
                                                       "DP",
                                                       "S2.phased",
                                                       "S2.GT",
                                                       "S2.DP"});
  REQUIRE(table.num_rows() == 2);
  REQUIRE(table.cell(0, "pos") == FieldValue::scalar(int64_t{100}));
  REQUIRE(table.cell(0, "DP") == FieldValue::scalar(int64_t{20}));
  REQUIRE(table.cell(1, "pos") == FieldValue::scalar(int64_t{150}));
  REQUIRE(table.cell(1, "DP").is_absent());
  REQUIRE(table.cell(1, "S2.DP") == FieldValue::scalar(int64_t{4}));

  // Reading again restarts the query.
  Table again = reader.read();
  REQUIRE(again.num_rows() == 2);

  reader.set_region("chr3");
  REQUIRE(reader.read().num_rows() == 0);

  reader.set_region("chr1:bad");
  REQUIRE_THROWS_AS(reader.read(), RegionSyntaxError);
}

TEST_CASE("SimpleVCF: Test read indexed region", "[simplevcf][reader]") {
  ReadParams params;
  params.uri = input_dir + "/small.vcf.gz";
  params.index_uri = input_dir + "/small_custom.tbi";
  params.region = "chr1:100-200";
  params.samples = std::vector<std::string>{"S1"};

  Reader reader;
  reader.set_all_params(params);
  reader.open();

  Table table = reader.read();
  REQUIRE(table.num_rows() == 2);
  REQUIRE(table.cell(0, "pos") == FieldValue::scalar(int64_t{100}));
  REQUIRE(table.cell(1, "pos") == FieldValue::scalar(int64_t{150}));
  REQUIRE(table.cell(1, "id") == FieldValue::scalar(std::string("rs3")));
  REQUIRE(table.column_index("S2.GT") == -1);

  reader.set_region("chr1:300-400");
  REQUIRE(reader.read().num_rows() == 0);

  reader.set_region("chrUn");
  REQUIRE(reader.read().num_rows() == 0);
}

TEST_CASE("SimpleVCF: Test read options", "[simplevcf][reader]") {
  Reader reader;
  reader.set_all_params(small_vcf_params());

  SECTION("- read before open") {
    REQUIRE_THROWS_AS(reader.read(), std::runtime_error);
    REQUIRE_THROWS_AS(reader.read_info_schema(), std::runtime_error);
  }

  SECTION("- max records") {
    reader.set_max_num_records(2);
    reader.open();
    Table table = reader.read();
    REQUIRE(table.num_rows() == 2);
    REQUIRE(reader.num_records_read() == 2);
  }

  SECTION("- strict fields") {
    reader.set_info_fields("DP,NOPE");
    reader.set_strict_fields(true);
    reader.open();
    REQUIRE_THROWS_AS(reader.read(), UnknownFieldError);

    reader.set_strict_fields(false);
    Table table = reader.read();
    REQUIRE(table.column_index("NOPE") >= 0);
    for (size_t i = 0; i < table.num_rows(); i++)
      REQUIRE(table.cell(i, "NOPE").is_absent());
  }

  SECTION("- include unspecified") {
    reader.set_info_fields("AF");
    reader.set_samples("S1");
    reader.set_sample_fields("AD");
    reader.set_include_unspecified(true);
    reader.open();
    Table table = reader.read();
    REQUIRE(table.column_index("AF") == 7);
    REQUIRE(table.column_index("DP") == 8);
    REQUIRE(table.column_index("S1.AD") >= 0);
    REQUIRE(table.column_index("S2.DP") >= 0);
    REQUIRE(table.num_columns() == 19);
  }
}

TEST_CASE("SimpleVCF: Test read schema", "[simplevcf][reader]") {
  Reader reader;
  reader.set_all_params(small_vcf_params());
  reader.open();

  Table info = reader.read_info_schema();
  REQUIRE(info.num_rows() == 4);
  REQUIRE(info.cell(1, "name") == FieldValue::scalar(std::string("AF")));
  REQUIRE(info.cell(1, "number") == FieldValue::scalar(std::string("A")));
  REQUIRE(info.cell(2, "type") == FieldValue::scalar(std::string("Flag")));
  REQUIRE(
      info.cell(3, "description") ==
      FieldValue::scalar(std::string("Annotation, \"quoted\", with commas")));

  Table format = reader.read_sample_schema();
  REQUIRE(format.num_rows() == 3);
  REQUIRE(format.cell(2, "number") == FieldValue::scalar(std::string("R")));

  REQUIRE(reader.header().sample_names() == std::vector<std::string>{"S1", "S2"});
}

TEST_CASE("SimpleVCF: Test read text", "[simplevcf][reader]") {
  Reader reader;
  reader.open_text(
      simplevcf::vcf::test::dp_gt_header() +
      simplevcf::vcf::test::tsv(
          {"chr1", "100", ".", "A", "G", ".", "PASS", "DP=10", "GT:DP", "0/1:5"}) +
      "\n");
  reader.set_sample_fields("DP");

  Table table = reader.read();
  REQUIRE(table.num_rows() == 1);
  REQUIRE(table.cell(0, "DP") == FieldValue::scalar(int64_t{10}));
  REQUIRE(table.cell(0, "S1.phased") == FieldValue::scalar(false));
  REQUIRE(table.cell(0, "S1.GT") == int_sequence({0, 1}));
  REQUIRE(table.cell(0, "S1.DP") == FieldValue::scalar(int64_t{5}));
}
