/**
 * @file   unit-projection.cc
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
 * Tests for projecting records into rows.
 */

#include <catch2/catch.hpp>

#include <algorithm>

#include "read/projection.h"
#include "unit-helpers.h"
#include "utils/exceptions.h"
#include "vcf/record_decoder.h"

using namespace simplevcf::vcf;
using simplevcf::vcf::test::int_sequence;
using simplevcf::vcf::test::tsv;

namespace {

std::vector<std::string> column_names(const Row& row) {
  std::vector<std::string> names;
  for (const auto& cell : row.cells())
    names.push_back(cell.first);
  return names;
}

VCFHeader two_sample_header() {
  return VCFHeader::parse(
      "##INFO=<ID=DP,Number=1,Type=Integer,Description=\"\">\n"
      "##INFO=<ID=AF,Number=A,Type=Float,Description=\"\">\n"
      "##FORMAT=<ID=GT,Number=1,Type=String,Description=\"\">\n"
      "##FORMAT=<ID=DP,Number=1,Type=Integer,Description=\"\">\n"
      "##FORMAT=<ID=GQ,Number=1,Type=Integer,Description=\"\">\n" +
      tsv({"#CHROM",
           "POS",
           "ID",
           "REF",
           "ALT",
           "QUAL",
           "FILTER",
           "INFO",
           "FORMAT",
           "S1",
           "S2"}) +
      "\n");
}

}  // namespace

TEST_CASE("SimpleVCF: Test Row", "[simplevcf][projection]") {
  Row row;
  REQUIRE(row.size() == 0);
  row.set("b", FieldValue::scalar(int64_t{1}));
  row.set("a", FieldValue::absent());
  row.set("b", FieldValue::scalar(int64_t{2}));
  REQUIRE(row.size() == 2);
  REQUIRE(column_names(row) == std::vector<std::string>{"b", "a"});
  REQUIRE(*row.get("b") == FieldValue::scalar(int64_t{2}));
  REQUIRE(row.contains("a"));
  REQUIRE(row.get("c") == nullptr);
}

TEST_CASE("SimpleVCF: Test projecting DP/GT record", "[simplevcf][projection]") {
  VCFHeader hdr = VCFHeader::parse(simplevcf::vcf::test::dp_gt_header());
  RecordDecoder decoder(&hdr);
  VariantRecord rec = decoder.decode(
      tsv({"chr1", "100", ".", "A", "G", ".", "PASS", "DP=10", "GT:DP", "0/1:5"}),
      1);

  ProjectionRequest request;
  request.info_fields = FieldSelection::only({"DP"});
  request.sample_fields = FieldSelection::only({"DP"});
  request.samples = FieldSelection::only({"S1"});
  FieldProjector projector(&hdr, request);

  Row row = projector.project(rec);
  REQUIRE(
      column_names(row) == std::vector<std::string>{"chrom",
                                                    "pos",
                                                    "id",
                                                    "ref",
                                                    "alts",
                                                    "qual",
                                                    "filters",
                                                    "DP",
                                                    "S1.phased",
                                                    "S1.GT",
                                                    "S1.DP"});
  REQUIRE(*row.get("chrom") == FieldValue::scalar(std::string("chr1")));
  REQUIRE(*row.get("pos") == FieldValue::scalar(int64_t{100}));
  REQUIRE(row.get("id")->is_absent());
  REQUIRE(*row.get("ref") == FieldValue::scalar(std::string("A")));
  REQUIRE(*row.get("alts") == FieldValue::string_sequence({"G"}));
  REQUIRE(row.get("qual")->is_absent());
  REQUIRE(*row.get("filters") == FieldValue::string_sequence({"PASS"}));
  REQUIRE(*row.get("DP") == FieldValue::scalar(int64_t{10}));
  REQUIRE(*row.get("S1.phased") == FieldValue::scalar(false));
  REQUIRE(*row.get("S1.GT") == int_sequence({0, 1}));
  REQUIRE(*row.get("S1.DP") == FieldValue::scalar(int64_t{5}));

  REQUIRE(projector.column_order() == column_names(row));
}

TEST_CASE("SimpleVCF: Test projection selections", "[simplevcf][projection]") {
  VCFHeader hdr = two_sample_header();
  RecordDecoder decoder(&hdr);
  VariantRecord rec = decoder.decode(
      tsv({"chr1",
           "10",
           "rs1",
           "A",
           "C",
           "20",
           "PASS",
           "AF=0.5;DP=3;XX=1",
           "GT:GQ:DP:YY",
           "0|1:30:4:a",
           "1/1:10:6:b"}),
      1);

  SECTION("- default request selects everything declared") {
    FieldProjector projector(&hdr, ProjectionRequest());
    REQUIRE(
        projector.column_order() ==
        std::vector<std::string>{"chrom",
                                 "pos",
                                 "id",
                                 "ref",
                                 "alts",
                                 "qual",
                                 "filters",
                                 "DP",
                                 "AF",
                                 "S1.phased",
                                 "S1.GT",
                                 "S1.DP",
                                 "S1.GQ",
                                 "S2.phased",
                                 "S2.GT",
                                 "S2.DP",
                                 "S2.GQ"});

    Row row = projector.project(rec);
    // "all" also selects keys the header does not declare.
    REQUIRE(*row.get("XX") == FieldValue::scalar(std::string("1")));
    REQUIRE(*row.get("S1.YY") == FieldValue::scalar(std::string("a")));
    REQUIRE(*row.get("S1.phased") == FieldValue::scalar(true));
    REQUIRE(*row.get("S2.GQ") == FieldValue::scalar(int64_t{10}));
    REQUIRE(*row.get("qual") == FieldValue::scalar(20.0));
    REQUIRE(*row.get("id") == FieldValue::scalar(std::string("rs1")));
  }

  SECTION("- explicit selections keep request order") {
    ProjectionRequest request;
    request.info_fields = FieldSelection::only({"AF", "DP"});
    request.sample_fields = FieldSelection::only({"GQ"});
    request.samples = FieldSelection::only({"S2"});
    FieldProjector projector(&hdr, request);
    REQUIRE(
        projector.column_order() ==
        std::vector<std::string>{"chrom",
                                 "pos",
                                 "id",
                                 "ref",
                                 "alts",
                                 "qual",
                                 "filters",
                                 "AF",
                                 "DP",
                                 "S2.phased",
                                 "S2.GT",
                                 "S2.GQ"});

    Row row = projector.project(rec);
    REQUIRE(!row.contains("S1.GT"));
    REQUIRE(!row.contains("S2.DP"));
    REQUIRE(!row.contains("XX"));
    REQUIRE(!row.contains("S2.YY"));
    REQUIRE(*row.get("S2.GQ") == FieldValue::scalar(int64_t{10}));
    REQUIRE(*row.get("S2.GT") == int_sequence({1, 1}));
    REQUIRE(*row.get("AF") == FieldValue::sequence({Scalar(0.5)}));
  }

  SECTION("- empty selections emit fixed columns only") {
    ProjectionRequest request;
    request.info_fields = FieldSelection::only({});
    request.sample_fields = FieldSelection::only({});
    request.samples = FieldSelection::only({});
    FieldProjector projector(&hdr, request);
    REQUIRE(projector.column_order() == FIXED_FIELD_COLUMNS);
    REQUIRE(column_names(projector.project(rec)) == FIXED_FIELD_COLUMNS);
  }

  SECTION("- include_unspecified adds everything else") {
    ProjectionRequest request;
    request.info_fields = FieldSelection::only({"AF"});
    request.sample_fields = FieldSelection::only({"GQ"});
    request.samples = FieldSelection::only({"S2"});
    request.include_unspecified = true;
    FieldProjector projector(&hdr, request);
    REQUIRE(
        projector.column_order() ==
        std::vector<std::string>{"chrom",
                                 "pos",
                                 "id",
                                 "ref",
                                 "alts",
                                 "qual",
                                 "filters",
                                 "AF",
                                 "DP",
                                 "S2.phased",
                                 "S2.GT",
                                 "S2.GQ",
                                 "S2.DP",
                                 "S1.phased",
                                 "S1.GT",
                                 "S1.GQ",
                                 "S1.DP"});

    Row row = projector.project(rec);
    REQUIRE(*row.get("XX") == FieldValue::scalar(std::string("1")));
    REQUIRE(*row.get("S1.YY") == FieldValue::scalar(std::string("a")));
    REQUIRE(*row.get("S1.DP") == FieldValue::scalar(int64_t{4}));
  }
}

TEST_CASE("SimpleVCF: Test unknown requested names", "[simplevcf][projection]") {
  VCFHeader hdr = two_sample_header();

  ProjectionRequest request;
  request.info_fields = FieldSelection::only({"DP", "NOPE"});
  request.samples = FieldSelection::only({"S9"});

  SECTION("- strict mode throws") {
    request.strict = true;
    REQUIRE_THROWS_AS(FieldProjector(&hdr, request), UnknownFieldError);

    ProjectionRequest fields_only;
    fields_only.sample_fields = FieldSelection::only({"PL"});
    fields_only.strict = true;
    REQUIRE_THROWS_AS(FieldProjector(&hdr, fields_only), UnknownFieldError);
  }

  SECTION("- otherwise the columns are kept") {
    FieldProjector projector(&hdr, request);
    const auto& order = projector.column_order();
    REQUIRE(
        std::find(order.begin(), order.end(), "NOPE") != order.end());
    REQUIRE(
        std::find(order.begin(), order.end(), "S9.GT") != order.end());
  }
}

TEST_CASE("SimpleVCF: Test FieldSelection", "[simplevcf][projection]") {
  FieldSelection all;
  REQUIRE(all.is_all());
  REQUIRE(all.contains("anything"));

  FieldSelection some = FieldSelection::only({"b", "a", "b"});
  REQUIRE(!some.is_all());
  REQUIRE(some.names() == std::vector<std::string>{"b", "a"});
  REQUIRE(some.contains("a"));
  REQUIRE(!some.contains("c"));

  REQUIRE(!FieldSelection::only({}).contains("a"));
}
