/**
 * @file   unit-vcf-header.cc
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
 * Tests for VCF header parsing.
 */

#include <catch2/catch.hpp>

#include "unit-helpers.h"
#include "utils/exceptions.h"
#include "vcf/header.h"

using namespace simplevcf::vcf;
using simplevcf::vcf::test::tsv;

namespace {

const std::string column_header =
    tsv({"#CHROM", "POS", "ID", "REF", "ALT", "QUAL", "FILTER", "INFO"});

std::string with_samples(const std::vector<std::string>& samples) {
  std::vector<std::string> cols = {
      "#CHROM", "POS", "ID", "REF", "ALT", "QUAL", "FILTER", "INFO", "FORMAT"};
  cols.insert(cols.end(), samples.begin(), samples.end());
  return tsv(cols);
}

}  // namespace

TEST_CASE("SimpleVCF: Test arity parsing", "[simplevcf][header]") {
  Arity a;
  REQUIRE(Arity::parse("1", &a));
  REQUIRE(a == Arity::fixed(1));
  REQUIRE(a.is_scalar());
  REQUIRE(Arity::parse("0", &a));
  REQUIRE(a == Arity::fixed(0));
  REQUIRE(Arity::parse("3", &a));
  REQUIRE(a.kind == Arity::Kind::Fixed);
  REQUIRE(a.count == 3);
  REQUIRE(!a.is_scalar());
  REQUIRE(Arity::parse("A", &a));
  REQUIRE(a.kind == Arity::Kind::PerAlt);
  REQUIRE(Arity::parse("R", &a));
  REQUIRE(a.kind == Arity::Kind::PerAllele);
  REQUIRE(Arity::parse("G", &a));
  REQUIRE(a.kind == Arity::Kind::PerGenotype);
  REQUIRE(Arity::parse(".", &a));
  REQUIRE(a.kind == Arity::Kind::Variable);
  REQUIRE(a.to_str() == ".");

  REQUIRE(!Arity::parse("", &a));
  REQUIRE(!Arity::parse("-1", &a));
  REQUIRE(!Arity::parse("X", &a));
  REQUIRE(!Arity::parse("1.5", &a));

  ValueType t;
  REQUIRE(parse_value_type("Integer", &t));
  REQUIRE(t == ValueType::Integer);
  REQUIRE(parse_value_type("Character", &t));
  REQUIRE(t == ValueType::String);
  REQUIRE(!parse_value_type("Double", &t));
  REQUIRE(value_type_str(ValueType::Flag) == "Flag");
}

TEST_CASE("SimpleVCF: Test header parsing", "[simplevcf][header]") {
  const std::string text =
      "##fileformat=VCFv4.2\n"
      "##FILTER=<ID=PASS,Description=\"All filters passed\">\n"
      "##contig=<ID=chr1,length=1000>\n"
      "##contig=<ID=chr2,length=500>\n"
      "##INFO=<ID=DP,Number=1,Type=Integer,Description=\"Total depth\">\n"
      "##INFO=<ID=AF,Number=A,Type=Float,Description=\"Allele frequency\">\n"
      "##INFO=<ID=DB,Number=0,Type=Flag,Description=\"dbSNP\">\n"
      "##INFO=<ID=ANN,Number=.,Type=String,Description=\"A, \\\"quoted\\\" "
      "text=with commas\">\n"
      "##source=unit-test\n"
      "##FORMAT=<ID=GT,Number=1,Type=String,Description=\"Genotype\">\n"
      "##FORMAT=<ID=PL,Number=G,Type=Integer,Description=\"Likelihoods\">\n" +
      with_samples({"S1", "S2", "S3"}) + "\n";

  VCFHeader hdr = VCFHeader::parse(text);
  REQUIRE(hdr.file_format() == "VCFv4.2");
  REQUIRE(hdr.raw_text() == text);

  const auto& info = hdr.info_fields();
  REQUIRE(info.size() == 4);
  REQUIRE(info[0].name == "DP");
  REQUIRE(info[0].arity == Arity::fixed(1));
  REQUIRE(info[0].type == ValueType::Integer);
  REQUIRE(info[0].description == "Total depth");
  REQUIRE(info[1].name == "AF");
  REQUIRE(info[1].arity.kind == Arity::Kind::PerAlt);
  REQUIRE(info[1].type == ValueType::Float);
  REQUIRE(info[2].name == "DB");
  REQUIRE(info[2].type == ValueType::Flag);
  REQUIRE(info[2].arity == Arity::fixed(0));
  REQUIRE(info[3].name == "ANN");
  REQUIRE(info[3].arity.kind == Arity::Kind::Variable);
  REQUIRE(info[3].description == "A, \"quoted\" text=with commas");

  const auto& fmt = hdr.format_fields();
  REQUIRE(fmt.size() == 2);
  REQUIRE(fmt[0].name == "GT");
  REQUIRE(fmt[1].name == "PL");
  REQUIRE(fmt[1].arity.kind == Arity::Kind::PerGenotype);
  REQUIRE(hdr.has_genotypes());

  REQUIRE(hdr.sample_names() == std::vector<std::string>{"S1", "S2", "S3"});
  REQUIRE(hdr.sample_index("S2") == 1);
  REQUIRE(hdr.sample_index("S4") == -1);
  REQUIRE(hdr.contigs() == std::vector<std::string>{"chr1", "chr2"});
  REQUIRE(hdr.filters() == std::vector<std::string>{"PASS"});

  REQUIRE(hdr.info_field("AF") == &info[1]);
  REQUIRE(hdr.info_field("GT") == nullptr);
  REQUIRE(hdr.format_field("PL") == &fmt[1]);
  REQUIRE(hdr.format_field("DP") == nullptr);
}

TEST_CASE("SimpleVCF: Test sites-only header", "[simplevcf][header]") {
  VCFHeader hdr = VCFHeader::parse(
      "##INFO=<ID=DP,Number=1,Type=Integer,Description=\"\">\n" +
      column_header + "\n");
  REQUIRE(hdr.sample_names().empty());
  REQUIRE(hdr.format_fields().empty());
  REQUIRE(!hdr.has_genotypes());
  REQUIRE(hdr.file_format().empty());
}

TEST_CASE("SimpleVCF: Test header normalization", "[simplevcf][header]") {
  SECTION("- Flag with non-zero Number") {
    VCFHeader hdr = VCFHeader::parse(
        "##INFO=<ID=DB,Number=1,Type=Flag,Description=\"dbSNP\">\n" +
        column_header + "\n");
    REQUIRE(hdr.info_fields().size() == 1);
    REQUIRE(hdr.info_fields()[0].arity == Arity::fixed(0));
  }

  SECTION("- Duplicate declaration keeps the first") {
    VCFHeader hdr = VCFHeader::parse(
        "##INFO=<ID=DP,Number=1,Type=Integer,Description=\"first\">\n"
        "##INFO=<ID=DP,Number=.,Type=String,Description=\"second\">\n" +
        column_header + "\n");
    REQUIRE(hdr.info_fields().size() == 1);
    REQUIRE(hdr.info_fields()[0].description == "first");
    REQUIRE(hdr.info_fields()[0].type == ValueType::Integer);
  }

  SECTION("- Sample names are trimmed, CRLF line endings accepted") {
    VCFHeader hdr = VCFHeader::parse(
        "##fileformat=VCFv4.2\r\n" + with_samples({" S1 ", "S2"}) + "\r\n");
    REQUIRE(hdr.sample_names() == std::vector<std::string>{"S1", "S2"});
    REQUIRE(hdr.file_format() == "VCFv4.2");
  }
}

TEST_CASE("SimpleVCF: Test malformed headers", "[simplevcf][header]") {
  SECTION("- Missing Type") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse(
            "##INFO=<ID=DP,Number=1,Description=\"Depth\">\n" + column_header),
        MalformedHeaderError);
  }

  SECTION("- Missing ID") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse(
            "##FORMAT=<Number=1,Type=Integer,Description=\"Depth\">\n" +
            column_header),
        MalformedHeaderError);
  }

  SECTION("- Missing Number") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse(
            "##INFO=<ID=DP,Type=Integer,Description=\"Depth\">\n" +
            column_header),
        MalformedHeaderError);
  }

  SECTION("- Unknown Type") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse(
            "##INFO=<ID=DP,Number=1,Type=Long,Description=\"Depth\">\n" +
            column_header),
        MalformedHeaderError);
  }

  SECTION("- Invalid Number") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse(
            "##INFO=<ID=DP,Number=Z,Type=Integer,Description=\"Depth\">\n" +
            column_header),
        MalformedHeaderError);
  }

  SECTION("- Number=0 on a non-Flag field") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse(
            "##INFO=<ID=DP,Number=0,Type=Integer,Description=\"Depth\">\n" +
            column_header),
        MalformedHeaderError);
  }

  SECTION("- Unstructured INFO line") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse("##INFO=DP\n" + column_header), MalformedHeaderError);
  }

  SECTION("- Unterminated quote") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse(
            "##INFO=<ID=DP,Number=1,Type=Integer,Description=\"Depth>\n" +
            column_header),
        MalformedHeaderError);
  }

  SECTION("- Missing column header line") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse("##fileformat=VCFv4.2\n"), MalformedHeaderError);
  }

  SECTION("- Too few fixed columns") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse(tsv({"#CHROM", "POS", "ID", "REF", "ALT"}) + "\n"),
        MalformedHeaderError);
  }

  SECTION("- Misspelled fixed column") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse(
            tsv({"#CHROM",
                 "POS",
                 "ID",
                 "REF",
                 "ALT",
                 "QUAL",
                 "FILTERS",
                 "INFO"}) +
            "\n"),
        MalformedHeaderError);
  }

  SECTION("- Duplicate sample") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse(with_samples({"S1", "S1"}) + "\n"),
        MalformedHeaderError);
  }

  SECTION("- Invalid sample name") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse(with_samples({"S1,S2"}) + "\n"),
        MalformedHeaderError);
  }

  SECTION("- Data line in the header") {
    REQUIRE_THROWS_AS(
        VCFHeader::parse("chr1\t1\n" + column_header), MalformedHeaderError);
  }
}
