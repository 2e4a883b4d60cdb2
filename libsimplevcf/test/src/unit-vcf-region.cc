/**
 * @file   unit-vcf-region.cc
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
 * Tests for region string parsing.
 */

#include <catch2/catch.hpp>

#include <limits>

#include "utils/exceptions.h"
#include "vcf/region.h"

using namespace simplevcf::vcf;

TEST_CASE("SimpleVCF: Test region parsing", "[simplevcf][region]") {
  SECTION("- contig:start-end is converted to 0-based") {
    Region r = Region::parse_region("chr1:100-200");
    REQUIRE(r.seq_name == "chr1");
    REQUIRE(r.min == 99);
    REQUIRE(r.max == 199);
    REQUIRE(r.to_str() == "chr1:100-200");
  }

  SECTION("- commas are stripped") {
    Region r("chr2:1,000-2,000");
    REQUIRE(r.seq_name == "chr2");
    REQUIRE(r.min == 999);
    REQUIRE(r.max == 1999);
  }

  SECTION("- contig only") {
    Region r = Region::parse_region("chrX");
    REQUIRE(r.seq_name == "chrX");
    REQUIRE(r.min == 0);
    REQUIRE(r.max == std::numeric_limits<uint32_t>::max() - 1);
  }

  SECTION("- contig:start") {
    Region r = Region::parse_region("1:500");
    REQUIRE(r.seq_name == "1");
    REQUIRE(r.min == 499);
    REQUIRE(r.max == std::numeric_limits<uint32_t>::max() - 1);
  }

  SECTION("- single position") {
    Region r = Region::parse_region("chr1:7-7");
    REQUIRE(r.min == 6);
    REQUIRE(r.max == 6);
  }

  SECTION("- contig names containing ':'") {
    Region r = Region::parse_region("HLA-A*01:01:1-10");
    REQUIRE(r.seq_name == "HLA-A*01:01");
    REQUIRE(r.min == 0);
    REQUIRE(r.max == 9);
  }
}

TEST_CASE("SimpleVCF: Test invalid regions", "[simplevcf][region]") {
  REQUIRE_THROWS_AS(Region::parse_region(""), RegionSyntaxError);
  REQUIRE_THROWS_AS(Region::parse_region("   "), RegionSyntaxError);
  REQUIRE_THROWS_AS(Region::parse_region(":1-10"), RegionSyntaxError);
  REQUIRE_THROWS_AS(Region::parse_region("chr1:"), RegionSyntaxError);
  REQUIRE_THROWS_AS(Region::parse_region("chr1:a-b"), RegionSyntaxError);
  REQUIRE_THROWS_AS(Region::parse_region("chr1:0-10"), RegionSyntaxError);
  REQUIRE_THROWS_AS(Region::parse_region("chr1:-5"), RegionSyntaxError);
  REQUIRE_THROWS_AS(Region::parse_region("chr1:10-"), RegionSyntaxError);
  REQUIRE_THROWS_AS(Region::parse_region("chr1:1-2-3"), RegionSyntaxError);
  REQUIRE_THROWS_AS(Region::parse_region("chr1:20-10"), RegionSyntaxError);

  // RegionSyntaxError is an invalid_argument.
  REQUIRE_THROWS_AS(Region::parse_region("chr1:x"), std::invalid_argument);
}

TEST_CASE("SimpleVCF: Test region containment", "[simplevcf][region]") {
  Region r = Region::parse_region("chr1:100-200");
  REQUIRE(r.contains("chr1", 100));
  REQUIRE(r.contains("chr1", 150));
  REQUIRE(r.contains("chr1", 200));
  REQUIRE(!r.contains("chr1", 99));
  REQUIRE(!r.contains("chr1", 201));
  REQUIRE(!r.contains("chr2", 150));
}
