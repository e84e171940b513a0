// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_xyz_parser.cpp
 *
 * Tests for the ASCII XYZ reader and the metadata sidecar.
 */

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>

#include "cloudreport/errors.hpp"
#include "cloudreport/io/metadata.hpp"
#include "cloudreport/io/xyz.hpp"

using namespace cloudreport;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

PointSet parseString(const std::string& content,
                     io::ParseStats* stats = nullptr) {
  std::istringstream in(content);
  return io::parseXyz(in, stats);
}

std::string writeTempFile(const std::string& content, const std::string& name) {
  std::string path = testing::TempDir() + "/" + name;
  std::ofstream fs(path);
  fs << content;
  return path;
}

}  // namespace

// ─── Line classification ─────────────────────────────────────────────────────

TEST(XyzLineTest, WhitespaceSeparated) {
  Point p;
  ASSERT_TRUE(io::parseXyzLine("1.5 -2 3e2", p));
  EXPECT_DOUBLE_EQ(p.x(), 1.5);
  EXPECT_DOUBLE_EQ(p.y(), -2.0);
  EXPECT_DOUBLE_EQ(p.z(), 300.0);
}

TEST(XyzLineTest, CommaSeparatedWithExtraColumns) {
  Point p;
  ASSERT_TRUE(io::parseXyzLine("10.0,20.0,30.0,0.75,255", p));
  EXPECT_DOUBLE_EQ(p.x(), 10.0);
  EXPECT_DOUBLE_EQ(p.y(), 20.0);
  EXPECT_DOUBLE_EQ(p.z(), 30.0);
}

TEST(XyzLineTest, MixedSeparatorsAndTabs) {
  Point p;
  ASSERT_TRUE(io::parseXyzLine("\t1, 2\t,3 ", p));
  EXPECT_DOUBLE_EQ(p.x(), 1.0);
  EXPECT_DOUBLE_EQ(p.y(), 2.0);
  EXPECT_DOUBLE_EQ(p.z(), 3.0);
}

TEST(XyzLineTest, SkippableLines) {
  Point p;
  EXPECT_FALSE(io::parseXyzLine("", p));
  EXPECT_FALSE(io::parseXyzLine("   \t ", p));
  EXPECT_FALSE(io::parseXyzLine("# x y z", p));
  EXPECT_FALSE(io::parseXyzLine("   # indented comment", p));
}

TEST(XyzLineTest, ShortLinesRejected) {
  Point p;
  EXPECT_FALSE(io::parseXyzLine("1 2", p));
  EXPECT_FALSE(io::parseXyzLine("1,2", p));
  EXPECT_FALSE(io::parseXyzLine("1", p));
}

TEST(XyzLineTest, NonNumericTokensRejected) {
  Point p;
  EXPECT_FALSE(io::parseXyzLine("x y z", p));
  EXPECT_FALSE(io::parseXyzLine("bad data here", p));
  EXPECT_FALSE(io::parseXyzLine("1 2 abc", p));
  EXPECT_FALSE(io::parseXyzLine("1.5abc 2 3", p));
  EXPECT_FALSE(io::parseXyzLine("0x10 2 3", p));
}

TEST(XyzLineTest, NonFiniteRejected) {
  Point p;
  EXPECT_FALSE(io::parseXyzLine("nan 0 0", p));
  EXPECT_FALSE(io::parseXyzLine("0 inf 0", p));
  EXPECT_FALSE(io::parseXyzLine("0 0 1e999", p));
}

TEST(XyzLineTest, UnderflowKeptAsTinyOrZero) {
  Point p;
  ASSERT_TRUE(io::parseXyzLine("1e-320 0 0", p));
  EXPECT_EQ(p.x(), 1e-320);
  EXPECT_GT(p.x(), 0.0);

  ASSERT_TRUE(io::parseXyzLine("1e-400 2 3", p));
  EXPECT_EQ(p.x(), 0.0);
  EXPECT_DOUBLE_EQ(p.z(), 3.0);
}

TEST(XyzLineTest, CarriageReturnTolerated) {
  Point p;
  ASSERT_TRUE(io::parseXyzLine("4 5 6\r", p));
  EXPECT_DOUBLE_EQ(p.z(), 6.0);
}

// ─── Whole-file parsing ──────────────────────────────────────────────────────

TEST(XyzParseTest, MixedFileKeepsValidPointsInOrder) {
  io::ParseStats stats;
  auto points = parseString(
      "0 0 0\n"
      "1 0 0\n"
      "0 1 0\n"
      "# comment\n"
      "\n"
      "bad data here\n",
      &stats);

  ASSERT_EQ(points.size(), 3u);
  EXPECT_EQ(points[0], Point(0, 0, 0));
  EXPECT_EQ(points[1], Point(1, 0, 0));
  EXPECT_EQ(points[2], Point(0, 1, 0));

  EXPECT_EQ(stats.lines_total, 6u);
  EXPECT_EQ(stats.lines_skipped, 3u);
  EXPECT_EQ(stats.points, 3u);
}

TEST(XyzParseTest, HeaderRowSkipped) {
  auto points = parseString(
      "X,Y,Z,Intensity\n"
      "1,2,3,0.5\n"
      "4,5,6,0.7\n");
  ASSERT_EQ(points.size(), 2u);
  EXPECT_EQ(points[1], Point(4, 5, 6));
}

TEST(XyzParseTest, CommentsOnlyThrows) {
  EXPECT_THROW(parseString("# a\n\n# b\n   \n"), ParseError);
}

TEST(XyzParseTest, ShortLinesOnlyThrows) {
  EXPECT_THROW(parseString("1 2\n3\n4,5\n"), ParseError);
}

TEST(XyzParseTest, EmptyInputThrows) {
  EXPECT_THROW(parseString(""), ParseError);
}

TEST(XyzParseTest, FailureMessageAndKind) {
  try {
    parseString("only text here\n");
    FAIL() << "expected ParseError";
  } catch (const ParseError& e) {
    EXPECT_EQ(e.kind(), ErrorKind::Parse);
    EXPECT_EQ(e.message(), "no valid points");
  }
}

TEST(XyzParseTest, StatsReportedOnFailure) {
  io::ParseStats stats;
  EXPECT_THROW(parseString("# c\nfoo bar baz\n", &stats), ParseError);
  EXPECT_EQ(stats.lines_total, 2u);
  EXPECT_EQ(stats.lines_skipped, 2u);
  EXPECT_EQ(stats.points, 0u);
}

// ─── File I/O ────────────────────────────────────────────────────────────────

TEST(XyzFileTest, ParsingIsIdempotent) {
  auto path = writeTempFile(
      "# scan\n"
      "0.125 -4.5 10.0 17\n"
      "1e-3, 2.5, -0.75\n"
      "garbage\n"
      "100 200 300\n",
      "test_idempotent.xyz");

  auto first = io::loadXyz(path);
  auto second = io::loadXyz(path);

  ASSERT_EQ(first.size(), 3u);
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i], second[i]) << "index " << i;
  }
  std::remove(path.c_str());
}

TEST(XyzFileTest, NonexistentFileThrows) {
  EXPECT_THROW(io::loadXyz("/nonexistent/cloud.xyz"), ParseError);
}

// ─── Metadata sidecar ────────────────────────────────────────────────────────

TEST(MetadataTest, SidecarPathSharesStem) {
  EXPECT_EQ(io::metadataPathFor("/data/site/scan.xyz"), "/data/site/scan.txt");
  EXPECT_EQ(io::metadataPathFor("scan.csv"), "scan.txt");
  EXPECT_EQ(io::metadataPathFor("/data/scan"), "/data/scan.txt");
}

TEST(MetadataTest, MissingFileIsNotAnError) {
  EXPECT_FALSE(io::readMetadata("/nonexistent/scan.txt").has_value());
  EXPECT_TRUE(io::loadMetadataFor("/nonexistent/scan.xyz").empty());
}

TEST(MetadataTest, BlankLinesDroppedAndCrStripped) {
  auto path = writeTempFile(
      "Project: Harbor survey\r\n"
      "\r\n"
      "   \n"
      "Operator: J. Doe\n",
      "test_meta_lines.txt");

  auto lines = io::readMetadata(path);
  ASSERT_TRUE(lines.has_value());
  ASSERT_EQ(lines->size(), 2u);
  EXPECT_EQ((*lines)[0], "Project: Harbor survey");
  EXPECT_EQ((*lines)[1], "Operator: J. Doe");
  std::remove(path.c_str());
}

TEST(MetadataTest, FoundBesideCloud) {
  auto cloud = writeTempFile("0 0 0\n1 1 1\n", "test_meta_cloud.xyz");
  auto sidecar = writeTempFile("Site: North pier\n", "test_meta_cloud.txt");

  auto lines = io::loadMetadataFor(cloud);
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0], "Site: North pier");
  std::remove(cloud.c_str());
  std::remove(sidecar.c_str());
}

TEST(MetadataTest, TxtCloudIsNotItsOwnMetadata) {
  auto cloud = writeTempFile("0 0 0\n1 1 1\n", "test_meta_self.txt");
  EXPECT_TRUE(io::loadMetadataFor(cloud).empty());
  std::remove(cloud.c_str());
}
