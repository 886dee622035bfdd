#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "chunk_resolver.hpp"
#include "digest_utility.hpp"
#include "stream_combiner.hpp"
#include "test_helpers.hpp"

using namespace ::testing;
using namespace ChunkCombiner;
using ChunkCombiner::Chunks::ChunkResolver;
using ChunkCombiner::Chunks::ChunkSet;
using ChunkCombiner::Testing::readFile;
using ChunkCombiner::Testing::TempDir;
using ChunkCombiner::Testing::writeFile;

namespace fs = std::filesystem;

namespace {

const char* const kEmptyMd5 = "d41d8cd98f00b204e9800998ecf8427e";
const char* const kEmptySha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
const char* const kAbcMd5 = "900150983cd24fb0d6963f7d28e17f72";
const char* const kAbcSha256 = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

std::string patternData(size_t size) {
  std::string data(size, '\0');
  uint32_t state = 2463534242u;
  for (size_t i = 0; i < size; ++i) {
    state ^= state << 13;
    state ^= state >> 17;
    state ^= state << 5;
    data[i] = static_cast<char>(state & 0xFF);
  }
  return data;
}

class StreamCombinerTest : public ::testing::Test {
protected:
  ChunkCombiner::Testing::TempDir dir_;

  // Split `data` at `cuts` into "<base>.001", "<base>.002", ...
  ChunkSet splitInto(const std::string& base, const std::string& data, const std::vector<size_t>& cuts) {
    size_t start = 0;
    int index = 1;
    std::vector<size_t> bounds(cuts);
    bounds.push_back(data.size());
    for (size_t end : bounds) {
      char suffix[8];
      std::snprintf(suffix, sizeof(suffix), "%03d", index++);
      writeFile(dir_ / (base + "." + suffix), data.substr(start, end - start));
      start = end;
    }
    return ChunkResolver::resolve(dir_ / (base + ".001"));
  }
};

}  // namespace

TEST_F(StreamCombinerTest, RoundTripRestoresOriginal) {
  const std::string original = patternData(100000);
  const std::vector<char> bytes(original.begin(), original.end());
  const std::string md5 = Digest::hexDigest(bytes, Digest::Algorithm::MD5);
  const std::string sha256 = Digest::hexDigest(bytes, Digest::Algorithm::SHA256);

  ChunkSet set = splitInto("blob.tar.gz", original, {1, 4097, 4098, 65536, 99999});
  ASSERT_EQ(set.chunks.size(), 6u);

  fs::path output = dir_ / "restored.tar.gz";
  auto result = StreamCombiner::combine(set, output, 1000);

  EXPECT_EQ(readFile(output), original);
  EXPECT_EQ(result.totalBytes(), original.size());
  EXPECT_EQ(result.md5(), md5);
  EXPECT_EQ(result.sha256(), sha256);
  EXPECT_EQ(result.outputPath(), output);
  ASSERT_EQ(result.chunkNames().size(), 6u);
  EXPECT_EQ(result.chunkNames().front(), "blob.tar.gz.001");
  EXPECT_EQ(result.chunkNames().back(), "blob.tar.gz.006");
}

TEST_F(StreamCombinerTest, BufferSizeDoesNotChangeOutput) {
  const std::string original = patternData(5000);
  ChunkSet set = splitInto("f", original, {1234, 2500});

  for (size_t buffer_size : {1u, 7u, 4096u, 1u << 20}) {
    fs::path output = dir_ / ("out_" + std::to_string(buffer_size));
    auto result = StreamCombiner::combine(set, output, buffer_size);
    EXPECT_EQ(readFile(output), original) << buffer_size;
    EXPECT_EQ(result.totalBytes(), 5000u);
  }
}

TEST_F(StreamCombinerTest, KnownDigests) {
  ChunkSet set = splitInto("abc", "abc", {1, 2});
  auto result = StreamCombiner::combine(set, dir_ / "abc", 8);
  EXPECT_EQ(result.md5(), kAbcMd5);
  EXPECT_EQ(result.sha256(), kAbcSha256);
}

TEST_F(StreamCombinerTest, EmptyChunksGiveEmptyOutput) {
  ChunkSet set = splitInto("empty", "", {0});
  ASSERT_EQ(set.chunks.size(), 2u);

  std::vector<double> fractions;
  auto result = StreamCombiner::combine(set, dir_ / "empty", 16,
                                        [&fractions](const CombineProgress& p) { fractions.push_back(p.fraction()); });
  EXPECT_EQ(result.totalBytes(), 0u);
  EXPECT_EQ(result.md5(), kEmptyMd5);
  EXPECT_EQ(result.sha256(), kEmptySha256);
  EXPECT_TRUE(fs::exists(dir_ / "empty"));
  EXPECT_EQ(fs::file_size(dir_ / "empty"), 0u);
  for (double f : fractions) {
    EXPECT_DOUBLE_EQ(f, 1.0);
  }
}

TEST_F(StreamCombinerTest, IdempotentAcrossRuns) {
  ChunkSet set = splitInto("same", patternData(3000), {1000, 2000});

  auto first = StreamCombiner::combine(set, dir_ / "first", 512);
  auto second = StreamCombiner::combine(set, dir_ / "second", 512);

  EXPECT_EQ(readFile(dir_ / "first"), readFile(dir_ / "second"));
  EXPECT_EQ(first.md5(), second.md5());
  EXPECT_EQ(first.sha256(), second.sha256());
  EXPECT_EQ(first.totalBytes(), second.totalBytes());
}

TEST_F(StreamCombinerTest, TruncatesExistingOutput) {
  ChunkSet set = splitInto("t", "short", {2});
  writeFile(dir_ / "out", std::string(1000, 'z'));

  StreamCombiner::combine(set, dir_ / "out", 64);
  EXPECT_EQ(readFile(dir_ / "out"), "short");
}

TEST_F(StreamCombinerTest, ReportsProgressPerChunkAndRead) {
  ChunkSet set = splitInto("p", patternData(10), {4});
  std::vector<CombineProgress> events;

  StreamCombiner::combine(set, dir_ / "p", 3, [&events](const CombineProgress& p) { events.push_back(p); });

  // chunk 1 (4 bytes): start, 3, 4; chunk 2 (6 bytes): start, 7, 10
  ASSERT_EQ(events.size(), 6u);
  EXPECT_TRUE(events[0].chunk_started);
  EXPECT_EQ(events[0].chunk_index, 1u);
  EXPECT_EQ(events[0].chunk_count, 2u);
  EXPECT_EQ(events[0].chunk_size, 4u);
  EXPECT_EQ(events[0].chunk_name, "p.001");
  EXPECT_EQ(events[0].total_bytes, 10u);
  EXPECT_EQ(events[1].bytes_written, 3u);
  EXPECT_EQ(events[2].bytes_written, 4u);
  EXPECT_TRUE(events[3].chunk_started);
  EXPECT_EQ(events[3].chunk_index, 2u);
  EXPECT_EQ(events[3].bytes_written, 4u);
  EXPECT_EQ(events[4].bytes_written, 7u);
  EXPECT_EQ(events[5].bytes_written, 10u);
  EXPECT_DOUBLE_EQ(events[5].fraction(), 1.0);
}

TEST_F(StreamCombinerTest, RejectsBadPreconditions) {
  ChunkSet set = splitInto("pre", "data", {2});
  EXPECT_THROW(StreamCombiner::combine(set, dir_ / "out", 0), std::invalid_argument);

  ChunkSet empty{dir_.path(), "none", Naming::Convention::Numeric, {}};
  EXPECT_THROW(StreamCombiner::combine(empty, dir_ / "out", 16), std::invalid_argument);
  EXPECT_FALSE(fs::exists(dir_ / "out"));
}

TEST_F(StreamCombinerTest, MissingChunkIsIOFailure) {
  ChunkSet set = splitInto("gone", "abcdef", {3});
  fs::remove(set.chunks.back());

  EXPECT_THROW(StreamCombiner::combine(set, dir_ / "out", 16), IOFailure);
}

TEST_F(StreamCombinerTest, UnwritableOutputIsIOFailure) {
  ChunkSet set = splitInto("w", "abcdef", {3});
  EXPECT_THROW(StreamCombiner::combine(set, dir_ / "missing_dir" / "out", 16), IOFailure);
}

TEST_F(StreamCombinerTest, TotalSizeSumsChunks) {
  ChunkSet set = splitInto("sz", patternData(777), {100, 200, 700});
  EXPECT_EQ(StreamCombiner::totalSize(set), 777u);
}
