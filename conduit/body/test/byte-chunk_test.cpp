#include "conduit/byte-chunk.hpp"

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "conduit/raw-bytes.hpp"

namespace conduit {

TEST(ByteChunkTest, DefaultIsEmpty) {
  ByteChunk chunk;
  EXPECT_TRUE(chunk.empty());
  EXPECT_EQ(chunk.size(), 0U);
  EXPECT_TRUE(chunk.view().empty());
  EXPECT_EQ(chunk.useCount(), 0);
}

TEST(ByteChunkTest, FromStringView) {
  ByteChunk chunk(std::string_view("hello"));
  EXPECT_EQ(chunk.size(), 5U);
  EXPECT_EQ(chunk.view(), "hello");
}

TEST(ByteChunkTest, FromRawBytesTakesOwnership) {
  RawBytes bytes(std::string_view("abc"));
  const auto* data = bytes.data();
  ByteChunk chunk(std::move(bytes));
  EXPECT_EQ(chunk.bytes().data(), data);
  EXPECT_EQ(chunk.view(), "abc");
}

TEST(ByteChunkTest, DuplicateSharesStorage) {
  ByteChunk chunk(std::string_view("shared"));
  ByteChunk dup = chunk.duplicate();
  EXPECT_EQ(chunk.useCount(), 2);
  EXPECT_EQ(dup.bytes().data(), chunk.bytes().data());
  EXPECT_EQ(dup.view(), "shared");
}

TEST(ByteChunkTest, SplitFront) {
  ByteChunk chunk(std::string_view("headtail"));
  ByteChunk head = chunk.splitFront(4);
  EXPECT_EQ(head.view(), "head");
  EXPECT_EQ(chunk.view(), "tail");
  EXPECT_EQ(head.useCount(), 2);

  ByteChunk rest = chunk.splitFront(100);
  EXPECT_EQ(rest.view(), "tail");
  EXPECT_TRUE(chunk.empty());

  ByteChunk none = rest.splitFront(0);
  EXPECT_TRUE(none.empty());
  EXPECT_EQ(rest.view(), "tail");
}

TEST(ByteChunkTest, ComposeNothing) {
  std::vector<ByteChunk> pieces;
  EXPECT_TRUE(ByteChunk::Compose(pieces).empty());
  pieces.emplace_back();
  EXPECT_TRUE(ByteChunk::Compose(pieces).empty());
}

TEST(ByteChunkTest, ComposeSinglePieceShares) {
  std::vector<ByteChunk> pieces;
  pieces.emplace_back();
  pieces.emplace_back(std::string_view("only"));
  ByteChunk composed = ByteChunk::Compose(pieces);
  EXPECT_EQ(composed.view(), "only");
  EXPECT_EQ(composed.bytes().data(), pieces[1].bytes().data());
}

TEST(ByteChunkTest, ComposeSeveralPiecesCopies) {
  std::vector<ByteChunk> pieces;
  pieces.emplace_back(std::string_view("one "));
  pieces.emplace_back(std::string_view("two "));
  pieces.emplace_back();
  pieces.emplace_back(std::string_view("three"));
  ByteChunk composed = ByteChunk::Compose(pieces);
  EXPECT_EQ(composed.view(), "one two three");
  EXPECT_EQ(composed.useCount(), 1);
}

}  // namespace conduit
