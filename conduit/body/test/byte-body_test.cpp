#include "conduit/byte-body.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "conduit/body-exceptions.hpp"
#include "conduit/body-size-limits.hpp"
#include "conduit/body-stream.hpp"
#include "conduit/body-test-util.hpp"
#include "conduit/byte-chunk.hpp"
#include "conduit/shared-buffer.hpp"
#include "conduit/upstream-balancer.hpp"
#include "conduit/upstream.hpp"

namespace conduit {

using test::MakeChunk;
using test::RecordingConsumer;
using test::RecordingUpstream;

class ByteBodyTest : public ::testing::Test {
 protected:
  void TearDown() override { ByteBody::SetClaimSiteTracking(false); }

  static std::string ReadAll(BodyStream& stream) {
    std::string ret;
    while (auto chunk = stream.next()) {
      ret.append(chunk->view());
    }
    return ret;
  }

  std::shared_ptr<RecordingUpstream> upstream = std::make_shared<RecordingUpstream>();
  std::shared_ptr<SharedBuffer> buffer = std::make_shared<SharedBuffer>(BodySizeLimits{1000, 1000}, upstream);
  ByteBody body{buffer};
};

TEST_F(ByteBodyTest, DrainFull) {
  auto future = body.drainFull();
  EXPECT_TRUE(body.claimed());
  EXPECT_EQ(upstream->calls(), (std::vector<std::string>{"start", "consumed:" + std::to_string(kUnboundedDemand)}));

  buffer->add(MakeChunk("hello "));
  buffer->add(MakeChunk("body"));
  buffer->complete();
  EXPECT_EQ(future.get().view(), "hello body");
}

TEST_F(ByteBodyTest, SecondClaimThrows) {
  auto stream = body.toStream();
  EXPECT_THROW(static_cast<void>(body.drainFull()), BodyAlreadyClaimedException);
  EXPECT_THROW(static_cast<void>(body.toStream()), BodyAlreadyClaimedException);
  EXPECT_THROW(body.subscribe(std::make_shared<RecordingConsumer>()), BodyAlreadyClaimedException);
  EXPECT_THROW(static_cast<void>(body.move()), BodyAlreadyClaimedException);
  EXPECT_THROW(static_cast<void>(body.split()), BodyAlreadyClaimedException);
}

TEST_F(ByteBodyTest, ClaimSiteIsReported) {
  ByteBody::SetClaimSiteTracking(true);
  const auto claimLine = static_cast<std::uint_least32_t>(__LINE__ + 1);
  auto future = body.drainFull();
  try {
    static_cast<void>(body.toStream());
    FAIL() << "second claim should throw";
  } catch (const BodyAlreadyClaimedException& ex) {
    ASSERT_TRUE(ex.firstClaim().has_value());
    EXPECT_EQ(ex.firstClaim()->line(), claimLine);
    EXPECT_NE(std::string_view(ex.what()).find("byte-body_test.cpp"), std::string_view::npos);
  }
}

TEST_F(ByteBodyTest, NoClaimSiteWithoutTracking) {
  auto future = body.drainFull();
  try {
    static_cast<void>(body.toStream());
    FAIL() << "second claim should throw";
  } catch (const BodyAlreadyClaimedException& ex) {
    EXPECT_FALSE(ex.firstClaim().has_value());
  }
}

TEST_F(ByteBodyTest, SubscribeReturnsUpstream) {
  auto consumer = std::make_shared<RecordingConsumer>();
  auto consumerUpstream = body.subscribe(consumer);
  EXPECT_EQ(consumerUpstream, upstream);
  buffer->add(MakeChunk("data"));
  buffer->complete();
  EXPECT_EQ(consumer->data(), "data");
  EXPECT_EQ(consumer->nbComplete(), 1U);
}

TEST_F(ByteBodyTest, SplitStrictDrainsBothHalves) {
  ByteBody other = body.split(SplitBackpressureMode::Strict);
  auto future = body.drainFull();
  auto stream = other.toStream();

  const std::vector<std::string_view> parts{"split ", "bodies ", "see ", "everything"};
  for (auto part : parts) {
    buffer->add(MakeChunk(part));
  }
  buffer->complete();

  EXPECT_EQ(future.get().view(), "split bodies see everything");
  EXPECT_EQ(ReadAll(stream), "split bodies see everything");
  EXPECT_EQ(buffer->reservations(), 0U);
}

TEST_F(ByteBodyTest, SplitHalfJoiningLate) {
  buffer->add(MakeChunk("early "));
  ByteBody other = body.split();
  auto stream = body.toStream();
  buffer->add(MakeChunk("late"));
  buffer->complete();
  EXPECT_EQ(ReadAll(stream), "early late");
  EXPECT_EQ(other.drainFull().get().view(), "early late");
}

TEST_F(ByteBodyTest, ThrowingConsumerDoesNotTruncateOtherHalf) {
  ByteBody other = body.split(SplitBackpressureMode::Fastest);
  auto consumer = std::make_shared<RecordingConsumer>();
  consumer->setOnAdd([](const ByteChunk&) { throw std::runtime_error("consumer failure"); });
  body.subscribe(consumer);
  auto future = other.drainFull();

  buffer->add(MakeChunk("abc"));
  buffer->add(MakeChunk("def"));
  buffer->complete();

  ASSERT_TRUE(future.ready());
  EXPECT_EQ(future.get().view(), "abcdef");
  EXPECT_EQ(consumer->data(), "abcdef");
  EXPECT_EQ(consumer->nbComplete(), 1U);
}

TEST_F(ByteBodyTest, ConsumerThrowingNonStdExceptionDoesNotTruncateOtherHalf) {
  ByteBody other = body.split(SplitBackpressureMode::Strict);
  auto consumer = std::make_shared<RecordingConsumer>();
  consumer->setOnAdd([](const ByteChunk&) { throw 7; });
  body.subscribe(consumer);
  auto future = other.drainFull();

  buffer->add(MakeChunk("abc"));
  buffer->add(MakeChunk("def"));
  buffer->complete();

  ASSERT_TRUE(future.ready());
  EXPECT_EQ(future.get().view(), "abcdef");
  EXPECT_EQ(consumer->nbComplete(), 1U);
}

TEST_F(ByteBodyTest, Close) {
  body.close();
  EXPECT_TRUE(body.claimed());
  EXPECT_EQ(upstream->calls(), (std::vector<std::string>{"discard", "disregard", "start"}));
  EXPECT_EQ(buffer->reservations(), 0U);
  body.close();
  EXPECT_EQ(upstream->nbDiscard(), 1U);
}

TEST_F(ByteBodyTest, DestructionClosesUnclaimedBody) {
  {
    ByteBody tmp = body.move();
    EXPECT_EQ(upstream->nbDiscard(), 0U);
  }
  EXPECT_EQ(upstream->nbDiscard(), 1U);
  EXPECT_EQ(buffer->reservations(), 0U);
}

TEST_F(ByteBodyTest, ClosingOneHalfKeepsTheOther) {
  ByteBody other = body.split(SplitBackpressureMode::Slowest);
  body.close();
  EXPECT_EQ(upstream->nbDiscard(), 0U);

  auto future = other.drainFull();
  EXPECT_EQ(upstream->calls(), (std::vector<std::string>{"start", "consumed:" + std::to_string(kUnboundedDemand)}));
  buffer->add(MakeChunk("kept"));
  buffer->complete();
  EXPECT_EQ(future.get().view(), "kept");
}

TEST_F(ByteBodyTest, MoveTransfersTheClaim) {
  ByteBody moved = body.move();
  EXPECT_TRUE(body.claimed());
  EXPECT_FALSE(moved.claimed());

  ByteBody movedAgain(std::move(moved));
  EXPECT_TRUE(moved.claimed());  // NOLINT(bugprone-use-after-move)
  auto future = movedAgain.drainFull();
  buffer->add(MakeChunk("moved"));
  buffer->complete();
  EXPECT_EQ(future.get().view(), "moved");
}

TEST_F(ByteBodyTest, AllowDiscardDoesNotClaim) {
  body.allowDiscard();
  EXPECT_EQ(upstream->nbDiscard(), 1U);
  EXPECT_FALSE(body.claimed());
}

TEST_F(ByteBodyTest, ExpectedLength) {
  EXPECT_FALSE(body.expectedLength().has_value());
  buffer->setExpectedLength(5);
  EXPECT_EQ(body.expectedLength(), 5U);
}

TEST_F(ByteBodyTest, BodyLargerThanBufferFailsDrainFull) {
  buffer = std::make_shared<SharedBuffer>(BodySizeLimits{100, 4}, upstream);
  ByteBody small(buffer);
  auto future = small.drainFull();
  buffer->add(MakeChunk(5));
  buffer->complete();
  EXPECT_THROW(future.get(), BufferLengthExceededException);
}

}  // namespace conduit
