#include "conduit/exception.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <exception>

namespace conduit {

TEST(ExceptionTest, InfoTakenFromConstCharStar) {
  EXPECT_STREQ(exception("This string can fill the inline storage").what(), "This string can fill the inline storage");
}

TEST(ExceptionTest, FormatUntruncated) {
  EXPECT_STREQ(exception("Received {} bytes out of {} declared", 12, 42).what(), "Received 12 bytes out of 42 declared");
}

TEST(ExceptionTest, FormatTruncated) {
  exception ex("This is a {} that will not {} and it will be {} because it is too {}. Bodies are large but messages "
               "should stay small so that throwing never allocates.",
               "string", "fit inside the buffer", "truncated", "long");
  const auto len = std::strlen(ex.what());
  EXPECT_EQ(len, exception::kMsgMaxLen);
  EXPECT_EQ(ex.what()[len - 1], '.');
  EXPECT_EQ(ex.what()[len - 2], '.');
  EXPECT_EQ(ex.what()[len - 3], '.');
  EXPECT_EQ(std::strncmp(ex.what(), "This is a string that will not fit inside the buffer", 52), 0);
}

TEST(ExceptionTest, CatchableAsStdException) {
  try {
    throw exception("maxBufferSize {} is invalid", 0);
  } catch (const std::exception& ex) {
    EXPECT_STREQ(ex.what(), "maxBufferSize 0 is invalid");
  }
}

}  // namespace conduit
