#include <gtest/gtest.h>

#include <string>

#include "packet/frame_reader.h"
#include "packet/p_base.h"

namespace {

void Feed(FrameReader *r, const std::string &s) {
  r->Feed(s.data(), s.size());
}

}  // namespace

TEST(FrameReaderTest, ReassemblesPartialReads) {
  FrameReader r;
  std::string frame;

  Feed(&r, "{\"type\":\"inp");
  EXPECT_FALSE(r.Next(&frame));
  Feed(&r, "ut\",\"dx\":1");
  EXPECT_FALSE(r.Next(&frame));
  Feed(&r, ",\"dy\":0}\n{\"type\"");

  ASSERT_TRUE(r.Next(&frame));
  EXPECT_EQ(frame, "{\"type\":\"input\",\"dx\":1,\"dy\":0}");
  EXPECT_FALSE(r.Next(&frame));
  EXPECT_EQ(r.buffered(), 7u);
}

TEST(FrameReaderTest, SeveralFramesInOneRead) {
  FrameReader r;
  Feed(&r, "{\"a\":1}\n{\"b\":2}\r\n\n{\"c\":3}\n");

  std::string frame;
  ASSERT_TRUE(r.Next(&frame));
  EXPECT_EQ(frame, "{\"a\":1}");
  ASSERT_TRUE(r.Next(&frame));
  EXPECT_EQ(frame, "{\"b\":2}");
  ASSERT_TRUE(r.Next(&frame));
  EXPECT_EQ(frame, "{\"c\":3}");
  EXPECT_FALSE(r.Next(&frame));
}

TEST(FrameReaderTest, SplitsGluedObjects) {
  FrameReader r;
  Feed(&r, "{\"type\":\"input\",\"dx\":1,\"dy\":0}{\"type\":\"chat\",\"text\":\"hi\"}\n");

  std::string frame;
  ASSERT_TRUE(r.Next(&frame));
  EXPECT_EQ(frame, "{\"type\":\"input\",\"dx\":1,\"dy\":0}");
  ASSERT_TRUE(r.Next(&frame));
  EXPECT_EQ(frame, "{\"type\":\"chat\",\"text\":\"hi\"}");
}

TEST(FrameReaderTest, BracesInsideStringsDoNotSplit) {
  const std::vector<std::string> objs =
      FrameReader::SplitObjects("{\"text\":\"}{ \\\" }\"}{\"x\":{\"y\":1}}");
  ASSERT_EQ(objs.size(), 2u);
  EXPECT_EQ(objs[0], "{\"text\":\"}{ \\\" }\"}");
  EXPECT_EQ(objs[1], "{\"x\":{\"y\":1}}");
}

TEST(FrameReaderTest, StrayTextIsKeptForTheDecoder) {
  const std::vector<std::string> objs = FrameReader::SplitObjects("not json");
  ASSERT_EQ(objs.size(), 1u);
  EXPECT_EQ(objs[0], "not json");

  const std::vector<std::string> open = FrameReader::SplitObjects("{\"a\":");
  ASSERT_EQ(open.size(), 1u);
  EXPECT_EQ(open[0], "{\"a\":");
}

TEST(FrameReaderTest, OversizedFrameThrows) {
  FrameReader r(16);
  Feed(&r, "{\"a\":1}\n");
  EXPECT_THROW(Feed(&r, std::string(32, 'x')), protocol_error);
  EXPECT_EQ(r.buffered(), 0u);

  // frames completed before the overflow are still delivered
  std::string frame;
  ASSERT_TRUE(r.Next(&frame));
  EXPECT_EQ(frame, "{\"a\":1}");
}
