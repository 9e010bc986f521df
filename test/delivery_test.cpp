#include <gmock/gmock.h>
#include <autojudge/errors.h>
#include <autojudge/delivery.h>
#include "utils.h"

using ::testing::ElementsAre;

class DeliveryTest : public ::testing::Test {
 protected:
  RecordingMessenger messenger;
  std::vector<std::chrono::milliseconds> sleeps;
  Sleeper sleeper = [this](std::chrono::milliseconds ms) { sleeps.push_back(ms); };
  fs::path file;

  void SetUp() override {
    file = TestDir("delivery") / "f.bin";
    WriteFile(file, "0123456789");
  }
};

TEST_F(DeliveryTest, PartNames) {
  EXPECT_EQ(PartFileName("a.zip", 1, 12), "a.zip.part01");
  EXPECT_EQ(PartFileName("a.zip", 3, 5), "a.zip.part3");
  EXPECT_EQ(PartFileName("a.zip", 7, 100), "a.zip.part007");
}

TEST_F(DeliveryTest, SmallFileGoesWhole) {
  auto sent = DeliverArtifact(messenger, 1, file, 10, "caption", sleeper);
  EXPECT_THAT(sent, ElementsAre("f.bin"));
  ASSERT_EQ(messenger.documents.size(), 1u);
  EXPECT_EQ(messenger.documents[0].content, "0123456789");
  EXPECT_EQ(messenger.documents[0].caption, "caption");
}

TEST_F(DeliveryTest, LargeFileIsSplit) {
  auto sent = DeliverArtifact(messenger, 1, file, 4, "caption", sleeper);
  EXPECT_THAT(sent, ElementsAre("f.bin.part1", "f.bin.part2", "f.bin.part3"));
  ASSERT_EQ(messenger.documents.size(), 3u);
  EXPECT_EQ(messenger.documents[0].content, "0123");
  EXPECT_EQ(messenger.documents[1].content, "4567");
  EXPECT_EQ(messenger.documents[2].content, "89");
  EXPECT_EQ(messenger.documents[0].caption, "caption");
  EXPECT_EQ(messenger.documents[1].caption, "");
  EXPECT_EQ(messenger.documents[2].caption, "");
  EXPECT_TRUE(sleeps.empty());
}

TEST_F(DeliveryTest, ThrottledPartIsRetried) {
  messenger.throttle = 2;
  auto sent = DeliverArtifact(messenger, 1, file, 5, "", sleeper);
  EXPECT_EQ(sent.size(), 2u);
  EXPECT_EQ(messenger.throttled, 2);
  EXPECT_EQ(messenger.documents.size(), 2u);
  EXPECT_THAT(sleeps, ElementsAre(std::chrono::milliseconds(1500), std::chrono::milliseconds(1500)));
}

TEST_F(DeliveryTest, GivesUpAfterAttempts) {
  messenger.throttle = kDeliveryAttempts;
  EXPECT_THROW(DeliverArtifact(messenger, 1, file, 100, "", sleeper), FlowControlError);
  EXPECT_EQ(messenger.throttled, kDeliveryAttempts);
  EXPECT_EQ(sleeps.size(), (size_t)kDeliveryAttempts - 1);
  EXPECT_TRUE(messenger.documents.empty());
}

TEST_F(DeliveryTest, OtherFailuresPropagate) {
  messenger.fail = true;
  EXPECT_THROW(DeliverArtifact(messenger, 1, file, 4, "", sleeper), DeliveryError);
  EXPECT_TRUE(sleeps.empty());
  EXPECT_THROW(DeliverArtifact(messenger, 1, file.parent_path() / "missing", 4, "", sleeper),
               DeliveryError);
}
