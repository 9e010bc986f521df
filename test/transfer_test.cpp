#include <fmt/format.h>
#include <autojudge/errors.h>
#include <autojudge/transfer.h>
#include "utils.h"

namespace {

PartFetcher Writes(const std::string& content) {
  return [content](const fs::path& path) {
    WriteFile(path, content);
    return true;
  };
}

PartFetcher Fails() {
  return [](const fs::path& path) {
    WriteFile(path, "trunc");
    return false;
  };
}

} // namespace

class TransferTest : public ::testing::Test {
 protected:
  FakeDirectory dir = FakeDirectory::Basic();
  FakeStore store;
  long membership_id = 100;
  TransferAssembler assembler{
    [this]() { return PlanSubmission(dir, store, membership_id); },
    [this](const Submission& sub) { return store.Create(sub); },
  };

  void SetUp() override {
    fs::remove_all(SubmissionsRoot());
  }

  void StartWith(int parts) {
    ASSERT_EQ(assembler.BeginChunked().signal, TransferSignal::ASK_PART_COUNT);
    auto reply = assembler.SetPartCount(std::to_string(parts));
    ASSERT_EQ(reply.signal, TransferSignal::READY);
    ASSERT_EQ(reply.total, parts);
  }
};

TEST_F(TransferTest, ChunkedUploadAssemblesInOrder) {
  StartWith(3);
  auto reply = assembler.OfferDocument("sol.zip.part1", 2, Writes("aa"));
  EXPECT_EQ(reply.signal, TransferSignal::PART_SAVED);
  EXPECT_EQ(reply.received, 1);
  EXPECT_EQ(reply.total, 3);
  reply = assembler.OfferDocument("sol.zip.part2", 2, Writes("bb"));
  EXPECT_EQ(reply.signal, TransferSignal::PART_SAVED);
  EXPECT_EQ(assembler.Session().received_count, 2);
  reply = assembler.OfferDocument("sol.zip.part3", 2, Writes("cc"));
  ASSERT_EQ(reply.signal, TransferSignal::SUBMITTED);
  ASSERT_TRUE(reply.submission);
  EXPECT_EQ(assembler.State(), TransferState::DONE);

  const Submission& sub = *reply.submission;
  EXPECT_EQ(sub.title, "Night Owls #1");
  EXPECT_EQ(sub.status, SubmissionStatus::PENDING);
  EXPECT_EQ(sub.team_membership_id, 100);
  EXPECT_EQ(sub.artifact_path, "submissions/10/Night_Owls_1.zip");
  EXPECT_EQ(ReadFile(kStorageRoot / sub.artifact_path), "aabbcc");
  EXPECT_FALSE(fs::exists(TransferWorkspace("Night_Owls", 1)));
}

TEST_F(TransferTest, AnyPartCountUpToTwenty) {
  for (int n = 2; n <= 20; n++) {
    SCOPED_TRACE(n);
    StartWith(n);
    std::string expected;
    TransferReply reply;
    for (int i = 1; i <= n; i++) {
      std::string chunk = std::to_string(i) + ";";
      expected += chunk;
      reply = assembler.OfferPart(fmt::format("sol.zip.part{:02d}", i), chunk.size(), Writes(chunk));
      if (i < n) ASSERT_EQ(reply.signal, TransferSignal::PART_SAVED);
    }
    ASSERT_EQ(reply.signal, TransferSignal::SUBMITTED);
    ASSERT_TRUE(reply.submission);
    EXPECT_EQ(ReadFile(kStorageRoot / reply.submission->artifact_path), expected);
  }
  EXPECT_EQ(store.rows.size(), 19u);
}

TEST_F(TransferTest, ZeroBasedParts) {
  StartWith(2);
  EXPECT_EQ(assembler.OfferPart("sol.zip.part0", 1, Writes("x")).signal, TransferSignal::PART_SAVED);
  EXPECT_EQ(assembler.Session().base_part_index, 0);
  auto reply = assembler.OfferPart("sol.zip.part1", 1, Writes("y"));
  ASSERT_EQ(reply.signal, TransferSignal::SUBMITTED);
  EXPECT_EQ(ReadFile(kStorageRoot / reply.submission->artifact_path), "xy");
}

TEST_F(TransferTest, FirstPartMustBeZeroOrOne) {
  StartWith(2);
  auto reply = assembler.OfferPart("sol.zip.part2", 1, Writes("x"));
  EXPECT_EQ(reply.signal, TransferSignal::WRONG_ORDER);
  EXPECT_EQ(reply.expected, "0 or 1");
  EXPECT_EQ(reply.got, 2);
  EXPECT_EQ(assembler.State(), TransferState::COLLECTING_PARTS);
  EXPECT_EQ(assembler.Session().received_count, 0);
}

TEST_F(TransferTest, OutOfOrderPartIsRejected) {
  StartWith(3);
  ASSERT_EQ(assembler.OfferPart("sol.zip.part1", 1, Writes("a")).signal, TransferSignal::PART_SAVED);
  auto reply = assembler.OfferPart("sol.zip.part3", 1, Writes("c"));
  EXPECT_EQ(reply.signal, TransferSignal::WRONG_ORDER);
  EXPECT_EQ(reply.expected, "2");
  EXPECT_EQ(reply.got, 3);
  EXPECT_EQ(assembler.Session().received_count, 1);
  // a duplicate of the last part is also out of order
  EXPECT_EQ(assembler.OfferPart("sol.zip.part1", 1, Writes("a")).signal, TransferSignal::WRONG_ORDER);
  EXPECT_EQ(assembler.OfferPart("sol.zip.part2", 1, Writes("b")).signal, TransferSignal::PART_SAVED);
  auto last = assembler.OfferPart("sol.zip.part3", 1, Writes("c"));
  ASSERT_EQ(last.signal, TransferSignal::SUBMITTED);
  EXPECT_EQ(ReadFile(kStorageRoot / last.submission->artifact_path), "abc");
}

TEST_F(TransferTest, PartCountValidation) {
  assembler.BeginChunked();
  for (const char* text : {"1", "21", "0", "-3", "abc", "", "2.5"}) {
    EXPECT_EQ(assembler.SetPartCount(text).signal, TransferSignal::INVALID_PART_COUNT) << text;
    EXPECT_EQ(assembler.State(), TransferState::AWAITING_PART_COUNT);
  }
  EXPECT_EQ(assembler.SetPartCount(" 20 ").signal, TransferSignal::READY);
  EXPECT_EQ(assembler.Session().expected_part_count, 20);
}

TEST_F(TransferTest, CancelWhileAwaitingCount) {
  assembler.BeginChunked();
  EXPECT_EQ(assembler.SetPartCount("Cancel").signal, TransferSignal::CANCELLED);
  EXPECT_EQ(assembler.State(), TransferState::IDLE);
  assembler.BeginChunked();
  EXPECT_EQ(assembler.SetPartCount("stop").signal, TransferSignal::CANCELLED);
  EXPECT_EQ(assembler.State(), TransferState::IDLE);
}

TEST_F(TransferTest, CancelDropsReceivedParts) {
  StartWith(3);
  ASSERT_EQ(assembler.OfferPart("sol.zip.part1", 1, Writes("a")).signal, TransferSignal::PART_SAVED);
  fs::path saved = assembler.Session().ordered_part_paths.at(0);
  ASSERT_TRUE(fs::exists(saved));
  EXPECT_EQ(assembler.Cancel().signal, TransferSignal::CANCELLED);
  EXPECT_EQ(assembler.State(), TransferState::IDLE);
  EXPECT_FALSE(fs::exists(saved));
  EXPECT_TRUE(store.rows.empty());
}

TEST_F(TransferTest, DocumentBeforePartCount) {
  assembler.BeginChunked();
  EXPECT_EQ(assembler.OfferDocument("sol.zip.part1", 1, Writes("a")).signal,
            TransferSignal::NEED_PART_COUNT);
  EXPECT_EQ(assembler.State(), TransferState::AWAITING_PART_COUNT);
}

TEST_F(TransferTest, PartWithoutSession) {
  EXPECT_EQ(assembler.OfferDocument("sol.zip.part1", 1, Writes("a")).signal, TransferSignal::NOT_STARTED);
  EXPECT_EQ(assembler.OfferPart("sol.zip.part1", 1, Writes("a")).signal, TransferSignal::NOT_STARTED);
  EXPECT_EQ(assembler.SetPartCount("3").signal, TransferSignal::NOT_STARTED);
  EXPECT_TRUE(store.rows.empty());
}

TEST_F(TransferTest, InvalidPartNames) {
  StartWith(2);
  for (const char* name : {"sol.zip", "sol.rar.part1", "sol.zip.partA", "sol.zip.part", ".zip.part1"}) {
    EXPECT_EQ(assembler.OfferPart(name, 1, Writes("a")).signal, TransferSignal::INVALID_PART_NAME) << name;
  }
  EXPECT_EQ(assembler.Session().received_count, 0);
}

TEST_F(TransferTest, PartTooLarge) {
  StartWith(2);
  auto reply = assembler.OfferPart("sol.zip.part1", kFilePartLimit + 1, Writes("a"));
  EXPECT_EQ(reply.signal, TransferSignal::TOO_LARGE);
  EXPECT_EQ(reply.limit, kFilePartLimit);
  EXPECT_EQ(assembler.State(), TransferState::COLLECTING_PARTS);
}

TEST_F(TransferTest, FailedDownloadCanBeRetried) {
  StartWith(2);
  auto reply = assembler.OfferPart("sol.zip.part1", 5, Fails());
  EXPECT_EQ(reply.signal, TransferSignal::DOWNLOAD_FAILED);
  EXPECT_EQ(assembler.Session().received_count, 0);
  EXPECT_FALSE(assembler.Session().base_part_index);
  EXPECT_EQ(assembler.State(), TransferState::COLLECTING_PARTS);

  PartFetcher throws = [](const fs::path&) -> bool { throw TransferError("connection reset"); };
  EXPECT_EQ(assembler.OfferPart("sol.zip.part1", 5, throws).signal, TransferSignal::DOWNLOAD_FAILED);

  EXPECT_EQ(assembler.OfferPart("sol.zip.part1", 5, Writes("first")).signal, TransferSignal::PART_SAVED);
  auto last = assembler.OfferPart("sol.zip.part2", 6, Writes("second"));
  ASSERT_EQ(last.signal, TransferSignal::SUBMITTED);
  EXPECT_EQ(ReadFile(kStorageRoot / last.submission->artifact_path), "firstsecond");
}

TEST_F(TransferTest, SingleArchive) {
  auto reply = assembler.OfferDocument("Solution.ZIP", 7, Writes("archive"));
  ASSERT_EQ(reply.signal, TransferSignal::SUBMITTED);
  EXPECT_EQ(assembler.State(), TransferState::IDLE);
  EXPECT_EQ(ReadFile(kStorageRoot / reply.submission->artifact_path), "archive");
  fs::path partial = kStorageRoot / reply.submission->artifact_path;
  partial += ".partial";
  EXPECT_FALSE(fs::exists(partial));
}

TEST_F(TransferTest, SingleRejectsNonArchive) {
  EXPECT_EQ(assembler.OfferDocument("solution.py", 7, Writes("print()")).signal,
            TransferSignal::NOT_ARCHIVE);
  EXPECT_EQ(assembler.OfferDocument("solution.zip", kFilePartLimit + 1, Writes("a")).signal,
            TransferSignal::TOO_LARGE);
  EXPECT_EQ(assembler.OfferDocument("solution.zip", 1, Fails()).signal,
            TransferSignal::DOWNLOAD_FAILED);
  EXPECT_TRUE(store.rows.empty());
}

TEST_F(TransferTest, SequenceCountsWholeTeam) {
  store.rows[1] = {.id = 1, .team_membership_id = 101, .title = "Night Owls #1"};
  store.next_id = 2;
  auto reply = assembler.OfferDocument("a.zip", 1, Writes("a"));
  ASSERT_EQ(reply.signal, TransferSignal::SUBMITTED);
  EXPECT_EQ(reply.submission->title, "Night Owls #2");
  EXPECT_EQ(reply.submission->artifact_path, "submissions/10/Night_Owls_2.zip");
}

TEST_F(TransferTest, QuotaExceeded) {
  dir.tracks[1].max_submissions_total = 2;
  store.rows[1] = {.id = 1, .team_membership_id = 100};
  store.rows[2] = {.id = 2, .team_membership_id = 101};
  store.next_id = 3;
  auto reply = assembler.OfferDocument("a.zip", 1, Writes("a"));
  EXPECT_EQ(reply.signal, TransferSignal::QUOTA_EXCEEDED);
  EXPECT_EQ(reply.limit, 2);

  StartWith(2);
  reply = assembler.OfferPart("a.zip.part1", 1, Writes("a"));
  EXPECT_EQ(reply.signal, TransferSignal::QUOTA_EXCEEDED);
  EXPECT_EQ(assembler.State(), TransferState::IDLE);
  EXPECT_EQ(store.rows.size(), 2u);
}

TEST_F(TransferTest, UnknownMembershipIsRejected) {
  membership_id = 999;
  auto reply = assembler.OfferDocument("a.zip", 1, Writes("a"));
  EXPECT_EQ(reply.signal, TransferSignal::REJECTED);
  EXPECT_FALSE(reply.detail.empty());
}

TEST_F(TransferTest, StoreFailureRemovesArtifact) {
  store.fail_create = true;
  auto reply = assembler.OfferDocument("a.zip", 1, Writes("a"));
  EXPECT_EQ(reply.signal, TransferSignal::REJECTED);
  EXPECT_FALSE(fs::exists(SubmissionArtifact(10, "Night_Owls", 1)));

  StartWith(2);
  ASSERT_EQ(assembler.OfferPart("a.zip.part1", 1, Writes("a")).signal, TransferSignal::PART_SAVED);
  reply = assembler.OfferPart("a.zip.part2", 1, Writes("b"));
  EXPECT_EQ(reply.signal, TransferSignal::REJECTED);
  EXPECT_EQ(assembler.State(), TransferState::ERROR);
  EXPECT_FALSE(fs::exists(SubmissionArtifact(10, "Night_Owls", 1)));
  // a finished session accepts a new one
  EXPECT_EQ(assembler.BeginChunked().signal, TransferSignal::ASK_PART_COUNT);
}

TEST(TransferNameTest, PartNames) {
  EXPECT_TRUE(IsZipPartName("sol.zip.part1"));
  EXPECT_TRUE(IsZipPartName("SOL.ZIP.PART12"));
  EXPECT_FALSE(IsZipPartName("sol.zip"));
  EXPECT_FALSE(IsZipPartName("sol.zip.part1.txt"));
  EXPECT_TRUE(IsZipName("a.Zip"));
  EXPECT_FALSE(IsZipName(".zip"));
  EXPECT_FALSE(IsZipName("a.zip.part1"));
  EXPECT_EQ(PartNumber("sol.zip.part007"), 7);
  EXPECT_EQ(PartNumber("sol.zip.PART0"), 0);
  EXPECT_EQ(PartNumber("sol.zip"), std::nullopt);
  EXPECT_EQ(PartNumber("sol.zip.part99999999999"), std::nullopt);
}

TEST(TransferNameTest, ConcatenateMissingPart) {
  fs::path dir = TestDir("concat");
  WriteFile(dir / "a", "1");
  EXPECT_FALSE(ConcatenateParts({dir / "a", dir / "missing"}, dir / "out"));
  EXPECT_FALSE(fs::exists(dir / "out"));
  EXPECT_FALSE(fs::exists(dir / "out.partial"));
  EXPECT_TRUE(ConcatenateParts({dir / "a", dir / "a"}, dir / "out"));
  EXPECT_EQ(ReadFile(dir / "out"), "11");
}
