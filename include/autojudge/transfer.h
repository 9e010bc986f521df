#ifndef INCLUDE_AUTOJUDGE_TRANSFER_H_
#define INCLUDE_AUTOJUDGE_TRANSFER_H_

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <functional>

#include "directory.h"
#include "submission.h"

namespace fs = std::filesystem;

// bytes; never below 1 MiB
extern long kFilePartLimit;
constexpr int kMinParts = 2;
constexpr int kMaxParts = 20;

#define ENUM_TRANSFER_STATE_ \
  X(IDLE) \
  X(AWAITING_PART_COUNT) \
  X(COLLECTING_PARTS) \
  X(ASSEMBLING) \
  X(DONE) \
  X(ERROR)
enum class TransferState {
#define X(name) name,
  ENUM_TRANSFER_STATE_
#undef X
};

#define ENUM_TRANSFER_SIGNAL_ \
  X(ASK_PART_COUNT) \
  X(INVALID_PART_COUNT) \
  X(READY) \
  X(CANCELLED) \
  X(NEED_PART_COUNT) /* a file arrived before the part count */ \
  X(NOT_STARTED) /* a part arrived without a chunked session */ \
  X(NOT_ARCHIVE) \
  X(INVALID_PART_NAME) \
  X(TOO_LARGE) \
  X(WRONG_ORDER) \
  X(QUOTA_EXCEEDED) \
  X(REJECTED) \
  X(DOWNLOAD_FAILED) \
  X(PART_SAVED) \
  X(ASSEMBLY_FAILED) \
  X(SUBMITTED)
enum class TransferSignal {
#define X(name) name,
  ENUM_TRANSFER_SIGNAL_
#undef X
};

struct TransferReply {
  TransferSignal signal;
  // WRONG_ORDER: "0 or 1" for the first part, the part number otherwise
  std::string expected;
  int got = 0;
  int received = 0;
  int total = 0;
  long limit = 0; // TOO_LARGE: bytes; QUOTA_EXCEEDED: submissions
  std::string detail;
  std::optional<Submission> submission; // SUBMITTED
};

// Where a new submission of a team goes
struct SubmissionPlan {
  long team_id = 0;
  long membership_id = 0;
  std::string title; // "<slug> #<seq>"
  fs::path destination; // absolute
  fs::path workspace; // for parts
  std::string relative_path; // stored in the submission
};

// Throws TransferError if the membership has no team, QuotaExceededError if
//   the team already used up its track's submissions
SubmissionPlan PlanSubmission(ContestDirectory&, SubmissionStore&, long membership_id);

using PlanProvider = std::function<SubmissionPlan()>;
// Downloads a file to the given path; returns false or throws TransferError on failure
using PartFetcher = std::function<bool(const fs::path&)>;

struct TransferSession {
  int expected_part_count = 0;
  std::optional<int> base_part_index;
  int received_count = 0;
  std::vector<fs::path> ordered_part_paths;
  std::optional<SubmissionPlan> plan;
};

// Chunked-upload protocol of one conversation. Not thread-safe.
class TransferAssembler {
  PlanProvider planner_;
  CreateFn create_;
  TransferState state_;
  TransferSession session_;

  TransferReply Assemble();
  TransferReply Finish(const SubmissionPlan&);
  void Reset(TransferState state);
  bool EnsurePlan(TransferReply& reply);
 public:
  TransferAssembler(PlanProvider planner, CreateFn create) :
      planner_(std::move(planner)), create_(std::move(create)), state_(TransferState::IDLE) {}

  TransferState State() const { return state_; }
  const TransferSession& Session() const { return session_; }

  TransferReply BeginChunked();
  TransferReply SetPartCount(const std::string& text);
  // dispatches to OfferPart or SubmitSingle according to the state
  TransferReply OfferDocument(const std::string& filename, long size, const PartFetcher& fetch);
  TransferReply OfferPart(const std::string& filename, long size, const PartFetcher& fetch);
  TransferReply SubmitSingle(const std::string& filename, long size, const PartFetcher& fetch);
  TransferReply Cancel();
};

bool IsZipPartName(const std::string& filename);
bool IsZipName(const std::string& filename);
// nullopt if filename has no .part<digits> suffix
std::optional<int> PartNumber(const std::string& filename);

// Concatenate parts into dest through a temporary sibling; dest only appears
//   once every byte has been written
bool ConcatenateParts(const std::vector<fs::path>& parts, const fs::path& dest);

const char* TransferStateName(TransferState);
const char* TransferSignalName(TransferSignal);

#endif  // INCLUDE_AUTOJUDGE_TRANSFER_H_
