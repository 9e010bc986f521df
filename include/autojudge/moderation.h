#ifndef INCLUDE_AUTOJUDGE_MODERATION_H_
#define INCLUDE_AUTOJUDGE_MODERATION_H_

#include <string>
#include <optional>

#include "delivery.h"
#include "messenger.h"
#include "transfer.h"
#include "submission.h"
#include "text_catalog.h"

#define ENUM_OVERRIDE_ACTION_ \
  X(RATE, "rate") /* first rating of a pending submission */ \
  X(RERATE, "rerate") /* correction of an accepted one */
enum class OverrideAction {
#define X(name, code) name,
  ENUM_OVERRIDE_ACTION_
#undef X
};

#define ENUM_OVERRIDE_RESULT_ \
  X(APPLIED) \
  X(OUTDATED) \
  X(NOT_FOUND)
enum class OverrideResult {
#define X(name) name,
  ENUM_OVERRIDE_RESULT_
#undef X
};

struct OverrideRequest {
  long submission_id = 0;
  OverrideAction action = OverrideAction::RATE;
  SubmissionStatus status = SubmissionStatus::ACCEPTED;
  std::optional<double> value;
};

// The update should be the notifying one so the contestant hears about it
OverrideResult ApplyOverride(const GetFn& get, const UpdateFn& update, const OverrideRequest&);

std::optional<OverrideAction> GetOverrideAction(const std::string&);
const char* OverrideResultName(OverrideResult);
// "skip" and "-" mean no value; returns false on anything else that is not a number
bool ParseOverrideValue(const std::string& text, std::optional<double>& value);

// Reply shown to the contestant right after a submission is created
std::string DescribeOutcome(const TextCatalog&, const std::optional<EvaluationOutcome>&);
std::string DescribeTransfer(const TextCatalog&, const TransferReply&);

// Send the artifact of a submission; false if it cannot be resolved inside kStorageRoot
bool SendSubmissionArtifact(Messenger&, long chat_id, const Submission&, long max_part_bytes,
                            const Sleeper& sleeper = SleepFor);

#endif  // INCLUDE_AUTOJUDGE_MODERATION_H_
