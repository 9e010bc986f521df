#ifndef INCLUDE_AUTOJUDGE_SUBMISSION_H_
#define INCLUDE_AUTOJUDGE_SUBMISSION_H_

#include <string>
#include <optional>
#include <functional>

#define ENUM_SUBMISSION_STATUS_ \
  X(PENDING, "pending") \
  X(ACCEPTED, "accepted") \
  X(REJECTED, "rejected") \
  X(ERROR, "error")
enum class SubmissionStatus {
#define X(name, code) name,
  ENUM_SUBMISSION_STATUS_
#undef X
};

#define ENUM_SORT_DIRECTION_ \
  X(ASC, "asc") \
  X(DESC, "desc")
enum class SortDirection {
#define X(name, code) name,
  ENUM_SORT_DIRECTION_
#undef X
};

struct Track {
  long id = 0;
  std::string slug;
  SortDirection sort_by = SortDirection::DESC;
  int max_submissions_total = 100;
  int max_contestants = 3;
};

struct Team {
  long id = 0;
  std::string slug;
  std::optional<long> track_id;
};

// a user's seat in a team; submissions belong to memberships
struct Membership {
  long id = 0;
  long team_id = 0;
  long user_id = 0;
};

struct Recipient {
  long user_id = 0;
  std::optional<long> chat_id;
};

class Submission {
 public:
  long id = 0;
  long team_membership_id = 0;
  std::string title;
  // relative to kStorageRoot
  std::string artifact_path;
  std::optional<double> value;
  SubmissionStatus status = SubmissionStatus::PENDING;
  long created_at = 0; // UNIX timestamp, seconds
};

// unset fields are left untouched
struct SubmissionUpdate {
  long id = 0;
  std::optional<SubmissionStatus> status;
  std::optional<double> value;
  std::optional<std::string> title;
};

struct EvaluationOutcome {
  std::optional<SubmissionStatus> status;
  std::optional<double> value;
  std::string message;
  bool success = true;
};

// Submission operations passed between components. Interceptors take one of
//   these and return a wrapped version with the same signature.
using CreateFn = std::function<Submission(const Submission&)>;
using UpdateFn = std::function<Submission(const SubmissionUpdate&)>;
using GetFn = std::function<std::optional<Submission>(long id)>;

#endif  // INCLUDE_AUTOJUDGE_SUBMISSION_H_
