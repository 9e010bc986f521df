#ifndef INCLUDE_AUTOJUDGE_DIRECTORY_H_
#define INCLUDE_AUTOJUDGE_DIRECTORY_H_

#include <vector>
#include <optional>

#include "submission.h"

// Read-only view of competitions, teams and users
class ContestDirectory {
 public:
  virtual ~ContestDirectory() = default;
  virtual std::optional<Membership> GetMembership(long membership_id) = 0;
  virtual std::optional<Team> GetTeam(long team_id) = 0;
  virtual std::optional<Track> GetTrack(long track_id) = 0;
  virtual std::vector<Membership> GetTeamMemberships(long team_id) = 0;
  virtual std::optional<Recipient> GetRecipient(long user_id) = 0;
};

// Failures are reported as PersistenceError
class SubmissionStore {
 public:
  virtual ~SubmissionStore() = default;
  // the id of the argument is ignored
  virtual Submission Create(const Submission&) = 0;
  virtual std::optional<Submission> Get(long id) = 0;
  virtual Submission Update(const SubmissionUpdate&) = 0;
  virtual int CountByMemberships(const std::vector<long>& membership_ids) = 0;
};

#endif  // INCLUDE_AUTOJUDGE_DIRECTORY_H_
