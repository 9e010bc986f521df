#ifndef CONTEST_DIRECTORY_H_
#define CONTEST_DIRECTORY_H_

#include <map>
#include <filesystem>

#include <nlohmann/json_fwd.hpp>
#include <autojudge/directory.h>

// Contest directory read from a JSON file:
// {"tracks": [{"id", "slug", "sort_by", "max_submissions_total", "max_contestants"}],
//  "teams": [{"id", "slug", "track_id"}],
//  "memberships": [{"id", "team_id", "user_id"}],
//  "users": [{"id", "chat_id"}]}
class JsonContestDirectory : public ContestDirectory {
  std::map<long, Track> tracks_;
  std::map<long, Team> teams_;
  std::map<long, Membership> memberships_;
  std::map<long, Recipient> users_;
 public:
  JsonContestDirectory() = default;
  explicit JsonContestDirectory(const nlohmann::json&);
  // throws std::runtime_error or nlohmann::json::exception
  static JsonContestDirectory Load(const std::filesystem::path&);

  std::optional<Membership> GetMembership(long membership_id) override;
  std::optional<Team> GetTeam(long team_id) override;
  std::optional<Track> GetTrack(long track_id) override;
  std::vector<Membership> GetTeamMemberships(long team_id) override;
  std::optional<Recipient> GetRecipient(long user_id) override;
};

#endif  // CONTEST_DIRECTORY_H_
