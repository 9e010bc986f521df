#include "contest_directory.h"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <autojudge/utils.h>

namespace {

template <class T>
std::optional<T> Find(const std::map<long, T>& mp, long id) {
  auto it = mp.find(id);
  if (it == mp.end()) return std::nullopt;
  return it->second;
}

} // namespace

JsonContestDirectory::JsonContestDirectory(const nlohmann::json& body) {
  for (auto& i : body.value("tracks", nlohmann::json::array())) {
    Track track;
    track.id = i.at("id").get<long>();
    track.slug = i.at("slug").get<std::string>();
    track.sort_by = GetSortDirection(i.value("sort_by", "desc"));
    track.max_submissions_total = i.value("max_submissions_total", 100);
    track.max_contestants = i.value("max_contestants", 3);
    tracks_[track.id] = track;
  }
  for (auto& i : body.value("teams", nlohmann::json::array())) {
    Team team;
    team.id = i.at("id").get<long>();
    team.slug = i.at("slug").get<std::string>();
    if (i.contains("track_id") && !i["track_id"].is_null()) team.track_id = i["track_id"].get<long>();
    teams_[team.id] = team;
  }
  for (auto& i : body.value("memberships", nlohmann::json::array())) {
    Membership membership{
      .id = i.at("id").get<long>(),
      .team_id = i.at("team_id").get<long>(),
      .user_id = i.at("user_id").get<long>(),
    };
    memberships_[membership.id] = membership;
  }
  for (auto& i : body.value("users", nlohmann::json::array())) {
    Recipient user;
    user.user_id = i.at("id").get<long>();
    if (i.contains("chat_id") && !i["chat_id"].is_null()) user.chat_id = i["chat_id"].get<long>();
    users_[user.user_id] = user;
  }
  spdlog::info("Contest directory: {} tracks, {} teams, {} memberships, {} users",
               tracks_.size(), teams_.size(), memberships_.size(), users_.size());
}

JsonContestDirectory JsonContestDirectory::Load(const std::filesystem::path& path) {
  std::ifstream fin(path);
  if (!fin) throw std::runtime_error("cannot open contest directory " + path.string());
  return JsonContestDirectory(nlohmann::json::parse(fin));
}

std::optional<Membership> JsonContestDirectory::GetMembership(long membership_id) {
  return Find(memberships_, membership_id);
}

std::optional<Team> JsonContestDirectory::GetTeam(long team_id) {
  return Find(teams_, team_id);
}

std::optional<Track> JsonContestDirectory::GetTrack(long track_id) {
  return Find(tracks_, track_id);
}

std::vector<Membership> JsonContestDirectory::GetTeamMemberships(long team_id) {
  std::vector<Membership> ret;
  for (auto& [id, membership] : memberships_) {
    if (membership.team_id == team_id) ret.push_back(membership);
  }
  return ret;
}

std::optional<Recipient> JsonContestDirectory::GetRecipient(long user_id) {
  return Find(users_, user_id);
}
