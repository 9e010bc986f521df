#include "utils.h"

#include <fstream>
#include <sstream>

#include <autojudge/errors.h>

namespace {

template <class T>
std::optional<T> Find(const std::map<long, T>& mp, long id) {
  auto it = mp.find(id);
  if (it == mp.end()) return std::nullopt;
  return it->second;
}

} // namespace

FakeDirectory FakeDirectory::Basic(const std::string& track_slug, int quota) {
  FakeDirectory ret;
  ret.tracks[1] = {.id = 1, .slug = track_slug, .max_submissions_total = quota};
  ret.teams[10] = {.id = 10, .slug = "Night Owls", .track_id = 1};
  ret.memberships[100] = {.id = 100, .team_id = 10, .user_id = 1000};
  ret.memberships[101] = {.id = 101, .team_id = 10, .user_id = 1001};
  ret.users[1000] = {.user_id = 1000, .chat_id = 5000};
  ret.users[1001] = {.user_id = 1001};
  return ret;
}

std::optional<Membership> FakeDirectory::GetMembership(long membership_id) {
  return Find(memberships, membership_id);
}
std::optional<Team> FakeDirectory::GetTeam(long team_id) {
  return Find(teams, team_id);
}
std::optional<Track> FakeDirectory::GetTrack(long track_id) {
  return Find(tracks, track_id);
}
std::vector<Membership> FakeDirectory::GetTeamMemberships(long team_id) {
  std::vector<Membership> ret;
  for (auto& [id, membership] : memberships) {
    if (membership.team_id == team_id) ret.push_back(membership);
  }
  return ret;
}
std::optional<Recipient> FakeDirectory::GetRecipient(long user_id) {
  return Find(users, user_id);
}

Submission FakeStore::Create(const Submission& sub) {
  if (fail_create) throw PersistenceError("database is locked");
  Submission row = sub;
  row.id = next_id++;
  rows[row.id] = row;
  return row;
}

std::optional<Submission> FakeStore::Get(long id) {
  return Find(rows, id);
}

Submission FakeStore::Update(const SubmissionUpdate& update) {
  if (fail_update) throw PersistenceError("database is locked");
  auto it = rows.find(update.id);
  if (it == rows.end()) throw PersistenceError("not found");
  updates++;
  if (update.status) it->second.status = *update.status;
  if (update.value) it->second.value = update.value;
  if (update.title) it->second.title = *update.title;
  return it->second;
}

int FakeStore::CountByMemberships(const std::vector<long>& membership_ids) {
  int ret = 0;
  for (auto& [id, row] : rows) {
    for (long i : membership_ids) ret += row.team_membership_id == i;
  }
  return ret;
}

void RecordingMessenger::SendMessage(long chat_id, const std::string& text) {
  if (fail) throw DeliveryError("chat not found");
  messages.emplace_back(chat_id, text);
}

void RecordingMessenger::SendDocument(long chat_id, const fs::path& file,
                                      const std::string& filename, const std::string& caption) {
  if (fail) throw DeliveryError("chat not found");
  if (throttle > 0) {
    throttle--;
    throttled++;
    throw FlowControlError("too many requests", 1500);
  }
  documents.push_back({chat_id, filename, caption, ReadFile(file)});
}

SandboxRunResult FakeRuntime::Run(const SandboxRequest& req) {
  requests.push_back(req);
  if (handler) return handler(req);
  return {.kind = RunKind::EXITED, .exit_code = 0};
}

void DirectoryExtractor::Extract(const fs::path& archive, const fs::path& boxdir, const fs::path& dest) {
  if (!fs::is_directory(archive)) throw ArchiveError("Submission archive could not be unpacked.");
  fs::copy(archive, InBox(boxdir, dest), fs::copy_options::recursive | fs::copy_options::copy_symlinks);
}

fs::path TestDir(const std::string& name) {
  fs::path ret = kStorageRoot / "test" / name;
  fs::remove_all(ret);
  fs::create_directories(ret);
  return ret;
}

void WriteFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  fout << content;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream fin(path, std::ios::binary);
  std::stringstream ss;
  ss << fin.rdbuf();
  return ss.str();
}
