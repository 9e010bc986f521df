#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <string>
#include <vector>
#include <functional>

#include <gtest/gtest.h>
#include <autojudge/paths.h>
#include <autojudge/runtime.h>
#include <autojudge/directory.h>
#include <autojudge/messenger.h>

class FakeDirectory : public ContestDirectory {
 public:
  std::map<long, Track> tracks;
  std::map<long, Team> teams;
  std::map<long, Membership> memberships;
  std::map<long, Recipient> users;

  // Track 1 with the given slug, team 10 on it, member 100 (user 1000, chat 5000)
  //   and member 101 (user 1001 without chat)
  static FakeDirectory Basic(const std::string& track_slug = "first_track", int quota = 100);

  std::optional<Membership> GetMembership(long membership_id) override;
  std::optional<Team> GetTeam(long team_id) override;
  std::optional<Track> GetTrack(long track_id) override;
  std::vector<Membership> GetTeamMemberships(long team_id) override;
  std::optional<Recipient> GetRecipient(long user_id) override;
};

class FakeStore : public SubmissionStore {
 public:
  std::map<long, Submission> rows;
  long next_id = 1;
  bool fail_create = false;
  bool fail_update = false;
  int updates = 0;

  Submission Create(const Submission&) override;
  std::optional<Submission> Get(long id) override;
  Submission Update(const SubmissionUpdate&) override;
  int CountByMemberships(const std::vector<long>& membership_ids) override;
};

class RecordingMessenger : public Messenger {
 public:
  struct Document {
    long chat_id;
    std::string filename;
    std::string caption;
    std::string content;
  };
  std::vector<std::pair<long, std::string>> messages;
  std::vector<Document> documents;
  int throttle = 0; // the next this many SendDocument calls are throttled
  int throttled = 0;
  bool fail = false;

  void SendMessage(long chat_id, const std::string& text) override;
  void SendDocument(long chat_id, const fs::path& file,
                    const std::string& filename, const std::string& caption) override;
};

class FakeRuntime : public SandboxRuntime {
 public:
  using Handler = std::function<SandboxRunResult(const SandboxRequest&)>;
  Handler handler; // exits with 0 if unset
  std::vector<SandboxRequest> requests;

  SandboxRunResult Run(const SandboxRequest&) override;
};

// Treats the "archive" as a directory and copies it into the box, keeping
//   symbolic links as unzip does
class DirectoryExtractor : public ArchiveExtractor {
 public:
  void Extract(const fs::path& archive, const fs::path& boxdir, const fs::path& dest) override;
};

// fresh empty directory under the test storage root
fs::path TestDir(const std::string& name);
void WriteFile(const fs::path&, const std::string&);
std::string ReadFile(const fs::path&);
// host path of a path seen from inside the box
inline fs::path InBox(const fs::path& box, const fs::path& inside) {
  return box / inside.relative_path();
}

#endif // TEST_UTILS_H_
