#include <nlohmann/json.hpp>
#include "contest_directory.h"
#include "utils.h"

TEST(ContestDirectoryTest, ParsesEntities) {
  JsonContestDirectory dir(nlohmann::json::parse(R"({
    "tracks": [
      {"id": 1, "slug": "first_track", "sort_by": "ASC", "max_submissions_total": 5},
      {"id": 2, "slug": "second_track"}
    ],
    "teams": [
      {"id": 10, "slug": "owls", "track_id": 1},
      {"id": 11, "slug": "larks", "track_id": null}
    ],
    "memberships": [
      {"id": 100, "team_id": 10, "user_id": 1000},
      {"id": 101, "team_id": 10, "user_id": 1001},
      {"id": 102, "team_id": 11, "user_id": 1002}
    ],
    "users": [
      {"id": 1000, "chat_id": 5000},
      {"id": 1001}
    ]
  })"));
  auto track = dir.GetTrack(1);
  ASSERT_TRUE(track);
  EXPECT_EQ(track->sort_by, SortDirection::ASC);
  EXPECT_EQ(track->max_submissions_total, 5);
  auto second = dir.GetTrack(2);
  ASSERT_TRUE(second);
  EXPECT_EQ(second->sort_by, SortDirection::DESC);
  EXPECT_EQ(second->max_submissions_total, 100);
  EXPECT_EQ(second->max_contestants, 3);

  EXPECT_EQ(dir.GetTeam(10)->track_id, 1);
  EXPECT_FALSE(dir.GetTeam(11)->track_id);
  EXPECT_FALSE(dir.GetTeam(12));
  EXPECT_EQ(dir.GetMembership(101)->user_id, 1001);
  EXPECT_EQ(dir.GetTeamMemberships(10).size(), 2u);
  EXPECT_TRUE(dir.GetTeamMemberships(99).empty());
  EXPECT_EQ(dir.GetRecipient(1000)->chat_id, 5000);
  EXPECT_FALSE(dir.GetRecipient(1001)->chat_id);
  EXPECT_FALSE(dir.GetRecipient(1002));
}

TEST(ContestDirectoryTest, Load) {
  fs::path file = TestDir("directory") / "contest.json";
  WriteFile(file, R"({"teams": [{"id": 1, "slug": "t"}]})");
  auto dir = JsonContestDirectory::Load(file);
  EXPECT_EQ(dir.GetTeam(1)->slug, "t");
  EXPECT_FALSE(dir.GetTrack(1));
  EXPECT_THROW(JsonContestDirectory::Load(file.parent_path() / "missing.json"), std::runtime_error);
  WriteFile(file, R"({"teams": [{"slug": "no id"}]})");
  EXPECT_THROW(JsonContestDirectory::Load(file), nlohmann::json::exception);
}
