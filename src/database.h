#ifndef DATABASE_H_
#define DATABASE_H_

#include <mutex>
#include <memory>
#include <string>

#include <sqlite_orm/sqlite_orm.h>
#include <autojudge/directory.h>

struct SubmissionRow {
  long id;
  long team_membership_id;
  std::string title;
  std::string file_path;
  std::optional<double> value;
  std::string status;
  long created_at;
};

namespace {

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_index("idx_submission_membership", &SubmissionRow::team_membership_id),
      make_table("submission",
                 make_column("id", &SubmissionRow::id, primary_key().autoincrement()),
                 make_column("team_membership_id", &SubmissionRow::team_membership_id),
                 make_column("title", &SubmissionRow::title),
                 make_column("file_path", &SubmissionRow::file_path),
                 make_column("value", &SubmissionRow::value),
                 make_column("status", &SubmissionRow::status, default_value("pending")),
                 make_column("created_at", &SubmissionRow::created_at)));
  storage.sync_schema(true);
  return storage;
}

} // namespace

// Submission store on a sqlite file; errors surface as PersistenceError
class Database : public SubmissionStore {
 public:
  using Storage = decltype(InitStorage(""));

 private:
  std::string path_;
  std::mutex mtx_;
  std::unique_ptr<Storage> db_;

  void Init();

 public:
  explicit Database(std::string path) : path_(std::move(path)) {}

  Submission Create(const Submission&) override;
  std::optional<Submission> Get(long id) override;
  Submission Update(const SubmissionUpdate&) override;
  int CountByMemberships(const std::vector<long>& membership_ids) override;
};

#endif  // DATABASE_H_
