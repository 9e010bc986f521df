#include "database.h"

#include <cmath>
#include <algorithm>
#include <system_error>

#include <spdlog/spdlog.h>
#include <autojudge/errors.h>
#include <autojudge/utils.h>

namespace {

// values are kept with 4 decimals, cut toward zero so the integer part never changes
std::optional<double> RoundValue(std::optional<double> value) {
  if (!value) return value;
  double whole = std::trunc(*value);
  // the slack keeps decimals such as 1.2346 from dropping a digit
  double frac = std::min(std::trunc(std::abs(*value - whole) * 10000 + 1e-6), 9999.0);
  return whole + std::copysign(frac / 10000, *value);
}

SubmissionRow ToRow(const Submission& sub) {
  return {
    .id = sub.id,
    .team_membership_id = sub.team_membership_id,
    .title = sub.title,
    .file_path = sub.artifact_path,
    .value = RoundValue(sub.value),
    .status = SubmissionStatusName(sub.status),
    .created_at = sub.created_at,
  };
}

Submission FromRow(const SubmissionRow& row) {
  Submission sub;
  sub.id = row.id;
  sub.team_membership_id = row.team_membership_id;
  sub.title = row.title;
  sub.artifact_path = row.file_path;
  sub.value = row.value;
  sub.status = GetSubmissionStatus(row.status).value_or(SubmissionStatus::PENDING);
  sub.created_at = row.created_at;
  return sub;
}

} // namespace

void Database::Init() {
  if (!db_) db_ = std::make_unique<Storage>(InitStorage(path_));
}

Submission Database::Create(const Submission& sub) {
  std::lock_guard lck(mtx_);
  try {
    Init();
    SubmissionRow row = ToRow(sub);
    row.id = db_->insert(row);
    spdlog::debug("Inserted submission {}", row.id);
    return FromRow(row);
  } catch (const std::system_error& err) {
    throw PersistenceError(std::string("cannot create submission: ") + err.what());
  }
}

std::optional<Submission> Database::Get(long id) {
  std::lock_guard lck(mtx_);
  try {
    Init();
    if (auto row = db_->get_pointer<SubmissionRow>(id)) return FromRow(*row);
    return std::nullopt;
  } catch (const std::system_error& err) {
    throw PersistenceError(std::string("cannot read submission: ") + err.what());
  }
}

Submission Database::Update(const SubmissionUpdate& update) {
  std::lock_guard lck(mtx_);
  try {
    Init();
    auto row = db_->get_pointer<SubmissionRow>(update.id);
    if (!row) throw PersistenceError("submission " + std::to_string(update.id) + " not found");
    if (update.status) row->status = SubmissionStatusName(*update.status);
    if (update.value) row->value = RoundValue(update.value);
    if (update.title) row->title = *update.title;
    db_->update(*row);
    return FromRow(*row);
  } catch (const std::system_error& err) {
    throw PersistenceError(std::string("cannot update submission: ") + err.what());
  }
}

int Database::CountByMemberships(const std::vector<long>& membership_ids) {
  using namespace sqlite_orm;
  if (membership_ids.empty()) return 0;
  std::lock_guard lck(mtx_);
  try {
    Init();
    return db_->count<SubmissionRow>(where(in(&SubmissionRow::team_membership_id, membership_ids)));
  } catch (const std::system_error& err) {
    throw PersistenceError(std::string("cannot count submissions: ") + err.what());
  }
}
