#include <autojudge/transfer.h>

#include <ctime>
#include <regex>
#include <fstream>

#include <spdlog/spdlog.h>
#include <autojudge/errors.h>
#include <autojudge/paths.h>
#include "utils.h"

long kFilePartLimit = 48L * 1024 * 1024;

namespace {

const std::regex kZipPartPattern(R"(.+\.zip\.part\d+$)", std::regex::icase);
const std::regex kPartNumberPattern(R"(\.part(\d+)$)", std::regex::icase);

std::string SafeSlug(const std::string& slug) {
  std::string ret = Trim(slug);
  for (auto& c : ret) {
    if (c == ' ' || c == '/' || c == '\\') c = '_';
  }
  if (ret.empty() || ret == "." || ret == "..") ret = "team";
  return ret;
}

} // namespace

bool IsZipPartName(const std::string& filename) {
  return std::regex_match(filename, kZipPartPattern);
}

bool IsZipName(const std::string& filename) {
  std::string lower = ToLower(filename);
  return lower.size() > 4 && lower.compare(lower.size() - 4, 4, ".zip") == 0;
}

std::optional<int> PartNumber(const std::string& filename) {
  std::smatch match;
  if (!std::regex_search(filename, match, kPartNumberPattern)) return std::nullopt;
  std::string digits = match[1].str();
  size_t nonzero = digits.find_first_not_of('0');
  if (nonzero != std::string::npos && digits.size() - nonzero > 9) return std::nullopt;
  return std::stoi(digits);
}

bool ConcatenateParts(const std::vector<fs::path>& parts, const fs::path& dest) {
  fs::path tmp = dest;
  tmp += ".partial";
  spdlog::debug("Assembling {} parts into {}", parts.size(), dest.c_str());
  {
    std::ofstream fout(tmp, std::ios::binary | std::ios::trunc);
    if (!fout) goto err;
    char buf[65536];
    for (auto& part : parts) {
      std::ifstream fin(part, std::ios::binary);
      if (!fin) {
        spdlog::warn("Cannot open part {}", part.c_str());
        goto err;
      }
      while (fin.read(buf, sizeof(buf)) || fin.gcount() > 0) {
        if (!fout.write(buf, fin.gcount())) goto err;
      }
      if (fin.bad()) goto err;
    }
    fout.close();
    if (!fout) goto err;
  }
  if (!Move(tmp, dest)) goto err;
  return true;
err:
  spdlog::warn("Failed assembling {}", dest.c_str());
  std::error_code ec;
  fs::remove(tmp, ec);
  return false;
}

SubmissionPlan PlanSubmission(ContestDirectory& directory, SubmissionStore& store, long membership_id) {
  auto membership = directory.GetMembership(membership_id);
  if (!membership) throw TransferError("membership not found");
  auto team = directory.GetTeam(membership->team_id);
  if (!team) throw TransferError("team not found");

  std::vector<long> ids;
  for (auto& i : directory.GetTeamMemberships(team->id)) ids.push_back(i.id);
  int count = store.CountByMemberships(ids);
  if (team->track_id) {
    auto track = directory.GetTrack(*team->track_id);
    if (track && track->max_submissions_total > 0 && count >= track->max_submissions_total) {
      throw QuotaExceededError(track->max_submissions_total);
    }
  }

  int seq = count + 1;
  std::string safe_slug = SafeSlug(team->slug);
  SubmissionPlan plan;
  plan.team_id = team->id;
  plan.membership_id = membership_id;
  plan.title = Trim(team->slug) + " #" + std::to_string(seq);
  plan.destination = SubmissionArtifact(team->id, safe_slug, seq);
  plan.workspace = TransferWorkspace(safe_slug, seq);
  plan.relative_path = plan.destination.lexically_relative(kStorageRoot).string();
  return plan;
}

void TransferAssembler::Reset(TransferState state) {
  for (auto& i : session_.ordered_part_paths) RemoveAll(i);
  if (session_.plan) RemoveAll(session_.plan->workspace);
  session_ = TransferSession();
  state_ = state;
}

bool TransferAssembler::EnsurePlan(TransferReply& reply) {
  if (session_.plan) return true;
  try {
    session_.plan = planner_();
    return true;
  } catch (const QuotaExceededError& err) {
    reply.signal = TransferSignal::QUOTA_EXCEEDED;
    reply.limit = err.Limit();
  } catch (const TransferError& err) {
    reply.signal = TransferSignal::REJECTED;
    reply.detail = err.what();
  } catch (const PersistenceError& err) {
    reply.signal = TransferSignal::REJECTED;
    reply.detail = err.what();
  }
  spdlog::info("Transfer rejected: {} {}", TransferSignalName(reply.signal), reply.detail);
  Reset(TransferState::IDLE);
  return false;
}

TransferReply TransferAssembler::BeginChunked() {
  Reset(TransferState::AWAITING_PART_COUNT);
  return {.signal = TransferSignal::ASK_PART_COUNT};
}

TransferReply TransferAssembler::SetPartCount(const std::string& text) {
  if (state_ != TransferState::AWAITING_PART_COUNT) return {.signal = TransferSignal::NOT_STARTED};
  std::string str = NormalizeSlug(text);
  if (str == "cancel" || str == "stop") return Cancel();
  bool numeric = !str.empty() && str.size() <= 3 &&
      str.find_first_not_of("0123456789") == std::string::npos;
  int total = numeric ? std::stoi(str) : 0;
  if (total < kMinParts || total > kMaxParts) return {.signal = TransferSignal::INVALID_PART_COUNT};
  session_ = TransferSession();
  session_.expected_part_count = total;
  state_ = TransferState::COLLECTING_PARTS;
  spdlog::debug("Chunked transfer expects {} parts", total);
  return {.signal = TransferSignal::READY, .total = total};
}

TransferReply TransferAssembler::OfferDocument(
    const std::string& filename, long size, const PartFetcher& fetch) {
  switch (state_) {
    case TransferState::COLLECTING_PARTS:
      return OfferPart(filename, size, fetch);
    case TransferState::AWAITING_PART_COUNT:
      return {.signal = TransferSignal::NEED_PART_COUNT};
    default:
      if (IsZipPartName(filename)) return {.signal = TransferSignal::NOT_STARTED};
      return SubmitSingle(filename, size, fetch);
  }
}

TransferReply TransferAssembler::OfferPart(
    const std::string& filename, long size, const PartFetcher& fetch) {
  if (state_ != TransferState::COLLECTING_PARTS) return {.signal = TransferSignal::NOT_STARTED};
  TransferReply reply{
    .signal = TransferSignal::PART_SAVED,
    .received = session_.received_count,
    .total = session_.expected_part_count,
  };
  auto number = IsZipPartName(filename) ? PartNumber(filename) : std::nullopt;
  if (!number) {
    reply.signal = TransferSignal::INVALID_PART_NAME;
    return reply;
  }
  reply.got = *number;
  if (size > kFilePartLimit) {
    reply.signal = TransferSignal::TOO_LARGE;
    reply.limit = kFilePartLimit;
    return reply;
  }
  if (!session_.base_part_index) {
    if (*number != 0 && *number != 1) {
      reply.signal = TransferSignal::WRONG_ORDER;
      reply.expected = "0 or 1";
      return reply;
    }
  } else if (int expected = *session_.base_part_index + session_.received_count; *number != expected) {
    spdlog::debug("Part {} rejected, expected {}", *number, expected);
    reply.signal = TransferSignal::WRONG_ORDER;
    reply.expected = std::to_string(expected);
    return reply;
  }
  if (!EnsurePlan(reply)) return reply;

  const SubmissionPlan& plan = *session_.plan;
  fs::path part_path = plan.workspace / fs::path(filename).filename();
  bool ok = CreateDirs(plan.workspace);
  if (ok) {
    try {
      ok = fetch(part_path);
    } catch (const TransferError& err) {
      spdlog::warn("Download of part {} failed: {}", filename, err.what());
      ok = false;
    }
  }
  if (!ok) {
    std::error_code ec;
    fs::remove(part_path, ec);
    reply.signal = TransferSignal::DOWNLOAD_FAILED;
    return reply;
  }

  if (!session_.base_part_index) session_.base_part_index = *number;
  session_.ordered_part_paths.push_back(part_path);
  reply.received = ++session_.received_count;
  spdlog::info("Part {}/{} saved to {}", reply.received, reply.total, part_path.c_str());
  if (session_.received_count == session_.expected_part_count) return Assemble();
  return reply;
}

TransferReply TransferAssembler::Assemble() {
  state_ = TransferState::ASSEMBLING;
  SubmissionPlan plan = *session_.plan;
  int total = session_.expected_part_count;
  if (!CreateDirs(plan.destination.parent_path()) ||
      !ConcatenateParts(session_.ordered_part_paths, plan.destination)) {
    Reset(TransferState::ERROR);
    return {.signal = TransferSignal::ASSEMBLY_FAILED, .received = total, .total = total};
  }
  Reset(TransferState::ASSEMBLING);
  TransferReply reply = Finish(plan);
  reply.received = reply.total = total;
  state_ = reply.signal == TransferSignal::SUBMITTED ? TransferState::DONE : TransferState::ERROR;
  return reply;
}

TransferReply TransferAssembler::Finish(const SubmissionPlan& plan) {
  Submission draft;
  draft.team_membership_id = plan.membership_id;
  draft.title = plan.title;
  draft.artifact_path = plan.relative_path;
  draft.status = SubmissionStatus::PENDING;
  draft.created_at = time(nullptr);
  try {
    Submission created = create_(draft);
    spdlog::info("Submission {} created at {}", created.id, plan.destination.c_str());
    return {.signal = TransferSignal::SUBMITTED, .submission = std::move(created)};
  } catch (const PersistenceError& err) {
    spdlog::error("Failed to create submission for {}: {}", plan.destination.c_str(), err.what());
    RemoveAll(plan.destination);
    return {.signal = TransferSignal::REJECTED, .detail = err.what()};
  }
}

TransferReply TransferAssembler::SubmitSingle(
    const std::string& filename, long size, const PartFetcher& fetch) {
  if (!IsZipName(filename)) return {.signal = TransferSignal::NOT_ARCHIVE};
  if (size > kFilePartLimit) return {.signal = TransferSignal::TOO_LARGE, .limit = kFilePartLimit};
  SubmissionPlan plan;
  try {
    plan = planner_();
  } catch (const QuotaExceededError& err) {
    return {.signal = TransferSignal::QUOTA_EXCEEDED, .limit = err.Limit()};
  } catch (const TransferError& err) {
    return {.signal = TransferSignal::REJECTED, .detail = err.what()};
  } catch (const PersistenceError& err) {
    return {.signal = TransferSignal::REJECTED, .detail = err.what()};
  }

  fs::path tmp = plan.destination;
  tmp += ".partial";
  bool ok = CreateDirs(plan.destination.parent_path());
  if (ok) {
    try {
      ok = fetch(tmp) && Move(tmp, plan.destination);
    } catch (const TransferError& err) {
      spdlog::warn("Download of {} failed: {}", filename, err.what());
      ok = false;
    }
  }
  if (!ok) {
    std::error_code ec;
    fs::remove(tmp, ec);
    return {.signal = TransferSignal::DOWNLOAD_FAILED};
  }
  return Finish(plan);
}

TransferReply TransferAssembler::Cancel() {
  spdlog::debug("Transfer cancelled in state {}", TransferStateName(state_));
  Reset(TransferState::IDLE);
  return {.signal = TransferSignal::CANCELLED};
}
