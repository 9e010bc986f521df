#include <autojudge/moderation.h>

#include <cmath>
#include <algorithm>

#include <spdlog/spdlog.h>
#include <autojudge/paths.h>
#include <autojudge/utils.h>
#include <autojudge/notification.h>

OverrideResult ApplyOverride(const GetFn& get, const UpdateFn& update, const OverrideRequest& req) {
  auto current = get(req.submission_id);
  if (!current) return OverrideResult::NOT_FOUND;
  SubmissionStatus required = req.action == OverrideAction::RATE ?
      SubmissionStatus::PENDING : SubmissionStatus::ACCEPTED;
  if (current->status != required) {
    spdlog::info("Override of submission {} is outdated: status is {}",
                 req.submission_id, SubmissionStatusName(current->status));
    return OverrideResult::OUTDATED;
  }
  update({.id = req.submission_id, .status = req.status, .value = req.value});
  spdlog::info("Submission {} overridden: status={} value={}", req.submission_id,
               SubmissionStatusName(req.status), FormatValue(req.value));
  return OverrideResult::APPLIED;
}

bool ParseOverrideValue(const std::string& text, std::optional<double>& value) {
  std::string str = NormalizeSlug(text);
  if (str == "skip" || str == "-") {
    value = std::nullopt;
    return true;
  }
  std::replace(str.begin(), str.end(), ',', '.');
  size_t pos = 0;
  try {
    double parsed = std::stod(str, &pos);
    if (pos != str.size() || !std::isfinite(parsed)) return false;
    value = parsed;
    return true;
  } catch (const std::invalid_argument&) {
    return false;
  } catch (const std::out_of_range&) {
    return false;
  }
}

std::string DescribeOutcome(const TextCatalog& catalog, const std::optional<EvaluationOutcome>& outcome) {
  if (!outcome) return catalog.Get("submit.success");
  std::string text = catalog.Get(outcome->success ? "submit.auto_success" : "submit.auto_failed");
  if (outcome->status) {
    text += '\n' + catalog.Get("submit.auto_status", {{"status", StatusLabel(catalog, *outcome->status)}});
  }
  if (outcome->value) {
    text += '\n' + catalog.Get("submit.auto_value", {{"value", FormatValue(outcome->value)}});
  }
  if (!outcome->message.empty()) {
    text += '\n' + catalog.Get("submit.auto_message", {{"message", outcome->message}});
  }
  return text;
}

std::string DescribeTransfer(const TextCatalog& catalog, const TransferReply& reply) {
  switch (reply.signal) {
    case TransferSignal::ASK_PART_COUNT: return catalog.Get("submit.multipart_ask_total");
    case TransferSignal::INVALID_PART_COUNT: return catalog.Get("submit.multipart_invalid_total");
    case TransferSignal::READY:
      return catalog.Get("submit.multipart_ready", {{"total", std::to_string(reply.total)}});
    case TransferSignal::CANCELLED: return catalog.Get("submit.multipart_cancelled");
    case TransferSignal::NEED_PART_COUNT: return catalog.Get("submit.multipart_need_total");
    case TransferSignal::NOT_STARTED: return catalog.Get("submit.multipart_not_started");
    case TransferSignal::NOT_ARCHIVE: return catalog.Get("submit.not_zip");
    case TransferSignal::INVALID_PART_NAME: return catalog.Get("submit.multipart_invalid_part");
    case TransferSignal::TOO_LARGE:
      return catalog.Get("submit.too_large", {{"limit", std::to_string(reply.limit / (1024 * 1024))}});
    case TransferSignal::WRONG_ORDER:
      return catalog.Get("submit.multipart_wrong_order",
                         {{"expected", reply.expected}, {"got", std::to_string(reply.got)}});
    case TransferSignal::QUOTA_EXCEEDED:
      return catalog.Get("submit.quota_exceeded", {{"limit", std::to_string(reply.limit)}});
    case TransferSignal::REJECTED: return catalog.Get("submit.rejected", {{"detail", reply.detail}});
    case TransferSignal::DOWNLOAD_FAILED: return catalog.Get("submit.download_failed");
    case TransferSignal::PART_SAVED:
      return catalog.Get("submit.multipart_part_saved",
                         {{"part", std::to_string(reply.received)}, {"total", std::to_string(reply.total)}});
    case TransferSignal::ASSEMBLY_FAILED: return catalog.Get("submit.multipart_assembly_failed");
    case TransferSignal::SUBMITTED: return catalog.Get("submit.success");
  }
  __builtin_unreachable();
}

bool SendSubmissionArtifact(Messenger& messenger, long chat_id, const Submission& sub,
                            long max_part_bytes, const Sleeper& sleeper) {
  auto path = ResolveArtifact(sub.artifact_path);
  if (!path) return false;
  DeliverArtifact(messenger, chat_id, *path, max_part_bytes, sub.title, sleeper);
  return true;
}
