#include <autojudge/notification.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <autojudge/errors.h>
#include <autojudge/utils.h>

std::string StatusLabel(const TextCatalog& catalog, SubmissionStatus status) {
  std::string code = SubmissionStatusName(status);
  std::string key = "submissions.status." + code;
  if (catalog.Has(key)) return catalog.Get(key);
  return ToUpper(code);
}

std::optional<std::string> NotificationDiffer::Compose(
    const std::optional<Submission>& previous, const Submission& updated) const {
  if (previous && previous->status == updated.status &&
      previous->value == updated.value && previous->title == updated.title) {
    return std::nullopt;
  }
  std::string status_current = StatusLabel(catalog_, updated.status);
  std::string value_current = FormatValue(updated.value);

  std::string text = catalog_.Get("submit.notify.header");
  text += '\n' + catalog_.Get("submit.notify.title", {{"title", updated.title}});
  if (previous && previous->status != updated.status) {
    text += '\n' + catalog_.Get("submit.notify.status_change", {
        {"old", StatusLabel(catalog_, previous->status)}, {"new", status_current}});
  } else {
    text += '\n' + catalog_.Get("submit.notify.status", {{"value", status_current}});
  }
  if (previous && previous->value != updated.value) {
    text += '\n' + catalog_.Get("submit.notify.value_change", {
        {"old", FormatValue(previous->value)}, {"new", value_current}});
  } else {
    text += '\n' + catalog_.Get("submit.notify.value", {{"value", value_current}});
  }
  return text;
}

void NotificationDiffer::Notify(const std::optional<Submission>& previous, const Submission& updated) {
  auto text = Compose(previous, updated);
  if (!text) {
    spdlog::debug("Submission {} unchanged; skipping notification", updated.id);
    return;
  }
  auto membership = directory_.GetMembership(updated.team_membership_id);
  auto recipient = membership ? directory_.GetRecipient(membership->user_id) : std::nullopt;
  if (!recipient) {
    spdlog::debug("Submission {}: user lookup failed; skipping notification", updated.id);
    return;
  }
  if (!recipient->chat_id) {
    spdlog::debug("Submission {}: user {} has no chat; skipping notification",
                  updated.id, recipient->user_id);
    return;
  }
  try {
    messenger_.SendMessage(*recipient->chat_id, *text);
  } catch (const DeliveryError& err) {
    spdlog::warn("Failed to deliver submission notification to user {}: {}",
                 recipient->user_id, err.what());
    return;
  }
  spdlog::info("Submission {} notification sent to user {}", updated.id, recipient->user_id);
}

UpdateFn NotificationDiffer::Wrap(UpdateFn update) {
  return [this, update = std::move(update)](const SubmissionUpdate& payload) {
    std::optional<Submission> previous;
    try {
      previous = snapshot_(payload.id);
    } catch (const std::exception& err) {
      spdlog::debug("Could not snapshot submission {} before update: {}", payload.id, err.what());
    }
    Submission updated = update(payload);
    try {
      Notify(previous, updated);
    } catch (const std::exception& err) {
      spdlog::error("Failed to send submission update notification for {}: {}", payload.id, err.what());
    }
    return updated;
  };
}
