#ifndef INCLUDE_AUTOJUDGE_NOTIFICATION_H_
#define INCLUDE_AUTOJUDGE_NOTIFICATION_H_

#include <optional>

#include "directory.h"
#include "messenger.h"
#include "text_catalog.h"

class NotificationDiffer {
  ContestDirectory& directory_;
  Messenger& messenger_;
  const TextCatalog& catalog_;
  GetFn snapshot_;

  void Notify(const std::optional<Submission>& previous, const Submission& updated);
 public:
  NotificationDiffer(ContestDirectory& directory, Messenger& messenger,
                     const TextCatalog& catalog, GetFn snapshot) :
      directory_(directory), messenger_(messenger), catalog_(catalog),
      snapshot_(std::move(snapshot)) {}

  // The returned function performs the update and then tells the owner of the
  //   submission what changed. Notification failures never fail the update.
  UpdateFn Wrap(UpdateFn update);

  // nullopt if status, value and title are all unchanged
  std::optional<std::string> Compose(const std::optional<Submission>& previous,
                                     const Submission& updated) const;
};

std::string StatusLabel(const TextCatalog&, SubmissionStatus);

#endif  // INCLUDE_AUTOJUDGE_NOTIFICATION_H_
