#ifndef INCLUDE_AUTOJUDGE_ERRORS_H_
#define INCLUDE_AUTOJUDGE_ERRORS_H_

#include <stdexcept>

// Transfer-level failure; the user may retry the step
class TransferError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class QuotaExceededError : public TransferError {
  int limit_;
 public:
  explicit QuotaExceededError(int limit) :
      TransferError("submission quota exceeded"), limit_(limit) {}
  int Limit() const { return limit_; }
};

// The archive is malformed or has a wrong layout
class ArchiveError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class SandboxError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ScoringError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class PersistenceError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class DeliveryError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The transport asks the sender to slow down
class FlowControlError : public DeliveryError {
  long retry_after_ms_;
 public:
  FlowControlError(const std::string& what, long retry_after_ms) :
      DeliveryError(what), retry_after_ms_(retry_after_ms) {}
  long RetryAfterMs() const { return retry_after_ms_; }
};

#endif  // INCLUDE_AUTOJUDGE_ERRORS_H_
