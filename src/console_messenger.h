#ifndef CONSOLE_MESSENGER_H_
#define CONSOLE_MESSENGER_H_

#include <filesystem>

#include <autojudge/messenger.h>

// Prints messages to stdout and copies documents into an outbox directory
class ConsoleMessenger : public Messenger {
  std::filesystem::path outbox_;
 public:
  explicit ConsoleMessenger(std::filesystem::path outbox) : outbox_(std::move(outbox)) {}
  void SendMessage(long chat_id, const std::string& text) override;
  void SendDocument(long chat_id, const std::filesystem::path& file,
                    const std::string& filename, const std::string& caption) override;
};

#endif  // CONSOLE_MESSENGER_H_
