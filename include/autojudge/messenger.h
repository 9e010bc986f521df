#ifndef INCLUDE_AUTOJUDGE_MESSENGER_H_
#define INCLUDE_AUTOJUDGE_MESSENGER_H_

#include <string>
#include <filesystem>

// Outbound transport. Both calls may throw FlowControlError or DeliveryError.
class Messenger {
 public:
  virtual ~Messenger() = default;
  virtual void SendMessage(long chat_id, const std::string& text) = 0;
  virtual void SendDocument(long chat_id, const std::filesystem::path& file,
                            const std::string& filename, const std::string& caption) = 0;
};

#endif  // INCLUDE_AUTOJUDGE_MESSENGER_H_
