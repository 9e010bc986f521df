#include "console_messenger.h"

#include <iostream>

#include <spdlog/spdlog.h>
#include <autojudge/errors.h>

namespace fs = std::filesystem;

void ConsoleMessenger::SendMessage(long chat_id, const std::string& text) {
  std::cout << "[chat " << chat_id << "]\n" << text << std::endl;
  if (!std::cout) throw DeliveryError("stdout is not writable");
}

void ConsoleMessenger::SendDocument(long chat_id, const fs::path& file,
                                    const std::string& filename, const std::string& caption) {
  fs::path dir = outbox_ / std::to_string(chat_id);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (!ec) fs::copy_file(file, dir / fs::path(filename).filename(), fs::copy_options::overwrite_existing, ec);
  if (ec) throw DeliveryError("cannot store " + filename + ": " + ec.message());
  spdlog::debug("Document {} stored in {}", filename, dir.c_str());
  std::cout << "[chat " << chat_id << "] document " << (dir / filename).string();
  if (!caption.empty()) std::cout << " (" << caption << ")";
  std::cout << std::endl;
}
