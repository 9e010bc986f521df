#include <autojudge/delivery.h>

#include <thread>
#include <fstream>

#include <spdlog/spdlog.h>
#include <autojudge/errors.h>
#include <autojudge/paths.h>
#include "utils.h"

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

void SendWithRetry(Messenger& messenger, long chat_id, const fs::path& file,
                   const std::string& filename, const std::string& caption, const Sleeper& sleeper) {
  for (int attempt = 1;; attempt++) {
    try {
      messenger.SendDocument(chat_id, file, filename, caption);
      return;
    } catch (const FlowControlError& err) {
      if (attempt >= kDeliveryAttempts) {
        spdlog::warn("Delivery of {} to {} failed after {} attempts", filename, chat_id, attempt);
        throw;
      }
      spdlog::debug("Delivery of {} throttled, retrying in {}ms", filename, err.RetryAfterMs());
      sleeper(std::chrono::milliseconds(err.RetryAfterMs()));
    }
  }
}

} // namespace

void SleepFor(std::chrono::milliseconds duration) {
  std::this_thread::sleep_for(duration);
}

std::string PartFileName(const std::string& filename, int index, int total) {
  return filename + ".part" + PadInt(index, std::to_string(total).size());
}

std::vector<std::string> DeliverArtifact(
    Messenger& messenger, long chat_id, const fs::path& file, long max_part_bytes,
    const std::string& caption, const Sleeper& sleeper) {
  std::error_code ec;
  long size = fs::file_size(file, ec);
  if (ec) throw DeliveryError("cannot read " + file.string() + ": " + ec.message());
  std::string filename = file.filename().string();
  if (max_part_bytes <= 0 || size <= max_part_bytes) {
    SendWithRetry(messenger, chat_id, file, filename, caption, sleeper);
    return {filename};
  }

  int total = (size + max_part_bytes - 1) / max_part_bytes;
  spdlog::info("Delivering {} ({} bytes) in {} parts", file.c_str(), size, total);
  TempDirectory tmpdir(kBoxRoot, "parts");
  if (tmpdir.Path().empty()) throw DeliveryError("cannot create a directory for parts");
  std::ifstream fin(file, std::ios::binary);
  if (!fin) throw DeliveryError("cannot read " + file.string());

  std::vector<std::string> ret;
  std::vector<char> buf(max_part_bytes);
  for (int i = 1; i <= total; i++) {
    fin.read(buf.data(), buf.size());
    std::string part_name = PartFileName(filename, i, total);
    fs::path part_path = tmpdir.Path() / part_name;
    {
      std::ofstream fout(part_path, std::ios::binary | std::ios::trunc);
      if (!fout.write(buf.data(), fin.gcount())) throw DeliveryError("cannot write " + part_path.string());
    }
    SendWithRetry(messenger, chat_id, part_path, part_name, i == 1 ? caption : "", sleeper);
    std::error_code rm_ec;
    fs::remove(part_path, rm_ec);
    ret.push_back(std::move(part_name));
  }
  return ret;
}
