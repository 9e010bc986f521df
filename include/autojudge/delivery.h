#ifndef INCLUDE_AUTOJUDGE_DELIVERY_H_
#define INCLUDE_AUTOJUDGE_DELIVERY_H_

#include <chrono>
#include <string>
#include <vector>
#include <filesystem>
#include <functional>

#include "messenger.h"

constexpr int kDeliveryAttempts = 3;

using Sleeper = std::function<void(std::chrono::milliseconds)>;
void SleepFor(std::chrono::milliseconds);

// "<filename>.part<NNN>" with NNN 1-based, zero-padded to the digit count of total
std::string PartFileName(const std::string& filename, int index, int total);

// Send a file, splitting it into parts of at most max_part_bytes if needed.
// Each part is retried on FlowControlError; the last failure propagates.
// Returns the names of the documents sent, in order.
std::vector<std::string> DeliverArtifact(
    Messenger&, long chat_id, const std::filesystem::path& file, long max_part_bytes,
    const std::string& caption, const Sleeper& sleeper = SleepFor);

#endif  // INCLUDE_AUTOJUDGE_DELIVERY_H_
