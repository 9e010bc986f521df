#include "utils.h"

#include <stdlib.h>
#include <cmath>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <autojudge/runtime.h>
#include <autojudge/transfer.h>
#include <autojudge/moderation.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(SubmissionStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SubmissionStatusName, SubmissionStatus, ENUM_SUBMISSION_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(RunKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* RunKindName, RunKind, ENUM_RUN_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(TransferState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TransferStateName, TransferState, ENUM_TRANSFER_STATE_)
#undef X

#define X(...) X_RETURN_ARG1(TransferSignal, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TransferSignalName, TransferSignal, ENUM_TRANSFER_SIGNAL_)
#undef X

#define X(...) X_RETURN_ARG1(OverrideResult, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OverrideResultName, OverrideResult, ENUM_OVERRIDE_RESULT_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

static const char* kSubmissionStatusTable[] = {
#define X(name, code) code,
  ENUM_SUBMISSION_STATUS_
#undef X
};

std::optional<SubmissionStatus> GetSubmissionStatus(const std::string& str) {
  std::string code = NormalizeSlug(str);
  for (size_t i = 0; i < sizeof(kSubmissionStatusTable) / sizeof(kSubmissionStatusTable[0]); i++) {
    if (code == kSubmissionStatusTable[i]) return (SubmissionStatus)i;
  }
  return std::nullopt;
}

SortDirection GetSortDirection(const std::string& str) {
  return NormalizeSlug(str) == "asc" ? SortDirection::ASC : SortDirection::DESC;
}

static const char* kOverrideActionTable[] = {
#define X(name, code) code,
  ENUM_OVERRIDE_ACTION_
#undef X
};

std::optional<OverrideAction> GetOverrideAction(const std::string& str) {
  std::string code = NormalizeSlug(str);
  for (size_t i = 0; i < sizeof(kOverrideActionTable) / sizeof(kOverrideActionTable[0]); i++) {
    if (code == kOverrideActionTable[i]) return (OverrideAction)i;
  }
  return std::nullopt;
}

std::string Trim(const std::string& str) {
  auto is_space = [](unsigned char c) { return std::isspace(c); };
  auto begin = std::find_if_not(str.begin(), str.end(), is_space);
  auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string ToLower(std::string str) {
  for (auto& c : str) c = std::tolower((unsigned char)c);
  return str;
}

std::string ToUpper(std::string str) {
  for (auto& c : str) c = std::toupper((unsigned char)c);
  return str;
}

std::string NormalizeSlug(const std::string& slug) {
  return ToLower(Trim(slug));
}

std::string FormatValue(std::optional<double> value) {
  if (!value) return "—";
  std::string ret = fmt::format("{:.4f}", *value);
  while (!ret.empty() && ret.back() == '0') ret.pop_back();
  if (!ret.empty() && ret.back() == '.') ret.pop_back();
  if (ret.empty() || ret == "-0") return "0";
  return ret;
}

fs::path InsideBox(const fs::path& box, const fs::path& path) {
  return "/" / path.lexically_relative(box);
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool Move(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Move {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::rename(from, to, ec);
  if (ec) {
    if (ec.value() != EXDEV) goto err;
    fs::copy(from, to, fs::copy_options::overwrite_existing | fs::copy_options::recursive, ec);
    if (ec) goto err;
    fs::remove_all(from, ec);
    if (ec) goto err;
  }
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed moving {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
  return false;
}

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(to, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed copying {} -> {}: {}", from.c_str(), to.c_str(), ec.message());
  return false;
}

std::string ReadTruncated(const fs::path& path, size_t max_len) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) return "";
  size_t total_length = fs::file_size(path, ec);
  if (ec) return "";
  std::string message(std::min(total_length, max_len), '\0');
  std::ifstream fin(path, std::ios::binary);
  fin.read(message.data(), message.size());
  message.resize(fin.gcount());
  if (total_length > max_len) {
    message += "\n[truncated after " + std::to_string(max_len) + " bytes]";
  }
  return message;
}

TempDirectory::TempDirectory(const fs::path& parent, const char* prefix) {
  if (!CreateDirs(parent)) return;
  std::string templ = (parent / (std::string(prefix) + ".XXXXXX")).string();
  if (char* res = mkdtemp(templ.data())) {
    path_ = res;
  } else {
    spdlog::warn("Failed creating temporary directory in {}: {}", parent.c_str(), strerror(errno));
  }
}

TempDirectory::~TempDirectory() {
  if (!path_.empty()) RemoveAll(path_);
}
