#include <autojudge/text_catalog.h>

#include <fstream>
#include <stdexcept>

#include <fmt/args.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

const char kDefaultCatalog[] = R"({
  "submissions": {
    "status": {
      "pending": "Pending",
      "accepted": "Accepted",
      "rejected": "Rejected",
      "error": "Error"
    }
  },
  "submit": {
    "notify": {
      "header": "Your submission has been updated.",
      "title": "Submission: {title}",
      "status_change": "Status: {old} -> {new}",
      "status": "Status: {value}",
      "value_change": "Score: {old} -> {new}",
      "value": "Score: {value}"
    },
    "success": "Submission received.",
    "auto_success": "Submission received and evaluated automatically.",
    "auto_failed": "Submission received, but automatic evaluation failed.",
    "auto_status": "Status: {status}",
    "auto_value": "Score: {value}",
    "auto_message": "Details: {message}",
    "not_zip": "Please send a .zip archive.",
    "too_large": "The file is too large; the limit is {limit} MB. Send it in parts instead.",
    "quota_exceeded": "Your team has used all {limit} submissions.",
    "rejected": "The submission cannot be accepted: {detail}",
    "download_failed": "The file could not be downloaded. Please send it again.",
    "multipart_ask_total": "How many parts will you send? Enter a number from 2 to 20, or \"cancel\".",
    "multipart_invalid_total": "Enter a number from 2 to 20, or \"cancel\".",
    "multipart_ready": "Send the {total} parts in order, named like solution.zip.part1.",
    "multipart_cancelled": "Multi-part upload cancelled.",
    "multipart_need_total": "First tell me how many parts you will send.",
    "multipart_not_started": "This looks like a part of an archive. Start a multi-part upload first.",
    "multipart_invalid_part": "Parts must be named like solution.zip.part1.",
    "multipart_wrong_order": "Wrong part order: expected {expected}, got {got}.",
    "multipart_part_saved": "Part {part}/{total} received.",
    "multipart_assembly_failed": "The parts could not be assembled. Please start over."
  },
  "admin": {
    "override": {
      "applied": "Submission {id} updated.",
      "outdated": "Submission {id} has changed since; the rating was not applied.",
      "not_found": "Submission {id} does not exist."
    }
  }
})";

void MergeInto(nlohmann::json& base, const nlohmann::json& overlay) {
  for (auto& [key, value] : overlay.items()) {
    if (value.is_object() && base.contains(key) && base[key].is_object()) {
      MergeInto(base[key], value);
    } else {
      base[key] = value;
    }
  }
}

const nlohmann::json* Lookup(const nlohmann::json& root, const std::string& key) {
  const nlohmann::json* cur = &root;
  size_t start = 0;
  while (true) {
    size_t dot = key.find('.', start);
    std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
    if (!cur->is_object()) return nullptr;
    auto it = cur->find(part);
    if (it == cur->end()) return nullptr;
    cur = &*it;
    if (dot == std::string::npos) break;
    start = dot + 1;
  }
  return cur->is_string() ? cur : nullptr;
}

} // namespace

TextCatalog::TextCatalog() : templates_(nlohmann::json::parse(kDefaultCatalog)) {}

TextCatalog::TextCatalog(nlohmann::json templates) : TextCatalog() {
  MergeInto(templates_, templates);
}

TextCatalog TextCatalog::Load(const std::filesystem::path& path) {
  std::ifstream fin(path);
  if (!fin) throw std::runtime_error("cannot open text catalog " + path.string());
  return TextCatalog(nlohmann::json::parse(fin));
}

bool TextCatalog::Has(const std::string& key) const {
  return Lookup(templates_, key) != nullptr;
}

std::string TextCatalog::Get(const std::string& key, const Args& args) const {
  const nlohmann::json* node = Lookup(templates_, key);
  if (!node) throw std::out_of_range("text key " + key + " is not found");
  const std::string& tmpl = node->get_ref<const std::string&>();
  if (args.empty()) return tmpl;
  fmt::dynamic_format_arg_store<fmt::format_context> store;
  for (auto& [name, value] : args) store.push_back(fmt::arg(name.c_str(), value));
  try {
    return fmt::vformat(tmpl, store);
  } catch (const fmt::format_error& err) {
    spdlog::warn("Malformed text template {}: {}", key, err.what());
    return tmpl;
  }
}
