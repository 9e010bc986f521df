#ifndef INCLUDE_AUTOJUDGE_TEXT_CATALOG_H_
#define INCLUDE_AUTOJUDGE_TEXT_CATALOG_H_

#include <string>
#include <vector>
#include <utility>
#include <filesystem>

#include <nlohmann/json.hpp>

// User-facing text templates keyed by dotted names ("submit.notify.header").
// Placeholders are written as {name}.
class TextCatalog {
  nlohmann::json templates_;
 public:
  using Args = std::vector<std::pair<std::string, std::string>>;

  TextCatalog(); // built-in English texts
  explicit TextCatalog(nlohmann::json templates);
  // keys missing from the file fall back to the built-in texts
  static TextCatalog Load(const std::filesystem::path&);

  bool Has(const std::string& key) const;
  // throws std::out_of_range if key does not name a string
  std::string Get(const std::string& key, const Args& args = {}) const;
};

#endif  // INCLUDE_AUTOJUDGE_TEXT_CATALOG_H_
