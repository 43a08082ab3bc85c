#include "config/config_loader.hpp"

#include <fstream>
#include <sstream>

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/strip.h>

namespace sockcan::config {

ConfigLoader& ConfigLoader::getInstance() {
  static absl::NoDestructor<ConfigLoader> instance;
  return *instance;
}

absl::Status ConfigLoader::Load(const std::string& path) {
  std::ifstream in(path);
  if (!in) return absl::NotFoundError(absl::StrCat("cannot open config file ", path));

  std::stringstream buffer;
  buffer << in.rdbuf();
  return LoadFromString(buffer.str());
}

absl::Status ConfigLoader::LoadFromString(const std::string& text) {
  std::istringstream in(text);
  std::string line, section;
  int line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    std::string_view view = absl::StripAsciiWhitespace(line);
    if (view.empty() || view.front() == ';' || view.front() == '#') continue;

    if (view.front() == '[') {
      if (view.back() != ']') {
        return absl::InvalidArgumentError(
            absl::StrCat("line ", line_no, ": unterminated section header"));
      }
      section = std::string(absl::StripAsciiWhitespace(view.substr(1, view.size() - 2)));
      continue;
    }

    auto pos = view.find('=');
    if (pos == std::string_view::npos) continue;
    std::string key(absl::StripAsciiWhitespace(view.substr(0, pos)));
    std::string val(absl::StripAsciiWhitespace(view.substr(pos + 1)));
    table_[section][key] = val;
  }
  return absl::OkStatus();
}

bool ConfigLoader::Has(const std::string& section, const std::string& key) const {
  auto s_it = table_.find(section);
  return s_it != table_.end() && s_it->second.count(key) != 0;
}

std::string ConfigLoader::Get(const std::string& section,
                              const std::string& key,
                              const std::string& def) const {
  auto s_it = table_.find(section);
  if (s_it == table_.end()) return def;

  auto k_it = s_it->second.find(key);
  if (k_it == s_it->second.end()) return def;
  return k_it->second;
}

absl::StatusOr<bool> ConfigLoader::GetBool(const std::string& section,
                                           const std::string& key,
                                           bool def) const {
  if (!Has(section, key)) return def;
  bool value = false;
  if (!absl::SimpleAtob(Get(section, key, ""), &value)) {
    return absl::InvalidArgumentError(absl::StrCat("[", section, "] ", key, " is not a boolean"));
  }
  return value;
}

absl::StatusOr<uint32_t> ConfigLoader::GetUint32(const std::string& section,
                                                 const std::string& key,
                                                 uint32_t def) const {
  if (!Has(section, key)) return def;
  std::string raw = Get(section, key, "");
  std::string_view digits = raw;

  uint32_t value = 0;
  const bool hex = absl::ConsumePrefix(&digits, "0x") || absl::ConsumePrefix(&digits, "0X");
  const bool ok  = hex ? absl::SimpleHexAtoi(digits, &value) : absl::SimpleAtoi(digits, &value);
  if (!ok || digits.empty()) {
    return absl::InvalidArgumentError(absl::StrCat("[", section, "] ", key, "=", raw,
                                                   " is not an unsigned integer"));
  }
  return value;
}

absl::StatusOr<int> ConfigLoader::GetInt(const std::string& section,
                                         const std::string& key,
                                         int def) const {
  if (!Has(section, key)) return def;
  int value = 0;
  if (!absl::SimpleAtoi(Get(section, key, ""), &value)) {
    return absl::InvalidArgumentError(absl::StrCat("[", section, "] ", key, " is not an integer"));
  }
  return value;
}

}  // namespace sockcan::config
