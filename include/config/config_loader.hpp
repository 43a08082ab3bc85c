#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include <absl/base/no_destructor.h>
#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace sockcan::config {

/// INI style `[section]` / `key=value` store. `;` and `#` start comment lines.
class ConfigLoader {
 public:
  static ConfigLoader& getInstance();

  absl::Status Load(const std::string& path);
  absl::Status LoadFromString(const std::string& text);

  bool Has(const std::string& section, const std::string& key) const;

  std::string Get(const std::string& section,
                  const std::string& key,
                  const std::string& def) const;

  // Typed getters return `def` when the key is missing and an error when the
  // value does not parse.
  absl::StatusOr<bool> GetBool(const std::string& section,
                               const std::string& key,
                               bool def) const;
  absl::StatusOr<uint32_t> GetUint32(const std::string& section,
                                     const std::string& key,
                                     uint32_t def) const;   ///< decimal or 0x-hex
  absl::StatusOr<int> GetInt(const std::string& section,
                             const std::string& key,
                             int def) const;

  void Clear() { table_.clear(); }

  const std::unordered_map<std::string, std::unordered_map<std::string, std::string>>&
  DebugAll() const { return table_; }

 private:
  ConfigLoader() = default;
  friend class absl::NoDestructor<ConfigLoader>;
  std::unordered_map<std::string, std::unordered_map<std::string, std::string>> table_;
};

}  // namespace sockcan::config
