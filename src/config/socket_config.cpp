#include "config/socket_config.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <absl/strings/strip.h>

namespace sockcan::config {

namespace {

constexpr char kSection[] = "can";

bool parseHex(std::string_view text, uint32_t& out) {
  text = absl::StripAsciiWhitespace(text);
  if (!absl::ConsumePrefix(&text, "0x")) absl::ConsumePrefix(&text, "0X");
  return !text.empty() && absl::SimpleHexAtoi(text, &out);
}

template <typename T>
absl::Status assignOptional(absl::StatusOr<T> value, const ConfigLoader& loader,
                            const char* key, std::optional<T>& out) {
  if (!value.ok()) return value.status();
  if (loader.Has(kSection, key)) out = *value;
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::vector<bus::Filter>> ParseFilters(std::string_view text) {
  std::vector<bus::Filter> filters;
  for (std::string_view item : absl::StrSplit(text, ',', absl::SkipWhitespace())) {
    std::vector<std::string_view> parts = absl::StrSplit(item, ':');
    bus::Filter f;
    if (parts.size() != 2 || !parseHex(parts[0], f.id) || !parseHex(parts[1], f.mask)) {
      return absl::InvalidArgumentError(absl::StrCat("bad filter '", item, "', expected <id>:<mask>"));
    }
    filters.push_back(f);
  }
  return filters;
}

absl::StatusOr<SocketConfig> LoadSocketConfig(const ConfigLoader& loader) {
  SocketConfig cfg;
  cfg.channel = loader.Get(kSection, "channel", "");

  if (loader.Has(kSection, "filters")) {
    auto filters = ParseFilters(loader.Get(kSection, "filters", ""));
    if (!filters.ok()) return filters.status();
    cfg.filters = *std::move(filters);
  }

  if (auto st = assignOptional(loader.GetUint32(kSection, "error_mask", 0), loader, "error_mask", cfg.error_mask); !st.ok()) return st;
  if (auto st = assignOptional(loader.GetBool(kSection, "loopback", true), loader, "loopback", cfg.loopback); !st.ok()) return st;
  if (auto st = assignOptional(loader.GetBool(kSection, "recv_own_msgs", false), loader, "recv_own_msgs", cfg.recv_own_msgs); !st.ok()) return st;
  if (auto st = assignOptional(loader.GetBool(kSection, "join_filters", false), loader, "join_filters", cfg.join_filters); !st.ok()) return st;

  auto nonblocking = loader.GetBool(kSection, "nonblocking", false);
  if (!nonblocking.ok()) return nonblocking.status();
  cfg.nonblocking = *nonblocking;

  auto read_ms = loader.GetInt(kSection, "read_timeout_ms", 0);
  if (!read_ms.ok()) return read_ms.status();
  auto write_ms = loader.GetInt(kSection, "write_timeout_ms", 0);
  if (!write_ms.ok()) return write_ms.status();
  if (*read_ms < 0 || *write_ms < 0) {
    return absl::InvalidArgumentError("[can] timeouts must not be negative");
  }
  cfg.read_timeout  = std::chrono::milliseconds(*read_ms);
  cfg.write_timeout = std::chrono::milliseconds(*write_ms);

  return cfg;
}

absl::Status ApplySocketConfig(bus::CanSocket& socket, const SocketConfig& cfg) {
  if (cfg.filters) {
    if (auto st = socket.SetFilters(*cfg.filters); !st.ok()) return st;
  }
  if (cfg.error_mask) {
    if (auto st = socket.SetErrorMask(*cfg.error_mask); !st.ok()) return st;
  }
  if (cfg.loopback) {
    if (auto st = socket.SetLoopback(*cfg.loopback); !st.ok()) return st;
  }
  if (cfg.recv_own_msgs) {
    if (auto st = socket.SetRecvOwnMsgs(*cfg.recv_own_msgs); !st.ok()) return st;
  }
  if (cfg.join_filters) {
    if (auto st = socket.SetJoinFilters(*cfg.join_filters); !st.ok()) return st;
  }
  if (cfg.nonblocking) {
    if (auto st = socket.SetNonBlocking(true); !st.ok()) return st;
  }
  if (cfg.read_timeout.count() > 0) {
    if (auto st = socket.SetReadTimeout(cfg.read_timeout); !st.ok()) return st;
  }
  if (cfg.write_timeout.count() > 0) {
    if (auto st = socket.SetWriteTimeout(cfg.write_timeout); !st.ok()) return st;
  }
  return absl::OkStatus();
}

}  // namespace sockcan::config
