// task/init_task.cpp
#include "task/init_task.hpp"

#include "config/config_loader.hpp"
#include "config/socket_config.hpp"

#include <iostream>
#include <fmt/core.h>

namespace sockcan::task {

absl::StatusOr<bus::CanSocket> Init(const std::string& config_path, std::string_view channel) {
  auto& cfg = sockcan::config::ConfigLoader::getInstance();
  std::cout << "[Init] Starting init..." << std::endl;

  // running from build/ needs the ../conf fallback
  if (auto st = cfg.Load(config_path); !st.ok()) {
    if (auto st2 = cfg.Load("../" + config_path); !st2.ok()) {
      std::cerr << "[Init] Config not found (" << config_path << "), using kernel defaults" << std::endl;
    }
  }

  auto socket_cfg = sockcan::config::LoadSocketConfig(cfg);
  if (!socket_cfg.ok()) return socket_cfg.status();
  if (!channel.empty()) socket_cfg->channel = std::string(channel);
  if (socket_cfg->channel.empty()) {
    return absl::InvalidArgumentError("no CAN channel given ([can] channel or command line)");
  }

  auto sock = bus::CanSocket::Open(socket_cfg->channel);
  if (!sock.ok()) return sock.status();

  if (auto st = sockcan::config::ApplySocketConfig(*sock, *socket_cfg); !st.ok()) return st;

  std::cout << fmt::format("[Init] {} opened (fd {})", socket_cfg->channel, sock->fd()) << std::endl;
  return sock;
}

}  // namespace sockcan::task
