// sockcan_send <ifname> <id>#<data> [config.ini]
#include "task/init_task.hpp"
#include "bus/frame.hpp"
#include "config/config_loader.hpp"
#include "config/socket_config.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <fmt/core.h>

int main(int argc, char** argv) {
  if (argc < 3) {
    std::cerr << "usage: sockcan_send <ifname> <id>#<data> [config.ini]\n"
                 "  123#DEADBEEF   standard id, 4 data bytes\n"
                 "  00000123#R     extended id (8 digits), remote request\n";
    return 2;
  }

  auto frame = sockcan::bus::Frame::Parse(argv[2]);
  if (!frame.ok()) {
    std::cerr << "[Send] " << frame.status() << std::endl;
    return 2;
  }

  const std::string config_path = argc > 3 ? argv[3] : "conf/config.ini";
  auto sock = sockcan::task::Init(config_path, argv[1]);
  if (!sock.ok()) {
    std::cerr << "[Init] " << sock.status() << std::endl;
    return 1;
  }

  // give up once [can] write_timeout_ms (1 s when unset) has run out
  auto cfg = sockcan::config::LoadSocketConfig(sockcan::config::ConfigLoader::getInstance());
  if (!cfg.ok()) {
    std::cerr << "[Init] " << cfg.status() << std::endl;
    return 1;
  }
  const std::chrono::milliseconds budget =
      cfg->write_timeout.count() > 0 ? cfg->write_timeout : std::chrono::milliseconds(1000);

  if (auto st = sock->WriteRetryFor(*frame, budget); !st.ok()) {
    std::cerr << fmt::format("[Send] {} failed: {}", *frame, st.ToString()) << std::endl;
    return 1;
  }
  std::cout << fmt::format("[Send] {} sent on {}", *frame, argv[1]) << std::endl;
  return 0;
}
