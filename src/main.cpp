// sockcan_dump [config.ini] [ifname]
#include "task/init_task.hpp"
#include "task/listener_task.hpp"
#include "config/config_loader.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
  std::cout.setf(std::ios::unitbuf); // auto flush
  const std::string config_path = argc > 1 ? argv[1] : "conf/config.ini";
  const std::string channel     = argc > 2 ? argv[2] : "";

  auto sock = sockcan::task::Init(config_path, channel);
  if (!sock.ok()) {
    std::cerr << "[Init] " << sock.status() << std::endl;
    return 1;
  }

  const std::string bus_name = channel.empty()
      ? sockcan::config::ConfigLoader::getInstance().Get("can", "channel", "")
      : channel;
  auto st = sockcan::task::StartListener(*sock, bus_name);
  return st.ok() ? 0 : 1;
}
