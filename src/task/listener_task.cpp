#include "task/listener_task.hpp"
#include "util/json_utils.hpp"

#include <chrono>
#include <iostream>
#include <fmt/core.h>

namespace bus = sockcan::bus;
namespace build_json = sockcan::util::json;

namespace sockcan::task
{

  absl::Status StartListener(const bus::CanSocket &sock, const std::string &bus_name)
  {
    absl::Status result;

    while (true)
    {
      auto rx = sock.Read();
      if (!rx.ok())
      {
        if (!bus::ShouldRetry(rx.status()))
        {
          result = rx.status();
          break;
        }
        // nonblocking sockets would spin here otherwise
        if (auto st = sock.WaitReadable(std::chrono::seconds(1)); !st.ok())
        {
          result = st;
          break;
        }
        continue;
      }

      sockcan_json j_canFrame = build_json::BuildJson(rx->frame, rx->timestamp, bus_name);
      std::cout << j_canFrame.dump() << '\n';
    }

    std::cerr << fmt::format("[Listener] stopped: {}", result.ToString()) << std::endl;
    return result;
  }

} // namespace sockcan::task
