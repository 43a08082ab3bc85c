#include "util/json_utils.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

#include "bus/can_error.hpp"
#include "bus/status.hpp"

namespace sockcan::util::json
{
    std::string ToHex(const uint8_t *d, size_t len)
    {
      std::ostringstream oss;
      oss << std::uppercase << std::hex << std::setfill('0');
      for (size_t i = 0; i < len; ++i)
      {
        oss << std::setw(2) << int(d[i]);
        if (i + 1 < len)
          oss << ' ';
      }
      return oss.str();
    }

    sockcan_json BuildJson(const bus::Frame &frame, bus::Timestamp ts, std::string_view bus_name)
    {
        sockcan_json j_canFrame;
        auto payload = frame.data();

        j_canFrame["ts"] = std::chrono::duration_cast<std::chrono::microseconds>(ts.time_since_epoch()).count();
        j_canFrame["bus"] = std::string(bus_name);
        j_canFrame["id"] = frame.id();
        j_canFrame["extended"] = frame.is_extended();
        j_canFrame["rtr"] = frame.is_rtr();
        j_canFrame["dlc"] = static_cast<int>(payload.size());
        j_canFrame["raw"] = ToHex(payload.data(), payload.size());

        if (frame.is_error())
        {
            auto decoded = bus::DecodeError(frame);
            if (decoded.ok())
                j_canFrame["error"] = bus::ToString(*decoded);
            else
            {
                auto kind = bus::GetFailure(decoded.status());
                j_canFrame["decode_failure"] = kind ? std::string(bus::FailureName(*kind))
                                                    : std::string(decoded.status().message());
            }
        }

        return j_canFrame;
    }

} // namespace sockcan::util::json
