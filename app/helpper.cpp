#include "helpper.hpp"
#include "hexrot/enums.hpp"
#include "utils/timestamp.h"

#include <format>

namespace helpper
{
    Print::Print(double duration) : duration_{duration}
    {
        last_ = utils::monotonic_now() - duration_;
    }

    bool Print::check()
    {
        double now = utils::monotonic_now();
        if (now - last_ > duration_)
        {
            last_ = now;
            return true;
        }
        return false;
    }

    std::string to_string(const hexrot::SimpleConfig &config)
    {
        return std::format("position= [{:+.3f}, {:+.3f}], max_velocity= {:.3f}",
                           config.min_position, config.max_position, config.max_velocity);
    }

    std::string to_string(const hexrot::SimpleTelemetry &tel)
    {
        return std::format("state= {:s}, offline= {:s}, enabled= {:s}, app_status= {:#06x}, curr= {:+.3f}, cmd= {:+.3f}",
                           hexrot::to_string(tel.state),
                           hexrot::to_string(tel.offline_substate),
                           hexrot::to_string(tel.enabled_substate),
                           tel.application_status, tel.curr_position, tel.cmd_position);
    }

    std::string to_string(const connection::wire::Command &cmd)
    {
        return std::format("counter= {}, code= {}, params= [{}, {}, {}, {}, {}, {}]",
                           cmd.counter, cmd.code, cmd.param[0], cmd.param[1], cmd.param[2],
                           cmd.param[3], cmd.param[4], cmd.param[5]);
    }

}
