#pragma once
#include "connection/wire_codec.hpp"
#include "hexrot/simple_device.hpp"

#include <string>

namespace helpper
{
    // Rate-limits periodic console output.
    class Print
    {
    public:
        explicit Print(double duration);
        [[nodiscard]] bool check();
    private:
        double last_{0.0};
        double duration_{1.0};
    };

    std::string to_string(const hexrot::SimpleConfig &config);

    std::string to_string(const hexrot::SimpleTelemetry &tel);

    std::string to_string(const connection::wire::Command &cmd);
}
