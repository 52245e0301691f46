#pragma once

#include "SimulationConfig.hpp"

#include <string>
#include <vector>

namespace junction
{
    struct ConfigParseResult
    {
        bool ok = false;
        JunctionConfig config{};
        std::vector<std::string> errors;
    };

    std::string junctionConfigToJson(const JunctionConfig &config);

    // Missing sections and fields keep their defaults; the result is validated before it is
    // reported ok
    ConfigParseResult junctionConfigFromJson(const std::string &json_text);

    std::string validationErrorsToJson(const std::vector<std::string> &errors);
} // namespace junction
