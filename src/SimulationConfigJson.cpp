#include "SimulationConfigJson.hpp"

#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>

namespace junction
{
    namespace
    {
        using nlohmann::json;

        void readDouble(const json &section, const char *key, const std::string &prefix,
                        double &target, std::vector<std::string> &errors)
        {
            if (!section.contains(key))
            {
                return;
            }
            const json &value = section.at(key);
            if (!value.is_number())
            {
                errors.push_back(prefix + "." + key + " must be a number");
                return;
            }
            target = value.get<double>();
        }

        template <typename T>
        void readUnsigned(const json &section, const char *key, const std::string &prefix,
                          T &target, std::vector<std::string> &errors)
        {
            if (!section.contains(key))
            {
                return;
            }
            const json &value = section.at(key);
            if (!value.is_number_unsigned())
            {
                errors.push_back(prefix + "." + key + " must be an unsigned number");
                return;
            }
            const auto raw = value.get<uint64_t>();
            if (raw > static_cast<uint64_t>(std::numeric_limits<T>::max()))
            {
                errors.push_back(prefix + "." + key + " is out of range");
                return;
            }
            target = static_cast<T>(raw);
        }

        void readBool(const json &section, const char *key, const std::string &prefix,
                      bool &target, std::vector<std::string> &errors)
        {
            if (!section.contains(key))
            {
                return;
            }
            const json &value = section.at(key);
            if (!value.is_boolean())
            {
                errors.push_back(prefix + "." + key + " must be a boolean");
                return;
            }
            target = value.get<bool>();
        }

        json groupToJson(const MovementGroup &group)
        {
            json group_json;
            group_json["origin"] = originToString(group.origin);
            group_json["direction"] = directionToString(group.direction);
            return group_json;
        }

        bool groupFromJson(const json &group_json, const std::string &phase_name,
                           MovementGroup &group, std::vector<std::string> &errors)
        {
            if (!group_json.is_object())
            {
                errors.push_back("phase '" + phase_name + "' group entries must be objects");
                return false;
            }
            if (!group_json.contains("origin") || !group_json["origin"].is_string() ||
                !group_json.contains("direction") || !group_json["direction"].is_string())
            {
                errors.push_back("phase '" + phase_name + "' group needs string origin and direction");
                return false;
            }

            const std::string origin_value = group_json["origin"].get<std::string>();
            if (!originFromString(origin_value, group.origin))
            {
                errors.push_back("phase '" + phase_name + "' unknown origin: " + origin_value);
                return false;
            }

            const std::string direction_value = group_json["direction"].get<std::string>();
            if (!directionFromString(direction_value, group.direction))
            {
                errors.push_back("phase '" + phase_name + "' unknown direction: " + direction_value);
                return false;
            }
            return true;
        }

        void parseSimulation(const json &section, SimulationConfig &config, std::vector<std::string> &errors)
        {
            const std::string prefix = "simulation";
            readDouble(section, "width", prefix, config.width, errors);
            readDouble(section, "height", prefix, config.height, errors);
            readUnsigned(section, "path_points", prefix, config.path_points, errors);
            readDouble(section, "car_length", prefix, config.car_length, errors);
            readDouble(section, "car_width", prefix, config.car_width, errors);
            readDouble(section, "max_speed", prefix, config.max_speed, errors);
            readDouble(section, "acceleration", prefix, config.acceleration, errors);
            readDouble(section, "deceleration", prefix, config.deceleration, errors);
            readDouble(section, "waypoint_threshold", prefix, config.waypoint_threshold, errors);
            readDouble(section, "coincident_epsilon", prefix, config.coincident_epsilon, errors);
            readDouble(section, "turn_smoothing", prefix, config.turn_smoothing, errors);
        }

        void parseController(const json &section, ControllerConfig &config, std::vector<std::string> &errors)
        {
            const std::string prefix = "controller";
            readUnsigned(section, "green_ticks", prefix, config.green_ticks, errors);
            readUnsigned(section, "yellow_ticks", prefix, config.yellow_ticks, errors);
            readUnsigned(section, "clearance_ticks", prefix, config.clearance_ticks, errors);
            readUnsigned(section, "max_clearance_ticks", prefix, config.max_clearance_ticks, errors);
            readBool(section, "skip_idle_phases", prefix, config.skip_idle_phases, errors);

            if (!section.contains("phases"))
            {
                return;
            }
            if (!section["phases"].is_array())
            {
                errors.push_back("controller.phases must be an array");
                return;
            }

            config.phases.clear();
            for (const auto &phase_json : section["phases"])
            {
                if (!phase_json.is_object())
                {
                    errors.push_back("phase entries must be objects");
                    continue;
                }

                PhaseConfig phase;
                phase.name = phase_json.value("name", std::string("phase-" + std::to_string(config.phases.size())));

                if (!phase_json.contains("groups") || !phase_json["groups"].is_array())
                {
                    errors.push_back("phase '" + phase.name + "' groups must be an array");
                    continue;
                }

                for (const auto &group_json : phase_json["groups"])
                {
                    MovementGroup group;
                    if (groupFromJson(group_json, phase.name, group, errors))
                    {
                        phase.groups.push_back(group);
                    }
                }

                config.phases.push_back(phase);
            }
        }

        void parseTraffic(const json &section, TrafficConfig &config, std::vector<std::string> &errors)
        {
            const std::string prefix = "traffic";
            readUnsigned(section, "spawn_interval_ticks", prefix, config.spawn_interval_ticks, errors);
            readUnsigned(section, "max_backlog_per_group", prefix, config.max_backlog_per_group, errors);
            readUnsigned(section, "straight_percent", prefix, config.straight_percent, errors);
            readUnsigned(section, "right_percent", prefix, config.right_percent, errors);
        }
    }

    std::string junctionConfigToJson(const JunctionConfig &config)
    {
        json root;

        const SimulationConfig &sim = config.simulation;
        root["simulation"] = {
            {"width", sim.width},
            {"height", sim.height},
            {"path_points", sim.path_points},
            {"car_length", sim.car_length},
            {"car_width", sim.car_width},
            {"max_speed", sim.max_speed},
            {"acceleration", sim.acceleration},
            {"deceleration", sim.deceleration},
            {"waypoint_threshold", sim.waypoint_threshold},
            {"coincident_epsilon", sim.coincident_epsilon},
            {"turn_smoothing", sim.turn_smoothing}};

        const ControllerConfig &ctrl = config.controller;
        json controller_json;
        controller_json["green_ticks"] = ctrl.green_ticks;
        controller_json["yellow_ticks"] = ctrl.yellow_ticks;
        controller_json["clearance_ticks"] = ctrl.clearance_ticks;
        controller_json["max_clearance_ticks"] = ctrl.max_clearance_ticks;
        controller_json["skip_idle_phases"] = ctrl.skip_idle_phases;
        controller_json["phases"] = json::array();
        for (const auto &phase : ctrl.phases)
        {
            json phase_json;
            phase_json["name"] = phase.name;
            phase_json["groups"] = json::array();
            for (const auto &group : phase.groups)
            {
                phase_json["groups"].push_back(groupToJson(group));
            }
            controller_json["phases"].push_back(phase_json);
        }
        root["controller"] = controller_json;

        const TrafficConfig &traffic = config.traffic;
        root["traffic"] = {
            {"spawn_interval_ticks", traffic.spawn_interval_ticks},
            {"max_backlog_per_group", traffic.max_backlog_per_group},
            {"straight_percent", traffic.straight_percent},
            {"right_percent", traffic.right_percent}};

        return root.dump();
    }

    ConfigParseResult junctionConfigFromJson(const std::string &json_text)
    {
        ConfigParseResult result;
        result.config = makeDefaultJunctionConfig();

        json root;
        try
        {
            root = json::parse(json_text);
        }
        catch (const json::parse_error &e)
        {
            result.errors.push_back(std::string("invalid JSON: ") + e.what());
            return result;
        }

        if (!root.is_object())
        {
            result.errors.push_back("root must be an object");
            return result;
        }

        struct Section
        {
            const char *name;
            void (*parse)(const json &, JunctionConfig &, std::vector<std::string> &);
        };

        const Section sections[] = {
            {"simulation", [](const json &s, JunctionConfig &c, std::vector<std::string> &e)
             { parseSimulation(s, c.simulation, e); }},
            {"controller", [](const json &s, JunctionConfig &c, std::vector<std::string> &e)
             { parseController(s, c.controller, e); }},
            {"traffic", [](const json &s, JunctionConfig &c, std::vector<std::string> &e)
             { parseTraffic(s, c.traffic, e); }}};

        for (const auto &section : sections)
        {
            if (!root.contains(section.name))
            {
                continue;
            }
            if (!root[section.name].is_object())
            {
                result.errors.push_back(std::string(section.name) + " must be an object");
                continue;
            }
            section.parse(root[section.name], result.config, result.errors);
        }

        if (result.errors.empty())
        {
            result.errors = validateJunctionConfig(result.config);
        }

        result.ok = result.errors.empty();
        return result;
    }

    std::string validationErrorsToJson(const std::vector<std::string> &errors)
    {
        json root;
        root["ok"] = false;
        root["errors"] = errors;
        return root.dump();
    }
} // namespace junction
