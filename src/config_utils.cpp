#include "config_utils.hpp"
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

static bool to_values(const YAML::Node& node, std::vector<std::string>& out) {
    if (node.IsNull()) {
        out.push_back("");
        return true;
    }
    if (node.IsScalar()) {
        out.push_back(node.Scalar());
        return true;
    }
    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (!item.IsScalar())
                return false;
            out.push_back(item.Scalar());
        }
        return true;
    }
    return false;
}

static bool to_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

static bool to_values(const nlohmann::json& v, std::vector<std::string>& out) {
    if (v.is_array()) {
        for (const auto& item : v) {
            std::string s;
            if (!to_value(item, s))
                return false;
            out.push_back(s);
        }
        return true;
    }
    std::string s;
    if (!to_value(v, s))
        return false;
    out.push_back(s);
    return true;
}

bool load_yaml_config(const std::string& path, ConfigValues& opts, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        YAML::Node root = YAML::Load(ifs);
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        auto read_entry = [&](const YAML::Node& key, const YAML::Node& val) {
            const std::string name = key.as<std::string>();
            std::vector<std::string> values;
            if (!to_values(val, values)) {
                error = "Unsupported value for " + name;
                return false;
            }
            opts["--" + name] = values;
            return true;
        };
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            if (it->second.IsMap()) {
                for (auto sub = it->second.begin(); sub != it->second.end(); ++sub) {
                    if (sub->first.IsScalar() && !read_entry(sub->first, sub->second))
                        return false;
                }
            } else if (!read_entry(it->first, it->second)) {
                return false;
            }
        }
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, ConfigValues& opts, std::string& error) {
    std::ifstream ifs(path);
    if (!ifs) {
        error = "Failed to open file";
        return false;
    }
    try {
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        auto read_entry = [&](const std::string& name, const nlohmann::json& val) {
            std::vector<std::string> values;
            if (!to_values(val, values)) {
                error = "Unsupported value for " + name;
                return false;
            }
            opts["--" + name] = values;
            return true;
        };
        for (auto it = root.begin(); it != root.end(); ++it) {
            if (it.value().is_object()) {
                for (auto sub = it.value().begin(); sub != it.value().end(); ++sub) {
                    if (!read_entry(sub.key(), sub.value()))
                        return false;
                }
            } else if (!read_entry(it.key(), it.value())) {
                return false;
            }
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}
