#include "dnnlift/config.hpp"
#include "dnnlift/debug.hpp"
#include "dnnlift/error.hpp"

#include <cstdlib>

namespace dnnlift {

namespace {

const char *const kEnvKeys[][2] = {
    {"DNNLIFT_DNN_INCLUDE_PATH", "dnn.include_path"},
    {"DNNLIFT_DNN_LIBRARY_PATH", "dnn.library_path"},
    {"DNNLIFT_DNN_CONV_ALGO_FWD", "dnn.conv.algo_fwd"},
    {"DNNLIFT_DNN_CONV_ALGO_BWD", "dnn.conv.algo_bwd"},
    {"DNNLIFT_DNN_ENABLED", "dnn.enabled"},
    {"DNNLIFT_DNN_CONV_WORKMEM", "dnn.conv.workmem"},
    {"DNNLIFT_DNN_CONV_WORKMEM_BWD", "dnn.conv.workmem_bwd"},
};

dnn::ConvAlgo parse_direction_algo(const std::string &key,
                                   const std::string &value,
                                   dnn::ConvDirection direction) {
    dnn::ConvAlgo algo;
    try {
        algo = dnn::parse_conv_algo(value);
    } catch (const ConfigurationError &) {
        throw ConfigurationError::invalid_value(key, value,
                                                "a convolution algorithm name");
    }
    if (!dnn::supports_direction(algo, direction)) {
        throw ConfigurationError::invalid_value(
            key, value,
            "an algorithm supported by the " + dnn::direction_name(direction) +
                " kernel");
    }
    return algo;
}

// Schema 1 only knew the workmem spelling of the algorithm settings
ConfigRecord upgrade_v1(const ConfigRecord &record) {
    ConfigRecord upgraded;
    upgraded.schema_version = 2;
    upgraded.values = record.values;
    auto rename = [&](const std::string &legacy, const std::string &current) {
        auto it = upgraded.values.find(legacy);
        if (it == upgraded.values.end())
            return;
        trace::diagnostic("config", legacy + " is deprecated, use " + current);
        if (upgraded.values.count(current) == 0)
            upgraded.values[current] = it->second;
        upgraded.values.erase(it);
    };
    rename("dnn.conv.workmem", "dnn.conv.algo_fwd");
    rename("dnn.conv.workmem_bwd", "dnn.conv.algo_bwd");
    return upgraded;
}

} // namespace

ConfigRecord config_record_from_env() {
    ConfigRecord record;
    for (const auto &entry : kEnvKeys) {
        const char *value = std::getenv(entry[0]);
        if (value && value[0] != '\0')
            record.values[entry[1]] = value;
    }
    bool legacy = record.values.count("dnn.conv.workmem") ||
                  record.values.count("dnn.conv.workmem_bwd");
    record.schema_version = legacy ? 1 : kConfigSchemaVersion;
    return record;
}

DnnConfig migrate_config(const ConfigRecord &record) {
    if (record.schema_version < 1 ||
        record.schema_version > kConfigSchemaVersion) {
        throw ConfigurationError::invalid_value(
            "schema_version", std::to_string(record.schema_version),
            "a version between 1 and " + std::to_string(kConfigSchemaVersion));
    }

    ConfigRecord current = record;
    if (current.schema_version == 1)
        current = upgrade_v1(current);

    DnnConfig config;
    for (const auto &[key, value] : current.values) {
        if (key == "dnn.include_path") {
            config.include_path = value;
        } else if (key == "dnn.library_path") {
            config.library_path = value;
        } else if (key == "dnn.conv.algo_fwd") {
            config.default_forward_algorithm =
                parse_direction_algo(key, value, dnn::ConvDirection::Forward);
        } else if (key == "dnn.conv.algo_bwd") {
            config.default_backward_algorithm = parse_direction_algo(
                key, value, dnn::ConvDirection::BackwardFilter);
        } else if (key == "dnn.enabled") {
            if (value == "auto")
                config.enabled = EnableMode::Auto;
            else if (value == "true" || value == "1")
                config.enabled = EnableMode::True;
            else if (value == "false" || value == "0")
                config.enabled = EnableMode::False;
            else
                throw ConfigurationError::invalid_value(key, value,
                                                        "auto, true or false");
        } else {
            throw ConfigurationError::invalid_value("config key", key,
                                                    "a known dnn setting");
        }
    }
    return config;
}

DnnConfig config_from_env() { return migrate_config(config_record_from_env()); }

const DnnConfig &default_config() {
    static const DnnConfig config = config_from_env();
    return config;
}

std::string enable_mode_name(EnableMode mode) {
    switch (mode) {
    case EnableMode::Auto:
        return "auto";
    case EnableMode::True:
        return "true";
    case EnableMode::False:
        return "false";
    }
    return "unknown";
}

} // namespace dnnlift
