#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "dnnlift/dnn/dnn_types.hpp"

namespace dnnlift {

// Current layout of DnnConfig. Records written by older releases are
// upgraded by migrate_config().
inline constexpr int kConfigSchemaVersion = 2;

// Whether accelerated rewriting is requested: Auto uses the backend when the
// gate finds it, True additionally fails loudly when it is missing.
enum class EnableMode : uint8_t { Auto, True, False };

// Raw key/value settings as read from the environment or a stored file.
// Schema 1 keys: dnn.conv.workmem, dnn.conv.workmem_bwd.
// Schema 2 keys: dnn.include_path, dnn.library_path, dnn.conv.algo_fwd,
// dnn.conv.algo_bwd, dnn.enabled.
struct ConfigRecord {
    int schema_version = kConfigSchemaVersion;
    std::map<std::string, std::string> values;
};

struct DnnConfig {
    int schema_version = kConfigSchemaVersion;
    std::string include_path = "/usr/local/cuda/include";
    std::string library_path = "/usr/local/cuda/lib64";
    dnn::ConvAlgo default_forward_algorithm = dnn::ConvAlgo::Precomputed;
    dnn::ConvAlgo default_backward_algorithm = dnn::ConvAlgo::Plain;
    EnableMode enabled = EnableMode::Auto;
};

// Reads DNNLIFT_DNN_INCLUDE_PATH, DNNLIFT_DNN_LIBRARY_PATH,
// DNNLIFT_DNN_CONV_ALGO_FWD, DNNLIFT_DNN_CONV_ALGO_BWD, DNNLIFT_DNN_ENABLED
// and the deprecated DNNLIFT_DNN_CONV_WORKMEM / DNNLIFT_DNN_CONV_WORKMEM_BWD.
ConfigRecord config_record_from_env();

// Upgrades a record of any known schema to the current DnnConfig and
// validates every value. Throws ConfigurationError on unknown schema
// versions, unknown algorithm names or algorithms the direction rejects.
DnnConfig migrate_config(const ConfigRecord &record);

// Fresh read of the environment (not cached)
DnnConfig config_from_env();

// Environment configuration resolved once per process
const DnnConfig &default_config();

std::string enable_mode_name(EnableMode mode);

} // namespace dnnlift
