#include "config.hpp"
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>
#include <cstdlib>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"

namespace grader {
using namespace std;
using namespace nlohmann;

void from_json(const json &j, sandbox_config &config) {
    const sandbox_config def;
    config.timeout_seconds = get_value_def(j, def.timeout_seconds, "timeoutSeconds");
    config.memory_limit_mb = get_value_def(j, def.memory_limit_mb, "memoryLimitMB");
    config.max_output_length = get_value_def(j, def.max_output_length, "maxOutputLength");
    config.max_error_length = get_value_def(j, def.max_error_length, "maxErrorLength");
    config.max_host_error_length = get_value_def(j, def.max_host_error_length, "maxHostErrorLength");
    config.max_capture_bytes = get_value_def(j, def.max_capture_bytes, "maxCaptureBytes");
    config.similarity_length_limit = get_value_def(j, def.similarity_length_limit, "similarityLengthLimit");
    config.python = get_value_def(j, def.python, "python");
    config.temp_dir = get_value_def(j, def.temp_dir.string(), "tempDir");
    config.banned_modules = get_value_def(j, def.banned_modules, "bannedModules");
    config.dangerous_calls = get_value_def(j, def.dangerous_calls, "dangerousCalls");
    config.inherited_env = get_value_def(j, def.inherited_env, "inheritedEnv");

    if (config.timeout_seconds <= 0)
        throw invalid_argument("timeoutSeconds must be positive");
    if (config.memory_limit_mb <= 0)
        throw invalid_argument("memoryLimitMB must be positive");
}

void to_json(json &j, const sandbox_config &config) {
    j = {{"timeoutSeconds", config.timeout_seconds},
         {"memoryLimitMB", config.memory_limit_mb},
         {"maxOutputLength", config.max_output_length},
         {"maxErrorLength", config.max_error_length},
         {"maxHostErrorLength", config.max_host_error_length},
         {"maxCaptureBytes", config.max_capture_bytes},
         {"similarityLengthLimit", config.similarity_length_limit},
         {"python", config.python},
         {"tempDir", config.temp_dir.string()},
         {"bannedModules", config.banned_modules},
         {"dangerousCalls", config.dangerous_calls},
         {"inheritedEnv", config.inherited_env}};
}

sandbox_config load_config(const filesystem::path &path) {
    if (!filesystem::is_regular_file(path))
        throw config_error("Configuration file " + path.string() + " does not exist");

    try {
        json j = json::parse(read_file_content(path));
        sandbox_config config = j.get<sandbox_config>();
        LOG(INFO) << "Loaded sandbox configuration from " << path;
        return config;
    } catch (std::exception &e) {
        throw config_error("Configuration file " + path.string() + " is malformed: " + e.what());
    }
}

template <typename T>
static T positive_from_env(const char *name, const char *text) {
    T result;
    try {
        result = boost::lexical_cast<T>(text);
    } catch (boost::bad_lexical_cast &) {
        throw config_error(string("Environment variable ") + name + " is not a number: " + text);
    }
    if (result <= 0)
        throw config_error(string("Environment variable ") + name + " must be positive: " + text);
    return result;
}

void apply_environment(sandbox_config &config) {
    if (const char *timeout = getenv("GRADER_TIMEOUT"))
        config.timeout_seconds = positive_from_env<double>("GRADER_TIMEOUT", timeout);
    if (const char *memory = getenv("GRADER_MEMORY_LIMIT"))
        config.memory_limit_mb = positive_from_env<int>("GRADER_MEMORY_LIMIT", memory);
    if (const char *python = getenv("GRADER_PYTHON"))
        config.python = python;
    if (const char *tmpdir = getenv("GRADER_TMPDIR"))
        config.temp_dir = tmpdir;
}

}  // namespace grader
