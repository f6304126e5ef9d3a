#include "lfscache/agent_config.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace lfscache {

// --- BackendConfig ---

namespace {

bool has_param(const BackendConfig& config, const char* key) {
    auto it = config.params.find(key);
    return it != config.params.end() && !it->second.empty();
}

}  // namespace

std::string BackendConfig::validate() const {
    if (type.empty()) return "cache backend type is required";
    if (type == "filesystem") {
        if (!has_param(*this, "dir")) return "filesystem cache requires 'dir'";
    } else if (type == "google_cloud_storage") {
        if (!has_param(*this, "bucket")) return "google_cloud_storage cache requires 'bucket'";
    } else if (type == "http") {
        if (!has_param(*this, "endpoint")) return "http cache requires 'endpoint'";
        const auto& endpoint = params.at("endpoint");
        if (!endpoint.starts_with("http://") && !endpoint.starts_with("https://"))
            return "http cache endpoint must be an http(s) URL: " + endpoint;
    } else {
        return "unknown cache backend type: " + type;
    }
    return {};
}

std::optional<BackendConfig> BackendConfig::from_json(const std::string& text, std::string& error) {
    try {
        auto j = nlohmann::json::parse(text);
        if (!j.is_object() || j.size() != 1) {
            error = "cache config must be an object with exactly one backend key";
            return std::nullopt;
        }

        BackendConfig config;
        auto it = j.begin();
        config.type = it.key();
        const auto& body = it.value();
        if (!body.is_object()) {
            error = "cache backend '" + config.type + "' must map to an object";
            return std::nullopt;
        }

        for (auto& [key, val] : body.items()) {
            if (config.type == "http" && key == "authorization") {
                if (val.is_null()) continue;
                if (!val.contains("bearer") || !val["bearer"].contains("token_path")) {
                    error = "http authorization supports only {\"bearer\":{\"token_path\":...}}";
                    return std::nullopt;
                }
                config.params["token_path"] = val["bearer"]["token_path"].get<std::string>();
            } else if (val.is_string()) {
                config.params[key] = val.get<std::string>();
            } else if (val.is_boolean()) {
                config.params[key] = val.get<bool>() ? "true" : "false";
            } else if (!val.is_null()) {
                config.params[key] = val.dump();
            }
        }

        auto err = config.validate();
        if (!err.empty()) {
            error = err;
            return std::nullopt;
        }
        return config;
    } catch (const nlohmann::json::exception& e) {
        error = std::string("invalid cache JSON: ") + e.what();
        return std::nullopt;
    }
}

std::string BackendConfig::to_json() const {
    nlohmann::json body = nlohmann::json::object();
    for (const auto& [key, val] : params) {
        if (type == "http" && key == "token_path") {
            body["authorization"]["bearer"]["token_path"] = val;
        } else {
            body[key] = val;
        }
    }
    nlohmann::json j;
    j[type] = body;
    return j.dump();
}

// --- AgentConfig ---

std::optional<AgentConfig> AgentConfig::from_args(int argc, char* argv[]) {
    AgentConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--cache") {
                auto* v = next_arg(i, "--cache");
                if (!v) return std::nullopt;
                std::string error;
                auto backend = BackendConfig::from_json(v, error);
                if (!backend) {
                    std::cerr << "Error: --cache: " << error << "\n";
                    return std::nullopt;
                }
                config.cache = std::move(*backend);
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--git-dir") {
                auto* v = next_arg(i, "--git-dir");
                if (!v) return std::nullopt;
                config.git_dir = v;
            } else if (arg == "--temp-dir") {
                auto* v = next_arg(i, "--temp-dir");
                if (!v) return std::nullopt;
                config.temp_dir = v;
            } else if (arg == "--logs-dir") {
                auto* v = next_arg(i, "--logs-dir");
                if (!v) return std::nullopt;
                config.logs_dir = v;
            } else if (arg == "--concurrency") {
                auto* v = next_arg(i, "--concurrency");
                if (!v) return std::nullopt;
                config.default_concurrency = std::stoull(v);
            } else if (arg == "--max-retries") {
                auto* v = next_arg(i, "--max-retries");
                if (!v) return std::nullopt;
                config.backoff.max_retries = std::stoull(v);
            } else if (arg == "--retry-initial-ms") {
                auto* v = next_arg(i, "--retry-initial-ms");
                if (!v) return std::nullopt;
                config.backoff.initial_interval = std::chrono::milliseconds(std::stoll(v));
            } else if (arg == "--retry-max-elapsed-secs") {
                auto* v = next_arg(i, "--retry-max-elapsed-secs");
                if (!v) return std::nullopt;
                config.backoff.max_elapsed = std::chrono::seconds(std::stoll(v));
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                std::cerr <<
                    "Usage: lfs-cache transfer-agent [options]\n"
                    "\n"
                    "Cache:\n"
                    "  --cache <json>                   Cache backend, one of:\n"
                    "                                     {\"filesystem\":{\"dir\":\"/path\"}}\n"
                    "                                     {\"google_cloud_storage\":{\"bucket\":\"b\",\"prefix\":\"p/\"}}\n"
                    "                                     {\"http\":{\"endpoint\":\"https://host/lfs\",\n"
                    "                                       \"authorization\":{\"bearer\":{\"token_path\":\"/t\"}}}}\n"
                    "  --config <path>                  JSON config file\n"
                    "\n"
                    "Transfers:\n"
                    "  --concurrency <N>                Workers when init omits a count (default: 8)\n"
                    "  --max-retries <N>                Retries per transient failure (default: 10)\n"
                    "  --retry-initial-ms <N>           First backoff interval (default: 500)\n"
                    "  --retry-max-elapsed-secs <N>     Give up retrying after (default: 900)\n"
                    "\n"
                    "Paths (default under `git rev-parse --absolute-git-dir`):\n"
                    "  --git-dir <path>                 Repository git directory\n"
                    "  --temp-dir <path>                Staging directory (default: <git-dir>/lfs/tmp)\n"
                    "  --logs-dir <path>                Transfer logs (default: <git-dir>/lfs-cache/logs)\n"
                    "\n"
                    "Diagnostics:\n"
                    "  --verbose                        Debug logging\n"
                    "  --log-file <path>                Log file (default: <logs-dir>/<run>.log)\n"
                    "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
                    "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
                    "  --help                           Show this help\n";
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool AgentConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("cache")) {
            std::string error;
            auto backend = BackendConfig::from_json(j["cache"].dump(), error);
            if (!backend) {
                std::cerr << "Error: cache: " << error << "\n";
                return false;
            }
            cache = std::move(*backend);
        }
        if (j.contains("git_dir")) git_dir = j["git_dir"].get<std::string>();
        if (j.contains("temp_dir")) temp_dir = j["temp_dir"].get<std::string>();
        if (j.contains("logs_dir")) logs_dir = j["logs_dir"].get<std::string>();
        if (j.contains("concurrency")) default_concurrency = j["concurrency"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("retry") && j["retry"].is_object()) {
            auto& jr = j["retry"];
            if (jr.contains("initial_interval_ms"))
                backoff.initial_interval = std::chrono::milliseconds(jr["initial_interval_ms"].get<int64_t>());
            if (jr.contains("multiplier")) backoff.multiplier = jr["multiplier"].get<double>();
            if (jr.contains("randomization_factor"))
                backoff.randomization_factor = jr["randomization_factor"].get<double>();
            if (jr.contains("max_interval_ms"))
                backoff.max_interval = std::chrono::milliseconds(jr["max_interval_ms"].get<int64_t>());
            if (jr.contains("max_elapsed_secs"))
                backoff.max_elapsed = std::chrono::seconds(jr["max_elapsed_secs"].get<int64_t>());
            if (jr.contains("max_retries")) backoff.max_retries = jr["max_retries"].get<size_t>();
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void AgentConfig::apply_defaults() {
    if (!git_dir.empty()) {
        if (temp_dir.empty()) temp_dir = git_dir / constants::TEMP_SUBDIR;
        if (logs_dir.empty()) logs_dir = git_dir / constants::LOGS_SUBDIR;
    }
}

std::string AgentConfig::validate() const {
    if (temp_dir.empty()) return "temp_dir is required (--temp-dir or a git repository)";
    if (default_concurrency == 0) return "concurrency must be > 0";
    if (default_concurrency > constants::MAX_CONCURRENT_TRANSFERS)
        return "concurrency must be <= " + std::to_string(constants::MAX_CONCURRENT_TRANSFERS);
    if (!cache.empty()) {
        auto err = cache.validate();
        if (!err.empty()) return "cache: " + err;
    }
    auto err = backoff.validate();
    if (!err.empty()) return err;
    if (!metrics_file.empty() && metrics_interval_secs == 0) return "metrics_interval must be > 0";
    return {};
}

}  // namespace lfscache
