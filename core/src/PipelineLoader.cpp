// PipelineLoader.cpp: load plugin pipeline config from JSON
#include "websink/PipelineLoader.hpp"
#include "websink/Log.hpp"
#include "websink/platform.hpp"

#include <fstream>
#include <functional>
#include <nlohmann/json.hpp>

namespace websink {

PipelineLoader::PipelineLoader(const std::string& path, const std::string& pluginDir)
    : path_(path), pluginDir_(pluginDir) {}

PipelineLoader::~PipelineLoader() {}

bool PipelineLoader::load() {
    pipeline_.clear();
    progress_msgs_.clear();
    try {
        std::ifstream f(path_);
        if (!f) {
            logf(WEBSINK_LOG_ERROR, "Cannot open file: %s", path_.c_str());
            return false;
        }
        nlohmann::json root;
        f >> root;
        if (!root.is_object()) {
            logf(WEBSINK_LOG_ERROR, "JSON root is not an object in %s", path_.c_str());
            return false;
        }
        if (!root.contains("plugins")) {
            logf(WEBSINK_LOG_ERROR, "\"plugins\" key not found in %s", path_.c_str());
            return false;
        }
        const auto& arr = root["plugins"];
        if (!arr.is_array()) {
            logf(WEBSINK_LOG_ERROR, "\"plugins\" is not an array in %s", path_.c_str());
            return false;
        }
        // Recursively flatten plugins with children
        std::function<void(const nlohmann::json&)> add_plugin;
        add_plugin = [&](const nlohmann::json& plugin) {
            if (!plugin.is_object()) {
                logf(WEBSINK_LOG_WARN, "A plugin entry is not an object in %s", path_.c_str());
                return;
            }
            PluginConfig pcfg;
            if (plugin.contains("path")) {
                pcfg.path = plugin["path"].get<std::string>();
            } else if (plugin.contains("kind")) {
                const auto kind = plugin["kind"].get<std::string>();
                pcfg.path = pluginDir_ + "/" + kind + "/" + kind + WEBSINK_PLUGIN_EXT;
            } else {
                logf(WEBSINK_LOG_WARN, "Plugin entry without path or kind in %s", path_.c_str());
                return;
            }
            if (plugin.contains("config"))
                pcfg.config_json = plugin["config"].dump();
            else if (plugin.contains("cfg"))
                pcfg.config_json = plugin["cfg"].dump();
            else
                pcfg.config_json = "{}";
            progress_msgs_.push_back("plugin " + pcfg.path);
            pipeline_.push_back(pcfg);
            if (plugin.contains("children")) {
                const auto& children = plugin["children"];
                if (children.is_array()) {
                    for (const auto& child : children) add_plugin(child);
                }
            }
        };
        for (const auto& plugin : arr) add_plugin(plugin);
        return !pipeline_.empty();
    } catch (const std::exception& e) {
        logf(WEBSINK_LOG_ERROR, "Exception parsing JSON %s: %s", path_.c_str(), e.what());
        return false;
    }
}

const std::vector<PluginConfig>& PipelineLoader::getPipeline() const {
    return pipeline_;
}

void PipelineLoader::printProgress() const {
    logf(WEBSINK_LOG_INFO, "[PipelineLoader] %zu plugins from %s", pipeline_.size(), path_.c_str());
    for (const auto& msg : progress_msgs_) logf(WEBSINK_LOG_INFO, "  %s", msg.c_str());
}

} // namespace websink
