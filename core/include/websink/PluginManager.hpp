#pragma once

#include <memory>
#include <string>
#include <vector>
#include "websink_plugin.h"
#include "websink/CaptureThread.hpp"
#include "websink/ShmRing.hpp"

namespace websink {

struct PluginConfig {
    std::string path;
    std::string config_json;
};

// Loads C plugins with dlopen and runs them as one pipeline: outputs first,
// then a capture thread for the input plugin. Stops in reverse.
class PluginManager {
public:
    // EventBus channel receiving every plugin's publish_evt payloads
    static constexpr const char* kPluginEventChannel = "plugin_event";

    PluginManager();
    ~PluginManager();

    PluginManager(const PluginManager&) = delete;
    PluginManager& operator=(const PluginManager&) = delete;

    // dlopen a plugin and run its init function
    bool loadPlugin(const std::string& path, const std::string& configJson = "{}");

    // Load a pipeline: vector of PluginConfig (path, config, ...)
    bool loadPipeline(const std::vector<PluginConfig>& pipeline);

    // False if any plugin refused to start; already started plugins are stopped again
    bool startAll();
    void stopAll();

    size_t pluginCount() const;

    // Get the raw handle for the plugin at index
    void* getHandle(size_t index) const;
    websink_plugin_t* plugin(size_t index);

private:
    struct PluginInstance {
        void* handle = nullptr;
        websink_plugin_t plugin{};
        PluginConfig config;
        bool started = false;
    };

    void stopOutputs();

    std::vector<PluginInstance> pipeline_;
    std::unique_ptr<ShmRing> ring_;
    std::unique_ptr<CaptureThread> captureThread_;
};

} // namespace websink
