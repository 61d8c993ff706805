// PipelineLoader.hpp
#pragma once
#include "websink/PluginManager.hpp" // for PluginConfig
#include <string>
#include <vector>

namespace websink {

// Reads a JSON pipeline description:
//   {"plugins": [{"kind": "capture_h264", "config": {...}, "children": [...]}, ...]}
// Entries name either an explicit "path" or a "kind" resolved under pluginDir.
class PipelineLoader {
public:
    explicit PipelineLoader(const std::string& path, const std::string& pluginDir = "plugins");
    ~PipelineLoader();

    bool load();

    // Get parsed pipeline (vector of PluginConfig)
    const std::vector<PluginConfig>& getPipeline() const;

    // Progress info for last load
    void printProgress() const;
private:
    std::string path_;
    std::string pluginDir_;
    std::vector<PluginConfig> pipeline_;
    // For progress/debug
    std::vector<std::string> progress_msgs_;
};

} // namespace websink
