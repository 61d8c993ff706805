// PluginManager implements dynamic loading of C plugins via C ABI
#include "websink/PluginManager.hpp"
#include "websink/EventBus.hpp"
#include "websink/Log.hpp"
#include <dlfcn.h>
#include <unistd.h>
#include <cstring>

namespace {

// Frame ring between the input plugin and the fan-out thread
constexpr size_t kRingSlots = 32;
constexpr size_t kRingSlotSize = 2 * 1024 * 1024;

// Host API handed to output plugins
websink_host_api_t gHost = {
    /* log */ [](void*, websink_log_level_t level, const char* msg) {
        websink::logf(level, "[plugin] %s", msg ? msg : "(null)");
    },
    /* publish_evt */ [](void*, const char* json_event) {
        if (json_event) websink::EventBus::instance().publish(websink::PluginManager::kPluginEventChannel, json_event);
    },
    /* on_frame    */ nullptr,
    /* reserved    */ {nullptr, nullptr, nullptr, nullptr}
};

} // namespace

namespace websink {

PluginManager::PluginManager() = default;

PluginManager::~PluginManager() {
    stopAll();
    for (auto& inst : pipeline_) {
        if (inst.handle) dlclose(inst.handle);
    }
}

bool PluginManager::loadPlugin(const std::string& path, const std::string& configJson) {
    void* handle = dlopen(path.c_str(), RTLD_NOW);
    if (!handle) {
        logf(WEBSINK_LOG_ERROR, "Failed to load plugin %s: %s", path.c_str(), dlerror());
        return false;
    }
    auto init_fn = reinterpret_cast<websink_plugin_init_fn>(dlsym(handle, WEBSINK_PLUGIN_EXPORT_SYMBOL));
    if (!init_fn) {
        logf(WEBSINK_LOG_ERROR, "%s not found in %s", WEBSINK_PLUGIN_EXPORT_SYMBOL, path.c_str());
        dlclose(handle);
        return false;
    }

    PluginInstance inst;
    inst.handle = handle;
    std::memset(&inst.plugin, 0, sizeof(websink_plugin_t));
    init_fn(&inst.plugin);
    inst.config = PluginConfig{path, configJson};
    pipeline_.push_back(inst);
    logf(WEBSINK_LOG_INFO, "Loaded %s plugin %s",
         inst.plugin.type == WEBSINK_PLUGIN_INPUT ? "input" : "output", path.c_str());
    return true;
}

bool PluginManager::loadPipeline(const std::vector<PluginConfig>& pipeline) {
    for (const auto& pcfg : pipeline) {
        if (!loadPlugin(pcfg.path, pcfg.config_json.empty() ? "{}" : pcfg.config_json)) {
            return false;
        }
    }
    return !pipeline_.empty();
}

bool PluginManager::startAll() {
    if (pipeline_.empty()) return false;

    // Identify input plugin (first with type == WEBSINK_PLUGIN_INPUT)
    size_t inputIdx = 0;
    for (; inputIdx < pipeline_.size(); ++inputIdx) {
        if (pipeline_[inputIdx].plugin.type == WEBSINK_PLUGIN_INPUT)
            break;
    }

    // Outputs first, so the first frame has somewhere to go
    std::vector<websink_plugin_t*> outputs;
    for (size_t i = 0; i < pipeline_.size(); ++i) {
        if (i == inputIdx) continue;
        auto& inst = pipeline_[i];
        if (inst.plugin.type == WEBSINK_PLUGIN_INPUT) {
            logf(WEBSINK_LOG_WARN, "Ignoring extra input plugin %s", inst.config.path.c_str());
            continue;
        }
        if (inst.plugin.start &&
            inst.plugin.start(&inst.plugin, &gHost, &inst, inst.config.config_json.c_str()) != 0) {
            logf(WEBSINK_LOG_ERROR, "Plugin %s failed to start", inst.config.path.c_str());
            stopOutputs();
            return false;
        }
        inst.started = true;
        outputs.push_back(&inst.plugin);
    }

    if (inputIdx == pipeline_.size()) {
        logf(WEBSINK_LOG_WARN, "No input plugin in pipeline; outputs will stay idle");
        return true;
    }

    try {
        ring_ = std::make_unique<ShmRing>("websink_ring_" + std::to_string(getpid()), kRingSlots, kRingSlotSize);
    } catch (const std::exception& e) {
        logf(WEBSINK_LOG_ERROR, "Cannot create frame ring: %s", e.what());
        stopOutputs();
        return false;
    }

    auto& input = pipeline_[inputIdx];
    captureThread_ = std::make_unique<CaptureThread>(&input.plugin, *ring_, outputs, input.config.config_json);
    if (!captureThread_->start()) {
        logf(WEBSINK_LOG_ERROR, "Input plugin %s failed to start", input.config.path.c_str());
        captureThread_.reset();
        ring_.reset();
        stopOutputs();
        return false;
    }
    return true;
}

void PluginManager::stopAll() {
    if (captureThread_) {
        captureThread_->stop();
        captureThread_.reset();
    }
    ring_.reset();
    stopOutputs();
}

void PluginManager::stopOutputs() {
    for (auto it = pipeline_.rbegin(); it != pipeline_.rend(); ++it) {
        if (it->started && it->plugin.stop) {
            it->plugin.stop(&it->plugin);
        }
        it->started = false;
    }
}

size_t PluginManager::pluginCount() const {
    return pipeline_.size();
}

void* PluginManager::getHandle(size_t index) const {
    if (index < pipeline_.size())
        return pipeline_[index].handle;
    return nullptr;
}

websink_plugin_t* PluginManager::plugin(size_t index) {
    if (index < pipeline_.size())
        return &pipeline_[index].plugin;
    return nullptr;
}

} // namespace websink
