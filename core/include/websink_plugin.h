#pragma once
#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Logging levels
typedef enum {
    WEBSINK_LOG_DEBUG,
    WEBSINK_LOG_INFO,
    WEBSINK_LOG_WARN,
    WEBSINK_LOG_ERROR
} websink_log_level_t;

// Plugin interface type
typedef enum websink_plugin_type_e {
    WEBSINK_PLUGIN_INPUT,
    WEBSINK_PLUGIN_OUTPUT
} websink_plugin_type_t;

// Frame flags
#define WEBSINK_FRAME_FLAG_KEY 0x1u

// Host API for plugins to call
typedef struct websink_host_api_s {
    // Logger with different severity levels
    void (*log)(void* host_ctx, websink_log_level_t level, const char* msg);
    // Event publishing for JSON events (stats, keyframe requests, ...)
    void (*publish_evt)(void* host_ctx, const char* json_event);
    // Frame callback for input plugins: buffer is header followed by payload
    void (*on_frame)(void* host_ctx, const void* frame_buf, size_t frame_size);
    // Reserved for future extensions of the API
    void* reserved[4];
} websink_host_api_t;

// Frame header prefixed to each encoded access unit
typedef struct websink_frame_hdr_s {
    uint32_t stream_id;        // Stream identifier (0=first video, 1=second video, etc.)
    uint32_t bytes;            // Size of the payload following this header
    uint32_t flags;            // WEBSINK_FRAME_FLAG_*
    uint32_t reserved;
    uint64_t pts_usec;         // Capture timestamp in microseconds
} websink_frame_hdr_t;

// Plugin definition
typedef struct websink_plugin_s {
    uint32_t version;          // API version, currently 1
    websink_plugin_type_t type;
    // Lifecycle callbacks; start returns 0 on success
    int (*start)(struct websink_plugin_s* plugin, websink_host_api_t* host, void* host_ctx, const char* json_cfg);
    void (*stop)(struct websink_plugin_s* plugin);
    // Frame delivery (output plugins only): header followed by payload
    void (*on_frame)(struct websink_plugin_s* plugin, const void* frame_buf, size_t frame_size);
    // Plugin instance data
    void* instance;
    void* reserved[2];
} websink_plugin_t;

// Export this symbol from your plugin
#define WEBSINK_PLUGIN_EXPORT_SYMBOL "websink_plugin_init"
typedef void (*websink_plugin_init_fn)(websink_plugin_t*);

#ifdef __cplusplus
}
#endif
