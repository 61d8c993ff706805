#pragma once

// Shared library suffix used when a pipeline names a plugin by kind
#if defined(_WIN32)
#define WEBSINK_PLUGIN_EXT ".dll"
#elif defined(__APPLE__)
#define WEBSINK_PLUGIN_EXT ".dylib"
#else
#define WEBSINK_PLUGIN_EXT ".so"
#endif
