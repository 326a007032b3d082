#pragma once

#include <windows.h>

#include <string>

struct RuntimeSettings {
    // Verbose CEF logging.
    bool debug = false;

    // Root directory for browser profiles. Empty uses a directory under %TEMP%.
    std::string rootCachePath;

    // Executable for CEF helper processes. Empty reuses the current executable.
    std::string subprocessPath;
};

// Process-wide CEF lifecycle. CEF runs its own UI thread
// (multi_threaded_message_loop) so windows keep a plain Win32 message loop.
namespace CefRuntime {

// Must be the first call in main(). Returns the exit code when this process
// was launched as a CEF helper, or -1 in the browser process.
int ExecuteSubprocess(HINSTANCE instance);

// Initialize CEF. Returns false on failure. Further calls are no-ops.
bool Initialize(HINSTANCE instance, const RuntimeSettings& settings);

bool IsInitialized();

// Shut down CEF. Call after every webview has been destroyed.
void Shutdown();

} // namespace CefRuntime
