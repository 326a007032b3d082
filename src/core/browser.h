#pragma once

#include "window_types.h"

#include <string>

// Capabilities the window needs from an embedded browser engine.
// ChromiumBrowser is the production implementation; tests use fakes.
class Browser {
public:
    virtual ~Browser() = default;

    // Create the browser as a child of `parent`. Returns false on failure.
    virtual bool Embed(WindowHandle parent) = 0;

    // Fit the browser to the parent's client area.
    virtual void Resize() = 0;

    virtual void Navigate(const std::string& url) = 0;

    // Register a script that runs on every page load, before page content.
    virtual void Init(const std::string& script) = 0;

    // Evaluate a script in the current page's main frame.
    virtual void Eval(const std::string& script) = 0;

    // Returns false if there is no browser to notify yet.
    virtual bool NotifyParentWindowPositionChanged() = 0;

    virtual void Focus() = 0;
};
