#pragma once

#include "ArgSpec.hpp"
#include "Value.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>


struct StreamMode {
    enum class Kind {
        Inherit,
        Capture,
        File
    };

    Kind kind = Kind::Capture;
    std::string path;   // File only, template text

    static StreamMode inherit() { return StreamMode{Kind::Inherit, ""}; }
    static StreamMode capture() { return StreamMode{Kind::Capture, ""}; }
    static StreamMode file(const std::string& path) { return StreamMode{Kind::File, path}; }

    // "inherit", "capture" or "file:<path>"
    static std::optional<StreamMode> parse(const std::string& text) {
        if (text == "inherit") return inherit();
        if (text == "capture") return capture();
        if (text.rfind("file:", 0) == 0 && text.size() > 5) return file(text.substr(5));
        return std::nullopt;
    }

    std::string to_string() const {
        switch (kind) {
            case Kind::Inherit: return "inherit";
            case Kind::Capture: return "capture";
            case Kind::File:    return "file:" + path;
        }
        return "";
    }
};

// Declarative description of one program invocation; every text field is a template
struct RunConfig {
    Value program;
    ArgvSpec argv;
    std::map<std::string, Value> env;
    std::optional<Value> workdir;
    std::optional<bool> shell;
    std::optional<StreamMode> stdout_mode;
    std::optional<StreamMode> stderr_mode;
    bool capture = true;
    int64_t timeout_ms = 0;   // 0 = no timeout

    StreamMode effective_stdout() const {
        if (stdout_mode) return *stdout_mode;
        return capture ? StreamMode::capture() : StreamMode::inherit();
    }

    StreamMode effective_stderr() const {
        if (stderr_mode) return *stderr_mode;
        return capture ? StreamMode::capture() : StreamMode::inherit();
    }
};
