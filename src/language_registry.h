#pragma once

#include <string>
#include <map>
#include <vector>
#include <chrono>

namespace runbox {

// How to turn a source file into a running program inside a container image
struct LanguageSpec {
    std::string name;                      // e.g., "python", "cpp"
    std::string image;                     // Container image (e.g., "gcc:latest")
    std::string extension;                 // Source extension without dot
    std::string file_name;                 // Overrides program.<ext> when set
    std::string compile_command;           // Optional; empty for interpreted languages
    std::string run_command;
    std::chrono::seconds timeout{15};      // Wait deadline for the container

    // Name of the source file inside the workspace
    std::string source_file_name() const;

    // "compile && run" or just "run"
    std::string command_line() const;
};

// Read-only mapping of language identifiers to their specs.
// Populated once at startup, then shared by all jobs without locking.
class LanguageRegistry {
public:
    // Registry populated with BuiltInLanguages::all()
    LanguageRegistry();

    // Empty registry (for tests and custom setups)
    struct Empty {};
    explicit LanguageRegistry(Empty) {}

    // Add or replace a language
    void add(const LanguageSpec& spec);

    // Returns nullptr if the language is not supported
    const LanguageSpec* lookup(const std::string& name) const;

    bool supports(const std::string& name) const { return lookup(name) != nullptr; }

    std::vector<std::string> names() const;
    size_t size() const { return languages_.size(); }

    // Merge overrides from a JSON file:
    //   { "lua": { "image": "...", "ext": "lua", "run": "lua program.lua",
    //              "compile": "...", "fileName": "...", "timeoutSeconds": 20 } }
    // Fields omitted for an existing language keep their current values.
    // Throws std::runtime_error on unreadable or malformed files.
    void load_overrides(const std::string& path);
    void load_overrides_from_string(const std::string& json_text);

private:
    std::map<std::string, LanguageSpec> languages_;
};

// Built-in language table
namespace BuiltInLanguages {
    std::vector<LanguageSpec> all();
}

} // namespace runbox
