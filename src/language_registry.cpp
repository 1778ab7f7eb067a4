#include "language_registry.h"
#include "constants.h"
#include "logger.h"
#include <json/json.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace runbox {

std::string LanguageSpec::source_file_name() const {
    if (!file_name.empty()) return file_name;
    return "program." + extension;
}

std::string LanguageSpec::command_line() const {
    if (compile_command.empty()) return run_command;
    return compile_command + " && " + run_command;
}

LanguageRegistry::LanguageRegistry() {
    for (const auto& spec : BuiltInLanguages::all()) {
        add(spec);
    }
}

void LanguageRegistry::add(const LanguageSpec& spec) {
    if (spec.name.empty()) {
        throw std::invalid_argument("Language name must not be empty");
    }
    if (spec.run_command.empty()) {
        throw std::invalid_argument("Language " + spec.name + " has no run command");
    }
    languages_[spec.name] = spec;
}

const LanguageSpec* LanguageRegistry::lookup(const std::string& name) const {
    auto it = languages_.find(name);
    return it != languages_.end() ? &it->second : nullptr;
}

std::vector<std::string> LanguageRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& [name, _] : languages_) {
        result.push_back(name);
    }
    return result;
}

void LanguageRegistry::load_overrides(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open language file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    load_overrides_from_string(buffer.str());
    LOG_INFO("[Languages] Loaded overrides from " + path);
}

void LanguageRegistry::load_overrides_from_string(const std::string& json_text) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errors;
    std::istringstream stream(json_text);

    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw std::runtime_error("Invalid language JSON: " + errors);
    }
    if (!root.isObject()) {
        throw std::runtime_error("Language JSON must be an object keyed by language name");
    }

    for (const auto& name : root.getMemberNames()) {
        const Json::Value& entry = root[name];
        if (!entry.isObject()) {
            throw std::runtime_error("Language entry is not an object: " + name);
        }

        LanguageSpec spec;
        if (const LanguageSpec* existing = lookup(name)) {
            spec = *existing;
        } else {
            spec.name = name;
        }

        auto read_string = [&](const char* key, std::string& field) {
            if (!entry.isMember(key)) return;
            if (!entry[key].isString()) {
                throw std::runtime_error("Field " + std::string(key) + " of " + name + " must be a string");
            }
            field = entry[key].asString();
        };
        read_string("image", spec.image);
        read_string("ext", spec.extension);
        read_string("fileName", spec.file_name);
        read_string("compile", spec.compile_command);
        read_string("run", spec.run_command);

        if (entry.isMember("timeoutSeconds")) {
            if (!entry["timeoutSeconds"].isInt() || entry["timeoutSeconds"].asInt() <= 0) {
                throw std::runtime_error("timeoutSeconds of " + name + " must be a positive integer");
            }
            spec.timeout = std::chrono::seconds(entry["timeoutSeconds"].asInt());
        }

        if (spec.image.empty()) {
            throw std::runtime_error("Language " + name + " has no image");
        }
        if (spec.extension.empty() && spec.file_name.empty()) {
            throw std::runtime_error("Language " + name + " needs ext or fileName");
        }
        add(spec);
    }
}

namespace BuiltInLanguages {

namespace {

LanguageSpec make(const std::string& name, const std::string& image, const std::string& ext,
                  const std::string& compile, const std::string& run,
                  int timeout_seconds = DEFAULT_TIMEOUT_SECONDS) {
    LanguageSpec spec;
    spec.name = name;
    spec.image = image;
    spec.extension = ext;
    spec.compile_command = compile;
    spec.run_command = run;
    spec.timeout = std::chrono::seconds(timeout_seconds);
    return spec;
}

} // namespace

std::vector<LanguageSpec> all() {
    std::vector<LanguageSpec> langs;

    langs.push_back(make("c", "gcc:latest", "c", "gcc -o program program.c", "./program"));
    langs.push_back(make("cpp", "gcc:latest", "cpp", "g++ -o program program.cpp", "./program"));

    // javac requires the file name to match the public class
    LanguageSpec java = make("java", "openjdk:17", "java", "javac Main.java", "java Main");
    java.file_name = "Main.java";
    langs.push_back(java);

    langs.push_back(make("python", "python:3.9", "py", "", "python program.py"));
    langs.push_back(make("kotlin", "kotlin:custom", "kt",
                         "kotlinc program.kt -include-runtime -d program.jar",
                         "java -jar program.jar"));
    langs.push_back(make("scala", "scala:custom", "scala", "scalac program.scala", "scala Main"));
    langs.push_back(make("javascript", "node:16", "js", "", "node program.js",
                         SLOW_START_TIMEOUT_SECONDS));
    langs.push_back(make("go", "golang:latest", "go", "", "go run program.go"));
    langs.push_back(make("ruby", "ruby:latest", "rb", "", "ruby program.rb"));
    langs.push_back(make("rust", "rust:latest", "rs", "rustc -o program program.rs", "./program"));
    langs.push_back(make("csharp", "mcr.microsoft.com/dotnet/sdk:8.0", "cs", "",
                         "dotnet script /app/program.cs", SLOW_START_TIMEOUT_SECONDS));

    return langs;
}

} // namespace BuiltInLanguages

} // namespace runbox
