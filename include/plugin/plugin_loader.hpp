#pragma once

#include "plugin/plugin_interface.hpp"
#include "recognizer/entity_detector.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace piishield {

struct PluginConfig {
    std::string path;                   // Path to .so file
    std::string type = "entity_detector";
    std::string config;                 // JSON config string passed to the factory
    std::vector<std::string> entities;  // Entity catalog; empty = default catalog
};

// RAII wrapper for a loaded shared library and the plugin instance it created
class LoadedPlugin {
public:
    LoadedPlugin(std::string path, std::string type, void* handle);
    ~LoadedPlugin();

    // Non-copyable, movable
    LoadedPlugin(const LoadedPlugin&) = delete;
    LoadedPlugin& operator=(const LoadedPlugin&) = delete;
    LoadedPlugin(LoadedPlugin&& other) noexcept;
    LoadedPlugin& operator=(LoadedPlugin&& other) noexcept;

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const std::string& type() const { return type_; }
    [[nodiscard]] void* handle() const { return handle_; }

    // Resolve symbol from the shared library
    [[nodiscard]] void* resolve(const char* symbol) const;

private:
    void release();

    std::string path_;
    std::string type_;
    void* handle_;

public:
    // Plugin instance (owned, destroyed before dlclose)
    EntityDetectorPlugin* detector = nullptr;
};

/**
 * @brief IEntityDetector backed by a C ABI plugin
 *
 * Calls into the plugin are serialized; the plugin (and its library) stays
 * alive as long as any detector referencing it does.
 */
class PluginEntityDetector final : public IEntityDetector {
public:
    explicit PluginEntityDetector(std::shared_ptr<LoadedPlugin> plugin);

    [[nodiscard]] std::string name() const override;

    /**
     * @throws std::runtime_error when the plugin reports an error
     */
    [[nodiscard]] std::vector<Span> detect(
        std::string_view text,
        const std::vector<std::string>& requested_types) const override;

private:
    std::shared_ptr<LoadedPlugin> plugin_;
    std::string name_;
    mutable std::mutex call_mutex_;
};

class PluginRegistry {
public:
    PluginRegistry() = default;
    ~PluginRegistry();

    // Non-copyable
    PluginRegistry(const PluginRegistry&) = delete;
    PluginRegistry& operator=(const PluginRegistry&) = delete;

    // Load a plugin from config (dlopen + resolve factory)
    [[nodiscard]] bool load_plugin(const PluginConfig& config);

    // Adopt an in-process plugin instance (no shared library); takes ownership
    // of plugin, which is destroyed on failure
    [[nodiscard]] bool adopt(EntityDetectorPlugin* plugin, const std::string& label);

    [[nodiscard]] const std::vector<std::shared_ptr<const IEntityDetector>>& entity_detectors() const {
        return detectors_;
    }

    [[nodiscard]] size_t plugin_count() const { return plugins_.size(); }

    // Drop registry references (libraries close once no detector uses them)
    void unload_all();

private:
    [[nodiscard]] bool install(std::shared_ptr<LoadedPlugin> plugin);

    std::vector<std::shared_ptr<LoadedPlugin>> plugins_;
    std::vector<std::shared_ptr<const IEntityDetector>> detectors_;
};

} // namespace piishield
