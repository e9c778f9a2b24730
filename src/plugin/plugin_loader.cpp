#include "plugin/plugin_loader.hpp"
#include "core/utils.hpp"

#include <dlfcn.h>
#include <format>
#include <stdexcept>

namespace piishield {

// ============================================================================
// LoadedPlugin
// ============================================================================

LoadedPlugin::LoadedPlugin(std::string path, std::string type, void* handle)
    : path_(std::move(path)), type_(std::move(type)), handle_(handle) {}

LoadedPlugin::~LoadedPlugin() {
    release();
}

void LoadedPlugin::release() {
    // Destroy plugin instance before dlclose
    if (detector) {
        if (detector->destroy) {
            detector->destroy(detector->instance);
        }
        delete detector;
        detector = nullptr;
    }
    if (handle_) {
        dlclose(handle_);
        handle_ = nullptr;
    }
}

LoadedPlugin::LoadedPlugin(LoadedPlugin&& other) noexcept
    : path_(std::move(other.path_)),
      type_(std::move(other.type_)),
      handle_(other.handle_),
      detector(other.detector) {
    other.handle_ = nullptr;
    other.detector = nullptr;
}

LoadedPlugin& LoadedPlugin::operator=(LoadedPlugin&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        type_ = std::move(other.type_);
        handle_ = other.handle_;
        detector = other.detector;
        other.handle_ = nullptr;
        other.detector = nullptr;
    }
    return *this;
}

void* LoadedPlugin::resolve(const char* symbol) const {
    if (!handle_) return nullptr;
    return dlsym(handle_, symbol);
}

// ============================================================================
// PluginEntityDetector
// ============================================================================

PluginEntityDetector::PluginEntityDetector(std::shared_ptr<LoadedPlugin> plugin)
    : plugin_(std::move(plugin)) {
    const auto info = plugin_->detector->get_info(plugin_->detector->instance);
    name_ = info.name ? info.name : plugin_->path();
}

std::string PluginEntityDetector::name() const {
    return name_;
}

std::vector<Span> PluginEntityDetector::detect(
    std::string_view text,
    const std::vector<std::string>& requested_types) const {

    std::vector<const char*> types;
    types.reserve(requested_types.size());
    for (const auto& t : requested_types) {
        types.push_back(t.c_str());
    }

    // detect() receives a NUL-terminated copy; offsets still refer to text
    const std::string buffer(text);
    auto* plugin = plugin_->detector;

    std::lock_guard<std::mutex> lock(call_mutex_);
    const auto result = plugin->detect(plugin->instance, buffer.c_str(), buffer.size(),
                                       types.empty() ? nullptr : types.data(), types.size());

    if (result.error) {
        std::string message = std::format("plugin '{}': {}", name_, result.error);
        if (plugin->free_result) plugin->free_result(plugin->instance, result);
        throw std::runtime_error(message);
    }

    std::vector<Span> spans;
    spans.reserve(result.count);
    for (size_t i = 0; i < result.count; ++i) {
        const auto& s = result.spans[i];
        spans.emplace_back(s.type ? s.type : "", s.start, s.end, s.score);
    }
    if (plugin->free_result) plugin->free_result(plugin->instance, result);
    return spans;
}

// ============================================================================
// PluginRegistry
// ============================================================================

PluginRegistry::~PluginRegistry() {
    unload_all();
}

bool PluginRegistry::load_plugin(const PluginConfig& config) {
    if (config.type != "entity_detector") {
        utils::log::error(std::format("Plugin [{}]: unknown type '{}'", config.path, config.type));
        return false;
    }

    // dlopen the shared library
    void* handle = dlopen(config.path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        utils::log::error(std::format("Plugin load failed [{}]: {}", config.path, dlerror()));
        return false;
    }

    auto plugin = std::make_shared<LoadedPlugin>(config.path, config.type, handle);

    // Resolve factory: EntityDetectorPlugin* create_entity_detector_plugin(const char*)
    using FactoryFn = EntityDetectorPlugin* (*)(const char*);
    const auto factory = reinterpret_cast<FactoryFn>(
        plugin->resolve("create_entity_detector_plugin"));
    if (!factory) {
        utils::log::error(std::format(
            "Plugin [{}]: missing create_entity_detector_plugin symbol", config.path));
        return false;
    }

    plugin->detector = factory(config.config.c_str());
    if (!plugin->detector) {
        utils::log::error(std::format("Plugin [{}]: factory returned null", config.path));
        return false;
    }

    return install(std::move(plugin));
}

bool PluginRegistry::adopt(EntityDetectorPlugin* detector, const std::string& label) {
    if (!detector) {
        utils::log::error(std::format("Plugin [{}]: null instance", label));
        return false;
    }
    auto plugin = std::make_shared<LoadedPlugin>(label, "entity_detector", nullptr);
    plugin->detector = detector;
    return install(std::move(plugin));
}

bool PluginRegistry::install(std::shared_ptr<LoadedPlugin> plugin) {
    auto* detector = plugin->detector;
    if (!detector->get_info || !detector->detect) {
        utils::log::error(std::format("Plugin [{}]: incomplete vtable", plugin->path()));
        return false;
    }

    // Validate API version and type
    const auto info = detector->get_info(detector->instance);
    if (info.api_version != PIISHIELD_PLUGIN_API_VERSION) {
        utils::log::error(std::format("Plugin [{}]: API version mismatch (got {}, expected {})",
            plugin->path(), info.api_version, PIISHIELD_PLUGIN_API_VERSION));
        return false;
    }
    if (!info.type || std::string(info.type) != "entity_detector") {
        utils::log::error(std::format("Plugin [{}]: not an entity detector", plugin->path()));
        return false;
    }

    detectors_.push_back(std::make_shared<PluginEntityDetector>(plugin));
    plugins_.push_back(std::move(plugin));
    utils::log::info(std::format("Plugin loaded: {} v{} (entity_detector)",
        info.name ? info.name : "?", info.version ? info.version : "?"));
    return true;
}

void PluginRegistry::unload_all() {
    detectors_.clear();
    plugins_.clear();
}

} // namespace piishield
