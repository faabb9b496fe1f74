// File: config/configuration.cpp

#include "config/configuration.hpp"

#include <filesystem>

namespace config {

    std::shared_ptr<Configuration> Configuration::instance_;
    std::once_flag Configuration::init_flag_;

    void Configuration::initialize(const std::string &filename) { getInstance(filename); }

    Configuration &Configuration::getInstance(const std::string &filename) {
        std::call_once(init_flag_, [&filename] {
            instance_ = std::make_shared<Configuration>(filename.empty() ? std::string(default_filename_) : filename);
        });
        return *instance_;
    }

    Configuration::Configuration(std::string filename) : filename_(std::move(filename)) { loadFile(); }

    void Configuration::loadFile() {
        if (!std::filesystem::exists(filename_)) {
            LOG_WARN("Configuration file '{}' not found, using built-in defaults.", filename_);
            return;
        }

        LOG_INFO("Loading configuration from file: {}", filename_);
        try {
            const YAML::Node root = YAML::LoadFile(filename_);
            load(root);
            LOG_INFO("Configuration file '{}' loaded successfully ({} keys).", filename_, config_map_.size());
        } catch (const YAML::Exception &e) {
            LOG_CRITICAL("YAML exception while loading configuration: {}", e.what());
            throw std::runtime_error(fmt::format("Invalid configuration file '{}': {}", filename_, e.what()));
        }
    }

    void Configuration::load(const YAML::Node &node, const std::string &prefix) {
        for (const auto &it: node) {
            const std::string key =
                    prefix.empty() ? it.first.as<std::string>() : prefix + "." + it.first.as<std::string>();
            if (it.second.IsMap()) {
                load(it.second, key);
            } else {
                config_map_[key] = it.second;
                LOG_DEBUG("Loaded key: '{}', value: '{}'", key,
                          it.second.IsScalar() ? it.second.as<std::string>() : "[non-scalar]");
            }
        }
    }

    bool Configuration::erase(const std::string &key) {
        std::unique_lock lock(mutex_);
        return config_map_.erase(key) > 0;
    }

    void Configuration::registerChangeCallback(ChangeCallback callback) {
        std::unique_lock lock(mutex_);
        change_callbacks_.push_back(std::move(callback));
    }

    void Configuration::notifyChangeCallbacks(const std::string &key, const YAML::Node &value) const {
        std::vector<ChangeCallback> callbacks;
        {
            std::shared_lock lock(mutex_);
            callbacks = change_callbacks_;
        }
        for (const auto &callback: callbacks) {
            callback(key, value);
        }
    }

    void Configuration::show() const {
        std::shared_lock lock(mutex_);
        LOG_INFO("Configuration details ({}):", filename_);
        for (const auto &[key, value]: config_map_) {
            if (value.IsScalar()) {
                LOG_INFO("{}: {}", key, value.as<std::string>());
            } else {
                LOG_INFO("{}: [non-scalar]", key);
            }
        }
    }
} // namespace config
