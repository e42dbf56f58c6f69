#include "gosnomer/config_manager.h"
#include <fstream>
#include <sstream>
#include <iostream>

// Incluir nlohmann/json de forma pimpl para evitar dependencias públicas
#include <nlohmann/json.hpp>

namespace gosnomer {

// Estructura interna para almacenar JSON
struct JsonHolder {
    nlohmann::json data;
};

ConfigManager::NormalizerConfig ConfigManager::getNormalizerConfig() const {
    NormalizerConfig config;
    config.preferred_formats = getStringList("normalizer.preferred_formats");
    return config;
}

ConfigManager::LoggingConfig ConfigManager::getLoggingConfig() const {
    LoggingConfig config;
    config.log_rejections = getBool("logging.log_rejections", true);
    config.log_accepted = getBool("logging.log_accepted", false);
    return config;
}

ConfigManager::ConfigManager() : json_data_(nullptr) {
    createDefaultConfig();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::loadFromFile(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cerr << "Error: No se pudo abrir el archivo de configuración: " << config_path << std::endl;
        createDefaultConfig();
        return false;
    }

    try {
        std::unique_ptr<JsonHolder> loaded = std::make_unique<JsonHolder>();
        file >> loaded->data;
        file.close();

        if (!loaded->data.is_object()) {
            std::cerr << "Error: La configuración debe ser un objeto JSON: " << config_path << std::endl;
            createDefaultConfig();
            return false;
        }

        json_data_ = std::move(loaded);
        std::cout << "Configuración cargada desde: " << config_path << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parseando JSON: " << e.what() << std::endl;
        createDefaultConfig();
        return false;
    }
}

bool ConfigManager::loadFromString(const std::string& json_text) {
    try {
        std::unique_ptr<JsonHolder> loaded = std::make_unique<JsonHolder>();
        loaded->data = nlohmann::json::parse(json_text);

        if (!loaded->data.is_object()) {
            std::cerr << "Error: La configuración debe ser un objeto JSON" << std::endl;
            createDefaultConfig();
            return false;
        }

        json_data_ = std::move(loaded);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parseando JSON: " << e.what() << std::endl;
        createDefaultConfig();
        return false;
    }
}

void ConfigManager::createDefaultConfig() {
    json_data_ = std::make_unique<JsonHolder>();

    // Configuración por defecto
    json_data_->data = nlohmann::json::object({
        {"normalizer", {
            {"preferred_formats", nlohmann::json::array()}
        }},
        {"logging", {
            {"log_rejections", true},
            {"log_accepted", false}
        }}
    });
}

void* ConfigManager::getNestedValue(const std::string& key) const {
    if (!json_data_) {
        return nullptr;
    }

    nlohmann::json* current = &json_data_->data;

    std::istringstream iss(key);
    std::string segment;

    while (std::getline(iss, segment, '.')) {
        if (current->is_object() && current->contains(segment)) {
            current = &((*current)[segment]);
        } else {
            return nullptr;
        }
    }

    return static_cast<void*>(current);
}

bool ConfigManager::getBool(const std::string& key, bool default_value) const {
    nlohmann::json* json_ptr = static_cast<nlohmann::json*>(getNestedValue(key));
    if (!json_ptr || !json_ptr->is_boolean()) {
        return default_value;
    }

    return json_ptr->get<bool>();
}

std::vector<std::string> ConfigManager::getStringList(const std::string& key,
                                                      const std::vector<std::string>& default_value) const {
    nlohmann::json* json_ptr = static_cast<nlohmann::json*>(getNestedValue(key));
    if (!json_ptr || !json_ptr->is_array()) {
        return default_value;
    }

    std::vector<std::string> result;
    for (const auto& item : *json_ptr) {
        if (item.is_string()) {
            result.push_back(item.get<std::string>());
        } else {
            std::cerr << "Advertencia: Elemento no textual ignorado en " << key << ": " << item.dump() << std::endl;
        }
    }

    return result;
}

bool ConfigManager::has(const std::string& key) const {
    return getNestedValue(key) != nullptr;
}

} // namespace gosnomer
