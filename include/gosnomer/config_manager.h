#ifndef GOSNOMER_CONFIG_MANAGER_H
#define GOSNOMER_CONFIG_MANAGER_H

#include <string>
#include <vector>
#include <memory>

namespace gosnomer {

// Forward declaration
struct JsonHolder;

/**
 * Gestor de configuración del normalizador
 * Lee configuración desde JSON (archivo o texto)
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    /**
     * Cargar configuración desde archivo JSON
     *
     * @param config_path Ruta al archivo de configuración
     * @return true si se cargó correctamente; si no, queda la configuración por defecto
     */
    bool loadFromFile(const std::string& config_path);

    /**
     * Cargar configuración desde un texto JSON
     *
     * @param json_text Documento JSON
     * @return true si se cargó correctamente; si no, queda la configuración por defecto
     */
    bool loadFromString(const std::string& json_text);

    /**
     * Obtener booleano de configuración
     */
    bool getBool(const std::string& key, bool default_value = false) const;

    /**
     * Obtener lista de strings de configuración
     * Elementos que no son string se ignoran
     */
    std::vector<std::string> getStringList(const std::string& key,
                                           const std::vector<std::string>& default_value = std::vector<std::string>()) const;

    /**
     * Verificar si existe una clave
     */
    bool has(const std::string& key) const;

    // Estructuras de configuración
    struct NormalizerConfig {
        std::vector<std::string> preferred_formats;
    };

    struct LoggingConfig {
        bool log_rejections;
        bool log_accepted;
    };

    /**
     * Obtener configuración del normalizador
     */
    NormalizerConfig getNormalizerConfig() const;

    /**
     * Obtener configuración de logging
     */
    LoggingConfig getLoggingConfig() const;

private:
    std::unique_ptr<JsonHolder> json_data_;

    /**
     * Obtener valor JSON anidado usando clave con "."
     */
    void* getNestedValue(const std::string& key) const;

    /**
     * Crear configuración por defecto
     */
    void createDefaultConfig();
};

} // namespace gosnomer

#endif // GOSNOMER_CONFIG_MANAGER_H
