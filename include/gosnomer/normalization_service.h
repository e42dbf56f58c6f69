#ifndef GOSNOMER_NORMALIZATION_SERVICE_H
#define GOSNOMER_NORMALIZATION_SERVICE_H

#include "gosnomer/config_manager.h"

#include <string>
#include <vector>

namespace gosnomer {

/**
 * Resultado de normalizar una entrada
 */
struct NormalizationResult {
    std::string input;           // Texto original
    std::string plate;           // Placa canónica (vacía si se rechazó)
    std::string format;          // Patrón de la plantilla elegida
    bool valid;                  // Si la placa se pudo normalizar
    std::string error_message;   // Motivo del rechazo

    NormalizationResult() : valid(false) {}
};

/**
 * Servicio de normalización configurable
 *
 * Aplica los formatos preferidos de la configuración y registra en consola
 * las placas aceptadas y rechazadas. No cambia tras la construcción, por lo
 * que se puede compartir entre hilos.
 */
class NormalizationService {
public:
    /**
     * Constructor
     *
     * @param config_path Ruta al archivo de configuración
     * @throws UnknownFormatError si la configuración prefiere un formato desconocido
     */
    explicit NormalizationService(const std::string& config_path = "config/default_config.json");

    /**
     * Constructor a partir de una configuración ya cargada
     *
     * @throws UnknownFormatError si la configuración prefiere un formato desconocido
     */
    explicit NormalizationService(const ConfigManager& config);

    /**
     * Normalizar una placa con los formatos preferidos configurados
     *
     * @throws PlateError si la placa no se puede corregir
     */
    std::string normalize(const std::string& raw_text) const;

    /**
     * Normalizar sin lanzar excepciones de placa
     *
     * @param raw_text Texto de la placa
     * @return Resultado con la placa o el motivo del rechazo
     */
    NormalizationResult process(const std::string& raw_text) const;

    /**
     * Normalizar varias entradas
     *
     * @return Un resultado por entrada, en el mismo orden
     */
    std::vector<NormalizationResult> processBatch(const std::vector<std::string>& raw_texts) const;

    const std::vector<std::string>& preferredFormats() const { return preferred_formats_; }

private:
    std::vector<std::string> preferred_formats_;
    bool log_rejections_;
    bool log_accepted_;

    /**
     * Leer y validar la configuración
     */
    void configure(const ConfigManager& config);

    /**
     * Ejecutar las cuatro etapas y registrar el resultado
     *
     * @param raw_text Texto de la placa
     * @param pattern Recibe el patrón de la plantilla elegida
     * @return Placa canónica
     */
    std::string run(const std::string& raw_text, std::string& pattern) const;
};

} // namespace gosnomer

#endif // GOSNOMER_NORMALIZATION_SERVICE_H
