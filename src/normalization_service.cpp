#include "gosnomer/normalization_service.h"
#include "gosnomer/plate_normalizer.h"
#include "gosnomer/plate_errors.h"

#include <iostream>

namespace gosnomer {

NormalizationService::NormalizationService(const std::string& config_path)
    : log_rejections_(true)
    , log_accepted_(false)
{
    ConfigManager config;
    config.loadFromFile(config_path);
    configure(config);
}

NormalizationService::NormalizationService(const ConfigManager& config)
    : log_rejections_(true)
    , log_accepted_(false)
{
    configure(config);
}

void NormalizationService::configure(const ConfigManager& config) {
    auto normalizer_config = config.getNormalizerConfig();
    auto logging_config = config.getLoggingConfig();

    // Formatos desconocidos en la configuración son un error de arranque
    FormatCatalog::checkPreferred(normalizer_config.preferred_formats);

    preferred_formats_ = normalizer_config.preferred_formats;
    log_rejections_ = logging_config.log_rejections;
    log_accepted_ = logging_config.log_accepted;

    if (!preferred_formats_.empty()) {
        std::cout << "Formatos preferidos:";
        for (const auto& pattern : preferred_formats_) {
            std::cout << " " << pattern;
        }
        std::cout << std::endl;
    }
}

std::string NormalizationService::normalize(const std::string& raw_text) const {
    std::string pattern;
    return run(raw_text, pattern);
}

NormalizationResult NormalizationService::process(const std::string& raw_text) const {
    NormalizationResult result;
    result.input = raw_text;

    try {
        result.plate = run(raw_text, result.format);
        result.valid = true;
    } catch (const PlateError& e) {
        result.plate.clear();
        result.format.clear();
        result.valid = false;
        result.error_message = e.what();
    }

    return result;
}

std::string NormalizationService::run(const std::string& raw_text, std::string& pattern) const {
    try {
        const std::string validated = PlateNormalizer::validateCharacters(PlateNormalizer::sanitize(raw_text));
        const PlateFormat& format = PlateNormalizer::matchFormat(validated, preferred_formats_);
        std::string plate = PlateNormalizer::resolveAndValidate(validated, format);

        if (log_accepted_) {
            std::cout << "✅ Placa normalizada: \"" << raw_text << "\" -> " << plate
                      << " (" << format.pattern << ")" << std::endl;
        }

        pattern = format.pattern;
        return plate;
    } catch (const PlateError& e) {
        if (log_rejections_) {
            std::cerr << "⚠️ Placa rechazada \"" << raw_text << "\": " << e.what() << std::endl;
        }
        throw;
    }
}

std::vector<NormalizationResult> NormalizationService::processBatch(const std::vector<std::string>& raw_texts) const {
    std::vector<NormalizationResult> results;
    results.reserve(raw_texts.size());

    for (const auto& raw_text : raw_texts) {
        results.push_back(process(raw_text));
    }

    return results;
}

} // namespace gosnomer
