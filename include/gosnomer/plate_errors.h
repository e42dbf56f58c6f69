#ifndef GOSNOMER_PLATE_ERRORS_H
#define GOSNOMER_PLATE_ERRORS_H

#include <stdexcept>
#include <string>
#include <vector>
#include <cstddef>

#include "gosnomer/plate_format.h"

namespace gosnomer {

/**
 * Base de todos los rechazos de una placa
 *
 * Todos los errores son resultado determinista de la entrada; el mensaje
 * (what()) está listo para mostrarse al usuario y cada subclase conserva
 * además los datos estructurados que lo originaron.
 */
class PlateError : public std::invalid_argument {
public:
    explicit PlateError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * Carácter fuera del alfabeto permitido
 */
class InvalidCharacterError : public PlateError {
public:
    InvalidCharacterError(char32_t character, size_t position);

    char32_t character() const { return character_; }
    // Carácter en UTF-8
    const std::string& characterText() const { return character_text_; }
    size_t position() const { return position_; }

private:
    char32_t character_;
    std::string character_text_;
    size_t position_;
};

/**
 * Ninguna plantilla del catálogo es compatible con la forma
 */
class InvalidFormatError : public PlateError {
public:
    explicit InvalidFormatError(const PlateShape& shape);

    const PlateShape& shape() const { return shape_; }
    std::string renderedShape() const;

private:
    PlateShape shape_;
};

/**
 * Región de 3 dígitos que empieza por cero
 */
class RegionFirstDigitZeroError : public PlateError {
public:
    explicit RegionFirstDigitZeroError(const std::string& region);

    const std::string& region() const { return region_; }

private:
    std::string region_;
};

/**
 * Serie o región compuesta solo de ceros
 */
class AllZeroSequenceError : public PlateError {
public:
    AllZeroSequenceError(const std::string& sequence, size_t position, bool is_region);

    const std::string& sequence() const { return sequence_; }
    size_t position() const { return position_; }
    bool isRegion() const { return is_region_; }

private:
    std::string sequence_;
    size_t position_;
    bool is_region_;
};

/**
 * Patrones preferidos que no existen en el catálogo
 */
class UnknownFormatError : public PlateError {
public:
    explicit UnknownFormatError(const std::vector<std::string>& patterns);

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_;
};

} // namespace gosnomer

#endif // GOSNOMER_PLATE_ERRORS_H
