#ifndef GOSNOMER_PLATE_FORMAT_H
#define GOSNOMER_PLATE_FORMAT_H

#include <string>
#include <vector>
#include <cstddef>

namespace gosnomer {

/**
 * Tipo de posición en una plantilla de placa
 */
enum class SlotKind {
    Letter,
    Digit
};

/**
 * Clasificación de un carácter ya validado
 * Ambiguous corresponde a "О" / "0"
 */
enum class ShapeSymbol {
    Letter,
    Digit,
    Ambiguous
};

// Forma abstracta de una placa, un símbolo por carácter
typedef std::vector<ShapeSymbol> PlateShape;

/**
 * Secuencia de dígitos de una plantilla (serie o región)
 */
struct DigitSequence {
    size_t start;      // Posición del primer dígito
    size_t length;     // Cantidad de dígitos
    bool is_region;    // true para el código de región

    DigitSequence() : start(0), length(0), is_region(false) {}
    DigitSequence(size_t s, size_t l, bool r) : start(s), length(l), is_region(r) {}
};

/**
 * Plantilla de placa
 *
 * El patrón usa 'X' para letra y '9' para dígito, p. ej. "X999XX99".
 */
struct PlateFormat {
    std::string pattern;        // Patrón legible
    std::string plate_type;     // Tipo según ГОСТ Р 50577-2018 ("1", "1Б", ...)
    std::string description;    // Uso de la placa
    size_t region_length;       // Dígitos finales que forman la región (2 o 3)

    size_t length() const { return pattern.length(); }

    /**
     * Tipo de posición en el índice dado
     */
    SlotKind slotAt(size_t index) const;

    /**
     * Secuencias de dígitos: series de izquierda a derecha y al final la región
     */
    std::vector<DigitSequence> digitSequences() const;
};

/**
 * Catálogo fijo de plantillas de placas rusas
 *
 * El orden de declaración es el criterio de desempate cuando una forma
 * con caracteres ambiguos es compatible con varias plantillas.
 */
class FormatCatalog {
public:
    // Marcadores de la representación legible
    static constexpr char LETTER_PLACEHOLDER = 'X';
    static constexpr char DIGIT_PLACEHOLDER = '9';
    static constexpr char WILDCARD_PLACEHOLDER = '*';

    /**
     * Todas las plantillas, en orden de declaración
     */
    static const std::vector<PlateFormat>& formats();

    /**
     * Patrones de las plantillas ("X999XX99", ...), en orden de declaración
     */
    static const std::vector<std::string>& allowedFormats();

    /**
     * Buscar una plantilla por su patrón
     *
     * @param pattern Patrón, p. ej. "X999XX999"
     * @return Puntero a la plantilla o nullptr si no existe
     */
    static const PlateFormat* find(const std::string& pattern);

    /**
     * Verificar si una forma es compatible con una plantilla
     *
     * Compatible: misma longitud y en cada posición el símbolo coincide con
     * el tipo de la plantilla o es ambiguo.
     */
    static bool isCompatible(const PlateFormat& format, const PlateShape& shape);

    /**
     * Todas las plantillas compatibles con la forma, en orden de declaración
     */
    static std::vector<const PlateFormat*> compatibleFormats(const PlateShape& shape);

    /**
     * Elegir la plantilla para una forma
     *
     * Se usa el primer patrón preferido que sea compatible; si no hay
     * ninguno, la primera plantilla compatible del catálogo.
     *
     * @param shape Forma de la placa
     * @param preferred Patrones preferidos en orden de preferencia
     * @return Plantilla elegida
     * @throws UnknownFormatError si algún patrón preferido no está en el catálogo
     * @throws InvalidFormatError si ninguna plantilla es compatible
     */
    static const PlateFormat& select(const PlateShape& shape,
                                     const std::vector<std::string>& preferred = std::vector<std::string>());

    /**
     * Comprobar que todos los patrones preferidos existen en el catálogo
     *
     * @throws UnknownFormatError con la lista de patrones desconocidos
     */
    static void checkPreferred(const std::vector<std::string>& preferred);

    /**
     * Representación legible de una forma: 'X' letra, '9' dígito, '*' ambiguo
     */
    static std::string renderShape(const PlateShape& shape);

    /**
     * Forma a partir de su representación legible (inversa de renderShape)
     *
     * @throws std::invalid_argument si contiene otros caracteres
     */
    static PlateShape parseShape(const std::string& rendered);
};

} // namespace gosnomer

#endif // GOSNOMER_PLATE_FORMAT_H
