#ifndef GOSNOMER_PLATE_NORMALIZER_H
#define GOSNOMER_PLATE_NORMALIZER_H

#include <string>
#include <vector>
#include <type_traits>

#include "gosnomer/plate_format.h"

namespace gosnomer {

/**
 * Normalizador de placas de vehículos rusas (госномер)
 *
 * Corrige errores de escritura manual y devuelve la placa en su forma
 * canónica. Etapas, en este orden y sin vuelta atrás:
 *   1. sanitize: quitar espacios extremos, mayúsculas, latín -> cirílico
 *   2. validateCharacters: solo letras y dígitos permitidos
 *   3. matchFormat: forma abstracta -> plantilla del catálogo
 *   4. resolveAndValidate: "О"/"0" según la plantilla, región y ceros
 *
 * Cada etapa lanza una subclase de PlateError al rechazar la entrada.
 * No guarda estado: puede usarse desde varios hilos sin sincronización.
 */
class PlateNormalizer {
public:
    /**
     * Normalizar una placa escrita a mano
     *
     * @param raw_text Texto en UTF-8
     * @param preferred Patrones preferidos ("X999XX99", ...) para resolver
     *                  entradas compatibles con varias plantillas
     * @return Placa canónica, p. ej. "О001ОО102"
     * @throws UnknownFormatError, InvalidCharacterError, InvalidFormatError,
     *         AllZeroSequenceError, RegionFirstDigitZeroError
     */
    static std::string normalize(const std::string& raw_text,
                                 const std::vector<std::string>& preferred = std::vector<std::string>());

    static std::string normalize(const char* raw_text,
                                 const std::vector<std::string>& preferred = std::vector<std::string>());

    /**
     * Normalizar una placa dada como número entero (p. ej. 12340078)
     *
     * Solo participa en la resolución para tipos enteros que no son bool
     * ni de carácter; con cualquier otro tipo no hay sobrecarga viable y
     * la llamada no compila.
     */
    template <typename T,
              typename std::enable_if<std::is_integral<T>::value &&
                                      !std::is_same<T, bool>::value &&
                                      !std::is_same<T, char>::value &&
                                      !std::is_same<T, signed char>::value &&
                                      !std::is_same<T, unsigned char>::value &&
                                      !std::is_same<T, wchar_t>::value &&
                                      !std::is_same<T, char16_t>::value &&
                                      !std::is_same<T, char32_t>::value>::type* = nullptr>
    static std::string normalize(T value,
                                 const std::vector<std::string>& preferred = std::vector<std::string>()) {
        return normalize(std::to_string(value), preferred);
    }

    /**
     * Verificar si el texto se puede normalizar
     *
     * @return true si normalize() no lanza PlateError
     * @throws UnknownFormatError si algún patrón preferido no está en el catálogo
     */
    static bool isValidPlate(const std::string& raw_text,
                             const std::vector<std::string>& preferred = std::vector<std::string>());

    /**
     * Limpiar texto: sin espacios extremos, en mayúsculas y con las letras
     * latinas parecidas reemplazadas por cirílicas
     *
     * Nunca falla; los caracteres ilegales se rechazan en la etapa siguiente.
     */
    static std::string sanitize(const std::string& raw_text);

    /**
     * Comprobar que todos los caracteres pertenecen al alfabeto permitido
     *
     * @return El mismo texto
     * @throws InvalidCharacterError con el primer carácter inválido
     */
    static std::string validateCharacters(const std::string& sanitized);

    /**
     * Forma abstracta del texto validado
     */
    static PlateShape buildShape(const std::string& validated);

    /**
     * Elegir la plantilla compatible con el texto validado
     *
     * @throws InvalidFormatError si ninguna plantilla es compatible
     */
    static const PlateFormat& matchFormat(const std::string& validated,
                                          const std::vector<std::string>& preferred = std::vector<std::string>());

    /**
     * Resolver los caracteres ambiguos según la plantilla y validar
     * región y series
     *
     * @throws AllZeroSequenceError si una serie o la región es solo ceros
     * @throws RegionFirstDigitZeroError si la región de 3 dígitos empieza por cero
     */
    static std::string resolveAndValidate(const std::string& validated, const PlateFormat& format);
};

} // namespace gosnomer

#endif // GOSNOMER_PLATE_NORMALIZER_H
