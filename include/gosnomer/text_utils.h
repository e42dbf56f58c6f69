#ifndef GOSNOMER_TEXT_UTILS_H
#define GOSNOMER_TEXT_UTILS_H

#include <string>
#include <cstddef>

namespace gosnomer {

/**
 * Utilidades de texto UTF-8 para el procesamiento de placas
 *
 * Las placas rusas mezclan letras cirílicas (2 bytes en UTF-8) con dígitos
 * ASCII, por lo que todo el análisis se hace sobre code points.
 */
namespace text {

// Carácter de reemplazo para secuencias UTF-8 inválidas
const char32_t REPLACEMENT_CHAR = 0xFFFD;

/**
 * Longitud de una secuencia UTF-8 según su primer byte
 *
 * @param first_byte Primer byte de la secuencia
 * @return Longitud en bytes (1-4), o 0 si el byte no puede iniciar una secuencia
 */
size_t utf8SequenceLength(unsigned char first_byte);

/**
 * Decodificar texto UTF-8 a code points
 *
 * Nunca falla: cada byte inválido se convierte en REPLACEMENT_CHAR.
 *
 * @param text Texto en UTF-8
 * @return Secuencia de code points
 */
std::u32string decodeUtf8(const std::string& text);

/**
 * Codificar un code point en UTF-8
 */
std::string encodeUtf8(char32_t code_point);

/**
 * Codificar una secuencia de code points en UTF-8
 */
std::string encodeUtf8(const std::u32string& text);

/**
 * Verificar si un code point es espacio en blanco (ASCII o Unicode)
 */
bool isWhitespace(char32_t c);

/**
 * Quitar espacios al inicio y al final (los interiores se conservan)
 */
std::u32string trim(const std::u32string& text);

/**
 * Pasar a mayúsculas letras latinas y cirílicas
 *
 * Otros code points se devuelven sin cambios.
 */
char32_t toUpper(char32_t c);

} // namespace text

} // namespace gosnomer

#endif // GOSNOMER_TEXT_UTILS_H
