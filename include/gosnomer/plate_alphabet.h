#ifndef GOSNOMER_PLATE_ALPHABET_H
#define GOSNOMER_PLATE_ALPHABET_H

#include <string>
#include <vector>
#include <map>

namespace gosnomer {

/**
 * Alfabeto de las placas rusas (ГОСТ Р 50577-2018)
 *
 * Letras: solo las 12 cirílicas con equivalente visual latino
 *         (А В Е К М Н О Р С Т У Х)
 * Números: 0-9
 *
 * "О" cirílica y el dígito "0" se confunden al teclear y se tratan como
 * un mismo carácter ambiguo.
 */
class PlateAlphabet {
public:
    // Letra cirílica ambigua "О" y dígito ambiguo "0"
    static constexpr char32_t AMBIGUOUS_LETTER = 0x041E;
    static constexpr char32_t AMBIGUOUS_DIGIT = U'0';

    /**
     * Letras permitidas, en orden de declaración
     *
     * @return Cadenas UTF-8 de un carácter
     */
    static const std::vector<std::string>& allowedLetters();

    /**
     * Dígitos permitidos "0".."9"
     */
    static const std::vector<std::string>& allowedNumbers();

    /**
     * Unión de letras y dígitos permitidos (letras primero)
     */
    static const std::vector<std::string>& allowedSymbols();

    static bool isAllowedLetter(char32_t c);
    static bool isAllowedNumber(char32_t c);
    static bool isAllowedSymbol(char32_t c);

    /**
     * Verificar si el carácter es "О" o "0"
     */
    static bool isAmbiguous(char32_t c);

    /**
     * Equivalente cirílico de una letra latina parecida
     *
     * @param c Letra latina en mayúscula
     * @return Letra cirílica, o el mismo carácter si no tiene equivalente
     */
    static char32_t cyrillicLookAlike(char32_t c);

    /**
     * Tabla completa latina -> cirílica
     */
    static const std::map<char32_t, char32_t>& latinLookAlikes();
};

} // namespace gosnomer

#endif // GOSNOMER_PLATE_ALPHABET_H
