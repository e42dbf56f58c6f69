#include "gosnomer/plate_alphabet.h"
#include "gosnomer/text_utils.h"

namespace gosnomer {

namespace {

const char32_t LETTERS[] = U"АВЕКМНОРСТУХ";
const char32_t NUMBERS[] = U"0123456789";

std::vector<std::string> splitToUtf8(const std::u32string& chars) {
    std::vector<std::string> result;
    result.reserve(chars.length());
    for (char32_t c : chars) {
        result.push_back(text::encodeUtf8(c));
    }
    return result;
}

} // namespace

const std::vector<std::string>& PlateAlphabet::allowedLetters() {
    static const std::vector<std::string> letters = splitToUtf8(LETTERS);
    return letters;
}

const std::vector<std::string>& PlateAlphabet::allowedNumbers() {
    static const std::vector<std::string> numbers = splitToUtf8(NUMBERS);
    return numbers;
}

const std::vector<std::string>& PlateAlphabet::allowedSymbols() {
    static const std::vector<std::string> symbols = splitToUtf8(std::u32string(LETTERS) + NUMBERS);
    return symbols;
}

bool PlateAlphabet::isAllowedLetter(char32_t c) {
    for (const char32_t* letter = LETTERS; *letter != 0; ++letter) {
        if (*letter == c) {
            return true;
        }
    }
    return false;
}

bool PlateAlphabet::isAllowedNumber(char32_t c) {
    return c >= U'0' && c <= U'9';
}

bool PlateAlphabet::isAllowedSymbol(char32_t c) {
    return isAllowedLetter(c) || isAllowedNumber(c);
}

bool PlateAlphabet::isAmbiguous(char32_t c) {
    return c == AMBIGUOUS_LETTER || c == AMBIGUOUS_DIGIT;
}

const std::map<char32_t, char32_t>& PlateAlphabet::latinLookAlikes() {
    // Solo letras latinas cuyo equivalente cirílico es una letra permitida
    static const std::map<char32_t, char32_t> table = {
        {U'A', U'А'}, {U'B', U'В'}, {U'C', U'С'}, {U'E', U'Е'},
        {U'H', U'Н'}, {U'K', U'К'}, {U'M', U'М'}, {U'O', U'О'},
        {U'P', U'Р'}, {U'T', U'Т'}, {U'X', U'Х'}, {U'Y', U'У'}
    };
    return table;
}

char32_t PlateAlphabet::cyrillicLookAlike(char32_t c) {
    const std::map<char32_t, char32_t>& table = latinLookAlikes();
    std::map<char32_t, char32_t>::const_iterator it = table.find(c);
    if (it == table.end()) {
        return c;
    }
    return it->second;
}

} // namespace gosnomer
