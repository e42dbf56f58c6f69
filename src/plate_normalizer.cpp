#include "gosnomer/plate_normalizer.h"
#include "gosnomer/plate_alphabet.h"
#include "gosnomer/plate_errors.h"
#include "gosnomer/text_utils.h"

namespace gosnomer {

std::string PlateNormalizer::normalize(const std::string& raw_text,
                                       const std::vector<std::string>& preferred) {
    FormatCatalog::checkPreferred(preferred);

    const std::string validated = validateCharacters(sanitize(raw_text));
    const PlateFormat& format = matchFormat(validated, preferred);
    return resolveAndValidate(validated, format);
}

std::string PlateNormalizer::normalize(const char* raw_text,
                                       const std::vector<std::string>& preferred) {
    return normalize(std::string(raw_text != nullptr ? raw_text : ""), preferred);
}

bool PlateNormalizer::isValidPlate(const std::string& raw_text,
                                   const std::vector<std::string>& preferred) {
    // Un patrón preferido desconocido es error del llamador, no de la placa
    FormatCatalog::checkPreferred(preferred);

    try {
        return !normalize(raw_text, preferred).empty();
    } catch (const PlateError&) {
        return false;
    }
}

std::string PlateNormalizer::sanitize(const std::string& raw_text) {
    std::u32string chars = text::trim(text::decodeUtf8(raw_text));

    for (char32_t& c : chars) {
        c = PlateAlphabet::cyrillicLookAlike(text::toUpper(c));
    }

    return text::encodeUtf8(chars);
}

std::string PlateNormalizer::validateCharacters(const std::string& sanitized) {
    const std::u32string chars = text::decodeUtf8(sanitized);

    for (size_t i = 0; i < chars.length(); ++i) {
        if (!PlateAlphabet::isAllowedSymbol(chars[i])) {
            throw InvalidCharacterError(chars[i], i);
        }
    }

    return sanitized;
}

PlateShape PlateNormalizer::buildShape(const std::string& validated) {
    const std::u32string chars = text::decodeUtf8(validated);

    PlateShape shape;
    shape.reserve(chars.length());

    for (size_t i = 0; i < chars.length(); ++i) {
        const char32_t c = chars[i];
        if (PlateAlphabet::isAmbiguous(c)) {
            shape.push_back(ShapeSymbol::Ambiguous);
        } else if (PlateAlphabet::isAllowedLetter(c)) {
            shape.push_back(ShapeSymbol::Letter);
        } else if (PlateAlphabet::isAllowedNumber(c)) {
            shape.push_back(ShapeSymbol::Digit);
        } else {
            throw InvalidCharacterError(c, i);
        }
    }

    return shape;
}

const PlateFormat& PlateNormalizer::matchFormat(const std::string& validated,
                                                const std::vector<std::string>& preferred) {
    return FormatCatalog::select(buildShape(validated), preferred);
}

std::string PlateNormalizer::resolveAndValidate(const std::string& validated, const PlateFormat& format) {
    std::u32string chars = text::decodeUtf8(validated);

    const PlateShape shape = buildShape(validated);
    if (!FormatCatalog::isCompatible(format, shape)) {
        throw InvalidFormatError(shape);
    }

    // Segunda pasada: cada "О"/"0" toma el tipo que exige la plantilla
    for (size_t i = 0; i < chars.length(); ++i) {
        if (PlateAlphabet::isAmbiguous(chars[i])) {
            chars[i] = format.slotAt(i) == SlotKind::Digit
                ? PlateAlphabet::AMBIGUOUS_DIGIT
                : PlateAlphabet::AMBIGUOUS_LETTER;
        }
    }

    const std::vector<DigitSequence> sequences = format.digitSequences();

    // Series y región sin dígitos distintos de cero
    for (const auto& sequence : sequences) {
        const std::u32string digits = chars.substr(sequence.start, sequence.length);
        if (digits.find_first_not_of(U'0') == std::u32string::npos) {
            throw AllZeroSequenceError(text::encodeUtf8(digits), sequence.start, sequence.is_region);
        }
    }

    // La región es siempre la última secuencia
    const DigitSequence& region = sequences.back();
    if (region.length == 3 && chars[region.start] == U'0') {
        throw RegionFirstDigitZeroError(text::encodeUtf8(chars.substr(region.start, region.length)));
    }

    return text::encodeUtf8(chars);
}

} // namespace gosnomer
