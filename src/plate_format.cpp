#include "gosnomer/plate_format.h"
#include "gosnomer/plate_errors.h"

#include <algorithm>

namespace gosnomer {

SlotKind PlateFormat::slotAt(size_t index) const {
    return pattern.at(index) == FormatCatalog::DIGIT_PLACEHOLDER ? SlotKind::Digit : SlotKind::Letter;
}

std::vector<DigitSequence> PlateFormat::digitSequences() const {
    std::vector<DigitSequence> sequences;
    const size_t region_start = length() - region_length;

    size_t i = 0;
    while (i < region_start) {
        if (slotAt(i) != SlotKind::Digit) {
            ++i;
            continue;
        }

        // La serie termina en una letra o donde empieza la región
        size_t end = i;
        while (end < region_start && slotAt(end) == SlotKind::Digit) {
            ++end;
        }
        sequences.push_back(DigitSequence(i, end - i, false));
        i = end;
    }

    sequences.push_back(DigitSequence(region_start, region_length, true));
    return sequences;
}

const std::vector<PlateFormat>& FormatCatalog::formats() {
    // Tipos 1, 1Б, 2, 3 y 4Б de ГОСТ Р 50577-2018
    static const std::vector<PlateFormat> catalog = {
        {"X999XX99",  "1",  "Легковые, грузовые автомобили и автобусы", 2},
        {"X999XX999", "1",  "Легковые, грузовые автомобили и автобусы (трехзначный регион)", 3},
        {"XX99999",   "1Б", "Легковые такси", 2},
        {"XX999999",  "2",  "Автомобильные прицепы и полуприцепы", 2},
        {"9999XX99",  "3",  "Тракторы, самоходные дорожно-строительные и иные машины", 2},
        {"XX99XX99",  "4Б", "Мопеды", 2}
    };
    return catalog;
}

const std::vector<std::string>& FormatCatalog::allowedFormats() {
    static const std::vector<std::string> patterns = [] {
        std::vector<std::string> result;
        for (const auto& format : formats()) {
            result.push_back(format.pattern);
        }
        return result;
    }();
    return patterns;
}

const PlateFormat* FormatCatalog::find(const std::string& pattern) {
    for (const auto& format : formats()) {
        if (format.pattern == pattern) {
            return &format;
        }
    }
    return nullptr;
}

bool FormatCatalog::isCompatible(const PlateFormat& format, const PlateShape& shape) {
    if (format.length() != shape.size()) {
        return false;
    }

    for (size_t i = 0; i < shape.size(); ++i) {
        switch (shape[i]) {
            case ShapeSymbol::Ambiguous:
                break;
            case ShapeSymbol::Letter:
                if (format.slotAt(i) != SlotKind::Letter) {
                    return false;
                }
                break;
            case ShapeSymbol::Digit:
                if (format.slotAt(i) != SlotKind::Digit) {
                    return false;
                }
                break;
        }
    }

    return true;
}

std::vector<const PlateFormat*> FormatCatalog::compatibleFormats(const PlateShape& shape) {
    std::vector<const PlateFormat*> result;
    for (const auto& format : formats()) {
        if (isCompatible(format, shape)) {
            result.push_back(&format);
        }
    }
    return result;
}

void FormatCatalog::checkPreferred(const std::vector<std::string>& preferred) {
    std::vector<std::string> unknown;
    for (const auto& pattern : preferred) {
        if (find(pattern) == nullptr &&
            std::find(unknown.begin(), unknown.end(), pattern) == unknown.end()) {
            unknown.push_back(pattern);
        }
    }

    if (!unknown.empty()) {
        throw UnknownFormatError(unknown);
    }
}

const PlateFormat& FormatCatalog::select(const PlateShape& shape,
                                         const std::vector<std::string>& preferred) {
    checkPreferred(preferred);

    const std::vector<const PlateFormat*> candidates = compatibleFormats(shape);
    if (candidates.empty()) {
        throw InvalidFormatError(shape);
    }

    for (const auto& pattern : preferred) {
        for (const PlateFormat* candidate : candidates) {
            if (candidate->pattern == pattern) {
                return *candidate;
            }
        }
    }

    return *candidates.front();
}

std::string FormatCatalog::renderShape(const PlateShape& shape) {
    std::string rendered;
    rendered.reserve(shape.size());

    for (ShapeSymbol symbol : shape) {
        switch (symbol) {
            case ShapeSymbol::Letter:
                rendered += LETTER_PLACEHOLDER;
                break;
            case ShapeSymbol::Digit:
                rendered += DIGIT_PLACEHOLDER;
                break;
            case ShapeSymbol::Ambiguous:
                rendered += WILDCARD_PLACEHOLDER;
                break;
        }
    }

    return rendered;
}

PlateShape FormatCatalog::parseShape(const std::string& rendered) {
    PlateShape shape;
    shape.reserve(rendered.length());

    for (char c : rendered) {
        if (c == LETTER_PLACEHOLDER) {
            shape.push_back(ShapeSymbol::Letter);
        } else if (c == DIGIT_PLACEHOLDER) {
            shape.push_back(ShapeSymbol::Digit);
        } else if (c == WILDCARD_PLACEHOLDER) {
            shape.push_back(ShapeSymbol::Ambiguous);
        } else {
            throw std::invalid_argument("Marcador de forma desconocido: '" + std::string(1, c) + "'");
        }
    }

    return shape;
}

} // namespace gosnomer
