#include "gosnomer/plate_errors.h"
#include "gosnomer/text_utils.h"

namespace gosnomer {

namespace {

std::string quoted(const std::string& value) {
    return "\"" + value + "\"";
}

std::string joinQuoted(const std::vector<std::string>& values) {
    std::string result;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            result += ", ";
        }
        result += quoted(values[i]);
    }
    return result;
}

} // namespace

InvalidCharacterError::InvalidCharacterError(char32_t character, size_t position)
    : PlateError("Недопустимый символ: " + quoted(text::encodeUtf8(character)))
    , character_(character)
    , character_text_(text::encodeUtf8(character))
    , position_(position)
{
}

InvalidFormatError::InvalidFormatError(const PlateShape& shape)
    : PlateError("Недопустимый формат: " + quoted(FormatCatalog::renderShape(shape)))
    , shape_(shape)
{
}

std::string InvalidFormatError::renderedShape() const {
    return FormatCatalog::renderShape(shape_);
}

RegionFirstDigitZeroError::RegionFirstDigitZeroError(const std::string& region)
    : PlateError("Первая цифра трехзначного региона не может быть нулем: " + quoted(region))
    , region_(region)
{
}

AllZeroSequenceError::AllZeroSequenceError(const std::string& sequence, size_t position, bool is_region)
    : PlateError("Номер не может содержать числовые последовательности, состоящие только из нулей: " +
                 quoted(sequence))
    , sequence_(sequence)
    , position_(position)
    , is_region_(is_region)
{
}

UnknownFormatError::UnknownFormatError(const std::vector<std::string>& patterns)
    : PlateError("Параметр prefer содержит недопустимые форматы: " + joinQuoted(patterns))
    , patterns_(patterns)
{
}

} // namespace gosnomer
