// ==============================================================================
// collector/encoding.hpp - Определение кодировки и декодирование в UTF-8
// ==============================================================================
//
// Назначение:
// - Перебор фиксированного списка кодировок, первая без ошибок выигрывает
// - Fallback: UTF-8 с заменой некорректных последовательностей (U+FFFD)
// - Результат всегда корректный UTF-8; decode() не бросает исключений
//
// Порядок: utf-8, utf-8-sig, utf-16, utf-16-le, utf-16-be, latin-1, cp1252
//
// ==============================================================================

#ifndef COLLECTOR_ENCODING_HPP
#define COLLECTOR_ENCODING_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace collector::content {

// ----------------------------------------------------------------------------
// Encoding
// ----------------------------------------------------------------------------

enum class Encoding {
    Utf8,     // строгий UTF-8
    Utf8Sig,  // UTF-8 с BOM (EF BB BF), BOM отбрасывается
    Utf16,    // UTF-16 с BOM (FF FE / FE FF), BOM отбрасывается
    Utf16Le,  // UTF-16LE без BOM
    Utf16Be,  // UTF-16BE без BOM
    Latin1,   // ISO-8859-1, байт = кодовая точка
    Cp1252    // Windows-1252
};

/// Порядок попыток декодирования
constexpr std::array<Encoding, 7> kEncodingPriority = {
    Encoding::Utf8,    Encoding::Utf8Sig, Encoding::Utf16,  Encoding::Utf16Le,
    Encoding::Utf16Be, Encoding::Latin1,  Encoding::Cp1252,
};

/// Метка fallback-декодирования с заменой
constexpr const char* kLossyUtf8Label = "utf-8-replace";

/// "utf-8", "utf-8-sig", "utf-16", ...
const char* encoding_label(Encoding enc);

// ----------------------------------------------------------------------------
// Декодирование
// ----------------------------------------------------------------------------

struct DecodeResult {
    std::string text;      // UTF-8
    std::string encoding;  // метка успешной кодировки или kLossyUtf8Label
};

/// Декодировать данные в конкретной кодировке
/// @return std::nullopt, если данные в этой кодировке некорректны
std::optional<std::string> decode_as(Encoding enc, std::string_view data);

/// Перебрать kEncodingPriority, затем fallback с заменой
DecodeResult decode(std::string_view data);

/// UTF-8 с заменой каждой максимальной некорректной подчасти на U+FFFD
std::string decode_lossy_utf8(std::string_view data);

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Корректен ли data как строгий UTF-8
bool is_valid_utf8(std::string_view data);

/// Длина незавершённой (но корректной до обрыва) UTF-8 последовательности
/// в конце data: 0..3. Нужна для переноса хвоста на границе чанков.
std::size_t incomplete_utf8_tail(std::string_view data);

/// Дописать кодовую точку в out как UTF-8
void append_utf8(std::string& out, std::uint32_t code_point);

}  // namespace collector::content

#endif  // COLLECTOR_ENCODING_HPP
