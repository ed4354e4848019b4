// ==============================================================================
// collector/classifier.hpp - Binary/text эвристика
// ==============================================================================
//
// Назначение:
// - Решение "бинарный или текст" по префиксу байтов файла
// - NUL в первых 1024 байтах -> бинарный
// - Иначе доля "нетекстовых" байтов > 0.30 -> бинарный
//
// Чистая функция от префикса, без I/O.
//
// ==============================================================================

#ifndef COLLECTOR_CLASSIFIER_HPP
#define COLLECTOR_CLASSIFIER_HPP

#include <cstddef>
#include <string_view>

namespace collector::content {

enum class Classification { Text, Binary };

/// Сколько байтов выборки анализируется
constexpr std::size_t kBinarySniffBytes = 1024;

/// Порог доли нетекстовых байтов
constexpr double kMaxNonTextRatio = 0.30;

/// Входит ли байт в допустимое множество
/// (0x20..0xFF плюс BEL, BS, TAB, LF, FF, CR, ESC)
bool is_text_byte(unsigned char b);

/// Классифицировать выборку; пустая выборка - текст
Classification classify(std::string_view sample);

/// Сокращение: classify(sample) == Classification::Binary
bool looks_binary(std::string_view sample);

const char* classification_to_string(Classification c);

}  // namespace collector::content

#endif  // COLLECTOR_CLASSIFIER_HPP
