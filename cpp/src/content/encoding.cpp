// ==============================================================================
// encoding.cpp - Определение кодировки и декодирование в UTF-8
// ==============================================================================
//
// Собственные декодеры без внешних библиотек (как utf16le_to_utf8 в
// analyse-модулях): строгий UTF-8 по таблице 3-7 Unicode, UTF-16 с
// суррогатными парами, Latin-1 и таблица Windows-1252.
//
// ==============================================================================

#include "collector/encoding.hpp"

#include <utility>

namespace collector::content {

namespace {

constexpr std::uint32_t kReplacementChar = 0xFFFD;

inline unsigned char byte_at(std::string_view data, std::size_t i) {
    return static_cast<unsigned char>(data[i]);
}

// ----------------------------------------------------------------------------
// UTF-8: разбор одной последовательности
// ----------------------------------------------------------------------------

struct Utf8Step {
    std::size_t length = 1;  // корректная длина или длина некорректной подчасти
    bool valid = false;
    bool truncated = false;  // данные кончились внутри последовательности
};

Utf8Step utf8_step(std::string_view data, std::size_t i) {
    const unsigned char b0 = byte_at(data, i);
    if (b0 < 0x80) {
        return {1, true, false};
    }

    std::size_t need = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        need = 1;
    } else if (b0 == 0xE0) {
        need = 2;
        lo = 0xA0;  // без overlong
    } else if ((b0 >= 0xE1 && b0 <= 0xEC) || b0 == 0xEE || b0 == 0xEF) {
        need = 2;
    } else if (b0 == 0xED) {
        need = 2;
        hi = 0x9F;  // без суррогатов
    } else if (b0 == 0xF0) {
        need = 3;
        lo = 0x90;
    } else if (b0 >= 0xF1 && b0 <= 0xF3) {
        need = 3;
    } else if (b0 == 0xF4) {
        need = 3;
        hi = 0x8F;  // не выше U+10FFFF
    } else {
        // 0x80..0xC1, 0xF5..0xFF
        return {1, false, false};
    }

    for (std::size_t k = 1; k <= need; ++k) {
        if (i + k >= data.size()) {
            return {k, false, true};
        }
        const unsigned char b = byte_at(data, i + k);
        if (b < lo || b > hi) {
            return {k, false, false};
        }
        lo = 0x80;
        hi = 0xBF;
    }
    return {need + 1, true, false};
}

// ----------------------------------------------------------------------------
// UTF-16
// ----------------------------------------------------------------------------

std::optional<std::string> decode_utf16(std::string_view data, bool big_endian) {
    if (data.size() % 2 != 0) {
        return std::nullopt;
    }

    std::string result;
    result.reserve(data.size());

    auto unit_at = [&](std::size_t i) -> std::uint16_t {
        const auto a = byte_at(data, i);
        const auto b = byte_at(data, i + 1);
        return big_endian ? static_cast<std::uint16_t>((a << 8) | b)
                          : static_cast<std::uint16_t>((b << 8) | a);
    };

    for (std::size_t i = 0; i < data.size(); i += 2) {
        const std::uint16_t unit = unit_at(i);

        if (unit >= 0xD800 && unit <= 0xDBFF) {
            // Старший суррогат: нужна пара
            if (i + 3 >= data.size()) {
                return std::nullopt;
            }
            const std::uint16_t low = unit_at(i + 2);
            if (low < 0xDC00 || low > 0xDFFF) {
                return std::nullopt;
            }
            const std::uint32_t cp =
                0x10000 + ((static_cast<std::uint32_t>(unit) - 0xD800) << 10) + (low - 0xDC00);
            append_utf8(result, cp);
            i += 2;
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            // Одиночный младший суррогат
            return std::nullopt;
        } else {
            append_utf8(result, unit);
        }
    }
    return result;
}

/// UTF-16 без BOM принимается только при наличии NUL-байта: без него
/// чётная по длине Latin-1/CP1252 строка "декодировалась бы" в CJK-мусор
bool plausible_bomless_utf16(std::string_view data) {
    return data.find('\0') != std::string_view::npos;
}

// ----------------------------------------------------------------------------
// Однобайтовые кодировки
// ----------------------------------------------------------------------------

std::string decode_latin1(std::string_view data) {
    std::string result;
    result.reserve(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        append_utf8(result, byte_at(data, i));
    }
    return result;
}

// 0x80..0x9F; 0 - неопределённая позиция
constexpr std::uint16_t kCp1252High[32] = {
    0x20AC, 0x0000, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,  // 80..87
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x0000, 0x017D, 0x0000,  // 88..8F
    0x0000, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,  // 90..97
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x0000, 0x017E, 0x0178,  // 98..9F
};

std::optional<std::string> decode_cp1252(std::string_view data) {
    std::string result;
    result.reserve(data.size());
    for (std::size_t i = 0; i < data.size(); ++i) {
        const unsigned char b = byte_at(data, i);
        if (b >= 0x80 && b <= 0x9F) {
            const std::uint16_t cp = kCp1252High[b - 0x80];
            if (cp == 0) {
                return std::nullopt;
            }
            append_utf8(result, cp);
        } else {
            append_utf8(result, b);
        }
    }
    return result;
}

bool starts_with(std::string_view data, std::string_view prefix) {
    return data.size() >= prefix.size() && data.substr(0, prefix.size()) == prefix;
}

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";
constexpr std::string_view kUtf16LeBom = "\xFF\xFE";
constexpr std::string_view kUtf16BeBom = "\xFE\xFF";

}  // namespace

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool is_valid_utf8(std::string_view data) {
    std::size_t i = 0;
    while (i < data.size()) {
        const Utf8Step step = utf8_step(data, i);
        if (!step.valid) {
            return false;
        }
        i += step.length;
    }
    return true;
}

std::size_t incomplete_utf8_tail(std::string_view data) {
    if (data.empty()) {
        return 0;
    }

    // Ищем начало последней последовательности (не дальше 3 байт от конца)
    std::size_t start = data.size() - 1;
    std::size_t back = 0;
    while (back < 3 && start > 0 && (byte_at(data, start) & 0xC0) == 0x80) {
        --start;
        ++back;
    }

    const Utf8Step step = utf8_step(data, start);
    if (!step.valid && step.truncated && start + step.length == data.size()) {
        return data.size() - start;
    }
    return 0;
}

std::string decode_lossy_utf8(std::string_view data) {
    std::string result;
    result.reserve(data.size());

    std::size_t i = 0;
    while (i < data.size()) {
        const Utf8Step step = utf8_step(data, i);
        if (step.valid) {
            result.append(data.data() + i, step.length);
        } else {
            append_utf8(result, kReplacementChar);
        }
        i += step.length;
    }
    return result;
}

// ----------------------------------------------------------------------------
// Encoding
// ----------------------------------------------------------------------------

const char* encoding_label(Encoding enc) {
    switch (enc) {
    case Encoding::Utf8:
        return "utf-8";
    case Encoding::Utf8Sig:
        return "utf-8-sig";
    case Encoding::Utf16:
        return "utf-16";
    case Encoding::Utf16Le:
        return "utf-16-le";
    case Encoding::Utf16Be:
        return "utf-16-be";
    case Encoding::Latin1:
        return "latin-1";
    case Encoding::Cp1252:
        return "cp1252";
    }
    return "unknown";
}

std::optional<std::string> decode_as(Encoding enc, std::string_view data) {
    switch (enc) {
    case Encoding::Utf8:
        if (!is_valid_utf8(data)) {
            return std::nullopt;
        }
        return std::string(data);

    case Encoding::Utf8Sig: {
        std::string_view body = starts_with(data, kUtf8Bom) ? data.substr(kUtf8Bom.size()) : data;
        if (!is_valid_utf8(body)) {
            return std::nullopt;
        }
        return std::string(body);
    }

    case Encoding::Utf16:
        if (starts_with(data, kUtf16LeBom)) {
            return decode_utf16(data.substr(2), false);
        }
        if (starts_with(data, kUtf16BeBom)) {
            return decode_utf16(data.substr(2), true);
        }
        return std::nullopt;

    case Encoding::Utf16Le:
        if (!plausible_bomless_utf16(data)) {
            return std::nullopt;
        }
        return decode_utf16(data, false);

    case Encoding::Utf16Be:
        if (!plausible_bomless_utf16(data)) {
            return std::nullopt;
        }
        return decode_utf16(data, true);

    case Encoding::Latin1:
        return decode_latin1(data);

    case Encoding::Cp1252:
        return decode_cp1252(data);
    }
    return std::nullopt;
}

DecodeResult decode(std::string_view data) {
    for (Encoding enc : kEncodingPriority) {
        auto text = decode_as(enc, data);
        if (text.has_value()) {
            return DecodeResult{std::move(*text), encoding_label(enc)};
        }
    }
    return DecodeResult{decode_lossy_utf8(data), kLossyUtf8Label};
}

}  // namespace collector::content
