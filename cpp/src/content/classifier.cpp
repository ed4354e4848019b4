// ==============================================================================
// classifier.cpp - Binary/text эвристика
// ==============================================================================

#include "collector/classifier.hpp"

#include <algorithm>
#include <array>

namespace collector::content {

namespace {

/// Таблица допустимых байтов, строится на этапе компиляции
constexpr std::array<bool, 256> make_text_table() {
    std::array<bool, 256> table{};
    for (std::size_t b = 0x20; b < 0x100; ++b) {
        table[b] = true;
    }
    table[0x07] = true;  // BEL
    table[0x08] = true;  // BS
    table[0x09] = true;  // TAB
    table[0x0A] = true;  // LF
    table[0x0C] = true;  // FF
    table[0x0D] = true;  // CR
    table[0x1B] = true;  // ESC
    return table;
}

constexpr std::array<bool, 256> kTextBytes = make_text_table();

}  // namespace

bool is_text_byte(unsigned char b) {
    return kTextBytes[b];
}

Classification classify(std::string_view sample) {
    if (sample.empty()) {
        return Classification::Text;
    }

    const std::string_view prefix = sample.substr(0, std::min(sample.size(), kBinarySniffBytes));

    if (prefix.find('\0') != std::string_view::npos) {
        return Classification::Binary;
    }

    std::size_t nontext = 0;
    for (char c : prefix) {
        if (!is_text_byte(static_cast<unsigned char>(c))) {
            ++nontext;
        }
    }

    const double ratio = static_cast<double>(nontext) / static_cast<double>(prefix.size());
    return ratio > kMaxNonTextRatio ? Classification::Binary : Classification::Text;
}

bool looks_binary(std::string_view sample) {
    return classify(sample) == Classification::Binary;
}

const char* classification_to_string(Classification c) {
    switch (c) {
    case Classification::Text:
        return "text";
    case Classification::Binary:
        return "binary";
    }
    return "unknown";
}

}  // namespace collector::content
