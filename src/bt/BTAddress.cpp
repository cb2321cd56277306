#include "bt/BTAddress.hpp"
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

//---------------------------------------------------------------------------
namespace bt {
//---------------------------------------------------------------------------
constexpr size_t ADDR_BYTE_COUNT = 6;
constexpr size_t ADDR_HEX_COUNT = ADDR_BYTE_COUNT * 2;

std::optional<uint8_t> get_hex_char_val(char c) {
    uint8_t i = static_cast<uint8_t>(std::toupper(static_cast<unsigned char>(c)));
    if (i >= 0x30 && i <= 0x39) {
        return i - 0x30;
    }
    if (i >= 0x41 && i <= 0x46) {
        return i - 0x41 + 10;
    }
    return std::nullopt;
}

/**
 * Returns the length of the hex digit groups for the given separator or 0 for unknown separators.
 **/
size_t get_group_len(char separator) {
    switch (separator) {
        case ':':
        case '-':
            return 2;
        case '.':
            return 4;
        default:
            return 0;
    }
}

bool normalize_address(const std::string& addr, std::string* result) {
    std::array<uint8_t, ADDR_HEX_COUNT> nibbles{};
    size_t count = 0;

    if (addr.size() == ADDR_HEX_COUNT) {
        for (char c : addr) {
            std::optional<uint8_t> val = get_hex_char_val(c);
            if (!val) {
                return false;
            }
            nibbles[count++] = *val;
        }
    } else {
        if (addr.size() < 5) {
            return false;
        }
        // "AA:BB:..." or "AABB.CCDD...", the separator has to be the same everywhere:
        char separator = addr[2];
        size_t groupLen = get_group_len(separator);
        if (groupLen != 2) {
            separator = addr[4];
            groupLen = get_group_len(separator);
            if (groupLen != 4) {
                return false;
            }
        }
        const size_t groupCount = ADDR_HEX_COUNT / groupLen;
        if (addr.size() != ADDR_HEX_COUNT + groupCount - 1) {
            return false;
        }
        for (size_t i = 0; i < addr.size(); i++) {
            if ((i + 1) % (groupLen + 1) == 0) {
                if (addr[i] != separator) {
                    return false;
                }
                continue;
            }
            std::optional<uint8_t> val = get_hex_char_val(addr[i]);
            if (!val) {
                return false;
            }
            nibbles[count++] = *val;
        }
    }

    static const std::array<char, 16> HEX_CHARS{'0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'A', 'B', 'C', 'D', 'E', 'F'};
    std::string normalized;
    normalized.reserve(ADDR_HEX_COUNT + ADDR_BYTE_COUNT - 1);
    for (size_t i = 0; i < ADDR_HEX_COUNT; i++) {
        if (i > 0 && i % 2 == 0) {
            normalized += ':';
        }
        normalized += HEX_CHARS[nibbles[i]];
    }
    *result = std::move(normalized);
    return true;
}

bool is_normalized_address(const std::string& addr) {
    std::string normalized;
    return normalize_address(addr, &normalized) && normalized == addr;
}
//---------------------------------------------------------------------------
}  // namespace bt
//---------------------------------------------------------------------------
