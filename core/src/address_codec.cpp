#include "localip/address_codec.hpp"
#include "localip/error.hpp"
#include <cstring>
#include <sstream>

namespace localip {

namespace {

// Returns the offset of the first byte that is not part of a well-formed
// UTF-8 sequence, or `length` when the whole buffer is valid.
size_t find_invalid_utf8(const uint8_t* data, size_t length) {
    size_t i = 0;
    while (i < length) {
        uint8_t lead = data[i];
        size_t extra = 0;
        uint32_t code_point = 0;

        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return i;
        }

        if (i + extra >= length) {
            return i;
        }
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cont = data[i + k];
            if ((cont & 0xC0) != 0x80) {
                return i;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }

        // Overlong forms, surrogates and values past U+10FFFF
        static const uint32_t min_value[] = {0, 0x80, 0x800, 0x10000};
        if (code_point < min_value[extra] ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return i;
        }

        i += extra + 1;
    }
    return length;
}

void append_utf8(std::string& out, uint32_t code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

} // anonymous namespace

NetworkAddress decode_ipv4_word(uint32_t raw, Endian target) {
    if (target == Endian::LITTLE) {
        raw = swap_bytes(raw);
    }
    return NetworkAddress::from_host_order(raw);
}

uint32_t encode_ipv4_word(const NetworkAddress& address, Endian target) {
    uint32_t value = address.to_host_order();
    return target == Endian::LITTLE ? swap_bytes(value) : value;
}

NetworkAddress decode_address_bytes(const uint8_t* data, size_t length) {
    if (length == 4) {
        NetworkAddress::V4Bytes octets;
        std::memcpy(octets.data(), data, octets.size());
        return NetworkAddress(octets);
    }
    if (length == 16) {
        NetworkAddress::V6Bytes bytes;
        std::memcpy(bytes.data(), data, bytes.size());
        return NetworkAddress(bytes);
    }
    throw Error::strategy_failure("Unexpected address payload length: " + std::to_string(length));
}

std::string parse_interface_name(const uint8_t* data, size_t length) {
    if (length > 0 && data[length - 1] == 0) {
        --length;
    }

    const void* nul = std::memchr(data, 0, length);
    if (nul != nullptr) {
        size_t offset = static_cast<const uint8_t*>(nul) - data;
        throw Error::invalid_name("interior NUL byte at offset " + std::to_string(offset));
    }

    size_t bad = find_invalid_utf8(data, length);
    if (bad != length) {
        std::ostringstream oss;
        oss << "invalid UTF-8 sequence at offset " << bad;
        throw Error::invalid_name(oss.str());
    }

    return std::string(reinterpret_cast<const char*>(data), length);
}

std::string parse_interface_name(const std::string& bytes) {
    return parse_interface_name(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

std::string parse_interface_name(const char* c_name) {
    if (c_name == nullptr) {
        throw Error::invalid_name("null name pointer");
    }
    return parse_interface_name(reinterpret_cast<const uint8_t*>(c_name), std::strlen(c_name));
}

std::string decode_utf16_name(const char16_t* units, size_t length) {
    std::string out;
    out.reserve(length);

    for (size_t i = 0; i < length; ++i) {
        uint32_t unit = units[i];
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 1 >= length || units[i + 1] < 0xDC00 || units[i + 1] > 0xDFFF) {
                throw Error::invalid_name("unpaired high surrogate at index " + std::to_string(i));
            }
            uint32_t low = units[++i];
            append_utf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            throw Error::invalid_name("unpaired low surrogate at index " + std::to_string(i));
        } else {
            append_utf8(out, unit);
        }
    }

    return out;
}

std::string decode_utf16_name(const char16_t* nul_terminated) {
    if (nul_terminated == nullptr) {
        throw Error::invalid_name("null name pointer");
    }
    size_t length = 0;
    while (nul_terminated[length] != u'\0') {
        ++length;
    }
    return decode_utf16_name(nul_terminated, length);
}

} // namespace localip
