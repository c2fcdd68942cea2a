#include "utils/Base64.h"

#include <utility>

namespace Base64 {

static constexpr const char *kEncTable = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int8_t decodeChar(unsigned char c) {
    if (c >= 'A' && c <= 'Z')
        return static_cast<int8_t>(c - 'A');
    if (c >= 'a' && c <= 'z')
        return static_cast<int8_t>(c - 'a' + 26);
    if (c >= '0' && c <= '9')
        return static_cast<int8_t>(c - '0' + 52);
    if (c == '+' || c == '-')
        return 62;
    if (c == '/' || c == '_')
        return 63;
    return -1;
}

static void encodeGroup(const uint8_t *in, size_t len, std::string &out) {
    uint32_t group = static_cast<uint32_t>(in[0]) << 16;
    if (len > 1)
        group |= static_cast<uint32_t>(in[1]) << 8;
    if (len > 2)
        group |= static_cast<uint32_t>(in[2]);

    out.push_back(kEncTable[(group >> 18) & 0x3F]);
    out.push_back(kEncTable[(group >> 12) & 0x3F]);
    out.push_back(len > 1 ? kEncTable[(group >> 6) & 0x3F] : '=');
    out.push_back(len > 2 ? kEncTable[group & 0x3F] : '=');
}

std::string encode(const uint8_t *data, size_t len) {
    Encoder encoder;
    encoder.update(data, len);
    return encoder.finish();
}

std::string encode(const std::vector<uint8_t> &data) { return encode(data.data(), data.size()); }

std::string encode(const std::string &data) {
    return encode(reinterpret_cast<const uint8_t *>(data.data()), data.size());
}

bool decode(const std::string &input, std::vector<uint8_t> &out) {
    out.clear();
    out.reserve(input.size() * 3 / 4);
    uint32_t buffer = 0;
    int bitsCollected = 0;
    for (unsigned char c : input) {
        if (c == '=')
            break;
        if (c == '\r' || c == '\n')
            continue;
        int8_t value = decodeChar(c);
        if (value < 0)
            return false;
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bitsCollected += 6;
        if (bitsCollected >= 8) {
            bitsCollected -= 8;
            out.push_back(static_cast<uint8_t>((buffer >> bitsCollected) & 0xFF));
        }
    }
    return true;
}

void Encoder::update(const uint8_t *data, size_t len) {
    size_t offset = 0;

    while (m_carryLen > 0 && m_carryLen < 3 && offset < len) {
        if (m_carryLen == 2) {
            const uint8_t group[3] = {m_carry[0], m_carry[1], data[offset++]};
            encodeGroup(group, 3, m_out);
            m_carryLen = 0;
        } else {
            m_carry[m_carryLen++] = data[offset++];
        }
    }

    while (offset + 3 <= len) {
        encodeGroup(data + offset, 3, m_out);
        offset += 3;
    }

    while (offset < len) {
        m_carry[m_carryLen++] = data[offset++];
    }
}

std::string Encoder::finish() {
    if (m_carryLen > 0) {
        encodeGroup(m_carry, m_carryLen, m_out);
        m_carryLen = 0;
    }
    std::string result = std::move(m_out);
    m_out.clear();
    return result;
}

} // namespace Base64
