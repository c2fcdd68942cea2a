#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace Base64 {

std::string encode(const uint8_t *data, size_t len);
std::string encode(const std::vector<uint8_t> &data);
std::string encode(const std::string &data);

/**
 * @brief Decode standard or URL-safe Base64; padding is optional
 * @return false if the input holds characters outside both alphabets
 */
bool decode(const std::string &input, std::vector<uint8_t> &out);

/**
 * @brief Streaming encoder for data that arrives in chunks
 * Bytes that do not fill a complete 3-byte group are carried to the next call.
 */
class Encoder {
  public:
    void update(const uint8_t *data, size_t len);
    std::string finish();

    size_t encodedSize() const { return m_out.size(); }

  private:
    std::string m_out;
    uint8_t m_carry[2] = {0, 0};
    size_t m_carryLen = 0;
};

} // namespace Base64
