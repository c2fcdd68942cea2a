#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

/**
 * @brief A file on the local filesystem picked for upload
 */
struct LocalFile {
    std::string path;
    std::optional<std::string> fileName;    ///< Overrides the name derived from the path
    std::optional<std::string> contentType; ///< Overrides the type inferred from the extension
};

/**
 * @brief An attachment ready to be embedded in a SendMessage invocation
 */
struct EncodedAttachment {
    std::string fileName;
    std::string encodedContent; ///< Standard padded Base64 of the raw bytes
    std::string contentType;
};

namespace AttachmentEncoder {

using ProgressCallback = std::function<void(int percent)>;

constexpr uint64_t kDefaultMaxBytes = 10 * 1024 * 1024;
constexpr const char *kFallbackContentType = "image/jpeg";

/**
 * @brief Read and Base64-encode a local file
 * @param file File to encode
 * @param token Temporary token of the send; its suffix names the file when no name is known
 * @param out Encoded attachment on success
 * @param error Reason on failure (missing, directory, too large, unreadable)
 * @param onProgress Optional, called with 0..100 as chunks are read
 * @param maxBytes Size limit
 * @return true on success
 */
bool encode(const LocalFile &file, const std::string &token, EncodedAttachment &out, std::string &error,
            const ProgressCallback &onProgress = nullptr, uint64_t maxBytes = kDefaultMaxBytes);

/**
 * @brief MIME type for a file name's extension, or std::nullopt if unknown
 */
std::optional<std::string> contentTypeFor(const std::string &fileName);

/**
 * @brief Name used when neither the caller nor the path supplies one ("image_<suffix>.jpg")
 */
std::string fallbackFileName(const std::string &token);

} // namespace AttachmentEncoder
