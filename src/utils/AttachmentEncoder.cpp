#include "utils/AttachmentEncoder.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>
#include <vector>

#include "utils/Base64.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {

constexpr size_t kChunkSize = 64 * 1024;

const std::array<std::pair<const char *, const char *>, 17> kMimeTypes = {{
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"png", "image/png"},
    {"gif", "image/gif"},
    {"webp", "image/webp"},
    {"bmp", "image/bmp"},
    {"heic", "image/heic"},
    {"pdf", "application/pdf"},
    {"doc", "application/msword"},
    {"docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
    {"xls", "application/vnd.ms-excel"},
    {"xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
    {"ppt", "application/vnd.ms-powerpoint"},
    {"pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
    {"txt", "text/plain"},
    {"csv", "text/csv"},
    {"zip", "application/zip"},
}};

} // namespace

namespace AttachmentEncoder {

std::optional<std::string> contentTypeFor(const std::string &fileName) {
    const size_t dot = fileName.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= fileName.size()) {
        return std::nullopt;
    }

    std::string ext = fileName.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto &entry : kMimeTypes) {
        if (ext == entry.first) {
            return std::string(entry.second);
        }
    }
    return std::nullopt;
}

std::string fallbackFileName(const std::string &token) {
    const size_t colon = token.find_last_of(':');
    std::string suffix = colon == std::string::npos ? token : token.substr(colon + 1);
    if (suffix.empty()) {
        suffix = "attachment";
    }
    return "image_" + suffix + ".jpg";
}

bool encode(const LocalFile &file, const std::string &token, EncodedAttachment &out, std::string &error,
            const ProgressCallback &onProgress, uint64_t maxBytes) {
    std::error_code ec;
    const fs::path path(file.path);

    if (file.path.empty() || !fs::exists(path, ec)) {
        error = "File not found: " + file.path;
        return false;
    }
    if (fs::is_directory(path, ec)) {
        error = "Not a regular file: " + file.path;
        return false;
    }

    const uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        error = "Cannot determine size of " + file.path + ": " + ec.message();
        return false;
    }
    if (size > maxBytes) {
        error = "File too large (" + std::to_string(size) + " bytes, limit " + std::to_string(maxBytes) + ")";
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        error = "Cannot open " + file.path;
        return false;
    }

    Base64::Encoder encoder;
    std::vector<char> buffer(kChunkSize);
    uintmax_t consumed = 0;

    if (onProgress) {
        onProgress(0);
    }

    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        encoder.update(reinterpret_cast<const uint8_t *>(buffer.data()), static_cast<size_t>(got));
        consumed += static_cast<uintmax_t>(got);
        if (onProgress && size > 0) {
            onProgress(static_cast<int>(std::min<uintmax_t>(100, consumed * 100 / size)));
        }
    }

    if (in.bad()) {
        error = "Read error on " + file.path;
        return false;
    }

    out.encodedContent = encoder.finish();

    if (file.fileName && !file.fileName->empty()) {
        out.fileName = *file.fileName;
    } else {
        out.fileName = path.filename().string();
        if (out.fileName.empty()) {
            out.fileName = fallbackFileName(token);
        }
    }

    if (file.contentType && !file.contentType->empty()) {
        out.contentType = *file.contentType;
    } else {
        out.contentType = contentTypeFor(out.fileName).value_or(kFallbackContentType);
    }

    if (onProgress && size == 0) {
        onProgress(100);
    }

    Logger::debug("AttachmentEncoder: encoded " + out.fileName + " (" + std::to_string(consumed) + " bytes, " +
                  out.contentType + ")");
    return true;
}

} // namespace AttachmentEncoder
