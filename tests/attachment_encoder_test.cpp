#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "support/Check.h"
#include "utils/AttachmentEncoder.h"
#include "utils/Base64.h"
#include "utils/Logger.h"

namespace {

std::filesystem::path TempDir(const std::string &name) {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec) / name;
    if (ec) {
        dir = std::filesystem::path{"."} / name;
    }
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    return dir;
}

void WriteFile(const std::filesystem::path &path, const std::string &bytes) {
    std::ofstream out(path, std::ios::binary);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

} // namespace

int main() {
    Logger::setLevel(Logger::Level::ERROR);

    const auto dir = TempDir("chatline_attachment_encoder");
    const std::string token = "pending:1234abcd-0000-4000-8000-000000000000";

    // Small image with a known encoding
    const auto photo = dir / "holiday.PNG";
    WriteFile(photo, "foobar");
    {
        EncodedAttachment out;
        std::string error;
        std::vector<int> progress;
        if (!AttachmentEncoder::encode(LocalFile{photo.string(), std::nullopt, std::nullopt}, token, out, error,
                                       [&progress](int p) { progress.push_back(p); })) {
            FAIL();
        }
        if (out.encodedContent != "Zm9vYmFy" || out.fileName != "holiday.PNG" || out.contentType != "image/png") {
            FAIL();
        }
        if (progress.empty() || progress.front() != 0 || progress.back() != 100) {
            FAIL();
        }
    }

    // Larger than one read chunk, progress is monotonic
    const auto big = dir / "report.pdf";
    std::string payload;
    for (int i = 0; i < 200000; ++i) {
        payload.push_back(static_cast<char>(i % 251));
    }
    WriteFile(big, payload);
    {
        EncodedAttachment out;
        std::string error;
        std::vector<int> progress;
        if (!AttachmentEncoder::encode(LocalFile{big.string(), std::nullopt, std::nullopt}, token, out, error,
                                       [&progress](int p) { progress.push_back(p); })) {
            FAIL();
        }
        if (out.encodedContent != Base64::encode(payload) || out.contentType != "application/pdf") {
            FAIL();
        }
        if (progress.size() < 3) {
            FAIL();
        }
        for (size_t i = 1; i < progress.size(); ++i) {
            if (progress[i] < progress[i - 1]) {
                FAIL();
            }
        }
    }

    // Caller-supplied name and type win
    {
        EncodedAttachment out;
        std::string error;
        if (!AttachmentEncoder::encode(LocalFile{photo.string(), std::string("renamed.bin"), std::string("text/plain")},
                                       token, out, error)) {
            FAIL();
        }
        if (out.fileName != "renamed.bin" || out.contentType != "text/plain") {
            FAIL();
        }
    }

    // Unknown extension falls back to a generic image type
    const auto unknown = dir / "capture.raw";
    WriteFile(unknown, "abc");
    {
        EncodedAttachment out;
        std::string error;
        if (!AttachmentEncoder::encode(LocalFile{unknown.string(), std::nullopt, std::nullopt}, token, out, error) ||
            out.contentType != "image/jpeg") {
            FAIL();
        }
    }

    // Empty file still encodes
    const auto empty = dir / "empty.txt";
    WriteFile(empty, "");
    {
        EncodedAttachment out;
        std::string error;
        if (!AttachmentEncoder::encode(LocalFile{empty.string(), std::nullopt, std::nullopt}, token, out, error) ||
            !out.encodedContent.empty() || out.contentType != "text/plain") {
            FAIL();
        }
    }

    // Failures
    {
        EncodedAttachment out;
        std::string error;
        if (AttachmentEncoder::encode(LocalFile{(dir / "missing.jpg").string(), std::nullopt, std::nullopt}, token,
                                      out, error) ||
            error.empty()) {
            FAIL();
        }

        error.clear();
        if (AttachmentEncoder::encode(LocalFile{dir.string(), std::nullopt, std::nullopt}, token, out, error) ||
            error.empty()) {
            FAIL();
        }

        error.clear();
        if (AttachmentEncoder::encode(LocalFile{big.string(), std::nullopt, std::nullopt}, token, out, error, nullptr,
                                      1024) ||
            error.find("too large") == std::string::npos) {
            FAIL();
        }

        error.clear();
        if (AttachmentEncoder::encode(LocalFile{"", std::nullopt, std::nullopt}, token, out, error) || error.empty()) {
            FAIL();
        }
    }

    if (AttachmentEncoder::fallbackFileName(token) != "image_1234abcd-0000-4000-8000-000000000000.jpg") {
        FAIL();
    }
    if (AttachmentEncoder::contentTypeFor("a.JPEG").value_or("") != "image/jpeg" ||
        AttachmentEncoder::contentTypeFor("archive.zip").value_or("") != "application/zip" ||
        AttachmentEncoder::contentTypeFor("noext") || AttachmentEncoder::contentTypeFor("trailing.")) {
        FAIL();
    }

    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    return 0;
}
