#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

enum class AttachmentKind { Image, Document, Unknown };

/**
 * @brief A file attached to a chat message, in the one shape the rest of the code consumes
 *
 * The server describes files loosely (bare URL strings, objects with one of several URL
 * member names, objects nested under "file"). fromJson() is the single place that
 * understands those variants; everything downstream reads url/fileName/kind only.
 */
class Attachment {
  public:
    /**
     * @brief Normalize one server-side file description
     * @param j String URL or object describing the file
     * @param mediaBase Base URL used to resolve relative paths (may be empty)
     * @return Attachment, or std::nullopt if no URL can be found
     */
    static std::optional<Attachment> fromJson(const nlohmann::json &j, const std::string &mediaBase = "");

    /**
     * @brief Classify a URL as document or image by its path
     * Documents are recognised by extension (pdf, docx, ...) or a document-hosting path;
     * everything else is treated as an image. An empty URL is Unknown.
     */
    static AttachmentKind classifyUrl(const std::string &url);

    /**
     * @brief Resolve a possibly relative URL against a base URL
     */
    static std::string resolveUrl(const std::string &url, const std::string &base);

    bool isImage() const { return kind == AttachmentKind::Image; }
    bool isDocument() const { return kind == AttachmentKind::Document; }

    std::string url;                        ///< Absolute URL of the file
    std::string fileName;                   ///< Display name
    std::optional<std::string> contentType; ///< MIME type when the server supplied one
    AttachmentKind kind = AttachmentKind::Unknown;
};
