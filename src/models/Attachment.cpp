#include "models/Attachment.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

constexpr std::array<const char *, 7> kUrlKeys = {"fileUrl", "FileUrl", "url", "Url", "uri", "filePath", "path"};
constexpr std::array<const char *, 3> kNameKeys = {"fileName", "FileName", "name"};
constexpr std::array<const char *, 2> kTypeKeys = {"contentType", "ContentType"};

constexpr std::array<const char *, 13> kDocumentExtensions = {"pdf", "doc", "docx", "xls", "xlsx", "ppt", "pptx",
                                                              "txt", "csv", "rtf", "odt", "ods", "zip"};
constexpr std::array<const char *, 3> kDocumentHosts = {"/raw/upload/", "/documents/", "docs.google.com"};

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string stripQuery(const std::string &url) {
    const size_t cut = url.find_first_of("?#");
    return cut == std::string::npos ? url : url.substr(0, cut);
}

template <size_t N>
std::optional<std::string> firstString(const nlohmann::json &j, const std::array<const char *, N> &keys) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    for (const char *key : keys) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string() && !it->get_ref<const std::string &>().empty()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

// Nested {"file": {...}} wins over the outer object
template <size_t N>
std::optional<std::string> lookup(const nlohmann::json &j, const std::array<const char *, N> &keys,
                                  bool acceptBareFile = false) {
    auto nested = j.find("file");
    if (nested != j.end()) {
        if (nested->is_object()) {
            if (auto value = firstString(*nested, keys)) {
                return value;
            }
        } else if (acceptBareFile && nested->is_string() && !nested->get_ref<const std::string &>().empty()) {
            return nested->get<std::string>();
        }
    }
    return firstString(j, keys);
}

std::string lastSegment(const std::string &url) {
    const std::string path = stripQuery(url);
    const size_t slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace

std::optional<Attachment> Attachment::fromJson(const nlohmann::json &j, const std::string &mediaBase) {
    Attachment attachment;

    if (j.is_string()) {
        attachment.url = j.get<std::string>();
    } else if (j.is_object()) {
        if (auto url = lookup(j, kUrlKeys, true)) {
            attachment.url = *url;
        }
        if (auto name = lookup(j, kNameKeys)) {
            attachment.fileName = *name;
        }
        if (auto type = lookup(j, kTypeKeys)) {
            attachment.contentType = *type;
        }
    }

    if (attachment.url.empty()) {
        return std::nullopt;
    }

    attachment.url = resolveUrl(attachment.url, mediaBase);

    if (attachment.fileName.empty()) {
        attachment.fileName = lastSegment(attachment.url);
    }

    if (attachment.contentType.has_value()) {
        const std::string type = toLower(*attachment.contentType);
        attachment.kind = type.rfind("image/", 0) == 0 ? AttachmentKind::Image : AttachmentKind::Document;
    } else {
        attachment.kind = classifyUrl(attachment.url);
    }

    return attachment;
}

AttachmentKind Attachment::classifyUrl(const std::string &url) {
    if (url.empty()) {
        return AttachmentKind::Unknown;
    }

    const std::string path = toLower(stripQuery(url));

    for (const char *host : kDocumentHosts) {
        if (path.find(host) != std::string::npos) {
            return AttachmentKind::Document;
        }
    }

    const std::string segment = lastSegment(path);
    const size_t dot = segment.find_last_of('.');
    if (dot != std::string::npos) {
        const std::string ext = segment.substr(dot + 1);
        for (const char *docExt : kDocumentExtensions) {
            if (ext == docExt) {
                return AttachmentKind::Document;
            }
        }
    }

    return AttachmentKind::Image;
}

std::string Attachment::resolveUrl(const std::string &url, const std::string &base) {
    const std::string lower = toLower(url.substr(0, std::min<size_t>(url.size(), 8)));
    if (lower.rfind("http://", 0) == 0 || lower.rfind("https://", 0) == 0 || lower.rfind("data:", 0) == 0 ||
        lower.rfind("file:", 0) == 0 || base.empty()) {
        return url;
    }

    if (url.rfind("//", 0) == 0) {
        const size_t scheme = base.find("://");
        return (scheme == std::string::npos ? std::string("https:") : base.substr(0, scheme + 1)) + url;
    }

    std::string joined = base;
    while (!joined.empty() && joined.back() == '/') {
        joined.pop_back();
    }
    return joined + (url.front() == '/' ? "" : "/") + url;
}
