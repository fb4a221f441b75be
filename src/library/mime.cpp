#include "medialib/library/mime.hpp"

#include <algorithm>
#include <cctype>

namespace medialib::library {
namespace {

std::string lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string top_level(const std::string& mime_type) {
    return mime_type.substr(0, mime_type.find('/'));
}

struct ExtensionEntry {
    const char* extension;
    const char* mime_type;
    bool allowed;
};

const ExtensionEntry kDefaultTable[] = {
    // Images
    {"3fr", "image/x-hasselblad-3fr", true},
    {"arw", "image/x-sony-arw", true},
    {"avif", "image/avif", true},
    {"bmp", "image/bmp", true},
    {"cr2", "image/x-canon-cr2", true},
    {"cr3", "image/x-canon-cr3", true},
    {"dng", "image/x-adobe-dng", true},
    {"gif", "image/gif", true},
    {"heic", "image/heic", true},
    {"heif", "image/heif", true},
    {"jpeg", "image/jpeg", true},
    {"jpg", "image/jpeg", true},
    {"jxl", "image/jxl", true},
    {"nef", "image/x-nikon-nef", true},
    {"orf", "image/x-olympus-orf", true},
    {"png", "image/png", true},
    {"psd", "image/vnd.adobe.photoshop", true},
    {"raf", "image/x-fuji-raf", true},
    {"rw2", "image/x-panasonic-rw2", true},
    {"srw", "image/x-samsung-srw", true},
    {"tif", "image/tiff", true},
    {"tiff", "image/tiff", true},
    {"webp", "image/webp", true},
    // Videos
    {"3gp", "video/3gpp", true},
    {"avi", "video/x-msvideo", true},
    {"flv", "video/x-flv", true},
    {"m2ts", "video/mp2t", true},
    {"m4v", "video/x-m4v", true},
    {"mkv", "video/x-matroska", true},
    {"mov", "video/quicktime", true},
    {"mp4", "video/mp4", true},
    {"mpeg", "video/mpeg", true},
    {"mpg", "video/mpeg", true},
    {"mts", "video/mp2t", true},
    {"webm", "video/webm", true},
    {"wmv", "video/x-ms-wmv", true},
    // Audio
    {"aac", "audio/aac", true},
    {"flac", "audio/flac", true},
    {"m4a", "audio/mp4", true},
    {"mp3", "audio/mpeg", true},
    {"ogg", "audio/ogg", true},
    {"wav", "audio/wav", true},
    // Known, never imported
    {"json", "application/json", false},
    {"pdf", "application/pdf", false},
    {"txt", "text/plain", false},
    {"xmp", "application/rdf+xml", false},
    {"zip", "application/zip", false},
};

} // namespace

std::optional<MimeClass> MimeClassifier::classify(const std::filesystem::path& path) const {
    auto mime_type = lookup(path);
    if (!mime_type) {
        return std::nullopt;
    }
    if (!is_allowed(*mime_type)) {
        return MimeClass::Unsupported;
    }

    switch (asset_type_for(*mime_type)) {
        case catalog::AssetType::Image: return MimeClass::Image;
        case catalog::AssetType::Video: return MimeClass::Video;
        case catalog::AssetType::Audio: return MimeClass::Audio;
        default: return MimeClass::Other;
    }
}

bool MimeClassifier::is_supported_media(const std::filesystem::path& path) const {
    auto mime_class = classify(path);
    return mime_class.has_value() && *mime_class != MimeClass::Unsupported;
}

catalog::AssetType MimeClassifier::asset_type_for(const std::string& mime_type) {
    const auto kind = lower(top_level(mime_type));
    if (kind == "image") return catalog::AssetType::Image;
    if (kind == "video") return catalog::AssetType::Video;
    if (kind == "audio") return catalog::AssetType::Audio;
    return catalog::AssetType::Other;
}

ExtensionMimeClassifier::ExtensionMimeClassifier() {
    for (const auto& entry : kDefaultTable) {
        register_type(entry.extension, entry.mime_type, entry.allowed);
    }
}

std::optional<std::string> ExtensionMimeClassifier::lookup(const std::filesystem::path& path) const {
    auto extension = path.extension().string();
    if (extension.size() < 2) {
        return std::nullopt;
    }

    auto it = by_extension_.find(lower(extension.substr(1)));
    if (it == by_extension_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool ExtensionMimeClassifier::is_allowed(const std::string& mime_type) const {
    return allowed_.count(mime_type) > 0;
}

void ExtensionMimeClassifier::register_type(std::string extension, std::string mime_type, bool allowed) {
    if (!extension.empty() && extension.front() == '.') {
        extension.erase(0, 1);
    }
    if (allowed) {
        allowed_.insert(mime_type);
    } else {
        allowed_.erase(mime_type);
    }
    by_extension_[lower(std::move(extension))] = std::move(mime_type);
}

} // namespace medialib::library
