#pragma once

#include "medialib/catalog/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace medialib::library {

/**
 * @brief Coarse classification of a path for the pipeline
 *
 * Unsupported: the MIME type is known but not importable (e.g. a .txt or an
 * .xmp sidecar). An unknown MIME type is not a class; classify() returns
 * nullopt for it.
 */
enum class MimeClass {
    Image,
    Video,
    Audio,
    Other,
    Unsupported
};

/**
 * @brief Pluggable MIME capability
 *
 * Subclasses provide lookup() and the allow-list; classification and the
 * crawler predicate are derived from those two.
 */
class MimeClassifier {
public:
    virtual ~MimeClassifier() = default;

    /// MIME type for the path, or nullopt if it cannot be determined.
    virtual std::optional<std::string> lookup(const std::filesystem::path& path) const = 0;

    /// Authoritative allow-list of importable MIME types.
    virtual bool is_allowed(const std::string& mime_type) const = 0;

    std::optional<MimeClass> classify(const std::filesystem::path& path) const;

    /// Cheap predicate used while crawling.
    bool is_supported_media(const std::filesystem::path& path) const;

    /// IMAGE/VIDEO/AUDIO from the top-level type, OTHER for anything else.
    static catalog::AssetType asset_type_for(const std::string& mime_type);
};

/**
 * @brief Classifier driven by a file-extension table
 *
 * Extensions are matched case-insensitively. The default table covers the
 * common camera, phone and desktop image/video/audio formats plus a few
 * known non-media types that must be rejected rather than reported unknown.
 */
class ExtensionMimeClassifier : public MimeClassifier {
public:
    ExtensionMimeClassifier();

    std::optional<std::string> lookup(const std::filesystem::path& path) const override;

    bool is_allowed(const std::string& mime_type) const override;

    /**
     * @brief Add or override an extension mapping
     *
     * @param extension With or without the leading dot
     * @param allowed Whether the MIME type is importable
     */
    void register_type(std::string extension, std::string mime_type, bool allowed);

private:
    std::unordered_map<std::string, std::string> by_extension_;
    std::unordered_set<std::string> allowed_;
};

} // namespace medialib::library
