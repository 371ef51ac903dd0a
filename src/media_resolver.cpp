#include "media_resolver.hpp"
#include "logger.hpp"
#include "token_classifier.hpp"
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

namespace qrplay {

MediaResolver::MediaResolver(std::string media_dir, ExtensionList supported_extensions)
    : m_media_dir(std::move(media_dir)) {
    for (auto& extension : supported_extensions) {
        m_supported_extensions.push_back(lower(std::move(extension)));
    }
}

std::string MediaResolver::lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool MediaResolver::is_supported_format(const std::string& file_path) const {
    std::string extension = lower(std::filesystem::path(file_path).extension().string());
    if (extension.empty()) {
        return false;
    }

    return std::find(m_supported_extensions.begin(), m_supported_extensions.end(), extension)
           != m_supported_extensions.end();
}

MediaIndex MediaResolver::build_index() {
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    std::filesystem::directory_iterator it(m_media_dir, ec);
    if (ec) {
        Logger::warn("Media: cannot list '" + m_media_dir + "': " + ec.message());
        return {};
    }

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) && is_supported_format(entry.path().string())) {
            files.push_back(entry.path());
        }
    }

    // Stem collisions resolve to the first path in sorted order
    std::sort(files.begin(), files.end());

    MediaIndex index;
    for (const auto& file : files) {
        index.emplace(lower(file.stem().string()), file.string());
    }

    return index;
}

std::optional<std::string> MediaResolver::resolve(const std::string& reference) {
    std::string key = TokenClassifier::normalize(reference);
    if (key.empty()) {
        return std::nullopt;
    }

    MediaIndex index = build_index();
    auto it = index.find(key);
    if (it == index.end()) {
        return std::nullopt;
    }

    return it->second;
}

std::unique_ptr<IMediaResolver> create_media_resolver(const std::string& media_dir,
                                                      const ExtensionList& supported_extensions) {
    return std::make_unique<MediaResolver>(media_dir, supported_extensions);
}

}
