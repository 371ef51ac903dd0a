#pragma once

#include "types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace qrplay {

using MediaIndex = std::map<std::string, std::string>;

class IMediaResolver {
public:
    virtual ~IMediaResolver() = default;
    virtual std::optional<std::string> resolve(const std::string& reference) = 0;
    virtual MediaIndex build_index() = 0;
    virtual bool is_supported_format(const std::string& file_path) const = 0;
};

class MediaResolver : public IMediaResolver {
private:
    std::string m_media_dir;
    ExtensionList m_supported_extensions;

public:
    MediaResolver(std::string media_dir, ExtensionList supported_extensions);
    ~MediaResolver() override = default;

    std::optional<std::string> resolve(const std::string& reference) override;
    MediaIndex build_index() override;
    bool is_supported_format(const std::string& file_path) const override;


private:
    static std::string lower(std::string text);
};

std::unique_ptr<IMediaResolver> create_media_resolver(const std::string& media_dir,
                                                      const ExtensionList& supported_extensions);

}
