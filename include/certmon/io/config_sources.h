/**
 * @file config_sources.h
 * @brief IConfigSource implementations
 */

#pragma once

#include <string>

#include "certmon/check/providers.h"

namespace certmon::io {

/**
 * @brief Reads the target list from a file
 */
class FileConfigSource : public check::IConfigSource {
public:
    explicit FileConfigSource(std::string path);

    /// @throws common::SourceException if the file cannot be opened or read
    std::string load() override;
    std::string describe() const override;

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @brief Target list held in memory
 */
class StringConfigSource : public check::IConfigSource {
public:
    explicit StringConfigSource(std::string text, std::string name = "inline");

    std::string load() override { return text_; }
    std::string describe() const override { return name_; }

private:
    std::string text_;
    std::string name_;
};

} // namespace certmon::io
