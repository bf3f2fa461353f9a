/**
 * @file config_sources.cpp
 * @brief IConfigSource implementations
 */

#include "certmon/io/config_sources.h"
#include "certmon/common/exceptions.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

namespace certmon::io {

FileConfigSource::FileConfigSource(std::string path)
    : path_(std::move(path)) {}

std::string FileConfigSource::load() {
    if (path_.empty()) {
        throw common::SourceException("no target file configured");
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw common::SourceException("cannot open '" + path_ + "': " + std::strerror(errno));
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw common::SourceException("failed to read '" + path_ + "'");
    }

    std::string text = content.str();
    spdlog::debug("[FileConfigSource] Read {} bytes from {}", text.size(), path_);
    return text;
}

std::string FileConfigSource::describe() const {
    return "file:" + path_;
}

StringConfigSource::StringConfigSource(std::string text, std::string name)
    : text_(std::move(text))
    , name_(std::move(name)) {}

} // namespace certmon::io
