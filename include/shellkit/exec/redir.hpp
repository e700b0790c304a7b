/*
 * Redirection file handling - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <string>
#include <shellkit/core/error.hpp>

namespace shellkit {

enum class RedirType { Out, OutAppend };

// File access used by redirects and file-reading verbs. Hosts may swap in
// their own implementation (sandboxed, in-memory, remote).
class FileHandler {
public:
    virtual ~FileHandler() = default;
    virtual Status write_file(const std::string& path, const std::string& content, RedirType type) = 0;
    virtual Status read_file(const std::string& path, std::string& content) = 0;
};

// Local filesystem through POSIX open/write (mode 0644).
class LocalFileHandler : public FileHandler {
public:
    Status write_file(const std::string& path, const std::string& content, RedirType type) override;
    Status read_file(const std::string& path, std::string& content) override;
};

} // namespace shellkit
