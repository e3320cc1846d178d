#pragma once

#include "handle.hpp"
#include <fstream>

class Reporter_;

// every failure in here is reported as IoError_, carrying the path involved
namespace File {
    std::string Read(const std::string& filename); // whole file
    void Open(const std::string& filename, std::ifstream* dst);
    void Create(const std::string& filename, std::ofstream* dst); // creates missing parent directories
    void Write(const std::string& filename, const std::string& content);

    std::vector<std::string> List(const std::string& dir,
                                  const std::string& pattern); // regex on the file name; recursive, sorted by path

    // path with root stripped, component by component; OTHER error if path is not under root
    std::string RelativeTo(const std::string& path, const std::string& root);
    std::string Join(const std::string& path1, const std::string& path2);
    std::string WithExtension(const std::string& filename, const std::string& extension);
    std::string Extension(const std::string& filename); // includes the '.'

    bool IsHidden(const std::string& filename);
    bool IsDirectory(const std::string& path);
    void MakeDirs(const std::string& dir);
    int CopyTree(const std::string& from, const std::string& to, const Reporter_& reporter); // skips hidden entries
    void RemoveAll(const std::string& path);
} // namespace File
