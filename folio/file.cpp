#include "file.hpp"
#include "reporter.hpp"
#include <algorithm>
#include <filesystem>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace {
    [[noreturn]] void Fail(const std::string& what, const fs::path& path, const std::error_code& ec) {
        throw IoError_(what + " '" + path.string() + "': " + ec.message());
    }

    void MakeParentDirs(const fs::path& filename) {
        if (filename.has_parent_path())
            File::MakeDirs(filename.parent_path().string());
    }
} // namespace

std::string File::Read(const std::string& filename) {
    std::ifstream src;
    Open(filename, &src);
    std::ostringstream retval;
    retval << src.rdbuf();
    if (src.bad())
        throw IoError_("Can't read '" + filename + "'");
    return retval.str();
}

void File::Open(const std::string& filename, std::ifstream* dst) {
    dst->open(filename, std::ios::in | std::ios::binary);
    if (!dst->is_open())
        throw IoError_("Can't open '" + filename + "' for reading");
}

void File::Create(const std::string& filename, std::ofstream* dst) {
    MakeParentDirs(fs::path(filename));
    dst->open(filename, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!dst->is_open())
        throw IoError_("Can't open '" + filename + "' for writing");
}

void File::Write(const std::string& filename, const std::string& content) {
    std::ofstream dst;
    Create(filename, &dst);
    dst << content;
    dst.flush();
    if (!dst)
        throw IoError_("Can't write '" + filename + "'");
}

std::vector<std::string> File::List(const std::string& dir, const std::string& pattern) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, ec);
    if (ec)
        Fail("Can't list", dir, ec);
    const fs::recursive_directory_iterator endit;
    std::vector<std::string> ret_val;
    const std::regex filter(pattern);
    while (it != endit) {
        const bool isFile = it->is_regular_file(ec);
        if (ec)
            Fail("Can't inspect", it->path(), ec);
        if (isFile && std::regex_match(it->path().filename().string(), filter))
            ret_val.push_back(it->path().string());
        it.increment(ec);
        if (ec)
            Fail("Can't list", dir, ec);
    }
    // directory traversal order is up to the filesystem
    std::sort(ret_val.begin(), ret_val.end());
    return ret_val;
}

std::string File::RelativeTo(const std::string& path, const std::string& root) {
    const fs::path p = fs::path(path).lexically_normal(), r = fs::path(root).lexically_normal();
    auto pp = p.begin();
    for (auto pr = r.begin(); pr != r.end(); ++pr) {
        if (pr->empty() || *pr == ".") // trailing separator, or the working directory
            continue;
        REQUIRE(pp != p.end() && *pp == *pr, "Path '" + path + "' is not under '" + root + "'");
        ++pp;
    }
    fs::path retval;
    for (; pp != p.end(); ++pp)
        retval /= *pp;
    return retval.generic_string();
}

std::string File::Join(const std::string& path1, const std::string& path2) {
    return (fs::path(path1) / fs::path(path2)).string();
}

std::string File::WithExtension(const std::string& filename, const std::string& extension) {
    return fs::path(filename).replace_extension(extension).generic_string();
}

std::string File::Extension(const std::string& filename) { return fs::path(filename).extension().string(); }

bool File::IsHidden(const std::string& filename) {
    const std::string leaf = fs::path(filename).filename().string();
    return !leaf.empty() && leaf[0] == '.';
}

bool File::IsDirectory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

void File::MakeDirs(const std::string& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
        Fail("Can't create directory", dir, ec);
}

int File::CopyTree(const std::string& from, const std::string& to, const Reporter_& reporter) {
    std::error_code ec;
    fs::recursive_directory_iterator it(from, ec);
    if (ec)
        Fail("Can't list", from, ec);
    const fs::recursive_directory_iterator endit;
    int retval = 0;
    while (it != endit) {
        const fs::path src = it->path();
        const bool isDir = it->is_directory(ec);
        if (ec)
            Fail("Can't inspect", src, ec);
        if (IsHidden(src.string())) {
            if (isDir)
                it.disable_recursion_pending();
        } else {
            const fs::path dst = fs::path(to) / fs::path(RelativeTo(src.string(), from));
            if (isDir) {
                reporter.Info("Creating directory " + dst.string());
                MakeDirs(dst.string());
            } else {
                reporter.Info("Copying " + src.string() + " to " + dst.string());
                MakeParentDirs(dst);
                fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
                if (ec)
                    Fail("Can't copy", src, ec);
                ++retval;
            }
        }
        it.increment(ec);
        if (ec)
            Fail("Can't list", from, ec);
    }
    return retval;
}

void File::RemoveAll(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec)
        Fail("Can't remove", path, ec);
}
