#pragma once
#include <filesystem>
#include <random>
#include <string>
#include <system_error>

// Fresh directory under the system temp path, removed with its contents.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "tokenx_test") {
        std::random_device rd;
        m_path = std::filesystem::temp_directory_path()
               / (prefix + "_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};
