#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

// Creates a unique directory under the system temp dir and removes it on exit
class TempTestDir {
public:
    TempTestDir() {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        std::string unique_name = "mdexpand_test_" + std::to_string(stamp) + "_" +
                                  std::to_string(counter++);
        std::error_code ec;
        auto base = std::filesystem::temp_directory_path(ec);
        if (ec) base = ".";
        // Canonical so that paths compare equal to resolved symlink targets
        std::filesystem::create_directories(base / unique_name);
        path = std::filesystem::canonical(base / unique_name).string();
    }

    ~TempTestDir() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    }

    // Write a file relative to the temp dir, creating parents; returns its full path
    std::string write(const std::string& rel, const std::string& content) const {
        std::filesystem::path full = std::filesystem::path(path) / rel;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream(full, std::ios::binary) << content;
        return full.string();
    }

    std::string file(const std::string& rel) const {
        return (std::filesystem::path(path) / rel).string();
    }

    std::string path;
};
