// tests/TempDir.hpp
#ifndef EMBER_TESTS_TEMP_DIR_HPP
#define EMBER_TESTS_TEMP_DIR_HPP

#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>

namespace EmberTests {

    // Fresh directory under the system temp dir, removed on destruction.
    class TempDir {
    public:
        explicit TempDir(const std::string& tag) {
            const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
            m_path = std::filesystem::temp_directory_path() / ("ember-" + tag + "-" + std::to_string(stamp));
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

} // namespace EmberTests

#endif // EMBER_TESTS_TEMP_DIR_HPP
