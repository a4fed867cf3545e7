/**
 * @file testtree.hpp
 * @brief Scratch directory helper shared by the test fixtures
 */

#ifndef TESTTREE_HPP
#define TESTTREE_HPP

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>

/**
 * @class TestTree
 * @brief Base fixture owning a fresh directory below the system temp dir
 *
 * Each test gets its own directory, named after the test, which is removed
 * again in TearDown(). The temp dir is used instead of $HOME so that no
 * test file ever lands in a protected location or one of the user's real
 * folders.
 */
class TestTree : public ::testing::Test {
protected:
    /** @brief Root of the scratch tree */
    std::filesystem::path test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = std::filesystem::temp_directory_path() /
                   (std::string("dupescan_") + info->test_suite_name() + "_" +
                    info->name());

        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }

    /**
     * @brief Writes @p content to @p relative below test_dir
     *
     * Missing parent directories are created.
     *
     * @return Full path of the written file
     */
    std::filesystem::path writeFile(const std::string& relative,
                                    const std::string& content) {
        std::filesystem::path path = test_dir / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    /** @brief Writes @p size copies of @p fill */
    std::filesystem::path writeFile(const std::string& relative,
                                    std::size_t size, char fill) {
        return writeFile(relative, std::string(size, fill));
    }
};

#endif // TESTTREE_HPP
