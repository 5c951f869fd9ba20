#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <iostream>

#include <nlohmann/json.hpp>

namespace githooker::test {

/**
 * @brief Test utilities for githooker tests
 *
 * Provides helpers for temporary projects, hook definition files and
 * cleanup.
 */
namespace utils {

/**
 * @brief Create a temporary directory for testing
 * @return Canonical path to the new directory
 */
std::filesystem::path createTempDir();

/**
 * @brief Remove a directory and all its contents
 * @param dir Directory to remove
 */
void removeDir(const std::filesystem::path& dir);

/**
 * @brief Create a file with content in the given directory
 * @param baseDir Base directory
 * @param filename File name (may contain subdirectories)
 * @param content File content
 * @return Full path to created file
 */
std::filesystem::path createFile(
    const std::filesystem::path& baseDir,
    const std::string& filename,
    const std::string& content = ""
);

/**
 * @brief Read file content
 * @param filePath Path to file
 * @return File content as string
 */
std::string readFile(const std::filesystem::path& filePath);

/**
 * @brief Check if a file exists and has given content
 */
bool fileHasContent(const std::filesystem::path& filePath, const std::string& expectedContent);

/**
 * @brief Create a fake git project: <repoPath>/.git/hooks
 * @param repoPath Path where the project should live
 * @return Path to project root
 */
std::filesystem::path initTestRepo(const std::filesystem::path& repoPath);

/**
 * @brief Write a JSON hook definition file
 * @param baseDir Directory relative to which fileName is created
 * @param fileName e.g. "githooks/pre_commit.json"
 * @param hookName Value of the "hook" key
 * @param steps One argv array per step
 * @param extra Additional keys merged into the document
 *              (e.g. {{"success_message", "done"}})
 */
std::filesystem::path writeHookFile(
    const std::filesystem::path& baseDir,
    const std::string& fileName,
    const std::string& hookName,
    const std::vector<std::vector<std::string>>& steps = {{"true"}},
    const nlohmann::json& extra = nlohmann::json::object()
);

/// True if the owner execute bit is set
bool isExecutable(const std::filesystem::path& filePath);

/**
 * @brief Get current working directory
 */
std::filesystem::path getCwd();

/**
 * @brief Set working directory
 */
void setCwd(const std::filesystem::path& dir);

} // namespace utils

} // namespace githooker::test
