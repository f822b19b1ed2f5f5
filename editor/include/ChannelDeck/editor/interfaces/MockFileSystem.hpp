#pragma once

/**
 * @file MockFileSystem.hpp
 * @brief In-memory implementation of IFileSystem for testing
 *
 * Stores files in memory and counts every read, so tests can verify how
 * often a resource actually reached the file system.
 */

#include "ChannelDeck/editor/interfaces/IFileSystem.hpp"

#include <atomic>
#include <map>
#include <mutex>

namespace ChannelDeck::editor {

class MockFileSystem : public IFileSystem {
public:
  MockFileSystem() = default;
  ~MockFileSystem() override = default;

  // =========================================================================
  // IFileSystem Implementation
  // =========================================================================

  [[nodiscard]] Result<std::string> readFile(const std::string& path) const override {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::string normalized = normalizePath(path);
    ++m_readCount;
    ++m_readCountByPath[normalized];

    auto it = m_files.find(normalized);
    if (it == m_files.end()) {
      return Result<std::string>::error("File not found: " + path);
    }
    return Result<std::string>::ok(it->second);
  }

  [[nodiscard]] std::string joinPath(const std::string& base,
                                     const std::string& component) const override {
    if (base.empty()) {
      return component;
    }
    if (component.empty()) {
      return base;
    }

    std::string result = base;
    if (result.back() != '/' && result.back() != '\\') {
      result += '/';
    }
    result += component;
    return normalizePath(result);
  }

  // =========================================================================
  // Mock Configuration
  // =========================================================================

  /**
   * @brief Add (or replace) a mock file
   * @param path File path
   * @param content File content
   */
  void addMockFile(const std::string& path, const std::string& content) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_files[normalizePath(path)] = content;
  }

  void removeMockFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_files.erase(normalizePath(path));
  }

  // =========================================================================
  // Test Helpers - Verification
  // =========================================================================

  /**
   * @brief Get number of readFile() calls, successful or not
   */
  [[nodiscard]] int getReadCount() const { return m_readCount; }

  /**
   * @brief Get number of readFile() calls for one path
   */
  [[nodiscard]] int getReadCount(const std::string& path) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_readCountByPath.find(normalizePath(path));
    return it != m_readCountByPath.end() ? it->second : 0;
  }

  void resetCounters() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_readCount = 0;
    m_readCountByPath.clear();
  }

private:
  [[nodiscard]] static std::string normalizePath(const std::string& path) {
    // Simple normalization: convert backslashes to forward slashes
    std::string result = path;
    for (char& c : result) {
      if (c == '\\') {
        c = '/';
      }
    }
    while (!result.empty() && result.back() == '/') {
      result.pop_back();
    }
    return result;
  }

  std::map<std::string, std::string> m_files;
  mutable std::atomic<int> m_readCount{0};
  mutable std::map<std::string, int> m_readCountByPath;
  mutable std::mutex m_mutex;
};

} // namespace ChannelDeck::editor
