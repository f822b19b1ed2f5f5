#pragma once

/**
 * @file IFileSystem.hpp
 * @brief Read-side file system interface used by the UI resource loader
 *
 * This interface decouples resource loading from QFile, allowing:
 * - Unit testing with in-memory file systems
 * - Counting reads to verify resource caching
 */

#include "ChannelDeck/core/result.hpp"

#include <string>

namespace ChannelDeck::editor {

/**
 * @brief File system interface
 *
 * Paths may be plain file system paths or Qt resource paths (":/...");
 * implementations decide which they support.
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  /**
   * @brief Read entire file content as UTF-8 text
   * @param path Path to the file
   * @return File content, or an error naming the path
   */
  [[nodiscard]] virtual Result<std::string> readFile(const std::string& path) const = 0;

  /**
   * @brief Join path components
   * @param base Base path
   * @param component Path component to append
   * @return Combined path
   */
  [[nodiscard]] virtual std::string joinPath(const std::string& base,
                                             const std::string& component) const = 0;
};

} // namespace ChannelDeck::editor
