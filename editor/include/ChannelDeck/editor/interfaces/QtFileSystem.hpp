#pragma once

/**
 * @file QtFileSystem.hpp
 * @brief Qt-based implementation of IFileSystem interface
 *
 * Implements the IFileSystem interface using QFile and QDir,
 * so Qt resource paths (":/ui/...") work as well as disk paths.
 */

#include "ChannelDeck/editor/interfaces/IFileSystem.hpp"

namespace ChannelDeck::editor {

class QtFileSystem : public IFileSystem {
public:
  QtFileSystem() = default;
  ~QtFileSystem() override = default;

  [[nodiscard]] Result<std::string> readFile(const std::string& path) const override;
  [[nodiscard]] std::string joinPath(const std::string& base,
                                     const std::string& component) const override;
};

} // namespace ChannelDeck::editor
