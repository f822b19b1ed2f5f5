/**
 * @file QtFileSystem.cpp
 * @brief Qt-based implementation of IFileSystem interface
 */

#include "ChannelDeck/editor/interfaces/QtFileSystem.hpp"

#include <QDir>
#include <QFile>

namespace ChannelDeck::editor {

Result<std::string> QtFileSystem::readFile(const std::string &path) const {
  QFile file(QString::fromStdString(path));
  if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
    return Result<std::string>::error("Failed to open " + path + ": " +
                                      file.errorString().toStdString());
  }

  QByteArray content = file.readAll();
  file.close();
  return Result<std::string>::ok(content.toStdString());
}

std::string QtFileSystem::joinPath(const std::string &base,
                                   const std::string &component) const {
  if (base.empty()) {
    return component;
  }
  QString joined = QString::fromStdString(base);
  if (!joined.endsWith('/') && !joined.endsWith(QDir::separator())) {
    joined += '/';
  }
  joined += QString::fromStdString(component);
  return QDir::cleanPath(joined).toStdString();
}

} // namespace ChannelDeck::editor
