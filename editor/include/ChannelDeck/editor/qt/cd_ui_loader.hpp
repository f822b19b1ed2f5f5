#pragma once

/**
 * @file cd_ui_loader.hpp
 * @brief Loads dialog markup (.ui) and instantiates it through QUiLoader
 *
 * Markup read from resources is kept in a small LRU cache so repeated dialog
 * invocations within a session neither re-read nor re-translate the file.
 * Markup may carry "{field}" placeholders that are filled in per build.
 */

#include "ChannelDeck/core/lru_cache.hpp"
#include "ChannelDeck/core/result.hpp"
#include "ChannelDeck/editor/interfaces/IFileSystem.hpp"

#include <QHash>
#include <QString>

#include <memory>
#include <string>

class QDialog;
class QWidget;

namespace ChannelDeck::editor::qt {

class CDTranslator;

using TemplateFields = QHash<QString, QString>;

class CDUiLoader {
public:
  static constexpr usize DEFAULT_CACHE_CAPACITY = 5;

  struct Options {
    /// Translate markup before building instead of letting QUiLoader do it
    bool pretranslate = false;
    usize cacheCapacity = DEFAULT_CACHE_CAPACITY;
  };

  CDUiLoader(std::shared_ptr<IFileSystem> fileSystem,
             std::shared_ptr<const CDTranslator> translator, Options options);

  /**
   * @brief Markup of a resource file, read at most once while cached
   *
   * With Options::pretranslate the markup is translated before it is
   * cached.
   */
  Result<QString> loadResource(const QString& path);

  /**
   * @brief Replace every "{name}" placeholder with its field value
   *
   * Placeholders without a field are left as they are. Field values are
   * inserted verbatim, so placeholders inside them are not expanded.
   */
  [[nodiscard]] static QString renderTemplate(const QString& markup, const TemplateFields& fields);

  /**
   * @brief Build the top-level widget of a resource file
   * @param path Resource file path
   * @param parent Parent of the created widget (transient window for dialogs)
   * @param fields Template fields rendered into the markup
   * @return The widget, owned by @p parent when one is given
   */
  Result<QWidget*> build(const QString& path, QWidget* parent,
                         const TemplateFields& fields = {});

  Result<QWidget*> buildFromString(const QString& markup, QWidget* parent,
                                   const TemplateFields& fields = {});

  /**
   * @brief Build a resource whose top-level widget must be a QDialog
   */
  Result<std::unique_ptr<QDialog>> buildDialog(const QString& path, QWidget* parent,
                                               const TemplateFields& fields = {});

  Result<std::unique_ptr<QDialog>> buildDialogFromString(const QString& markup,
                                                         QWidget* parent,
                                                         const TemplateFields& fields = {});

  void clearCache() { m_cache.clear(); }
  [[nodiscard]] core::CacheStats cacheStats() const { return m_cache.stats(); }
  [[nodiscard]] const Options& options() const { return m_options; }

private:
  Result<QWidget*> instantiate(const QString& markup, QWidget* parent,
                               const TemplateFields& fields);
  static Result<std::unique_ptr<QDialog>> requireDialog(Result<QWidget*> built);

  std::shared_ptr<IFileSystem> m_fileSystem;
  std::shared_ptr<const CDTranslator> m_translator;
  Options m_options;
  core::LruCache<std::string, QString> m_cache;
};

} // namespace ChannelDeck::editor::qt
