#pragma once

/**
 * @file cd_translator.hpp
 * @brief Text-domain translation for dialog strings and dialog markup
 *
 * The text domain is used as the translation context for strings that come
 * from code. Strings inside .ui markup use the form class as their context,
 * the same way lupdate extracts them.
 */

#include "ChannelDeck/core/result.hpp"

#include <QString>

#include <memory>

class QTranslator;

namespace ChannelDeck::editor::qt {

class CDTranslator {
public:
  explicit CDTranslator(QString textDomain);
  ~CDTranslator();

  CDTranslator(const CDTranslator&) = delete;
  CDTranslator& operator=(const CDTranslator&) = delete;

  [[nodiscard]] const QString& textDomain() const { return m_textDomain; }

  /**
   * @brief Translate a message of the text domain
   * @return The translation, or @p key unchanged when the catalog has none
   */
  [[nodiscard]] QString translate(const QString& key) const;

  [[nodiscard]] QString translate(const QString& key, const QString& context,
                                  const QString& disambiguation = QString()) const;

  /**
   * @brief Load and install "<domain>_<locale>.qm" from @p directory
   *
   * Replaces the catalog loaded by a previous call. An empty locale selects
   * the system UI languages.
   */
  Result<void> loadCatalog(const QString& locale, const QString& directory);

  /// Remove the installed catalog, if any
  void unloadCatalog();

  [[nodiscard]] bool hasCatalog() const { return m_catalog != nullptr; }

  /**
   * @brief Replace the text of translatable elements in .ui markup
   *
   * Every @p tag element not flagged notr="true" gets its text translated,
   * with the form's <class> as context and the element's "comment"
   * attribute as disambiguation.
   *
   * @return The rewritten markup, or an error for malformed XML
   */
  [[nodiscard]] Result<QString> translateMarkup(const QString& markup,
                                                const QString& tag = QStringLiteral("string")) const;

private:
  QString m_textDomain;
  std::unique_ptr<QTranslator> m_catalog;
};

} // namespace ChannelDeck::editor::qt
