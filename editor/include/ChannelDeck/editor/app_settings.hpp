#pragma once

/**
 * @file app_settings.hpp
 * @brief Application settings consumed by the dialog layer
 *
 * Loaded from a JSON file:
 * @code
 * {
 *   "profile_data_path": "/home/user/channeldeck/data",
 *   "ui_resources_path": ":/ui",
 *   "text_domain": "channeldeck",
 *   "locale": "de",
 *   "translations_path": "/usr/share/channeldeck/translations",
 *   "log_level": "info"
 * }
 * @endcode
 * Every key is optional; missing keys keep their defaults.
 */

#include "ChannelDeck/core/logger.hpp"
#include "ChannelDeck/core/result.hpp"

#include <QJsonObject>
#include <QString>

namespace ChannelDeck::editor {

class AppSettings {
public:
  static constexpr const char* DEFAULT_TEXT_DOMAIN = "channeldeck";
  static constexpr const char* DEFAULT_UI_RESOURCES_PATH = ":/ui";

  AppSettings();

  /**
   * @brief Load settings from a JSON file
   *
   * A missing file yields the defaults. Unreadable files, malformed JSON,
   * non-object documents and unknown log levels are errors.
   */
  static Result<AppSettings> loadFromFile(const QString& path);

  /**
   * @brief Build settings from an already parsed JSON object
   */
  static Result<AppSettings> fromJson(const QJsonObject& json);

  [[nodiscard]] QJsonObject toJson() const;
  Result<void> saveToFile(const QString& path) const;

  /// Base directory file choosers open in
  [[nodiscard]] const QString& profileDataPath() const { return m_profileDataPath; }
  void setProfileDataPath(const QString& path) { m_profileDataPath = path; }

  /// Directory holding the dialog .ui files (disk path or Qt resource path)
  [[nodiscard]] const QString& uiResourcesPath() const { return m_uiResourcesPath; }
  void setUiResourcesPath(const QString& path) { m_uiResourcesPath = path; }

  [[nodiscard]] const QString& textDomain() const { return m_textDomain; }
  void setTextDomain(const QString& domain) { m_textDomain = domain; }

  /// Empty means "use the system locale"
  [[nodiscard]] const QString& locale() const { return m_locale; }
  void setLocale(const QString& locale) { m_locale = locale; }

  [[nodiscard]] const QString& translationsPath() const { return m_translationsPath; }
  void setTranslationsPath(const QString& path) { m_translationsPath = path; }

  [[nodiscard]] core::LogLevel logLevel() const { return m_logLevel; }
  void setLogLevel(core::LogLevel level) { m_logLevel = level; }

private:
  QString m_profileDataPath;
  QString m_uiResourcesPath;
  QString m_textDomain;
  QString m_locale;
  QString m_translationsPath;
  core::LogLevel m_logLevel = core::LogLevel::Info;
};

} // namespace ChannelDeck::editor
