/**
 * @file app_settings.cpp
 * @brief JSON persistence for AppSettings
 */

#include "ChannelDeck/editor/app_settings.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>

namespace ChannelDeck::editor {

namespace {

const char* logLevelName(core::LogLevel level) {
  switch (level) {
  case core::LogLevel::Trace:
    return "trace";
  case core::LogLevel::Debug:
    return "debug";
  case core::LogLevel::Info:
    return "info";
  case core::LogLevel::Warning:
    return "warning";
  case core::LogLevel::Error:
    return "error";
  case core::LogLevel::Fatal:
    return "fatal";
  case core::LogLevel::Off:
    return "off";
  }
  return "info";
}

} // namespace

AppSettings::AppSettings()
    : m_profileDataPath(QDir::homePath()), m_uiResourcesPath(DEFAULT_UI_RESOURCES_PATH),
      m_textDomain(DEFAULT_TEXT_DOMAIN) {}

Result<AppSettings> AppSettings::loadFromFile(const QString& path) {
  if (!QFileInfo::exists(path)) {
    CHANNELDECK_LOG_INFO("Settings file not found, using defaults: " + path.toStdString());
    return Result<AppSettings>::ok(AppSettings());
  }

  QFile file(path);
  if (!file.open(QIODevice::ReadOnly)) {
    return Result<AppSettings>::error("Failed to open settings file " + path.toStdString() +
                                      ": " + file.errorString().toStdString());
  }

  QJsonParseError error;
  const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &error);
  if (error.error != QJsonParseError::NoError) {
    return Result<AppSettings>::error("Failed to parse settings file " + path.toStdString() +
                                      ": " + error.errorString().toStdString());
  }
  if (!doc.isObject()) {
    return Result<AppSettings>::error("Settings file " + path.toStdString() +
                                      " does not contain a JSON object");
  }

  return fromJson(doc.object());
}

Result<AppSettings> AppSettings::fromJson(const QJsonObject& json) {
  AppSettings settings;

  settings.m_profileDataPath =
      json.value("profile_data_path").toString(settings.m_profileDataPath);
  settings.m_uiResourcesPath =
      json.value("ui_resources_path").toString(settings.m_uiResourcesPath);
  settings.m_textDomain = json.value("text_domain").toString(settings.m_textDomain);
  settings.m_locale = json.value("locale").toString(settings.m_locale);
  settings.m_translationsPath =
      json.value("translations_path").toString(settings.m_translationsPath);

  if (json.contains("log_level")) {
    const QString levelName = json.value("log_level").toString();
    auto level = core::logLevelFromString(levelName.toStdString());
    if (!level) {
      return Result<AppSettings>::error("Unknown log level: " + levelName.toStdString());
    }
    settings.m_logLevel = *level;
  }

  if (settings.m_textDomain.isEmpty()) {
    return Result<AppSettings>::error("text_domain must not be empty");
  }

  return Result<AppSettings>::ok(std::move(settings));
}

QJsonObject AppSettings::toJson() const {
  QJsonObject obj;
  obj.insert("profile_data_path", m_profileDataPath);
  obj.insert("ui_resources_path", m_uiResourcesPath);
  obj.insert("text_domain", m_textDomain);
  obj.insert("locale", m_locale);
  obj.insert("translations_path", m_translationsPath);
  obj.insert("log_level", QString::fromLatin1(logLevelName(m_logLevel)));
  return obj;
}

Result<void> AppSettings::saveToFile(const QString& path) const {
  QFile file(path);
  if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    return Result<void>::error("Failed to write settings file " + path.toStdString() + ": " +
                               file.errorString().toStdString());
  }
  file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
  return Result<void>::ok();
}

} // namespace ChannelDeck::editor
