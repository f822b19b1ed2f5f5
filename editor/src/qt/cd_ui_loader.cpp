#include "ChannelDeck/editor/qt/cd_ui_loader.hpp"
#include "ChannelDeck/core/logger.hpp"
#include "ChannelDeck/editor/qt/cd_translator.hpp"

#include <QBuffer>
#include <QDialog>
#include <QRegularExpression>
#include <QStringView>
#include <QUiLoader>
#include <QWidget>

namespace ChannelDeck::editor::qt {

CDUiLoader::CDUiLoader(std::shared_ptr<IFileSystem> fileSystem,
                       std::shared_ptr<const CDTranslator> translator,
                       Options options)
    : m_fileSystem(std::move(fileSystem)), m_translator(std::move(translator)),
      m_options(options), m_cache(options.cacheCapacity) {}

Result<QString> CDUiLoader::loadResource(const QString &path) {
  const std::string key = path.toStdString();
  if (auto cached = m_cache.get(key)) {
    return Result<QString>::ok(*cached);
  }

  auto content = m_fileSystem->readFile(key);
  if (content.isError()) {
    return Result<QString>::error(content.error());
  }

  QString markup = QString::fromStdString(content.value());
  if (m_options.pretranslate) {
    auto translated = m_translator->translateMarkup(markup);
    if (translated.isError()) {
      return Result<QString>::error(key + ": " + translated.error());
    }
    markup = std::move(translated).value();
  }

  CHANNELDECK_LOG_DEBUG("Loaded UI resource {} ({} chars)", key, markup.size());
  m_cache.put(key, markup);
  return Result<QString>::ok(markup);
}

QString CDUiLoader::renderTemplate(const QString &markup,
                                   const TemplateFields &fields) {
  static const QRegularExpression placeholder(QStringLiteral("\\{(\\w+)\\}"));

  // Single pass over the markup: substituted values are never rescanned
  QString rendered;
  rendered.reserve(markup.size());
  qsizetype last = 0;
  auto matches = placeholder.globalMatch(markup);
  while (matches.hasNext()) {
    const QRegularExpressionMatch match = matches.next();
    const auto field = fields.constFind(match.captured(1));
    if (field == fields.cend()) {
      continue;
    }
    rendered += QStringView(markup).mid(last, match.capturedStart() - last);
    rendered += field.value();
    last = match.capturedEnd();
  }
  rendered += QStringView(markup).mid(last);
  return rendered;
}

Result<QWidget *> CDUiLoader::build(const QString &path, QWidget *parent,
                                    const TemplateFields &fields) {
  auto markup = loadResource(path);
  if (markup.isError()) {
    return Result<QWidget *>::error(markup.error());
  }
  auto widget = instantiate(markup.value(), parent, fields);
  if (widget.isError()) {
    return Result<QWidget *>::error(path.toStdString() + ": " + widget.error());
  }
  return widget;
}

Result<QWidget *> CDUiLoader::buildFromString(const QString &markup,
                                              QWidget *parent,
                                              const TemplateFields &fields) {
  return instantiate(markup, parent, fields);
}

Result<std::unique_ptr<QDialog>>
CDUiLoader::buildDialog(const QString &path, QWidget *parent,
                        const TemplateFields &fields) {
  return requireDialog(build(path, parent, fields));
}

Result<std::unique_ptr<QDialog>>
CDUiLoader::buildDialogFromString(const QString &markup, QWidget *parent,
                                  const TemplateFields &fields) {
  return requireDialog(buildFromString(markup, parent, fields));
}

Result<QWidget *> CDUiLoader::instantiate(const QString &markup, QWidget *parent,
                                          const TemplateFields &fields) {
  QByteArray data = renderTemplate(markup, fields).toUtf8();
  QBuffer buffer(&data);
  if (!buffer.open(QIODevice::ReadOnly)) {
    return Result<QWidget *>::error("Failed to open markup buffer");
  }

  QUiLoader loader;
  loader.setTranslationEnabled(!m_options.pretranslate);
  QWidget *widget = loader.load(&buffer, parent);
  if (!widget) {
    return Result<QWidget *>::error("Failed to build UI: " +
                                    loader.errorString().toStdString());
  }
  return Result<QWidget *>::ok(widget);
}

Result<std::unique_ptr<QDialog>>
CDUiLoader::requireDialog(Result<QWidget *> built) {
  if (built.isError()) {
    return Result<std::unique_ptr<QDialog>>::error(built.error());
  }

  QWidget *widget = built.value();
  auto *dialog = qobject_cast<QDialog *>(widget);
  if (!dialog) {
    const std::string className = widget->metaObject()->className();
    delete widget;
    return Result<std::unique_ptr<QDialog>>::error(
        "Top-level widget is a " + className + ", expected a QDialog");
  }
  return Result<std::unique_ptr<QDialog>>::ok(std::unique_ptr<QDialog>(dialog));
}

} // namespace ChannelDeck::editor::qt
