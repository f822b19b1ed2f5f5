#include "ChannelDeck/editor/qt/cd_translator.hpp"
#include "ChannelDeck/core/logger.hpp"

#include <QCoreApplication>
#include <QLocale>
#include <QTranslator>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

namespace ChannelDeck::editor::qt {

CDTranslator::CDTranslator(QString textDomain) : m_textDomain(std::move(textDomain)) {}

CDTranslator::~CDTranslator() { unloadCatalog(); }

QString CDTranslator::translate(const QString &key) const {
  return translate(key, m_textDomain);
}

QString CDTranslator::translate(const QString &key, const QString &context,
                                const QString &disambiguation) const {
  if (key.isEmpty()) {
    return key;
  }
  const QByteArray ctx = context.toUtf8();
  const QByteArray source = key.toUtf8();
  const QByteArray comment = disambiguation.toUtf8();
  // QCoreApplication falls back to the source text when no catalog matches
  return QCoreApplication::translate(ctx.constData(), source.constData(),
                                     disambiguation.isEmpty() ? nullptr
                                                              : comment.constData());
}

Result<void> CDTranslator::loadCatalog(const QString &locale,
                                       const QString &directory) {
  auto catalog = std::make_unique<QTranslator>();
  bool loaded = false;
  if (locale.isEmpty()) {
    loaded = catalog->load(QLocale(), m_textDomain, QStringLiteral("_"), directory);
  } else {
    loaded = catalog->load(m_textDomain + '_' + locale, directory);
  }

  if (!loaded) {
    return Result<void>::error("No translation catalog for domain '" +
                               m_textDomain.toStdString() + "' and locale '" +
                               locale.toStdString() + "' in " +
                               directory.toStdString());
  }

  unloadCatalog();
  if (!QCoreApplication::installTranslator(catalog.get())) {
    return Result<void>::error("Failed to install translation catalog " +
                               catalog->filePath().toStdString());
  }

  CHANNELDECK_LOG_INFO("Loaded translation catalog " +
                       catalog->filePath().toStdString());
  m_catalog = std::move(catalog);
  return Result<void>::ok();
}

void CDTranslator::unloadCatalog() {
  if (m_catalog) {
    QCoreApplication::removeTranslator(m_catalog.get());
    m_catalog.reset();
  }
}

Result<QString> CDTranslator::translateMarkup(const QString &markup,
                                              const QString &tag) const {
  QXmlStreamReader reader(markup);
  QString output;
  QXmlStreamWriter writer(&output);

  QString formClass;
  bool inClass = false;
  bool inTranslatable = false;
  QString comment;

  while (!reader.atEnd()) {
    reader.readNext();
    if (reader.hasError()) {
      break;
    }

    switch (reader.tokenType()) {
    case QXmlStreamReader::StartElement: {
      const auto attrs = reader.attributes();
      inClass = reader.name() == QLatin1String("class") && formClass.isEmpty();
      inTranslatable = reader.name() == tag &&
                       attrs.value(QLatin1String("notr")) != QLatin1String("true");
      comment = attrs.value(QLatin1String("comment")).toString();
      writer.writeCurrentToken(reader);
      break;
    }
    case QXmlStreamReader::Characters:
      if (inClass) {
        formClass += reader.text();
        writer.writeCurrentToken(reader);
      } else if (inTranslatable && !reader.isWhitespace()) {
        const QString context = formClass.isEmpty() ? m_textDomain : formClass;
        writer.writeCharacters(translate(reader.text().toString(), context, comment));
      } else {
        writer.writeCurrentToken(reader);
      }
      break;
    case QXmlStreamReader::EndElement:
      inClass = false;
      inTranslatable = false;
      comment.clear();
      writer.writeCurrentToken(reader);
      break;
    default:
      writer.writeCurrentToken(reader);
      break;
    }
  }

  if (reader.hasError()) {
    return Result<QString>::error("Malformed markup at line " +
                                  std::to_string(reader.lineNumber()) + ": " +
                                  reader.errorString().toStdString());
  }
  return Result<QString>::ok(output);
}

} // namespace ChannelDeck::editor::qt
