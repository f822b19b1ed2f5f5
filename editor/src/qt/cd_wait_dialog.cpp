#include "ChannelDeck/editor/qt/cd_wait_dialog.hpp"
#include "ChannelDeck/core/logger.hpp"
#include "ChannelDeck/editor/qt/cd_translator.hpp"

#include <QCoreApplication>
#include <QDialog>
#include <QLabel>
#include <QMetaObject>

namespace ChannelDeck::editor::qt {

namespace {

QLabel *findLabel(QDialog *dialog) {
  return dialog ? dialog->findChild<QLabel *>(
                      QString::fromLatin1(CDWaitDialog::LABEL_OBJECT_NAME))
                : nullptr;
}

} // namespace

CDWaitDialog::CDWaitDialog(std::unique_ptr<QDialog> dialog,
                           std::shared_ptr<const CDTranslator> translator,
                           const QString &text)
    : m_dialog(dialog.release()), m_label(findLabel(m_dialog.data())),
      m_translator(std::move(translator)) {
  if (!m_label) {
    CHANNELDECK_LOG_WARN("Wait dialog markup has no label named {}",
                         LABEL_OBJECT_NAME);
  }
  if (!text.isEmpty()) {
    m_defaultText = text;
  } else if (m_label) {
    m_defaultText = m_label->text();
    m_defaultTranslated = true;
  }
}

CDWaitDialog::~CDWaitDialog() {
  if (!m_destroyed.exchange(true)) {
    post([](QDialog *dialog, QLabel *) { dialog->deleteLater(); });
  }
}

void CDWaitDialog::show(const QString &text) {
  if (m_destroyed) {
    return;
  }
  const QString shown = displayText(text);
  post([shown](QDialog *dialog, QLabel *label) {
    if (label) {
      label->setText(shown);
    }
    dialog->show();
  });
}

void CDWaitDialog::setText(const QString &text) {
  if (m_destroyed) {
    return;
  }
  const QString shown = displayText(text);
  post([shown](QDialog *, QLabel *label) {
    if (label) {
      label->setText(shown);
    }
  });
}

void CDWaitDialog::hide() {
  if (m_destroyed) {
    return;
  }
  post([](QDialog *dialog, QLabel *) { dialog->hide(); });
}

void CDWaitDialog::destroy() {
  if (m_destroyed.exchange(true)) {
    return;
  }
  post([](QDialog *dialog, QLabel *) { dialog->deleteLater(); });
}

void CDWaitDialog::post(std::function<void(QDialog *, QLabel *)> action) const {
  QCoreApplication *app = QCoreApplication::instance();
  if (!app) {
    return;
  }

  // The application object is the receiver: the dialog may be deleted on the
  // UI thread at any time, so it is only looked at once the call runs there.
  QMetaObject::invokeMethod(
      app,
      [dialog = m_dialog, label = m_label, action = std::move(action)]() {
        if (dialog) {
          action(dialog.data(), label.data());
        }
      },
      Qt::QueuedConnection);
}

QString CDWaitDialog::displayText(const QString &text) const {
  if (text.isEmpty() && m_defaultTranslated) {
    return m_defaultText;
  }
  const QString &source = text.isEmpty() ? m_defaultText : text;
  return m_translator ? m_translator->translate(source) : source;
}

} // namespace ChannelDeck::editor::qt
