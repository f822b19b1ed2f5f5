#pragma once

/**
 * @file cd_wait_dialog.hpp
 * @brief Handle for a long-lived "please wait" dialog
 *
 * Background workers report progress through this handle. Every operation
 * is posted to the UI thread's event queue (Qt::QueuedConnection), so no
 * widget is touched from the calling thread, even when that thread is the
 * UI thread itself. Effects become visible once the event loop runs.
 */

#include <QPointer>
#include <QString>

#include <atomic>
#include <functional>
#include <memory>

class QDialog;
class QLabel;

namespace ChannelDeck::editor::qt {

class CDTranslator;

class CDWaitDialog {
public:
  static constexpr const char* LABEL_OBJECT_NAME = "wait_dialog_label";

  /**
   * @param dialog Dialog built from wait_dialog.ui; ownership is taken
   * @param translator Translates texts before display
   * @param text Default text (untranslated); the markup's label text when empty
   */
  CDWaitDialog(std::unique_ptr<QDialog> dialog, std::shared_ptr<const CDTranslator> translator,
               const QString& text = QString());
  ~CDWaitDialog();

  CDWaitDialog(const CDWaitDialog&) = delete;
  CDWaitDialog& operator=(const CDWaitDialog&) = delete;

  /// Set the text (default text when empty) and show the dialog
  void show(const QString& text = QString());

  /// Empty text restores the default text
  void setText(const QString& text);

  void hide();

  /// Schedule deletion of the dialog; this and later calls are no-ops after the first
  void destroy();

  [[nodiscard]] const QString& defaultText() const { return m_defaultText; }

  /// The underlying dialog; null once it has been deleted. UI thread only.
  [[nodiscard]] QDialog* dialog() const { return m_dialog.data(); }

private:
  void post(std::function<void(QDialog*, QLabel*)> action) const;
  [[nodiscard]] QString displayText(const QString& text) const;

  // Set once in the constructor; only dereferenced on the UI thread
  const QPointer<QDialog> m_dialog;
  const QPointer<QLabel> m_label;
  std::shared_ptr<const CDTranslator> m_translator;
  QString m_defaultText;
  // The markup default was already translated when the dialog was built
  bool m_defaultTranslated = false;
  std::atomic<bool> m_destroyed{false};
};

} // namespace ChannelDeck::editor::qt
