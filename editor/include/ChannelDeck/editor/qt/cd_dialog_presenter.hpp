#pragma once

/**
 * @file cd_dialog_presenter.hpp
 * @brief Presents the application's standard dialogs
 *
 * Translates a dialog kind into toolkit construction calls, runs the dialog
 * modally and returns a typed result:
 * - Info / Error: message box with OK, returns the button response code
 * - Question: message box with OK/Cancel or a caller-supplied button set
 * - Chooser: file or folder chooser opening in the settings' profile data
 *   directory, returns the resolved absolute path
 * - Input: text prompt, returns the entered text
 * - About: static information dialog, returns the button response code
 * - Wait: returns a CDWaitDialog handle instead of blocking
 *
 * Cancellation is a normal result (CDCancelled). Construction failures
 * (missing or malformed markup) are returned as errors.
 */

#include "ChannelDeck/core/result.hpp"
#include "ChannelDeck/editor/app_settings.hpp"
#include "ChannelDeck/editor/interfaces/IFileSystem.hpp"
#include "ChannelDeck/editor/qt/cd_dialog_runner.hpp"
#include "ChannelDeck/editor/qt/cd_translator.hpp"
#include "ChannelDeck/editor/qt/cd_ui_loader.hpp"
#include "ChannelDeck/editor/qt/cd_wait_dialog.hpp"
#include "ChannelDeck/platform/host_environment.hpp"

#include <QDialogButtonBox>
#include <QString>
#include <QStringList>

#include <memory>
#include <optional>
#include <variant>

class QDialog;
class QWidget;

namespace ChannelDeck::editor::qt {

enum class CDDialogKind { Input, Chooser, Error, Question, Info, About, Wait };

/// Lowercase name of a kind ("input", "chooser", ...); resources are "<name>_dialog.ui"
[[nodiscard]] QString dialogKindName(CDDialogKind kind);

enum class CDChooserAction { Open, Save, SelectFolder };

struct CDCancelled {};

struct CDTextResult {
  QString text;
};

struct CDPathResult {
  QString path;
};

struct CDResponseResult {
  /// QDialogButtonBox::StandardButton pressed; NoButton when dismissed
  int code = QDialogButtonBox::NoButton;
};

using CDDialogResult = std::variant<CDCancelled, CDTextResult, CDPathResult, CDResponseResult,
                                    std::shared_ptr<CDWaitDialog>>;

[[nodiscard]] inline bool isCancelled(const CDDialogResult& result) {
  return std::holds_alternative<CDCancelled>(result);
}

/**
 * @brief Optional parameters of CDDialogPresenter::present()
 */
struct CDDialogRequest {
  /// Message, input pre-fill or wait text
  QString text;
  /// Settings for the chooser; the presenter's own settings when null
  const AppSettings* settings = nullptr;
  /// Chooser mode; SelectFolder when unset
  std::optional<CDChooserAction> chooserAction;
  /// Chooser filters, e.g. "Bouquets (*.tv *.radio)"
  QStringList nameFilters;
  /// Question buttons; Ok|Cancel when unset
  std::optional<QDialogButtonBox::StandardButtons> buttons;
  QString title;
  /// Allow the chooser to create folders
  bool createDirs = false;
};

class CDDialogPresenter {
public:
  /**
   * @param settings Resource path, text domain and chooser base directory
   * @param environment Platform checks (header usage, markup translation)
   * @param fileSystem Resource reader; QtFileSystem when null
   * @param runner Modal loop; CDModalDialogRunner when null
   */
  CDDialogPresenter(AppSettings settings, platform::HostEnvironment environment,
                    std::shared_ptr<IFileSystem> fileSystem = nullptr,
                    std::shared_ptr<CDDialogRunner> runner = nullptr);
  ~CDDialogPresenter();

  CDDialogPresenter(const CDDialogPresenter&) = delete;
  CDDialogPresenter& operator=(const CDDialogPresenter&) = delete;

  /**
   * @brief Show a dialog of @p kind above @p parent
   *
   * Blocks until the dialog is dismissed, except for Wait.
   */
  Result<CDDialogResult> present(CDDialogKind kind, QWidget* parent,
                                 const CDDialogRequest& request = {});

  /**
   * @brief Open-file chooser limited to one named set of glob patterns
   * @param filterName Filter label, e.g. "Satellites"
   * @param patterns Glob patterns, e.g. {"*.xml"}
   */
  Result<CDDialogResult> chooseFile(QWidget* parent, const QString& filterName,
                                    const QStringList& patterns, const QString& title = QString(),
                                    const AppSettings* settings = nullptr);

  Result<std::shared_ptr<CDWaitDialog>> createWaitDialog(QWidget* parent,
                                                         const QString& text = QString());

  /// Markup of a dialog resource, served from the resource cache
  Result<QString> loadResource(const QString& path) { return m_uiLoader->loadResource(path); }

  [[nodiscard]] QString translate(const QString& key) const { return m_translator->translate(key); }

  /**
   * @brief Absolute canonical form of a chosen path
   *
   * Directories end with the native separator, files do not. Paths that do
   * not exist (a new file name from a save chooser) are made absolute only.
   */
  [[nodiscard]] static QString resolveChosenPath(const QString& path);

  /// Markup used for message boxes; fields: title, use_header, message_type, buttons_type
  [[nodiscard]] static QString messageTemplate();

  [[nodiscard]] const AppSettings& settings() const { return m_settings; }
  [[nodiscard]] const platform::HostEnvironment& environment() const { return m_environment; }
  [[nodiscard]] CDTranslator& translator() { return *m_translator; }
  [[nodiscard]] CDUiLoader& uiLoader() { return *m_uiLoader; }

private:
  Result<CDDialogResult> showMessage(CDDialogKind kind, QWidget* parent,
                                     QDialogButtonBox::StandardButtons buttons,
                                     const QString& text, const QString& title);
  Result<CDDialogResult> showChooser(QWidget* parent, const CDDialogRequest& request);
  Result<CDDialogResult> showInput(QWidget* parent, const CDDialogRequest& request);
  Result<CDDialogResult> showAbout(QWidget* parent);

  Result<std::unique_ptr<QDialog>> dialogFromResource(CDDialogKind kind, QWidget* parent,
                                                      bool useHeader,
                                                      const QString& title = QString());
  [[nodiscard]] QString resourcePath(CDDialogKind kind) const;
  [[nodiscard]] QString windowTitle(const QString& title) const;

  AppSettings m_settings;
  platform::HostEnvironment m_environment;
  std::shared_ptr<IFileSystem> m_fileSystem;
  std::shared_ptr<CDDialogRunner> m_runner;
  std::shared_ptr<CDTranslator> m_translator;
  std::unique_ptr<CDUiLoader> m_uiLoader;
};

} // namespace ChannelDeck::editor::qt
