#pragma once

/**
 * @file cd_dialog_runner.hpp
 * @brief Runs constructed dialogs modally
 *
 * CDDialogPresenter builds and configures dialogs; a runner decides how
 * they are shown. The production runner enters the toolkit's modal loop.
 * Tests substitute a runner that operates the dialog's widgets instead.
 */

#include <QStringList>

class QDialog;
class QFileDialog;

namespace ChannelDeck::editor::qt {

class CDDialogRunner {
public:
  virtual ~CDDialogRunner() = default;

  /**
   * @brief Show @p dialog modally and block until it is dismissed
   * @return The dialog's result code
   */
  virtual int exec(QDialog& dialog) = 0;

  /**
   * @brief Show a file chooser modally
   * @return Selected paths, empty when the user cancelled
   */
  virtual QStringList chooseFiles(QFileDialog& dialog) = 0;
};

class CDModalDialogRunner final : public CDDialogRunner {
public:
  int exec(QDialog& dialog) override;
  QStringList chooseFiles(QFileDialog& dialog) override;
};

} // namespace ChannelDeck::editor::qt
