#include "ChannelDeck/editor/qt/cd_dialog_runner.hpp"

#include <QDialog>
#include <QDir>
#include <QFileDialog>

namespace ChannelDeck::editor::qt {

int CDModalDialogRunner::exec(QDialog &dialog) { return dialog.exec(); }

QStringList CDModalDialogRunner::chooseFiles(QFileDialog &dialog) {
  if (dialog.exec() != QDialog::Accepted) {
    return {};
  }

  QStringList files = dialog.selectedFiles();
  if (files.isEmpty()) {
    // Some native folder pickers accept without reporting a selection
    files << dialog.directory().absolutePath();
  }
  return files;
}

} // namespace ChannelDeck::editor::qt
