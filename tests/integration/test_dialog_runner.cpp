/**
 * @file test_dialog_runner.cpp
 * @brief Integration tests for CDModalDialogRunner
 *
 * The modal loop is entered for real; a zero-timeout timer dismisses the
 * dialog from inside it.
 */

#include <catch2/catch_test_macros.hpp>

#include "ChannelDeck/editor/qt/cd_dialog_runner.hpp"
#include "qt_test_fixture.hpp"

#include <QDialog>
#include <QDialogButtonBox>
#include <QDir>
#include <QFile>
#include <QFileDialog>
#include <QFileInfo>
#include <QTemporaryDir>
#include <QTimer>

using namespace ChannelDeck::editor::qt;

namespace {

void prepareChooser(QFileDialog& dialog, const QTemporaryDir& dir) {
  dialog.setOption(QFileDialog::DontUseNativeDialog);
  dialog.setFileMode(QFileDialog::ExistingFile);
  dialog.setDirectory(dir.path());
}

} // namespace

// =============================================================================
// Modal Dialogs
// =============================================================================

TEST_CASE("Modal runner returns the dialog's result code", "[integration][runner]") {
  QtTestFixture fixture;
  CDModalDialogRunner runner;
  QDialog dialog;

  QTimer::singleShot(0, &dialog, [&dialog]() { dialog.done(QDialogButtonBox::Ok); });
  REQUIRE(runner.exec(dialog) == QDialogButtonBox::Ok);
  REQUIRE_FALSE(dialog.isVisible());
}

// =============================================================================
// File Choosers
// =============================================================================

TEST_CASE("Modal runner file chooser", "[integration][runner][chooser]") {
  QtTestFixture fixture;
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  CDModalDialogRunner runner;
  QFileDialog dialog;
  prepareChooser(dialog, dir);

  SECTION("Accepting without a selection yields the current directory") {
    QTimer::singleShot(0, &dialog, [&dialog]() { dialog.QDialog::accept(); });
    const QStringList files = runner.chooseFiles(dialog);

    REQUIRE(files.size() == 1);
    REQUIRE(QDir(files.first()).canonicalPath() == QDir(dir.path()).canonicalPath());
  }

  SECTION("Accepting with a typed file name yields that file") {
    const QString path = dir.filePath(QStringLiteral("lamedb"));
    {
      QFile file(path);
      REQUIRE(file.open(QIODevice::WriteOnly));
      file.write("eDVB services /4/\n");
    }
    dialog.selectFile(QStringLiteral("lamedb"));

    QTimer::singleShot(0, &dialog, [&dialog]() { dialog.QDialog::accept(); });
    const QStringList files = runner.chooseFiles(dialog);

    REQUIRE(files.size() == 1);
    REQUIRE(QFileInfo(files.first()).fileName() == QStringLiteral("lamedb"));
  }

  SECTION("Rejecting yields no paths") {
    QTimer::singleShot(0, &dialog, [&dialog]() { dialog.QDialog::reject(); });
    REQUIRE(runner.chooseFiles(dialog).isEmpty());
  }
}
