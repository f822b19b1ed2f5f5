/**
 * @file test_file_systems.cpp
 * @brief Integration tests for QtFileSystem and MockFileSystem
 */

#include <catch2/catch_test_macros.hpp>

#include "ChannelDeck/editor/interfaces/MockFileSystem.hpp"
#include "ChannelDeck/editor/interfaces/QtFileSystem.hpp"
#include "ChannelDeck/editor/qt/cd_dialog_presenter.hpp"
#include "qt_test_fixture.hpp"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

using namespace ChannelDeck;
using namespace ChannelDeck::editor;
using namespace ChannelDeck::editor::qt;

TEST_CASE("QtFileSystem reads disk files", "[integration][filesystem]") {
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  const QString path = dir.filePath(QStringLiteral("wait_dialog.ui"));
  {
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    file.write("<ui version=\"4.0\"/>\n");
  }

  QtFileSystem fs;
  const std::string base = dir.path().toStdString();
  const std::string joined = fs.joinPath(base, "wait_dialog.ui");
  REQUIRE(joined == path.toStdString());

  auto content = fs.readFile(joined);
  REQUIRE(content.isOk());
  REQUIRE(content.value() == "<ui version=\"4.0\"/>\n");

  auto missing = fs.readFile(fs.joinPath(base, "absent.ui"));
  REQUIRE(missing.isError());
  REQUIRE(missing.error().find("absent.ui") != std::string::npos);
}

TEST_CASE("QtFileSystem reads compiled-in resources", "[integration][filesystem]") {
  QtTestFixture fixture;
  // The presenter registers the bundled dialog resources
  CDDialogPresenter presenter(AppSettings(), {});

  QtFileSystem fs;
  const std::string path = fs.joinPath(":/ui/", "input_dialog.ui");
  REQUIRE(path == ":/ui/input_dialog.ui");
  auto content = fs.readFile(path);
  REQUIRE(content.isOk());
  REQUIRE(content.value().find("input_entry") != std::string::npos);
}

TEST_CASE("MockFileSystem serves files and counts reads", "[integration][filesystem]") {
  MockFileSystem fs;
  fs.addMockFile("/opt/channeldeck/ui/about_dialog.ui", "<ui/>");

  REQUIRE(fs.joinPath("/opt/channeldeck/ui/", "about_dialog.ui") ==
          "/opt/channeldeck/ui/about_dialog.ui");

  REQUIRE(fs.readFile("/opt/channeldeck/ui/about_dialog.ui").isOk());
  REQUIRE(fs.readFile("/opt/channeldeck/ui/missing.ui").isError());
  REQUIRE(fs.getReadCount() == 2);
  REQUIRE(fs.getReadCount("/opt/channeldeck/ui/about_dialog.ui") == 1);

  fs.removeMockFile("/opt/channeldeck/ui/about_dialog.ui");
  REQUIRE(fs.readFile("/opt/channeldeck/ui/about_dialog.ui").isError());
  REQUIRE(fs.getReadCount("/opt/channeldeck/ui/about_dialog.ui") == 2);

  fs.resetCounters();
  REQUIRE(fs.getReadCount() == 0);
}
