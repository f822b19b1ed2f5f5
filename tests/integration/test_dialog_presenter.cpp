/**
 * @file test_dialog_presenter.cpp
 * @brief Integration tests for CDDialogPresenter
 *
 * Dialogs are built from the bundled resources and operated through
 * ScriptedDialogRunner, which clicks the same buttons a user would.
 */

#include <catch2/catch_test_macros.hpp>

#include "ChannelDeck/editor/interfaces/MockFileSystem.hpp"
#include "ChannelDeck/editor/qt/cd_dialog_presenter.hpp"
#include "qt_test_fixture.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QLabel>
#include <QLineEdit>
#include <QTemporaryDir>

#include <memory>

using namespace ChannelDeck;
using namespace ChannelDeck::editor;
using namespace ChannelDeck::editor::qt;

namespace {

const char* const kMockInputMarkup = R"(<?xml version="1.0" encoding="UTF-8"?>
<ui version="4.0">
 <class>InputDialog</class>
 <widget class="QDialog" name="input_dialog">
  <layout class="QVBoxLayout" name="layout">
   <item>
    <widget class="QLineEdit" name="input_entry"/>
   </item>
   <item>
    <widget class="QDialogButtonBox" name="button_box">
     <property name="standardButtons">
      <set>QDialogButtonBox::Cancel|QDialogButtonBox::Ok</set>
     </property>
    </widget>
   </item>
  </layout>
 </widget>
</ui>
)";

struct PresenterSetup {
  explicit PresenterSetup(platform::HostEnvironment environment = {}) {
    settings.setProfileDataPath(profileDir.path());
    runner = std::make_shared<ScriptedDialogRunner>();
    presenter = std::make_unique<CDDialogPresenter>(settings, environment, nullptr, runner);
  }

  QTemporaryDir profileDir;
  AppSettings settings;
  std::shared_ptr<ScriptedDialogRunner> runner;
  std::unique_ptr<CDDialogPresenter> presenter;
};

int responseCode(const Result<CDDialogResult>& result) {
  REQUIRE(result.isOk());
  const auto* response = std::get_if<CDResponseResult>(&result.value());
  REQUIRE(response != nullptr);
  return response->code;
}

QString canonical(const QString& path) { return QFileInfo(path).canonicalFilePath(); }

} // namespace

// =============================================================================
// Message Dialogs
// =============================================================================

TEST_CASE("Presenter: info and error dialogs", "[integration][presenter][message]") {
  QtTestFixture fixture;
  PresenterSetup setup;

  QString shownText;
  QString shownType;
  bool hasCancel = true;
  setup.runner->script = [&](QDialog& dialog) {
    auto* label = dialog.findChild<QLabel*>(QStringLiteral("message_label"));
    REQUIRE(label != nullptr);
    shownText = label->text();
    shownType = dialog.property("messageType").toString();
    auto* box = dialog.findChild<QDialogButtonBox*>(QStringLiteral("button_box"));
    hasCancel = box->button(QDialogButtonBox::Cancel) != nullptr;
    clickButton(dialog, QDialogButtonBox::Ok);
  };

  CDDialogRequest request;
  request.text = QStringLiteral("Bouquets saved.");

  SECTION("Info returns the OK response") {
    auto result = setup.presenter->present(CDDialogKind::Info, nullptr, request);
    REQUIRE(responseCode(result) == QDialogButtonBox::Ok);
    REQUIRE(shownText == QStringLiteral("Bouquets saved."));
    REQUIRE(shownType == QStringLiteral("info"));
    REQUIRE_FALSE(hasCancel);
  }

  SECTION("Error returns the OK response") {
    request.text = QStringLiteral("Receiver not reachable.");
    auto result = setup.presenter->present(CDDialogKind::Error, nullptr, request);
    REQUIRE(responseCode(result) == QDialogButtonBox::Ok);
    REQUIRE(shownText == QStringLiteral("Receiver not reachable."));
    REQUIRE(shownType == QStringLiteral("error"));
  }

  SECTION("Window title defaults to the application name") {
    REQUIRE(setup.presenter->present(CDDialogKind::Info, nullptr, request).isOk());
    REQUIRE(setup.runner->lastWindowTitle == QGuiApplication::applicationDisplayName());
  }

  SECTION("Explicit titles are used") {
    request.title = QStringLiteral("Upload <done>");
    REQUIRE(setup.presenter->present(CDDialogKind::Info, nullptr, request).isOk());
    REQUIRE(setup.runner->lastWindowTitle == QStringLiteral("Upload <done>"));
  }
}

TEST_CASE("Presenter: question dialogs", "[integration][presenter][message]") {
  QtTestFixture fixture;
  PresenterSetup setup;

  SECTION("Default question offers OK and Cancel") {
    QString shownText;
    bool hasOk = false;
    setup.runner->script = [&](QDialog& dialog) {
      shownText = dialog.findChild<QLabel*>(QStringLiteral("message_label"))->text();
      auto* box = dialog.findChild<QDialogButtonBox*>(QStringLiteral("button_box"));
      hasOk = box->button(QDialogButtonBox::Ok) != nullptr;
      clickButton(dialog, QDialogButtonBox::Cancel);
    };

    auto result = setup.presenter->present(CDDialogKind::Question, nullptr);
    REQUIRE(responseCode(result) == QDialogButtonBox::Cancel);
    REQUIRE(shownText == QStringLiteral("Are you sure?"));
    REQUIRE(hasOk);
  }

  SECTION("OK is reported as OK") {
    setup.runner->script = [](QDialog& dialog) { clickButton(dialog, QDialogButtonBox::Ok); };
    CDDialogRequest request;
    request.text = QStringLiteral("Remove 3 services?");
    auto result = setup.presenter->present(CDDialogKind::Question, nullptr, request);
    REQUIRE(responseCode(result) == QDialogButtonBox::Ok);
  }

  SECTION("Caller supplied buttons") {
    setup.runner->script = [](QDialog& dialog) { clickButton(dialog, QDialogButtonBox::No); };
    CDDialogRequest request;
    request.text = QStringLiteral("Overwrite the receiver's bouquets?");
    request.buttons = QDialogButtonBox::Yes | QDialogButtonBox::No;
    auto result = setup.presenter->present(CDDialogKind::Question, nullptr, request);
    REQUIRE(responseCode(result) == QDialogButtonBox::No);
  }

  SECTION("Dismissing without a button yields no response") {
    setup.runner->script = [](QDialog& dialog) { dialog.reject(); };
    auto result = setup.presenter->present(CDDialogKind::Question, nullptr);
    REQUIRE(responseCode(result) == QDialogButtonBox::NoButton);
  }
}

TEST_CASE("Presenter: message texts are translated", "[integration][presenter][translation]") {
  QtTestFixture fixture;
  InMemoryTranslator catalog;
  catalog.add("channeldeck", "Are you sure?", QStringLiteral("Sind Sie sicher?"));
  ScopedTranslator installed(&catalog);

  PresenterSetup setup;
  QString shownText;
  setup.runner->script = [&](QDialog& dialog) {
    shownText = dialog.findChild<QLabel*>(QStringLiteral("message_label"))->text();
  };

  REQUIRE(setup.presenter->present(CDDialogKind::Question, nullptr).isOk());
  REQUIRE(shownText == QStringLiteral("Sind Sie sicher?"));
  REQUIRE(setup.presenter->translate(QStringLiteral("Unknown Key")) ==
          QStringLiteral("Unknown Key"));
}

TEST_CASE("Presenter: message template", "[integration][presenter][message]") {
  const QString markup = CDDialogPresenter::messageTemplate();
  REQUIRE(markup.startsWith(QStringLiteral("<?xml")));
  for (const char* field : {"{title}", "{use_header}", "{message_type}", "{buttons_type}"}) {
    REQUIRE(markup.contains(QLatin1String(field)));
  }
}

// =============================================================================
// About Dialog
// =============================================================================

TEST_CASE("Presenter: about dialog", "[integration][presenter][about]") {
  QtTestFixture fixture;
  PresenterSetup setup;
  QCoreApplication::setApplicationVersion(QStringLiteral("2.4.1"));

  QString version;
  setup.runner->script = [&](QDialog& dialog) {
    version = dialog.findChild<QLabel*>(QStringLiteral("version_label"))->text();
    clickButton(dialog, QDialogButtonBox::Close);
  };

  auto result = setup.presenter->present(CDDialogKind::About, nullptr);
  REQUIRE(responseCode(result) == QDialogButtonBox::Close);
  REQUIRE(version == QStringLiteral("2.4.1"));

  QCoreApplication::setApplicationVersion(QString());
}

// =============================================================================
// Input Dialog
// =============================================================================

TEST_CASE("Presenter: input dialog", "[integration][presenter][input]") {
  QtTestFixture fixture;
  PresenterSetup setup;

  CDDialogRequest request;
  request.text = QStringLiteral("Favourites");

  SECTION("Entry is pre-filled and the confirmed text returned") {
    QString prefilled;
    setup.runner->script = [&](QDialog& dialog) {
      auto* entry = dialog.findChild<QLineEdit*>(QStringLiteral("input_entry"));
      prefilled = entry->text();
      entry->setText(QStringLiteral("Sports HD"));
      clickButton(dialog, QDialogButtonBox::Ok);
    };

    auto result = setup.presenter->present(CDDialogKind::Input, nullptr, request);
    REQUIRE(result.isOk());
    const auto* text = std::get_if<CDTextResult>(&result.value());
    REQUIRE(text != nullptr);
    REQUIRE(text->text == QStringLiteral("Sports HD"));
    REQUIRE(prefilled == QStringLiteral("Favourites"));
  }

  SECTION("Confirming an empty entry returns an empty text") {
    setup.runner->script = [](QDialog& dialog) {
      dialog.findChild<QLineEdit*>(QStringLiteral("input_entry"))->clear();
      clickButton(dialog, QDialogButtonBox::Ok);
    };

    auto result = setup.presenter->present(CDDialogKind::Input, nullptr, request);
    REQUIRE(result.isOk());
    const auto* text = std::get_if<CDTextResult>(&result.value());
    REQUIRE(text != nullptr);
    REQUIRE(text->text.isEmpty());
  }

  SECTION("Cancel discards the entered text") {
    setup.runner->script = [](QDialog& dialog) {
      dialog.findChild<QLineEdit*>(QStringLiteral("input_entry"))->setText(QStringLiteral("x"));
      clickButton(dialog, QDialogButtonBox::Cancel);
    };

    auto result = setup.presenter->present(CDDialogKind::Input, nullptr, request);
    REQUIRE(result.isOk());
    REQUIRE(isCancelled(result.value()));
  }
}

TEST_CASE("Presenter: header follows the desktop session", "[integration][presenter][input]") {
  QtTestFixture fixture;

  bool headerHidden = false;
  auto inspectHeader = [&headerHidden](QDialog& dialog) {
    auto* header = dialog.findChild<QLabel*>(QStringLiteral("header_label"));
    REQUIRE(header != nullptr);
    headerHidden = header->isHidden();
  };

  SECTION("GNOME sessions show the header") {
    PresenterSetup setup(platform::HostEnvironment{false, true});
    setup.runner->script = inspectHeader;
    REQUIRE(setup.presenter->present(CDDialogKind::Input, nullptr).isOk());
    REQUIRE_FALSE(headerHidden);
  }

  SECTION("Other sessions hide it") {
    PresenterSetup setup(platform::HostEnvironment{false, false});
    setup.runner->script = inspectHeader;
    REQUIRE(setup.presenter->present(CDDialogKind::Input, nullptr).isOk());
    REQUIRE(headerHidden);
  }
}

// =============================================================================
// Chooser
// =============================================================================

TEST_CASE("Presenter: folder chooser", "[integration][presenter][chooser]") {
  QtTestFixture fixture;
  PresenterSetup setup;
  QTemporaryDir picked;
  REQUIRE(picked.isValid());

  SECTION("Directories end with a separator") {
    setup.runner->chosenPaths = {picked.path()};
    auto result = setup.presenter->present(CDDialogKind::Chooser, nullptr);
    REQUIRE(result.isOk());
    const auto* path = std::get_if<CDPathResult>(&result.value());
    REQUIRE(path != nullptr);
    REQUIRE(path->path ==
            QDir::toNativeSeparators(canonical(picked.path())) + QDir::separator());

    REQUIRE(setup.runner->chooserFileMode == QFileDialog::Directory);
    REQUIRE(setup.runner->chooserDirsOnly);
  }

  SECTION("A trailing separator is not doubled") {
    setup.runner->chosenPaths = {picked.path() + QLatin1Char('/')};
    auto result = setup.presenter->present(CDDialogKind::Chooser, nullptr);
    REQUIRE(result.isOk());
    const QString& path = std::get<CDPathResult>(result.value()).path;
    REQUIRE(path.endsWith(QDir::separator()));
    REQUIRE_FALSE(path.endsWith(QString(QDir::separator()) + QDir::separator()));
  }

  SECTION("The chooser opens in the profile data directory") {
    REQUIRE(setup.presenter->present(CDDialogKind::Chooser, nullptr).isOk());
    REQUIRE(canonical(setup.runner->chooserDirectory) == canonical(setup.profileDir.path()));
  }

  SECTION("Per-call settings override the presenter's") {
    AppSettings other;
    other.setProfileDataPath(picked.path());
    CDDialogRequest request;
    request.settings = &other;
    REQUIRE(setup.presenter->present(CDDialogKind::Chooser, nullptr, request).isOk());
    REQUIRE(canonical(setup.runner->chooserDirectory) == canonical(picked.path()));
  }

  SECTION("Folder creation follows createDirs") {
    CDDialogRequest request;
    REQUIRE(setup.presenter->present(CDDialogKind::Chooser, nullptr, request).isOk());
    REQUIRE(setup.runner->chooserReadOnly);

    request.createDirs = true;
    REQUIRE(setup.presenter->present(CDDialogKind::Chooser, nullptr, request).isOk());
    REQUIRE_FALSE(setup.runner->chooserReadOnly);
  }

  SECTION("Cancelling returns a cancellation") {
    setup.runner->chosenPaths.clear();
    auto result = setup.presenter->present(CDDialogKind::Chooser, nullptr);
    REQUIRE(result.isOk());
    REQUIRE(isCancelled(result.value()));
  }
}

TEST_CASE("Presenter: file chooser", "[integration][presenter][chooser]") {
  QtTestFixture fixture;
  PresenterSetup setup;
  QTemporaryDir dir;
  REQUIRE(dir.isValid());

  const QString filePath = dir.filePath(QStringLiteral("satellites.xml"));
  QFile file(filePath);
  REQUIRE(file.open(QIODevice::WriteOnly));
  file.write("<satellites/>");
  file.close();

  SECTION("Files are returned without a separator") {
    setup.runner->chosenPaths = {filePath};
    auto result = setup.presenter->chooseFile(nullptr, QStringLiteral("Satellites"),
                                              {QStringLiteral("*.xml")},
                                              QStringLiteral("Open satellites"));
    REQUIRE(result.isOk());
    const auto* path = std::get_if<CDPathResult>(&result.value());
    REQUIRE(path != nullptr);
    REQUIRE(path->path == QDir::toNativeSeparators(canonical(filePath)));

    REQUIRE(setup.runner->chooserFileMode == QFileDialog::ExistingFile);
    REQUIRE(setup.runner->chooserAcceptMode == QFileDialog::AcceptOpen);
    REQUIRE(setup.runner->chooserNameFilters ==
            QStringList{QStringLiteral("Satellites (*.xml)")});
    REQUIRE(setup.runner->chooserTitle == QStringLiteral("Open satellites"));
  }

  SECTION("Save choosers accept new file names") {
    const QString newFile = dir.filePath(QStringLiteral("lamedb"));
    setup.runner->chosenPaths = {newFile};
    CDDialogRequest request;
    request.chooserAction = CDChooserAction::Save;
    auto result = setup.presenter->present(CDDialogKind::Chooser, nullptr, request);
    REQUIRE(result.isOk());
    REQUIRE(std::get<CDPathResult>(result.value()).path ==
            QDir::toNativeSeparators(QFileInfo(newFile).absoluteFilePath()));
    REQUIRE(setup.runner->chooserAcceptMode == QFileDialog::AcceptSave);
    REQUIRE(setup.runner->chooserFileMode == QFileDialog::AnyFile);
  }
}

TEST_CASE("Presenter: chosen path resolution", "[integration][presenter][chooser]") {
  QTemporaryDir dir;
  REQUIRE(dir.isValid());
  QDir(dir.path()).mkdir(QStringLiteral("bouquets"));

  const QString viaDots = dir.path() + QStringLiteral("/bouquets/../bouquets");
  REQUIRE(CDDialogPresenter::resolveChosenPath(viaDots) ==
          QDir::toNativeSeparators(canonical(dir.filePath(QStringLiteral("bouquets")))) +
              QDir::separator());
}

// =============================================================================
// Resources
// =============================================================================

TEST_CASE("Presenter: dialog resources are cached", "[integration][presenter][resources]") {
  QtTestFixture fixture;
  auto fileSystem = std::make_shared<MockFileSystem>();
  fileSystem->addMockFile("/opt/channeldeck/ui/input_dialog.ui", kMockInputMarkup);

  AppSettings settings;
  settings.setUiResourcesPath(QStringLiteral("/opt/channeldeck/ui"));
  auto runner = std::make_shared<ScriptedDialogRunner>();
  CDDialogPresenter presenter(settings, {}, fileSystem, runner);

  runner->script = [](QDialog& dialog) { clickButton(dialog, QDialogButtonBox::Ok); };
  REQUIRE(presenter.present(CDDialogKind::Input, nullptr).isOk());
  REQUIRE(presenter.present(CDDialogKind::Input, nullptr).isOk());
  REQUIRE(fileSystem->getReadCount("/opt/channeldeck/ui/input_dialog.ui") == 1);

  auto markup = presenter.loadResource(QStringLiteral("/opt/channeldeck/ui/input_dialog.ui"));
  REQUIRE(markup.isOk());
  REQUIRE(fileSystem->getReadCount() == 1);
}

TEST_CASE("Presenter: missing resources are errors", "[integration][presenter][resources]") {
  QtTestFixture fixture;
  auto fileSystem = std::make_shared<MockFileSystem>();
  AppSettings settings;
  settings.setUiResourcesPath(QStringLiteral("/opt/channeldeck/ui"));
  auto runner = std::make_shared<ScriptedDialogRunner>();
  CDDialogPresenter presenter(settings, {}, fileSystem, runner);

  auto result = presenter.present(CDDialogKind::About, nullptr);
  REQUIRE(result.isError());
  REQUIRE(result.error().find("about_dialog.ui") != std::string::npos);
  REQUIRE(runner->execCount == 0);
}

TEST_CASE("Presenter: wait kind returns a handle", "[integration][presenter][wait]") {
  QtTestFixture fixture;
  PresenterSetup setup;

  CDDialogRequest request;
  request.text = QStringLiteral("Reading lamedb...");
  auto result = setup.presenter->present(CDDialogKind::Wait, nullptr, request);
  REQUIRE(result.isOk());

  const auto* handle = std::get_if<std::shared_ptr<CDWaitDialog>>(&result.value());
  REQUIRE(handle != nullptr);
  REQUIRE(*handle != nullptr);
  REQUIRE((*handle)->dialog() != nullptr);
  REQUIRE((*handle)->defaultText() == QStringLiteral("Reading lamedb..."));
  REQUIRE(setup.runner->execCount == 0);
}
