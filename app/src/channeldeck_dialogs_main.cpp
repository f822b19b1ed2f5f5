/**
 * @file channeldeck_dialogs_main.cpp
 * @brief ChannelDeck dialog tool - Main Entry Point
 *
 * Presents one of the standard dialogs and prints its result, so scripts
 * and packagers can check dialogs, resources and translations without
 * starting the whole editor.
 *
 * Usage:
 *   channeldeck-dialogs --kind info --text "Done"
 *   channeldeck-dialogs --kind question --text "Remove bouquet?"
 *   channeldeck-dialogs --kind chooser --action open --filter "Satellites (*.xml)"
 *   channeldeck-dialogs --kind input --text "Favourites"
 *   channeldeck-dialogs --kind wait --text "Downloading..." --seconds 3
 *   channeldeck-dialogs --config settings.json --lang de --kind about
 *
 * Exit status: 0 on a confirmed result, 1 on cancellation, 2 on errors.
 */

#include "ChannelDeck/core/logger.hpp"
#include "ChannelDeck/editor/app_settings.hpp"
#include "ChannelDeck/editor/qt/cd_dialog_presenter.hpp"
#include "ChannelDeck/platform/host_environment.hpp"

#include <QApplication>
#include <QCommandLineParser>
#include <QTimer>

#include <chrono>
#include <iostream>
#include <optional>
#include <thread>

using namespace ChannelDeck;
using namespace ChannelDeck::editor;
using namespace ChannelDeck::editor::qt;

namespace {

constexpr int kExitConfirmed = 0;
constexpr int kExitCancelled = 1;
constexpr int kExitError = 2;

std::optional<CDDialogKind> kindFromName(const QString& name) {
  for (auto kind : {CDDialogKind::Input, CDDialogKind::Chooser, CDDialogKind::Error,
                    CDDialogKind::Question, CDDialogKind::Info, CDDialogKind::About,
                    CDDialogKind::Wait}) {
    if (dialogKindName(kind) == name) {
      return kind;
    }
  }
  return std::nullopt;
}

std::optional<CDChooserAction> actionFromName(const QString& name) {
  if (name == QLatin1String("open"))
    return CDChooserAction::Open;
  if (name == QLatin1String("save"))
    return CDChooserAction::Save;
  if (name == QLatin1String("folder"))
    return CDChooserAction::SelectFolder;
  return std::nullopt;
}

int printResult(const CDDialogResult& result) {
  if (const auto* text = std::get_if<CDTextResult>(&result)) {
    std::cout << text->text.toStdString() << '\n';
    return kExitConfirmed;
  }
  if (const auto* path = std::get_if<CDPathResult>(&result)) {
    std::cout << path->path.toStdString() << '\n';
    return kExitConfirmed;
  }
  if (const auto* response = std::get_if<CDResponseResult>(&result)) {
    std::cout << response->code << '\n';
    return response->code == QDialogButtonBox::Cancel ||
                   response->code == QDialogButtonBox::NoButton
               ? kExitCancelled
               : kExitConfirmed;
  }
  std::cout << "cancelled\n";
  return kExitCancelled;
}

int runWaitDialog(QApplication& app, const std::shared_ptr<CDWaitDialog>& wait, int seconds) {
  wait->show();

  // Progress is reported from a worker, as a long-running job would
  std::thread worker([wait, seconds]() {
    for (int remaining = seconds; remaining > 0; --remaining) {
      // Source texts; the handle translates them
      wait->setText(remaining > 1 ? QStringLiteral("Working...")
                                  : QStringLiteral("Finishing..."));
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    wait->destroy();
  });

  QTimer::singleShot(std::chrono::seconds(seconds) + std::chrono::milliseconds(200), &app,
                     &QApplication::quit);
  const int status = app.exec();
  worker.join();
  return status == 0 ? kExitConfirmed : kExitError;
}

int runDialogTool(int argc, char* argv[]) {
  QApplication app(argc, argv);
  QApplication::setApplicationName(QStringLiteral("channeldeck-dialogs"));
  QApplication::setApplicationDisplayName(QStringLiteral("ChannelDeck"));
  QApplication::setApplicationVersion(QStringLiteral(CHANNELDECK_VERSION));

  QCommandLineParser parser;
  parser.setApplicationDescription(QStringLiteral("Presents a ChannelDeck dialog."));
  parser.addHelpOption();
  parser.addVersionOption();

  QCommandLineOption kindOption(
      {QStringLiteral("k"), QStringLiteral("kind")},
      QStringLiteral("Dialog kind: input, chooser, error, question, info, about, wait."),
      QStringLiteral("kind"), QStringLiteral("info"));
  QCommandLineOption textOption({QStringLiteral("t"), QStringLiteral("text")},
                                QStringLiteral("Message, input pre-fill or wait text."),
                                QStringLiteral("text"));
  QCommandLineOption titleOption(QStringLiteral("title"), QStringLiteral("Dialog title."),
                                 QStringLiteral("title"));
  QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
                                  QStringLiteral("Settings file (JSON)."),
                                  QStringLiteral("file"));
  QCommandLineOption langOption(QStringLiteral("lang"),
                                QStringLiteral("Locale of the translation catalog."),
                                QStringLiteral("locale"));
  QCommandLineOption actionOption(QStringLiteral("action"),
                                  QStringLiteral("Chooser action: open, save, folder."),
                                  QStringLiteral("action"), QStringLiteral("folder"));
  QCommandLineOption filterOption(QStringLiteral("filter"),
                                  QStringLiteral("Chooser name filter, may be repeated."),
                                  QStringLiteral("filter"));
  QCommandLineOption createDirsOption(QStringLiteral("create-dirs"),
                                      QStringLiteral("Allow creating folders in the chooser."));
  QCommandLineOption secondsOption(QStringLiteral("seconds"),
                                   QStringLiteral("How long the wait dialog stays open."),
                                   QStringLiteral("seconds"), QStringLiteral("3"));
  QCommandLineOption logFileOption(QStringLiteral("log-file"),
                                   QStringLiteral("Append log output to a file."),
                                   QStringLiteral("file"));
  parser.addOptions({kindOption, textOption, titleOption, configOption, langOption, actionOption,
                     filterOption, createDirsOption, secondsOption, logFileOption});
  parser.process(app);

  auto& logger = core::Logger::instance();
  if (parser.isSet(logFileOption)) {
    logger.setOutputFile(parser.value(logFileOption).toStdString());
  }

  auto settings = AppSettings::loadFromFile(parser.value(configOption));
  if (settings.isError()) {
    CHANNELDECK_LOG_ERROR(settings.error());
    return kExitError;
  }
  logger.setLevel(settings.value().logLevel());

  const auto kind = kindFromName(parser.value(kindOption));
  if (!kind) {
    CHANNELDECK_LOG_ERROR("Unknown dialog kind: " + parser.value(kindOption).toStdString());
    return kExitError;
  }
  const auto action = actionFromName(parser.value(actionOption));
  if (!action) {
    CHANNELDECK_LOG_ERROR("Unknown chooser action: " + parser.value(actionOption).toStdString());
    return kExitError;
  }

  CDDialogPresenter presenter(settings.value(), platform::HostEnvironment::detect());

  const QString locale =
      parser.isSet(langOption) ? parser.value(langOption) : settings.value().locale();
  if (!settings.value().translationsPath().isEmpty()) {
    auto catalog = presenter.translator().loadCatalog(locale, settings.value().translationsPath());
    if (catalog.isError()) {
      // Untranslated dialogs are still usable
      CHANNELDECK_LOG_WARN(catalog.error());
    }
  }

  CDDialogRequest request;
  request.text = parser.value(textOption);
  request.title = parser.value(titleOption);
  request.chooserAction = *action;
  request.nameFilters = parser.values(filterOption);
  request.createDirs = parser.isSet(createDirsOption);

  auto result = presenter.present(*kind, nullptr, request);
  if (result.isError()) {
    CHANNELDECK_LOG_ERROR("Failed to present dialog: " + result.error());
    return kExitError;
  }

  if (auto* wait = std::get_if<std::shared_ptr<CDWaitDialog>>(&result.value())) {
    bool ok = false;
    const int seconds = parser.value(secondsOption).toInt(&ok);
    return runWaitDialog(app, *wait, ok && seconds > 0 ? seconds : 3);
  }

  return printResult(result.value());
}

} // namespace

int main(int argc, char* argv[]) { return runDialogTool(argc, argv); }
