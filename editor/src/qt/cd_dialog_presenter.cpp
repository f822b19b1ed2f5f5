#include "ChannelDeck/editor/qt/cd_dialog_presenter.hpp"
#include "ChannelDeck/core/logger.hpp"
#include "ChannelDeck/editor/interfaces/QtFileSystem.hpp"
#include "cd_dialogs_detail.hpp"

#include <QCoreApplication>
#include <QDialog>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QGuiApplication>
#include <QLabel>
#include <QLineEdit>

// Q_INIT_RESOURCE must be expanded outside of any namespace
static void initDialogResources() { Q_INIT_RESOURCE(channeldeck_dialogs); }

namespace ChannelDeck::editor::qt {

namespace {

const char *const kMessageTemplate = R"(<?xml version="1.0" encoding="UTF-8"?>
<ui version="4.0">
 <class>MessageDialog</class>
 <widget class="QDialog" name="message_dialog">
  <property name="minimumSize">
   <size>
    <width>250</width>
    <height>0</height>
   </size>
  </property>
  <property name="modal">
   <bool>true</bool>
  </property>
  <property name="windowTitle">
   <string notr="true">{title}</string>
  </property>
  <property name="messageType" stdset="0">
   <string notr="true">{message_type}</string>
  </property>
  <layout class="QVBoxLayout" name="message_layout">
   <item>
    <widget class="QLabel" name="header_label">
     <property name="visible">
      <bool>{use_header}</bool>
     </property>
     <property name="text">
      <string notr="true">{title}</string>
     </property>
    </widget>
   </item>
   <item>
    <layout class="QHBoxLayout" name="content_layout">
     <item>
      <widget class="QLabel" name="icon_label">
       <property name="alignment">
        <set>Qt::AlignLeading|Qt::AlignTop</set>
       </property>
      </widget>
     </item>
     <item>
      <widget class="QLabel" name="message_label">
       <property name="wordWrap">
        <bool>true</bool>
       </property>
       <property name="openExternalLinks">
        <bool>true</bool>
       </property>
       <property name="textInteractionFlags">
        <set>Qt::TextBrowserInteraction</set>
       </property>
      </widget>
     </item>
    </layout>
   </item>
   <item>
    <widget class="QDialogButtonBox" name="button_box">
     <property name="standardButtons">
      <set>{buttons_type}</set>
     </property>
    </widget>
   </item>
  </layout>
 </widget>
</ui>
)";

const char *const kDefaultQuestion = "Are you sure?";

QString boolField(bool value) {
  return value ? QStringLiteral("true") : QStringLiteral("false");
}

detail::MessageType messageTypeFor(CDDialogKind kind) {
  switch (kind) {
  case CDDialogKind::Error:
    return detail::MessageType::Error;
  case CDDialogKind::Question:
    return detail::MessageType::Question;
  default:
    return detail::MessageType::Info;
  }
}

template <typename T>
Result<T *> requireChild(QObject *root, const char *name) {
  auto *child = root->findChild<T *>(QString::fromLatin1(name));
  if (!child) {
    return Result<T *>::error(std::string("Dialog markup has no ") +
                              T::staticMetaObject.className() + " named " +
                              name);
  }
  return Result<T *>::ok(child);
}

} // namespace

QString dialogKindName(CDDialogKind kind) {
  switch (kind) {
  case CDDialogKind::Input:
    return QStringLiteral("input");
  case CDDialogKind::Chooser:
    return QStringLiteral("chooser");
  case CDDialogKind::Error:
    return QStringLiteral("error");
  case CDDialogKind::Question:
    return QStringLiteral("question");
  case CDDialogKind::Info:
    return QStringLiteral("info");
  case CDDialogKind::About:
    return QStringLiteral("about");
  case CDDialogKind::Wait:
    return QStringLiteral("wait");
  }
  return QString();
}

CDDialogPresenter::CDDialogPresenter(AppSettings settings,
                                     platform::HostEnvironment environment,
                                     std::shared_ptr<IFileSystem> fileSystem,
                                     std::shared_ptr<CDDialogRunner> runner)
    : m_settings(std::move(settings)), m_environment(environment),
      m_fileSystem(std::move(fileSystem)), m_runner(std::move(runner)) {
  initDialogResources();

  if (!m_fileSystem) {
    m_fileSystem = std::make_shared<QtFileSystem>();
  }
  if (!m_runner) {
    m_runner = std::make_shared<CDModalDialogRunner>();
  }

  m_translator = std::make_shared<CDTranslator>(m_settings.textDomain());

  CDUiLoader::Options options;
  options.pretranslate = m_environment.isWindows;
  m_uiLoader = std::make_unique<CDUiLoader>(m_fileSystem, m_translator, options);
}

CDDialogPresenter::~CDDialogPresenter() = default;

QString CDDialogPresenter::messageTemplate() {
  return QString::fromUtf8(kMessageTemplate);
}

Result<CDDialogResult> CDDialogPresenter::present(CDDialogKind kind,
                                                  QWidget *parent,
                                                  const CDDialogRequest &request) {
  CHANNELDECK_LOG_DEBUG("Presenting {} dialog", dialogKindName(kind).toStdString());

  switch (kind) {
  case CDDialogKind::Info:
  case CDDialogKind::Error:
    return showMessage(kind, parent, QDialogButtonBox::Ok, request.text,
                       request.title);
  case CDDialogKind::Question: {
    const auto buttons = request.buttons.value_or(
        QDialogButtonBox::StandardButtons(QDialogButtonBox::Ok | QDialogButtonBox::Cancel));
    const QString text = request.text.isEmpty() ? QString::fromLatin1(kDefaultQuestion)
                                                : request.text;
    return showMessage(kind, parent, buttons, text, request.title);
  }
  case CDDialogKind::Chooser:
    return showChooser(parent, request);
  case CDDialogKind::Input:
    return showInput(parent, request);
  case CDDialogKind::About:
    return showAbout(parent);
  case CDDialogKind::Wait: {
    auto handle = createWaitDialog(parent, request.text);
    if (handle.isError()) {
      return Result<CDDialogResult>::error(handle.error());
    }
    return Result<CDDialogResult>::ok(CDDialogResult(handle.value()));
  }
  }
  return Result<CDDialogResult>::error("Unknown dialog kind");
}

Result<CDDialogResult>
CDDialogPresenter::chooseFile(QWidget *parent, const QString &filterName,
                              const QStringList &patterns, const QString &title,
                              const AppSettings *settings) {
  CDDialogRequest request;
  request.settings = settings;
  request.chooserAction = CDChooserAction::Open;
  request.title = title;
  request.nameFilters << QStringLiteral("%1 (%2)").arg(translate(filterName),
                                                       patterns.join(QLatin1Char(' ')));
  return present(CDDialogKind::Chooser, parent, request);
}

Result<std::shared_ptr<CDWaitDialog>>
CDDialogPresenter::createWaitDialog(QWidget *parent, const QString &text) {
  auto dialog = dialogFromResource(CDDialogKind::Wait, parent, false);
  if (dialog.isError()) {
    return Result<std::shared_ptr<CDWaitDialog>>::error(dialog.error());
  }
  return Result<std::shared_ptr<CDWaitDialog>>::ok(
      std::make_shared<CDWaitDialog>(std::move(dialog).value(), m_translator, text));
}

QString CDDialogPresenter::resolveChosenPath(const QString &path) {
  const QFileInfo info(path);
  if (info.isDir()) {
    QString resolved = info.canonicalFilePath();
    if (resolved.isEmpty()) {
      resolved = info.absoluteFilePath();
    }
    resolved = QDir::toNativeSeparators(resolved);
    if (!resolved.endsWith(QDir::separator())) {
      resolved += QDir::separator();
    }
    return resolved;
  }
  if (info.isFile()) {
    return QDir::toNativeSeparators(info.canonicalFilePath());
  }
  return QDir::toNativeSeparators(info.absoluteFilePath());
}

Result<CDDialogResult>
CDDialogPresenter::showMessage(CDDialogKind kind, QWidget *parent,
                               QDialogButtonBox::StandardButtons buttons,
                               const QString &text, const QString &title) {
  const detail::MessageType type = messageTypeFor(kind);
  const QString shownTitle = windowTitle(title);

  TemplateFields fields;
  fields.insert(QStringLiteral("title"), shownTitle.toHtmlEscaped());
  fields.insert(QStringLiteral("use_header"), boolField(false));
  fields.insert(QStringLiteral("message_type"), detail::messageTypeName(type));
  fields.insert(QStringLiteral("buttons_type"), detail::standardButtonsMarkup(buttons));

  auto built = m_uiLoader->buildDialogFromString(messageTemplate(), parent, fields);
  if (built.isError()) {
    return Result<CDDialogResult>::error(built.error());
  }
  std::unique_ptr<QDialog> dialog = std::move(built).value();

  auto messageLabel = requireChild<QLabel>(dialog.get(), "message_label");
  auto buttonBox = requireChild<QDialogButtonBox>(dialog.get(), "button_box");
  if (messageLabel.isError()) {
    return Result<CDDialogResult>::error(messageLabel.error());
  }
  if (buttonBox.isError()) {
    return Result<CDDialogResult>::error(buttonBox.error());
  }

  messageLabel.value()->setText(translate(text));
  detail::applyMessageIcon(dialog->findChild<QLabel *>(QStringLiteral("icon_label")), type);
  detail::finishWithStandardButton(dialog.get(), buttonBox.value());

  const int response = m_runner->exec(*dialog);
  CHANNELDECK_LOG_DEBUG("{} dialog finished with response {}",
                        dialogKindName(kind).toStdString(), response);
  return Result<CDDialogResult>::ok(CDResponseResult{response});
}

Result<CDDialogResult>
CDDialogPresenter::showChooser(QWidget *parent, const CDDialogRequest &request) {
  const AppSettings &settings = request.settings ? *request.settings : m_settings;
  const CDChooserAction action =
      request.chooserAction.value_or(CDChooserAction::SelectFolder);

  QFileDialog dialog(parent, request.title.isEmpty() ? QString() : translate(request.title));
  dialog.setModal(true);

  switch (action) {
  case CDChooserAction::Open:
    dialog.setAcceptMode(QFileDialog::AcceptOpen);
    dialog.setFileMode(QFileDialog::ExistingFile);
    break;
  case CDChooserAction::Save:
    dialog.setAcceptMode(QFileDialog::AcceptSave);
    dialog.setFileMode(QFileDialog::AnyFile);
    break;
  case CDChooserAction::SelectFolder:
    dialog.setAcceptMode(QFileDialog::AcceptOpen);
    dialog.setFileMode(QFileDialog::Directory);
    dialog.setOption(QFileDialog::ShowDirsOnly, true);
    break;
  }

  // A read-only model hides "New Folder"
  dialog.setOption(QFileDialog::ReadOnly, !request.createDirs);

  if (!request.nameFilters.isEmpty()) {
    dialog.setNameFilters(request.nameFilters);
  }
  dialog.setDirectory(settings.profileDataPath());

  const QStringList chosen = m_runner->chooseFiles(dialog);
  if (chosen.isEmpty()) {
    return Result<CDDialogResult>::ok(CDCancelled{});
  }

  const QString resolved = resolveChosenPath(chosen.first());
  CHANNELDECK_LOG_DEBUG("Chooser accepted {}", resolved.toStdString());
  return Result<CDDialogResult>::ok(CDPathResult{resolved});
}

Result<CDDialogResult>
CDDialogPresenter::showInput(QWidget *parent, const CDDialogRequest &request) {
  auto built = dialogFromResource(CDDialogKind::Input, parent,
                                  m_environment.isGnomeSession, request.title);
  if (built.isError()) {
    return Result<CDDialogResult>::error(built.error());
  }
  std::unique_ptr<QDialog> dialog = std::move(built).value();

  auto entry = requireChild<QLineEdit>(dialog.get(), "input_entry");
  auto buttonBox = requireChild<QDialogButtonBox>(dialog.get(), "button_box");
  if (entry.isError()) {
    return Result<CDDialogResult>::error(entry.error());
  }
  if (buttonBox.isError()) {
    return Result<CDDialogResult>::error(buttonBox.error());
  }

  entry.value()->setText(request.text);
  entry.value()->selectAll();
  detail::finishWithAcceptReject(dialog.get(), buttonBox.value());

  const int response = m_runner->exec(*dialog);
  const QString text = entry.value()->text();

  if (response != QDialog::Accepted) {
    return Result<CDDialogResult>::ok(CDCancelled{});
  }
  return Result<CDDialogResult>::ok(CDTextResult{text});
}

Result<CDDialogResult> CDDialogPresenter::showAbout(QWidget *parent) {
  auto built = dialogFromResource(CDDialogKind::About, parent, false);
  if (built.isError()) {
    return Result<CDDialogResult>::error(built.error());
  }
  std::unique_ptr<QDialog> dialog = std::move(built).value();

  auto buttonBox = requireChild<QDialogButtonBox>(dialog.get(), "button_box");
  if (buttonBox.isError()) {
    return Result<CDDialogResult>::error(buttonBox.error());
  }

  if (auto *version = dialog->findChild<QLabel *>(QStringLiteral("version_label"))) {
    const QString appVersion = QCoreApplication::applicationVersion();
    if (!appVersion.isEmpty()) {
      version->setText(appVersion);
    }
  }
  detail::finishWithStandardButton(dialog.get(), buttonBox.value());

  const int response = m_runner->exec(*dialog);
  return Result<CDDialogResult>::ok(CDResponseResult{response});
}

Result<std::unique_ptr<QDialog>>
CDDialogPresenter::dialogFromResource(CDDialogKind kind, QWidget *parent,
                                      bool useHeader, const QString &title) {
  TemplateFields fields;
  fields.insert(QStringLiteral("use_header"), boolField(useHeader));
  fields.insert(QStringLiteral("title"), windowTitle(title).toHtmlEscaped());
  return m_uiLoader->buildDialog(resourcePath(kind), parent, fields);
}

QString CDDialogPresenter::resourcePath(CDDialogKind kind) const {
  const std::string fileName = dialogKindName(kind).toStdString() + "_dialog.ui";
  return QString::fromStdString(
      m_fileSystem->joinPath(m_settings.uiResourcesPath().toStdString(), fileName));
}

QString CDDialogPresenter::windowTitle(const QString &title) const {
  if (!title.isEmpty()) {
    return translate(title);
  }
  return QGuiApplication::applicationDisplayName();
}

} // namespace ChannelDeck::editor::qt
