/**
 * @file cd_dialogs_detail.cpp
 * @brief Shared helpers for the dialogs built from markup
 */

#include "cd_dialogs_detail.hpp"

#include <QAbstractButton>
#include <QApplication>
#include <QDialog>
#include <QLabel>
#include <QStringList>
#include <QStyle>

#include <array>
#include <utility>

namespace ChannelDeck::editor::qt::detail {

namespace {

constexpr std::array<std::pair<QDialogButtonBox::StandardButton, const char *>, 18>
    kStandardButtonNames = {{
        {QDialogButtonBox::Ok, "Ok"},
        {QDialogButtonBox::Save, "Save"},
        {QDialogButtonBox::SaveAll, "SaveAll"},
        {QDialogButtonBox::Open, "Open"},
        {QDialogButtonBox::Yes, "Yes"},
        {QDialogButtonBox::YesToAll, "YesToAll"},
        {QDialogButtonBox::No, "No"},
        {QDialogButtonBox::NoToAll, "NoToAll"},
        {QDialogButtonBox::Abort, "Abort"},
        {QDialogButtonBox::Retry, "Retry"},
        {QDialogButtonBox::Ignore, "Ignore"},
        {QDialogButtonBox::Close, "Close"},
        {QDialogButtonBox::Cancel, "Cancel"},
        {QDialogButtonBox::Discard, "Discard"},
        {QDialogButtonBox::Help, "Help"},
        {QDialogButtonBox::Apply, "Apply"},
        {QDialogButtonBox::Reset, "Reset"},
        {QDialogButtonBox::RestoreDefaults, "RestoreDefaults"},
    }};

} // namespace

void finishWithStandardButton(QDialog *dialog, QDialogButtonBox *buttonBox) {
  if (!dialog || !buttonBox) {
    return;
  }
  // Only the clicked() response may finish the dialog
  QObject::disconnect(buttonBox, &QDialogButtonBox::accepted, dialog, &QDialog::accept);
  QObject::disconnect(buttonBox, &QDialogButtonBox::rejected, dialog, &QDialog::reject);
  QObject::connect(buttonBox, &QDialogButtonBox::clicked, dialog,
                   [dialog, buttonBox](QAbstractButton *button) {
                     dialog->done(static_cast<int>(buttonBox->standardButton(button)));
                   });
}

void finishWithAcceptReject(QDialog *dialog, QDialogButtonBox *buttonBox) {
  if (!dialog || !buttonBox) {
    return;
  }
  QObject::connect(buttonBox, &QDialogButtonBox::accepted, dialog, &QDialog::accept);
  QObject::connect(buttonBox, &QDialogButtonBox::rejected, dialog, &QDialog::reject);
}

QString standardButtonsMarkup(QDialogButtonBox::StandardButtons buttons) {
  QStringList names;
  for (const auto &[button, name] : kStandardButtonNames) {
    if (buttons.testFlag(button)) {
      names << QStringLiteral("QDialogButtonBox::") + QLatin1String(name);
    }
  }
  if (names.isEmpty()) {
    return QStringLiteral("QDialogButtonBox::NoButton");
  }
  return names.join(QLatin1Char('|'));
}

QString messageTypeName(MessageType type) {
  switch (type) {
  case MessageType::Info:
    return QStringLiteral("info");
  case MessageType::Error:
    return QStringLiteral("error");
  case MessageType::Question:
    return QStringLiteral("question");
  }
  return QStringLiteral("info");
}

void applyMessageIcon(QLabel *iconLabel, MessageType type) {
  if (!iconLabel) {
    return;
  }

  QStyle::StandardPixmap pixmap = QStyle::SP_MessageBoxInformation;
  switch (type) {
  case MessageType::Info:
    pixmap = QStyle::SP_MessageBoxInformation;
    break;
  case MessageType::Error:
    pixmap = QStyle::SP_MessageBoxCritical;
    break;
  case MessageType::Question:
    pixmap = QStyle::SP_MessageBoxQuestion;
    break;
  }

  QStyle *style = iconLabel->style() ? iconLabel->style() : QApplication::style();
  iconLabel->setPixmap(style->standardIcon(pixmap, nullptr, iconLabel)
                           .pixmap(MESSAGE_ICON_SIZE, MESSAGE_ICON_SIZE));
}

} // namespace ChannelDeck::editor::qt::detail
