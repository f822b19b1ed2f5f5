#pragma once

/**
 * @file cd_dialogs_detail.hpp
 * @brief Shared helpers for the dialogs built from markup
 *
 * - Button boxes report the pressed standard button as the dialog result
 * - Message icons and the markup spelling of button sets
 */

#include <QDialogButtonBox>
#include <QString>

class QDialog;
class QLabel;

namespace ChannelDeck::editor::qt::detail {

enum class MessageType { Info, Error, Question };

/**
 * @brief Finish @p dialog with the standard button clicked in @p buttonBox
 *
 * The dialog result becomes the QDialogButtonBox::StandardButton value, so
 * exec() returns it directly. Escape still rejects, which yields NoButton.
 */
void finishWithStandardButton(QDialog* dialog, QDialogButtonBox* buttonBox);

/**
 * @brief Wire accept/reject roles of @p buttonBox to QDialog::accept/reject
 */
void finishWithAcceptReject(QDialog* dialog, QDialogButtonBox* buttonBox);

/**
 * @brief Markup value of a QDialogButtonBox::standardButtons <set>
 * @return e.g. "QDialogButtonBox::Ok|QDialogButtonBox::Cancel", or
 * "QDialogButtonBox::NoButton" for an empty set
 */
QString standardButtonsMarkup(QDialogButtonBox::StandardButtons buttons);

/**
 * @brief Name used for the message_type template field
 */
QString messageTypeName(MessageType type);

/**
 * @brief Put the style's standard icon for @p type into @p iconLabel
 */
void applyMessageIcon(QLabel* iconLabel, MessageType type);

constexpr int MESSAGE_ICON_SIZE = 48;

} // namespace ChannelDeck::editor::qt::detail
