#include "screens/ConversationScreen.h"

#include <FL/Fl_Native_File_Chooser.H>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <utility>

#include "ui/Theme.h"
#include "utils/Logger.h"

namespace {

constexpr int PADDING = 8;
constexpr int HEADER_HEIGHT = 32;
constexpr int COMPOSER_HEIGHT = 34;
constexpr int BUTTON_WIDTH = 90;

std::string clockTime(const std::chrono::system_clock::time_point &tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buffer[16];
    std::strftime(buffer, sizeof(buffer), "%H:%M", &tm);
    return buffer;
}

} // namespace

ConversationScreen::ConversationScreen(int x, int y, int w, int h, ConnectionManager &connection,
                                       HistoryProvider &history, CredentialProvider &credentials, int64_t peerId,
                                       ConversationSession::Options options)
    : Fl_Group(x, y, w, h), m_session(connection, history, credentials, peerId, std::move(options)) {
    box(FL_FLAT_BOX);
    color(ThemeColors::BG_WINDOW);
    setupUI();

    m_session.setChangeHandler([this]() { refresh(); });
}

ConversationScreen::~ConversationScreen() { m_session.deactivate(); }

void ConversationScreen::onEnter() {
    m_session.activate();
    refresh();
}

void ConversationScreen::onLeave() { m_session.deactivate(); }

void ConversationScreen::setupUI() {
    begin();

    const std::string title = "Conversation with user " + std::to_string(m_session.peerId());
    m_headerLabel = new Fl_Box(x() + PADDING, y() + PADDING, w() / 2, HEADER_HEIGHT);
    m_headerLabel->copy_label(title.c_str());
    m_headerLabel->align(FL_ALIGN_LEFT | FL_ALIGN_INSIDE);
    m_headerLabel->labelfont(FL_BOLD);
    m_headerLabel->labelsize(16);
    m_headerLabel->labelcolor(ThemeColors::TEXT_PRIMARY);

    m_reconnectBtn = new Fl_Button(x() + w() - PADDING - BUTTON_WIDTH, y() + PADDING, BUTTON_WIDTH, HEADER_HEIGHT,
                                   "Reconnect");
    m_reconnectBtn->color(ThemeColors::BTN_SECONDARY);
    m_reconnectBtn->labelcolor(FL_WHITE);
    m_reconnectBtn->callback([](Fl_Widget *, void *data) { static_cast<ConversationScreen *>(data)->onReconnectClicked(); },
                             this);

    m_statusLabel = new Fl_Box(x() + w() / 2, y() + PADDING, w() / 2 - 2 * PADDING - BUTTON_WIDTH, HEADER_HEIGHT);
    m_statusLabel->align(FL_ALIGN_RIGHT | FL_ALIGN_INSIDE);
    m_statusLabel->labelsize(12);

    const int listTop = y() + HEADER_HEIGHT + 2 * PADDING;
    const int composerTop = y() + h() - PADDING - COMPOSER_HEIGHT;
    const int attachTop = composerTop - 20;

    m_messageList = new Fl_Hold_Browser(x() + PADDING, listTop, w() - 2 * PADDING, attachTop - listTop - PADDING);
    m_messageList->color(ThemeColors::BG_PANEL);
    m_messageList->textcolor(ThemeColors::TEXT_PRIMARY);
    m_messageList->textsize(13);

    m_attachLabel = new Fl_Box(x() + PADDING, attachTop, w() - 2 * PADDING, 18);
    m_attachLabel->align(FL_ALIGN_LEFT | FL_ALIGN_INSIDE);
    m_attachLabel->labelsize(11);
    m_attachLabel->labelcolor(ThemeColors::TEXT_SECONDARY);

    m_attachBtn = new Fl_Button(x() + PADDING, composerTop, BUTTON_WIDTH, COMPOSER_HEIGHT, "Attach...");
    m_attachBtn->color(ThemeColors::BTN_SECONDARY);
    m_attachBtn->labelcolor(FL_WHITE);
    m_attachBtn->callback([](Fl_Widget *, void *data) { static_cast<ConversationScreen *>(data)->onAttachClicked(); },
                          this);

    m_input = new Fl_Input(x() + 2 * PADDING + BUTTON_WIDTH, composerTop, w() - 4 * PADDING - 2 * BUTTON_WIDTH,
                           COMPOSER_HEIGHT);
    m_input->color(ThemeColors::BG_INPUT);
    m_input->textcolor(ThemeColors::TEXT_PRIMARY);
    m_input->cursor_color(ThemeColors::TEXT_PRIMARY);
    m_input->when(FL_WHEN_ENTER_KEY_ALWAYS);
    m_input->callback([](Fl_Widget *, void *data) { static_cast<ConversationScreen *>(data)->onSendClicked(); },
                      this);

    m_sendBtn = new Fl_Button(x() + w() - PADDING - BUTTON_WIDTH, composerTop, BUTTON_WIDTH, COMPOSER_HEIGHT, "Send");
    m_sendBtn->color(ThemeColors::BTN_PRIMARY);
    m_sendBtn->labelcolor(FL_WHITE);
    m_sendBtn->callback([](Fl_Widget *, void *data) { static_cast<ConversationScreen *>(data)->onSendClicked(); },
                        this);

    resizable(m_messageList);
    end();
}

void ConversationScreen::refresh() {
    const int previousSize = m_messageList->size();

    m_messageList->clear();
    for (const auto &message : m_session.messages()) {
        m_messageList->add(formatMessage(message).c_str());
        for (const auto &attachment : message.attachments) {
            const std::string line =
                std::string("@i@.    ") + (attachment.isDocument() ? "[document] " : "[image] ") + attachment.fileName +
                "  " + attachment.url;
            m_messageList->add(line.c_str());
        }
    }

    if (m_messageList->size() > previousSize) {
        m_messageList->bottomline(m_messageList->size());
    }

    updateStatus();
    redraw();
}

void ConversationScreen::updateStatus() {
    const auto state = m_session.connectionState();
    Fl_Color statusColor = ThemeColors::STATUS_OK;
    if (state == ConnectionManager::ConnectionState::Connecting) {
        statusColor = ThemeColors::STATUS_PENDING;
    } else if (state == ConnectionManager::ConnectionState::Disconnected) {
        statusColor = ThemeColors::STATUS_ERROR;
    }

    m_statusText = toString(state);
    switch (m_session.status()) {
    case ConversationStatus::Loading:
        m_statusText += " | loading history";
        break;
    case ConversationStatus::Empty:
        m_statusText += " | no messages yet";
        break;
    case ConversationStatus::Error:
        m_statusText += " | " + (m_session.lastError().empty() ? std::string("error") : m_session.lastError());
        statusColor = ThemeColors::STATUS_ERROR;
        break;
    default:
        break;
    }

    m_statusLabel->labelcolor(statusColor);
    m_statusLabel->label(m_statusText.c_str());
    m_statusLabel->redraw_label();
}

std::string ConversationScreen::formatMessage(const Message &message) const {
    const bool mine = message.senderId == m_session.selfId();
    std::string line = mine ? "@B" + std::to_string(ThemeColors::BG_INPUT) : std::string();
    line += "@.[" + clockTime(message.sentTime) + "] " + (mine ? "You" : "User " + std::to_string(message.senderId)) +
            ": " + message.content;
    if (message.isPending()) {
        line += "  (sending...)";
    }
    return line;
}

void ConversationScreen::onSendClicked() {
    const std::string text = m_input->value() ? m_input->value() : "";

    SendResult result = m_session.send(text, m_attachment, [this](const SendResult &delivered) {
        if (!delivered.ok()) {
            m_statusLabel->copy_label((std::string(describe(delivered.error)) + " " + delivered.detail).c_str());
            m_statusLabel->labelcolor(ThemeColors::STATUS_ERROR);
            m_statusLabel->redraw_label();
        }
    });

    if (!result.ok()) {
        Logger::warn(std::string("Send rejected: ") + describe(result.error));
        m_statusLabel->copy_label(describe(result.error));
        m_statusLabel->labelcolor(ThemeColors::STATUS_ERROR);
        m_statusLabel->redraw_label();
        return;
    }

    if (result.attachmentWarning) {
        Logger::warn("Attachment skipped: " + *result.attachmentWarning);
    }

    m_input->value("");
    m_attachment.reset();
    m_attachLabel->label("");
    m_attachLabel->redraw_label();
}

void ConversationScreen::onAttachClicked() {
    Fl_Native_File_Chooser chooser;
    chooser.title("Attach a file");
    chooser.type(Fl_Native_File_Chooser::BROWSE_FILE);

    if (chooser.show() != 0 || !chooser.filename()) {
        return;
    }

    LocalFile file;
    file.path = chooser.filename();
    m_attachment = file;

    m_attachText = "Attached: " + std::filesystem::path(file.path).filename().string();
    m_attachLabel->label(m_attachText.c_str());
    m_attachLabel->redraw_label();
}

void ConversationScreen::onReconnectClicked() {
    Logger::info("Reconnect requested");
    m_session.reconnect();
    updateStatus();
}
