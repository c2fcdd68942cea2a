#pragma once

#include <FL/Fl_Box.H>
#include <FL/Fl_Button.H>
#include <FL/Fl_Group.H>
#include <FL/Fl_Hold_Browser.H>
#include <FL/Fl_Input.H>

#include <optional>
#include <string>

#include "state/ConversationSession.h"

/**
 * @brief One conversation: message list, composer and connection status
 */
class ConversationScreen : public Fl_Group {
  public:
    ConversationScreen(int x, int y, int w, int h, ConnectionManager &connection, HistoryProvider &history,
                       CredentialProvider &credentials, int64_t peerId, ConversationSession::Options options);
    ~ConversationScreen() override;

    void onEnter();
    void onLeave();

  private:
    void setupUI();
    void refresh();
    void updateStatus();

    void onSendClicked();
    void onAttachClicked();
    void onReconnectClicked();

    std::string formatMessage(const Message &message) const;

    ConversationSession m_session;
    std::optional<LocalFile> m_attachment;
    std::string m_statusText;
    std::string m_attachText;

    Fl_Box *m_headerLabel = nullptr;
    Fl_Box *m_statusLabel = nullptr;
    Fl_Hold_Browser *m_messageList = nullptr;
    Fl_Input *m_input = nullptr;
    Fl_Button *m_attachBtn = nullptr;
    Fl_Button *m_sendBtn = nullptr;
    Fl_Button *m_reconnectBtn = nullptr;
    Fl_Box *m_attachLabel = nullptr;
};
