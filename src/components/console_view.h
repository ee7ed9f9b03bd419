#pragma once
#include <ftxui/component/component.hpp>

#include "../console_session.h"
#include "../key_dispatch.h"

/**
 * @brief Main pane, toolbar and command input of the console. Key events
 * go through `keys` first; unmatched ones reach the input line.
 */
ftxui::Component ConsoleView(ConsoleSession& session,
                             const KeyDispatchTable& keys);

/**
 * @brief Renders `buffer` as lines with the cursor line in focus, so an
 * enclosing frame scrolls to it.
 */
ftxui::Element render_buffer(const TextBuffer& buffer);
