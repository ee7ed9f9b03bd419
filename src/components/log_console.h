#pragma once
#include <ftxui/component/component.hpp>

#include "../stream_redirect.h"

/**
 * @brief Window with the newest application log messages.
 */
ftxui::Component LogConsole(int msg_count = 6);
