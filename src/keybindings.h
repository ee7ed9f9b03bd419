#pragma once

#include <functional>

#include "command_processor.h"
#include "key_dispatch.h"

/**
 * @param page_lines lines per PageUp/PageDown step, read at key time.
 */
KeyDispatchTable create_key_bindings(CommandProcessor& commands,
                                     std::function<int()> page_lines);
