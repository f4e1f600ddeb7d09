#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(oxCore, "obsidex.core")
Q_LOGGING_CATEGORY(oxFs, "obsidex.fs")
Q_LOGGING_CATEGORY(oxIndex, "obsidex.index")
Q_LOGGING_CATEGORY(oxEmbed, "obsidex.embed")
Q_LOGGING_CATEGORY(oxQuery, "obsidex.query")
