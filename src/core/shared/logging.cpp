#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(ddCore, "dd.core")
Q_LOGGING_CATEGORY(ddStore, "dd.store")
Q_LOGGING_CATEGORY(ddIndex, "dd.index")
Q_LOGGING_CATEGORY(ddSuggest, "dd.suggest")
Q_LOGGING_CATEGORY(ddPrivacy, "dd.privacy")
Q_LOGGING_CATEGORY(ddIpc, "dd.ipc")
