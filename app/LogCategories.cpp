#include "LogCategories.hpp"

Q_LOGGING_CATEGORY(sbXfer, "sitebackup.transfer")
Q_LOGGING_CATEGORY(sbConn, "sitebackup.connection")
Q_LOGGING_CATEGORY(sbHistory, "sitebackup.history")
