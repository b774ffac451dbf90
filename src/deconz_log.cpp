#include "deconz_log.h"

Q_LOGGING_CATEGORY(httpLog, "deconz-control.http");
Q_LOGGING_CATEGORY(clientLog, "deconz-control.client");
Q_LOGGING_CATEGORY(uiLog, "deconz-control.ui");
Q_LOGGING_CATEGORY(appLog, "deconz-control.app");
