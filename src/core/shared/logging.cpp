#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(crCore, "cr.core")
Q_LOGGING_CATEGORY(crFusion, "cr.fusion")
Q_LOGGING_CATEGORY(crResilience, "cr.resilience")
Q_LOGGING_CATEGORY(crCorrection, "cr.correction")
