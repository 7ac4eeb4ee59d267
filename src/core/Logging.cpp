#include "rollcal/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcData, "rollcal.data")
Q_LOGGING_CATEGORY(lcLayout, "rollcal.layout")
Q_LOGGING_CATEGORY(lcRender, "rollcal.render")
