#include "test_base.h"

Q_LOGGING_CATEGORY(cutlineTests, "cutline.tests")
