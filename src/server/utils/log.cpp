#include "log.hpp"

bool enable_debug = false;
