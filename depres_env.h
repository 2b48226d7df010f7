#pragma once
#include "depres_utils.h"

Config init_config();
