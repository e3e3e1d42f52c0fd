#pragma once

#define MEDUSA_VERSION_MAJOR 0
#define MEDUSA_VERSION_MINOR 1
#define MEDUSA_VERSION_PATCH 0
#define MEDUSA_VERSION "0.1.0"
