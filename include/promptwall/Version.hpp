#pragma once

#define PROMPTWALL_VERSION_MAJOR 0
#define PROMPTWALL_VERSION_MINOR 2
#define PROMPTWALL_VERSION_PATCH 0
#define PROMPTWALL_VERSION "0.2.0"
