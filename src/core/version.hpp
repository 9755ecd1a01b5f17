#pragma once

#define SSOKIT_VERSION_MAJOR 0
#define SSOKIT_VERSION_MINOR 3
#define SSOKIT_VERSION_PATCH 0
#define SSOKIT_VERSION_STRING "0.3.0"
