#pragma once

#ifndef LIGHTNINGROD_VERSION
#define LIGHTNINGROD_VERSION "0.0.0-dev"
#endif

constexpr const char* kAgentVersion = LIGHTNINGROD_VERSION;
