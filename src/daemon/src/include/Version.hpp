/*
 * Valheim Server Manager — Version (header)
 * (c) 2025 ValheimServerManager contributors
 */
#pragma once

#ifndef VSMD_VERSION
#define VSMD_VERSION "0.3.0"
#endif
