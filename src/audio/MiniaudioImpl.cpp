// SPDX-License-Identifier: Apache-2.0

// The miniaudio implementation lives in this translation unit only.
// AudioCapture includes <miniaudio.h> without the IMPLEMENTATION define.
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
